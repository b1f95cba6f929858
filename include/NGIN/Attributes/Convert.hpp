// Convert.hpp - Shared ArgValue -> T conversion helpers and type-id utilities
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Meta/TypeName.hpp>
#include <NGIN/Hashing/FNV.hpp>

#include <cmath>
#include <cstdint>
#include <expected>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

#include <NGIN/Attributes/Types.hpp>

namespace NGIN::Attributes::detail
{

  // Compute FNV-based type id for a type
  template <class T>
  inline NGIN::UInt64 TypeIdOf()
  {
    auto sv = NGIN::Meta::TypeName<std::remove_cvref_t<T>>::qualifiedName;
    return NGIN::Hashing::FNV1a64(sv.data(), sv.size());
  }

  template <class T>
  inline constexpr bool is_numeric_v = std::is_arithmetic_v<std::remove_cvref_t<T>> && !std::is_same_v<std::remove_cvref_t<T>, bool>;

  template <class T>
  struct is_optional : std::false_type
  {
  };
  template <class T>
  struct is_optional<std::optional<T>> : std::true_type
  {
  };
  template <class T>
  inline constexpr bool is_optional_v = is_optional<T>::value;

  // True when `v` is representable in the integral type I.
  template <class I>
  constexpr bool IntegerFits(std::int64_t v) noexcept
  {
    using L = std::numeric_limits<I>;
    if constexpr (std::is_signed_v<I>)
      return v >= static_cast<std::int64_t>(L::min()) && v <= static_cast<std::int64_t>(L::max());
    else
      return v >= 0 && static_cast<std::uint64_t>(v) <= static_cast<std::uint64_t>(L::max());
  }

  // True when `v` converts to N without leaving N's range. Integral targets truncate toward zero.
  template <class N>
  inline bool DoubleFits(double v) noexcept
  {
    using L = std::numeric_limits<N>;
    if constexpr (std::is_floating_point_v<N>)
    {
      return !std::isfinite(v) || std::fabs(v) <= static_cast<double>(L::max());
    }
    else
    {
      // 2^digits is exact in double; the valid range is (lo, hi) before truncation.
      const double hi = std::ldexp(1.0, L::digits);
      const double lo = std::is_signed_v<N> ? -hi - 1.0 : -1.0;
      return v > lo && v < hi;
    }
  }

  // Try to convert ArgValue -> To (exact match, arithmetic conversions, enums from integers, optionals)
  template <class To>
  inline std::expected<std::remove_cvref_t<To>, Error> ConvertArg(const ArgValue &src)
  {
    using Dest = std::remove_cvref_t<To>;
    if constexpr (is_optional_v<Dest>)
    {
      if (std::holds_alternative<std::monostate>(src))
        return Dest{};
      auto inner = ConvertArg<typename Dest::value_type>(src);
      if (!inner.has_value())
        return std::unexpected(inner.error());
      return Dest{std::move(inner.value())};
    }
    else if constexpr (std::is_same_v<Dest, bool>)
    {
      if (const auto *b = std::get_if<bool>(&src))
        return *b;
    }
    else if constexpr (std::is_enum_v<Dest>)
    {
      if (const auto *i = std::get_if<std::int64_t>(&src))
      {
        if (!IntegerFits<std::underlying_type_t<Dest>>(*i))
          return std::unexpected(Error{ErrorCode::ArgumentTypeMismatch, "argument out of range for enum"});
        return static_cast<Dest>(*i);
      }
    }
    else if constexpr (is_numeric_v<Dest>)
    {
      if (const auto *i = std::get_if<std::int64_t>(&src))
      {
        if constexpr (std::is_integral_v<Dest>)
        {
          if (!IntegerFits<Dest>(*i))
            return std::unexpected(Error{ErrorCode::ArgumentTypeMismatch, "argument out of range"});
        }
        return static_cast<Dest>(*i);
      }
      if (const auto *d = std::get_if<double>(&src))
      {
        if (!DoubleFits<Dest>(*d))
          return std::unexpected(Error{ErrorCode::ArgumentTypeMismatch, "argument out of range"});
        return static_cast<Dest>(*d);
      }
      if (const auto *b = std::get_if<bool>(&src))
        return static_cast<Dest>(*b);
    }
    else if constexpr (std::is_constructible_v<Dest, const std::string &> && !std::is_same_v<Dest, std::string_view>)
    {
      if (const auto *s = std::get_if<std::string>(&src))
        return Dest(*s);
    }
    return std::unexpected(Error{ErrorCode::ArgumentTypeMismatch, "argument type not convertible"});
  }

} // namespace NGIN::Attributes::detail
