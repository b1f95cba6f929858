// NameUtils.hpp
// Name helpers: short names of qualified identifiers and member names derived from pointer-to-member constants.
#pragma once

#include <string_view>

namespace NGIN::Attributes::detail
{

  // "Ns::Inner::Type" -> "Type". Backslash-separated names are accepted as well.
  [[nodiscard]] constexpr std::string_view ShortName(std::string_view qualified) noexcept
  {
    const auto colons = qualified.rfind("::");
    const auto slash = qualified.rfind('\\');
    std::string_view::size_type start = 0;
    if (colons != std::string_view::npos)
      start = colons + 2;
    if (slash != std::string_view::npos && slash + 1 > start)
      start = slash + 1;
    return qualified.substr(start);
  }

  // Text after `open` up to the first of the `close` characters.
  [[nodiscard]] constexpr std::string_view Between(std::string_view sig, std::string_view open, std::string_view close) noexcept
  {
    const auto kpos = sig.find(open);
    if (kpos == std::string_view::npos)
      return {};
    const auto start = kpos + open.size();
    const auto end = sig.find_first_of(close, start);
    if (end == std::string_view::npos || end <= start)
      return {};
    return sig.substr(start, end - start);
  }

  // Member identifier of a pointer-to-member constant, e.g. &Marker::name -> "name".
  template <auto MemberPtr>
  consteval std::string_view MemberNameFromPretty() noexcept
  {
#if defined(_MSC_VER)
    // "... MemberNameFromPretty< &Class::member >(void) noexcept"
    constexpr std::string_view full = Between(__FUNCSIG__, "< &", " >");
#elif defined(__clang__)
    // "... MemberNameFromPretty() [MemberPtr = &Class::member]"
    constexpr std::string_view full = Between(__PRETTY_FUNCTION__, "[MemberPtr = &", "]");
#elif defined(__GNUC__)
    // "... MemberNameFromPretty() [with auto MemberPtr = &Class::member; std::string_view = ...]"
    constexpr std::string_view full = Between(__PRETTY_FUNCTION__, "[with auto MemberPtr = &", ";]");
#else
    constexpr std::string_view full{};
#endif
    return ShortName(full);
  }

} // namespace NGIN::Attributes::detail
