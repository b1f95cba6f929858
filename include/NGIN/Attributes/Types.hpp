// Types.hpp
// Public-facing error codes, identifiers, raw marker arguments and copied reflection facts
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Hashing/FNV.hpp>

#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace NGIN::Attributes
{

  using StructureId = NGIN::UInt64;
  using MarkerTypeId = NGIN::UInt64;

  enum class ErrorCode : unsigned
  {
    NotFound = 1,
    InvalidArgument = 2,
    MissingRequiredArguments = 3,
    AmbiguousAttachment = 4,
    ArgumentTypeMismatch = 5,
    RecursionLimit = 6,
  };

  struct Error
  {
    ErrorCode code{ErrorCode::InvalidArgument};
    std::string_view message{};
    // Formatted context (marker type, field names); may be empty.
    std::string detail{};

    Error() = default;
    Error(ErrorCode c, std::string_view m) : code(c), message(m) {}
    Error(ErrorCode c, std::string_view m, std::string d) : code(c), message(m), detail(std::move(d)) {}
  };

  enum class StructureKind : unsigned char
  {
    Class = 0,
    Contract = 1,
    Enum = 2,
  };

  enum class ComponentKind : unsigned char
  {
    Structure = 0,
    Property = 1,
    Method = 2,
    Constant = 3,
    Parameter = 4,
  };

  [[nodiscard]] constexpr std::string_view ToString(StructureKind kind) noexcept
  {
    switch (kind)
    {
    case StructureKind::Class:
      return "class";
    case StructureKind::Contract:
      return "contract";
    case StructureKind::Enum:
      return "enum";
    }
    return "unknown";
  }

  [[nodiscard]] constexpr std::string_view ToString(ComponentKind kind) noexcept
  {
    switch (kind)
    {
    case ComponentKind::Structure:
      return "structure";
    case ComponentKind::Property:
      return "property";
    case ComponentKind::Method:
      return "method";
    case ComponentKind::Constant:
      return "constant";
    case ComponentKind::Parameter:
      return "parameter";
    }
    return "unknown";
  }

  // Structures are identified by the FNV-1a hash of their fully qualified name.
  [[nodiscard]] inline StructureId StructureIdOf(std::string_view qualifiedName)
  {
    return NGIN::Hashing::FNV1a64(qualifiedName.data(), qualifiedName.size());
  }

  // Raw constructor-style argument value. monostate is the null argument.
  using ArgValue = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

  struct Argument
  {
    std::string name{}; // empty for positional arguments
    ArgValue value{};

    Argument() = default;

    template <class V>
      requires std::constructible_from<ArgValue, V &&>
    Argument(V &&v) : value(std::forward<V>(v))
    {
    }

    template <class V>
      requires std::constructible_from<ArgValue, V &&>
    Argument(std::string_view n, V &&v) : name(n), value(std::forward<V>(v))
    {
    }

    [[nodiscard]] bool IsNamed() const noexcept { return !name.empty(); }
  };

  // Structural facts handed to reflectable markers. Always a copy; never refers back into the source.
  struct StructureInfo
  {
    StructureId id{0};
    std::string qualifiedName{};
    std::string shortName{};
    StructureKind kind{StructureKind::Class};
    bool isAbstract{false};
    bool isFinal{false};
    NGIN::Containers::Vector<std::string> ancestors{};
    NGIN::Containers::Vector<std::string> contracts{};
  };

  struct ComponentInfo
  {
    ComponentKind kind{ComponentKind::Property};
    std::string name{};
    std::string declaringStructure{};
    std::optional<std::string> declaredType{};
    bool isStatic{false};
    // Parameters only: the owning method, the zero-based position and whether a default exists.
    std::string method{};
    NGIN::UInt32 position{0};
    bool isOptional{false};
  };

  // Addresses a structure or one of its components inside a reflective source.
  struct Target
  {
    StructureId structure{0};
    ComponentKind kind{ComponentKind::Structure};
    std::string component{}; // member name, or the owning method for parameters
    std::string parameter{};

    [[nodiscard]] static Target Of(StructureId s) { return Target{s, ComponentKind::Structure, {}, {}}; }

    [[nodiscard]] static Target Member(StructureId s, ComponentKind k, std::string_view name)
    {
      return Target{s, k, std::string{name}, {}};
    }

    [[nodiscard]] static Target Param(StructureId s, std::string_view method, std::string_view name)
    {
      return Target{s, ComponentKind::Parameter, std::string{method}, std::string{name}};
    }

    // Same component addressed on another structure (used to walk ancestors).
    [[nodiscard]] Target On(StructureId other) const
    {
      Target t{*this};
      t.structure = other;
      return t;
    }
  };

} // namespace NGIN::Attributes
