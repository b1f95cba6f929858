// Capabilities.hpp
// Opt-in marker protocols. Tag bases declare behaviour without hooks; concepts detect hook members.
#pragma once

#include <NGIN/Primitives.hpp>

#include <concepts>
#include <utility>

#include <NGIN/Attributes/Types.hpp>

namespace NGIN::Attributes
{

  class ClassAnalyzer;
  template <class M>
  class MarkerMap;

  /// Search ancestor classes (and, at class level, implemented contracts) when absent locally.
  struct Inheritable
  {
  };

  /// Properties and parameters fall back to the marker of the structure named by their declared type.
  struct Transitive
  {
  };

  /// May be attached repeatedly; as a sub-marker it is folded as an ordered sequence.
  struct Multivalue
  {
  };

  enum class Capability : NGIN::UInt32
  {
    None = 0,
    Reflectable = 1u << 0,
    ParsesProperties = 1u << 1,
    ParsesMethods = 1u << 2,
    ParsesConstants = 1u << 3,
    ParsesParameters = 1u << 4,
    HasSubMarkers = 1u << 5,
    Excludable = 1u << 6,
    Inheritable = 1u << 7,
    Transitive = 1u << 8,
    CustomResolution = 1u << 9,
    Multivalue = 1u << 10,
  };

  [[nodiscard]] constexpr NGIN::UInt32 operator|(Capability a, Capability b) noexcept
  {
    return static_cast<NGIN::UInt32>(a) | static_cast<NGIN::UInt32>(b);
  }

  [[nodiscard]] constexpr NGIN::UInt32 operator|(NGIN::UInt32 a, Capability b) noexcept
  {
    return a | static_cast<NGIN::UInt32>(b);
  }

  [[nodiscard]] constexpr bool HasCapability(NGIN::UInt32 set, Capability c) noexcept
  {
    return (set & static_cast<NGIN::UInt32>(c)) != 0;
  }

  template <class M>
  concept InheritableMarker = std::derived_from<M, Inheritable>;

  template <class M>
  concept TransitiveMarker = std::derived_from<M, Transitive>;

  template <class M>
  concept MultivalueMarker = std::derived_from<M, Multivalue>;

  template <class M>
  concept ReflectsStructure = requires(M &m, const StructureInfo &info) { m.FromReflection(info); };

  template <class M>
  concept ReflectsComponent = requires(M &m, const ComponentInfo &info) { m.FromReflection(info); };

  template <class M>
  concept ParsesProperties = requires(M &m, const M &cm) {
    typename M::PropertyMarker;
    { cm.IncludePropertiesByDefault() } -> std::convertible_to<bool>;
    m.SetProperties(std::declval<MarkerMap<typename M::PropertyMarker>>());
  };

  template <class M>
  concept ParsesMethods = requires(M &m, const M &cm) {
    typename M::MethodMarker;
    { cm.IncludeMethodsByDefault() } -> std::convertible_to<bool>;
    m.SetMethods(std::declval<MarkerMap<typename M::MethodMarker>>());
  };

  template <class M>
  concept ParsesConstants = requires(M &m, const M &cm) {
    typename M::ConstantMarker;
    { cm.IncludeConstantsByDefault() } -> std::convertible_to<bool>;
    m.SetConstants(std::declval<MarkerMap<typename M::ConstantMarker>>());
  };

  // Method-level markers only.
  template <class M>
  concept ParsesParameters = requires(M &m, const M &cm) {
    typename M::ParameterMarker;
    { cm.IncludeParametersByDefault() } -> std::convertible_to<bool>;
    m.SetParameters(std::declval<MarkerMap<typename M::ParameterMarker>>());
  };

  template <class M>
  concept ExcludableMarker = requires(const M &cm) {
    { cm.Exclude() } -> std::convertible_to<bool>;
  };

  template <class M>
  concept CustomResolvesStructure = requires(M &m, ClassAnalyzer &analyzer, const StructureInfo &info) {
    m.CustomResolve(analyzer, info);
  };

  template <class M>
  concept CustomResolvesComponent = requires(M &m, ClassAnalyzer &analyzer, const ComponentInfo &info) {
    m.CustomResolve(analyzer, info);
  };

  namespace detail
  {
    // Sub-marker support is declared through MarkerBuilder and added by the descriptor itself.
    template <class M>
    constexpr NGIN::UInt32 CapabilitiesOf() noexcept
    {
      NGIN::UInt32 set = static_cast<NGIN::UInt32>(Capability::None);
      if constexpr (ReflectsStructure<M> || ReflectsComponent<M>)
        set = set | Capability::Reflectable;
      if constexpr (ParsesProperties<M>)
        set = set | Capability::ParsesProperties;
      if constexpr (ParsesMethods<M>)
        set = set | Capability::ParsesMethods;
      if constexpr (ParsesConstants<M>)
        set = set | Capability::ParsesConstants;
      if constexpr (ParsesParameters<M>)
        set = set | Capability::ParsesParameters;
      if constexpr (ExcludableMarker<M>)
        set = set | Capability::Excludable;
      if constexpr (InheritableMarker<M>)
        set = set | Capability::Inheritable;
      if constexpr (TransitiveMarker<M>)
        set = set | Capability::Transitive;
      if constexpr (CustomResolvesStructure<M> || CustomResolvesComponent<M>)
        set = set | Capability::CustomResolution;
      if constexpr (MultivalueMarker<M>)
        set = set | Capability::Multivalue;
      return set;
    }
  } // namespace detail

} // namespace NGIN::Attributes
