// Source.hpp
// The structural introspection interface consumed by the analyzer.
#pragma once

#include <NGIN/Containers/Vector.hpp>

#include <optional>
#include <string_view>
#include <typeinfo>
#include <vector>

#include <NGIN/Attributes/Types.hpp>
#include <NGIN/Attributes/MarkerType.hpp>

namespace NGIN::Attributes
{

  // One marker attachment as declared in the source: its concrete type and raw arguments.
  struct AttachedMarker
  {
    const MarkerTypeDesc *type{nullptr};
    std::vector<Argument> arguments;
  };

  /**
   * Read-only view of class-like structures, their ancestry, their components and the markers
   * attached to each. Implementations must return copies; the analyzer never keeps references
   * into the source past a single call.
   */
  class ReflectiveSource
  {
  public:
    virtual ~ReflectiveSource() = default;

    [[nodiscard]] virtual bool Contains(StructureId id) const = 0;
    [[nodiscard]] virtual std::optional<StructureInfo> Describe(StructureId id) const = 0;

    /// Parent classes, immediate parent first.
    [[nodiscard]] virtual NGIN::Containers::Vector<StructureId> Ancestors(StructureId id) const = 0;

    /// Directly and transitively implemented contracts, in source order, without duplicates.
    [[nodiscard]] virtual NGIN::Containers::Vector<StructureId> ImplementedContracts(StructureId id) const = 0;

    /// Properties, methods or constants visible on the structure, in declaration order.
    [[nodiscard]] virtual NGIN::Containers::Vector<ComponentInfo> ChildComponents(StructureId id, ComponentKind kind) const = 0;

    [[nodiscard]] virtual NGIN::Containers::Vector<ComponentInfo> Parameters(StructureId id, std::string_view method) const = 0;

    /// Markers on `target` whose type is `type` or a subtype of it, in attachment order.
    [[nodiscard]] virtual NGIN::Containers::Vector<AttachedMarker> AttachedMarkers(const Target &target,
                                                                                  const MarkerTypeDesc &type) const = 0;

    /// Structure a C++ type was registered as, used to normalize live objects to their runtime type.
    /// Sources that know no C++ types keep the default.
    [[nodiscard]] virtual std::optional<StructureId> StructureOfType(const std::type_info &) const { return std::nullopt; }
  };

} // namespace NGIN::Attributes
