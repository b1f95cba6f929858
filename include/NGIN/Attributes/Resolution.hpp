// Resolution.hpp
// Capability dispatch: the per-marker-type resolution steps, instantiated for each analyzed marker type.
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <expected>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

#include <fmt/core.h>

#include <NGIN/Attributes/Analyzer.hpp>
#include <NGIN/Attributes/Capabilities.hpp>
#include <NGIN/Attributes/Export.hpp>
#include <NGIN/Attributes/Log.hpp>
#include <NGIN/Attributes/MarkerMap.hpp>
#include <NGIN/Attributes/MarkerType.hpp>
#include <NGIN/Attributes/Source.hpp>
#include <NGIN/Attributes/Types.hpp>

namespace NGIN::Attributes::detail
{

  /// Targets consulted for `subject`, in precedence order. Without inheritance only the subject
  /// itself; otherwise the subject, then the same target on each ancestor class and, for
  /// structures only, each implemented contract.
  [[nodiscard]] NGIN_ATTRIBUTES_API NGIN::Containers::Vector<Target>
  SearchTargets(const ReflectiveSource &source, const Target &subject, bool inheritable);

  /// First marker of `type` (or a subtype) along the search list, instantiated from its arguments
  /// and viewed as `type`. Empty when nothing is attached anywhere on the list.
  [[nodiscard]] NGIN_ATTRIBUTES_API std::expected<std::optional<MarkerInstance>, Error>
  FindMarker(const ReflectiveSource &source, const Target &subject, const MarkerTypeDesc &type, bool inheritable);

  [[nodiscard]] NGIN_ATTRIBUTES_API std::expected<MarkerInstance, Error> DefaultInstance(const MarkerTypeDesc &type);

  // Runs every sub-marker handler registered on `type` against `marker`.
  [[nodiscard]] NGIN_ATTRIBUTES_API std::expected<void, Error>
  FoldSubMarkers(const ReflectiveSource &source, const Target &target, const MarkerTypeDesc &type, void *marker);

  // The structure named by a component's declared type, if the source knows it.
  [[nodiscard]] NGIN_ATTRIBUTES_API std::optional<StructureId>
  TransitiveSubject(const ReflectiveSource &source, const ComponentInfo &component);

  [[nodiscard]] NGIN_ATTRIBUTES_API Target ComponentTarget(StructureId structure, const ComponentInfo &component);

  // Hooks may return void or std::expected<void, Error>; a returned error aborts the analysis.
  template <class M, class Info>
  std::expected<void, Error> RunCustomResolve(M &marker, ClassAnalyzer &analyzer, const Info &info)
  {
    if constexpr (std::is_void_v<decltype(marker.CustomResolve(analyzer, info))>)
    {
      marker.CustomResolve(analyzer, info);
      return {};
    }
    else
    {
      return marker.CustomResolve(analyzer, info);
    }
  }

  template <class C>
  std::expected<std::optional<std::shared_ptr<const C>>, Error>
  ResolveComponent(Analyzer &analyzer, const Target &target, const ComponentInfo &info, bool includeByDefault);

  template <class C>
  std::expected<MarkerMap<C>, Error> ResolveEach(Analyzer &analyzer, StructureId subject,
                                                 const NGIN::Containers::Vector<ComponentInfo> &components,
                                                 bool includeByDefault)
  {
    MarkerMap<C> map;
    for (NGIN::UIntSize i = 0; i < components.Size(); ++i)
    {
      const auto &info = components[i];
      auto resolved = ResolveComponent<C>(analyzer, ComponentTarget(subject, info), info, includeByDefault);
      if (!resolved.has_value())
        return std::unexpected(std::move(resolved.error()));
      if (resolved->has_value())
        map.Insert(info.name, std::move(**resolved));
    }
    return map;
  }

  template <class C>
  std::expected<std::optional<std::shared_ptr<const C>>, Error>
  ResolveComponent(Analyzer &analyzer, const Target &target, const ComponentInfo &info, bool includeByDefault)
  {
    using Result = std::optional<std::shared_ptr<const C>>;
    const auto &type = MarkerTypeOf<C>();
    const auto &source = analyzer.Source();

    auto found = FindMarker(source, target, type, InheritableMarker<C>);
    if (!found.has_value())
      return std::unexpected(std::move(found.error()));
    std::optional<MarkerInstance> instance = std::move(*found);

    if constexpr (TransitiveMarker<C>)
    {
      const bool typed = info.kind == ComponentKind::Property || info.kind == ComponentKind::Parameter;
      if (!instance && typed)
      {
        if (const auto other = TransitiveSubject(source, info))
        {
          auto viaType = FindMarker(source, Target::Of(*other), type, InheritableMarker<C>);
          if (!viaType.has_value())
            return std::unexpected(std::move(viaType.error()));
          instance = std::move(*viaType);
          if (instance)
            Log(LogLevel::Debug, "{} '{}' takes {} from its type {}", ToString(info.kind), info.name,
                type.qualifiedName, *info.declaredType);
        }
      }
    }

    if (!instance)
    {
      if (!includeByDefault)
        return Result{};
      auto made = DefaultInstance(type);
      if (!made.has_value())
        return std::unexpected(std::move(made.error()));
      instance = std::move(*made);
    }

    auto *marker = static_cast<C *>(instance->object);
    if constexpr (ReflectsComponent<C>)
      marker->FromReflection(info);

    if (type.Has(Capability::HasSubMarkers))
    {
      auto folded = FoldSubMarkers(source, target, type, marker);
      if (!folded.has_value())
        return std::unexpected(std::move(folded.error()));
    }

    if constexpr (ParsesParameters<C>)
    {
      if (info.kind == ComponentKind::Method)
      {
        auto params = ResolveEach<typename C::ParameterMarker>(analyzer, target.structure,
                                                               source.Parameters(target.structure, info.name),
                                                               marker->IncludeParametersByDefault());
        if (!params.has_value())
          return std::unexpected(std::move(params.error()));
        marker->SetParameters(std::move(*params));
      }
    }

    if constexpr (CustomResolvesComponent<C>)
    {
      auto hooked = RunCustomResolve(*marker, static_cast<ClassAnalyzer &>(analyzer), info);
      if (!hooked.has_value())
        return std::unexpected(std::move(hooked.error()));
    }

    if constexpr (ExcludableMarker<C>)
    {
      if (std::as_const(*marker).Exclude())
      {
        Log(LogLevel::Trace, "{} '{}' excluded by {}", ToString(info.kind), info.name, type.qualifiedName);
        return Result{};
      }
    }

    return Result{std::shared_ptr<const C>(instance->owner, marker)};
  }

  template <class M>
  std::expected<MarkerInstance, Error> ResolveStructure(Analyzer &analyzer, StructureId subject)
  {
    const auto &type = MarkerTypeOf<M>();
    const auto &source = analyzer.Source();

    const auto info = source.Describe(subject);
    if (!info)
      return std::unexpected(Error{ErrorCode::NotFound, "structure is not known to the source",
                                   fmt::format("{:#018x}", subject)});

    const auto target = Target::Of(subject);
    auto found = FindMarker(source, target, type, InheritableMarker<M>);
    if (!found.has_value())
      return std::unexpected(std::move(found.error()));

    MarkerInstance instance{};
    if (found->has_value())
    {
      instance = std::move(**found);
    }
    else
    {
      auto made = DefaultInstance(type);
      if (!made.has_value())
        return std::unexpected(std::move(made.error()));
      instance = std::move(*made);
    }

    auto *marker = static_cast<M *>(instance.object);
    if constexpr (ReflectsStructure<M>)
      marker->FromReflection(*info);

    if (type.Has(Capability::HasSubMarkers))
    {
      auto folded = FoldSubMarkers(source, target, type, marker);
      if (!folded.has_value())
        return std::unexpected(std::move(folded.error()));
    }

    if constexpr (ParsesProperties<M>)
    {
      auto children = ResolveEach<typename M::PropertyMarker>(analyzer, subject,
                                                             source.ChildComponents(subject, ComponentKind::Property),
                                                             marker->IncludePropertiesByDefault());
      if (!children.has_value())
        return std::unexpected(std::move(children.error()));
      marker->SetProperties(std::move(*children));
    }

    if constexpr (ParsesMethods<M>)
    {
      auto children = ResolveEach<typename M::MethodMarker>(analyzer, subject,
                                                           source.ChildComponents(subject, ComponentKind::Method),
                                                           marker->IncludeMethodsByDefault());
      if (!children.has_value())
        return std::unexpected(std::move(children.error()));
      marker->SetMethods(std::move(*children));
    }

    if constexpr (ParsesConstants<M>)
    {
      auto children = ResolveEach<typename M::ConstantMarker>(analyzer, subject,
                                                             source.ChildComponents(subject, ComponentKind::Constant),
                                                             marker->IncludeConstantsByDefault());
      if (!children.has_value())
        return std::unexpected(std::move(children.error()));
      marker->SetConstants(std::move(*children));
    }

    if constexpr (CustomResolvesStructure<M>)
    {
      auto hooked = RunCustomResolve(*marker, static_cast<ClassAnalyzer &>(analyzer), *info);
      if (!hooked.has_value())
        return std::unexpected(std::move(hooked.error()));
    }

    return instance;
  }

} // namespace NGIN::Attributes::detail
