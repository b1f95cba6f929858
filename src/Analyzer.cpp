#include <NGIN/Attributes/Analyzer.hpp>
#include <NGIN/Attributes/Instantiator.hpp>
#include <NGIN/Attributes/Log.hpp>

#include <fmt/core.h>

#include <span>
#include <string>
#include <utility>

namespace NGIN::Attributes
{
  namespace
  {
    thread_local NGIN::UInt32 t_depth = 0;

    struct DepthScope
    {
      DepthScope() noexcept { ++t_depth; }
      ~DepthScope() { --t_depth; }
      DepthScope(const DepthScope &) = delete;
      DepthScope &operator=(const DepthScope &) = delete;
    };

    std::string Where(const Target &t)
    {
      switch (t.kind)
      {
      case ComponentKind::Structure:
        return fmt::format("{:#018x}", t.structure);
      case ComponentKind::Parameter:
        return fmt::format("{:#018x}::{}(${})", t.structure, t.component, t.parameter);
      default:
        return fmt::format("{:#018x}::{}", t.structure, t.component);
      }
    }

    struct Level
    {
      NGIN::Containers::Vector<AttachedMarker> markers;
      NGIN::UIntSize index{0};
    };

    // Attachments at the first search target that carries any marker of `type`.
    std::optional<Level> FirstLevel(const ReflectiveSource &source, const NGIN::Containers::Vector<Target> &targets,
                                    const MarkerTypeDesc &type)
    {
      for (NGIN::UIntSize i = 0; i < targets.Size(); ++i)
      {
        auto markers = source.AttachedMarkers(targets[i], type);
        if (markers.Size() > 0)
          return Level{std::move(markers), i};
      }
      return std::nullopt;
    }

    // Instantiate an attachment and view it as `requested`.
    std::expected<MarkerInstance, Error> Materialize(const AttachedMarker &attached, const MarkerTypeDesc &requested)
    {
      if (!attached.type)
        return std::unexpected(Error{ErrorCode::InvalidArgument, "attachment has no marker type"});
      auto made = Instantiate(*attached.type, std::span<const Argument>{attached.arguments});
      if (!made.has_value())
        return std::unexpected(std::move(made.error()));
      void *viewed = attached.type->UpcastTo(requested.typeId, made->object);
      if (!viewed)
        return std::unexpected(Error{ErrorCode::InvalidArgument, "attached marker is not a subtype of the requested type",
                                     fmt::format("{} as {}", attached.type->qualifiedName, requested.qualifiedName)});
      made->object = viewed;
      return made;
    }

    std::expected<NGIN::Containers::Vector<MarkerInstance>, Error>
    FindSubMarkers(const ReflectiveSource &source, const Target &target, const MarkerTypeDesc &subType)
    {
      NGIN::Containers::Vector<MarkerInstance> out;
      const bool inheritable = subType.Has(Capability::Inheritable);
      const bool multi = subType.Has(Capability::Multivalue);
      const auto targets = detail::SearchTargets(source, target, inheritable);
      auto level = FirstLevel(source, targets, subType);
      if (!level)
        return out;
      if (!multi && level->markers.Size() > 1)
        return std::unexpected(Error{ErrorCode::AmbiguousAttachment, "sub-marker attached more than once",
                                     fmt::format("{} on {}", subType.qualifiedName, Where(targets[level->index]))});
      out.Reserve(level->markers.Size());
      for (NGIN::UIntSize i = 0; i < level->markers.Size(); ++i)
      {
        auto made = Materialize(level->markers[i], subType);
        if (!made.has_value())
          return std::unexpected(std::move(made.error()));
        out.PushBack(std::move(*made));
      }
      return out;
    }
  } // namespace

  std::expected<MarkerInstance, Error> Analyzer::AnalyzeRequest(const AnalysisRequest &request)
  {
    if (!request.markerType || !request.resolve)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "incomplete analysis request"});

    if (m_options.maxDepth != 0 && t_depth >= m_options.maxDepth)
    {
      detail::Log(LogLevel::Warn, "analysis of {} exceeded depth {}", request.markerType->qualifiedName,
                  m_options.maxDepth);
      return std::unexpected(Error{ErrorCode::RecursionLimit, "analysis nested too deeply",
                                   fmt::format("{} at depth {}", request.markerType->qualifiedName, t_depth)});
    }
    DepthScope scope;

    detail::Log(LogLevel::Debug, "analyze {} for {:#018x}", request.markerType->qualifiedName, request.subject);
    auto result = request.resolve(*this, request.subject);
    if (!result.has_value())
      detail::Log(LogLevel::Warn, "analysis of {} failed: {} ({})", request.markerType->qualifiedName,
                  result.error().message, result.error().detail);
    return result;
  }

  namespace detail
  {
    NGIN::Containers::Vector<Target> SearchTargets(const ReflectiveSource &source, const Target &subject, bool inheritable)
    {
      NGIN::Containers::Vector<Target> out;
      out.PushBack(subject);
      if (!inheritable)
        return out;

      const auto ancestors = source.Ancestors(subject.structure);
      for (NGIN::UIntSize i = 0; i < ancestors.Size(); ++i)
        out.PushBack(subject.On(ancestors[i]));

      // Contracts carry no properties, methods or parameters worth inheriting from.
      if (subject.kind == ComponentKind::Structure)
      {
        const auto contracts = source.ImplementedContracts(subject.structure);
        for (NGIN::UIntSize i = 0; i < contracts.Size(); ++i)
          out.PushBack(subject.On(contracts[i]));
      }
      return out;
    }

    std::expected<std::optional<MarkerInstance>, Error>
    FindMarker(const ReflectiveSource &source, const Target &subject, const MarkerTypeDesc &type, bool inheritable)
    {
      const auto targets = SearchTargets(source, subject, inheritable);
      auto level = FirstLevel(source, targets, type);
      if (!level)
        return std::optional<MarkerInstance>{};

      const auto &first = level->markers[0];
      if (level->markers.Size() > 1 && !type.Has(Capability::Multivalue))
        return std::unexpected(Error{ErrorCode::AmbiguousAttachment, "marker attached more than once",
                                     fmt::format("{} on {}", type.qualifiedName, Where(targets[level->index]))});

      if (level->index > 0)
        Log(LogLevel::Debug, "{} inherited from {}", type.qualifiedName, Where(targets[level->index]));

      auto made = Materialize(first, type);
      if (!made.has_value())
        return std::unexpected(std::move(made.error()));
      return std::optional<MarkerInstance>{std::move(*made)};
    }

    std::expected<MarkerInstance, Error> DefaultInstance(const MarkerTypeDesc &type)
    {
      Log(LogLevel::Trace, "default-instantiating {}", type.qualifiedName);
      return Instantiate(type);
    }

    std::expected<void, Error>
    FoldSubMarkers(const ReflectiveSource &source, const Target &target, const MarkerTypeDesc &type, void *marker)
    {
      for (NGIN::UIntSize i = 0; i < type.subMarkers.Size(); ++i)
      {
        const auto &sub = type.subMarkers[i];
        const auto &subType = sub.Type();
        auto found = FindSubMarkers(source, target, subType);
        if (!found.has_value())
          return std::unexpected(std::move(found.error()));
        void *handler = type.UpcastTo(sub.owner, marker);
        if (!handler)
          return std::unexpected(Error{ErrorCode::InvalidArgument, "sub-marker handler owner is not a marker base",
                                       fmt::format("{} in {}", subType.qualifiedName, type.qualifiedName)});
        Log(LogLevel::Trace, "folding {} x {} into {}", found->Size(), subType.qualifiedName, type.qualifiedName);
        sub.Fold(handler, *found);
      }
      return {};
    }

    std::optional<StructureId> TransitiveSubject(const ReflectiveSource &source, const ComponentInfo &component)
    {
      if (!component.declaredType || component.declaredType->empty())
        return std::nullopt;
      const auto id = StructureIdOf(*component.declaredType);
      if (!source.Contains(id))
        return std::nullopt;
      return id;
    }

    Target ComponentTarget(StructureId structure, const ComponentInfo &component)
    {
      if (component.kind == ComponentKind::Parameter)
        return Target::Param(structure, component.method, component.name);
      return Target::Member(structure, component.kind, component.name);
    }
  } // namespace detail

} // namespace NGIN::Attributes
