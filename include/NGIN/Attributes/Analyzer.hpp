// Analyzer.hpp
// Resolution entry points: the ClassAnalyzer interface and the source-backed Analyzer.
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Meta/TypeName.hpp>

#include <concepts>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>

#include <NGIN/Attributes/Export.hpp>
#include <NGIN/Attributes/Types.hpp>
#include <NGIN/Attributes/MarkerType.hpp>
#include <NGIN/Attributes/Source.hpp>

namespace NGIN::Attributes
{

  class Analyzer;

  struct AnalyzerOptions
  {
    // Maximum number of nested analyses on one thread, as reached when custom resolution hooks
    // call back into the analyzer. 0 disables the guard.
    NGIN::UInt32 maxDepth{0};
  };

  using ResolveFn = std::expected<MarkerInstance, Error> (*)(Analyzer &, StructureId);

  // One (structure, marker type) question. `resolve` is the type-specific resolution routine.
  struct AnalysisRequest
  {
    StructureId subject{0};
    const MarkerTypeDesc *markerType{nullptr};
    ResolveFn resolve{nullptr};
  };

  namespace detail
  {
    template <class M>
    std::expected<MarkerInstance, Error> ResolveStructure(Analyzer &analyzer, StructureId subject);
  } // namespace detail

  /**
   * Resolves the authoritative marker of a given type for a structure.
   *
   * Implementations either resolve (Analyzer) or decorate another analyzer (MemoryCacheAnalyzer).
   * Results are shared and immutable; the same request answered twice by a caching analyzer yields
   * the same object.
   */
  class NGIN_ATTRIBUTES_API ClassAnalyzer
  {
  public:
    virtual ~ClassAnalyzer() = default;

    [[nodiscard]] virtual std::expected<MarkerInstance, Error> AnalyzeRequest(const AnalysisRequest &request) = 0;

    template <class M>
    [[nodiscard]] std::expected<std::shared_ptr<const M>, Error> Analyze(StructureId subject);

    template <class M>
    [[nodiscard]] std::expected<std::shared_ptr<const M>, Error> Analyze(std::string_view qualifiedName)
    {
      return Analyze<M>(StructureIdOf(qualifiedName));
    }

    // A live object is analyzed as its runtime type. A polymorphic object seen through a base
    // reference must have its dynamic type registered (Registry::Register<T>()); otherwise the
    // object is analyzed as its static type, registered under NGIN::Meta::TypeName.
    template <class M, class Obj>
      requires(std::is_class_v<Obj> && !std::convertible_to<const Obj &, std::string_view>)
    [[nodiscard]] std::expected<std::shared_ptr<const M>, Error> Analyze(const Obj &object)
    {
      if constexpr (std::is_polymorphic_v<Obj>)
      {
        const std::type_info &dynamic = typeid(object);
        if (dynamic != typeid(Obj))
        {
          const auto id = StructureOfType(dynamic);
          if (!id)
            return std::unexpected(Error{ErrorCode::NotFound, "runtime type of the object is not registered",
                                         std::string{dynamic.name()}});
          return Analyze<M>(*id);
        }
      }
      return Analyze<M>(StructureIdOf(NGIN::Meta::TypeName<Obj>::qualifiedName));
    }

    /// Structure registered for a C++ type, if the underlying source knows it.
    [[nodiscard]] virtual std::optional<StructureId> StructureOfType(const std::type_info &) const { return std::nullopt; }
  };

  class NGIN_ATTRIBUTES_API Analyzer final : public ClassAnalyzer
  {
  public:
    explicit Analyzer(const ReflectiveSource &source, AnalyzerOptions options = {})
        : m_source(&source), m_options(options)
    {
    }

    [[nodiscard]] std::expected<MarkerInstance, Error> AnalyzeRequest(const AnalysisRequest &request) override;

    [[nodiscard]] std::optional<StructureId> StructureOfType(const std::type_info &type) const override
    {
      return m_source->StructureOfType(type);
    }

    [[nodiscard]] const ReflectiveSource &Source() const noexcept { return *m_source; }
    [[nodiscard]] const AnalyzerOptions &Options() const noexcept { return m_options; }

  private:
    const ReflectiveSource *m_source{nullptr};
    AnalyzerOptions m_options{};
  };

  template <class M>
  inline std::expected<std::shared_ptr<const M>, Error> ClassAnalyzer::Analyze(StructureId subject)
  {
    using U = std::remove_cvref_t<M>;
    const AnalysisRequest request{subject, &MarkerTypeOf<U>(), &detail::ResolveStructure<U>};
    auto result = AnalyzeRequest(request);
    if (!result.has_value())
      return std::unexpected(std::move(result.error()));
    return std::shared_ptr<const U>(result->owner, static_cast<const U *>(result->object));
  }

} // namespace NGIN::Attributes

#include <NGIN/Attributes/Resolution.hpp>
