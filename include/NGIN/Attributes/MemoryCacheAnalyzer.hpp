// MemoryCacheAnalyzer.hpp
// Memoizing decorator over any ClassAnalyzer, keyed by (structure, marker type).
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Containers/HashMap.hpp>

#include <expected>
#include <mutex>
#include <optional>
#include <typeinfo>

#include <NGIN/Attributes/Export.hpp>
#include <NGIN/Attributes/Analyzer.hpp>

namespace NGIN::Attributes
{

  /**
   * Caches every successful analysis of the wrapped analyzer for the lifetime of this object.
   *
   * A hit returns the stored instance without consulting the wrapped analyzer. Failures are
   * passed through and not cached. Safe to share between threads; when two threads miss on the
   * same key concurrently, the first stored result is the one every caller receives.
   */
  class NGIN_ATTRIBUTES_API MemoryCacheAnalyzer final : public ClassAnalyzer
  {
  public:
    explicit MemoryCacheAnalyzer(ClassAnalyzer &inner) : m_inner(&inner) {}

    MemoryCacheAnalyzer(const MemoryCacheAnalyzer &) = delete;
    MemoryCacheAnalyzer &operator=(const MemoryCacheAnalyzer &) = delete;

    [[nodiscard]] std::expected<MarkerInstance, Error> AnalyzeRequest(const AnalysisRequest &request) override;

    [[nodiscard]] std::optional<StructureId> StructureOfType(const std::type_info &type) const override
    {
      return m_inner->StructureOfType(type);
    }

    [[nodiscard]] NGIN::UIntSize Size() const;

  private:
    struct Entry
    {
      StructureId subject{0};
      MarkerTypeId markerType{0};
      MarkerInstance instance{};
    };

    // Index of the entry for the pair, or -1. Caller holds m_mutex.
    NGIN::UInt32 FindLocked(StructureId subject, MarkerTypeId markerType) const;

    ClassAnalyzer *m_inner{nullptr};
    mutable std::mutex m_mutex;
    NGIN::Containers::Vector<Entry> m_entries;
    NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> m_index;
  };

} // namespace NGIN::Attributes
