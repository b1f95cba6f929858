#include <NGIN/Attributes/MemoryCacheAnalyzer.hpp>
#include <NGIN/Attributes/Log.hpp>

#include <NGIN/Hashing/FNV.hpp>

#include <cstring>

namespace NGIN::Attributes
{
  namespace
  {
    constexpr NGIN::UInt32 kNoEntry = static_cast<NGIN::UInt32>(-1);

    NGIN::UInt64 KeyOf(StructureId subject, MarkerTypeId markerType) noexcept
    {
      unsigned char bytes[sizeof(StructureId) + sizeof(MarkerTypeId)];
      std::memcpy(bytes, &subject, sizeof(subject));
      std::memcpy(bytes + sizeof(subject), &markerType, sizeof(markerType));
      return NGIN::Hashing::FNV1a64(bytes, sizeof(bytes));
    }
  } // namespace

  NGIN::UInt32 MemoryCacheAnalyzer::FindLocked(StructureId subject, MarkerTypeId markerType) const
  {
    const auto *idx = m_index.GetPtr(KeyOf(subject, markerType));
    if (!idx)
      return kNoEntry;
    if (m_entries[*idx].subject == subject && m_entries[*idx].markerType == markerType)
      return *idx;
    // Key collision with a different pair.
    for (NGIN::UIntSize i = 0; i < m_entries.Size(); ++i)
    {
      if (m_entries[i].subject == subject && m_entries[i].markerType == markerType)
        return static_cast<NGIN::UInt32>(i);
    }
    return kNoEntry;
  }

  std::expected<MarkerInstance, Error> MemoryCacheAnalyzer::AnalyzeRequest(const AnalysisRequest &request)
  {
    if (!request.markerType)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "incomplete analysis request"});
    const auto typeId = request.markerType->typeId;

    {
      std::lock_guard<std::mutex> lock(m_mutex);
      const auto hit = FindLocked(request.subject, typeId);
      if (hit != kNoEntry)
      {
        detail::Log(LogLevel::Trace, "cache hit: {} for {:#018x}", request.markerType->qualifiedName, request.subject);
        return m_entries[hit].instance;
      }
    }

    auto result = m_inner->AnalyzeRequest(request);
    if (!result.has_value())
      return result;

    std::lock_guard<std::mutex> lock(m_mutex);
    const auto raced = FindLocked(request.subject, typeId);
    if (raced != kNoEntry)
      return m_entries[raced].instance;

    const auto idx = static_cast<NGIN::UInt32>(m_entries.Size());
    m_entries.PushBack(Entry{request.subject, typeId, *result});
    const auto key = KeyOf(request.subject, typeId);
    if (!m_index.GetPtr(key))
      m_index.Insert(key, idx);
    return result;
  }

  NGIN::UIntSize MemoryCacheAnalyzer::Size() const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.Size();
  }

} // namespace NGIN::Attributes
