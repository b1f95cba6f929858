// MarkerMap.hpp
// Name-keyed, declaration-ordered map of resolved child markers (properties, methods, constants, parameters).
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Hashing/FNV.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace NGIN::Attributes
{

  template <class M>
  class MarkerMap
  {
  public:
    using Pointer = std::shared_ptr<const M>;

    MarkerMap() = default;

    /// Insert or replace the entry for `name`, keeping its original position on replace.
    void Insert(std::string_view name, Pointer value)
    {
      if (auto idx = IndexOf(name); idx != NotFound)
      {
        m_values[idx] = std::move(value);
        return;
      }
      const auto key = Key(name);
      const auto newIdx = static_cast<NGIN::UInt32>(m_names.Size());
      m_names.PushBack(std::string{name});
      m_values.PushBack(std::move(value));
      if (!m_index.GetPtr(key))
        m_index.Insert(key, newIdx);
    }

    [[nodiscard]] NGIN::UIntSize Size() const noexcept { return m_names.Size(); }
    [[nodiscard]] bool Empty() const noexcept { return m_names.Size() == 0; }

    [[nodiscard]] bool Contains(std::string_view name) const { return IndexOf(name) != NotFound; }

    /// Null when no component of that name survived resolution.
    [[nodiscard]] Pointer Find(std::string_view name) const
    {
      const auto idx = IndexOf(name);
      if (idx == NotFound)
        return nullptr;
      return m_values[idx];
    }

    [[nodiscard]] std::string_view NameAt(NGIN::UIntSize i) const { return m_names[i]; }
    [[nodiscard]] const Pointer &At(NGIN::UIntSize i) const { return m_values[i]; }

  private:
    static constexpr NGIN::UInt32 NotFound = static_cast<NGIN::UInt32>(-1);

    static NGIN::UInt64 Key(std::string_view name)
    {
      return NGIN::Hashing::FNV1a64(name.data(), name.size());
    }

    NGIN::UInt32 IndexOf(std::string_view name) const
    {
      const auto *p = m_index.GetPtr(Key(name));
      if (!p)
        return NotFound;
      if (m_names[*p] == name)
        return *p;
      // Hash collision: the index only remembers the first name per key.
      for (NGIN::UIntSize i = 0; i < m_names.Size(); ++i)
      {
        if (m_names[i] == name)
          return static_cast<NGIN::UInt32>(i);
      }
      return NotFound;
    }

    NGIN::Containers::Vector<std::string> m_names;
    NGIN::Containers::Vector<Pointer> m_values;
    NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> m_index;
  };

} // namespace NGIN::Attributes
