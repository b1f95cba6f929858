#include <NGIN/Attributes/MarkerType.hpp>

namespace NGIN::Attributes
{

  bool MarkerTypeDesc::IsA(MarkerTypeId other) const noexcept
  {
    if (typeId == other)
      return true;
    for (NGIN::UIntSize i = 0; i < ancestry.Size(); ++i)
    {
      if (ancestry[i] == other)
        return true;
    }
    return false;
  }

  void *MarkerTypeDesc::UpcastTo(MarkerTypeId target, void *obj) const noexcept
  {
    if (!obj)
      return nullptr;
    if (typeId == target)
      return obj;
    for (NGIN::UIntSize i = 0; i < bases.Size(); ++i)
    {
      const auto &b = bases[i];
      if (!b.type->IsA(target))
        continue;
      return b.type->UpcastTo(target, b.Upcast(obj));
    }
    return nullptr;
  }

  NGIN::UInt32 MarkerTypeDesc::FindField(std::string_view fieldName) const noexcept
  {
    for (NGIN::UIntSize i = 0; i < fields.Size(); ++i)
    {
      if (fields[i].name == fieldName)
        return static_cast<NGIN::UInt32>(i);
    }
    return static_cast<NGIN::UInt32>(-1);
  }

} // namespace NGIN::Attributes
