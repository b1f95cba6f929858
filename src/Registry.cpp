#include <NGIN/Attributes/Registry.hpp>
#include <NGIN/Attributes/NameUtils.hpp>
#include <NGIN/Attributes/Log.hpp>

#include <string>
#include <utility>

namespace NGIN::Attributes
{
  namespace
  {
    std::optional<std::string> TypeOrNone(std::string_view type)
    {
      if (type.empty())
        return std::nullopt;
      return std::string{type};
    }

    bool ContainsName(const NGIN::Containers::Vector<std::string> &names, std::string_view name)
    {
      for (NGIN::UIntSize i = 0; i < names.Size(); ++i)
      {
        if (names[i] == name)
          return true;
      }
      return false;
    }

    bool ContainsComponent(const NGIN::Containers::Vector<ComponentInfo> &list, std::string_view name)
    {
      for (NGIN::UIntSize i = 0; i < list.Size(); ++i)
      {
        if (list[i].name == name)
          return true;
      }
      return false;
    }

    ComponentInfo ToInfo(const detail::StructureRecord &owner, const detail::ComponentRecord &c)
    {
      ComponentInfo info{};
      info.kind = c.kind;
      info.name = c.name;
      info.declaringStructure = owner.qualifiedName;
      info.declaredType = c.declaredType;
      info.isStatic = c.isStatic;
      return info;
    }
  } // namespace

  ParameterBuilder &ParameterBuilder::Optional()
  {
    auto &c = m_registry->m_structures[m_structure].components[m_component];
    c.parameters[m_parameter].isOptional = true;
    return *this;
  }

  ComponentBuilder &ComponentBuilder::Static()
  {
    m_registry->m_structures[m_structure].components[m_component].isStatic = true;
    return *this;
  }

  ParameterBuilder ComponentBuilder::Parameter(std::string_view name, std::string_view type)
  {
    auto &c = m_registry->m_structures[m_structure].components[m_component];
    detail::ParameterRecord p{};
    p.name = std::string{name};
    p.declaredType = TypeOrNone(type);
    const auto idx = static_cast<NGIN::UInt32>(c.parameters.Size());
    c.parameters.PushBack(std::move(p));
    return ParameterBuilder{*m_registry, m_structure, m_component, idx};
  }

  StructureBuilder &StructureBuilder::Parent(std::string_view qualifiedName)
  {
    m_registry->m_structures[m_structure].parent = std::string{qualifiedName};
    return *this;
  }

  StructureBuilder &StructureBuilder::Implements(std::string_view qualifiedName)
  {
    auto &rec = m_registry->m_structures[m_structure];
    if (!ContainsName(rec.contracts, qualifiedName))
      rec.contracts.PushBack(std::string{qualifiedName});
    return *this;
  }

  StructureBuilder &StructureBuilder::Abstract()
  {
    m_registry->m_structures[m_structure].isAbstract = true;
    return *this;
  }

  StructureBuilder &StructureBuilder::Final()
  {
    m_registry->m_structures[m_structure].isFinal = true;
    return *this;
  }

  ComponentBuilder StructureBuilder::Property(std::string_view name, std::string_view type)
  {
    return AddComponent(ComponentKind::Property, name, type);
  }

  ComponentBuilder StructureBuilder::Method(std::string_view name, std::string_view returnType)
  {
    return AddComponent(ComponentKind::Method, name, returnType);
  }

  ComponentBuilder StructureBuilder::Constant(std::string_view name, std::string_view type)
  {
    return AddComponent(ComponentKind::Constant, name, type);
  }

  StructureId StructureBuilder::Id() const
  {
    return m_registry->m_structures[m_structure].id;
  }

  ComponentBuilder StructureBuilder::AddComponent(ComponentKind kind, std::string_view name, std::string_view type)
  {
    auto &rec = m_registry->m_structures[m_structure];
    // Redeclaring a component reopens it.
    for (NGIN::UIntSize i = 0; i < rec.components.Size(); ++i)
    {
      auto &c = rec.components[i];
      if (c.kind == kind && c.name == name)
      {
        if (!type.empty())
          c.declaredType = std::string{type};
        return ComponentBuilder{*m_registry, m_structure, static_cast<NGIN::UInt32>(i)};
      }
    }
    detail::ComponentRecord c{};
    c.kind = kind;
    c.name = std::string{name};
    c.declaredType = TypeOrNone(type);
    const auto idx = static_cast<NGIN::UInt32>(rec.components.Size());
    rec.components.PushBack(std::move(c));
    return ComponentBuilder{*m_registry, m_structure, idx};
  }

  StructureBuilder Registry::Class(std::string_view qualifiedName)
  {
    return Declare(qualifiedName, StructureKind::Class);
  }

  StructureBuilder Registry::Contract(std::string_view qualifiedName)
  {
    return Declare(qualifiedName, StructureKind::Contract);
  }

  StructureBuilder Registry::Enum(std::string_view qualifiedName)
  {
    return Declare(qualifiedName, StructureKind::Enum);
  }

  StructureBuilder Registry::Declare(std::string_view qualifiedName, StructureKind kind)
  {
    const auto id = StructureIdOf(qualifiedName);
    if (auto *existing = m_byId.GetPtr(id))
    {
      const auto &rec = m_structures[*existing];
      if (rec.kind != kind)
        detail::Log(LogLevel::Warn, "{} reopened as {}; keeping {}", rec.qualifiedName, ToString(kind), ToString(rec.kind));
      return StructureBuilder{*this, *existing};
    }
    detail::StructureRecord rec{};
    rec.id = id;
    rec.qualifiedName = std::string{qualifiedName};
    rec.kind = kind;
    const auto idx = static_cast<NGIN::UInt32>(m_structures.Size());
    m_structures.PushBack(std::move(rec));
    m_byId.Insert(id, idx);
    return StructureBuilder{*this, idx};
  }

  void Registry::BindType(const std::type_info &type, StructureId structure)
  {
    for (NGIN::UIntSize i = 0; i < m_byType.Size(); ++i)
    {
      if (*m_byType[i].type == type)
      {
        m_byType[i].structure = structure;
        return;
      }
    }
    m_byType.PushBack(TypeBinding{&type, structure});
  }

  std::optional<StructureId> Registry::StructureOfType(const std::type_info &type) const
  {
    for (NGIN::UIntSize i = 0; i < m_byType.Size(); ++i)
    {
      if (*m_byType[i].type == type)
        return m_byType[i].structure;
    }
    return std::nullopt;
  }

  const detail::StructureRecord *Registry::Find(StructureId id) const
  {
    const auto *idx = m_byId.GetPtr(id);
    return idx ? &m_structures[*idx] : nullptr;
  }

  NGIN::Containers::Vector<AttachedMarker> &Registry::MarkersAt(NGIN::UInt32 structure, NGIN::UInt32 component,
                                                                 NGIN::UInt32 parameter)
  {
    auto &rec = m_structures[structure];
    if (component == detail::kNoIndex)
      return rec.markers;
    auto &c = rec.components[component];
    if (parameter == detail::kNoIndex)
      return c.markers;
    return c.parameters[parameter].markers;
  }

  bool Registry::Contains(StructureId id) const
  {
    return Find(id) != nullptr;
  }

  NGIN::Containers::Vector<std::string> Registry::AncestorNames(StructureId id) const
  {
    NGIN::Containers::Vector<std::string> out;
    const auto *rec = Find(id);
    if (!rec || rec->kind != StructureKind::Class)
      return out;
    // Stops at the first unregistered parent or when the chain loops back.
    while (rec && !rec->parent.empty())
    {
      if (rec->parent == Find(id)->qualifiedName || ContainsName(out, rec->parent))
        break;
      out.PushBack(rec->parent);
      rec = Find(StructureIdOf(rec->parent));
    }
    return out;
  }

  void Registry::CollectContracts(const detail::StructureRecord &rec, NGIN::Containers::Vector<std::string> &out) const
  {
    for (NGIN::UIntSize i = 0; i < rec.contracts.Size(); ++i)
    {
      const auto &name = rec.contracts[i];
      if (ContainsName(out, name))
        continue;
      out.PushBack(name);
      if (const auto *contract = Find(StructureIdOf(name)))
        CollectContracts(*contract, out);
    }
  }

  NGIN::Containers::Vector<std::string> Registry::ContractNames(StructureId id) const
  {
    NGIN::Containers::Vector<std::string> out;
    const auto *rec = Find(id);
    if (!rec)
      return out;
    CollectContracts(*rec, out);
    const auto ancestors = AncestorNames(id);
    for (NGIN::UIntSize i = 0; i < ancestors.Size(); ++i)
    {
      if (const auto *parent = Find(StructureIdOf(ancestors[i])))
        CollectContracts(*parent, out);
    }
    return out;
  }

  NGIN::Containers::Vector<StructureId> Registry::Ancestors(StructureId id) const
  {
    NGIN::Containers::Vector<StructureId> out;
    const auto names = AncestorNames(id);
    out.Reserve(names.Size());
    for (NGIN::UIntSize i = 0; i < names.Size(); ++i)
      out.PushBack(StructureIdOf(names[i]));
    return out;
  }

  NGIN::Containers::Vector<StructureId> Registry::ImplementedContracts(StructureId id) const
  {
    NGIN::Containers::Vector<StructureId> out;
    const auto names = ContractNames(id);
    out.Reserve(names.Size());
    for (NGIN::UIntSize i = 0; i < names.Size(); ++i)
      out.PushBack(StructureIdOf(names[i]));
    return out;
  }

  std::optional<StructureInfo> Registry::Describe(StructureId id) const
  {
    const auto *rec = Find(id);
    if (!rec)
      return std::nullopt;
    StructureInfo info{};
    info.id = rec->id;
    info.qualifiedName = rec->qualifiedName;
    info.shortName = std::string{detail::ShortName(rec->qualifiedName)};
    info.kind = rec->kind;
    info.isAbstract = rec->isAbstract;
    info.isFinal = rec->isFinal;
    info.ancestors = AncestorNames(id);
    info.contracts = ContractNames(id);
    return info;
  }

  Registry::ComponentLookup Registry::FindComponent(StructureId id, ComponentKind kind, std::string_view name) const
  {
    const auto *rec = Find(id);
    if (!rec)
      return {};
    const auto ancestors = AncestorNames(id);
    for (NGIN::UIntSize level = 0; rec; ++level)
    {
      for (NGIN::UIntSize i = 0; i < rec->components.Size(); ++i)
      {
        const auto &c = rec->components[i];
        if (c.kind == kind && c.name == name)
          return ComponentLookup{rec, &c};
      }
      rec = level < ancestors.Size() ? Find(StructureIdOf(ancestors[level])) : nullptr;
    }
    return {};
  }

  NGIN::Containers::Vector<ComponentInfo> Registry::ChildComponents(StructureId id, ComponentKind kind) const
  {
    NGIN::Containers::Vector<ComponentInfo> out;
    const auto *rec = Find(id);
    if (!rec)
      return out;
    const auto ancestors = AncestorNames(id);
    for (NGIN::UIntSize level = 0; rec; ++level)
    {
      for (NGIN::UIntSize i = 0; i < rec->components.Size(); ++i)
      {
        const auto &c = rec->components[i];
        if (c.kind == kind && !ContainsComponent(out, c.name))
          out.PushBack(ToInfo(*rec, c));
      }
      rec = level < ancestors.Size() ? Find(StructureIdOf(ancestors[level])) : nullptr;
    }
    return out;
  }

  NGIN::Containers::Vector<ComponentInfo> Registry::Parameters(StructureId id, std::string_view method) const
  {
    NGIN::Containers::Vector<ComponentInfo> out;
    const auto found = FindComponent(id, ComponentKind::Method, method);
    if (!found.component)
      return out;
    const auto &params = found.component->parameters;
    out.Reserve(params.Size());
    for (NGIN::UIntSize i = 0; i < params.Size(); ++i)
    {
      ComponentInfo info{};
      info.kind = ComponentKind::Parameter;
      info.name = params[i].name;
      info.declaringStructure = found.owner->qualifiedName;
      info.declaredType = params[i].declaredType;
      info.method = found.component->name;
      info.position = static_cast<NGIN::UInt32>(i);
      info.isOptional = params[i].isOptional;
      out.PushBack(std::move(info));
    }
    return out;
  }

  const NGIN::Containers::Vector<AttachedMarker> *Registry::MarkersOf(const Target &target) const
  {
    switch (target.kind)
    {
    case ComponentKind::Structure:
    {
      const auto *rec = Find(target.structure);
      return rec ? &rec->markers : nullptr;
    }
    case ComponentKind::Property:
    case ComponentKind::Method:
    case ComponentKind::Constant:
    {
      const auto found = FindComponent(target.structure, target.kind, target.component);
      return found.component ? &found.component->markers : nullptr;
    }
    case ComponentKind::Parameter:
    {
      const auto found = FindComponent(target.structure, ComponentKind::Method, target.component);
      if (!found.component)
        return nullptr;
      const auto &params = found.component->parameters;
      for (NGIN::UIntSize i = 0; i < params.Size(); ++i)
      {
        if (params[i].name == target.parameter)
          return &params[i].markers;
      }
      return nullptr;
    }
    }
    return nullptr;
  }

  NGIN::Containers::Vector<AttachedMarker> Registry::AttachedMarkers(const Target &target,
                                                                     const MarkerTypeDesc &type) const
  {
    NGIN::Containers::Vector<AttachedMarker> out;
    const auto *markers = MarkersOf(target);
    if (!markers)
      return out;
    for (NGIN::UIntSize i = 0; i < markers->Size(); ++i)
    {
      const auto &m = (*markers)[i];
      if (m.type && m.type->IsA(type.typeId))
        out.PushBack(m);
    }
    return out;
  }

} // namespace NGIN::Attributes
