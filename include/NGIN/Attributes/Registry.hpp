// Registry.hpp
// In-memory reflective source: structures, components and marker attachments described through builders.
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Meta/TypeName.hpp>

#include <concepts>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>

#include <NGIN/Attributes/Export.hpp>
#include <NGIN/Attributes/Types.hpp>
#include <NGIN/Attributes/MarkerType.hpp>
#include <NGIN/Attributes/Source.hpp>

namespace NGIN::Attributes
{

  class Registry;
  class StructureBuilder;

  // Optional external customization point for C++ types you cannot modify
  // Specialize in namespace NGIN::Attributes: template<> struct DescribeStructure<T> { static void Do(StructureBuilder&); };
  template <class T>
  struct DescribeStructure;

  namespace detail
  {
    struct ParameterRecord
    {
      std::string name;
      std::optional<std::string> declaredType;
      bool isOptional{false};
      NGIN::Containers::Vector<AttachedMarker> markers;
    };

    struct ComponentRecord
    {
      ComponentKind kind{ComponentKind::Property};
      std::string name;
      std::optional<std::string> declaredType;
      bool isStatic{false};
      NGIN::Containers::Vector<ParameterRecord> parameters;
      NGIN::Containers::Vector<AttachedMarker> markers;
    };

    struct StructureRecord
    {
      StructureId id{0};
      std::string qualifiedName;
      StructureKind kind{StructureKind::Class};
      bool isAbstract{false};
      bool isFinal{false};
      std::string parent;
      NGIN::Containers::Vector<std::string> contracts;
      NGIN::Containers::Vector<ComponentRecord> components;
      NGIN::Containers::Vector<AttachedMarker> markers;
    };

    template <class M>
    AttachedMarker MakeAttachment(std::initializer_list<Argument> args)
    {
      AttachedMarker a{};
      a.type = &MarkerTypeOf<M>();
      a.arguments.assign(args.begin(), args.end());
      return a;
    }

    template <class T>
    concept HasNginStructureWithBuilder = requires(StructureBuilder &b) {
      // ADL hook: void NginStructure(Tag<T>, StructureBuilder&)
      { NginStructure(Tag<T>{}, b) } -> std::same_as<void>;
    };

    template <class, class = void>
    struct HasDescribeStructureImpl : std::false_type
    {
    };
    template <class T>
    struct HasDescribeStructureImpl<T, std::void_t<decltype(NGIN::Attributes::DescribeStructure<T>::Do(std::declval<StructureBuilder &>()))>>
        : std::true_type
    {
    };
    template <class T>
    concept HasDescribeStructureWithBuilder = HasDescribeStructureImpl<T>::value;

    inline constexpr NGIN::UInt32 kNoIndex = static_cast<NGIN::UInt32>(-1);
  } // namespace detail

  // Builders bind to record indices, so they stay valid while the registry grows.
  class NGIN_ATTRIBUTES_API ParameterBuilder
  {
  public:
    ParameterBuilder(Registry &registry, NGIN::UInt32 structure, NGIN::UInt32 component, NGIN::UInt32 parameter)
        : m_registry(&registry), m_structure(structure), m_component(component), m_parameter(parameter)
    {
    }

    ParameterBuilder &Optional();

    template <class M>
    ParameterBuilder &Marker(std::initializer_list<Argument> args = {});

  private:
    Registry *m_registry{nullptr};
    NGIN::UInt32 m_structure{0};
    NGIN::UInt32 m_component{0};
    NGIN::UInt32 m_parameter{0};
  };

  class NGIN_ATTRIBUTES_API ComponentBuilder
  {
  public:
    ComponentBuilder(Registry &registry, NGIN::UInt32 structure, NGIN::UInt32 component)
        : m_registry(&registry), m_structure(structure), m_component(component)
    {
    }

    ComponentBuilder &Static();

    template <class M>
    ComponentBuilder &Marker(std::initializer_list<Argument> args = {});

    // Methods only: append a parameter.
    ParameterBuilder Parameter(std::string_view name, std::string_view type = {});

  private:
    Registry *m_registry{nullptr};
    NGIN::UInt32 m_structure{0};
    NGIN::UInt32 m_component{0};
  };

  class NGIN_ATTRIBUTES_API StructureBuilder
  {
  public:
    StructureBuilder(Registry &registry, NGIN::UInt32 structure) : m_registry(&registry), m_structure(structure) {}

    StructureBuilder &Parent(std::string_view qualifiedName);
    // On a contract this declares an extended contract.
    StructureBuilder &Implements(std::string_view qualifiedName);
    StructureBuilder &Abstract();
    StructureBuilder &Final();

    template <class M>
    StructureBuilder &Marker(std::initializer_list<Argument> args = {});

    ComponentBuilder Property(std::string_view name, std::string_view type = {});
    ComponentBuilder Method(std::string_view name, std::string_view returnType = {});
    ComponentBuilder Constant(std::string_view name, std::string_view type = {});

    [[nodiscard]] StructureId Id() const;

  private:
    ComponentBuilder AddComponent(ComponentKind kind, std::string_view name, std::string_view type);

    Registry *m_registry{nullptr};
    NGIN::UInt32 m_structure{0};
  };

  class NGIN_ATTRIBUTES_API Registry : public ReflectiveSource
  {
  public:
    Registry() = default;

    // Declare (or reopen) a structure by fully qualified name.
    StructureBuilder Class(std::string_view qualifiedName);
    StructureBuilder Contract(std::string_view qualifiedName);
    StructureBuilder Enum(std::string_view qualifiedName);

    // Declare the C++ type T as a class named by NGIN::Meta::TypeName<T> and run its description hook.
    template <class T>
    StructureBuilder Register();

    [[nodiscard]] NGIN::UIntSize StructureCount() const noexcept { return m_structures.Size(); }

    [[nodiscard]] bool Contains(StructureId id) const override;
    [[nodiscard]] std::optional<StructureInfo> Describe(StructureId id) const override;
    [[nodiscard]] NGIN::Containers::Vector<StructureId> Ancestors(StructureId id) const override;
    [[nodiscard]] NGIN::Containers::Vector<StructureId> ImplementedContracts(StructureId id) const override;
    [[nodiscard]] NGIN::Containers::Vector<ComponentInfo> ChildComponents(StructureId id, ComponentKind kind) const override;
    [[nodiscard]] NGIN::Containers::Vector<ComponentInfo> Parameters(StructureId id, std::string_view method) const override;
    [[nodiscard]] NGIN::Containers::Vector<AttachedMarker> AttachedMarkers(const Target &target,
                                                                          const MarkerTypeDesc &type) const override;
    [[nodiscard]] std::optional<StructureId> StructureOfType(const std::type_info &type) const override;

  private:
    friend class StructureBuilder;
    friend class ComponentBuilder;
    friend class ParameterBuilder;

    struct TypeBinding
    {
      const std::type_info *type{nullptr};
      StructureId structure{0};
    };

    struct ComponentLookup
    {
      const detail::StructureRecord *owner{nullptr};
      const detail::ComponentRecord *component{nullptr};
    };

    StructureBuilder Declare(std::string_view qualifiedName, StructureKind kind);
    void BindType(const std::type_info &type, StructureId structure);
    const detail::StructureRecord *Find(StructureId id) const;
    // Own components first, then inherited ones along the parent chain.
    ComponentLookup FindComponent(StructureId id, ComponentKind kind, std::string_view name) const;
    const NGIN::Containers::Vector<AttachedMarker> *MarkersOf(const Target &target) const;
    void CollectContracts(const detail::StructureRecord &rec, NGIN::Containers::Vector<std::string> &out) const;
    NGIN::Containers::Vector<std::string> ContractNames(StructureId id) const;
    NGIN::Containers::Vector<std::string> AncestorNames(StructureId id) const;

    NGIN::Containers::Vector<AttachedMarker> &MarkersAt(NGIN::UInt32 structure,
                                                        NGIN::UInt32 component = detail::kNoIndex,
                                                        NGIN::UInt32 parameter = detail::kNoIndex);

    NGIN::Containers::Vector<detail::StructureRecord> m_structures;
    NGIN::Containers::FlatHashMap<StructureId, NGIN::UInt32> m_byId;
    NGIN::Containers::Vector<TypeBinding> m_byType;
  };

  template <class T>
  [[nodiscard]] inline StructureId StructureIdOf()
  {
    return StructureIdOf(NGIN::Meta::TypeName<std::remove_cvref_t<T>>::qualifiedName);
  }

  template <class M>
  inline ParameterBuilder &ParameterBuilder::Marker(std::initializer_list<Argument> args)
  {
    m_registry->MarkersAt(m_structure, m_component, m_parameter).PushBack(detail::MakeAttachment<M>(args));
    return *this;
  }

  template <class M>
  inline ComponentBuilder &ComponentBuilder::Marker(std::initializer_list<Argument> args)
  {
    m_registry->MarkersAt(m_structure, m_component).PushBack(detail::MakeAttachment<M>(args));
    return *this;
  }

  template <class M>
  inline StructureBuilder &StructureBuilder::Marker(std::initializer_list<Argument> args)
  {
    m_registry->MarkersAt(m_structure).PushBack(detail::MakeAttachment<M>(args));
    return *this;
  }

  template <class T>
  inline StructureBuilder Registry::Register()
  {
    using U = std::remove_cvref_t<T>;
    auto b = Class(NGIN::Meta::TypeName<U>::qualifiedName);
    BindType(typeid(U), StructureIdOf(NGIN::Meta::TypeName<U>::qualifiedName));
    if constexpr (detail::HasNginStructureWithBuilder<U>)
    {
      NginStructure(Tag<U>{}, b); // ADL: the type describes its components and markers
    }
    else if constexpr (detail::HasDescribeStructureWithBuilder<U>)
    {
      NGIN::Attributes::DescribeStructure<U>::Do(b);
    }
    return b;
  }

} // namespace NGIN::Attributes
