// MarkerType.hpp
// Runtime marker type descriptors and the MarkerBuilder<M> used to describe marker fields, bases and sub-markers.
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Meta/TypeName.hpp>

#include <concepts>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <NGIN/Attributes/Export.hpp>
#include <NGIN/Attributes/Types.hpp>
#include <NGIN/Attributes/Capabilities.hpp>
#include <NGIN/Attributes/MarkerMap.hpp>
#include <NGIN/Attributes/NameUtils.hpp>
#include <NGIN/Attributes/Convert.hpp>

namespace NGIN::Attributes
{

  template <class T>
  struct Tag
  {
    using type = T;
  };

  template <class M>
  class MarkerBuilder;

  // Optional external customization point for marker types you cannot modify
  // Specialize in namespace NGIN::Attributes: template<> struct DescribeMarker<M> { static void Do(MarkerBuilder<M>&); };
  template <class M>
  struct DescribeMarker;

  struct MarkerTypeDesc;

  // Type-erased marker object. `owner` keeps the most-derived object alive; `object` points at the
  // subobject of the marker type that was asked for.
  struct MarkerInstance
  {
    std::shared_ptr<void> owner{};
    void *object{nullptr};
    const MarkerTypeDesc *type{nullptr}; // concrete (most-derived) type

    [[nodiscard]] bool IsValid() const noexcept { return object != nullptr; }
  };

  namespace detail
  {
    struct MarkerFieldDesc
    {
      std::string name;
      NGIN::UInt64 typeId{0};
      MarkerTypeId owner{0}; // marker type that declares the member
      bool required{false};
      std::expected<void, Error> (*Store)(void *, const ArgValue &){nullptr};
    };

    struct MarkerBaseDesc
    {
      const MarkerTypeDesc *type{nullptr};
      void *(*Upcast)(void *){nullptr};
    };

    struct SubMarkerDesc
    {
      const MarkerTypeDesc &(*Type)(){nullptr};
      MarkerTypeId owner{0}; // marker type whose member handles the sub-marker
      void (*Fold)(void *marker, const NGIN::Containers::Vector<MarkerInstance> &found){nullptr};
    };
  } // namespace detail

  struct NGIN_ATTRIBUTES_API MarkerTypeDesc
  {
    std::string_view qualifiedName;
    std::string_view name;
    MarkerTypeId typeId{0};
    NGIN::UInt32 capabilities{0};
    NGIN::Containers::Vector<detail::MarkerFieldDesc> fields;
    NGIN::Containers::Vector<detail::MarkerBaseDesc> bases;
    // Every marker type this one derives from, directly or transitively.
    NGIN::Containers::Vector<MarkerTypeId> ancestry;
    NGIN::Containers::Vector<detail::SubMarkerDesc> subMarkers;
    std::shared_ptr<void> (*Create)(){nullptr};

    [[nodiscard]] bool Has(Capability c) const noexcept { return HasCapability(capabilities, c); }

    /// True when a marker of this type satisfies a request for `other` (same type or subtype).
    [[nodiscard]] bool IsA(MarkerTypeId other) const noexcept;

    /// Convert a pointer to an object of this type into a pointer to its `target` subobject; nullptr if unrelated.
    [[nodiscard]] void *UpcastTo(MarkerTypeId target, void *obj) const noexcept;

    /// Index of the field with that name, or -1.
    [[nodiscard]] NGIN::UInt32 FindField(std::string_view fieldName) const noexcept;
  };

  template <class M>
  const MarkerTypeDesc &MarkerTypeOf();

  namespace detail
  {
    template <class M>
    concept HasNginMarkerWithBuilder = requires(MarkerBuilder<M> &b) {
      // ADL friend should be declared as: friend void NginMarker(Tag<M>, MarkerBuilder<M>&)
      { NginMarker(Tag<M>{}, b) } -> std::same_as<void>;
    };

    // Detection for DescribeMarker<M>::Do(MarkerBuilder<M>&)
    template <class, class = void>
    struct HasDescribeMarkerImpl : std::false_type
    {
    };
    template <class M>
    struct HasDescribeMarkerImpl<M, std::void_t<decltype(NGIN::Attributes::DescribeMarker<M>::Do(std::declval<MarkerBuilder<M> &>()))>>
        : std::true_type
    {
    };
    template <class M>
    concept HasDescribeMarkerWithBuilder = HasDescribeMarkerImpl<M>::value;

    // Traits for pointer-to-member decomposition
    template <class P>
    struct MemberPtrTraits;
    template <class C, class P>
    struct MemberPtrTraits<P C::*>
    {
      using Class = C;
      using Member = P;
    };

    template <auto MemberPtr>
    using MemberClassT = typename MemberPtrTraits<decltype(MemberPtr)>::Class;

    template <auto MemberPtr>
    using MemberTypeT = typename MemberPtrTraits<decltype(MemberPtr)>::Member;

    template <class M, auto MemberPtr>
    std::expected<void, Error> FieldStore(void *obj, const ArgValue &value)
    {
      using F = MemberTypeT<MemberPtr>;
      auto converted = ConvertArg<F>(value);
      if (!converted.has_value())
        return std::unexpected(std::move(converted.error()));
      auto *m = static_cast<M *>(obj);
      (m->*MemberPtr) = std::move(converted.value());
      return {};
    }

    // Sub-marker handlers: void (C::*)(std::shared_ptr<const S>) for single values,
    // void (C::*)(std::span<const std::shared_ptr<const S>>) for multi-value sub-markers.
    template <class>
    struct SubMarkerHandlerTraits;

    template <class C, class S>
    struct SubMarkerHandlerTraits<void (C::*)(std::shared_ptr<const S>)>
    {
      using Class = C;
      using Sub = S;
      static constexpr bool IsMulti = false;
    };

    template <class C, class S>
    struct SubMarkerHandlerTraits<void (C::*)(std::span<const std::shared_ptr<const S>>)>
    {
      using Class = C;
      using Sub = S;
      static constexpr bool IsMulti = true;
    };

    template <class S>
    std::shared_ptr<const S> AsShared(const MarkerInstance &instance)
    {
      return std::shared_ptr<const S>(instance.owner, static_cast<const S *>(instance.object));
    }

    template <class M>
    MarkerTypeDesc BuildMarkerType();
  } // namespace detail

  template <class M>
  class MarkerBuilder
  {
  public:
    // Note: constructed by MarkerTypeOf<M>() while building the descriptor for M.
    explicit MarkerBuilder(MarkerTypeDesc &desc) : m_desc(&desc) {}

    // Field with a default: the member initializer of M. Name optional and auto-derived if omitted.
    template <auto MemberPtr>
    MarkerBuilder &Field(std::string_view name = {})
    {
      AddField<MemberPtr>(name, false);
      return *this;
    }

    // Field that must be supplied by an argument whenever the marker is instantiated.
    template <auto MemberPtr>
    MarkerBuilder &Required(std::string_view name = {})
    {
      AddField<MemberPtr>(name, true);
      return *this;
    }

    // Declare B as a marker base of M: attachments of M satisfy requests for B, and B's fields bind on M.
    template <class B>
    MarkerBuilder &Base()
    {
      static_assert(std::is_base_of_v<B, M> && !std::is_same_v<B, M>, "marker base must be a proper base class of the marker");
      const auto &base = MarkerTypeOf<B>();
      detail::MarkerBaseDesc b{};
      b.type = &base;
      b.Upcast = [](void *p) -> void * { return static_cast<B *>(static_cast<M *>(p)); };
      m_desc->bases.PushBack(b);
      m_desc->ancestry.PushBack(base.typeId);
      for (NGIN::UIntSize i = 0; i < base.ancestry.Size(); ++i)
        m_desc->ancestry.PushBack(base.ancestry[i]);
      for (NGIN::UIntSize i = 0; i < base.fields.Size(); ++i)
      {
        if (m_desc->FindField(base.fields[i].name) == static_cast<NGIN::UInt32>(-1))
          m_desc->fields.PushBack(base.fields[i]);
      }
      for (NGIN::UIntSize i = 0; i < base.subMarkers.Size(); ++i)
      {
        if (FindSubMarker(base.subMarkers[i].Type) == static_cast<NGIN::UInt32>(-1))
          m_desc->subMarkers.PushBack(base.subMarkers[i]);
      }
      if (base.Has(Capability::HasSubMarkers))
        m_desc->capabilities = m_desc->capabilities | Capability::HasSubMarkers;
      return *this;
    }

    // Register a sub-marker handler; the sub-marker type is deduced from the handler parameter.
    template <auto Handler>
    MarkerBuilder &SubMarker()
    {
      using Traits = detail::SubMarkerHandlerTraits<decltype(Handler)>;
      using Sub = typename Traits::Sub;
      static_assert(std::is_base_of_v<typename Traits::Class, M>, "sub-marker handler must be a member of the marker");
      static_assert(Traits::IsMulti == MultivalueMarker<Sub>,
                    "multi-value sub-markers take a span handler, single sub-markers a shared_ptr handler");
      detail::SubMarkerDesc s{};
      s.Type = &MarkerTypeOf<Sub>;
      s.owner = m_desc->typeId;
      s.Fold = [](void *marker, const NGIN::Containers::Vector<MarkerInstance> &found)
      {
        auto *m = static_cast<M *>(marker);
        if constexpr (Traits::IsMulti)
        {
          std::vector<std::shared_ptr<const Sub>> values;
          values.reserve(found.Size());
          for (NGIN::UIntSize i = 0; i < found.Size(); ++i)
            values.push_back(detail::AsShared<Sub>(found[i]));
          (m->*Handler)(std::span<const std::shared_ptr<const Sub>>{values});
        }
        else
        {
          (m->*Handler)(found.Size() > 0 ? detail::AsShared<Sub>(found[0]) : std::shared_ptr<const Sub>{});
        }
      };
      // A handler for a sub-marker type a base already handles replaces the inherited one.
      const auto existing = FindSubMarker(s.Type);
      if (existing != static_cast<NGIN::UInt32>(-1))
        m_desc->subMarkers[existing] = s;
      else
        m_desc->subMarkers.PushBack(s);
      m_desc->capabilities = m_desc->capabilities | Capability::HasSubMarkers;
      return *this;
    }

  private:
    NGIN::UInt32 FindSubMarker(const MarkerTypeDesc &(*type)()) const noexcept
    {
      for (NGIN::UIntSize i = 0; i < m_desc->subMarkers.Size(); ++i)
      {
        if (m_desc->subMarkers[i].Type == type)
          return static_cast<NGIN::UInt32>(i);
      }
      return static_cast<NGIN::UInt32>(-1);
    }

    template <auto MemberPtr>
    void AddField(std::string_view name, bool required)
    {
      static_assert(std::is_base_of_v<detail::MemberClassT<MemberPtr>, M>, "field must be a data member of the marker");
      detail::MarkerFieldDesc f{};
      f.name = std::string{name.empty() ? detail::MemberNameFromPretty<MemberPtr>() : name};
      f.typeId = detail::TypeIdOf<detail::MemberTypeT<MemberPtr>>();
      f.owner = m_desc->typeId;
      f.required = required;
      f.Store = &detail::FieldStore<M, MemberPtr>;
      // Redeclaring an inherited field replaces it in place.
      const auto existing = m_desc->FindField(f.name);
      if (existing != static_cast<NGIN::UInt32>(-1))
        m_desc->fields[existing] = std::move(f);
      else
        m_desc->fields.PushBack(std::move(f));
    }

    MarkerTypeDesc *m_desc{nullptr};
  };

  namespace detail
  {
    template <class M>
    MarkerTypeDesc BuildMarkerType()
    {
      static_assert(std::is_default_constructible_v<M>, "marker types must be default constructible");
      MarkerTypeDesc desc{};
      desc.qualifiedName = NGIN::Meta::TypeName<M>::qualifiedName;
      desc.name = NGIN::Meta::TypeName<M>::unqualifiedName;
      desc.typeId = TypeIdOf<M>();
      desc.capabilities = CapabilitiesOf<M>();
      desc.Create = []() -> std::shared_ptr<void> { return std::make_shared<M>(); };

      MarkerBuilder<M> b{desc};
      if constexpr (HasNginMarkerWithBuilder<M>)
      {
        NginMarker(Tag<M>{}, b); // ADL: marker describes its fields/bases/sub-markers
      }
      else if constexpr (HasDescribeMarkerWithBuilder<M>)
      {
        NGIN::Attributes::DescribeMarker<M>::Do(b); // Trait fallback
      }
      return desc;
    }
  } // namespace detail

  // Descriptor for M, built once on first use.
  template <class M>
  const MarkerTypeDesc &MarkerTypeOf()
  {
    using U = std::remove_cvref_t<M>;
    if constexpr (!std::is_same_v<U, M>)
    {
      return MarkerTypeOf<U>();
    }
    else
    {
      static const MarkerTypeDesc desc = detail::BuildMarkerType<U>();
      return desc;
    }
  }

} // namespace NGIN::Attributes
