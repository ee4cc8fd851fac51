// Registry.hpp
// Process-wide type descriptions (fields, properties, bases) and query API
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Meta/TypeName.hpp>
#include <NGIN/Hashing/FNV.hpp>
#include <NGIN/Utilities/StringInterner.hpp>

#include <concepts>
#include <string_view>
#include <expected>
#include <type_traits>
#include <optional>
#include <utility>
#include <typeinfo>

#include <Morph/Mapping/Export.hpp>
#include <Morph/Mapping/Types.hpp>
#include <Morph/Mapping/Convert.hpp>

namespace Morph::Mapping
{
  using NameId = NGIN::UInt32;

  template <class T>
  struct Tag
  {
    using type = T;
  };
  template <class T>
  class TypeBuilder;

  // Optional external customization point for types you cannot modify
  // Specialize in namespace Morph::Mapping: template<> struct Describe<MyType> { static void Do(TypeBuilder<MyType>&); };
  template <class T>
  struct Describe;

  // Names one member either by its reflected name or by its pointer-to-member.
  struct MemberSelector
  {
    std::string_view name{};
    void *(*fieldGetter)(void *){nullptr};

    constexpr MemberSelector() = default;
    constexpr MemberSelector(std::string_view n) : name(n) {}
    constexpr MemberSelector(const char *n) : name(n) {}
    constexpr explicit MemberSelector(void *(*getter)(void *)) : fieldGetter(getter) {}
  };

  namespace detail
  {
    using StringInterner = NGIN::Utilities::StringInterner<>;

    // Convenience wrappers using the global registry interner
    MORPH_MAPPING_API NameId InternNameId(std::string_view s) noexcept;
    MORPH_MAPPING_API bool FindNameId(std::string_view s, NameId &out) noexcept;
    MORPH_MAPPING_API std::string_view NameFromId(NameId id) noexcept;
    MORPH_MAPPING_API std::string_view InternName(std::string_view s) noexcept;

    using UpcastFn = const void *(*)(const void *);
    using UpcastMutFn = void *(*)(void *);

    struct MemberRuntimeDesc
    {
      std::string_view name;
      NameId nameId{static_cast<NameId>(-1)};
      NGIN::UInt64 typeId{0};
      MemberKind kind{MemberKind::Field};
      bool readable{true};
      bool writable{false};
      LoadFn Load{nullptr};
      ResolveStoreFn ResolveStore{nullptr};
      // Field-only direct access; null for properties.
      const void *(*GetConst)(const void *){nullptr};
      void *(*GetMut)(void *){nullptr};
      void (*CopyValue)(void *, const void *){nullptr};
    };

    struct BaseRuntimeDesc
    {
      NGIN::UInt32 baseTypeIndex{static_cast<NGIN::UInt32>(-1)};
      NGIN::UInt64 baseTypeId{0};
      UpcastFn UpcastConst{nullptr};
      UpcastMutFn Upcast{nullptr};
    };

    struct TypeRuntimeDesc
    {
      std::string_view qualifiedName;
      NameId qualifiedNameId{static_cast<NameId>(-1)};
      NGIN::UInt64 typeId{0};
      NGIN::UInt64 rttiId{0};
      NGIN::UIntSize sizeBytes{0};
      NGIN::UIntSize alignBytes{0};
      NGIN::Containers::Vector<MemberRuntimeDesc> members;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> memberIndex;
      NGIN::Containers::Vector<BaseRuntimeDesc> bases;
      NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> baseIndex;
    };

    struct Registry
    {
      NGIN::Containers::Vector<TypeRuntimeDesc> types;
      NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> byTypeId;
      NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> byRttiId;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> byName;

      StringInterner names;
    };

    MORPH_MAPPING_API Registry &GetRegistry() noexcept;

    // A member reached from some type, possibly through base classes. The
    // upcast chains adjust an object pointer to the member's owning type.
    struct MemberPath
    {
      NGIN::UInt32 typeIndex{static_cast<NGIN::UInt32>(-1)};
      NGIN::UInt32 memberIndex{static_cast<NGIN::UInt32>(-1)};
      NGIN::Containers::Vector<UpcastFn> upcastConst;
      NGIN::Containers::Vector<UpcastMutFn> upcast;

      [[nodiscard]] const MemberRuntimeDesc &Desc() const { return GetRegistry().types[typeIndex].members[memberIndex]; }

      [[nodiscard]] const void *Adjust(const void *obj) const
      {
        for (NGIN::UIntSize i = 0; i < upcastConst.Size(); ++i)
          obj = upcastConst[i](obj);
        return obj;
      }
      [[nodiscard]] void *Adjust(void *obj) const
      {
        for (NGIN::UIntSize i = 0; i < upcast.Size(); ++i)
          obj = upcast[i](obj);
        return obj;
      }
    };

    // Own members first, then bases depth-first in declaration order; a name
    // found earlier hides later ones.
    MORPH_MAPPING_API std::optional<MemberPath> FindMemberPath(NGIN::UInt32 typeIndex, NameId nameId);
    MORPH_MAPPING_API std::optional<MemberPath> FindFieldPath(NGIN::UInt32 typeIndex, void *(*getter)(void *));
    MORPH_MAPPING_API NGIN::Containers::Vector<MemberPath> CollectMembers(NGIN::UInt32 typeIndex);
    // Resolves a selector to a top-level member; nested paths are rejected.
    MORPH_MAPPING_API std::expected<MemberPath, Error> ResolveMember(NGIN::UInt32 typeIndex, const MemberSelector &selector);

    MORPH_MAPPING_API std::optional<NGIN::UInt32> FindTypeIndex(NGIN::UInt64 typeId);
    MORPH_MAPPING_API std::optional<NGIN::UInt32> FindTypeIndexByRtti(NGIN::UInt64 rttiId);

    template <class T>
    concept HasMorphReflectWithTypeBuilder = requires(TypeBuilder<T> &b) {
      // ADL friend should be declared as: friend void MorphReflect(Tag<T>, TypeBuilder<T>&)
      { MorphReflect(Tag<T>{}, b) } -> std::same_as<void>;
    };

    // Detection for Describe<T>::Do(TypeBuilder<T>&)
    template <class, class = void>
    struct HasDescribeImpl : std::false_type
    {
    };
    template <class T>
    struct HasDescribeImpl<T, std::void_t<decltype(Morph::Mapping::Describe<T>::Do(std::declval<TypeBuilder<T> &>()))>>
        : std::true_type
    {
    };
    template <class T>
    concept HasDescribeWithTypeBuilder = HasDescribeImpl<T>::value;

    // Traits for pointer-to-member decomposition
    template <class M>
    struct MemberPtrTraits;
    template <class C, class M>
    struct MemberPtrTraits<M C::*>
    {
      using Class = C;
      using Member = M;
    };

    template <auto MemberPtr>
    using MemberClassT = typename MemberPtrTraits<decltype(MemberPtr)>::Class;

    template <auto MemberPtr>
    using MemberTypeT = typename MemberPtrTraits<decltype(MemberPtr)>::Member;

    template <class>
    struct GetterTraits;
    template <class C, class R>
    struct GetterTraits<R (C::*)() const>
    {
      using Class = C;
      using Ret = R;
    };
    template <class C, class R>
    struct GetterTraits<R (C::*)() const noexcept>
    {
      using Class = C;
      using Ret = R;
    };

    template <class>
    struct SetterTraits;
    template <class C, class P>
    struct SetterTraits<void (C::*)(P)>
    {
      using Class = C;
      using Param = P;
    };
    template <class C, class P>
    struct SetterTraits<void (C::*)(P) noexcept>
    {
      using Class = C;
      using Param = P;
    };

    // Function pointers for field accessors. Inline so every translation unit
    // sees the same address; selectors compare against it.
    template <auto MemberPtr>
    inline void *FieldGetterMut(void *obj)
    {
      using C = MemberClassT<MemberPtr>;
      auto *c = static_cast<C *>(obj);
      return const_cast<void *>(static_cast<const void *>(&(c->*MemberPtr)));
    }

    template <auto MemberPtr>
    inline const void *FieldGetterConst(const void *obj)
    {
      using C = MemberClassT<MemberPtr>;
      auto *c = static_cast<const C *>(obj);
      return static_cast<const void *>(&(c->*MemberPtr));
    }

    template <auto MemberPtr>
    struct FieldAccess
    {
      using Class = MemberClassT<MemberPtr>;
      using Value = std::remove_cv_t<MemberTypeT<MemberPtr>>;
      static constexpr bool Writable = !std::is_const_v<MemberTypeT<MemberPtr>> && std::is_copy_assignable_v<Value>;

      static const Value &Read(const void *obj) { return static_cast<const Class *>(obj)->*MemberPtr; }

      template <class V>
      static void Write(void *obj, V &&value)
      {
        static_cast<Class *>(obj)->*MemberPtr = std::forward<V>(value);
      }
    };

    template <auto Getter, auto Setter = nullptr>
    struct PropertyAccess
    {
      using Class = typename GetterTraits<decltype(Getter)>::Class;
      using Value = std::remove_cvref_t<typename GetterTraits<decltype(Getter)>::Ret>;
      static constexpr bool Writable = !std::is_null_pointer_v<decltype(Setter)>;

      static Value Read(const void *obj) { return (static_cast<const Class *>(obj)->*Getter)(); }

      template <class V>
      static void Write(void *obj, V &&value)
      {
        if constexpr (Writable)
          (static_cast<Class *>(obj)->*Setter)(std::forward<V>(value));
      }
    };

    template <class Access>
    Any LoadMember(const void *obj)
    {
      return Any{Access::Read(obj)};
    }

    // Ensure a type is present; returns the type index
    template <class T>
    NGIN::UInt32 EnsureRegistered()
    {
      using U = std::remove_cvref_t<T>;
      auto &reg = GetRegistry();
      const auto tid = TypeIdOf<U>();
      if (auto *p = reg.byTypeId.GetPtr(tid))
        return *p;

      TypeRuntimeDesc rec{};
      rec.qualifiedNameId = InternNameId(NGIN::Meta::TypeName<U>::qualifiedName);
      rec.qualifiedName = NameFromId(rec.qualifiedNameId); // default name derived; user override optional
      rec.typeId = tid;
      rec.rttiId = RttiIdOf<U>();
      rec.sizeBytes = sizeof(U);
      rec.alignBytes = alignof(U);

      const auto idx = static_cast<NGIN::UInt32>(reg.types.Size());
      reg.types.PushBack(std::move(rec));
      reg.byTypeId.Insert(tid, idx);
      reg.byRttiId.Insert(reg.types[idx].rttiId, idx);
      reg.byName.Insert(reg.types[idx].qualifiedNameId, idx);
      // MSVC sometimes prefixes qualified names with "class ", "struct ", etc.
      // Add trimmed aliases to support portable GetType("Namespace::Type") lookups.
#if defined(_MSC_VER)
      {
        auto qn = reg.types[idx].qualifiedName;
        auto add_alias = [&](std::string_view prefix) {
          if (qn.size() > prefix.size() && qn.substr(0, prefix.size()) == prefix)
          {
            auto trimmed = qn.substr(prefix.size());
            auto aliasId = InternNameId(trimmed);
            reg.byName.Insert(aliasId, idx);
          }
        };
        add_alias("class ");
        add_alias("struct ");
      }
#endif

      if constexpr (HasMorphReflectWithTypeBuilder<U>)
      {
        TypeBuilder<U> b{idx};
        MorphReflect(Tag<U>{}, b); // ADL: user describes fields/properties/bases
      }
      else if constexpr (HasDescribeWithTypeBuilder<U>)
      {
        TypeBuilder<U> b{idx};
        Morph::Mapping::Describe<U>::Do(b); // Trait fallback: public access only
      }
      return idx;
    }

  } // namespace detail

  // Selects a member by reflected name or by pointer-to-data-member.
  inline MemberSelector Select(std::string_view name) { return MemberSelector{name}; }

  template <auto MemberPtr>
  inline MemberSelector Select()
  {
    return MemberSelector{&detail::FieldGetterMut<MemberPtr>};
  }

  class Member
  {
  public:
    constexpr Member() = default;
    explicit constexpr Member(MemberHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept
    {
      if (!m_h.IsValid())
        return false;
      const auto &reg = detail::GetRegistry();
      return m_h.typeIndex < reg.types.Size() && m_h.memberIndex < reg.types[m_h.typeIndex].members.Size();
    }
    [[nodiscard]] std::string_view Name() const;
    [[nodiscard]] NGIN::UInt64 TypeId() const;
    [[nodiscard]] MemberKind Kind() const;
    [[nodiscard]] bool IsField() const { return Kind() == MemberKind::Field; }
    [[nodiscard]] bool IsProperty() const { return Kind() == MemberKind::Property; }
    [[nodiscard]] bool IsReadable() const;
    [[nodiscard]] bool IsWritable() const;

    [[nodiscard]] Any GetAny(const void *obj) const;
    // Accepts the member's own type or a safe conversion (see Convert.hpp).
    [[nodiscard]] std::expected<void, Error> SetAny(void *obj, const Any &value) const;

    template <class T, class Obj>
    requires (!std::is_pointer_v<std::remove_reference_t<Obj>>)
    [[nodiscard]] std::expected<std::remove_cvref_t<T>, Error> Get(const Obj &obj) const
    {
      using U = std::remove_cvref_t<T>;
      if (!IsValid())
        return std::unexpected(Error{ErrorCode::InvalidArgument, "invalid member handle"});
      if (TypeId() != detail::TypeIdOf<U>())
        return std::unexpected(Error{ErrorCode::InvalidArgument, "type-id mismatch"});
      auto any = GetAny(static_cast<const void *>(&obj));
      return any.template Cast<U>();
    }

    template <class T, class Obj>
    requires (!std::is_pointer_v<std::remove_reference_t<Obj>>)
    [[nodiscard]] std::expected<void, Error> Set(Obj &obj, T &&value) const
    {
      return SetAny(static_cast<void *>(&obj), Any{std::forward<T>(value)});
    }

  private:
    MemberHandle m_h{};
  };

  class Base
  {
  public:
    constexpr Base() = default;
    explicit constexpr Base(BaseHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept
    {
      if (!m_h.IsValid())
        return false;
      const auto &reg = detail::GetRegistry();
      return m_h.typeIndex < reg.types.Size() && m_h.baseIndex < reg.types[m_h.typeIndex].bases.Size();
    }
    [[nodiscard]] Type BaseType() const;
    [[nodiscard]] void *Upcast(void *obj) const;
    [[nodiscard]] const void *Upcast(const void *obj) const;

  private:
    BaseHandle m_h{};
  };

  class Type
  {
  public:
    constexpr Type() = default;
    explicit constexpr Type(TypeHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept
    {
      if (!m_h.IsValid())
        return false;
      return m_h.index < detail::GetRegistry().types.Size();
    }
    [[nodiscard]] TypeHandle Handle() const noexcept { return m_h; }
    [[nodiscard]] std::string_view QualifiedName() const;
    [[nodiscard]] NGIN::UInt64 GetTypeId() const;
    [[nodiscard]] NGIN::UIntSize Size() const;
    [[nodiscard]] NGIN::UIntSize Alignment() const;

    // Own members only; inherited members are reached through BaseAt().
    [[nodiscard]] NGIN::UIntSize MemberCount() const;
    [[nodiscard]] Member MemberAt(NGIN::UIntSize i) const;
    [[nodiscard]] ExpectedMember GetMember(std::string_view name) const;
    [[nodiscard]] std::optional<Member> FindMember(std::string_view name) const;

    [[nodiscard]] NGIN::UIntSize BaseCount() const;
    [[nodiscard]] Base BaseAt(NGIN::UIntSize i) const;
    [[nodiscard]] std::optional<Base> FindBase(const Type &base) const;
    // Direct or indirect base.
    [[nodiscard]] bool IsDerivedFrom(const Type &base) const;

  private:
    TypeHandle m_h{};
  };

  // Queries
  MORPH_MAPPING_API ExpectedType GetType(std::string_view name);
  MORPH_MAPPING_API std::optional<Type> FindType(std::string_view name);
  MORPH_MAPPING_API std::optional<Type> FindTypeById(NGIN::UInt64 typeId);

  template <class T>
  Type GetType()
  {
    auto idx = detail::EnsureRegistered<T>();
    return Type{TypeHandle{idx}};
  }

  template <class T>
  std::optional<Type> TryGetType()
  {
    using U = std::remove_cvref_t<T>;
    if (auto idx = detail::FindTypeIndex(detail::TypeIdOf<U>()))
      return Type{TypeHandle{*idx}};
    return std::nullopt;
  }

  // Optional eager registration helper
  template <class T>
  inline bool AutoRegister()
  {
    (void)detail::EnsureRegistered<T>();
    return true;
  }

} // namespace Morph::Mapping
