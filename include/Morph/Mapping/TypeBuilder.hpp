// TypeBuilder.hpp
// Public TypeBuilder<T> used inside the ADL friend to describe fields, properties and bases
#pragma once

#include <Morph/Mapping/Registry.hpp>
#include <Morph/Mapping/NameUtils.hpp>
#include <Morph/Mapping/Convert.hpp>
#include <string_view>
#include <type_traits>
#include <utility>

namespace Morph::Mapping
{

  template <class T>
  class TypeBuilder
  {
  public:
    // Note: constructed by the registry when invoking ADL reflect; binds to a specific type index.
    explicit TypeBuilder(NGIN::UInt32 typeIndex) : m_index(typeIndex) {}

    // Optional name overrides (qualified or unqualified). If not set, defaults to Meta::TypeName<T>.
    TypeBuilder &SetName(std::string_view qualified)
    {
      auto &reg = detail::GetRegistry();
      auto id = detail::InternNameId(qualified);
      reg.types[m_index].qualifiedNameId = id;
      reg.types[m_index].qualifiedName = detail::NameFromId(id);
      // Update name index as well
      reg.byName.Insert(id, m_index);
      return *this;
    }

    // Add a public data member as a field; name optional and auto-derived if omitted.
    template <auto MemberPtr>
    TypeBuilder &Field(std::string_view name = {})
    {
      using Access = detail::FieldAccess<MemberPtr>;
      static_assert(std::is_same_v<detail::MemberClassT<MemberPtr>, T>, "Field must belong to T; describe base members on the base");
      detail::MemberRuntimeDesc m{};
      m.kind = MemberKind::Field;
      m.typeId = detail::TypeIdOf<typename Access::Value>();
      m.readable = true;
      m.writable = Access::Writable;
      m.Load = &detail::LoadMember<Access>;
      m.ResolveStore = &detail::ResolveStore<Access>;
      m.GetMut = &detail::FieldGetterMut<MemberPtr>;
      m.GetConst = &detail::FieldGetterConst<MemberPtr>;
      if constexpr (Access::Writable)
        m.CopyValue = &detail::CopyAssign<typename Access::Value>;
      return Add(std::move(m), name.empty() ? detail::MemberNameOf<MemberPtr>() : name);
    }

    // Add a property backed by a const getter and an optional setter. The name
    // defaults to the getter's identifier.
    template <auto Getter, auto Setter = nullptr>
    TypeBuilder &Property(std::string_view name = {})
    {
      using Access = detail::PropertyAccess<Getter, Setter>;
      static_assert(std::is_same_v<typename Access::Class, T>, "Property getter must belong to T");
      if constexpr (Access::Writable)
      {
        using Param = std::remove_cvref_t<typename detail::SetterTraits<decltype(Setter)>::Param>;
        static_assert(std::is_same_v<Param, typename Access::Value>, "Setter parameter must match the getter type");
      }
      detail::MemberRuntimeDesc m{};
      m.kind = MemberKind::Property;
      m.typeId = detail::TypeIdOf<typename Access::Value>();
      m.readable = true;
      m.writable = Access::Writable;
      m.Load = &detail::LoadMember<Access>;
      m.ResolveStore = &detail::ResolveStore<Access>;
      return Add(std::move(m), name.empty() ? detail::MemberNameOf<Getter>() : name);
    }

    // Declare a base class. Registers B (if needed) and records upcasts.
    template <class B>
    TypeBuilder &Base()
    {
      static_assert(std::is_base_of_v<B, T>, "Base<B>() requires B to be a base of T");
      const auto baseIndex = detail::EnsureRegistered<B>();
      // Registering B may grow the type table; take the reference afterwards.
      auto &reg = detail::GetRegistry();
      detail::BaseRuntimeDesc b{};
      b.baseTypeIndex = baseIndex;
      b.baseTypeId = reg.types[baseIndex].typeId;
      b.UpcastConst = [](const void *p) -> const void * { return static_cast<const B *>(static_cast<const T *>(p)); };
      b.Upcast = [](void *p) -> void * { return static_cast<B *>(static_cast<T *>(p)); };
      auto &tdesc = reg.types[m_index];
      if (tdesc.baseIndex.GetPtr(b.baseTypeId))
        return *this;
      tdesc.bases.PushBack(b);
      tdesc.baseIndex.Insert(b.baseTypeId, static_cast<NGIN::UInt32>(tdesc.bases.Size() - 1));
      return *this;
    }

    // No-op; present for API symmetry.
    constexpr void Build() const noexcept {}

  private:
    TypeBuilder &Add(detail::MemberRuntimeDesc m, std::string_view name)
    {
      auto &reg = detail::GetRegistry();
      auto id = detail::InternNameId(name);
      m.nameId = id;
      m.name = detail::NameFromId(id);
      auto &tdesc = reg.types[m_index];
      // Re-declaring a name replaces the earlier entry
      if (auto *existing = tdesc.memberIndex.GetPtr(id))
      {
        tdesc.members[*existing] = std::move(m);
        return *this;
      }
      tdesc.members.PushBack(std::move(m));
      const auto newIdx = static_cast<NGIN::UInt32>(tdesc.members.Size() - 1);
      tdesc.memberIndex.Insert(id, newIdx);
      return *this;
    }

    NGIN::UInt32 m_index{0};
  };

} // namespace Morph::Mapping
