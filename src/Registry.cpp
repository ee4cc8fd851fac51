#include <Morph/Mapping/Registry.hpp>
#include <Morph/Mapping/NameUtils.hpp>
#include <optional>

namespace Morph::Mapping::detail
{

  static Registry g_registry{};

  Registry &GetRegistry() noexcept { return g_registry; }
  namespace
  {
    constexpr NameId InvalidNameId = static_cast<NameId>(StringInterner::INVALID_ID);
  }

  NameId InternNameId(std::string_view s) noexcept
  {
    auto &reg = GetRegistry();
    const auto id = reg.names.InsertOrGet(s);
    if (id == StringInterner::INVALID_ID)
      return InvalidNameId;
    return static_cast<NameId>(id);
  }

  bool FindNameId(std::string_view s, NameId &out) noexcept
  {
    auto &reg = GetRegistry();
    StringInterner::IdType id{};
    if (!reg.names.TryGetId(s, id))
      return false;
    out = static_cast<NameId>(id);
    return true;
  }

  std::string_view NameFromId(NameId id) noexcept
  {
    auto &reg = GetRegistry();
    return reg.names.View(static_cast<StringInterner::IdType>(id));
  }

  std::string_view InternName(std::string_view s) noexcept
  {
    auto &reg = GetRegistry();
    return reg.names.Intern(s);
  }

  std::optional<NGIN::UInt32> FindTypeIndex(NGIN::UInt64 typeId)
  {
    const auto &reg = GetRegistry();
    if (auto *p = reg.byTypeId.GetPtr(typeId))
      return *p;
    return std::nullopt;
  }

  std::optional<NGIN::UInt32> FindTypeIndexByRtti(NGIN::UInt64 rttiId)
  {
    const auto &reg = GetRegistry();
    if (auto *p = reg.byRttiId.GetPtr(rttiId))
      return *p;
    return std::nullopt;
  }

  namespace
  {
    // Prepends the hop from a derived type to one of its bases.
    MemberPath ThroughBase(const BaseRuntimeDesc &b, MemberPath &&inner)
    {
      MemberPath out{};
      out.typeIndex = inner.typeIndex;
      out.memberIndex = inner.memberIndex;
      out.upcastConst.Reserve(inner.upcastConst.Size() + 1);
      out.upcast.Reserve(inner.upcast.Size() + 1);
      out.upcastConst.PushBack(b.UpcastConst);
      out.upcast.PushBack(b.Upcast);
      for (NGIN::UIntSize i = 0; i < inner.upcastConst.Size(); ++i)
      {
        out.upcastConst.PushBack(inner.upcastConst[i]);
        out.upcast.PushBack(inner.upcast[i]);
      }
      return out;
    }

    void CollectInto(NGIN::UInt32 typeIndex, NGIN::Containers::Vector<MemberPath> &out,
                     NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> &seen)
    {
      const auto &reg = GetRegistry();
      const auto &tdesc = reg.types[typeIndex];
      for (NGIN::UIntSize i = 0; i < tdesc.members.Size(); ++i)
      {
        const auto nameId = tdesc.members[i].nameId;
        if (seen.GetPtr(nameId))
          continue;
        seen.Insert(nameId, static_cast<NGIN::UInt32>(out.Size()));
        MemberPath p{};
        p.typeIndex = typeIndex;
        p.memberIndex = static_cast<NGIN::UInt32>(i);
        out.PushBack(std::move(p));
      }
      for (NGIN::UIntSize i = 0; i < tdesc.bases.Size(); ++i)
      {
        const auto &b = tdesc.bases[i];
        NGIN::Containers::Vector<MemberPath> inherited;
        CollectInto(b.baseTypeIndex, inherited, seen);
        for (NGIN::UIntSize j = 0; j < inherited.Size(); ++j)
          out.PushBack(ThroughBase(b, std::move(inherited[j])));
      }
    }
  } // namespace

  std::optional<MemberPath> FindMemberPath(NGIN::UInt32 typeIndex, NameId nameId)
  {
    const auto &reg = GetRegistry();
    if (typeIndex >= reg.types.Size())
      return std::nullopt;
    const auto &tdesc = reg.types[typeIndex];
    if (auto *p = tdesc.memberIndex.GetPtr(nameId))
    {
      MemberPath path{};
      path.typeIndex = typeIndex;
      path.memberIndex = *p;
      return path;
    }
    for (NGIN::UIntSize i = 0; i < tdesc.bases.Size(); ++i)
    {
      const auto &b = tdesc.bases[i];
      if (auto inner = FindMemberPath(b.baseTypeIndex, nameId))
        return ThroughBase(b, std::move(*inner));
    }
    return std::nullopt;
  }

  std::optional<MemberPath> FindFieldPath(NGIN::UInt32 typeIndex, void *(*getter)(void *))
  {
    const auto &reg = GetRegistry();
    if (typeIndex >= reg.types.Size() || getter == nullptr)
      return std::nullopt;
    const auto &tdesc = reg.types[typeIndex];
    for (NGIN::UIntSize i = 0; i < tdesc.members.Size(); ++i)
    {
      if (tdesc.members[i].GetMut == getter)
      {
        MemberPath path{};
        path.typeIndex = typeIndex;
        path.memberIndex = static_cast<NGIN::UInt32>(i);
        return path;
      }
    }
    for (NGIN::UIntSize i = 0; i < tdesc.bases.Size(); ++i)
    {
      const auto &b = tdesc.bases[i];
      if (auto inner = FindFieldPath(b.baseTypeIndex, getter))
        return ThroughBase(b, std::move(*inner));
    }
    return std::nullopt;
  }

  NGIN::Containers::Vector<MemberPath> CollectMembers(NGIN::UInt32 typeIndex)
  {
    NGIN::Containers::Vector<MemberPath> out;
    if (typeIndex >= GetRegistry().types.Size())
      return out;
    NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> seen;
    CollectInto(typeIndex, out, seen);
    return out;
  }

  std::expected<MemberPath, Error> ResolveMember(NGIN::UInt32 typeIndex, const MemberSelector &selector)
  {
    const auto &reg = GetRegistry();
    if (typeIndex >= reg.types.Size())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "invalid type index"});
    const auto typeId = reg.types[typeIndex].typeId;
    if (selector.fieldGetter)
    {
      if (auto path = FindFieldPath(typeIndex, selector.fieldGetter))
        return std::move(*path);
      return std::unexpected(Error{ErrorCode::InvalidMemberExpression, "field is not a described member", typeId, 0});
    }
    if (selector.name.empty())
      return std::unexpected(Error{ErrorCode::InvalidMemberExpression, "empty member name", typeId, 0});
    if (selector.name.find('.') != std::string_view::npos)
      return std::unexpected(Error{ErrorCode::InvalidMemberExpression, "only top-level members can be selected", typeId,
                                   0, InternName(selector.name)});
    NameId nid{};
    if (FindNameId(selector.name, nid))
    {
      if (auto path = FindMemberPath(typeIndex, nid))
        return std::move(*path);
    }
    return std::unexpected(
        Error{ErrorCode::InvalidMemberExpression, "not a member of the type", typeId, 0, InternName(selector.name)});
  }

} // namespace Morph::Mapping::detail

namespace Morph::Mapping
{

  using detail::GetRegistry;
  namespace
  {
    constexpr std::string_view kStaleHandle = "stale handle";

    bool IsTypeAlive(TypeHandle h)
    {
      return h.IsValid() && h.index < GetRegistry().types.Size();
    }

    bool IsMemberAlive(MemberHandle h)
    {
      if (!h.IsValid())
        return false;
      const auto &reg = GetRegistry();
      return h.typeIndex < reg.types.Size() && h.memberIndex < reg.types[h.typeIndex].members.Size();
    }

    bool IsBaseAlive(BaseHandle h)
    {
      if (!h.IsValid())
        return false;
      const auto &reg = GetRegistry();
      return h.typeIndex < reg.types.Size() && h.baseIndex < reg.types[h.typeIndex].bases.Size();
    }

    const detail::MemberRuntimeDesc &MemberDesc(MemberHandle h)
    {
      return GetRegistry().types[h.typeIndex].members[h.memberIndex];
    }
  } // namespace

  // Type
  std::string_view Type::QualifiedName() const
  {
    if (!IsTypeAlive(m_h))
      return {};
    return GetRegistry().types[m_h.index].qualifiedName;
  }

  NGIN::UInt64 Type::GetTypeId() const
  {
    if (!IsTypeAlive(m_h))
      return 0;
    return GetRegistry().types[m_h.index].typeId;
  }

  NGIN::UIntSize Type::Size() const
  {
    if (!IsTypeAlive(m_h))
      return 0;
    return GetRegistry().types[m_h.index].sizeBytes;
  }

  NGIN::UIntSize Type::Alignment() const
  {
    if (!IsTypeAlive(m_h))
      return 0;
    return GetRegistry().types[m_h.index].alignBytes;
  }

  NGIN::UIntSize Type::MemberCount() const
  {
    if (!IsTypeAlive(m_h))
      return 0;
    return GetRegistry().types[m_h.index].members.Size();
  }

  Member Type::MemberAt(NGIN::UIntSize i) const
  {
    if (!IsTypeAlive(m_h))
      return Member{};
    return Member{MemberHandle{m_h.index, static_cast<NGIN::UInt32>(i)}};
  }

  ExpectedMember Type::GetMember(std::string_view name) const
  {
    if (!IsTypeAlive(m_h))
      return std::unexpected(Error{ErrorCode::InvalidArgument, kStaleHandle});
    if (auto m = FindMember(name))
      return *m;
    return std::unexpected(Error{ErrorCode::NotFound, "member not found"});
  }

  std::optional<Member> Type::FindMember(std::string_view name) const
  {
    if (!IsTypeAlive(m_h))
      return std::nullopt;
    NameId nid{};
    if (!detail::FindNameId(name, nid))
      return std::nullopt;
    const auto &tdesc = GetRegistry().types[m_h.index];
    if (auto *p = tdesc.memberIndex.GetPtr(nid))
      return Member{MemberHandle{m_h.index, *p}};
    return std::nullopt;
  }

  NGIN::UIntSize Type::BaseCount() const
  {
    if (!IsTypeAlive(m_h))
      return 0;
    return GetRegistry().types[m_h.index].bases.Size();
  }

  Base Type::BaseAt(NGIN::UIntSize i) const
  {
    if (!IsTypeAlive(m_h))
      return Base{};
    return Base{BaseHandle{m_h.index, static_cast<NGIN::UInt32>(i)}};
  }

  std::optional<Base> Type::FindBase(const Type &base) const
  {
    if (!IsTypeAlive(m_h))
      return std::nullopt;
    const auto &tdesc = GetRegistry().types[m_h.index];
    if (auto *p = tdesc.baseIndex.GetPtr(base.GetTypeId()))
      return Base{BaseHandle{m_h.index, *p}};
    return std::nullopt;
  }

  bool Type::IsDerivedFrom(const Type &base) const
  {
    if (!IsTypeAlive(m_h) || !base.IsValid())
      return false;
    const auto &reg = GetRegistry();
    const auto &tdesc = reg.types[m_h.index];
    if (tdesc.baseIndex.GetPtr(base.GetTypeId()))
      return true;
    for (NGIN::UIntSize i = 0; i < tdesc.bases.Size(); ++i)
    {
      if (Type{TypeHandle{tdesc.bases[i].baseTypeIndex}}.IsDerivedFrom(base))
        return true;
    }
    return false;
  }

  ExpectedType GetType(std::string_view name)
  {
    if (auto t = FindType(name))
      return *t;
    return std::unexpected(Error{ErrorCode::NotFound, "type not found"});
  }

  std::optional<Type> FindType(std::string_view name)
  {
    auto &reg = GetRegistry();
    NameId nid{};
    if (detail::FindNameId(name, nid))
    {
      if (auto *p = reg.byName.GetPtr(nid))
        return Type{TypeHandle{*p}};
    }
    return std::nullopt;
  }

  std::optional<Type> FindTypeById(NGIN::UInt64 typeId)
  {
    if (auto idx = detail::FindTypeIndex(typeId))
      return Type{TypeHandle{*idx}};
    return std::nullopt;
  }

  // Member
  std::string_view Member::Name() const
  {
    if (!IsMemberAlive(m_h))
      return {};
    return MemberDesc(m_h).name;
  }

  NGIN::UInt64 Member::TypeId() const
  {
    if (!IsMemberAlive(m_h))
      return 0;
    return MemberDesc(m_h).typeId;
  }

  MemberKind Member::Kind() const
  {
    if (!IsMemberAlive(m_h))
      return MemberKind::Field;
    return MemberDesc(m_h).kind;
  }

  bool Member::IsReadable() const
  {
    return IsMemberAlive(m_h) && MemberDesc(m_h).readable;
  }

  bool Member::IsWritable() const
  {
    return IsMemberAlive(m_h) && MemberDesc(m_h).writable;
  }

  Any Member::GetAny(const void *obj) const
  {
    if (!IsMemberAlive(m_h))
      return Any::MakeVoid();
    const auto &m = MemberDesc(m_h);
    if (m.Load)
      return m.Load(obj);
    return Any::MakeVoid();
  }

  std::expected<void, Error> Member::SetAny(void *obj, const Any &value) const
  {
    if (!IsMemberAlive(m_h))
      return std::unexpected(Error{ErrorCode::InvalidArgument, kStaleHandle});
    const auto &reg = GetRegistry();
    const auto &m = MemberDesc(m_h);
    if (!m.writable || !m.ResolveStore)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "member is read-only", 0, reg.types[m_h.typeIndex].typeId, m.name});
    auto store = m.ResolveStore(value.GetTypeId());
    if (!store)
      return std::unexpected(
          Error{ErrorCode::IncompatibleMemberType, "value type is not assignable to the member", value.GetTypeId(),
                reg.types[m_h.typeIndex].typeId, m.name});
    store(obj, value);
    return {};
  }

  // Base
  Type Base::BaseType() const
  {
    if (!IsBaseAlive(m_h))
      return Type{};
    const auto &b = GetRegistry().types[m_h.typeIndex].bases[m_h.baseIndex];
    return Type{TypeHandle{b.baseTypeIndex}};
  }

  void *Base::Upcast(void *obj) const
  {
    if (!IsBaseAlive(m_h))
      return nullptr;
    const auto &b = GetRegistry().types[m_h.typeIndex].bases[m_h.baseIndex];
    if (!b.Upcast)
      return nullptr;
    return b.Upcast(obj);
  }

  const void *Base::Upcast(const void *obj) const
  {
    if (!IsBaseAlive(m_h))
      return nullptr;
    const auto &b = GetRegistry().types[m_h.typeIndex].bases[m_h.baseIndex];
    if (!b.UpcastConst)
      return nullptr;
    return b.UpcastConst(obj);
  }

} // namespace Morph::Mapping
