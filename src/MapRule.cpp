#include <Morph/Mapping/MapRule.hpp>

namespace Morph::Mapping
{
  namespace
  {
    bool Contains(const NGIN::Containers::Vector<NameId> &ids, NameId id)
    {
      for (NGIN::UIntSize i = 0; i < ids.Size(); ++i)
      {
        if (ids[i] == id)
          return true;
      }
      return false;
    }
  } // namespace

  bool MapRule::HasCustomMapping(NameId destinationNameId) const noexcept
  {
    for (NGIN::UIntSize i = 0; i < m_custom.Size(); ++i)
    {
      if (m_custom[i].destinationNameId == destinationNameId)
        return true;
    }
    return false;
  }

  bool MapRule::IsCollectionMember(NameId nameId) const noexcept { return Contains(m_collections, nameId); }

  bool MapRule::IsIgnored(NameId nameId) const noexcept { return Contains(m_ignored, nameId); }

  void MapRule::AddCollectionMember(NameId nameId)
  {
    if (!Contains(m_collections, nameId))
      m_collections.PushBack(nameId);
  }

  void MapRule::AddIgnoredMember(NameId nameId)
  {
    if (!Contains(m_ignored, nameId))
      m_ignored.PushBack(nameId);
  }

  void MapRule::Finalize()
  {
    if (m_finalized)
      return;

    const auto &reg = detail::GetRegistry();
    NGIN::Containers::Vector<AutoCopyMember> plan;
    auto sources = detail::CollectMembers(m_sourceTypeIndex);
    for (NGIN::UIntSize i = 0; i < sources.Size(); ++i)
    {
      const auto &src = sources[i].Desc();
      if (!src.readable || !src.Load)
        continue;
      if (IsIgnored(src.nameId) || IsCollectionMember(src.nameId) || HasCustomMapping(src.nameId))
        continue;

      auto dst = detail::FindMemberPath(m_destinationTypeIndex, src.nameId);
      if (!dst)
        continue;
      const auto &d = reg.types[dst->typeIndex].members[dst->memberIndex];
      if (!d.writable || d.typeId != src.typeId)
        continue;

      AutoCopyMember m{};
      m.source = std::move(sources[i]);
      m.destination = std::move(*dst);
      plan.PushBack(std::move(m));
    }
    m_autoCopy = std::move(plan);
    m_finalized = true;
  }

} // namespace Morph::Mapping
