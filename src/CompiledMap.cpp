#include <Morph/Mapping/CompiledMap.hpp>

#include <mutex>

namespace Morph::Mapping
{
  namespace
  {
    // Both ends are plain fields of the same type.
    bool CanCopyDirect(const detail::MemberRuntimeDesc &src, const detail::MemberRuntimeDesc &dst)
    {
      return src.GetConst && dst.GetMut && dst.CopyValue && src.typeId == dst.typeId;
    }

    CompiledMap::Step MakeMemberStep(const detail::MemberPath &source, const detail::MemberPath &destination,
                                     detail::StoreFn store)
    {
      const auto &s = source.Desc();
      const auto &d = destination.Desc();
      CompiledMap::Step step{};
      step.source = source;
      step.destination = destination;
      if (CanCopyDirect(s, d))
      {
        step.kind = CompiledMap::StepKind::DirectCopy;
        step.sourceField = s.GetConst;
        step.destinationField = d.GetMut;
        step.copy = d.CopyValue;
      }
      else
      {
        step.kind = CompiledMap::StepKind::Transfer;
        step.load = s.Load;
        step.store = store;
      }
      return step;
    }
  } // namespace

  void *CompiledMap::Invoke(const void *source, void *destination) const
  {
    for (NGIN::UIntSize i = 0; i < m_steps.Size(); ++i)
    {
      const auto &step = m_steps[i];
      void *dst = step.destination.Adjust(destination);
      switch (step.kind)
      {
      case StepKind::DirectCopy:
        step.copy(step.destinationField(dst), step.sourceField(step.source.Adjust(source)));
        break;
      case StepKind::Transfer:
        step.store(dst, step.load(step.source.Adjust(source)));
        break;
      case StepKind::Derive:
        step.store(dst, step.derive(source));
        break;
      }
    }
    if (m_afterMap)
      m_afterMap(source, destination);
    return destination;
  }

  std::expected<std::shared_ptr<const CompiledMap>, Error> CompiledMap::Build(const MapRule &rule)
  {
    if (!rule.IsFinalized())
      return std::unexpected(
          Error{ErrorCode::InvalidArgument, "rule is not finalized", rule.SourceTypeId(), rule.DestinationTypeId()});

    auto map = std::make_shared<CompiledMap>();
    map->m_key = rule.Key();

    const auto &custom = rule.CustomMappings();
    const auto &autoCopy = rule.AutoCopyMembers();
    map->m_steps.Reserve(custom.Size() + autoCopy.Size());

    for (NGIN::UIntSize i = 0; i < custom.Size(); ++i)
    {
      const auto &c = custom[i];
      const auto &d = c.destination.Desc();
      detail::StoreFn store = d.ResolveStore ? d.ResolveStore(c.resultTypeId) : nullptr;
      if (!store)
        return std::unexpected(Error{ErrorCode::IncompatibleMemberType, "derived value cannot be stored into member",
                                     rule.SourceTypeId(), rule.DestinationTypeId(), c.destinationName});
      if (c.sourceMember)
      {
        map->m_steps.PushBack(MakeMemberStep(*c.sourceMember, c.destination, store));
        continue;
      }
      Step step{};
      step.kind = StepKind::Derive;
      step.destination = c.destination;
      step.derive = c.derive;
      step.store = store;
      map->m_steps.PushBack(std::move(step));
    }

    for (NGIN::UIntSize i = 0; i < autoCopy.Size(); ++i)
    {
      const auto &a = autoCopy[i];
      const auto &s = a.source.Desc();
      const auto &d = a.destination.Desc();
      detail::StoreFn store = d.ResolveStore ? d.ResolveStore(s.typeId) : nullptr;
      if (!store && !CanCopyDirect(s, d))
        return std::unexpected(Error{ErrorCode::IncompatibleMemberType, "member cannot be copied", rule.SourceTypeId(),
                                     rule.DestinationTypeId(), d.name});
      map->m_steps.PushBack(MakeMemberStep(a.source, a.destination, store));
    }

    map->m_afterMap = rule.AfterMap();
    return std::shared_ptr<const CompiledMap>(std::move(map));
  }

  std::expected<std::shared_ptr<const CompiledMap>, Error> CompiledMapCache::GetOrBuild(const MapRule &rule)
  {
    const AccessorKey key{rule.Key(), AccessorKind::Compiled};
    {
      std::shared_lock lock(m_mutex);
      if (auto it = m_maps.find(key); it != m_maps.end())
        return it->second;
    }

    auto built = CompiledMap::Build(rule);
    if (!built)
      return std::unexpected(built.error());

    std::unique_lock lock(m_mutex);
    return m_maps.try_emplace(key, std::move(*built)).first->second;
  }

  std::shared_ptr<const CompiledMap> CompiledMapCache::Find(const TypePairKey &key) const
  {
    std::shared_lock lock(m_mutex);
    if (auto it = m_maps.find(AccessorKey{key, AccessorKind::Compiled}); it != m_maps.end())
      return it->second;
    return nullptr;
  }

  void CompiledMapCache::Clear()
  {
    std::unique_lock lock(m_mutex);
    m_maps.clear();
  }

  NGIN::UIntSize CompiledMapCache::Count() const
  {
    std::shared_lock lock(m_mutex);
    return static_cast<NGIN::UIntSize>(m_maps.size());
  }

} // namespace Morph::Mapping
