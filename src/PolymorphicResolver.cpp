#include <Morph/Mapping/PolymorphicResolver.hpp>

namespace Morph::Mapping
{
  namespace
  {
    struct Candidate
    {
      NGIN::UInt32 typeIndex;
      const void *object;
    };

    bool Seen(const NGIN::Containers::Vector<Candidate> &list, NGIN::UInt32 typeIndex)
    {
      for (NGIN::UIntSize i = 0; i < list.Size(); ++i)
      {
        if (list[i].typeIndex == typeIndex)
          return true;
      }
      return false;
    }

    // The effective type followed by all of its bases, breadth first.
    NGIN::Containers::Vector<Candidate> Candidates(Candidate start)
    {
      const auto &reg = detail::GetRegistry();
      NGIN::Containers::Vector<Candidate> out;
      out.PushBack(start);
      for (NGIN::UIntSize next = 0; next < out.Size(); ++next)
      {
        const auto current = out[next];
        const auto &bases = reg.types[current.typeIndex].bases;
        for (NGIN::UIntSize i = 0; i < bases.Size(); ++i)
        {
          if (Seen(out, bases[i].baseTypeIndex))
            continue;
          out.PushBack(Candidate{bases[i].baseTypeIndex, bases[i].UpcastConst(current.object)});
        }
      }
      return out;
    }
  } // namespace

  std::optional<ResolvedSource> PolymorphicResolver::Resolve(NGIN::UInt64 destinationTypeId,
                                                             const SourceRef &source) const
  {
    if (source.IsAbsent())
      return std::nullopt;

    const auto &reg = detail::GetRegistry();
    NGIN::UInt64 typeId = source.StaticTypeId();
    const void *object = source.StaticObject();
    auto typeIndex = detail::FindTypeIndex(typeId);

    if (auto *runtime = std::get_if<RuntimeSource>(&source.Get()))
    {
      if (auto dynamicIndex = detail::FindTypeIndexByRtti(runtime->dynamicRttiId))
      {
        typeIndex = *dynamicIndex;
        typeId = reg.types[*dynamicIndex].typeId;
        object = runtime->mostDerived;
      }
    }

    if (typeIndex && m_registry->Options().proxyPredicate)
    {
      const auto &bases = reg.types[*typeIndex].bases;
      if (bases.Size() > 0 && m_registry->Options().proxyPredicate(Type{TypeHandle{*typeIndex}}))
      {
        object = bases[0].UpcastConst(object);
        typeIndex = bases[0].baseTypeIndex;
        typeId = bases[0].baseTypeId;
      }
    }

    if (const auto *rule = m_registry->FindRule(typeId, destinationTypeId))
      return ResolvedSource{typeId, object, rule};

    // Undescribed types have no bases to walk.
    if (!typeIndex)
      return std::nullopt;

    const auto candidates = Candidates(Candidate{*typeIndex, object});

    if (auto memo = m_registry->FindResolvedSource(destinationTypeId))
    {
      for (NGIN::UIntSize i = 0; i < candidates.Size(); ++i)
      {
        const auto &c = candidates[i];
        if (reg.types[c.typeIndex].typeId != *memo)
          continue;
        if (const auto *rule = m_registry->FindRule(*memo, destinationTypeId))
          return ResolvedSource{*memo, c.object, rule};
      }
    }

    for (NGIN::UIntSize i = 1; i < candidates.Size(); ++i)
    {
      const auto &c = candidates[i];
      const auto candidateId = reg.types[c.typeIndex].typeId;
      if (const auto *rule = m_registry->FindRule(candidateId, destinationTypeId))
      {
        (void)m_registry->RememberResolvedSource(destinationTypeId, candidateId);
        return ResolvedSource{candidateId, c.object, rule};
      }
    }
    return std::nullopt;
  }

} // namespace Morph::Mapping
