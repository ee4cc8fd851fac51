#include <Morph/Mapping/MapRegistry.hpp>
#include <Morph/Mapping/Profile.hpp>

#include <string>

namespace Morph::Mapping
{

  ProxyPredicate ProxyNamespace(std::string_view prefix)
  {
    return [p = std::string{prefix}](const Type &type) {
      const auto name = type.QualifiedName();
      return !p.empty() && name.size() >= p.size() && name.substr(0, p.size()) == p;
    };
  }

  MapRegistry::MapRegistry(MapperOptions options) : m_options(std::move(options)) {}

  MapRegistry::~MapRegistry() = default;

  std::expected<MapRule *, Error> MapRegistry::AddRule(TypePairKey key, NGIN::UInt32 sourceTypeIndex,
                                                       NGIN::UInt32 destinationTypeIndex)
  {
    std::lock_guard lock(m_finalizeMutex);
    if (m_rules.find(key) != m_rules.end())
      return std::unexpected(Error{ErrorCode::DuplicateMapping, "mapping already registered", key.sourceTypeId,
                                   key.destinationTypeId});
    auto rule = std::make_unique<MapRule>(key, sourceTypeIndex, destinationTypeIndex);
    auto *raw = rule.get();
    m_rules.emplace(key, std::move(rule));
    m_finalized.store(false, std::memory_order_release);
    return raw;
  }

  std::expected<void, Error> MapRegistry::AddProfile(MappingProfile &profile)
  {
    return profile.Configure(*this);
  }

  void MapRegistry::Finalize()
  {
    if (m_finalized.load(std::memory_order_acquire))
      return;
    std::lock_guard lock(m_finalizeMutex);
    if (m_finalized.load(std::memory_order_relaxed))
      return;
    for (auto &[key, rule] : m_rules)
      rule->Finalize();
    m_finalized.store(true, std::memory_order_release);
  }

  const MapRule *MapRegistry::FindRule(const TypePairKey &key) const
  {
    if (auto it = m_rules.find(key); it != m_rules.end())
      return it->second.get();
    return nullptr;
  }

  void MapRegistry::Reset()
  {
    {
      std::lock_guard lock(m_finalizeMutex);
      m_rules.clear();
      m_finalized.store(false, std::memory_order_release);
    }
    {
      std::unique_lock lock(m_memoMutex);
      m_memo = NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt64>{};
    }
    m_cache.Clear();
  }

  std::optional<NGIN::UInt64> MapRegistry::FindResolvedSource(NGIN::UInt64 destinationTypeId) const
  {
    std::shared_lock lock(m_memoMutex);
    if (auto *p = m_memo.GetPtr(destinationTypeId))
      return *p;
    return std::nullopt;
  }

  NGIN::UInt64 MapRegistry::RememberResolvedSource(NGIN::UInt64 destinationTypeId, NGIN::UInt64 sourceTypeId)
  {
    std::unique_lock lock(m_memoMutex);
    if (auto *p = m_memo.GetPtr(destinationTypeId))
      return *p;
    m_memo.Insert(destinationTypeId, sourceTypeId);
    return sourceTypeId;
  }

  std::expected<RuleDescription, Error> MapRegistry::DescribeRule(const TypePairKey &key)
  {
    Finalize();
    const auto *rule = FindRule(key);
    if (!rule)
      return std::unexpected(
          Error{ErrorCode::MappingNotFound, "no mapping registered", key.sourceTypeId, key.destinationTypeId});

    const auto &reg = detail::GetRegistry();
    RuleDescription out{};
    out.key = key;
    out.sourceType = reg.types[rule->SourceTypeIndex()].qualifiedName;
    out.destinationType = reg.types[rule->DestinationTypeIndex()].qualifiedName;
    const auto &autoCopy = rule->AutoCopyMembers();
    for (NGIN::UIntSize i = 0; i < autoCopy.Size(); ++i)
      out.autoCopied.PushBack(autoCopy[i].destination.Desc().name);
    const auto &custom = rule->CustomMappings();
    for (NGIN::UIntSize i = 0; i < custom.Size(); ++i)
      out.custom.PushBack(custom[i].destinationName);
    const auto &collections = rule->CollectionMembers();
    for (NGIN::UIntSize i = 0; i < collections.Size(); ++i)
      out.collections.PushBack(detail::NameFromId(collections[i]));
    out.hasAfterMap = static_cast<bool>(rule->AfterMap());
    return out;
  }

} // namespace Morph::Mapping
