// MapRegistry.hpp
// Rule store keyed by (source, destination): registration, finalize, lookup, polymorphic memo
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <atomic>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string_view>
#include <unordered_map>

#include <Morph/Mapping/Export.hpp>
#include <Morph/Mapping/Registry.hpp>
#include <Morph/Mapping/TypeBuilder.hpp>
#include <Morph/Mapping/TypePair.hpp>
#include <Morph/Mapping/MapRule.hpp>
#include <Morph/Mapping/MapBuilder.hpp>
#include <Morph/Mapping/CompiledMap.hpp>

namespace Morph::Mapping
{

  class MappingProfile;

  // Decides whether a described type is a generated stand-in for its first base.
  using ProxyPredicate = std::function<bool(const Type &)>;

  // Matches types whose qualified name starts with `prefix` (e.g. "Proxies::").
  MORPH_MAPPING_API ProxyPredicate ProxyNamespace(std::string_view prefix);

  struct MapperOptions
  {
    ProxyPredicate proxyPredicate{};
  };

  // Member plan of one finalized rule, for diagnostics.
  struct RuleDescription
  {
    TypePairKey key{};
    std::string_view sourceType;
    std::string_view destinationType;
    NGIN::Containers::Vector<std::string_view> autoCopied;
    NGIN::Containers::Vector<std::string_view> custom;
    NGIN::Containers::Vector<std::string_view> collections;
    bool hasAfterMap{false};
  };

  class MORPH_MAPPING_API MapRegistry
  {
  public:
    explicit MapRegistry(MapperOptions options = {});
    MapRegistry(const MapRegistry &) = delete;
    MapRegistry &operator=(const MapRegistry &) = delete;
    ~MapRegistry();

    // Registers S -> D. Fails with DuplicateMapping if the pair exists; the
    // earlier rule stays in place.
    template <class S, class D>
    std::expected<MapBuilder<S, D>, Error> CreateMap()
    {
      const auto srcIndex = detail::EnsureRegistered<S>();
      const auto dstIndex = detail::EnsureRegistered<D>();
      auto rule = AddRule(MakeTypePairKey<S, D>(), srcIndex, dstIndex);
      if (!rule)
        return std::unexpected(rule.error());
      return MapBuilder<S, D>{*rule};
    }

    // Applies profiles in order and stops at the first failure.
    std::expected<void, Error> AddProfile(MappingProfile &profile);

    template <class... P>
    std::expected<void, Error> AddProfiles(P &...profiles)
    {
      std::expected<void, Error> result{};
      (void)((result = AddProfile(profiles), result.has_value()) && ...);
      return result;
    }

    // Derives auto-copy members for every rule added since the last call.
    void Finalize();
    [[nodiscard]] bool IsFinalized() const noexcept { return m_finalized.load(std::memory_order_acquire); }

    [[nodiscard]] const MapRule *FindRule(const TypePairKey &key) const;
    [[nodiscard]] const MapRule *FindRule(NGIN::UInt64 sourceTypeId, NGIN::UInt64 destinationTypeId) const
    {
      return FindRule(TypePairKey{sourceTypeId, destinationTypeId});
    }
    template <class S, class D>
    [[nodiscard]] const MapRule *FindRule() const
    {
      return FindRule(MakeTypePairKey<S, D>());
    }

    [[nodiscard]] NGIN::UIntSize RuleCount() const noexcept { return static_cast<NGIN::UIntSize>(m_rules.size()); }

    // Drops rules, the polymorphic memo and the compiled cache. Not safe while mapping.
    void Reset();

    // Polymorphic memo: destination type -> source type that resolved for it.
    [[nodiscard]] std::optional<NGIN::UInt64> FindResolvedSource(NGIN::UInt64 destinationTypeId) const;
    // Stores the winner unless one is present; returns the stored one.
    NGIN::UInt64 RememberResolvedSource(NGIN::UInt64 destinationTypeId, NGIN::UInt64 sourceTypeId);

    [[nodiscard]] CompiledMapCache &Cache() noexcept { return m_cache; }
    [[nodiscard]] const MapperOptions &Options() const noexcept { return m_options; }

    std::expected<RuleDescription, Error> DescribeRule(const TypePairKey &key);
    template <class S, class D>
    std::expected<RuleDescription, Error> DescribeRule()
    {
      return DescribeRule(MakeTypePairKey<S, D>());
    }

  private:
    std::expected<MapRule *, Error> AddRule(TypePairKey key, NGIN::UInt32 sourceTypeIndex, NGIN::UInt32 destinationTypeIndex);

    MapperOptions m_options;
    // Node-based: builders keep MapRule pointers, and the key is a composite hashed by TypePairKeyHash.
    std::unordered_map<TypePairKey, std::unique_ptr<MapRule>, TypePairKeyHash> m_rules;

    std::mutex m_finalizeMutex;
    std::atomic<bool> m_finalized{false};

    mutable std::shared_mutex m_memoMutex;
    NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt64> m_memo;

    CompiledMapCache m_cache;
  };

} // namespace Morph::Mapping
