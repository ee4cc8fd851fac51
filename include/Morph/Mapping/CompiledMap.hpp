// CompiledMap.hpp
// Copy plan built once from a finalized MapRule, plus the per-key cache that owns it
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <expected>
#include <memory>
#include <shared_mutex>
#include <unordered_map>

#include <Morph/Mapping/Export.hpp>
#include <Morph/Mapping/MapRule.hpp>
#include <Morph/Mapping/TypePair.hpp>

namespace Morph::Mapping
{

  class MORPH_MAPPING_API CompiledMap
  {
  public:
    enum class StepKind : unsigned char
    {
      DirectCopy, // field to field of the same type
      Transfer,   // read a source member, store into the destination member
      Derive,     // user derivation, store into the destination member
    };

    struct Step
    {
      StepKind kind{StepKind::Transfer};
      detail::MemberPath source;
      detail::MemberPath destination;
      const void *(*sourceField)(const void *){nullptr};
      void *(*destinationField)(void *){nullptr};
      void (*copy)(void *, const void *){nullptr};
      detail::LoadFn load{nullptr};
      detail::StoreFn store{nullptr};
      DeriveFn derive;
    };

    // Source must point at an object of the rule's source type and destination
    // at one of its destination type. Returns destination.
    void *Invoke(const void *source, void *destination) const;

    template <class S, class D>
    D &Invoke(const S &source, D &destination) const
    {
      return *static_cast<D *>(Invoke(static_cast<const void *>(&source), static_cast<void *>(&destination)));
    }

    [[nodiscard]] const TypePairKey &Key() const noexcept { return m_key; }
    [[nodiscard]] const NGIN::Containers::Vector<Step> &Steps() const noexcept { return m_steps; }

    // Fails with IncompatibleMemberType when a custom derivation's value cannot be
    // stored into its destination member.
    static std::expected<std::shared_ptr<const CompiledMap>, Error> Build(const MapRule &rule);

  private:
    TypePairKey m_key{};
    NGIN::Containers::Vector<Step> m_steps;
    AfterMapFn m_afterMap;
  };

  // One compiled map per (type pair, kind). Concurrent first use may build more
  // than once; the first stored map is what every caller gets.
  class MORPH_MAPPING_API CompiledMapCache
  {
  public:
    CompiledMapCache() = default;
    CompiledMapCache(const CompiledMapCache &) = delete;
    CompiledMapCache &operator=(const CompiledMapCache &) = delete;

    std::expected<std::shared_ptr<const CompiledMap>, Error> GetOrBuild(const MapRule &rule);
    [[nodiscard]] std::shared_ptr<const CompiledMap> Find(const TypePairKey &key) const;
    void Clear();
    [[nodiscard]] NGIN::UIntSize Count() const;

  private:
    mutable std::shared_mutex m_mutex;
    // try_emplace hands back the stored winner when two builders race.
    std::unordered_map<AccessorKey, std::shared_ptr<const CompiledMap>, AccessorKeyHash> m_maps;
  };

} // namespace Morph::Mapping
