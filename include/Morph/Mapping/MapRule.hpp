// MapRule.hpp
// Declarative description of one (source, destination) conversion
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <functional>
#include <optional>
#include <string_view>

#include <Morph/Mapping/Export.hpp>
#include <Morph/Mapping/Registry.hpp>
#include <Morph/Mapping/TypePair.hpp>

namespace Morph::Mapping
{

  // Produces the value for one destination member from a source object (typed as the rule's source).
  using DeriveFn = std::function<Any(const void *)>;
  // Runs after every member assignment: (source, destination).
  using AfterMapFn = std::function<void(const void *, void *)>;

  struct CustomMemberMapping
  {
    NameId destinationNameId{static_cast<NameId>(-1)};
    std::string_view destinationName;
    detail::MemberPath destination;
    // Type of the value the derivation yields.
    NGIN::UInt64 resultTypeId{0};
    // Exactly one of derive / sourceMember is set.
    DeriveFn derive;
    std::optional<detail::MemberPath> sourceMember;
  };

  struct AutoCopyMember
  {
    detail::MemberPath source;
    detail::MemberPath destination;
  };

  // Mutable through MapBuilder until Finalize(), read-only afterwards.
  class MORPH_MAPPING_API MapRule
  {
  public:
    MapRule(TypePairKey key, NGIN::UInt32 sourceTypeIndex, NGIN::UInt32 destinationTypeIndex)
        : m_key(key), m_sourceTypeIndex(sourceTypeIndex), m_destinationTypeIndex(destinationTypeIndex)
    {
    }

    MapRule(const MapRule &) = delete;
    MapRule &operator=(const MapRule &) = delete;

    [[nodiscard]] const TypePairKey &Key() const noexcept { return m_key; }
    [[nodiscard]] NGIN::UInt64 SourceTypeId() const noexcept { return m_key.sourceTypeId; }
    [[nodiscard]] NGIN::UInt64 DestinationTypeId() const noexcept { return m_key.destinationTypeId; }
    [[nodiscard]] NGIN::UInt32 SourceTypeIndex() const noexcept { return m_sourceTypeIndex; }
    [[nodiscard]] NGIN::UInt32 DestinationTypeIndex() const noexcept { return m_destinationTypeIndex; }
    [[nodiscard]] bool IsFinalized() const noexcept { return m_finalized; }

    [[nodiscard]] const NGIN::Containers::Vector<CustomMemberMapping> &CustomMappings() const noexcept { return m_custom; }
    [[nodiscard]] const NGIN::Containers::Vector<NameId> &CollectionMembers() const noexcept { return m_collections; }
    [[nodiscard]] const NGIN::Containers::Vector<NameId> &IgnoredSourceMembers() const noexcept { return m_ignored; }
    [[nodiscard]] const NGIN::Containers::Vector<AutoCopyMember> &AutoCopyMembers() const noexcept { return m_autoCopy; }
    [[nodiscard]] const AfterMapFn &AfterMap() const noexcept { return m_afterMap; }

    [[nodiscard]] bool HasCustomMapping(NameId destinationNameId) const noexcept;
    [[nodiscard]] bool IsCollectionMember(NameId nameId) const noexcept;
    [[nodiscard]] bool IsIgnored(NameId nameId) const noexcept;

    // Mutators used by MapBuilder; callers check IsFinalized() first.
    void AddCustomMapping(CustomMemberMapping mapping) { m_custom.PushBack(std::move(mapping)); }
    void AddCollectionMember(NameId nameId);
    void AddIgnoredMember(NameId nameId);
    void SetAfterMap(AfterMapFn fn) { m_afterMap = std::move(fn); }

    // Derives the auto-copy member list. Idempotent.
    void Finalize();

  private:
    TypePairKey m_key{};
    NGIN::UInt32 m_sourceTypeIndex{static_cast<NGIN::UInt32>(-1)};
    NGIN::UInt32 m_destinationTypeIndex{static_cast<NGIN::UInt32>(-1)};
    bool m_finalized{false};

    NGIN::Containers::Vector<CustomMemberMapping> m_custom;
    NGIN::Containers::Vector<NameId> m_collections;
    NGIN::Containers::Vector<NameId> m_ignored;
    NGIN::Containers::Vector<AutoCopyMember> m_autoCopy;
    AfterMapFn m_afterMap;
  };

} // namespace Morph::Mapping
