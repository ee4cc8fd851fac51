// PolymorphicResolver.hpp
// Finds the rule for a destination when the source's concrete type is only known at run time
#pragma once

#include <NGIN/Primitives.hpp>

#include <optional>

#include <Morph/Mapping/Export.hpp>
#include <Morph/Mapping/MapRegistry.hpp>
#include <Morph/Mapping/SourceRef.hpp>

namespace Morph::Mapping
{

  struct ResolvedSource
  {
    NGIN::UInt64 sourceTypeId{0};
    // Source adjusted to the winning type.
    const void *object{nullptr};
    const MapRule *rule{nullptr};
  };

  /**
   * Resolution order for a non-absent source:
   *  1. effective type: the dynamic type when it is described, else the static
   *     type; a type accepted by the proxy predicate is replaced by its first base
   *  2. exact rule for (effective, destination)
   *  3. the type memoized for the destination, if it is the effective type or one of its bases
   *  4. the effective type's bases, breadth first in declaration order
   * A winner found in step 4 is memoized for the destination.
   */
  class MORPH_MAPPING_API PolymorphicResolver
  {
  public:
    explicit PolymorphicResolver(MapRegistry &registry) : m_registry(&registry) {}

    [[nodiscard]] std::optional<ResolvedSource> Resolve(NGIN::UInt64 destinationTypeId, const SourceRef &source) const;

  private:
    MapRegistry *m_registry;
  };

} // namespace Morph::Mapping
