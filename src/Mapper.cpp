#include <Morph/Mapping/Mapper.hpp>

namespace Morph::Mapping
{

  std::expected<std::shared_ptr<const CompiledMap>, Error> Mapper::Compiled(const TypePairKey &key)
  {
    m_registry->Finalize();
    const auto *rule = m_registry->FindRule(key);
    if (!rule)
      return std::unexpected(
          Error{ErrorCode::MappingNotFound, "no mapping registered", key.sourceTypeId, key.destinationTypeId});
    return m_registry->Cache().GetOrBuild(*rule);
  }

  std::expected<std::optional<BoundSource>, Error> Mapper::Bind(NGIN::UInt64 destinationTypeId, const SourceRef &source)
  {
    if (source.IsAbsent())
      return std::optional<BoundSource>{};
    m_registry->Finalize();
    auto resolved = m_resolver.Resolve(destinationTypeId, source);
    if (!resolved)
      return std::unexpected(Error{ErrorCode::MappingNotFound, "no mapping for the source type or any of its bases",
                                   source.StaticTypeId(), destinationTypeId});
    auto compiled = m_registry->Cache().GetOrBuild(*resolved->rule);
    if (!compiled)
      return std::unexpected(compiled.error());
    return std::optional<BoundSource>{BoundSource{std::move(*compiled), resolved->object}};
  }

} // namespace Morph::Mapping
