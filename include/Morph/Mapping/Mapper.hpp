// Mapper.hpp
// Facade: map one object, a runtime-typed object, or a range of objects
#pragma once

#include <NGIN/Primitives.hpp>

#include <cstddef>
#include <expected>
#include <iterator>
#include <memory>
#include <optional>
#include <ranges>
#include <type_traits>
#include <utility>
#include <vector>

#include <Morph/Mapping/Export.hpp>
#include <Morph/Mapping/CompiledMap.hpp>
#include <Morph/Mapping/MapRegistry.hpp>
#include <Morph/Mapping/PolymorphicResolver.hpp>
#include <Morph/Mapping/SourceRef.hpp>

namespace Morph::Mapping
{

  // A source object paired with the compiled map that applies to it.
  struct BoundSource
  {
    std::shared_ptr<const CompiledMap> map;
    const void *object{nullptr};
  };

  // Lazy sequence of mapped objects. Each dereference builds and maps a fresh D;
  // iterating again maps again. The referenced sources must outlive the range.
  template <class D>
  class MappedRange
  {
  public:
    class iterator
    {
    public:
      using iterator_concept = std::forward_iterator_tag;
      using iterator_category = std::input_iterator_tag;
      using value_type = D;
      using difference_type = std::ptrdiff_t;
      using reference = D;

      iterator() = default;
      explicit iterator(typename std::vector<BoundSource>::const_iterator it) : m_it(it) {}

      D operator*() const
      {
        D out{};
        m_it->map->Invoke(m_it->object, static_cast<void *>(&out));
        return out;
      }

      iterator &operator++()
      {
        ++m_it;
        return *this;
      }
      iterator operator++(int)
      {
        auto tmp = *this;
        ++m_it;
        return tmp;
      }

      friend bool operator==(const iterator &, const iterator &) = default;

    private:
      typename std::vector<BoundSource>::const_iterator m_it{};
    };

    MappedRange() = default;
    explicit MappedRange(std::vector<BoundSource> sources) : m_sources(std::move(sources)) {}

    [[nodiscard]] iterator begin() const { return iterator{m_sources.begin()}; }
    [[nodiscard]] iterator end() const { return iterator{m_sources.end()}; }
    [[nodiscard]] std::size_t size() const noexcept { return m_sources.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_sources.empty(); }

  private:
    std::vector<BoundSource> m_sources;
  };

  class MORPH_MAPPING_API Mapper
  {
  public:
    explicit Mapper(MapRegistry &registry) : m_registry(&registry), m_resolver(registry) {}

    // Exact rule for (S, D); MappingNotFound otherwise.
    template <class S, class D>
    std::expected<D *, Error> Map(const S &source, D &destination)
    {
      auto compiled = Compiled(MakeTypePairKey<S, D>());
      if (!compiled)
        return std::unexpected(compiled.error());
      (*compiled)->Invoke(static_cast<const void *>(&source), static_cast<void *>(&destination));
      return &destination;
    }

    template <class D, class S>
    std::expected<D, Error> Map(const S &source)
    {
      D destination{};
      auto r = Map(source, destination);
      if (!r)
        return std::unexpected(r.error());
      return destination;
    }

    // Runtime-typed source. An absent source yields nullptr, not an error.
    template <class D>
    std::expected<D *, Error> MapObject(const SourceRef &source, D &destination)
    {
      auto bound = Bind(detail::TypeIdOf<D>(), source);
      if (!bound)
        return std::unexpected(bound.error());
      if (!*bound)
        return nullptr;
      (*bound)->map->Invoke((*bound)->object, static_cast<void *>(&destination));
      return &destination;
    }

    template <class D>
    std::expected<std::optional<D>, Error> MapObject(const SourceRef &source)
    {
      if (source.IsAbsent())
        return std::optional<D>{};
      D destination{};
      auto r = MapObject(source, destination);
      if (!r)
        return std::unexpected(r.error());
      return std::optional<D>{std::move(destination)};
    }

    // Resolves every element now and maps lazily on iteration. Null pointer
    // elements are skipped. Value elements use the exact rule of their type;
    // pointer elements are resolved polymorphically. The range must outlive the
    // result, so owning temporaries are rejected.
    template <class D, std::ranges::input_range R>
      requires(std::is_lvalue_reference_v<R> || std::ranges::borrowed_range<R>)
    std::expected<MappedRange<D>, Error> MapRange(R &&range)
    {
      using Ref = std::ranges::range_reference_t<R>;
      using E = std::remove_cvref_t<Ref>;
      std::vector<BoundSource> bound;
      if constexpr (std::ranges::sized_range<R>)
        bound.reserve(static_cast<std::size_t>(std::ranges::size(range)));

      if constexpr (detail::IsPointerLike<E>)
      {
        const auto destinationTypeId = detail::TypeIdOf<D>();
        for (auto &&element : range)
        {
          auto b = Bind(destinationTypeId, SourceRef{element});
          if (!b)
            return std::unexpected(b.error());
          if (*b)
            bound.push_back(std::move(**b));
        }
      }
      else
      {
        static_assert(std::is_lvalue_reference_v<Ref>, "value elements must be stored in the range, not produced on the fly");
        auto compiled = Compiled(MakeTypePairKey<E, D>());
        if (!compiled)
          return std::unexpected(compiled.error());
        for (auto &&element : range)
          bound.push_back(BoundSource{*compiled, static_cast<const void *>(std::addressof(element))});
      }
      return MappedRange<D>{std::move(bound)};
    }

    [[nodiscard]] MapRegistry &Registry() noexcept { return *m_registry; }

    // Compiled map for an exact pair; finalizes the registry first.
    std::expected<std::shared_ptr<const CompiledMap>, Error> Compiled(const TypePairKey &key);
    // Resolves and compiles for a runtime-typed source; empty for an absent source.
    std::expected<std::optional<BoundSource>, Error> Bind(NGIN::UInt64 destinationTypeId, const SourceRef &source);

  private:
    MapRegistry *m_registry;
    PolymorphicResolver m_resolver;
  };

} // namespace Morph::Mapping
