// TypePair.hpp
// (source, destination) identity used to key rules and compiled maps
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Hashing/FNV.hpp>

#include <cstddef>

#include <Morph/Mapping/Convert.hpp>

namespace Morph::Mapping
{

  struct TypePairKey
  {
    NGIN::UInt64 sourceTypeId{0};
    NGIN::UInt64 destinationTypeId{0};

    friend constexpr bool operator==(const TypePairKey &, const TypePairKey &) = default;

    [[nodiscard]] NGIN::UInt64 Hash() const noexcept
    {
      const NGIN::UInt64 ids[2]{sourceTypeId, destinationTypeId};
      return NGIN::Hashing::FNV1a64(reinterpret_cast<const char *>(ids), sizeof(ids));
    }
  };

  struct TypePairKeyHash
  {
    std::size_t operator()(const TypePairKey &k) const noexcept { return static_cast<std::size_t>(k.Hash()); }
  };

  template <class S, class D>
  inline TypePairKey MakeTypePairKey()
  {
    return TypePairKey{detail::TypeIdOf<S>(), detail::TypeIdOf<D>()};
  }

  // Kind of cached accessor; only compiled maps exist today.
  enum class AccessorKind : unsigned char
  {
    Compiled = 0,
  };

  struct AccessorKey
  {
    TypePairKey pair{};
    AccessorKind kind{AccessorKind::Compiled};

    friend constexpr bool operator==(const AccessorKey &, const AccessorKey &) = default;
  };

  struct AccessorKeyHash
  {
    std::size_t operator()(const AccessorKey &k) const noexcept
    {
      return static_cast<std::size_t>(k.pair.Hash() ^ (static_cast<NGIN::UInt64>(k.kind) * 0x9E3779B97F4A7C15ull));
    }
  };

} // namespace Morph::Mapping
