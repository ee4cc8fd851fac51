#pragma once

#include <string_view>

#include <Morph/Mapping/Export.hpp>
#include <Morph/Mapping/Types.hpp>
#include <Morph/Mapping/Registry.hpp>
#include <Morph/Mapping/NameUtils.hpp>
#include <Morph/Mapping/TypeBuilder.hpp>
#include <Morph/Mapping/TypePair.hpp>
#include <Morph/Mapping/MapRule.hpp>
#include <Morph/Mapping/MapBuilder.hpp>
#include <Morph/Mapping/CompiledMap.hpp>
#include <Morph/Mapping/MapRegistry.hpp>
#include <Morph/Mapping/SourceRef.hpp>
#include <Morph/Mapping/PolymorphicResolver.hpp>
#include <Morph/Mapping/Mapper.hpp>
#include <Morph/Mapping/Profile.hpp>
#include <Morph/Mapping/Diagnostics.hpp>
#include <NGIN/Meta/TypeName.hpp>

namespace Morph::Mapping
{

    // For quick sanity checks / examples.
    [[nodiscard]] constexpr std::string_view LibraryName() noexcept { return "Morph.Mapping"; }

} // namespace Morph::Mapping
