// Diagnostics.hpp
// Human-readable rendering of Error values for callers that log
#pragma once

#include <string>
#include <string_view>

#include <Morph/Mapping/Export.hpp>
#include <Morph/Mapping/Types.hpp>

namespace Morph::Mapping
{

  [[nodiscard]] MORPH_MAPPING_API std::string_view ErrorCodeName(ErrorCode code) noexcept;

  // "<Code>: <message> (<source> -> <destination>, member '<name>')"; type ids
  // are replaced by qualified names when the types are described.
  [[nodiscard]] MORPH_MAPPING_API std::string FormatError(const Error &error);

} // namespace Morph::Mapping
