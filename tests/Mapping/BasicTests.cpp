/// @file BasicTests.cpp
/// @brief Basic smoke tests for Morph.Mapping.

#include <catch2/catch_test_macros.hpp>
#include <Morph/Mapping/Mapping.hpp>

TEST_CASE("LibraryNameReturnsModuleIdentifier", "[mapping][Basics]") {
  CHECK(Morph::Mapping::LibraryName() == std::string_view{"Morph.Mapping"});
}
