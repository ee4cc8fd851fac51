#pragma once

#include <expected>

#include <Morph/Mapping/Types.hpp>
#include <Morph/Mapping/MapRegistry.hpp>

namespace Morph::Mapping
{

  /**
   * Groups the rule registrations of one feature or module. Configure() is
   * called by MapRegistry::AddProfile and should return the first failure of
   * any CreateMap or builder call it makes.
   */
  class MappingProfile
  {
  public:
    virtual ~MappingProfile() = default;

    virtual std::expected<void, Error> Configure(MapRegistry &registry) = 0;
  };

} // namespace Morph::Mapping
