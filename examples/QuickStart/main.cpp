#include <Morph/Mapping/Mapping.hpp>

#include <iostream>
#include <string>

namespace Demo {
  struct Address {
    std::string city;
    friend void MorphReflect(Morph::Mapping::Tag<Address>, Morph::Mapping::TypeBuilder<Address> &b) {
      b.Field<&Address::city>("city");
    }
  };

  struct Customer {
    int id{0};
    std::string first;
    std::string last;
    Address home;
    std::string password;
    friend void MorphReflect(Morph::Mapping::Tag<Customer>, Morph::Mapping::TypeBuilder<Customer> &b) {
      b.Field<&Customer::id>("id");
      b.Field<&Customer::first>("first");
      b.Field<&Customer::last>("last");
      b.Field<&Customer::home>("home");
      b.Field<&Customer::password>("password");
    }
  };

  struct CustomerDto {
    int id{0};
    std::string fullName;
    std::string city;
    std::string password{"<hidden>"};
    friend void MorphReflect(Morph::Mapping::Tag<CustomerDto>, Morph::Mapping::TypeBuilder<CustomerDto> &b) {
      b.Field<&CustomerDto::id>("id");
      b.Field<&CustomerDto::fullName>("fullName");
      b.Field<&CustomerDto::city>("city");
      b.Field<&CustomerDto::password>("password");
    }
  };
}

int main() {
  using namespace Morph::Mapping;
  using Demo::Customer;
  using Demo::CustomerDto;

  std::cout << "Library: " << LibraryName() << "\n";

  MapRegistry registry;
  auto map = registry.CreateMap<Customer, CustomerDto>();
  if (!map) {
    std::cerr << FormatError(map.error()) << "\n";
    return 1;
  }
  map->ForMember("fullName", [](const Customer &c) { return c.first + " " + c.last; })
      .ForMember("city", [](const Customer &c) { return c.home.city; })
      .IgnoreMember<&Customer::password>();
  if (auto status = map->Status(); !status) {
    std::cerr << FormatError(status.error()) << "\n";
    return 1;
  }

  Mapper mapper{registry};
  Customer c{7, "Ada", "Lovelace", {"London"}, "secret"};
  auto dto = mapper.Map<CustomerDto>(c);
  if (!dto) {
    std::cerr << FormatError(dto.error()) << "\n";
    return 1;
  }
  std::cout << dto->id << " " << dto->fullName << " (" << dto->city << ") " << dto->password << "\n";

  auto plan = registry.DescribeRule<Customer, CustomerDto>();
  if (plan) {
    std::cout << plan->sourceType << " -> " << plan->destinationType << "\n";
    for (NGIN::UIntSize i = 0; i < plan->autoCopied.Size(); ++i)
      std::cout << "  copy   " << plan->autoCopied[i] << "\n";
    for (NGIN::UIntSize i = 0; i < plan->custom.Size(); ++i)
      std::cout << "  custom " << plan->custom[i] << "\n";
  }

  // Nested paths are rejected; only top-level members can be selected.
  auto other = registry.CreateMap<CustomerDto, Customer>();
  if (other) {
    other->ForMember("home.city", "city");
    if (auto status = other->Status(); !status)
      std::cout << FormatError(status.error()) << "\n";
  }
  return 0;
}
