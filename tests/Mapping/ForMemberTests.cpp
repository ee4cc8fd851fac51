// ForMemberTests.cpp - custom member mappings, after-map hooks and builder failures

#include <catch2/catch_test_macros.hpp>

#include <Morph/Mapping/Mapping.hpp>

#include <string>
#include <string_view>

namespace CustomDemo
{
  using Morph::Mapping::Tag;
  using Morph::Mapping::TypeBuilder;

  struct Address
  {
    std::string City;
    friend void MorphReflect(Tag<Address>, TypeBuilder<Address> &b) { b.Field<&Address::City>("City"); }
  };

  struct Customer
  {
    int Id{0};
    std::string Name;
    int Age{0};
    Address Home;
    friend void MorphReflect(Tag<Customer>, TypeBuilder<Customer> &b)
    {
      b.Field<&Customer::Id>("Id");
      b.Field<&Customer::Name>("Name");
      b.Field<&Customer::Age>("Age");
      b.Field<&Customer::Home>("Home");
    }
  };

  struct CustomerDto
  {
    int Id{0};
    std::string Name;
    std::string DisplayName;
    double Age{0.0};
    int Score{0};
    std::string Summary;
    std::string Kind() const { return "dto"; }
    friend void MorphReflect(Tag<CustomerDto>, TypeBuilder<CustomerDto> &b)
    {
      b.Field<&CustomerDto::Id>("Id");
      b.Field<&CustomerDto::Name>("Name");
      b.Field<&CustomerDto::DisplayName>("DisplayName");
      b.Field<&CustomerDto::Age>("Age");
      b.Field<&CustomerDto::Score>("Score");
      b.Field<&CustomerDto::Summary>("Summary");
      b.Property<&CustomerDto::Kind>("Kind");
    }
  };
} // namespace CustomDemo

TEST_CASE("ForMemberDerivesFromWholeSource", "[mapping][ForMember]")
{
  using namespace Morph::Mapping;
  using namespace CustomDemo;

  MapRegistry registry;
  auto builder = registry.CreateMap<Customer, CustomerDto>();
  REQUIRE(builder.has_value());
  builder->ForMember("DisplayName", [](const Customer &c) { return c.Name + "!"; });
  REQUIRE(builder->Status().has_value());

  Mapper mapper{registry};
  Customer c{};
  c.Id = 1;
  c.Name = "A";
  auto dto = mapper.Map<CustomerDto>(c);
  REQUIRE(dto.has_value());
  CHECK(dto->DisplayName == "A!");
  CHECK(dto->Name == "A");
  CHECK(dto->Id == 1);
}

TEST_CASE("CustomMappingTakesPrecedenceOverAutoCopy", "[mapping][ForMember]")
{
  using namespace Morph::Mapping;
  using namespace CustomDemo;

  MapRegistry registry;
  auto builder = registry.CreateMap<Customer, CustomerDto>();
  REQUIRE(builder.has_value());
  builder->ForMember(Select<&CustomerDto::Name>(), [](const Customer &c) { return c.Name + "!"; });
  REQUIRE(builder->Status().has_value());

  Mapper mapper{registry};
  Customer c{};
  c.Name = "A";
  auto dto = mapper.Map<CustomerDto>(c);
  REQUIRE(dto.has_value());
  CHECK(dto->Name == "A!");

  auto plan = registry.DescribeRule<Customer, CustomerDto>();
  REQUIRE(plan.has_value());
  for (NGIN::UIntSize i = 0; i < plan->autoCopied.Size(); ++i)
    CHECK(plan->autoCopied[i] != std::string_view{"Name"});
  REQUIRE(plan->custom.Size() == 1);
  CHECK(plan->custom[0] == std::string_view{"Name"});
}

TEST_CASE("ForMemberSelectsSourceMemberWithConversion", "[mapping][ForMember]")
{
  using namespace Morph::Mapping;
  using namespace CustomDemo;

  MapRegistry registry;
  auto builder = registry.CreateMap<Customer, CustomerDto>();
  REQUIRE(builder.has_value());
  builder->ForMember("Score", Select<&Customer::Age>()).ForMember("Summary", "Name");
  REQUIRE(builder->Status().has_value());

  Mapper mapper{registry};
  Customer c{};
  c.Name = "Zed";
  c.Age = 33;
  auto dto = mapper.Map<CustomerDto>(c);
  REQUIRE(dto.has_value());
  CHECK(dto->Score == 33);
  CHECK(dto->Summary == "Zed");
  // Age differs in type (int -> double) so auto-copy leaves it alone.
  CHECK(dto->Age == 0.0);
}

TEST_CASE("DerivedValueUsesSafeConversion", "[mapping][ForMember]")
{
  using namespace Morph::Mapping;
  using namespace CustomDemo;

  MapRegistry registry;
  auto builder = registry.CreateMap<Customer, CustomerDto>();
  REQUIRE(builder.has_value());
  builder->ForMember("Age", [](const Customer &c) { return c.Age; });
  builder->ForMember("Summary", [](const Customer &) -> std::string_view { return "static"; });

  Mapper mapper{registry};
  Customer c{};
  c.Age = 21;
  auto dto = mapper.Map<CustomerDto>(c);
  REQUIRE(dto.has_value());
  CHECK(dto->Age == 21.0);
  CHECK(dto->Summary == "static");
}

TEST_CASE("NullCStringStoresEmptyString", "[mapping][ForMember]")
{
  using namespace Morph::Mapping;
  using namespace CustomDemo;

  MapRegistry registry;
  auto builder = registry.CreateMap<Customer, CustomerDto>();
  REQUIRE(builder.has_value());
  builder->ForMember("Summary", [](const Customer &) -> const char * { return nullptr; });
  builder->ForMember("DisplayName", [](const Customer &) -> const char * { return "guest"; });

  Mapper mapper{registry};
  CustomerDto dto{};
  dto.Summary = "stale";
  auto r = mapper.Map(Customer{}, dto);
  REQUIRE(r.has_value());
  CHECK(dto.Summary.empty());
  CHECK(dto.DisplayName == "guest");
}

TEST_CASE("NarrowingDerivedValueFailsAtBuild", "[mapping][ForMember]")
{
  using namespace Morph::Mapping;
  using namespace CustomDemo;

  MapRegistry registry;
  auto builder = registry.CreateMap<Customer, CustomerDto>();
  REQUIRE(builder.has_value());
  builder->ForMember("Score", [](const Customer &) { return 1e300; });
  CHECK(builder->Status().has_value());

  Mapper mapper{registry};
  auto dto = mapper.Map<CustomerDto>(Customer{});
  REQUIRE_FALSE(dto.has_value());
  CHECK(dto.error().code == ErrorCode::IncompatibleMemberType);
  CHECK(dto.error().member == std::string_view{"Score"});
}

TEST_CASE("NestedMemberPathIsRejected", "[mapping][ForMember]")
{
  using namespace Morph::Mapping;
  using namespace CustomDemo;

  MapRegistry registry;
  auto builder = registry.CreateMap<Customer, CustomerDto>();
  REQUIRE(builder.has_value());
  builder->ForMember("Summary", "Home.City");
  auto status = builder->Status();
  REQUIRE_FALSE(status.has_value());
  CHECK(status.error().code == ErrorCode::InvalidMemberExpression);
  CHECK(status.error().member == std::string_view{"Home.City"});
  CHECK(builder->Rule().CustomMappings().Size() == 0);
}

TEST_CASE("UnknownOrReadOnlyDestinationIsRejected", "[mapping][ForMember]")
{
  using namespace Morph::Mapping;
  using namespace CustomDemo;

  MapRegistry registry;
  auto builder = registry.CreateMap<Customer, CustomerDto>();
  REQUIRE(builder.has_value());

  builder->ForMember("Nickname", [](const Customer &c) { return c.Name; });
  REQUIRE_FALSE(builder->Status().has_value());
  CHECK(builder->Status().error().code == ErrorCode::InvalidMemberExpression);

  // The first failure is kept; later calls still apply.
  builder->ForMember("Kind", [](const Customer &c) { return c.Name; }).ForMember("DisplayName", "Name");
  CHECK(builder->Status().error().member == std::string_view{"Nickname"});
  CHECK(builder->Rule().CustomMappings().Size() == 1);
}

TEST_CASE("SameDestinationTwiceIsRejected", "[mapping][ForMember]")
{
  using namespace Morph::Mapping;
  using namespace CustomDemo;

  MapRegistry registry;
  auto builder = registry.CreateMap<Customer, CustomerDto>();
  REQUIRE(builder.has_value());
  builder->ForMember("DisplayName", "Name").ForMember("DisplayName", [](const Customer &) { return std::string{"x"}; });
  auto status = builder->Status();
  REQUIRE_FALSE(status.has_value());
  CHECK(status.error().code == ErrorCode::DuplicateMemberMapping);
  CHECK(builder->Rule().CustomMappings().Size() == 1);
}

TEST_CASE("IncompatibleDerivedValueFailsAtBuild", "[mapping][ForMember]")
{
  using namespace Morph::Mapping;
  using namespace CustomDemo;

  MapRegistry registry;
  auto builder = registry.CreateMap<Customer, CustomerDto>();
  REQUIRE(builder.has_value());
  builder->ForMember("Score", [](const Customer &c) { return c.Name; });
  CHECK(builder->Status().has_value());

  Mapper mapper{registry};
  auto dto = mapper.Map<CustomerDto>(Customer{});
  REQUIRE_FALSE(dto.has_value());
  CHECK(dto.error().code == ErrorCode::IncompatibleMemberType);
  CHECK(dto.error().member == std::string_view{"Score"});
  CHECK(registry.Cache().Count() == 0);
}

TEST_CASE("AfterMapRunsAfterAssignments", "[mapping][ForMember]")
{
  using namespace Morph::Mapping;
  using namespace CustomDemo;

  MapRegistry registry;
  auto builder = registry.CreateMap<Customer, CustomerDto>();
  REQUIRE(builder.has_value());
  builder->ForMember("DisplayName", [](const Customer &c) { return c.Name; })
      .AfterMap([](const Customer &c, CustomerDto &d) { d.Summary = d.DisplayName + "#" + std::to_string(c.Id); });

  Mapper mapper{registry};
  Customer c{};
  c.Id = 9;
  c.Name = "Kai";
  auto dto = mapper.Map<CustomerDto>(c);
  REQUIRE(dto.has_value());
  CHECK(dto->Summary == "Kai#9");

  auto plan = registry.DescribeRule<Customer, CustomerDto>();
  REQUIRE(plan.has_value());
  CHECK(plan->hasAfterMap);
}

TEST_CASE("ConfigurationAfterFinalizeIsRejected", "[mapping][ForMember]")
{
  using namespace Morph::Mapping;
  using namespace CustomDemo;

  MapRegistry registry;
  auto builder = registry.CreateMap<Customer, CustomerDto>();
  REQUIRE(builder.has_value());
  registry.Finalize();

  builder->ForMember("DisplayName", "Name");
  auto status = builder->Status();
  REQUIRE_FALSE(status.has_value());
  CHECK(status.error().code == ErrorCode::InvalidMemberExpression);
  CHECK(builder->Rule().CustomMappings().Size() == 0);
}

TEST_CASE("FormatErrorNamesTypesAndMember", "[mapping][ForMember]")
{
  using namespace Morph::Mapping;
  using namespace CustomDemo;

  MapRegistry registry;
  auto builder = registry.CreateMap<Customer, CustomerDto>();
  REQUIRE(builder.has_value());
  builder->ForMember("Summary", "Home.City");
  auto text = FormatError(builder->Status().error());
  CHECK(text.find("InvalidMemberExpression") != std::string::npos);
  CHECK(text.find(std::string{GetType<Customer>().QualifiedName()}) != std::string::npos);
  CHECK(text.find("Home.City") != std::string::npos);
}
