// AutoCopyTests.cpp - members copied by matching name

#include <catch2/catch_test_macros.hpp>

#include <Morph/Mapping/Mapping.hpp>

#include <string>
#include <vector>

namespace AutoDemo
{
  using Morph::Mapping::Tag;
  using Morph::Mapping::TypeBuilder;

  struct Simple
  {
    int Id{0};
    std::string Name;
    friend void MorphReflect(Tag<Simple>, TypeBuilder<Simple> &b)
    {
      b.Field<&Simple::Id>("Id");
      b.Field<&Simple::Name>("Name");
    }
  };

  struct SimpleDto
  {
    int Id{0};
    std::string Name;
    int Extra{-1};
    friend void MorphReflect(Tag<SimpleDto>, TypeBuilder<SimpleDto> &b)
    {
      b.Field<&SimpleDto::Id>("Id");
      b.Field<&SimpleDto::Name>("Name");
      b.Field<&SimpleDto::Extra>("Extra");
    }
  };

  // Same names, different shapes: Id is a string here, Name is read-only.
  struct Mismatch
  {
    std::string Id{"unset"};
    std::string name_;
    std::string Name() const { return name_; }
    friend void MorphReflect(Tag<Mismatch>, TypeBuilder<Mismatch> &b)
    {
      b.Field<&Mismatch::Id>("Id");
      b.Property<&Mismatch::Name>("Name");
    }
  };

  struct Audited
  {
    std::string CreatedBy;
    friend void MorphReflect(Tag<Audited>, TypeBuilder<Audited> &b) { b.Field<&Audited::CreatedBy>("CreatedBy"); }
  };

  struct Order : Audited
  {
    int Number{0};
    double Total{0.0};
    std::vector<int> Lines;
    friend void MorphReflect(Tag<Order>, TypeBuilder<Order> &b)
    {
      b.Base<Audited>();
      b.Field<&Order::Number>("Number");
      b.Field<&Order::Total>("Total");
      b.Field<&Order::Lines>("Lines");
    }
  };

  struct OrderDto
  {
    std::string CreatedBy;
    int Number{0};
    double total_{0.0};
    std::vector<int> Lines;
    double Total() const { return total_; }
    void SetTotal(double v) { total_ = v; }
    friend void MorphReflect(Tag<OrderDto>, TypeBuilder<OrderDto> &b)
    {
      b.Field<&OrderDto::CreatedBy>("CreatedBy");
      b.Field<&OrderDto::Number>("Number");
      b.Property<&OrderDto::Total, &OrderDto::SetTotal>("Total");
      b.Field<&OrderDto::Lines>("Lines");
    }
  };
} // namespace AutoDemo

TEST_CASE("AutoCopyCopiesSameNamedMembers", "[mapping][AutoCopy]")
{
  using namespace Morph::Mapping;
  using namespace AutoDemo;

  MapRegistry registry;
  REQUIRE(registry.CreateMap<Simple, SimpleDto>().has_value());
  Mapper mapper{registry};

  auto dto = mapper.Map<SimpleDto>(Simple{1, "A"});
  REQUIRE(dto.has_value());
  CHECK(dto->Id == 1);
  CHECK(dto->Name == "A");
  CHECK(dto->Extra == -1);
}

TEST_CASE("AutoCopySkipsTypeMismatchAndReadOnlyDestination", "[mapping][AutoCopy]")
{
  using namespace Morph::Mapping;
  using namespace AutoDemo;

  MapRegistry registry;
  REQUIRE(registry.CreateMap<Simple, Mismatch>().has_value());
  Mapper mapper{registry};

  auto out = mapper.Map<Mismatch>(Simple{5, "B"});
  REQUIRE(out.has_value());
  CHECK(out->Id == "unset");
  CHECK(out->Name().empty());

  auto plan = registry.DescribeRule<Simple, Mismatch>();
  REQUIRE(plan.has_value());
  CHECK(plan->autoCopied.Size() == 0);
}

TEST_CASE("AutoCopyIncludesInheritedMembersAndProperties", "[mapping][AutoCopy]")
{
  using namespace Morph::Mapping;
  using namespace AutoDemo;

  MapRegistry registry;
  REQUIRE(registry.CreateMap<Order, OrderDto>().has_value());
  Mapper mapper{registry};

  Order o{};
  o.CreatedBy = "system";
  o.Number = 42;
  o.Total = 9.5;
  o.Lines = {1, 2, 3};

  auto dto = mapper.Map<OrderDto>(o);
  REQUIRE(dto.has_value());
  CHECK(dto->CreatedBy == "system");
  CHECK(dto->Number == 42);
  CHECK(dto->Total() == 9.5);
  CHECK(dto->Lines == std::vector<int>{1, 2, 3});
}

TEST_CASE("IgnoredSourceMembersAreNotCopied", "[mapping][AutoCopy]")
{
  using namespace Morph::Mapping;
  using namespace AutoDemo;

  MapRegistry registry;
  auto builder = registry.CreateMap<Order, OrderDto>();
  REQUIRE(builder.has_value());
  builder->IgnoreMember("Number").IgnoreMembers({"CreatedBy", "DoesNotExist"});
  CHECK(builder->Status().has_value());

  Mapper mapper{registry};
  Order o{};
  o.CreatedBy = "system";
  o.Number = 42;
  o.Total = 1.25;

  auto dto = mapper.Map<OrderDto>(o);
  REQUIRE(dto.has_value());
  CHECK(dto->CreatedBy.empty());
  CHECK(dto->Number == 0);
  CHECK(dto->Total() == 1.25);
}

TEST_CASE("CollectionMembersAreExcludedFromAutoCopy", "[mapping][AutoCopy]")
{
  using namespace Morph::Mapping;
  using namespace AutoDemo;

  MapRegistry registry;
  auto builder = registry.CreateMap<Order, OrderDto>();
  REQUIRE(builder.has_value());
  builder->MarkCollection("Lines");
  CHECK(builder->Status().has_value());

  Mapper mapper{registry};
  Order o{};
  o.Number = 3;
  o.Lines = {7, 8};

  auto dto = mapper.Map<OrderDto>(o);
  REQUIRE(dto.has_value());
  CHECK(dto->Number == 3);
  CHECK(dto->Lines.empty());

  auto plan = registry.DescribeRule<Order, OrderDto>();
  REQUIRE(plan.has_value());
  REQUIRE(plan->collections.Size() == 1);
  CHECK(plan->collections[0] == std::string_view{"Lines"});
}

TEST_CASE("MarkCollectionRejectsUnknownMember", "[mapping][AutoCopy]")
{
  using namespace Morph::Mapping;
  using namespace AutoDemo;

  MapRegistry registry;
  auto builder = registry.CreateMap<Order, OrderDto>();
  REQUIRE(builder.has_value());
  builder->MarkCollection("Items");
  auto status = builder->Status();
  REQUIRE_FALSE(status.has_value());
  CHECK(status.error().code == ErrorCode::InvalidMemberExpression);
}

TEST_CASE("MapIntoExistingDestinationKeepsUnmappedMembers", "[mapping][AutoCopy]")
{
  using namespace Morph::Mapping;
  using namespace AutoDemo;

  MapRegistry registry;
  REQUIRE(registry.CreateMap<Simple, SimpleDto>().has_value());
  Mapper mapper{registry};

  SimpleDto dto{};
  dto.Extra = 77;
  auto r = mapper.Map(Simple{2, "C"}, dto);
  REQUIRE(r.has_value());
  CHECK(*r == &dto);
  CHECK(dto.Id == 2);
  CHECK(dto.Name == "C");
  CHECK(dto.Extra == 77);
}

TEST_CASE("RepeatedMappingIntoSameDestinationIsIdempotent", "[mapping][AutoCopy]")
{
  using namespace Morph::Mapping;
  using namespace AutoDemo;

  MapRegistry registry;
  auto builder = registry.CreateMap<Simple, SimpleDto>();
  REQUIRE(builder.has_value());
  builder->ForMember("Name", [](const Simple &s) { return s.Name + "!"; })
      .AfterMap([](const Simple &s, SimpleDto &d) { d.Extra = s.Id * 10; });
  REQUIRE(builder->Status().has_value());
  Mapper mapper{registry};

  const Simple source{4, "D"};
  SimpleDto dto{9, "old", 5};
  REQUIRE(mapper.Map(source, dto).has_value());
  const SimpleDto first = dto;
  REQUIRE(mapper.Map(source, dto).has_value());

  CHECK(first.Id == 4);
  CHECK(first.Name == "D!");
  CHECK(first.Extra == 40);
  CHECK(dto.Id == first.Id);
  CHECK(dto.Name == first.Name);
  CHECK(dto.Extra == first.Extra);
}
