// CompiledCacheTests.cpp - one compiled map per type pair

#include <catch2/catch_test_macros.hpp>

#include <Morph/Mapping/Mapping.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace CacheDemo
{
  using Morph::Mapping::Tag;
  using Morph::Mapping::TypeBuilder;

  struct Item
  {
    int Sku{0};
    std::string Title;
    float Price{0.0f};
    friend void MorphReflect(Tag<Item>, TypeBuilder<Item> &b)
    {
      b.Field<&Item::Sku>("Sku");
      b.Field<&Item::Title>("Title");
      b.Field<&Item::Price>("Price");
    }
  };

  struct ItemView
  {
    int Sku{0};
    std::string Title;
    double Price{0.0};
    friend void MorphReflect(Tag<ItemView>, TypeBuilder<ItemView> &b)
    {
      b.Field<&ItemView::Sku>("Sku");
      b.Field<&ItemView::Title>("Title");
      b.Field<&ItemView::Price>("Price");
    }
  };
} // namespace CacheDemo

TEST_CASE("CompiledMapIsBuiltOnceAndReused", "[mapping][CompiledCache]")
{
  using namespace Morph::Mapping;
  using namespace CacheDemo;

  MapRegistry registry;
  REQUIRE(registry.CreateMap<Item, ItemView>().has_value());
  Mapper mapper{registry};

  auto a = mapper.Compiled(MakeTypePairKey<Item, ItemView>());
  auto b = mapper.Compiled(MakeTypePairKey<Item, ItemView>());
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  CHECK(a->get() == b->get());
  CHECK(registry.Cache().Count() == 1);
  CHECK(registry.Cache().Find(MakeTypePairKey<Item, ItemView>()).get() == a->get());
  CHECK(registry.Cache().Find(MakeTypePairKey<ItemView, Item>()) == nullptr);
}

TEST_CASE("CompiledStepsFollowMemberShapes", "[mapping][CompiledCache]")
{
  using namespace Morph::Mapping;
  using namespace CacheDemo;

  MapRegistry registry;
  auto builder = registry.CreateMap<Item, ItemView>();
  REQUIRE(builder.has_value());
  builder->ForMember("Price", Select<&Item::Price>());
  Mapper mapper{registry};

  auto compiled = mapper.Compiled(MakeTypePairKey<Item, ItemView>());
  REQUIRE(compiled.has_value());
  const auto &steps = (*compiled)->Steps();
  REQUIRE(steps.Size() == 3);
  // Custom mappings run first.
  CHECK(steps[0].kind == CompiledMap::StepKind::Transfer);
  CHECK(steps[1].kind == CompiledMap::StepKind::DirectCopy);
  CHECK(steps[2].kind == CompiledMap::StepKind::DirectCopy);

  Item item{7, "Lamp", 2.5f};
  ItemView view{};
  (*compiled)->Invoke(item, view);
  CHECK(view.Sku == 7);
  CHECK(view.Title == "Lamp");
  CHECK(view.Price == 2.5);
}

TEST_CASE("UnfinalizedRuleCannotBeCompiled", "[mapping][CompiledCache]")
{
  using namespace Morph::Mapping;
  using namespace CacheDemo;

  MapRegistry registry;
  REQUIRE(registry.CreateMap<Item, ItemView>().has_value());
  const auto *rule = registry.FindRule<Item, ItemView>();
  REQUIRE(rule != nullptr);

  auto built = registry.Cache().GetOrBuild(*rule);
  REQUIRE_FALSE(built.has_value());
  CHECK(built.error().code == ErrorCode::InvalidArgument);
  CHECK(registry.Cache().Count() == 0);
}

TEST_CASE("ClearEmptiesTheCache", "[mapping][CompiledCache]")
{
  using namespace Morph::Mapping;
  using namespace CacheDemo;

  MapRegistry registry;
  REQUIRE(registry.CreateMap<Item, ItemView>().has_value());
  Mapper mapper{registry};
  auto first = mapper.Compiled(MakeTypePairKey<Item, ItemView>());
  REQUIRE(first.has_value());

  registry.Cache().Clear();
  CHECK(registry.Cache().Count() == 0);
  // Maps handed out earlier stay alive.
  Item item{1, "Pen", 1.0f};
  ItemView view{};
  (*first)->Invoke(item, view);
  CHECK(view.Title == "Pen");

  auto again = mapper.Compiled(MakeTypePairKey<Item, ItemView>());
  REQUIRE(again.has_value());
  CHECK(registry.Cache().Count() == 1);
}

TEST_CASE("ConcurrentFirstUseSharesOneMap", "[mapping][CompiledCache]")
{
  using namespace Morph::Mapping;
  using namespace CacheDemo;

  MapRegistry registry;
  REQUIRE(registry.CreateMap<Item, ItemView>().has_value());
  registry.Finalize();
  const auto *rule = registry.FindRule<Item, ItemView>();
  REQUIRE(rule != nullptr);

  constexpr int kThreads = 8;
  std::vector<const CompiledMap *> seen(kThreads, nullptr);
  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i)
  {
    threads.emplace_back([&, i] {
      auto map = registry.Cache().GetOrBuild(*rule);
      if (!map)
      {
        failures.fetch_add(1);
        return;
      }
      seen[static_cast<std::size_t>(i)] = map->get();
    });
  }
  for (auto &t : threads)
    t.join();

  CHECK(failures.load() == 0);
  CHECK(registry.Cache().Count() == 1);
  for (const auto *p : seen)
    CHECK(p == seen[0]);
}
