#include <iostream>
#include <string>

#include <NGIN/Benchmark.hpp>
#include <Morph/Mapping/Mapping.hpp>

using namespace NGIN;

namespace BenchDemo
{
  struct Order
  {
    int id{0};
    std::string customer{"acme"};
    double total{12.5};
    int lines{3};
    friend void MorphReflect(Morph::Mapping::Tag<Order>, Morph::Mapping::TypeBuilder<Order> &b)
    {
      b.Field<&Order::id>("id");
      b.Field<&Order::customer>("customer");
      b.Field<&Order::total>("total");
      b.Field<&Order::lines>("lines");
    }
  };

  struct OrderDto
  {
    int id{0};
    std::string customer;
    double total{0.0};
    long lines{0};
    std::string label;
    friend void MorphReflect(Morph::Mapping::Tag<OrderDto>, Morph::Mapping::TypeBuilder<OrderDto> &b)
    {
      b.Field<&OrderDto::id>("id");
      b.Field<&OrderDto::customer>("customer");
      b.Field<&OrderDto::total>("total");
      b.Field<&OrderDto::lines>("lines");
      b.Field<&OrderDto::label>("label");
    }
  };
}

int main()
{
  using namespace Morph::Mapping;
  using BenchDemo::Order;
  using BenchDemo::OrderDto;

  MapRegistry registry;
  auto builder = registry.CreateMap<Order, OrderDto>();
  if (!builder)
  {
    std::cerr << FormatError(builder.error()) << "\n";
    return 1;
  }
  builder->ForMember("lines", "lines").ForMember("label", [](const Order &o) { return o.customer; });
  Mapper mapper{registry};
  auto compiled = mapper.Compiled(MakeTypePairKey<Order, OrderDto>()).value();

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    Order o{};
    OrderDto d{};
    ctx.start();
    int sum = 0;
    for (int i=0;i<10000;++i) {
      o.id = i;
      (void)mapper.Map(o, d);
      sum += d.id;
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "Mapper Map Order->OrderDto 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    Order o{};
    OrderDto d{};
    ctx.start();
    int sum = 0;
    for (int i=0;i<10000;++i) {
      o.id = i;
      compiled->Invoke(o, d);
      sum += d.id;
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "CompiledMap Invoke 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    Order o{};
    OrderDto d{};
    ctx.start();
    int sum = 0;
    for (int i=0;i<10000;++i) {
      o.id = i;
      d.id = o.id;
      d.customer = o.customer;
      d.total = o.total;
      d.lines = o.lines;
      d.label = o.customer;
      sum += d.id;
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "Hand-written copy 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    auto member = GetType<OrderDto>().GetMember("total").value();
    OrderDto d{};
    Any val{42};
    ctx.start();
    for (int i=0;i<20000;++i) {
      (void)member.SetAny(&d, val);
    }
    ctx.doNotOptimize(d.total);
    ctx.stop(); }, "Member SetAny int->double 20k");

  auto results = Benchmark::RunAll<Milliseconds>();
  Benchmark::PrintSummaryTable(std::cout, results);
  return 0;
}
