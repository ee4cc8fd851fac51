#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <NGIN/Benchmark.hpp>
#include <Morph/Mapping/Mapping.hpp>

using namespace NGIN;

namespace BenchDemo
{
  struct Node
  {
    virtual ~Node() = default;
    int id{0};
    friend void MorphReflect(Morph::Mapping::Tag<Node>, Morph::Mapping::TypeBuilder<Node> &b) { b.Field<&Node::id>("id"); }
  };

  struct Leaf : Node
  {
    std::string text{"leaf"};
    friend void MorphReflect(Morph::Mapping::Tag<Leaf>, Morph::Mapping::TypeBuilder<Leaf> &b)
    {
      b.Base<Node>();
      b.Field<&Leaf::text>("text");
    }
  };

  struct Branch : Node
  {
    int width{2};
    friend void MorphReflect(Morph::Mapping::Tag<Branch>, Morph::Mapping::TypeBuilder<Branch> &b)
    {
      b.Base<Node>();
      b.Field<&Branch::width>("width");
    }
  };

  struct NodeDto
  {
    int id{0};
    std::string text;
    friend void MorphReflect(Morph::Mapping::Tag<NodeDto>, Morph::Mapping::TypeBuilder<NodeDto> &b)
    {
      b.Field<&NodeDto::id>("id");
      b.Field<&NodeDto::text>("text");
    }
  };
}

int main()
{
  using namespace Morph::Mapping;
  using namespace BenchDemo;

  MapRegistry registry;
  if (auto r = registry.CreateMap<Leaf, NodeDto>(); !r)
  {
    std::cerr << FormatError(r.error()) << "\n";
    return 1;
  }
  if (auto r = registry.CreateMap<Node, NodeDto>(); !r)
  {
    std::cerr << FormatError(r.error()) << "\n";
    return 1;
  }
  (void)GetType<Branch>();
  Mapper mapper{registry};

  std::vector<std::unique_ptr<Node>> nodes;
  for (int i=0;i<1000;++i) {
    if (i % 2 == 0)
      nodes.push_back(std::make_unique<Leaf>());
    else
      nodes.push_back(std::make_unique<Branch>());
    nodes.back()->id = i;
  }

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    Leaf leaf{};
    const Node *src = &leaf;
    NodeDto d{};
    ctx.start();
    int sum = 0;
    for (int i=0;i<10000;++i) {
      (void)mapper.MapObject(src, d);
      sum += d.id;
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "MapObject exact dynamic rule 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    Branch branch{};
    const Node *src = &branch;
    NodeDto d{};
    ctx.start();
    int sum = 0;
    for (int i=0;i<10000;++i) {
      (void)mapper.MapObject(src, d);
      sum += d.id;
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "MapObject via base rule 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    int sum = 0;
    auto range = mapper.MapRange<NodeDto>(nodes);
    if (range) {
      for (auto dto : *range)
        sum += dto.id;
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "MapRange 1k mixed nodes");

  auto results = Benchmark::RunAll<Milliseconds>();
  Benchmark::PrintSummaryTable(std::cout, results);
  return 0;
}
