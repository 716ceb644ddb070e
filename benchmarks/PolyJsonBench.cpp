#include <iostream>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include <NGIN/Benchmark.hpp>
#include <NGIN/PolyJson/PolyJson.hpp>

using namespace NGIN;

namespace PolyJsonBench
{
  struct Item
  {
    virtual ~Item() = default;
  };

  struct Counter final : Item
  {
    int Value{};
    std::string Label;

    friend void PolyJsonReflect(NGIN::PolyJson::Tag<Counter>, NGIN::PolyJson::TypeBuilder<Counter> &b)
    {
      b.base<Item>();
      b.type_id("counter");
      b.field<&Counter::Value>();
      b.field<&Counter::Label>();
    }
  };

  struct Bag final : Item
  {
    std::vector<std::unique_ptr<Item>> Items;

    friend void PolyJsonReflect(NGIN::PolyJson::Tag<Bag>, NGIN::PolyJson::TypeBuilder<Bag> &b)
    {
      b.base<Item>();
      b.type_id("bag");
      b.field<&Bag::Items>();
    }
  };

  struct Catalog
  {
    static void Declare(NGIN::PolyJson::TypeGroupBuilder &g) { g.RegisterTypes<Counter, Bag>(); }
  };
}

int main()
{
  using namespace PolyJsonBench;

  auto host = NGIN::PolyJson::SerializerServices{}.AddPolymorphicSerializer().AddTypeGroup<Catalog>().Build();
  if (!host)
  {
    std::cerr << NGIN::PolyJson::ToString(host.error()) << "\n";
    return 1;
  }
  auto serializer = host->GetSerializer().value();
  auto typed = host->GetSerializer<Item>().value();
  const auto base = NGIN::PolyJson::GetType<Item>();
  const auto options = NGIN::PolyJson::MakeOptions();

  Bag bag;
  for (int i = 0; i < 100; ++i)
  {
    auto c = std::make_unique<Counter>();
    c->Value = i;
    c->Label = "item-" + std::to_string(i);
    bag.Items.push_back(std::move(c));
  }
  const std::string document = typed->Encode(bag).value();

  constexpr int N = 10000;
  constexpr int M = 1000;

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        int hits = 0;
                        for (int i = 0; i < N; ++i)
                        {
                          auto config = serializer->CreateConfig(base, options);
                          hits += config ? 1 : 0;
                        }
                        ctx.doNotOptimize(hits);
                        ctx.stop(); }, "CreateConfig cached 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        int built = 0;
                        for (int i = 0; i < M; ++i)
                        {
                          auto config = NGIN::PolyJson::CombineResolvers(base, serializer->Groups(), options.get());
                          built += config ? 1 : 0;
                        }
                        ctx.doNotOptimize(built);
                        ctx.stop(); }, "CombineResolvers fresh 1k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        std::size_t bytes = 0;
                        for (int i = 0; i < M; ++i)
                        {
                          auto text = typed->Encode(bag);
                          bytes += text ? text->size() : 0;
                        }
                        ctx.doNotOptimize(bytes);
                        ctx.stop(); }, "Encode 100 variants 1k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        int decoded = 0;
                        for (int i = 0; i < M; ++i)
                        {
                          auto value = typed->Decode(document);
                          decoded += value ? 1 : 0;
                        }
                        ctx.doNotOptimize(decoded);
                        ctx.stop(); }, "Decode 100 variants 1k");

  auto results = NGIN::Benchmark::RunAll<Milliseconds>();
  NGIN::Benchmark::PrintSummaryTable(std::cout, results);
  return 0;
}
