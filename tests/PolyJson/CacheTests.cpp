// CacheTests.cpp - configuration identity per (base, options object)

#include <catch2/catch_test_macros.hpp>

#include <NGIN/PolyJson/PolyJson.hpp>

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

namespace CacheDemo
{
  struct Event
  {
    virtual ~Event() = default;
  };

  struct Click final : Event
  {
    int X{};
    int Y{};

    friend void PolyJsonReflect(NGIN::PolyJson::Tag<Click>, NGIN::PolyJson::TypeBuilder<Click> &b)
    {
      b.base<Event>();
      b.type_id("click");
      b.field<&Click::X>();
      b.field<&Click::Y>();
    }
  };

  struct Events
  {
    static void Declare(NGIN::PolyJson::TypeGroupBuilder &g) { g.RegisterType<Click>(); }
  };

  std::shared_ptr<PolyJson::PolymorphicSerializer> MakeSerializer()
  {
    NGIN::PolyJson::GroupList groups;
    groups.PushBack(NGIN::PolyJson::MaterializeTypeGroup<Events>().value());
    return std::make_shared<PolyJson::PolymorphicSerializer>(std::move(groups));
  }
} // namespace CacheDemo

TEST_CASE("DefaultConfigurationIsComputedOnce", "[polyjson][Cache]")
{
  using namespace NGIN::PolyJson;
  auto serializer = CacheDemo::MakeSerializer();
  auto base = GetType<CacheDemo::Event>();

  auto a = serializer->CreateConfig(base);
  auto b = serializer->CreateConfig(base);
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  CHECK(*a == *b);

  auto typed = TypedSerializer<CacheDemo::Event>::Create(serializer);
  REQUIRE(typed.has_value());
  auto c = (*typed)->CreateConfig();
  auto d = (*typed)->CreateConfig();
  REQUIRE(c.has_value());
  CHECK(*c == *d);
}

TEST_CASE("SameOptionsObjectYieldsSameConfiguration", "[polyjson][Cache]")
{
  using namespace NGIN::PolyJson;
  auto serializer = CacheDemo::MakeSerializer();
  auto base = GetType<CacheDemo::Event>();
  auto options = MakeOptions({.indent = 2});

  auto a = serializer->CreateConfig(base, options);
  auto b = serializer->CreateConfig(base, options);
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  CHECK(*a == *b);
  CHECK((*a)->Options().indent == 2);
}

TEST_CASE("EqualButDistinctOptionsYieldDistinctConfigurations", "[polyjson][Cache]")
{
  using namespace NGIN::PolyJson;
  auto serializer = CacheDemo::MakeSerializer();
  auto base = GetType<CacheDemo::Event>();

  auto first = MakeOptions({.indent = 2});
  auto second = MakeOptions({.indent = 2});
  auto compact = MakeOptions({.indent = -1});

  auto a = serializer->CreateConfig(base, first);
  auto b = serializer->CreateConfig(base, second);
  auto c = serializer->CreateConfig(base, compact);
  auto d = serializer->CreateConfig(base);
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  REQUIRE(c.has_value());
  REQUIRE(d.has_value());
  CHECK(*a != *b);
  CHECK(*a != *c);
  CHECK(*a != *d);
  CHECK((*a)->Options().indent == 2);
  CHECK((*c)->Options().indent == -1);
}

TEST_CASE("CacheKeepsOptionsAlive", "[polyjson][Cache]")
{
  using namespace NGIN::PolyJson;
  ConfigurationCache cache;
  auto base = GetType<CacheDemo::Event>();
  NGIN::PolyJson::GroupList groups;
  groups.PushBack(MaterializeTypeGroup<CacheDemo::Events>().value());

  auto options = MakeOptions();
  std::weak_ptr<const SerializerOptions> watch = options;
  const SerializerOptions *key = options.get();
  auto config = cache.GetOrCompute(base.GetTypeId(), options, [&] { return CombineResolvers(base, groups, options.get()); });
  REQUIRE(config.has_value());

  options.reset();
  CHECK_FALSE(watch.expired());
  CHECK(cache.Find(base.GetTypeId(), key) == *config);
  CHECK(cache.Size() == 1);
}

TEST_CASE("FailedComputationIsNotPublished", "[polyjson][Cache]")
{
  using namespace NGIN::PolyJson;
  ConfigurationCache cache;
  auto options = MakeOptions();
  int calls = 0;
  auto compute = [&]() -> std::expected<SharedConfig, Error> {
    ++calls;
    return std::unexpected(Error{ErrorCode::Configuration, "boom"});
  };

  auto a = cache.GetOrCompute(42, options, compute);
  auto b = cache.GetOrCompute(42, options, compute);
  REQUIRE_FALSE(a.has_value());
  REQUIRE_FALSE(b.has_value());
  CHECK(a.error().code == ErrorCode::Configuration);
  CHECK(calls == 2);
  CHECK(cache.Size() == 0);
}

TEST_CASE("ConcurrentCallersReceiveThePublishedConfiguration", "[polyjson][Cache]")
{
  using namespace NGIN::PolyJson;
  auto serializer = CacheDemo::MakeSerializer();
  auto base = GetType<CacheDemo::Event>();
  auto options = MakeOptions({.writeNullMembers = false});

  constexpr int kThreads = 8;
  std::vector<SharedConfig> results(kThreads);
  std::atomic<int> failures{0};
  {
    std::vector<std::jthread> threads;
    for (int i = 0; i < kThreads; ++i)
    {
      threads.emplace_back([&, i] {
        auto config = serializer->CreateConfig(base, options);
        if (!config)
        {
          ++failures;
          return;
        }
        results[i] = *config;
      });
    }
  }

  CHECK(failures.load() == 0);
  for (int i = 1; i < kThreads; ++i)
    CHECK(results[i] == results[0]);
  REQUIRE(results[0] != nullptr);
  CHECK_FALSE(results[0]->Options().writeNullMembers);
}
