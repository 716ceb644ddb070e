// ConfigTests.cpp - combining group providers into a serializer configuration

#include <catch2/catch_test_macros.hpp>

#include <NGIN/PolyJson/PolyJson.hpp>

#include <memory>

namespace ConfigDemo
{
  struct Message
  {
    virtual ~Message() = default;
  };

  struct Payload
  {
    int Size{};

    friend void PolyJsonReflect(NGIN::PolyJson::Tag<Payload>, NGIN::PolyJson::TypeBuilder<Payload> &b) { b.field<&Payload::Size>(); }
  };

  struct Ping final : Message
  {
    Payload Body;

    friend void PolyJsonReflect(NGIN::PolyJson::Tag<Ping>, NGIN::PolyJson::TypeBuilder<Ping> &b)
    {
      b.base<Message>();
      b.type_id("ping");
      b.field<&Ping::Body>();
    }
  };

  struct Pong final : Message
  {
    friend void PolyJsonReflect(NGIN::PolyJson::Tag<Pong>, NGIN::PolyJson::TypeBuilder<Pong> &b)
    {
      b.base<Message>();
      b.type_id("pong");
    }
  };

  struct Clash final : Message
  {
    friend void PolyJsonReflect(NGIN::PolyJson::Tag<Clash>, NGIN::PolyJson::TypeBuilder<Clash> &b)
    {
      b.base<Message>();
      b.type_id("ping");
    }
  };

  struct PingGroup
  {
    static void Declare(NGIN::PolyJson::TypeGroupBuilder &g) { g.RegisterType<Ping>(); }
  };

  struct PongGroup
  {
    static void Declare(NGIN::PolyJson::TypeGroupBuilder &g) { g.RegisterType<Pong>(); }
  };

  struct ClashGroup
  {
    static void Declare(NGIN::PolyJson::TypeGroupBuilder &g) { g.RegisterType<Clash>(); }
  };

  NGIN::PolyJson::GroupList PingPong()
  {
    NGIN::PolyJson::GroupList list;
    list.PushBack(NGIN::PolyJson::MaterializeTypeGroup<PingGroup>().value());
    list.PushBack(NGIN::PolyJson::MaterializeTypeGroup<PongGroup>().value());
    return list;
  }
} // namespace ConfigDemo

TEST_CASE("PolymorphicProviderComesFirstThenGroupsInOrder", "[polyjson][Config]")
{
  using namespace NGIN::PolyJson;
  using namespace ConfigDemo;

  auto groups = PingPong();
  auto config = CombineResolvers(GetType<Message>(), groups, nullptr);
  REQUIRE(config.has_value());

  const auto &c = **config;
  REQUIRE(c.ProviderCount() == 3);
  CHECK(dynamic_cast<const PolymorphicContractProvider *>(c.ProviderAt(0).get()) != nullptr);
  CHECK(c.ProviderAt(1) == groups[0]->DefaultProvider());
  CHECK(c.ProviderAt(2) == groups[1]->DefaultProvider());
  CHECK(c.Resolution().VariantCount() == 2);
  CHECK(c.BaseType() == GetType<Message>());
}

TEST_CASE("ExplicitOptionsGetFreshGroupProviders", "[polyjson][Config]")
{
  using namespace NGIN::PolyJson;
  using namespace ConfigDemo;

  auto groups = PingPong();
  SerializerOptions options{};
  options.indent = 2;
  auto config = CombineResolvers(GetType<Message>(), groups, &options);
  REQUIRE(config.has_value());

  const auto &c = **config;
  REQUIRE(c.ProviderCount() == 3);
  CHECK(c.ProviderAt(1) != groups[0]->DefaultProvider());
  CHECK(c.ProviderAt(2) != groups[1]->DefaultProvider());

  // The configuration keeps its own copy of the options.
  options.indent = 8;
  CHECK(c.Options().indent == 2);
}

TEST_CASE("ContractLookupWalksTheChain", "[polyjson][Config]")
{
  using namespace NGIN::PolyJson;
  using namespace ConfigDemo;

  auto config = CombineResolvers(GetType<Message>(), PingPong(), nullptr);
  REQUIRE(config.has_value());
  const auto &c = **config;

  const auto *base = c.FindContract(GetType<Message>().GetTypeId());
  REQUIRE(base != nullptr);
  CHECK(base->kind == ContractKind::Polymorphic);
  CHECK(base->resolution == &c.Resolution());
  CHECK(c.FindObjectContract(GetType<Message>().GetTypeId()) == nullptr);

  const auto *ping = c.FindContract(GetType<Ping>().GetTypeId());
  REQUIRE(ping != nullptr);
  CHECK(ping->kind == ContractKind::Object);

  // Reached through Ping's member, so the first group describes it.
  const auto *payload = c.FindContract(GetType<Payload>().GetTypeId());
  REQUIRE(payload != nullptr);
  CHECK(payload->kind == ContractKind::Object);

  CHECK(c.FindContract(detail::TypeIdOf<int>()) == nullptr);
}

TEST_CASE("BaseWithoutVariantsStillCombines", "[polyjson][Config]")
{
  using namespace NGIN::PolyJson;
  using namespace ConfigDemo;

  auto config = CombineResolvers(GetType<Payload>(), PingPong(), nullptr);
  REQUIRE(config.has_value());
  CHECK((*config)->Resolution().VariantCount() == 0);
  // A non-polymorphic base falls through to the groups' object contract.
  CHECK((*config)->FindObjectContract(GetType<Payload>().GetTypeId()) != nullptr);
}

TEST_CASE("CombiningPropagatesCompilationErrors", "[polyjson][Config]")
{
  using namespace NGIN::PolyJson;
  using namespace ConfigDemo;

  auto groups = PingPong();
  groups.PushBack(MaterializeTypeGroup<ClashGroup>().value());
  auto config = CombineResolvers(GetType<Message>(), groups, nullptr);
  REQUIRE_FALSE(config.has_value());
  CHECK(config.error().code == ErrorCode::Configuration);
}
