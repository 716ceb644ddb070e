// ErrorTests.cpp - decode/encode failures, their codes and JSON paths

#include <catch2/catch_test_macros.hpp>

#include <NGIN/PolyJson/PolyJson.hpp>

#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace ErrorDemo
{
  struct ITest
  {
    virtual ~ITest() = default;
  };

  struct Class1 final : ITest
  {
    friend void PolyJsonReflect(NGIN::PolyJson::Tag<Class1>, NGIN::PolyJson::TypeBuilder<Class1> &b)
    {
      b.base<ITest>();
      b.type_id("class1");
    }
  };

  struct UnregisteredClass final : ITest
  {
  };

  struct RequiredClass final : ITest
  {
    std::string Name;

    friend void PolyJsonReflect(NGIN::PolyJson::Tag<RequiredClass>, NGIN::PolyJson::TypeBuilder<RequiredClass> &b)
    {
      b.base<ITest>();
      b.type_id("required");
      b.required_field<&RequiredClass::Name>();
    }
  };

  struct Counter final : ITest
  {
    std::int8_t Small{};
    std::uint32_t Count{};
    std::vector<std::unique_ptr<ITest>> Items;
    std::unique_ptr<ITest> Next;

    friend void PolyJsonReflect(NGIN::PolyJson::Tag<Counter>, NGIN::PolyJson::TypeBuilder<Counter> &b)
    {
      b.base<ITest>();
      b.type_id("counter");
      b.field<&Counter::Small>();
      b.field<&Counter::Count>();
      b.field<&Counter::Items>();
      b.field<&Counter::Next>();
    }
  };

  struct Measure final : ITest
  {
    double Ratio{};
    float Scale{};

    friend void PolyJsonReflect(NGIN::PolyJson::Tag<Measure>, NGIN::PolyJson::TypeBuilder<Measure> &b)
    {
      b.base<ITest>();
      b.type_id("measure");
      b.field<&Measure::Ratio>();
      b.field<&Measure::Scale>();
    }
  };

  // Registered, but unrelated to ITest.
  struct Stranger
  {
    int Value{};

    friend void PolyJsonReflect(NGIN::PolyJson::Tag<Stranger>, NGIN::PolyJson::TypeBuilder<Stranger> &b) { b.field<&Stranger::Value>(); }
  };

  struct Errors
  {
    static void Declare(NGIN::PolyJson::TypeGroupBuilder &g) { g.RegisterTypes<Class1, RequiredClass, Counter, Measure>(); }
  };
} // namespace ErrorDemo

namespace
{
  std::shared_ptr<PolyJson::TypedSerializer<ErrorDemo::ITest>> MakeTyped()
  {
    auto host = NGIN::PolyJson::SerializerServices{}.AddPolymorphicSerializer().AddTypeGroup<ErrorDemo::Errors>().Build();
    REQUIRE(host.has_value());
    auto serializer = host->GetSerializer<ErrorDemo::ITest>();
    REQUIRE(serializer.has_value());
    return *serializer;
  }
} // namespace

TEST_CASE("UnknownDiscriminatorIsAFormatError", "[polyjson][Errors]")
{
  using namespace NGIN::PolyJson;
  auto serializer = MakeTyped();

  auto result = serializer->Decode(R"({"$type":"unknown"})");
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == ErrorCode::Format);
  CHECK(result.error().IsFormatError());
  CHECK(result.error().detail == R"("unknown")");
  CHECK(result.error().path == "$");
}

TEST_CASE("MissingDiscriminatorIsAFormatError", "[polyjson][Errors]")
{
  using namespace NGIN::PolyJson;
  auto serializer = MakeTyped();

  auto result = serializer->Decode(R"({"Name":"x"})");
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == ErrorCode::Format);
  CHECK(result.error().message == "missing discriminator");
}

TEST_CASE("UnregisteredRuntimeTypeCannotBeEncoded", "[polyjson][Errors]")
{
  using namespace NGIN::PolyJson;
  auto serializer = MakeTyped();

  auto result = serializer->Encode(ErrorDemo::UnregisteredClass{});
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == ErrorCode::UnsupportedType);
  CHECK_FALSE(result.error().IsFormatError());
}

TEST_CASE("MissingRequiredMemberIsReported", "[polyjson][Errors]")
{
  using namespace NGIN::PolyJson;
  auto serializer = MakeTyped();

  auto result = serializer->Decode(R"({"$type":"required"})");
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == ErrorCode::MissingMember);
  CHECK(result.error().IsFormatError());
  CHECK(result.error().path == "$.Name");

  auto ok = serializer->Decode(R"({"$type":"required","Name":"present"})");
  REQUIRE(ok.has_value());
  auto *value = dynamic_cast<ErrorDemo::RequiredClass *>(ok->get());
  REQUIRE(value != nullptr);
  CHECK(value->Name == "present");
}

TEST_CASE("MemberTypeMismatchesCarryTheirPath", "[polyjson][Errors]")
{
  using namespace NGIN::PolyJson;
  auto serializer = MakeTyped();

  auto wrongKind = serializer->Decode(R"({"$type":"required","Name":42})");
  REQUIRE_FALSE(wrongKind.has_value());
  CHECK(wrongKind.error().code == ErrorCode::Format);
  CHECK(wrongKind.error().message == "expected string");
  CHECK(wrongKind.error().path == "$.Name");

  auto nested = serializer->Decode(R"({"$type":"counter","Items":[{"$type":"class1"},{"$type":"counter","Count":"many"}]})");
  REQUIRE_FALSE(nested.has_value());
  CHECK(nested.error().code == ErrorCode::Format);
  CHECK(nested.error().path == "$.Items[1].Count");

  auto notAnArray = serializer->Decode(R"({"$type":"counter","Items":{}})");
  REQUIRE_FALSE(notAnArray.has_value());
  CHECK(notAnArray.error().message == "expected array");
}

TEST_CASE("IntegersAreRangeChecked", "[polyjson][Errors]")
{
  using namespace NGIN::PolyJson;
  auto serializer = MakeTyped();

  auto tooBig = serializer->Decode(R"({"$type":"counter","Small":300})");
  REQUIRE_FALSE(tooBig.has_value());
  CHECK(tooBig.error().message == "integer out of range");
  CHECK(tooBig.error().path == "$.Small");

  auto negative = serializer->Decode(R"({"$type":"counter","Count":-1})");
  REQUIRE_FALSE(negative.has_value());
  CHECK(negative.error().message == "integer out of range");

  auto fractional = serializer->Decode(R"({"$type":"counter","Count":1.5})");
  REQUIRE_FALSE(fractional.has_value());
  CHECK(fractional.error().message == "expected integer");

  auto fits = serializer->Decode(R"({"$type":"counter","Small":-128,"Count":4294967295})");
  REQUIRE(fits.has_value());
  auto *counter = dynamic_cast<ErrorDemo::Counter *>(fits->get());
  REQUIRE(counter != nullptr);
  CHECK(counter->Small == -128);
  CHECK(counter->Count == 4294967295u);
}

TEST_CASE("MalformedDocumentsAreFormatErrors", "[polyjson][Errors]")
{
  using namespace NGIN::PolyJson;
  auto serializer = MakeTyped();

  auto truncated = serializer->Decode(R"({"$type":"class1")");
  REQUIRE_FALSE(truncated.has_value());
  CHECK(truncated.error().code == ErrorCode::Format);
  CHECK(truncated.error().message == "malformed JSON");

  auto array = serializer->Decode("[1,2]");
  REQUIRE_FALSE(array.has_value());
  CHECK(array.error().code == ErrorCode::Format);
  CHECK(array.error().message == "expected object");

  auto trailing = serializer->Decode(R"({"$type":"class1"} {})");
  REQUIRE_FALSE(trailing.has_value());
  CHECK(trailing.error().code == ErrorCode::Format);

  // Valid syntax, but the number does not fit a double.
  auto overflow = serializer->Decode(R"({"$type":"counter","Count":1e400})");
  REQUIRE_FALSE(overflow.has_value());
  CHECK(overflow.error().code == ErrorCode::Format);
  CHECK(overflow.error().message == "malformed JSON");

  auto negativeOverflow = serializer->Decode(R"({"$type":"measure","Ratio":-1e400})");
  REQUIRE_FALSE(negativeOverflow.has_value());
  CHECK(negativeOverflow.error().code == ErrorCode::Format);
}

TEST_CASE("NonFiniteFloatsAreNotEncoded", "[polyjson][Errors]")
{
  using namespace NGIN::PolyJson;
  auto serializer = MakeTyped();

  ErrorDemo::Measure nan;
  nan.Ratio = std::numeric_limits<double>::quiet_NaN();
  auto first = serializer->Encode(nan);
  REQUIRE_FALSE(first.has_value());
  CHECK(first.error().code == ErrorCode::UnsupportedType);
  CHECK(first.error().message == "non-finite number");
  CHECK(first.error().path == "$.Ratio");

  ErrorDemo::Measure inf;
  inf.Scale = -std::numeric_limits<float>::infinity();
  auto second = serializer->Encode(inf);
  REQUIRE_FALSE(second.has_value());
  CHECK(second.error().message == "non-finite number");
  CHECK(second.error().path == "$.Scale");

  ErrorDemo::Measure finite;
  finite.Ratio = 0.25;
  finite.Scale = 2.0f;
  CHECK(serializer->Encode(finite).value() == R"({"$type":"measure","Ratio":0.25,"Scale":2.0})");
}

TEST_CASE("FloatsAreRangeChecked", "[polyjson][Errors]")
{
  using namespace NGIN::PolyJson;
  auto serializer = MakeTyped();

  auto tooBig = serializer->Decode(R"({"$type":"measure","Scale":1e300})");
  REQUIRE_FALSE(tooBig.has_value());
  CHECK(tooBig.error().code == ErrorCode::Format);
  CHECK(tooBig.error().message == "number out of range");
  CHECK(tooBig.error().path == "$.Scale");

  auto tooSmall = serializer->Decode(R"({"$type":"measure","Scale":-1e39})");
  REQUIRE_FALSE(tooSmall.has_value());
  CHECK(tooSmall.error().message == "number out of range");

  auto fits = serializer->Decode(R"({"$type":"measure","Ratio":1e300,"Scale":-3.5})");
  REQUIRE(fits.has_value());
  auto *measure = dynamic_cast<ErrorDemo::Measure *>(fits->get());
  REQUIRE(measure != nullptr);
  CHECK(measure->Ratio == 1e300);
  CHECK(measure->Scale == -3.5f);
}

TEST_CASE("UnknownMembersAreSkippedUnlessDisallowed", "[polyjson][Errors]")
{
  using namespace NGIN::PolyJson;
  auto serializer = MakeTyped();
  const std::string json = R"({"$type":"class1","Extra":{"deep":[1,2,3]}})";

  CHECK(serializer->Decode(json).has_value());

  auto strict = MakeOptions({.allowUnknownMembers = false});
  auto result = serializer->Decode(json, strict);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == ErrorCode::Format);
  CHECK(result.error().message == "unknown member");
  CHECK(result.error().path == "$.Extra");
}

TEST_CASE("NestingBeyondMaxDepthFails", "[polyjson][Errors]")
{
  using namespace NGIN::PolyJson;
  auto serializer = MakeTyped();
  auto shallow = MakeOptions({.maxDepth = 2});

  const std::string twoLevels = R"({"$type":"counter","Next":{"$type":"class1"}})";
  const std::string threeLevels = R"({"$type":"counter","Next":{"$type":"counter","Next":{"$type":"class1"}}})";

  CHECK(serializer->Decode(twoLevels, shallow).has_value());
  auto deep = serializer->Decode(threeLevels, shallow);
  REQUIRE_FALSE(deep.has_value());
  CHECK(deep.error().code == ErrorCode::Format);
  CHECK(deep.error().message == "maximum depth exceeded");
  CHECK(deep.error().path == "$.Next.Next");

  ErrorDemo::Counter value;
  auto middle = std::make_unique<ErrorDemo::Counter>();
  middle->Next = std::make_unique<ErrorDemo::Class1>();
  value.Next = std::move(middle);
  auto encoded = serializer->Encode(value, shallow);
  REQUIRE_FALSE(encoded.has_value());
  CHECK(encoded.error().message == "maximum depth exceeded");
  CHECK(serializer->Encode(value).has_value());
}

TEST_CASE("ValuesOutsideTheBaseAreRejected", "[polyjson][Errors]")
{
  using namespace NGIN::PolyJson;
  auto host = SerializerServices{}.AddPolymorphicSerializer().AddTypeGroup<ErrorDemo::Errors>().Build();
  REQUIRE(host.has_value());
  auto serializer = host->GetSerializer().value();

  auto unregistered = serializer->Encode(ErrorDemo::UnregisteredClass{}, GetType<ErrorDemo::ITest>());
  REQUIRE_FALSE(unregistered.has_value());
  CHECK(unregistered.error().code == ErrorCode::UnsupportedType);

  (void)GetType<ErrorDemo::Stranger>();
  auto stranger = serializer->Encode(ErrorDemo::Stranger{}, GetType<ErrorDemo::ITest>());
  REQUIRE_FALSE(stranger.has_value());
  CHECK(stranger.error().code == ErrorCode::InvalidArgument);

  auto invalidBase = serializer->Decode(R"({"$type":"class1"})", Type{});
  REQUIRE_FALSE(invalidBase.has_value());
  CHECK(invalidBase.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("ErrorsRenderReadably", "[polyjson][Errors]")
{
  using namespace NGIN::PolyJson;
  auto serializer = MakeTyped();

  auto result = serializer->Decode(R"({"$type":"counter","Next":{"$type":"class9"}})");
  REQUIRE_FALSE(result.has_value());
  CHECK(ToString(result.error()) == R"(Format: unknown discriminator ("class9") at $.Next)");
}
