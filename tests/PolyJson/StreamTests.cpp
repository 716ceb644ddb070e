// StreamTests.cpp - stream encode/decode, async variants, cancellation and sequences

#include <catch2/catch_test_macros.hpp>

#include <NGIN/PolyJson/PolyJson.hpp>

#include <memory>
#include <sstream>
#include <stop_token>
#include <string>
#include <vector>

namespace StreamDemo
{
  struct Record
  {
    virtual ~Record() = default;
  };

  struct Entry final : Record
  {
    std::string Text;
    std::vector<std::string> Lines;

    friend void PolyJsonReflect(NGIN::PolyJson::Tag<Entry>, NGIN::PolyJson::TypeBuilder<Entry> &b)
    {
      b.base<Record>();
      b.type_id("entry");
      b.field<&Entry::Text>();
      b.field<&Entry::Lines>();
    }
  };

  struct Marker final : Record
  {
    friend void PolyJsonReflect(NGIN::PolyJson::Tag<Marker>, NGIN::PolyJson::TypeBuilder<Marker> &b)
    {
      b.base<Record>();
      b.type_id("marker");
    }
  };

  struct Journal
  {
    static void Declare(NGIN::PolyJson::TypeGroupBuilder &g) { g.RegisterTypes<Entry, Marker>(); }
  };

  std::shared_ptr<PolyJson::TypedSerializer<Record>> MakeTyped()
  {
    auto host = NGIN::PolyJson::SerializerServices{}.AddPolymorphicSerializer().AddTypeGroup<Journal>().Build();
    REQUIRE(host.has_value());
    return host->GetSerializer<Record>().value();
  }
} // namespace StreamDemo

TEST_CASE("EncodeToStreamWritesTheDocument", "[polyjson][Stream]")
{
  auto serializer = StreamDemo::MakeTyped();
  StreamDemo::Entry entry;
  entry.Text = "hello";

  std::ostringstream out;
  REQUIRE(serializer->EncodeTo(entry, out).has_value());
  CHECK(out.str() == R"({"$type":"entry","Text":"hello","Lines":[]})");
}

TEST_CASE("AsyncRoundTripThroughStreams", "[polyjson][Stream]")
{
  auto serializer = StreamDemo::MakeTyped();
  StreamDemo::Entry entry;
  entry.Text = "async";
  entry.Lines = {"a", "b"};

  std::stringstream buffer;
  auto written = serializer->EncodeAsync(entry, buffer).get();
  REQUIRE(written.has_value());
  CHECK(buffer.str() == R"({"$type":"entry","Text":"async","Lines":["a","b"]})");

  auto decoded = serializer->DecodeAsync(buffer).get();
  REQUIRE(decoded.has_value());
  auto *back = dynamic_cast<StreamDemo::Entry *>(decoded->get());
  REQUIRE(back != nullptr);
  CHECK(back->Text == "async");
  CHECK(back->Lines == std::vector<std::string>{"a", "b"});
}

TEST_CASE("PayloadsLargerThanOneChunkSurvive", "[polyjson][Stream]")
{
  auto serializer = StreamDemo::MakeTyped();
  StreamDemo::Entry entry;
  for (int i = 0; i < 2000; ++i)
    entry.Lines.push_back("line-" + std::to_string(i));

  std::stringstream buffer;
  REQUIRE(serializer->EncodeAsync(entry, buffer).get().has_value());
  CHECK(buffer.str().size() > NGIN::PolyJson::detail::kStreamChunkSize * 2);

  auto decoded = serializer->DecodeAsync(buffer).get();
  REQUIRE(decoded.has_value());
  auto *back = dynamic_cast<StreamDemo::Entry *>(decoded->get());
  REQUIRE(back != nullptr);
  REQUIRE(back->Lines.size() == 2000);
  CHECK(back->Lines.front() == "line-0");
  CHECK(back->Lines.back() == "line-1999");
}

TEST_CASE("StoppedTokensCancelStreamOperations", "[polyjson][Stream]")
{
  using namespace NGIN::PolyJson;
  auto serializer = StreamDemo::MakeTyped();
  std::stop_source source;
  source.request_stop();

  std::stringstream out;
  auto written = serializer->EncodeAsync(StreamDemo::Marker{}, out, nullptr, source.get_token()).get();
  REQUIRE_FALSE(written.has_value());
  CHECK(written.error().code == ErrorCode::Cancelled);
  CHECK(out.str().empty());

  std::istringstream in{R"({"$type":"marker"})"};
  auto read = serializer->DecodeAsync(in, nullptr, source.get_token()).get();
  REQUIRE_FALSE(read.has_value());
  CHECK(read.error().code == ErrorCode::Cancelled);

  std::istringstream array{R"([{"$type":"marker"}])"};
  auto sequence = serializer->DecodeSequence(array, nullptr, source.get_token());
  REQUIRE(sequence.has_value());
  auto first = sequence->Next();
  REQUIRE(first.has_value());
  REQUIRE_FALSE(first->has_value());
  CHECK(first->error().code == ErrorCode::Cancelled);
  CHECK_FALSE(sequence->Next().has_value());
}

TEST_CASE("DecodeSequenceYieldsEachElement", "[polyjson][Stream]")
{
  auto serializer = StreamDemo::MakeTyped();
  std::istringstream in{R"( [ {"$type":"entry","Text":"one"}, {"$type":"marker"} ,{"$type":"entry","Text":"]two["}] trailing)"};

  auto sequence = serializer->DecodeSequence(in);
  REQUIRE(sequence.has_value());

  std::vector<std::unique_ptr<StreamDemo::Record>> items;
  for (auto &item : *sequence)
  {
    REQUIRE(item.has_value());
    items.push_back(std::move(*item));
  }

  REQUIRE(items.size() == 3);
  auto *one = dynamic_cast<StreamDemo::Entry *>(items[0].get());
  REQUIRE(one != nullptr);
  CHECK(one->Text == "one");
  CHECK(dynamic_cast<StreamDemo::Marker *>(items[1].get()) != nullptr);
  auto *two = dynamic_cast<StreamDemo::Entry *>(items[2].get());
  REQUIRE(two != nullptr);
  CHECK(two->Text == "]two[");

  // Nothing after the closing bracket was consumed.
  std::string rest;
  in >> rest;
  CHECK(rest == "trailing");
}

TEST_CASE("DecodeSequenceOfAnEmptyArray", "[polyjson][Stream]")
{
  auto serializer = StreamDemo::MakeTyped();
  std::istringstream in{"[ ]"};
  auto sequence = serializer->DecodeSequence(in);
  REQUIRE(sequence.has_value());
  CHECK_FALSE(sequence->Next().has_value());
}

TEST_CASE("DecodeSequenceRejectsNonArrays", "[polyjson][Stream]")
{
  using namespace NGIN::PolyJson;
  auto serializer = StreamDemo::MakeTyped();
  std::istringstream in{R"({"$type":"marker"})"};
  auto sequence = serializer->DecodeSequence(in);
  REQUIRE(sequence.has_value());

  auto first = sequence->Next();
  REQUIRE(first.has_value());
  REQUIRE_FALSE(first->has_value());
  CHECK(first->error().code == ErrorCode::Format);
  CHECK_FALSE(sequence->Next().has_value());
}

TEST_CASE("DecodeSequenceStopsAtTheFirstBadElement", "[polyjson][Stream]")
{
  using namespace NGIN::PolyJson;
  auto serializer = StreamDemo::MakeTyped();
  std::istringstream in{R"([{"$type":"marker"},{"$type":"nope"},{"$type":"marker"}])"};
  auto sequence = serializer->DecodeSequence(in);
  REQUIRE(sequence.has_value());

  int ok = 0;
  int failed = 0;
  for (auto &item : *sequence)
  {
    if (item)
      ++ok;
    else
    {
      ++failed;
      CHECK(item.error().message == "unknown discriminator");
    }
  }
  CHECK(ok == 1);
  CHECK(failed == 1);
}

TEST_CASE("ArrayElementReaderSplitsTopLevelElements", "[polyjson][Stream]")
{
  using NGIN::PolyJson::Json;
  using NGIN::PolyJson::detail::ArrayElementReader;
  std::istringstream in{R"([ "a]b" , {"x":"\"}","y":[1,{}]}, 12 ,true,null,[[1,[2]],[]],-0.5,7] tail)"};
  ArrayElementReader reader{in};

  std::vector<Json> elements;
  for (;;)
  {
    auto next = reader.Next();
    REQUIRE(next.has_value());
    if (!*next)
      break;
    elements.push_back(std::move(**next));
  }

  CHECK(reader.Done());
  REQUIRE(elements.size() == 8);
  CHECK(elements[0] == "a]b");
  CHECK(elements[1].dump() == R"({"x":"\"}","y":[1,{}]})");
  CHECK(elements[2] == 12);
  CHECK(elements[3] == true);
  CHECK(elements[4].is_null());
  CHECK(elements[5].dump() == "[[1,[2]],[]]");
  CHECK(elements[6] == -0.5);
  CHECK(elements[7] == 7);

  auto after = reader.Next();
  REQUIRE(after.has_value());
  CHECK_FALSE(after->has_value());

  std::string rest;
  in >> rest;
  CHECK(rest == "tail");
}

TEST_CASE("ArrayElementReaderReportsTruncation", "[polyjson][Stream]")
{
  using namespace NGIN::PolyJson;
  std::istringstream unterminated{R"([{"a":1},{"b":)"};
  detail::ArrayElementReader reader{unterminated};

  auto first = reader.Next();
  REQUIRE(first.has_value());
  REQUIRE(first->has_value());
  CHECK((**first).dump() == R"({"a":1})");

  auto second = reader.Next();
  REQUIRE_FALSE(second.has_value());
  CHECK(second.error().code == ErrorCode::Format);

  std::istringstream missingComma{R"([1 2])"};
  detail::ArrayElementReader strict{missingComma};
  REQUIRE(strict.Next().has_value());
  auto bad = strict.Next();
  REQUIRE_FALSE(bad.has_value());
  CHECK(bad.error().code == ErrorCode::Format);

  std::istringstream unclosed{"[1"};
  detail::ArrayElementReader open{unclosed};
  REQUIRE(open.Next().has_value());
  auto end = open.Next();
  REQUIRE_FALSE(end.has_value());
  CHECK(end.error().message == "unexpected end of input");
}

TEST_CASE("DecodeSequenceReportsNumberOverflow", "[polyjson][Stream]")
{
  using namespace NGIN::PolyJson;
  auto serializer = StreamDemo::MakeTyped();
  std::istringstream in{R"([{"$type":"marker"},{"$type":"entry","Text":1e400},{"$type":"marker"}])"};
  auto sequence = serializer->DecodeSequence(in);
  REQUIRE(sequence.has_value());

  auto first = sequence->Next();
  REQUIRE(first.has_value());
  CHECK(first->has_value());

  auto second = sequence->Next();
  REQUIRE(second.has_value());
  REQUIRE_FALSE(second->has_value());
  CHECK(second->error().code == ErrorCode::Format);
  CHECK(second->error().message == "malformed JSON");

  CHECK_FALSE(sequence->Next().has_value());
}
