#include <NGIN/PolyJson/PolyJson.hpp>

#include <iostream>
#include <cstdint>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

namespace Events {
  struct Event
  {
    virtual ~Event() = default;
    std::int64_t Timestamp{};

    friend void PolyJsonReflect(NGIN::PolyJson::Tag<Event>, NGIN::PolyJson::TypeBuilder<Event> &b)
    {
      b.field<&Event::Timestamp>();
    }
  };

  struct Login final : Event
  {
    std::string User;

    friend void PolyJsonReflect(NGIN::PolyJson::Tag<Login>, NGIN::PolyJson::TypeBuilder<Login> &b)
    {
      b.base<Event>();
      b.type_id(1);
      b.required_field<&Login::User>();
    }
  };

  struct Logout final : Event
  {
    std::string User;
    std::optional<std::string> Reason;

    friend void PolyJsonReflect(NGIN::PolyJson::Tag<Logout>, NGIN::PolyJson::TypeBuilder<Logout> &b)
    {
      b.base<Event>();
      b.type_id(2);
      b.required_field<&Logout::User>();
      b.field<&Logout::Reason>();
    }
  };

  struct Sessions
  {
    static void Declare(NGIN::PolyJson::TypeGroupBuilder &g) { g.RegisterType<Login>(); }
  };

  // Groups may also be declared by plain functions and named at runtime.
  void DeclarePlugin(NGIN::PolyJson::TypeGroupBuilder &g) { g.RegisterType<Logout>(); }
}

int main() {
  auto host = NGIN::PolyJson::SerializerServices{}
                  .AddPolymorphicSerializer()
                  .AddTypeGroup<Events::Sessions>()
                  .AddTypeGroup(NGIN::PolyJson::TypeGroupDescriptor{"plugin.sessions", &Events::DeclarePlugin})
                  .Build();
  if (!host) {
    std::cerr << NGIN::PolyJson::ToString(host.error()) << "\n";
    return 1;
  }

  std::cout << "Groups:\n";
  for (const auto &group : host->Groups())
    std::cout << "  " << group->Name() << " (" << group->DeclaredTypeCount() << " declared, "
              << group->KnownTypeCount() << " known)\n";

  // Non-generic facade: the base type is picked per call.
  auto serializer = host->GetSerializer();
  if (!serializer) {
    std::cerr << NGIN::PolyJson::ToString(serializer.error()) << "\n";
    return 1;
  }
  Events::Login login;
  login.Timestamp = 1700000000;
  login.User = "ada";
  auto text = (*serializer)->Encode(login, NGIN::PolyJson::GetType<Events::Event>());
  if (!text) {
    std::cerr << NGIN::PolyJson::ToString(text.error()) << "\n";
    return 1;
  }
  std::cout << "Encoded: " << *text << "\n";

  // Typed facade: stream a JSON array one element at a time.
  auto events = host->GetSerializer<Events::Event>();
  if (!events) {
    std::cerr << NGIN::PolyJson::ToString(events.error()) << "\n";
    return 1;
  }
  std::istringstream feed{R"([
    {"$type":1,"User":"ada","Timestamp":10},
    {"$type":2,"User":"ada","Reason":"idle","Timestamp":70},
    {"$type":3,"Timestamp":80}
  ])"};
  auto sequence = (*events)->DecodeSequence(feed);
  if (!sequence) {
    std::cerr << NGIN::PolyJson::ToString(sequence.error()) << "\n";
    return 1;
  }
  for (auto &item : *sequence) {
    if (!item) {
      std::cout << "Stopped: " << NGIN::PolyJson::ToString(item.error()) << "\n";
      break;
    }
    const Events::Event &event = **item;
    if (auto *in = dynamic_cast<const Events::Login *>(&event))
      std::cout << event.Timestamp << " login " << in->User << "\n";
    else if (auto *out = dynamic_cast<const Events::Logout *>(&event))
      std::cout << event.Timestamp << " logout " << out->User << " (" << out->Reason.value_or("none") << ")\n";
  }

  // Asynchronous write to any ostream.
  std::ostringstream sink;
  Events::Logout logout;
  logout.User = "ada";
  auto written = (*events)->EncodeAsync(logout, sink, NGIN::PolyJson::MakeOptions({.writeNullMembers = false})).get();
  if (!written) {
    std::cerr << NGIN::PolyJson::ToString(written.error()) << "\n";
    return 1;
  }
  std::cout << "Async: " << sink.str() << "\n";
  return 0;
}
