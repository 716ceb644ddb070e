#include <NGIN/PolyJson/PolyJson.hpp>
#include <NGIN/Meta/TypeName.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace Demo {
  struct Point
  {
    double x{};
    double y{};

    friend void PolyJsonReflect(NGIN::PolyJson::Tag<Point>, NGIN::PolyJson::TypeBuilder<Point> &b)
    {
      b.field<&Point::x>();
      b.field<&Point::y>();
    }
  };

  struct Shape
  {
    virtual ~Shape() = default;
    std::string Name;

    friend void PolyJsonReflect(NGIN::PolyJson::Tag<Shape>, NGIN::PolyJson::TypeBuilder<Shape> &b) { b.field<&Shape::Name>(); }
  };

  struct Circle final : Shape
  {
    Point Center;
    double Radius{};

    friend void PolyJsonReflect(NGIN::PolyJson::Tag<Circle>, NGIN::PolyJson::TypeBuilder<Circle> &b)
    {
      b.base<Shape>();
      b.type_id("circle");
      b.field<&Circle::Center>();
      b.field<&Circle::Radius>();
    }
  };

  struct Group final : Shape
  {
    std::vector<std::unique_ptr<Shape>> Children;

    friend void PolyJsonReflect(NGIN::PolyJson::Tag<Group>, NGIN::PolyJson::TypeBuilder<Group> &b)
    {
      b.base<Shape>();
      b.type_id("group");
      b.field<&Group::Children>();
    }
  };

  struct ShapeTypes
  {
    static void Declare(NGIN::PolyJson::TypeGroupBuilder &g) { g.RegisterTypes<Circle, Group>(); }
  };
}

int main() {
  std::cout << "Library: " << NGIN::PolyJson::LibraryName() << "\n";
  std::cout << "Base type: " << NGIN::Meta::TypeName<Demo::Shape>::qualifiedName << "\n";

  auto host = NGIN::PolyJson::SerializerServices{}
                  .AddPolymorphicSerializer()
                  .AddTypeGroup<Demo::ShapeTypes>()
                  .Build();
  if (!host) {
    std::cerr << NGIN::PolyJson::ToString(host.error()) << "\n";
    return 1;
  }

  auto serializer = host->GetSerializer<Demo::Shape>();
  if (!serializer) {
    std::cerr << NGIN::PolyJson::ToString(serializer.error()) << "\n";
    return 1;
  }

  Demo::Group scene;
  scene.Name = "scene";
  auto circle = std::make_unique<Demo::Circle>();
  circle->Name = "wheel";
  circle->Center = {1.0, 2.0};
  circle->Radius = 0.5;
  scene.Children.push_back(std::move(circle));

  auto text = (*serializer)->Encode(scene, NGIN::PolyJson::MakeOptions({.indent = 2}));
  if (!text) {
    std::cerr << NGIN::PolyJson::ToString(text.error()) << "\n";
    return 1;
  }
  std::cout << *text << "\n";

  auto back = (*serializer)->Decode(*text);
  if (!back) {
    std::cerr << NGIN::PolyJson::ToString(back.error()) << "\n";
    return 1;
  }
  auto *group = dynamic_cast<Demo::Group *>(back->get());
  std::cout << "Decoded " << (group ? group->Children.size() : 0) << " child shape(s) of \""
            << (*back)->Name << "\"\n";

  auto bad = (*serializer)->Decode(R"({"$type":"square"})");
  if (!bad)
    std::cout << "Rejected: " << NGIN::PolyJson::ToString(bad.error()) << "\n";

  return 0;
}
