// Options.hpp
// Serializer options. Configurations are cached per options object identity.
#pragma once

#include <NGIN/Primitives.hpp>

#include <memory>

namespace NGIN::PolyJson
{

  struct SerializerOptions
  {
    // Spaces per nesting level; negative writes compact output.
    int indent{-1};
    // Emit members whose value encodes as null.
    bool writeNullMembers{true};
    // Skip members the target type does not declare instead of failing.
    bool allowUnknownMembers{true};
    // Maximum object nesting accepted on encode and decode.
    NGIN::UInt32 maxDepth{64};
  };

  using SharedOptions = std::shared_ptr<const SerializerOptions>;

  [[nodiscard]] inline SharedOptions MakeOptions(const SerializerOptions &options = {})
  {
    return std::make_shared<const SerializerOptions>(options);
  }

} // namespace NGIN::PolyJson
