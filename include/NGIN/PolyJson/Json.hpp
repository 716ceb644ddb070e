// Json.hpp
// Document model used by the codecs
#pragma once

#include <nlohmann/json.hpp>

#include <string_view>

namespace NGIN::PolyJson
{
  // Insertion-ordered so members serialize in declaration order.
  using Json = nlohmann::ordered_json;

  // Reserved member carrying the variant discriminator of a polymorphic object.
  inline constexpr std::string_view kDiscriminatorProperty = "$type";

} // namespace NGIN::PolyJson
