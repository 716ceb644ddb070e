// Engine.hpp
// Root-level encode/decode against a configuration, plus text conversion
#pragma once

#include <NGIN/PolyJson/Codec.hpp>
#include <NGIN/PolyJson/Config.hpp>
#include <NGIN/PolyJson/Object.hpp>

#include <expected>
#include <string>
#include <string_view>

namespace NGIN::PolyJson::detail
{

  // Encode `value` through the configuration's base type. `value.type` must be
  // assignable to the base.
  [[nodiscard]] NGIN_POLYJSON_API std::expected<Json, Error> EncodeRoot(const SerializerConfig &config, const ObjectView &value);

  // A JSON null decodes to an empty DecodedObject. The result is viewed as the base type.
  [[nodiscard]] NGIN_POLYJSON_API std::expected<DecodedObject, Error> DecodeRoot(const SerializerConfig &config, const Json &document);

  [[nodiscard]] NGIN_POLYJSON_API std::expected<Json, Error> ParseDocument(std::string_view text);
  // Appends to `out`, indented per the configuration's options.
  [[nodiscard]] NGIN_POLYJSON_API std::expected<void, Error> DumpDocument(const SerializerConfig &config, const Json &document, std::string &out);

} // namespace NGIN::PolyJson::detail
