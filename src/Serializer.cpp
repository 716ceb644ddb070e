#include <NGIN/PolyJson/Serializer.hpp>

#include <string>

namespace NGIN::PolyJson
{
  namespace
  {
    Object Box(const SerializerConfig &config, const detail::DecodedObject &decoded) noexcept
    {
      if (!decoded.object)
        return Object{};
      return Object{decoded.object, config.BaseType(), decoded.dynamicType};
    }
  } // namespace

  PolymorphicSerializer::PolymorphicSerializer(GroupList groups) : m_groups(std::move(groups)) {}

  std::expected<SharedConfig, Error> PolymorphicSerializer::CreateConfig(Type base, const SharedOptions &options)
  {
    if (!base.IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "invalid base type"});
    return m_cache.GetOrCompute(base.GetTypeId(), options, [&]() { return CombineResolvers(base, m_groups, options.get()); });
  }

  std::expected<std::string, Error> PolymorphicSerializer::EncodeWith(const SerializerConfig &config, const ObjectView &value)
  {
    auto document = detail::EncodeRoot(config, value);
    if (!document)
      return std::unexpected(std::move(document.error()));
    std::string text;
    if (auto r = detail::DumpDocument(config, *document, text); !r)
      return std::unexpected(std::move(r.error()));
    return text;
  }

  std::expected<detail::DecodedObject, Error> PolymorphicSerializer::DecodeWith(const SerializerConfig &config, std::string_view json)
  {
    auto document = detail::ParseDocument(json);
    if (!document)
      return std::unexpected(std::move(document.error()));
    return detail::DecodeRoot(config, *document);
  }

  std::expected<std::string, Error> PolymorphicSerializer::Encode(const ObjectView &value, Type base, const SharedOptions &options)
  {
    auto config = CreateConfig(base, options);
    if (!config)
      return std::unexpected(std::move(config.error()));
    return EncodeWith(**config, value);
  }

  std::expected<void, Error> PolymorphicSerializer::EncodeTo(const ObjectView &value, Type base, std::string &buffer,
                                                             const SharedOptions &options)
  {
    auto text = Encode(value, base, options);
    if (!text)
      return std::unexpected(std::move(text.error()));
    buffer.append(*text);
    return {};
  }

  std::expected<void, Error> PolymorphicSerializer::EncodeTo(const ObjectView &value, Type base, std::ostream &stream,
                                                             const SharedOptions &options)
  {
    auto text = Encode(value, base, options);
    if (!text)
      return std::unexpected(std::move(text.error()));
    return detail::WriteChunked(stream, *text, {});
  }

  std::future<std::expected<void, Error>> PolymorphicSerializer::EncodeAsync(const ObjectView &value, Type base, std::ostream &stream,
                                                                             const SharedOptions &options, std::stop_token token)
  {
    using Result = std::expected<void, Error>;
    if (token.stop_requested())
      return detail::ReadyFuture<Result>(std::unexpected(Error{ErrorCode::Cancelled, "operation cancelled"}));
    auto text = Encode(value, base, options);
    if (!text)
      return detail::ReadyFuture<Result>(std::unexpected(std::move(text.error())));
    return std::async(std::launch::async, [&stream, payload = std::move(*text), token = std::move(token)]() -> Result {
      return detail::WriteChunked(stream, payload, token);
    });
  }

  std::expected<Object, Error> PolymorphicSerializer::Decode(std::string_view json, Type base, const SharedOptions &options)
  {
    auto config = CreateConfig(base, options);
    if (!config)
      return std::unexpected(std::move(config.error()));
    auto decoded = DecodeWith(**config, json);
    if (!decoded)
      return std::unexpected(std::move(decoded.error()));
    return Box(**config, *decoded);
  }

  std::expected<Object, Error> PolymorphicSerializer::Decode(std::istream &stream, Type base, const SharedOptions &options)
  {
    auto text = detail::ReadAll(stream, {});
    if (!text)
      return std::unexpected(std::move(text.error()));
    return Decode(*text, base, options);
  }

  std::future<std::expected<Object, Error>> PolymorphicSerializer::DecodeAsync(std::istream &stream, Type base,
                                                                               const SharedOptions &options, std::stop_token token)
  {
    using Result = std::expected<Object, Error>;
    auto config = CreateConfig(base, options);
    if (!config)
      return detail::ReadyFuture<Result>(std::unexpected(std::move(config.error())));
    return std::async(std::launch::async, [&stream, cfg = std::move(*config), token = std::move(token)]() -> Result {
      auto text = detail::ReadAll(stream, token);
      if (!text)
        return std::unexpected(std::move(text.error()));
      auto decoded = DecodeWith(*cfg, *text);
      if (!decoded)
        return std::unexpected(std::move(decoded.error()));
      return Box(*cfg, *decoded);
    });
  }

} // namespace NGIN::PolyJson
