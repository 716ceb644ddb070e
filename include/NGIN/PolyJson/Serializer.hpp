// Serializer.hpp
// Non-generic and typed serializer facades over cached configurations
#pragma once

#include <NGIN/PolyJson/Config.hpp>
#include <NGIN/PolyJson/ConfigurationCache.hpp>
#include <NGIN/PolyJson/Engine.hpp>
#include <NGIN/PolyJson/Object.hpp>
#include <NGIN/PolyJson/Stream.hpp>

#include <expected>
#include <cstddef>
#include <future>
#include <istream>
#include <iterator>
#include <memory>
#include <optional>
#include <ostream>
#include <stop_token>
#include <string>
#include <string_view>
#include <type_traits>

namespace NGIN::PolyJson
{

  /**
   * Serializes values through a base type chosen per call. Configurations are
   * built on first use for each (base, options) pair and cached; a null options
   * pointer selects the defaults. Safe to share between threads.
   */
  class NGIN_POLYJSON_API PolymorphicSerializer
  {
  public:
    explicit PolymorphicSerializer(GroupList groups);

    [[nodiscard]] const GroupList &Groups() const noexcept { return m_groups; }

    [[nodiscard]] std::expected<SharedConfig, Error> CreateConfig(Type base, const SharedOptions &options = nullptr);

    [[nodiscard]] std::expected<std::string, Error> Encode(const ObjectView &value, Type base, const SharedOptions &options = nullptr);
    [[nodiscard]] std::expected<void, Error> EncodeTo(const ObjectView &value, Type base, std::string &buffer,
                                                      const SharedOptions &options = nullptr);
    [[nodiscard]] std::expected<void, Error> EncodeTo(const ObjectView &value, Type base, std::ostream &stream,
                                                      const SharedOptions &options = nullptr);
    // Encodes on the calling thread; the write happens asynchronously. `value`
    // need not outlive the call, `stream` must outlive the future.
    [[nodiscard]] std::future<std::expected<void, Error>> EncodeAsync(const ObjectView &value, Type base, std::ostream &stream,
                                                                      const SharedOptions &options = nullptr,
                                                                      std::stop_token token = {});

    template <class T>
    requires(!std::is_pointer_v<T>)
    [[nodiscard]] std::expected<std::string, Error> Encode(const T &value, Type base, const SharedOptions &options = nullptr)
    {
      return Encode(ObjectView::Of(value), base, options);
    }

    [[nodiscard]] std::expected<Object, Error> Decode(std::string_view json, Type base, const SharedOptions &options = nullptr);
    [[nodiscard]] std::expected<Object, Error> Decode(std::istream &stream, Type base, const SharedOptions &options = nullptr);
    // `stream` must outlive the future.
    [[nodiscard]] std::future<std::expected<Object, Error>> DecodeAsync(std::istream &stream, Type base,
                                                                        const SharedOptions &options = nullptr,
                                                                        std::stop_token token = {});

    // Lower-level entry points shared with TypedSerializer.
    [[nodiscard]] static std::expected<std::string, Error> EncodeWith(const SerializerConfig &config, const ObjectView &value);
    [[nodiscard]] static std::expected<detail::DecodedObject, Error> DecodeWith(const SerializerConfig &config, std::string_view json);

  private:
    GroupList m_groups;
    ConfigurationCache m_cache;
  };

  // Owned decode result of a typed facade; empty for a JSON null.
  template <class B>
  [[nodiscard]] std::unique_ptr<B> AdoptDecoded(const detail::DecodedObject &decoded) noexcept
  {
    return std::unique_ptr<B>(static_cast<B *>(decoded.object));
  }

  /**
   * Lazily decodes the elements of a top-level JSON array read from a stream.
   * Each call to Next reads and decodes one element; the sequence stops after
   * the closing bracket, the first error, or a stop request.
   */
  template <class B>
  class ValueSequence
  {
  public:
    using Item = std::expected<std::unique_ptr<B>, Error>;

    ValueSequence(SharedConfig config, std::istream &stream, std::stop_token token)
        : m_config(std::move(config)), m_reader(stream), m_token(std::move(token))
    {
    }

    // An empty optional marks the end.
    [[nodiscard]] std::optional<Item> Next()
    {
      if (m_failed)
        return std::nullopt;
      if (m_token.stop_requested())
        return Fail(Error{ErrorCode::Cancelled, "operation cancelled"});
      auto element = m_reader.Next();
      if (!element)
        return Fail(std::move(element.error()));
      if (!*element)
        return std::nullopt;
      auto decoded = detail::DecodeRoot(*m_config, **element);
      if (!decoded)
        return Fail(std::move(decoded.error()));
      return Item{AdoptDecoded<B>(*decoded)};
    }

    class Iterator
    {
    public:
      using value_type = Item;
      using difference_type = std::ptrdiff_t;

      Iterator() = default;
      explicit Iterator(ValueSequence *seq) : m_seq(seq) { ++*this; }

      Item &operator*() const { return *m_current; }
      Item *operator->() const { return &*m_current; }
      Iterator &operator++()
      {
        m_current = m_seq->Next();
        if (!m_current)
          m_seq = nullptr;
        return *this;
      }
      void operator++(int) { ++*this; }
      friend bool operator==(const Iterator &it, std::default_sentinel_t) noexcept { return it.m_seq == nullptr; }

    private:
      ValueSequence *m_seq{nullptr};
      mutable std::optional<Item> m_current;
    };

    [[nodiscard]] Iterator begin() { return Iterator{this}; }
    [[nodiscard]] std::default_sentinel_t end() const noexcept { return {}; }

  private:
    std::optional<Item> Fail(Error error)
    {
      m_failed = true;
      return Item{std::unexpected(std::move(error))};
    }

    SharedConfig m_config;
    detail::ArrayElementReader m_reader;
    std::stop_token m_token;
    bool m_failed{false};
  };

  /**
   * Typed facade bound to base B. Holds the default configuration computed at
   * creation; explicit options go through the shared PolymorphicSerializer cache.
   */
  template <class B>
  class TypedSerializer
  {
  public:
    TypedSerializer(std::shared_ptr<PolymorphicSerializer> inner, Type base, SharedConfig defaults) noexcept
        : m_inner(std::move(inner)), m_base(base), m_default(std::move(defaults))
    {
    }

    [[nodiscard]] static std::expected<std::shared_ptr<TypedSerializer>, Error> Create(std::shared_ptr<PolymorphicSerializer> inner)
    {
      if (!inner)
        return std::unexpected(Error{ErrorCode::InvalidArgument, "serializer is null"});
      const Type base = GetType<B>();
      auto config = inner->CreateConfig(base);
      if (!config)
        return std::unexpected(std::move(config.error()));
      return std::make_shared<TypedSerializer>(std::move(inner), base, std::move(*config));
    }

    [[nodiscard]] Type BaseType() const noexcept { return m_base; }

    [[nodiscard]] std::expected<SharedConfig, Error> CreateConfig(const SharedOptions &options = nullptr)
    {
      if (!options)
        return m_default;
      return m_inner->CreateConfig(m_base, options);
    }

    [[nodiscard]] std::expected<std::string, Error> Encode(const B &value, const SharedOptions &options = nullptr)
    {
      auto config = CreateConfig(options);
      if (!config)
        return std::unexpected(std::move(config.error()));
      return PolymorphicSerializer::EncodeWith(**config, View(value));
    }

    [[nodiscard]] std::expected<void, Error> EncodeTo(const B &value, std::string &buffer, const SharedOptions &options = nullptr)
    {
      auto text = Encode(value, options);
      if (!text)
        return std::unexpected(std::move(text.error()));
      buffer.append(*text);
      return {};
    }

    [[nodiscard]] std::expected<void, Error> EncodeTo(const B &value, std::ostream &stream, const SharedOptions &options = nullptr)
    {
      auto text = Encode(value, options);
      if (!text)
        return std::unexpected(std::move(text.error()));
      return detail::WriteChunked(stream, *text, {});
    }

    [[nodiscard]] std::future<std::expected<void, Error>> EncodeAsync(const B &value, std::ostream &stream,
                                                                      const SharedOptions &options = nullptr,
                                                                      std::stop_token token = {})
    {
      return m_inner->EncodeAsync(View(value), m_base, stream, options, std::move(token));
    }

    [[nodiscard]] std::expected<std::unique_ptr<B>, Error> Decode(std::string_view json, const SharedOptions &options = nullptr)
    {
      auto config = CreateConfig(options);
      if (!config)
        return std::unexpected(std::move(config.error()));
      auto decoded = PolymorphicSerializer::DecodeWith(**config, json);
      if (!decoded)
        return std::unexpected(std::move(decoded.error()));
      return AdoptDecoded<B>(*decoded);
    }

    [[nodiscard]] std::future<std::expected<std::unique_ptr<B>, Error>> DecodeAsync(std::istream &stream,
                                                                                    const SharedOptions &options = nullptr,
                                                                                    std::stop_token token = {})
    {
      using Result = std::expected<std::unique_ptr<B>, Error>;
      auto config = CreateConfig(options);
      if (!config)
        return detail::ReadyFuture<Result>(std::unexpected(std::move(config.error())));
      return std::async(std::launch::async, [&stream, cfg = std::move(*config), token = std::move(token)]() -> Result {
        auto text = detail::ReadAll(stream, token);
        if (!text)
          return std::unexpected(std::move(text.error()));
        auto decoded = PolymorphicSerializer::DecodeWith(*cfg, *text);
        if (!decoded)
          return std::unexpected(std::move(decoded.error()));
        return AdoptDecoded<B>(*decoded);
      });
    }

    // Elements are decoded one per step; `stream` must outlive the sequence.
    [[nodiscard]] std::expected<ValueSequence<B>, Error> DecodeSequence(std::istream &stream, const SharedOptions &options = nullptr,
                                                                        std::stop_token token = {})
    {
      auto config = CreateConfig(options);
      if (!config)
        return std::unexpected(std::move(config.error()));
      return ValueSequence<B>{std::move(*config), stream, std::move(token)};
    }

  private:
    ObjectView View(const B &value) const
    {
      ObjectView v{};
      v.object = &value;
      v.type = m_base;
      v.dynamicType = &typeid(value);
      return v;
    }

    std::shared_ptr<PolymorphicSerializer> m_inner;
    Type m_base{};
    SharedConfig m_default;
  };

} // namespace NGIN::PolyJson
