// Stream.hpp
// Chunked stream I/O with cooperative cancellation and a top-level array splitter
#pragma once

#include <NGIN/Primitives.hpp>

#include <NGIN/PolyJson/Export.hpp>
#include <NGIN/PolyJson/Json.hpp>
#include <NGIN/PolyJson/Types.hpp>

#include <expected>
#include <future>
#include <istream>
#include <optional>
#include <ostream>
#include <stop_token>
#include <string>
#include <string_view>

namespace NGIN::PolyJson::detail
{

  inline constexpr NGIN::UIntSize kStreamChunkSize = 4096;

  // Write `text` in chunks, checking `token` before each one.
  [[nodiscard]] NGIN_POLYJSON_API std::expected<void, Error> WriteChunked(std::ostream &stream, std::string_view text, std::stop_token token);
  // Read the stream to its end in chunks, checking `token` before each one.
  [[nodiscard]] NGIN_POLYJSON_API std::expected<std::string, Error> ReadAll(std::istream &stream, std::stop_token token);

  /**
   * Reads the elements of a top-level JSON array one at a time. The brackets and
   * separators are consumed here; each element is parsed from the stream by the
   * JSON library. Nothing after the closing bracket is read.
   */
  class NGIN_POLYJSON_API ArrayElementReader
  {
  public:
    explicit ArrayElementReader(std::istream &stream) noexcept : m_stream(&stream) {}

    // Next element, or an empty optional once the array is closed.
    [[nodiscard]] std::expected<std::optional<Json>, Error> Next();
    [[nodiscard]] bool Done() const noexcept { return m_done; }

  private:
    int NextToken();
    std::expected<Json, Error> ReadElement();

    std::istream *m_stream;
    bool m_started{false};
    bool m_done{false};
  };

  template <class T>
  [[nodiscard]] std::future<T> ReadyFuture(T value)
  {
    std::promise<T> promise;
    promise.set_value(std::move(value));
    return promise.get_future();
  }

} // namespace NGIN::PolyJson::detail
