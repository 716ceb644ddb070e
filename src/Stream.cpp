#include <NGIN/PolyJson/Stream.hpp>

#include <algorithm>
#include <istream>
#include <string>

namespace NGIN::PolyJson::detail
{
  namespace
  {
    Error Cancelled() { return Error{ErrorCode::Cancelled, "operation cancelled"}; }

    Error Truncated() { return Error{ErrorCode::Format, "unexpected end of input"}; }
  } // namespace

  std::expected<void, Error> WriteChunked(std::ostream &stream, std::string_view text, std::stop_token token)
  {
    NGIN::UIntSize offset = 0;
    while (offset < text.size())
    {
      if (token.stop_requested())
        return std::unexpected(Cancelled());
      const auto n = std::min(kStreamChunkSize, text.size() - offset);
      stream.write(text.data() + offset, static_cast<std::streamsize>(n));
      if (!stream)
        return std::unexpected(Error{ErrorCode::Io, "stream write failed"});
      offset += n;
    }
    stream.flush();
    if (!stream)
      return std::unexpected(Error{ErrorCode::Io, "stream flush failed"});
    return {};
  }

  std::expected<std::string, Error> ReadAll(std::istream &stream, std::stop_token token)
  {
    std::string out;
    char buffer[kStreamChunkSize];
    for (;;)
    {
      if (token.stop_requested())
        return std::unexpected(Cancelled());
      stream.read(buffer, static_cast<std::streamsize>(sizeof(buffer)));
      const auto got = stream.gcount();
      if (got > 0)
        out.append(buffer, static_cast<NGIN::UIntSize>(got));
      if (stream.eof())
        break;
      if (!stream)
        return std::unexpected(Error{ErrorCode::Io, "stream read failed"});
    }
    return out;
  }

  // Skips whitespace and takes the next character, or eof.
  int ArrayElementReader::NextToken()
  {
    *m_stream >> std::ws;
    return m_stream->get();
  }

  std::expected<Json, Error> ArrayElementReader::ReadElement()
  {
    Json element;
    try
    {
      *m_stream >> element;
    }
    catch (const Json::exception &e)
    {
      return std::unexpected(Error{ErrorCode::Format, "malformed JSON", e.what()});
    }
    // The lexer consumes the character that ends a number; hand it back so the
    // separator is seen.
    if (element.is_number() && !m_stream->eof())
      m_stream->unget();
    return element;
  }

  std::expected<std::optional<Json>, Error> ArrayElementReader::Next()
  {
    if (m_done)
      return std::optional<Json>{};

    const int c = NextToken();
    if (c == std::char_traits<char>::eof())
      return std::unexpected(Truncated());
    if (!m_started)
    {
      if (c != '[')
        return std::unexpected(Error{ErrorCode::Format, "expected a top-level array"});
      m_started = true;
      *m_stream >> std::ws;
      if (m_stream->peek() == ']')
      {
        m_stream->get();
        m_done = true;
        return std::optional<Json>{};
      }
    }
    else if (c == ']')
    {
      m_done = true;
      return std::optional<Json>{};
    }
    else if (c != ',')
    {
      return std::unexpected(Error{ErrorCode::Format, "expected ',' or ']' between array elements"});
    }

    *m_stream >> std::ws;
    if (m_stream->peek() == std::char_traits<char>::eof())
      return std::unexpected(Truncated());
    auto element = ReadElement();
    if (!element)
      return std::unexpected(std::move(element.error()));
    return std::optional<Json>{std::move(*element)};
  }

} // namespace NGIN::PolyJson::detail
