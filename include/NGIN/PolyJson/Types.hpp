// Types.hpp
// Public-facing error codes and small handle types
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/PolyJson/Export.hpp>

#include <string>
#include <string_view>
#include <expected>
#include <utility>

namespace NGIN::PolyJson
{

  enum class ErrorCode : unsigned
  {
    NotFound = 1,
    InvalidArgument = 2,
    Configuration = 3,
    UnsupportedType = 4,
    Format = 5,
    MissingMember = 6,
    Cancelled = 7,
    Io = 8,
  };

  // `message` is a static description; `detail` and `path` carry the offending
  // name/value and the JSON location ("$.Prop1[2]") when one applies.
  struct Error
  {
    ErrorCode code{ErrorCode::InvalidArgument};
    std::string_view message{};
    std::string detail{};
    std::string path{};

    Error() = default;
    Error(ErrorCode c, std::string_view m) : code(c), message(m) {}
    Error(ErrorCode c, std::string_view m, std::string d)
        : code(c), message(m), detail(std::move(d))
    {
    }
    Error(ErrorCode c, std::string_view m, std::string d, std::string p)
        : code(c), message(m), detail(std::move(d)), path(std::move(p))
    {
    }

    // Malformed input or input that names something the configuration cannot map.
    [[nodiscard]] bool IsFormatError() const noexcept
    {
      return code == ErrorCode::Format || code == ErrorCode::MissingMember;
    }
  };

  [[nodiscard]] NGIN_POLYJSON_API std::string_view ErrorCodeName(ErrorCode code) noexcept;
  // "Format: unknown discriminator (\"class9\") at $.Prop1"
  [[nodiscard]] NGIN_POLYJSON_API std::string ToString(const Error &error);

  // Small opaque handles (indices into the append-only type table).
  struct TypeHandle
  {
    NGIN::UInt32 index{static_cast<NGIN::UInt32>(-1)};
    constexpr bool IsValid() const noexcept { return index != static_cast<NGIN::UInt32>(-1); }
  };

  struct FieldHandle
  {
    NGIN::UInt32 typeIndex{static_cast<NGIN::UInt32>(-1)};
    NGIN::UInt32 fieldIndex{static_cast<NGIN::UInt32>(-1)};
    constexpr bool IsValid() const noexcept { return typeIndex != static_cast<NGIN::UInt32>(-1) && fieldIndex != static_cast<NGIN::UInt32>(-1); }
  };

  // Forward decls of high-level wrappers
  class Type;
  class Field;

  using ExpectedType = std::expected<Type, Error>;
  using ExpectedField = std::expected<Field, Error>;

} // namespace NGIN::PolyJson
