// Discriminator.hpp
// Variant tag written to and read from the "$type" member
#pragma once

#include <NGIN/PolyJson/Json.hpp>
#include <NGIN/PolyJson/Types.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace NGIN::PolyJson
{

  // A string or 32-bit integer tag. `1` and `"1"` are different discriminators.
  class Discriminator
  {
  public:
    Discriminator() = default;
    explicit Discriminator(std::string value) : m_value(std::move(value)) {}
    explicit Discriminator(std::string_view value) : m_value(std::string{value}) {}
    explicit Discriminator(const char *value) : m_value(std::string{value}) {}
    explicit Discriminator(std::int32_t value) : m_value(value) {}

    [[nodiscard]] bool IsString() const noexcept { return std::holds_alternative<std::string>(m_value); }
    [[nodiscard]] bool IsInteger() const noexcept { return std::holds_alternative<std::int32_t>(m_value); }

    [[nodiscard]] std::string_view AsString() const noexcept
    {
      const auto *s = std::get_if<std::string>(&m_value);
      return s ? std::string_view{*s} : std::string_view{};
    }
    [[nodiscard]] std::int32_t AsInteger() const noexcept
    {
      const auto *i = std::get_if<std::int32_t>(&m_value);
      return i ? *i : 0;
    }

    [[nodiscard]] Json ToJson() const
    {
      if (IsString())
        return Json(AsString());
      return Json(AsInteger());
    }

    // True when `value` is the JSON form of this discriminator (same kind and value).
    [[nodiscard]] bool Matches(const Json &value) const noexcept
    {
      if (IsString())
        return value.is_string() && value.get_ref<const std::string &>() == AsString();
      if (value.is_number_unsigned())
        return AsInteger() >= 0 && value.get<std::uint64_t>() == static_cast<std::uint64_t>(AsInteger());
      if (value.is_number_integer())
        return value.get<std::int64_t>() == AsInteger();
      return false;
    }

    // Quoted for strings, bare for integers; used in diagnostics.
    [[nodiscard]] std::string ToString() const
    {
      if (IsString())
        return "\"" + std::string{AsString()} + "\"";
      return std::to_string(AsInteger());
    }

    friend bool operator==(const Discriminator &, const Discriminator &) = default;

  private:
    std::variant<std::string, std::int32_t> m_value{};
  };

} // namespace NGIN::PolyJson
