// NameUtils.hpp
// Derives JSON member names from pointer-to-member constants via compiler signatures.
#pragma once

#include <string_view>

namespace NGIN::PolyJson::detail
{

  // Text between `key` and `terminator` in `sig`, or empty when either is missing.
  consteval std::string_view SliceSignature(std::string_view sig, std::string_view key, std::string_view terminator) noexcept
  {
    const auto kpos = sig.find(key);
    if (kpos == std::string_view::npos)
      return {};
    const auto start = kpos + key.size();
    const auto end = sig.find(terminator, start);
    if (end == std::string_view::npos || end <= start)
      return {};
    return sig.substr(start, end - start);
  }

  // "Circle::Radius" -> "Radius"
  template <auto MemberPtr>
  consteval std::string_view MemberNameFromPretty() noexcept
  {
#if defined(_MSC_VER)
    constexpr auto full = SliceSignature(__FUNCSIG__, "< &", " >");
#elif defined(__clang__)
    constexpr auto full = SliceSignature(__PRETTY_FUNCTION__, "[MemberPtr = &", "]");
#elif defined(__GNUC__)
    // GCC appends "; std::string_view = ..." before the closing bracket.
    constexpr auto bracketed = SliceSignature(__PRETTY_FUNCTION__, "[with auto MemberPtr = &", "]");
    constexpr auto full = bracketed.substr(0, bracketed.find(';'));
#else
    constexpr std::string_view full{};
#endif
    const auto dc = full.rfind("::");
    if (dc == std::string_view::npos)
      return full;
    return full.substr(dc + 2);
  }

} // namespace NGIN::PolyJson::detail
