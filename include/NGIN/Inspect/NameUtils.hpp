// NameUtils.hpp
// Member identifiers recovered from pointer-to-member constants via the compiler's function signature
#pragma once

#include <string_view>

namespace NGIN::Inspect::detail
{

  // Text between `open` and `close` in `sig`, or empty when either marker is absent.
  consteval std::string_view Between(std::string_view sig, std::string_view open, std::string_view close) noexcept
  {
    const auto start = sig.find(open);
    if (start == std::string_view::npos)
      return {};
    const auto from = start + open.size();
    const auto end = sig.find(close, from);
    if (end == std::string_view::npos || end <= from)
      return {};
    return sig.substr(from, end - from);
  }

  // Pointer-to-member text ("Class::member") reduced to "member".
  consteval std::string_view LastIdentifier(std::string_view full) noexcept
  {
    const auto dc = full.rfind("::");
    return dc == std::string_view::npos ? full : full.substr(dc + 2);
  }

  template <auto MemberPtr>
  consteval std::string_view MemberNameFromPretty() noexcept
  {
#if defined(_MSC_VER)
    // "... MemberNameFromPretty< &Class::member >(void) noexcept"
    return LastIdentifier(Between(__FUNCSIG__, "< &", " >"));
#elif defined(__clang__)
    // "... MemberNameFromPretty() [MemberPtr = &Class::member]"
    return LastIdentifier(Between(__PRETTY_FUNCTION__, "[MemberPtr = &", "]"));
#elif defined(__GNUC__)
    // "... MemberNameFromPretty() [with auto MemberPtr = &Class::member]"
    return LastIdentifier(Between(__PRETTY_FUNCTION__, "[with auto MemberPtr = &", "]"));
#else
    return {};
#endif
  }

} // namespace NGIN::Inspect::detail
