// NameUtils.hpp
// Member names recovered from the compiler's rendering of a pointer-to-member template argument.
#pragma once

#include <string_view>

namespace Morph::Mapping::detail
{

  // Text between `open` and the first character of `stops` after it, or empty.
  constexpr std::string_view Between(std::string_view text, std::string_view open, std::string_view stops) noexcept
  {
    const auto from = text.find(open);
    if (from == std::string_view::npos)
      return {};
    const auto begin = from + open.size();
    const auto end = text.find_first_of(stops, begin);
    if (end == std::string_view::npos)
      return {};
    return text.substr(begin, end - begin);
  }

  // "Ns::Class::member" -> "member"
  constexpr std::string_view LastIdentifier(std::string_view qualified) noexcept
  {
    const auto sep = qualified.rfind("::");
    return sep == std::string_view::npos ? qualified : qualified.substr(sep + 2);
  }

  // Works for data members and member functions: &Class::Total -> "Total".
  template <auto Ptr>
  consteval std::string_view MemberNameOf() noexcept
  {
#if defined(_MSC_VER)
    return LastIdentifier(Between(__FUNCSIG__, "< &", " >"));
#elif defined(__clang__)
    return LastIdentifier(Between(__PRETTY_FUNCTION__, "[Ptr = &", "]"));
#elif defined(__GNUC__)
    // GCC appends "; std::string_view = ..." before the closing bracket.
    return LastIdentifier(Between(__PRETTY_FUNCTION__, "[with auto Ptr = &", ";]"));
#else
    return {};
#endif
  }

} // namespace Morph::Mapping::detail
