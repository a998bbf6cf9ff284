#ifndef ZPARSE_REGEX_HPP
#define ZPARSE_REGEX_HPP

#include "zparse.hpp"

#include <ctre.hpp>

#include <algorithm>
#include <array>
#include <compare>
#include <cstddef>
#include <iterator>
#include <span>
#include <string_view>

namespace zparse {

template<std::size_t N>
struct const_str {
   constexpr const_str(const char (&other)[N]) : data{} { std::ranges::copy(other, std::begin(data)); }
   constexpr const_str(const std::array<char, N>& other) : data{} { std::ranges::copy(other, std::begin(data)); }

   char data[N];
   constexpr auto operator<=>(const const_str&) const = default;
};

// Compile-time regular expression anchored at the start of the remaining input.
// Variable length, the matched size comes from the regex engine.
template<const_str Regex>
struct regex_pattern {
private:
   static inline constexpr auto engine = ctre::match<Regex.data>;

public:
   static auto matcher(std::span<const char> data) noexcept -> match_result
   {
      const auto result = engine.starts_with(std::string_view{data.data(), data.size()});
      if (!result) {
         return no_match;
      }
      return {true, result.to_view().size()};
   }

   static constexpr auto size() noexcept -> std::size_t { return 0; }
};

template<const_str Regex>
inline constexpr auto regex = regex_pattern<Regex>{};

} // namespace zparse

#endif // ZPARSE_REGEX_HPP
