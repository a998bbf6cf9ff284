#ifndef ZPARSE_BYTES_HPP
#define ZPARSE_BYTES_HPP

#include "zparse.hpp"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <span>
#include <string_view>

// Matchers over byte-sized elements. All of them accept char, unsigned char and std::uint8_t
// input alike, so a scanner over a std::string_view and one over raw bytes share the patterns.
namespace zparse::bytes {

constexpr bool is_digit(char c) noexcept
{
   return c >= '0' && c <= '9';
}

constexpr bool is_whitespace(char c) noexcept
{
   return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

template<byte_like B>
constexpr auto match_char(char expected, std::span<const B> data) noexcept -> match_result
{
   if (data.empty() || static_cast<char>(data.front()) != expected) {
      return no_match;
   }
   return {true, 1};
}

template<byte_like B>
constexpr auto match_sequence(std::string_view expected, std::span<const B> data) noexcept -> match_result
{
   if (data.size() < expected.size()) {
      return no_match;
   }
   for (std::size_t i = 0; i < expected.size(); ++i) {
      if (static_cast<char>(data[i]) != expected[i]) {
         return no_match;
      }
   }
   return {true, expected.size()};
}

// Run of ASCII decimal digits, no sign
template<byte_like B>
constexpr auto match_number(std::span<const B> data) noexcept -> match_result
{
   std::size_t size = 0;
   while (size < data.size() && is_digit(static_cast<char>(data[size]))) {
      ++size;
   }
   return {size > 0, size};
}

template<byte_like B>
constexpr auto match_whitespace(std::span<const B> data) noexcept -> match_result
{
   std::size_t size = 0;
   while (size < data.size() && is_whitespace(static_cast<char>(data[size]))) {
      ++size;
   }
   return {size > 0, size};
}

enum class token_kind : std::uint8_t {
   open_paren,
   close_paren,
   comma,
   semicolon,
   colon,
   whitespace,
   greater_than,
   less_than,
   exclamation,
   quote,
   double_quote,
   equal,
   plus,
};

constexpr auto to_char(token_kind kind) noexcept -> char
{
   switch (kind) {
   case token_kind::open_paren: return '(';
   case token_kind::close_paren: return ')';
   case token_kind::comma: return ',';
   case token_kind::semicolon: return ';';
   case token_kind::colon: return ':';
   case token_kind::whitespace: return ' ';
   case token_kind::greater_than: return '>';
   case token_kind::less_than: return '<';
   case token_kind::exclamation: return '!';
   case token_kind::quote: return '\'';
   case token_kind::double_quote: return '"';
   case token_kind::equal: return '=';
   case token_kind::plus: return '+';
   }
   return '\0';
}

inline std::ostream& operator<<(std::ostream& os, token_kind kind)
{
   return os << '\'' << to_char(kind) << '\'';
}

// Single punctuation byte, always exactly one element long
struct token {
   token_kind kind;

   template<byte_like B>
   constexpr auto matcher(std::span<const B> data) const noexcept -> match_result
   {
      return match_char(to_char(kind), data);
   }

   static constexpr auto size() noexcept -> std::size_t { return 1; }
};

namespace tokens {

inline constexpr token open_paren{token_kind::open_paren};
inline constexpr token close_paren{token_kind::close_paren};
inline constexpr token comma{token_kind::comma};
inline constexpr token semicolon{token_kind::semicolon};
inline constexpr token colon{token_kind::colon};
inline constexpr token whitespace{token_kind::whitespace};
inline constexpr token greater_than{token_kind::greater_than};
inline constexpr token less_than{token_kind::less_than};
inline constexpr token exclamation{token_kind::exclamation};
inline constexpr token quote{token_kind::quote};
inline constexpr token double_quote{token_kind::double_quote};
inline constexpr token equal{token_kind::equal};
inline constexpr token plus{token_kind::plus};

} // namespace tokens

// Variable length: the size is only known once the digits have been counted
struct number {
   template<byte_like B>
   constexpr auto matcher(std::span<const B> data) const noexcept -> match_result
   {
      return match_number(data);
   }

   static constexpr auto size() noexcept -> std::size_t { return 0; }
};

struct spaces {
   template<byte_like B>
   constexpr auto matcher(std::span<const B> data) const noexcept -> match_result
   {
      return match_whitespace(data);
   }

   static constexpr auto size() noexcept -> std::size_t { return 0; }
};

// Fixed byte string such as "::<" or "->"
struct sequence {
   std::string_view expected;

   template<byte_like B>
   constexpr auto matcher(std::span<const B> data) const noexcept -> match_result
   {
      return match_sequence(expected, data);
   }

   constexpr auto size() const noexcept -> std::size_t { return expected.size(); }
};

inline constexpr auto digits = number{};
inline constexpr auto blanks = spaces{};

} // namespace zparse::bytes

#endif // ZPARSE_BYTES_HPP
