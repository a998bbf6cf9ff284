#ifndef ZPARSE_CHECK_GRAMMAR_HPP
#define ZPARSE_CHECK_GRAMMAR_HPP

#include <zparse/bytes.hpp>
#include <zparse/zparse.hpp>

#include <cstdint>
#include <initializer_list>
#include <limits>
#include <optional>

namespace check {

using text_scanner = zparse::scanner<char>;

// Recognizes every token in order, stopping at the first one that is missing
inline auto expect(text_scanner& s, std::initializer_list<zparse::bytes::token> tokens) -> zparse::parse_result<void>
{
   for (const auto& token : tokens) {
      const auto result = zparse::recognize(token, s);
      if (!result) {
         return nonstd::make_unexpected(result.error());
      }
   }
   return {};
}

struct number {
   std::uint64_t value;

   static auto accept(text_scanner& s) -> zparse::parse_result<number>
   {
      const auto start = s.position();
      const auto digits = zparse::recognize(zparse::bytes::digits, s);
      if (!digits) {
         return nonstd::make_unexpected(digits.error());
      }
      const auto value = zparse::to_number<std::uint64_t>(*digits, start);
      if (!value) {
         return nonstd::make_unexpected(value.error());
      }
      return number{*value};
   }
};

// lhs + rhs = result, one space around each operator
struct addition {
   std::uint64_t lhs;
   std::uint64_t rhs;
   std::uint64_t result;

   // Empty when lhs + rhs does not fit in 64 bits
   std::optional<std::uint64_t> sum() const noexcept
   {
      if (rhs > std::numeric_limits<std::uint64_t>::max() - lhs) {
         return std::nullopt;
      }
      return lhs + rhs;
   }

   bool holds() const noexcept { return sum() == result; }

   static auto accept(text_scanner& s) -> zparse::parse_result<addition>
   {
      namespace tokens = zparse::bytes::tokens;

      const auto left = number::accept(s);
      if (!left) {
         return nonstd::make_unexpected(left.error());
      }
      if (const auto ops = expect(s, {tokens::whitespace, tokens::plus, tokens::whitespace}); !ops) {
         return nonstd::make_unexpected(ops.error());
      }
      const auto right = number::accept(s);
      if (!right) {
         return nonstd::make_unexpected(right.error());
      }
      if (const auto ops = expect(s, {tokens::whitespace, tokens::equal, tokens::whitespace}); !ops) {
         return nonstd::make_unexpected(ops.error());
      }
      const auto sum = number::accept(s);
      if (!sum) {
         return nonstd::make_unexpected(sum.error());
      }
      return addition{left->value, right->value, sum->value};
   }
};

// ::<N>
struct turbofish {
   std::uint64_t value;

   static auto accept(text_scanner& s) -> zparse::parse_result<turbofish>
   {
      const auto open = zparse::recognize(zparse::bytes::sequence{"::<"}, s);
      if (!open) {
         return nonstd::make_unexpected(open.error());
      }
      const auto inner = number::accept(s);
      if (!inner) {
         return nonstd::make_unexpected(inner.error());
      }
      if (const auto close = expect(s, {zparse::bytes::tokens::greater_than}); !close) {
         return nonstd::make_unexpected(close.error());
      }
      return turbofish{inner->value};
   }
};

} // namespace check

#endif // ZPARSE_CHECK_GRAMMAR_HPP
