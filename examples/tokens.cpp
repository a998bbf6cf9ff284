// Scanning the output of a lexer instead of characters.
// Nested, non-empty lists like [1, [2, 3], 4] are summed without building a tree.

#include <zparse/zparse.hpp>

#include <algorithm>
#include <array>
#include <cassert>
#include <cstddef>
#include <iostream>
#include <span>

namespace {

enum class lexeme_kind {
   open,
   close,
   comma,
   number,
};

struct lexeme {
   lexeme_kind kind;
   long value = 0;
};

struct of_kind {
   lexeme_kind kind;

   constexpr auto matcher(std::span<const lexeme> data) const noexcept -> zparse::match_result
   {
      if (data.empty() || data.front().kind != kind) {
         return zparse::no_match;
      }
      return {true, 1};
   }

   static constexpr auto size() noexcept -> std::size_t { return 1; }
};

struct list {
   long sum = 0;
   int depth = 1;

   // '[' is consumed before recursing, so nesting always makes progress
   static auto accept(zparse::scanner<lexeme>& s) -> zparse::parse_result<list>
   {
      if (const auto open = zparse::recognize(of_kind{lexeme_kind::open}, s); !open) {
         return nonstd::make_unexpected(open.error());
      }
      list to_ret;
      while (true) {
         const auto value = zparse::try_recognize(of_kind{lexeme_kind::number}, s);
         if (!value) {
            return nonstd::make_unexpected(value.error());
         }
         if (*value) {
            to_ret.sum += (*value)->front().value;
         }
         else {
            const auto nested = list::accept(s);
            if (!nested) {
               return nonstd::make_unexpected(nested.error());
            }
            to_ret.sum += nested->sum;
            to_ret.depth = std::max(to_ret.depth, nested->depth + 1);
         }

         const auto close = zparse::try_recognize(of_kind{lexeme_kind::close}, s);
         if (!close) {
            return nonstd::make_unexpected(close.error());
         }
         if (*close) {
            return to_ret;
         }
         if (const auto comma = zparse::recognize(of_kind{lexeme_kind::comma}, s); !comma) {
            return nonstd::make_unexpected(comma.error());
         }
      }
   }
};

static_assert(zparse::visitor<list, lexeme>);

} // namespace

int main()
{
   using enum lexeme_kind;
   // [1, [2, 3], 4]
   const std::array<lexeme, 11> good{
      {{open}, {number, 1}, {comma}, {open}, {number, 2}, {comma}, {number, 3}, {close}, {comma}, {number, 4}, {close}}};
   zparse::scanner s{good};
   const auto result = zparse::accept<list>(s);
   assert(result);
   assert(result->sum == 10);
   assert(result->depth == 2);
   assert(s.is_empty());

   // [1, 2 3]
   const std::array<lexeme, 6> bad{{{open}, {number, 1}, {comma}, {number, 2}, {number, 3}, {close}}};
   zparse::scanner t{bad};
   const auto failed = zparse::accept<list>(t);
   assert(!failed);
   assert(failed.error().kind == zparse::error_kind::unexpected_element);
   assert(failed.error().position == 4);

   std::cout << "sum " << result->sum << ", depth " << result->depth << '\n';
   std::cout << "rejected: " << failed.error() << '\n';
}
