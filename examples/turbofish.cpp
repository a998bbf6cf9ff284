// A hand written pattern over char32_t elements: the turbofish operator "::<>"

#include <zparse/zparse.hpp>

#include <array>
#include <cassert>
#include <iostream>
#include <span>
#include <string_view>

namespace {

constexpr std::array<char32_t, 4> turbofish_chars{U':', U':', U'<', U'>'};

struct turbofish {
   static constexpr auto matcher(std::span<const char32_t> data) noexcept -> zparse::match_result
   {
      if (data.size() < turbofish_chars.size()) {
         return zparse::no_match;
      }
      for (std::size_t i = 0; i < turbofish_chars.size(); ++i) {
         if (data[i] != turbofish_chars[i]) {
            return zparse::no_match;
         }
      }
      return {true, turbofish_chars.size()};
   }

   static constexpr auto size() noexcept -> std::size_t { return turbofish_chars.size(); }
};

static_assert(zparse::pattern<turbofish, char32_t>);
static_assert(turbofish::matcher(std::u32string_view{U"::<>b"}).size == 4);
static_assert(!turbofish::matcher(std::u32string_view{U"::<"}).matched);

} // namespace

int main()
{
   const std::u32string_view input = U"::<>b";
   zparse::scanner s{input};

   // Peeking does not consume anything
   assert(s.matches(turbofish{}).matched);
   assert(s.position() == 0);

   const auto operator_chars = zparse::recognize(turbofish{}, s);
   assert(operator_chars);
   assert(operator_chars->size() == 4);
   assert(s.position() == 4);
   assert(s.peek() == U'b');

   // A second turbofish would need 4 more elements, only 1 is left
   const auto again = zparse::recognize(turbofish{}, s);
   assert(!again);
   assert(again.error().kind == zparse::error_kind::unexpected_end_of_input);
   assert(s.position() == 4);

   std::cout << "turbofish recognized, " << s.remaining().size() << " element(s) left\n";
}
