#include <zparse/bytes.hpp>

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <cstdint>
#include <span>
#include <sstream>
#include <string_view>
#include <utility>

using namespace std::string_view_literals;

namespace {

constexpr std::span<const char> span_of(std::string_view sv)
{
   return {sv.data(), sv.size()};
}

static_assert(zparse::bytes::match_number(span_of("007x")) == zparse::match_result{true, 3});
static_assert(!zparse::bytes::match_number(span_of("x1")).matched);
static_assert(zparse::bytes::match_char('(', span_of("(a")) == zparse::match_result{true, 1});

template<typename Int>
concept number_target = requires(std::span<const char> digits) { zparse::to_number<Int>(digits, 0); };

static_assert(number_target<int>);
static_assert(number_target<std::uint64_t>);
static_assert(!number_target<bool>);

} // namespace

TEST_CASE("match_char", "[ut][bytes]")
{
   REQUIRE(zparse::bytes::match_char('+', span_of("+1")) == zparse::match_result{true, 1});
   REQUIRE_FALSE(zparse::bytes::match_char('+', span_of("-1")).matched);
   REQUIRE_FALSE(zparse::bytes::match_char('+', span_of("")).matched);
}

TEST_CASE("match_number", "[ut][bytes]")
{
   REQUIRE(zparse::bytes::match_number(span_of("123abc")) == zparse::match_result{true, 3});
   REQUIRE(zparse::bytes::match_number(span_of("9")) == zparse::match_result{true, 1});
   REQUIRE_FALSE(zparse::bytes::match_number(span_of("abc")).matched);
   REQUIRE_FALSE(zparse::bytes::match_number(span_of("-1")).matched);
   REQUIRE_FALSE(zparse::bytes::match_number(span_of("")).matched);
}

TEST_CASE("match_sequence", "[ut][bytes]")
{
   REQUIRE(zparse::bytes::match_sequence("::<", span_of("::<>")) == zparse::match_result{true, 3});
   REQUIRE_FALSE(zparse::bytes::match_sequence("::<", span_of("::")).matched);
   REQUIRE_FALSE(zparse::bytes::match_sequence("::<", span_of(":;<")).matched);
}

TEST_CASE("match_whitespace", "[ut][bytes]")
{
   REQUIRE(zparse::bytes::match_whitespace(span_of(" \t\r\nx")) == zparse::match_result{true, 4});
   REQUIRE_FALSE(zparse::bytes::match_whitespace(span_of("x ")).matched);
}

TEST_CASE("tokens match their character", "[ut][bytes]")
{
   using zparse::bytes::token_kind;
   constexpr std::array<std::pair<token_kind, char>, 13> expected{{
      {token_kind::open_paren, '('},
      {token_kind::close_paren, ')'},
      {token_kind::comma, ','},
      {token_kind::semicolon, ';'},
      {token_kind::colon, ':'},
      {token_kind::whitespace, ' '},
      {token_kind::greater_than, '>'},
      {token_kind::less_than, '<'},
      {token_kind::exclamation, '!'},
      {token_kind::quote, '\''},
      {token_kind::double_quote, '"'},
      {token_kind::equal, '='},
      {token_kind::plus, '+'},
   }};
   for (const auto& [kind, ch] : expected) {
      const zparse::bytes::token token{kind};
      const std::array<char, 2> input{ch, 'x'};
      REQUIRE(zparse::bytes::to_char(kind) == ch);
      REQUIRE(token.size() == 1);
      REQUIRE(token.matcher(std::span<const char>{input}) == zparse::match_result{true, 1});
      REQUIRE_FALSE(token.matcher(std::span<const char>{input}.subspan(1)).matched);
   }
}

TEST_CASE("token_kind streams as its character", "[ut][bytes]")
{
   std::ostringstream oss;
   oss << zparse::bytes::token_kind::plus;
   REQUIRE(oss.str() == "'+'");
}

TEST_CASE("byte patterns over raw bytes", "[ut][bytes]")
{
   // "12+x"
   const std::array<std::uint8_t, 4> input{0x31, 0x32, 0x2b, 0x78};
   zparse::scanner s{input};

   const auto digits = zparse::recognize(zparse::bytes::digits, s);
   REQUIRE(digits);
   REQUIRE(digits->size() == 2);
   const auto value = zparse::to_number<int>(*digits, 0);
   REQUIRE(value);
   REQUIRE(*value == 12);

   REQUIRE(zparse::recognize(zparse::bytes::tokens::plus, s));
   REQUIRE(s.position() == 3);

   const auto missing = zparse::recognize(zparse::bytes::tokens::plus, s);
   REQUIRE_FALSE(missing);
   REQUIRE(missing.error() == zparse::parse_error{zparse::error_kind::unexpected_element, 3});
}

TEST_CASE("blanks and sequences through the recognizer", "[ut][bytes]")
{
   zparse::scanner s{"   ->rest"sv};

   const auto gap = zparse::recognize(zparse::bytes::blanks, s);
   REQUIRE(gap);
   REQUIRE(gap->size() == 3);

   const auto arrow = zparse::recognize(zparse::bytes::sequence{"->"}, s);
   REQUIRE(arrow);
   REQUIRE(s.position() == 5);

   const auto no_gap = zparse::try_recognize(zparse::bytes::blanks, s);
   REQUIRE(no_gap);
   REQUIRE_FALSE(*no_gap);
   REQUIRE(s.position() == 5);
}

TEST_CASE("to_number", "[ut][bytes]")
{
   SECTION("decimal")
   {
      const auto value = zparse::to_number<std::uint32_t>(span_of("4096"), 7);
      REQUIRE(value);
      REQUIRE(*value == 4096);
   }

   SECTION("other bases")
   {
      const auto value = zparse::to_number<int>(span_of("ff"), 0, 16);
      REQUIRE(value);
      REQUIRE(*value == 255);
   }

   SECTION("out of range")
   {
      const auto value = zparse::to_number<std::uint8_t>(span_of("256"), 7);
      REQUIRE_FALSE(value);
      REQUIRE(value.error().kind == zparse::error_kind::conversion);
      REQUIRE(value.error().position == 7);
   }

   SECTION("trailing garbage")
   {
      const auto value = zparse::to_number<int>(span_of("12a"), 2);
      REQUIRE_FALSE(value);
      REQUIRE(value.error().kind == zparse::error_kind::conversion);
      REQUIRE(value.error().position == 2);
   }

   SECTION("signed bytes")
   {
      const std::array<signed char, 2> input{'4', '2'};
      const auto value = zparse::to_number<int>(std::span<const signed char>{input}, 0);
      REQUIRE(value);
      REQUIRE(*value == 42);
   }

   SECTION("empty")
   {
      REQUIRE_FALSE(zparse::to_number<int>(span_of(""), 0));
   }
}
