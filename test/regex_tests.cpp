#include <zparse/regex.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string_view>

using namespace std::string_view_literals;

static_assert(zparse::pattern<zparse::regex_pattern<"[a-z]+">, char>);

TEST_CASE("regex pattern is anchored at the cursor", "[ut][regex]")
{
   zparse::scanner s{"abc123"sv};

   REQUIRE_FALSE(zparse::try_recognize(zparse::regex<"[0-9]+">, s).value());
   REQUIRE(s.position() == 0);

   const auto word = zparse::recognize(zparse::regex<"[a-z]+">, s);
   REQUIRE(word);
   REQUIRE(std::string_view{word->data(), word->size()} == "abc");

   const auto digits = zparse::recognize(zparse::regex<"[0-9]+">, s);
   REQUIRE(digits);
   REQUIRE(digits->size() == 3);
   REQUIRE(s.is_empty());
}

TEST_CASE("regex pattern has no static size", "[ut][regex]")
{
   REQUIRE(zparse::pattern_size(zparse::regex<"0x[0-9a-f]+">) == 0);

   zparse::scanner s{"0xff;"sv};
   const auto hex = zparse::recognize(zparse::regex<"0x[0-9a-f]+">, s);
   REQUIRE(hex);
   const auto value = zparse::to_number<int>(hex->subspan(2), 2, 16);
   REQUIRE(value);
   REQUIRE(*value == 255);
   REQUIRE(s.peek() == ';');
}

TEST_CASE("regex alternatives", "[ut][regex]")
{
   zparse::scanner s{"<=x"sv};
   const auto op = zparse::recognize(zparse::regex<"<=|<|>=|>">, s);
   REQUIRE(op);
   REQUIRE(op->size() == 2);

   const auto missing = zparse::recognize(zparse::regex<"<=|<|>=|>">, s);
   REQUIRE_FALSE(missing);
   REQUIRE(missing.error().kind == zparse::error_kind::unexpected_element);
   REQUIRE(missing.error().position == 2);
}
