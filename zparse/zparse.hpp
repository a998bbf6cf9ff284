#ifndef ZPARSE_HPP
#define ZPARSE_HPP

// Auto-detection picks std::expected on some toolchains and the API differs slightly,
// so force the nonstd version everywhere
#ifndef nsel_CONFIG_SELECT_EXPECTED
#define nsel_CONFIG_SELECT_EXPECTED nsel_EXPECTED_NONSTD
#endif
#include <nonstd/expected.hpp>

#include <algorithm>
#include <charconv>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <ranges>
#include <span>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace zparse {

enum class error_kind : std::uint8_t {
   unexpected_element,
   unexpected_end_of_input,
   conversion,
   invalid_position,
   message,
};

constexpr auto to_string(error_kind kind) noexcept -> std::string_view
{
   switch (kind) {
   case error_kind::unexpected_element: return "unexpected element";
   case error_kind::unexpected_end_of_input: return "unexpected end of input";
   case error_kind::conversion: return "conversion failed";
   case error_kind::invalid_position: return "invalid position";
   case error_kind::message: return "error";
   }
   return "unknown error";
}

inline std::ostream& operator<<(std::ostream& os, error_kind kind)
{
   return os << to_string(kind);
}

struct parse_error {
   error_kind kind;
   // Scanner position at the time of failure
   std::size_t position;
   // Only ever points at static storage, errors never allocate
   std::string_view reason{};

   friend constexpr bool operator==(const parse_error&, const parse_error&) = default;
};

inline std::ostream& operator<<(std::ostream& os, const parse_error& err)
{
   os << err.kind << " at position " << err.position;
   if (!err.reason.empty()) {
      os << ": " << err.reason;
   }
   return os;
}

template<typename T>
using parse_result = nonstd::expected<T, parse_error>;

// reason is stored as a view, so it must refer to static storage (a string literal).
// A message built at runtime would dangle once the error leaves the builder's scope.
inline auto make_error(error_kind kind, std::size_t position, std::string_view reason = {}) noexcept
   -> nonstd::unexpected_type<parse_error>
{
   return nonstd::make_unexpected(parse_error{kind, position, reason});
}

// Outcome of testing a pattern against the start of a slice.
// size is only meaningful when matched is true and never exceeds the slice length.
struct match_result {
   bool matched;
   std::size_t size;

   friend constexpr bool operator==(const match_result&, const match_result&) = default;
};

inline constexpr match_result no_match{false, 0};

// clang-format off
template<typename P, typename T>
concept pattern = requires(const P& p, std::span<const T> data) {
   { p.matcher(data) } -> std::same_as<match_result>;
};

template<typename P>
concept sized_pattern = requires(const P& p) {
   { p.size() } -> std::convertible_to<std::size_t>;
};

template<typename T>
concept byte_like = std::integral<T> && sizeof(T) == 1 && !std::same_as<std::remove_cv_t<T>, bool>;
// clang-format on

// 0 means the length is only known after running the matcher
template<typename P>
constexpr auto pattern_size(const P& p) noexcept -> std::size_t
{
   if constexpr (sized_pattern<P>) {
      return static_cast<std::size_t>(p.size());
   }
   else {
      return 0;
   }
}

// Cursor over a borrowed, contiguous view of T. The scanner never owns or copies the data,
// so the data has to outlive the scanner and everything recognized from it.
template<typename T>
class scanner {
public:
   using element_type = T;

   // clang-format off
   template<std::ranges::contiguous_range Range>
      requires std::same_as<std::ranges::range_value_t<Range>, T>
            && (std::is_lvalue_reference_v<Range> || std::ranges::borrowed_range<Range>)
   // clang-format on
   constexpr explicit scanner(Range&& input) noexcept
      : data_{std::ranges::data(input), std::ranges::size(input)}
   {}

   constexpr auto peek() const noexcept -> std::optional<T>
   {
      if (cursor_ >= data_.size()) {
         return std::nullopt;
      }
      return data_[cursor_];
   }

   constexpr auto bump() noexcept -> std::optional<T>
   {
      auto to_ret = peek();
      if (to_ret) {
         ++cursor_;
      }
      return to_ret;
   }

   auto bump_by(std::size_t count) noexcept -> parse_result<void>
   {
      if (count > data_.size() - cursor_) {
         return make_error(error_kind::unexpected_end_of_input, cursor_);
      }
      cursor_ += count;
      return {};
   }

   // Positions past the end are rejected and the cursor is left as it was
   auto rewind(std::size_t to) noexcept -> parse_result<void>
   {
      if (to > data_.size()) {
         return make_error(error_kind::invalid_position, cursor_, "rewind target is past the end of the input");
      }
      cursor_ = to;
      return {};
   }

   constexpr auto remaining() const noexcept -> std::span<const T> { return data_.subspan(cursor_); }
   constexpr auto data() const noexcept -> std::span<const T> { return data_; }
   constexpr auto position() const noexcept -> std::size_t { return cursor_; }
   constexpr auto is_empty() const noexcept -> bool { return cursor_ == data_.size(); }

   // Lookahead only, the cursor does not move
   template<pattern<T> P>
   constexpr auto matches(const P& p) const -> match_result
   {
      return p.matcher(remaining());
   }

private:
   std::span<const T> data_;
   std::size_t cursor_ = 0;
};

template<std::ranges::contiguous_range Range>
scanner(Range&&) -> scanner<std::ranges::range_value_t<Range>>;

template<typename T>
using recognized = std::span<const T>;

// Runs the pattern against the unconsumed data.
// Returns the consumed slice on a match and an empty optional (cursor untouched) when the
// pattern is absent. Recognition on an exhausted scanner is an unexpected end of input.
template<typename T, pattern<T> P>
auto try_recognize(const P& p, scanner<T>& s) -> parse_result<std::optional<recognized<T>>>
{
   if (s.is_empty()) {
      return make_error(error_kind::unexpected_end_of_input, s.position());
   }
   const auto data = s.remaining();
   const auto [matched, size] = p.matcher(data);
   if (!matched) {
      return std::optional<recognized<T>>{};
   }
   // A matcher claiming more than it was given is a bug in the pattern, nothing moves
   if (size > data.size()) {
      return make_error(error_kind::message, s.position(), "matcher claimed more than the remaining input");
   }
   const auto bumped = s.bump_by(size);
   if (!bumped) {
      return nonstd::make_unexpected(bumped.error());
   }
   return std::optional<recognized<T>>{data.first(size)};
}

// Like try_recognize, but the pattern is required: a missing pattern is an unexpected
// element at the position recognition started from.
template<typename T, pattern<T> P>
auto recognize(const P& p, scanner<T>& s) -> parse_result<recognized<T>>
{
   const auto start = s.position();
   if (pattern_size(p) > s.remaining().size()) {
      return make_error(error_kind::unexpected_end_of_input, start);
   }
   const auto result = try_recognize(p, s);
   if (!result) {
      return nonstd::make_unexpected(result.error());
   }
   if (!*result) {
      return make_error(error_kind::unexpected_element, start);
   }
   return **result;
}

// A type that builds itself from a scanner by driving recognizers and other visitors.
// There is no rewind on failure: callers that try alternatives snapshot position() first
// and rewind() before the next attempt. Nesting depth is bounded only by the call stack,
// so left recursive grammars recurse forever.
// clang-format off
template<typename V, typename T>
concept visitor = requires(scanner<T>& s) {
   { V::accept(s) } -> std::same_as<parse_result<V>>;
};
// clang-format on

template<typename V, typename T>
   requires visitor<V, T>
auto accept(scanner<T>& s) -> parse_result<V>
{
   return V::accept(s);
}

// Single element exact match
template<typename T>
struct element {
   T value;

   constexpr auto matcher(std::span<const T> data) const noexcept -> match_result
   {
      if (data.empty() || !(data.front() == value)) {
         return no_match;
      }
      return {true, 1};
   }

   static constexpr auto size() noexcept -> std::size_t { return 1; }
};

template<typename T>
element(T) -> element<T>;

// Fixed sequence of elements, borrowed like everything else
template<typename T>
class literal {
public:
   // clang-format off
   template<std::ranges::contiguous_range Range>
      requires std::same_as<std::ranges::range_value_t<Range>, T>
            && (std::is_lvalue_reference_v<Range> || std::ranges::borrowed_range<Range>)
   // clang-format on
   constexpr explicit literal(Range&& sequence) noexcept
      : expected_{std::ranges::data(sequence), std::ranges::size(sequence)}
   {}

   constexpr auto matcher(std::span<const T> data) const noexcept -> match_result
   {
      if (data.size() < expected_.size()) {
         return no_match;
      }
      if (!std::ranges::equal(data.first(expected_.size()), expected_)) {
         return no_match;
      }
      return {true, expected_.size()};
   }

   constexpr auto size() const noexcept -> std::size_t { return expected_.size(); }

private:
   std::span<const T> expected_;
};

template<std::ranges::contiguous_range Range>
literal(Range&&) -> literal<std::ranges::range_value_t<Range>>;

// Converts a recognized run of digits. position is where the digits started and is what
// ends up in the error.
template<std::integral Int, byte_like B>
   requires(!std::same_as<std::remove_cv_t<Int>, bool>)
auto to_number(std::span<const B> digits, std::size_t position, int base = 10) noexcept -> parse_result<Int>
{
   Int to_ret{};
   const char* first = nullptr;
   if constexpr (std::same_as<std::remove_cv_t<B>, char>) {
      first = digits.data();
   }
   else {
      first = reinterpret_cast<const char*>(digits.data());
   }
   const auto* last = first + digits.size();
   const auto [ptr, ec] = std::from_chars(first, last, to_ret, base);
   if (ec == std::errc::result_out_of_range) {
      return make_error(error_kind::conversion, position, "number does not fit the target type");
   }
   else if (ec != std::errc{} || ptr != last) {
      return make_error(error_kind::conversion, position, "not a number");
   }
   return to_ret;
}

} // namespace zparse

#endif // ZPARSE_HPP
