#ifndef ZPARSE_CHECK_OPTIONS_HPP
#define ZPARSE_CHECK_OPTIONS_HPP

#include <zparse/zparse.hpp>

#include <plog/Severity.h>

#include <optional>
#include <string>
#include <string_view>

namespace check {

enum class grammar {
   addition,
   turbofish,
};

auto to_grammar(std::string_view name) noexcept -> std::optional<grammar>;

struct options {
   std::string exe_name;

   bool print_help = false;
   plog::Severity severity = plog::info;
   grammar language = grammar::addition;

   auto parse(int argc, const char** argv) -> nonstd::expected<void, std::string>;

   std::string help() const;
};

} // namespace check

#endif // ZPARSE_CHECK_OPTIONS_HPP
