#include "options.hpp"

#include <sstream>

namespace check {

auto to_grammar(std::string_view name) noexcept -> std::optional<grammar>
{
   if (name == "addition") {
      return grammar::addition;
   }
   if (name == "turbofish") {
      return grammar::turbofish;
   }
   return std::nullopt;
}

auto options::parse(int argc, const char** argv) -> nonstd::expected<void, std::string>
{
   if (argc < 1) {
      return nonstd::make_unexpected(std::string{"Missing executable name"});
   }
   exe_name = argv[0];

   for (int i = 1; i < argc; ++i) {
      const std::string_view arg = argv[i];
      const auto is = [&](std::string_view sh, std::string_view lh) { return arg == sh || arg == lh; };

      if (is("-h", "--help")) {
         print_help = true;
      }
      else if (is("-v", "--verbose")) {
         severity = plog::debug;
      }
      else if (is("-q", "--quiet")) {
         severity = plog::warning;
      }
      else if (is("-g", "--grammar")) {
         if (i + 1 >= argc) {
            return nonstd::make_unexpected("Missing grammar name after '" + std::string{arg} + "'");
         }
         const std::string_view name = argv[++i];
         const auto chosen = to_grammar(name);
         if (!chosen) {
            return nonstd::make_unexpected("Unknown grammar '" + std::string{name} + "'");
         }
         language = *chosen;
      }
      else {
         return nonstd::make_unexpected("Unknown CLI argument '" + std::string{arg} + "'");
      }
   }
   return {};
}

std::string options::help() const
{
   std::ostringstream oss;
   oss << "Help for '" << exe_name << "'\n";
   oss << exe_name << " [Options] < input\n";
   oss << "Checks every line of stdin against a small grammar\n";
   oss << "Options\n";
   oss << "    -h  --help           Print this help\n";
   oss << "    -v  --verbose        Log debug output\n";
   oss << "    -q  --quiet          Only log warnings and errors\n";
   oss << "    -g  --grammar NAME   addition (default): 'lhs + rhs = result'\n";
   oss << "                         turbofish: '::<N>' followed by anything\n";
   return oss.str();
}

} // namespace check
