#include "app.hpp"
#include "grammar.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <string>

namespace check {

void report(std::ostream& os, std::string_view line, const zparse::parse_error& err)
{
   os << "    " << line << '\n';
   os << "    " << std::string(std::min(err.position, line.size()), ' ') << "^ " << err << '\n';
}

bool app::run(std::istream& in, std::ostream& out) const
{
   std::size_t line_count = 0;
   std::size_t failure_count = 0;
   for (std::string line; std::getline(in, line);) {
      ++line_count;
      if (!line.empty() && line.back() == '\r') {
         line.pop_back();
      }
      if (line.empty()) {
         PLOG_DEBUG << "Skipping empty line " << line_count;
         continue;
      }
      PLOG_DEBUG << "Checking line " << line_count << ": '" << line << "'";
      if (!check_line(line, out)) {
         ++failure_count;
      }
   }
   if (failure_count) {
      PLOG_WARNING << failure_count << " of " << line_count << " lines failed";
   }
   else {
      PLOG_INFO << "All " << line_count << " lines passed";
   }
   return failure_count == 0;
}

bool app::check_line(std::string_view line, std::ostream& out) const
{
   switch (options_.language) {
   case grammar::addition: return check_addition_(line, out);
   case grammar::turbofish: return check_turbofish_(line, out);
   }
   PLOG_ERROR << "Unhandled grammar " << static_cast<int>(options_.language);
   return false;
}

bool app::check_addition_(std::string_view line, std::ostream& out) const
{
   text_scanner s{line};
   const auto result = addition::accept(s);
   if (!result) {
      out << "parse error\n";
      report(out, line, result.error());
      return false;
   }
   if (!s.is_empty()) {
      out << "trailing input\n";
      report(out, line, zparse::parse_error{zparse::error_kind::unexpected_element, s.position()});
      return false;
   }
   PLOG_DEBUG << "Parsed " << result->lhs << " + " << result->rhs << " = " << result->result;
   if (!result->holds()) {
      out << "wrong: " << result->lhs << " + " << result->rhs;
      if (const auto sum = result->sum()) {
         out << " is " << *sum;
      }
      else {
         out << " overflows";
      }
      out << ", not " << result->result << '\n';
      return false;
   }
   out << "ok: " << line << '\n';
   return true;
}

bool app::check_turbofish_(std::string_view line, std::ostream& out) const
{
   text_scanner s{line};
   const auto result = turbofish::accept(s);
   if (!result) {
      out << "parse error\n";
      report(out, line, result.error());
      return false;
   }
   const auto rest = s.remaining();
   out << "turbofish " << result->value << ", rest '" << std::string_view{rest.data(), rest.size()} << "'\n";
   return true;
}

} // namespace check
