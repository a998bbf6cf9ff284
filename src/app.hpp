#ifndef ZPARSE_CHECK_APP_HPP
#define ZPARSE_CHECK_APP_HPP

#include "options.hpp"

#include <zparse/zparse.hpp>

#include <cstddef>
#include <istream>
#include <ostream>
#include <string_view>
#include <utility>

namespace check {

// Writes the line with a caret under the failing position
void report(std::ostream& os, std::string_view line, const zparse::parse_error& err);

class app {
public:
   explicit app(options opts) noexcept : options_{std::move(opts)} {}

   // Returns true when every line parsed (and, for additions, held)
   bool run(std::istream& in, std::ostream& out) const;

   bool check_line(std::string_view line, std::ostream& out) const;

private:
   bool check_addition_(std::string_view line, std::ostream& out) const;
   bool check_turbofish_(std::string_view line, std::ostream& out) const;

   options options_;
};

} // namespace check

#endif // ZPARSE_CHECK_APP_HPP
