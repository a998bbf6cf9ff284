#include "app.hpp"
#include "options.hpp"

#include <plog/Formatters/TxtFormatter.h>
#include <plog/Initializers/ConsoleInitializer.h>
#include <plog/Log.h>

#include <iostream>

int main(int argc, const char** argv)
{
   check::options options;
   if (const auto parsed = options.parse(argc, argv); !parsed) {
      std::cerr << parsed.error() << '\n';
      std::cerr << options.help();
      return 2;
   }

   if (options.print_help) {
      std::cout << options.help();
      return 0;
   }

   plog::init<plog::TxtFormatter>(options.severity, plog::streamStdErr);
   PLOG_DEBUG << "Using grammar " << (options.language == check::grammar::addition ? "addition" : "turbofish");

   const check::app app{options};
   return app.run(std::cin, std::cout) ? 0 : 1;
}
