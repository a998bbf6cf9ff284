#include <zparse/bytes.hpp>
#include <zparse/regex.hpp>
#include <zparse/zparse.hpp>

#include <benchmark/benchmark.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace {

// "12345 + 67890 = 80235 " repeated
std::string make_input(std::size_t repetitions)
{
   std::string to_ret;
   for (std::size_t i = 0; i < repetitions; ++i) {
      to_ret += "12345 + 67890 = 80235 ";
   }
   return to_ret;
}

const std::string input = make_input(1024);

void bump_bench(benchmark::State& state)
{
   for (auto _ : state) {
      zparse::scanner s{std::string_view{input}};
      std::size_t count = 0;
      while (s.bump()) {
         ++count;
      }
      benchmark::DoNotOptimize(count);
   }
   state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(input.size()));
}

template<typename Digits>
void tokens_bench(benchmark::State& state, const Digits& digits)
{
   for (auto _ : state) {
      zparse::scanner s{std::string_view{input}};
      std::size_t count = 0;
      while (!s.is_empty()) {
         const auto run = zparse::try_recognize(digits, s);
         if (!run) {
            break;
         }
         if (*run) {
            ++count;
            continue;
         }
         const auto gap = zparse::try_recognize(zparse::bytes::blanks, s);
         if (!gap) {
            break;
         }
         if (!*gap && !s.bump()) {
            break;
         }
      }
      benchmark::DoNotOptimize(count);
   }
   state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(input.size()));
}

void digits_bench(benchmark::State& state)
{
   tokens_bench(state, zparse::bytes::digits);
}

void regex_bench(benchmark::State& state)
{
   tokens_bench(state, zparse::regex<"[0-9]+">);
}

void literal_bench(benchmark::State& state)
{
   constexpr std::string_view plus = " + ";
   const zparse::literal pattern{plus};
   for (auto _ : state) {
      zparse::scanner s{std::string_view{input}};
      std::size_t count = 0;
      while (!s.is_empty()) {
         const auto found = zparse::try_recognize(pattern, s);
         if (!found) {
            break;
         }
         if (*found) {
            ++count;
         }
         else if (!s.bump()) {
            break;
         }
      }
      benchmark::DoNotOptimize(count);
   }
}

} // namespace

BENCHMARK(bump_bench);
BENCHMARK(digits_bench);
BENCHMARK(regex_bench);
BENCHMARK(literal_bench);

BENCHMARK_MAIN();
