#include "gap_text_buffer_core.hpp"
#include "vector_text_buffer_core.hpp"
#include <string>
#include <chrono>
#include <iostream>
#include <random>
#include <cstdlib>

struct BenchCfg {
  size_t N = 200000;            // initial lines
  size_t type_iters = 100000;   // single-char inserts at one moving spot
  size_t random_iters = 10000;  // inserts at random offsets
  size_t erase_iters = 50000;   // single-char erases
  size_t lookup_iters = 200000; // line_of / line_start lookups
};

static std::u32string make_text(size_t lines) {
  std::u32string s;
  s.reserve(lines * 5);
  for (size_t i = 0; i < lines; ++i) s += U"line\n";
  return s;
}

template <typename Fn>
static double timed(Fn&& fn) {
  auto t0 = std::chrono::steady_clock::now();
  fn();
  auto t1 = std::chrono::steady_clock::now();
  std::chrono::duration<double> dt = t1 - t0;
  return dt.count();
}

template <typename Core>
static void run(const BenchCfg& cfg) {
  const std::u32string text = make_text(cfg.N);
  std::string tag = "[" + std::string(Core::get_name_sv()) + "]";
  tag.resize(10, ' ');
  Core core;
  std::cout << tag << " init N=" << cfg.N << " took " << timed([&]{ core.init(text); }) << "s\n";

  size_t mid = core.length() / 2;
  std::cout << tag << " typing mid iters=" << cfg.type_iters << " took " << timed([&]{
    for (size_t i = 0; i < cfg.type_iters; ++i) core.insert(mid + i, U"x");
  }) << "s\n";

  std::mt19937 rng(12345);
  std::cout << tag << " random insert iters=" << cfg.random_iters << " took " << timed([&]{
    for (size_t i = 0; i < cfg.random_iters; ++i) {
      std::uniform_int_distribution<size_t> dist(0, core.length());
      core.insert(dist(rng), U"ab\n");
    }
  }) << "s\n";

  std::cout << tag << " backspace mid iters=" << cfg.erase_iters << " took " << timed([&]{
    size_t at = core.length() / 2;
    for (size_t i = 0; i < cfg.erase_iters && at > 0; ++i) core.erase(--at, 1);
  }) << "s\n";

  std::cout << tag << " line lookups iters=" << cfg.lookup_iters << " took " << timed([&]{
    size_t lines = core.line_count();
    volatile size_t sink = 0;
    for (size_t i = 0; i < cfg.lookup_iters; ++i) {
      std::uniform_int_distribution<size_t> row(0, lines - 1);
      sink = sink + core.line_of(core.line_start(row(rng)));
    }
  }) << "s\n";
}

int main(int argc, char** argv) {
  BenchCfg cfg;
  if (argc > 1) {
    char* end = nullptr;
    unsigned long n = std::strtoul(argv[1], &end, 10);
    if (end && *end == '\0' && n > 0) cfg.N = n;
  }
  std::cout << "Backend operations benchmark (N=" << cfg.N << ")\n";
  run<VectorTextBufferCore>(cfg);
  run<GapTextBufferCore>(cfg);
  return 0;
}
