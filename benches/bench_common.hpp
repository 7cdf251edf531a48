#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <functional>
#include <iostream>
#include <string>

namespace textguard::bench {

/// Times `iterations` calls of `fn` over an input of `input_bytes` bytes, after one
/// untimed warm-up call. Prints average and slowest call plus throughput.
inline void run_bench(const std::string &name, int iterations, std::size_t input_bytes,
                      const std::function<void()> &fn) {
  using clock = std::chrono::steady_clock;
  fn();

  std::chrono::microseconds total{0};
  std::chrono::microseconds slowest{0};
  for (int i = 0; i < iterations; ++i) {
    const auto start = clock::now();
    fn();
    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(clock::now() - start);
    total += elapsed;
    slowest = std::max(slowest, elapsed);
  }

  const double avg_us = static_cast<double>(total.count()) / static_cast<double>(iterations);
  const double mb_per_s = avg_us > 0.0 ? static_cast<double>(input_bytes) / avg_us : 0.0;
  std::cout << name << ": iterations=" << iterations << " bytes=" << input_bytes
            << " avg_us=" << avg_us << " max_us=" << slowest.count() << " mb_per_s=" << mb_per_s
            << "\n";
}

} // namespace textguard::bench
