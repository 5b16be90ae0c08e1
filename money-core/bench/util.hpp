#ifndef MONEY_BENCH_UTIL_HPP
#define MONEY_BENCH_UTIL_HPP

#include <benchmark/benchmark.h>
#include <fmt/format.h>

#include <string>
#include <vector>

/// @brief 以 ns/op 與吞吐量呈現結果的 console reporter
class ThroughputBenchmarkReporter : public benchmark::ConsoleReporter {
 public:
  bool ReportContext(const Context& context) override {
    bool result = ConsoleReporter::ReportContext(context);

    fmt::print("{}\n", std::string(60, '='));
    fmt::print("Money Benchmark Results\n");
    fmt::print("{}\n", std::string(60, '='));

    return result;
  }

  void ReportRuns(const std::vector<Run>& reports) override {
    for (const auto& run : reports) {
      if (run.error_occurred) continue;

      double ns_per_op = run.GetAdjustedRealTime();

      fmt::print("{:<44} {:>10.2f}ns\n", run.benchmark_name(), ns_per_op);

      // 公式: (1 sec / latency_ns) * 10^9 / 10^6 = 1000 / latency_ns
      if (ns_per_op > 0) {
        fmt::print("{:<44} {:>10.2f} M ops/s\n", "", 1000.0 / ns_per_op);
      }
    }
  }
};

#endif
