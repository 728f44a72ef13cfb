#include <benchmark/benchmark.h>
#include "acmeflow/retry_after.hpp"
#include <chrono>
#include <string>

using namespace acmeflow;

static const auto NOW = std::chrono::system_clock::from_time_t(1445412480);

static void BM_RetryAfter_Seconds(benchmark::State& state) {
    for (auto _ : state) {
        auto delay = retryDelay("120", NOW);
        benchmark::DoNotOptimize(delay);
    }
}
BENCHMARK(BM_RetryAfter_Seconds);

static void BM_RetryAfter_ImfFixdate(benchmark::State& state) {
    for (auto _ : state) {
        auto delay = retryDelay("Wed, 21 Oct 2015 07:30:00 GMT", NOW);
        benchmark::DoNotOptimize(delay);
    }
}
BENCHMARK(BM_RetryAfter_ImfFixdate);

// Worst case: every earlier date form is tried first
static void BM_RetryAfter_Iso8601(benchmark::State& state) {
    for (auto _ : state) {
        auto delay = retryDelay("2015-10-21T07:30:00Z", NOW);
        benchmark::DoNotOptimize(delay);
    }
}
BENCHMARK(BM_RetryAfter_Iso8601);
