/**
 * @file  bench/bench_pipeline.cpp
 * @brief Google Benchmark suite for the coldstream per-reading hot path.
 *
 * Benchmarks
 * ----------
 *   BM_Normalize_Rfc3339 / UnixSeconds   — record → Reading
 *   BM_RollingStats_Update                — Welford add + evict per sample
 *   BM_Fusion_Historical / Interleaved    — merge cost per reading
 *   BM_Engine_Page                        — full pipeline, one sensor
 *   BM_Coordinator_Page                   — sharded pipeline, many sensors
 *
 * Build (CMake):
 *   cmake -DCOLDSTREAM_BENCH=ON ..
 *   cmake --build build --target bench_pipeline
 *   ./build/bench_pipeline --benchmark_format=json
 *
 * Throughput units: items/second (readings processed).
 */

#include "benchmark/benchmark.h"

// Internal headers (need src/ on include path)
#include "fusion/fusion_buffer.hpp"
#include "stats/rolling_stats.hpp"

#include "coldstream/coordinator.hpp"
#include "coldstream/engine.hpp"
#include "coldstream/normalizer.hpp"
#include "coldstream/sink.hpp"

#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

using namespace coldstream;

// ── Fixture helpers ────────────────────────────────────────────────────────────

namespace {

constexpr double BASE = 1'583'366'400.0;

/// A sink that keeps nothing.
class NullSink final : public EventSink {
public:
    void on_event(const AnomalyEvent& event) override { benchmark::DoNotOptimize(event.event_id); }
};

/// `n` one-minute records of a freezer that warms up every 200 minutes.
std::vector<RawRecord> make_page(const std::string& sensor, std::size_t n) {
    std::vector<RawRecord> page(n);
    for (std::size_t i = 0; i < n; ++i) {
        const double temp = (i % 200) < 20 ? 8.0 : -18.0 + 0.1 * std::sin(static_cast<double>(i));
        page[i].target_name = "projects/bench/devices/" + sensor;
        page[i].update_time = std::to_string(BASE + 60.0 * static_cast<double>(i));
        page[i].temperature = std::to_string(temp);
    }
    return page;
}

std::vector<Reading> make_readings(std::size_t n, Source source, double offset = 0.0) {
    std::vector<Reading> out(n);
    for (std::size_t i = 0; i < n; ++i) {
        out[i] = Reading{
            .sensor_id   = "s",
            .timestamp   = BASE + offset + 60.0 * static_cast<double>(i),
            .temperature = -18.0,
            .source      = source,
        };
    }
    return out;
}

void set_throughput(benchmark::State& state, std::size_t n) {
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}

} // anonymous namespace

// ── Normalizer ─────────────────────────────────────────────────────────────────

static void BM_Normalize_Rfc3339(benchmark::State& state) {
    RawRecord r;
    r.target_name = "projects/bsarslgg7oekgsc2jb20/devices/bjei2dqdqfcg00a9ga3g";
    r.update_time = "2020-03-05T10:15:30.123456Z";
    r.temperature = "-17.85";
    for (auto _ : state) {
        auto result = EventNormalizer::normalize(r, Source::Live);
        benchmark::DoNotOptimize(result);
    }
    set_throughput(state, 1);
}
BENCHMARK(BM_Normalize_Rfc3339);

static void BM_Normalize_UnixSeconds(benchmark::State& state) {
    RawRecord r;
    r.target_name = "projects/p/devices/s";
    r.update_time = "1583403330.123456";
    r.temperature = "-17.85";
    for (auto _ : state) {
        auto result = EventNormalizer::normalize(r, Source::Historical);
        benchmark::DoNotOptimize(result);
    }
    set_throughput(state, 1);
}
BENCHMARK(BM_Normalize_UnixSeconds);

// ── Rolling statistics ─────────────────────────────────────────────────────────

static void BM_RollingStats_Update(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    for (auto _ : state) {
        stats::RollingStatsTracker tracker;
        for (std::size_t i = 0; i < n; ++i) {
            const auto& s = tracker.update(BASE + 5.0 * static_cast<double>(i),
                                           -18.0 + 0.01 * static_cast<double>(i % 17));
            benchmark::DoNotOptimize(s.mean);
        }
    }
    set_throughput(state, n);
}
BENCHMARK(BM_RollingStats_Update)->RangeMultiplier(4)->Range(256, 16384)->Unit(benchmark::kMicrosecond);

// ── Fusion ─────────────────────────────────────────────────────────────────────

static void BM_Fusion_Historical(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto hist = make_readings(n, Source::Historical);
    std::vector<Reading> out;
    out.reserve(n);
    for (auto _ : state) {
        fusion::FusionBuffer buf("s");
        out.clear();
        for (const auto& r : hist) buf.push_historical(r, out);
        benchmark::DoNotOptimize(out.data());
    }
    set_throughput(state, n);
}
BENCHMARK(BM_Fusion_Historical)->RangeMultiplier(4)->Range(256, 16384)->Unit(benchmark::kMicrosecond);

static void BM_Fusion_Interleaved(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto hist = make_readings(n, Source::Historical);
    const auto live = make_readings(n, Source::Live, 60.0 * static_cast<double>(n / 2));
    std::vector<Reading> out;
    out.reserve(2 * n);
    for (auto _ : state) {
        fusion::FusionBuffer buf("s");
        out.clear();
        for (std::size_t i = 0; i < n; ++i) {
            buf.push_historical(hist[i], out);
            buf.push_live(live[i], out);
        }
        buf.end_backfill(true, out);
        benchmark::DoNotOptimize(out.data());
    }
    set_throughput(state, 2 * n);
}
BENCHMARK(BM_Fusion_Interleaved)->RangeMultiplier(4)->Range(256, 16384)->Unit(benchmark::kMicrosecond);

// ── Full pipeline ──────────────────────────────────────────────────────────────

static void BM_Engine_Page(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto page = make_page("s", n);
    NullSink sink;
    for (auto _ : state) {
        core::Engine engine(sink);
        engine.ingest_historical_page(page);
        engine.shutdown();
    }
    set_throughput(state, n);
}
BENCHMARK(BM_Engine_Page)->RangeMultiplier(4)->Range(256, 16384)->Unit(benchmark::kMicrosecond);

static void BM_Coordinator_Page(benchmark::State& state) {
    const std::size_t workers = static_cast<std::size_t>(state.range(0));
    std::vector<RawRecord> page;
    for (int s = 0; s < 16; ++s) {
        const auto p = make_page("s" + std::to_string(s), 1024);
        page.insert(page.end(), p.begin(), p.end());
    }
    NullSink sink;
    EngineConfig cfg;
    cfg.worker_count = workers;
    for (auto _ : state) {
        core::Coordinator coord(sink, cfg);
        coord.submit_page(page);
        coord.shutdown();
    }
    set_throughput(state, page.size());
}
BENCHMARK(BM_Coordinator_Page)->Arg(1)->Arg(2)->Arg(4)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
