/**
 * @file  tests/core/test_engine.cpp
 * @brief Unit tests for the single-threaded Engine coordinator.
 */

#include <gtest/gtest.h>
#include "coldstream/engine.hpp"
#include "coldstream/sink.hpp"

#include <string>
#include <vector>

using namespace coldstream;
using namespace coldstream::core;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static RawRecord record(const std::string& sensor, double ts, double temp) {
    RawRecord r;
    r.target_name = "projects/cold-room/devices/" + sensor;
    r.update_time = std::to_string(ts);
    r.temperature = std::to_string(temp);
    return r;
}

/// 0 °C baseline, three readings at 6 °C, back to 0 °C long enough to close.
static std::vector<RawRecord> excursion(const std::string& sensor, double t0) {
    const double temps[] = {0, 0, 0, 0, 0, 6, 6, 6, 0, 0, 0, 0, 0, 0};
    std::vector<RawRecord> page;
    for (std::size_t i = 0; i < std::size(temps); ++i) {
        page.push_back(record(sensor, t0 + 60.0 * static_cast<double>(i), temps[i]));
    }
    return page;
}

// ─── Intake ──────────────────────────────────────────────────────────────────

TEST(Engine_Ingest, ValidRecord_Accepted) {
    EventQueue sink;
    Engine engine(sink);
    EXPECT_EQ(engine.ingest(record("s1", 1000.0, 2.0), Source::Historical),
              IngestStatus::kAccepted);
    EXPECT_EQ(engine.sensor_ids(), (std::vector<SensorId>{"s1"}));
    ASSERT_TRUE(engine.stats("s1").has_value());
    EXPECT_EQ(engine.stats("s1")->count, 1u);
    EXPECT_EQ(engine.counters().records, 1u);
    EXPECT_EQ(engine.counters().released, 1u);
}

TEST(Engine_Ingest, MalformedDroppedCountedReported) {
    EventQueue sink;
    Engine engine(sink);
    auto bad = record("s1", 1000.0, 2.0);
    bad.temperature = "warm";

    EXPECT_EQ(engine.ingest(bad, Source::Live), IngestStatus::kMalformed);
    EXPECT_EQ(engine.counters().malformed, 1u);
    EXPECT_TRUE(engine.sensor_ids().empty());

    const auto reports = sink.drain_malformed();
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].error, RecordError::kBadTemperature);
    EXPECT_EQ(reports[0].source, Source::Live);
    EXPECT_EQ(reports[0].record.target_name, bad.target_name);
}

TEST(Engine_Ingest, MalformedNeverStopsStream) {
    EventQueue sink;
    Engine engine(sink);
    auto bad = record("s1", 1060.0, 2.0);
    bad.update_time = "";
    engine.ingest(record("s1", 1000.0, 2.0), Source::Historical);
    engine.ingest(bad, Source::Historical);
    engine.ingest(record("s1", 1120.0, 2.0), Source::Historical);
    EXPECT_EQ(engine.stats("s1")->count, 2u);
    EXPECT_EQ(engine.counters().malformed, 1u);
}

TEST(Engine_Ingest, NonTemperatureEventIgnored) {
    EventQueue sink;
    Engine engine(sink);
    auto touch = record("s1", 1000.0, 0.0);
    touch.event_type  = "touch";
    touch.temperature = "";

    EXPECT_EQ(engine.ingest(touch, Source::Live), IngestStatus::kIgnored);
    EXPECT_EQ(engine.counters().ignored, 1u);
    EXPECT_EQ(engine.counters().malformed, 0u);
    EXPECT_TRUE(sink.drain_malformed().empty());
    EXPECT_TRUE(engine.sensor_ids().empty());
}

TEST(Engine_Ingest, HistoricalPageCountsAccepted) {
    EventQueue sink;
    Engine engine(sink);
    auto page = excursion("s1", 0.0);
    page[3].temperature = "";
    EXPECT_EQ(engine.ingest_historical_page(page), page.size() - 1);
}

TEST(Engine_Ingest, ReadingMarkerRejected) {
    EventQueue sink;
    Engine engine(sink);
    Reading marker{.sensor_id = "s1", .timestamp = 10.0, .temperature = std::nullopt,
                   .source = Source::Historical, .annotations = kDataGap};
    EXPECT_EQ(engine.ingest_reading(marker), IngestStatus::kMalformed);
}

// ─── Sensors ─────────────────────────────────────────────────────────────────

TEST(Engine_Sensors, LazyCreationSorted) {
    EventQueue sink;
    Engine engine(sink);
    engine.ingest(record("zeta", 0.0, 1.0), Source::Live);
    engine.ingest(record("alpha", 0.0, 1.0), Source::Live);
    EXPECT_EQ(engine.sensor_ids(), (std::vector<SensorId>{"alpha", "zeta"}));
}

TEST(Engine_Sensors, RegisterCreatesPipeline) {
    EventQueue sink;
    Engine engine(sink);
    engine.register_sensor("fridge-1");
    ASSERT_TRUE(engine.state("fridge-1").has_value());
    EXPECT_EQ(*engine.state("fridge-1"), AnomalyState::Normal);
    EXPECT_FALSE(engine.state("unknown").has_value());
    EXPECT_FALSE(engine.stats("unknown").has_value());
}

// ─── Events ──────────────────────────────────────────────────────────────────

TEST(Engine_Events, ExcursionOpenedAndClosed) {
    EventQueue sink;
    Engine engine(sink);
    engine.ingest_historical_page(excursion("s1", 0.0));

    const auto events = sink.drain();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].status, EventStatus::Open);
    EXPECT_EQ(events[0].sensor_id, "s1");
    EXPECT_DOUBLE_EQ(events[0].start_time, 300.0);
    EXPECT_EQ(events[1].status, EventStatus::Closed);
    EXPECT_EQ(events[1].event_id, events[0].event_id);
    ASSERT_TRUE(events[1].end_time.has_value());
    EXPECT_DOUBLE_EQ(*events[1].end_time, 780.0);
    EXPECT_DOUBLE_EQ(events[1].peak_temperature, 6.0);

    const auto c = engine.counters();
    EXPECT_EQ(c.events_opened, 1u);
    EXPECT_EQ(c.events_closed, 1u);
}

TEST(Engine_Events, SensorsIndependent) {
    EventQueue sink;
    Engine engine(sink);
    const auto a = excursion("a", 0.0);
    // Sensor b stays cold throughout.
    for (std::size_t i = 0; i < a.size(); ++i) {
        engine.ingest(a[i], Source::Historical);
        engine.ingest(record("b", 60.0 * static_cast<double>(i), -20.0), Source::Historical);
    }
    const auto events = sink.drain();
    ASSERT_EQ(events.size(), 2u);
    for (const auto& e : events) EXPECT_EQ(e.sensor_id, "a");
    EXPECT_EQ(*engine.state("b"), AnomalyState::Normal);
}

TEST(Engine_Events, TraceForEveryFusedReading) {
    EventQueue sink;
    EngineConfig cfg;
    cfg.emit_trace = true;
    Engine engine(sink, cfg);

    for (double t : {0.0, 60.0, 120.0, 180.0, 3600.0}) {
        engine.ingest(record("s1", t, 1.0), Source::Historical);
    }
    const auto traces = sink.drain_traces();
    ASSERT_EQ(traces.size(), 6u);  // five readings plus one gap marker
    EXPECT_TRUE(traces[4].reading.is_marker());
    EXPECT_TRUE(traces[4].reading.has(kDataGap));
    EXPECT_TRUE(traces[4].classification.has(kUnverifiedGap));
    EXPECT_EQ(traces[4].stats.count, 0u);
    EXPECT_EQ(traces[5].stats.count, 1u);
    EXPECT_TRUE(traces[5].classification.has(kUnverifiedGap));
    EXPECT_EQ(engine.counters().gaps, 1u);
}

// ─── Backfill and hold ───────────────────────────────────────────────────────

TEST(Engine_Backfill, LiveHeldUntilBackfillEnds) {
    EventQueue sink;
    Engine engine(sink);
    engine.ingest(record("s1", 1000.0, 1.0), Source::Live);
    EXPECT_EQ(engine.stats("s1")->count, 0u);

    engine.end_backfill(true);
    EXPECT_EQ(engine.stats("s1")->count, 1u);
}

TEST(Engine_Backfill, GlobalFailureAppliesToLaterSensors) {
    EventQueue sink;
    EngineConfig cfg;
    cfg.emit_trace = true;
    Engine engine(sink, cfg);
    engine.end_backfill(false);

    engine.ingest(record("late", 1000.0, 1.0), Source::Live);
    const auto traces = sink.drain_traces();
    ASSERT_EQ(traces.size(), 1u);
    EXPECT_TRUE(traces[0].reading.has(kBackfillIncomplete));
}

TEST(Engine_Backfill, PerSensorEnd) {
    EventQueue sink;
    Engine engine(sink);
    engine.ingest(record("a", 1000.0, 1.0), Source::Live);
    engine.ingest(record("b", 1000.0, 1.0), Source::Live);
    engine.end_backfill("a", true);
    EXPECT_EQ(engine.stats("a")->count, 1u);
    EXPECT_EQ(engine.stats("b")->count, 0u);
}

TEST(Engine_Backfill, AdvanceTimeReleasesHeldLive) {
    EventQueue sink;
    EngineConfig cfg;
    cfg.emit_trace = true;
    Engine engine(sink, cfg);
    engine.ingest(record("s1", 1000.0, 1.0), Source::Live);

    engine.advance_time(1100.0);
    EXPECT_EQ(engine.stats("s1")->count, 0u);
    engine.advance_time(1120.0);
    EXPECT_EQ(engine.stats("s1")->count, 1u);

    const auto traces = sink.drain_traces();
    ASSERT_EQ(traces.size(), 1u);
    EXPECT_TRUE(traces[0].reading.has(kGapTolerated));
    EXPECT_EQ(engine.counters().gap_tolerated, 1u);
}

TEST(Engine_Backfill, EndSessionFlushes) {
    EventQueue sink;
    Engine engine(sink);
    engine.ingest(record("s1", 1000.0, 1.0), Source::Live);
    engine.end_session("s1");
    EXPECT_EQ(engine.stats("s1")->count, 1u);
}

// ─── Shutdown ────────────────────────────────────────────────────────────────

TEST(Engine_Shutdown, OpenEventInterrupted) {
    EventQueue sink;
    Engine engine(sink);
    auto page = excursion("s1", 0.0);
    page.resize(9);  // stop while still anomalous
    engine.ingest_historical_page(page);
    ASSERT_EQ(*engine.state("s1"), AnomalyState::Recovering);

    engine.shutdown();
    const auto events = sink.drain();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].status, EventStatus::Interrupted);
    ASSERT_TRUE(events[1].end_time.has_value());
    EXPECT_DOUBLE_EQ(*events[1].end_time, 480.0);
    EXPECT_EQ(engine.counters().events_interrupted, 1u);
}

TEST(Engine_Shutdown, FlushesHeldReadingsFirst) {
    EventQueue sink;
    Engine engine(sink);
    engine.ingest(record("s1", 1000.0, 1.0), Source::Live);
    engine.shutdown();
    EXPECT_EQ(engine.stats("s1")->count, 1u);
}

TEST(Engine_Shutdown, StopsAcceptingAndIsIdempotent) {
    EventQueue sink;
    Engine engine(sink);
    auto page = excursion("s1", 0.0);
    page.resize(8);
    engine.ingest_historical_page(page);
    engine.shutdown();
    engine.shutdown();

    EXPECT_FALSE(engine.accepting());
    EXPECT_EQ(engine.ingest(record("s1", 2000.0, 1.0), Source::Live), IngestStatus::kStopped);
    EXPECT_EQ(engine.counters().rejected, 1u);
    EXPECT_EQ(sink.drain().size(), 2u);
}

// ─── Configuration ───────────────────────────────────────────────────────────

TEST(Engine_Config, InvalidFallsBackToDefaults) {
    EventQueue sink;
    EngineConfig cfg;
    cfg.window.max_samples     = 1;
    cfg.classifier.expected_max = -100.0;
    Engine engine(sink, cfg);
    EXPECT_EQ(engine.config().window.max_samples, constants::DEFAULT_WINDOW_MAX_SAMPLES);
    EXPECT_DOUBLE_EQ(engine.config().classifier.expected_max, constants::DEFAULT_EXPECTED_MAX);
}

TEST(Engine_Config, ValidKept) {
    EventQueue sink;
    EngineConfig cfg;
    cfg.classifier.expected_max = 8.0;
    Engine engine(sink, cfg);
    EXPECT_DOUBLE_EQ(engine.config().classifier.expected_max, 8.0);
}

TEST(Engine_Status, Names) {
    EXPECT_EQ(to_string(IngestStatus::kAccepted), "ACCEPTED");
    EXPECT_EQ(to_string(IngestStatus::kStopped), "STOPPED");
}
