/**
 * @file  tests/core/test_source_pump.cpp
 * @brief Tests for SourcePump with in-memory source doubles.
 */

#include <gtest/gtest.h>
#include "coldstream/sources.hpp"
#include "coldstream/sink.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <limits>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace coldstream;
using namespace coldstream::core;
using namespace std::chrono_literals;

// ─── Source doubles ──────────────────────────────────────────────────────────

namespace {

RawRecord record(const std::string& sensor, double ts, double temp) {
    RawRecord r;
    r.target_name = "projects/cold-room/devices/" + sensor;
    r.update_time = std::to_string(ts);
    r.temperature = std::to_string(temp);
    return r;
}

class PagedHistory final : public HistoricalSource {
public:
    PagedHistory(const SourceCredentials& creds, std::vector<Page> pages, bool available = true)
        : project_(creds.project_id), pages_(pages.begin(), pages.end()), available_(available) {}

    bool open() override { return available_; }

    Page next_page() override {
        if (pages_.empty()) {
            return Page{.records = {}, .status = PageStatus::kLast, .error = {}};
        }
        Page p = std::move(pages_.front());
        pages_.pop_front();
        return p;
    }

    const std::string& project() const { return project_; }

private:
    std::string      project_;
    std::deque<Page> pages_;
    bool             available_;
};

/// Yields queued records, then either disconnects or idles until stopped.
/// The first `good_opens` calls to open() succeed, later ones fail.
class ScriptedLive final : public LiveSource {
public:
    explicit ScriptedLive(std::vector<RawRecord> records,
                          int  good_opens            = std::numeric_limits<int>::max(),
                          bool disconnect_when_empty = false)
        : records_(records.begin(), records.end())
        , good_opens_(good_opens)
        , disconnect_(disconnect_when_empty) {}

    bool open() override {
        ++opens;
        if (good_opens_ > 0) {
            --good_opens_;
            return true;
        }
        return false;
    }

    std::optional<RawRecord> next(std::stop_token stop) override {
        {
            std::lock_guard lock(mutex_);
            if (!records_.empty()) {
                RawRecord r = std::move(records_.front());
                records_.pop_front();
                ++delivered;
                return r;
            }
        }
        if (disconnect_) {
            return std::nullopt;
        }
        while (!stop.stop_requested()) std::this_thread::sleep_for(1ms);
        return std::nullopt;
    }

    std::atomic<int> opens{0};
    std::atomic<int> delivered{0};

private:
    std::mutex            mutex_;
    std::deque<RawRecord> records_;
    std::atomic<int>      good_opens_;
    bool                  disconnect_;
};

PumpConfig fast_pump() {
    PumpConfig cfg;
    cfg.max_reconnects  = 3;
    cfg.reconnect_delay = 1ms;
    return cfg;
}

} // anonymous namespace

// ─── start ───────────────────────────────────────────────────────────────────

TEST(SourcePump_Start, BothUnavailable_Fatal) {
    EventQueue sink;
    Coordinator coord(sink);
    SourceCredentials creds{.api_base = "https://example.invalid", .project_id = "p",
                            .key_id = "k", .secret = "s"};
    PagedHistory history(creds, {}, /*available=*/false);
    ScriptedLive live({}, /*good_opens=*/0);

    SourcePump pump(coord, history, live, fast_pump());
    EXPECT_EQ(pump.start(), PumpStatus::kBothSourcesUnavailable);
    EXPECT_EQ(to_string(PumpStatus::kBothSourcesUnavailable), "BOTH_SOURCES_UNAVAILABLE");
}

TEST(SourcePump_Start, SecondStartRejected) {
    EventQueue sink;
    Coordinator coord(sink);
    PagedHistory history(SourceCredentials{}, {});
    ScriptedLive live({});
    SourcePump pump(coord, history, live, fast_pump());
    EXPECT_EQ(pump.start(), PumpStatus::kStarted);
    EXPECT_EQ(pump.start(), PumpStatus::kAlreadyStarted);
    pump.stop();
}

// ─── History ─────────────────────────────────────────────────────────────────

TEST(SourcePump_History, PagesFedThenBackfillComplete) {
    EventQueue sink;
    EngineConfig cfg;
    cfg.emit_trace = true;
    Coordinator coord(sink, cfg);

    std::vector<Page> pages(3);
    for (int p = 0; p < 3; ++p) {
        for (int i = 0; i < 4; ++i) {
            pages[p].records.push_back(record("s1", 60.0 * (p * 4 + i), 1.0));
        }
    }
    pages[2].status = PageStatus::kLast;
    SourceCredentials creds;
    creds.project_id = "cold-room";
    PagedHistory history(creds, std::move(pages));
    EXPECT_EQ(history.project(), "cold-room");
    ScriptedLive live({});

    SourcePump pump(coord, history, live, fast_pump());
    ASSERT_EQ(pump.start(), PumpStatus::kStarted);
    pump.wait_history();
    EXPECT_TRUE(pump.history_done());
    EXPECT_EQ(pump.pages(), 3u);

    pump.stop();
    coord.shutdown();
    const auto traces = sink.drain_traces();
    ASSERT_EQ(traces.size(), 12u);
    for (const auto& t : traces) EXPECT_FALSE(t.reading.has(kBackfillIncomplete));
}

TEST(SourcePump_History, FailedPagingMarksBackfillIncomplete) {
    EventQueue sink;
    EngineConfig cfg;
    cfg.emit_trace = true;
    Coordinator coord(sink, cfg);

    Page failed;
    failed.status = PageStatus::kFailed;
    failed.error  = "HTTP 503";
    PagedHistory history(SourceCredentials{}, {failed});
    ScriptedLive live({record("s1", 1000.0, 1.0)});

    SourcePump pump(coord, history, live, fast_pump());
    ASSERT_EQ(pump.start(), PumpStatus::kStarted);
    pump.wait_history();
    while (live.delivered.load() < 1) std::this_thread::sleep_for(1ms);
    pump.stop();
    coord.shutdown();

    const auto traces = sink.drain_traces();
    ASSERT_EQ(traces.size(), 1u);
    EXPECT_TRUE(traces[0].reading.has(kBackfillIncomplete));
}

TEST(SourcePump_History, UnavailableHistoryRunsLiveOnly) {
    EventQueue sink;
    Coordinator coord(sink);
    PagedHistory history(SourceCredentials{}, {}, /*available=*/false);
    ScriptedLive live({record("s1", 0.0, 1.0), record("s1", 60.0, 1.0)});

    SourcePump pump(coord, history, live, fast_pump());
    ASSERT_EQ(pump.start(), PumpStatus::kStarted);
    EXPECT_TRUE(pump.history_done());
    while (live.delivered.load() < 2) std::this_thread::sleep_for(1ms);
    pump.stop();
    coord.shutdown();
    EXPECT_EQ(coord.counters().released, 2u);
}

// ─── Live reconnect ──────────────────────────────────────────────────────────

TEST(SourcePump_Live, ReconnectsAfterDisconnect) {
    EventQueue sink;
    Coordinator coord(sink);
    PagedHistory history(SourceCredentials{}, {});
    // Stream drops once its records are delivered; each re-open succeeds.
    ScriptedLive live({record("s1", 0.0, 1.0)}, std::numeric_limits<int>::max(),
                      /*disconnect_when_empty=*/true);

    SourcePump pump(coord, history, live, fast_pump());
    ASSERT_EQ(pump.start(), PumpStatus::kStarted);
    while (pump.reconnects() < 2) std::this_thread::sleep_for(1ms);
    pump.stop();
    EXPECT_GE(live.opens.load(), 3);
    EXPECT_FALSE(pump.live_running());
}

TEST(SourcePump_Live, GivesUpAfterMaxReconnects) {
    EventQueue sink;
    Coordinator coord(sink);
    PagedHistory history(SourceCredentials{}, {});
    // First open succeeds, the stream drops, every re-open fails.
    ScriptedLive live({}, /*good_opens=*/1, /*disconnect_when_empty=*/true);

    SourcePump pump(coord, history, live, fast_pump());
    ASSERT_EQ(pump.start(), PumpStatus::kStarted);
    pump.wait_live();
    EXPECT_FALSE(pump.live_running());
    EXPECT_EQ(live.opens.load(), 1 + 3);
    EXPECT_EQ(pump.reconnects(), 0u);
    pump.stop();
}
