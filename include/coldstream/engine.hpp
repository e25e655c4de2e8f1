#pragma once

/// @file include/coldstream/engine.hpp
/// @brief Engine — single-threaded coordinator of the per-sensor pipelines.
///
/// # Module: Engine Coordinator
///
/// ## Responsibility
/// Route every incoming record to its sensor's pipeline:
///   RawRecord → EventNormalizer → FusionBuffer → RollingStatsTracker
///             → AnomalyClassifier → EventSink
/// creating the pipeline lazily on first sighting of a sensor id, and
/// multiplex all AnomalyEvents into one sink, tagged by sensor id.
///
/// ## Usage
/// ```cpp
/// EventQueue events;
/// Engine engine(events);
/// engine.ingest_historical_page(page);          // any number of pages
/// engine.end_backfill(true);                    // paging finished
/// engine.ingest(live_record, Source::Live);     // as records arrive
/// engine.shutdown();                            // flush, INTERRUPTED events
/// for (const auto& e : events.drain()) { ... }
/// ```
///
/// ## Guarantees
/// - Deterministic: identical input order yields identical sink calls
/// - Malformed records are dropped, counted and reported, never fatal
/// - After shutdown() no input is accepted
///
/// ## NOT Responsible For
/// - Threads (see coordinator.hpp)
/// - Fetching records (see sources.hpp)

#include "coldstream/config.hpp"
#include "coldstream/normalizer.hpp"
#include "coldstream/sink.hpp"
#include "coldstream/types.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace coldstream::core {

class SensorPipeline;

// ─── IngestStatus ─────────────────────────────────────────────────────────────

enum class IngestStatus {
    kAccepted,
    kMalformed,  ///< Dropped as MALFORMED_RECORD
    kIgnored,    ///< Not a temperature event
    kStopped,    ///< Engine no longer accepts input
};

[[nodiscard]] std::string_view to_string(IngestStatus status) noexcept;

// ─── EngineCounters ───────────────────────────────────────────────────────────

struct EngineCounters {
    std::size_t records            = 0;  ///< Raw records offered
    std::size_t malformed          = 0;
    std::size_t ignored            = 0;
    std::size_t rejected           = 0;  ///< Offered after shutdown
    std::size_t released           = 0;  ///< Fused readings, markers excluded
    std::size_t duplicates         = 0;
    std::size_t stale              = 0;
    std::size_t gaps               = 0;
    std::size_t gap_tolerated      = 0;
    std::size_t events_opened      = 0;
    std::size_t events_closed      = 0;
    std::size_t events_interrupted = 0;
    std::size_t events_truncated   = 0;

    EngineCounters& operator+=(const EngineCounters& other) noexcept;
};

// ─── Engine ───────────────────────────────────────────────────────────────────

class Engine {
public:
    /// `sink` must outlive the engine. An invalid `config` is replaced by
    /// the defaults.
    explicit Engine(EventSink& sink, EngineConfig config = EngineConfig{});
    ~Engine();

    Engine(const Engine&)            = delete;
    Engine& operator=(const Engine&) = delete;

    /// Create the pipeline for a known device ahead of its first record.
    void register_sensor(const SensorId& sensor_id);

    /// Normalize and route one raw record.
    IngestStatus ingest(const RawRecord& record, Source source);

    /// Route every record of one historical page. Page boundaries carry no
    /// meaning; returns the number of records accepted.
    std::size_t ingest_historical_page(std::span<const RawRecord> page);

    /// Route an already normalized reading by its `source`.
    IngestStatus ingest_reading(const Reading& reading);

    /// Historical paging ended for every sensor, including sensors first
    /// seen later. `complete == false` means BACKFILL_INCOMPLETE.
    void end_backfill(bool complete);

    /// Historical paging ended for one sensor.
    void end_backfill(const SensorId& sensor_id, bool complete);

    /// Release live readings held longer than the hold timeout at data
    /// time `now` (epoch seconds).
    void advance_time(double now);

    /// The sensor's stream session ended: flush its fusion cursor.
    void end_session(const SensorId& sensor_id);

    /// Stop accepting input, flush every pending reading through the
    /// pipelines and emit open events as INTERRUPTED. Idempotent.
    void shutdown();

    [[nodiscard]] bool accepting() const noexcept { return accepting_; }
    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }
    [[nodiscard]] EngineCounters counters() const;
    [[nodiscard]] std::vector<SensorId> sensor_ids() const;

    /// Current state of a sensor, or nullopt for an unknown sensor.
    [[nodiscard]] std::optional<AnomalyState> state(const SensorId& sensor_id) const;

    /// Current rolling statistics of a sensor, or nullopt for an unknown one.
    [[nodiscard]] std::optional<RollingStats> stats(const SensorId& sensor_id) const;

private:
    SensorPipeline& pipeline(const SensorId& sensor_id);

    EventSink&                                          sink_;
    EngineConfig                                        config_;
    std::map<SensorId, std::unique_ptr<SensorPipeline>> pipelines_;
    std::optional<bool>                                 backfill_result_;
    EngineCounters                                      intake_{};
    bool                                                accepting_ = true;
};

}  // namespace coldstream::core
