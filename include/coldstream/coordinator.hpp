#pragma once

/// @file include/coldstream/coordinator.hpp
/// @brief Coordinator — sensor-sharded worker threads around Engine.
///
/// # Module: Engine Coordinator (concurrent front end)
///
/// Sensors are independent, so the Coordinator partitions them by a hash of
/// the sensor id over `worker_count` worker threads. Each worker owns one
/// Engine and drains its own task queue, so every per-sensor pipeline is
/// touched by exactly one thread and per-sensor order is the submission
/// order. Normalization runs on the submitting thread.
///
/// The EventSink is shared by all workers and must be thread-safe
/// (EventQueue and FormattingSink are). Events of different sensors may
/// interleave in any order; events of one sensor never reorder.
///
/// shutdown() drains every queue, flushes the fusion buffers and emits open
/// events as INTERRUPTED before the workers exit. The destructor calls it.

#include "coldstream/config.hpp"
#include "coldstream/engine.hpp"
#include "coldstream/normalizer.hpp"
#include "coldstream/sink.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <span>
#include <vector>

namespace coldstream::core {

class Coordinator {
public:
    /// `sink` must outlive the coordinator.
    explicit Coordinator(EventSink& sink, EngineConfig config = EngineConfig{});
    ~Coordinator();

    Coordinator(const Coordinator&)            = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    /// Normalize one record and queue it on its sensor's worker.
    IngestStatus submit(const RawRecord& record, Source source);

    /// Queue a historical page; returns the number of records accepted.
    std::size_t submit_page(std::span<const RawRecord> page);

    /// Historical paging ended (for every sensor, present and future).
    void end_backfill(bool complete);

    /// Historical paging ended for one sensor; routed to its worker.
    void end_backfill(const SensorId& sensor_id, bool complete);

    /// The sensor's stream session ended: flush its held live readings.
    void end_session(const SensorId& sensor_id);

    /// Forward a data-time tick to every worker.
    void advance_time(double now);

    /// Block until every task queued so far has been processed.
    void wait_idle();

    /// Stop accepting input, drain, flush and join the workers. Idempotent.
    void shutdown();

    [[nodiscard]] bool accepting() const noexcept { return accepting_.load(); }
    [[nodiscard]] std::size_t worker_count() const noexcept { return workers_.size(); }

    /// Sum over all workers plus intake counts of this thread.
    [[nodiscard]] EngineCounters counters() const;

    /// Worker index a sensor id is routed to.
    [[nodiscard]] std::size_t shard_of(const SensorId& sensor_id) const noexcept;

private:
    struct Worker;

    EventSink&                           sink_;
    std::vector<std::unique_ptr<Worker>> workers_;
    std::atomic<bool>                    accepting_{true};
    std::atomic<std::size_t>             records_{0};
    std::atomic<std::size_t>             malformed_{0};
    std::atomic<std::size_t>             ignored_{0};
    std::atomic<std::size_t>             rejected_{0};
    bool                                 verbose_ = false;
};

}  // namespace coldstream::core
