/// @file src/core/coordinator.cpp
/// @brief Coordinator — sensor-sharded worker threads around Engine.

#include "coldstream/coordinator.hpp"

#include <fmt/format.h>

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <variant>

namespace coldstream::core {

namespace {

struct EndBackfill    { bool complete; };
struct EndBackfillFor { SensorId sensor_id; bool complete; };
struct EndSession     { SensorId sensor_id; };
struct AdvanceTime    { double now; };

using Task = std::variant<Reading, EndBackfill, EndBackfillFor, EndSession, AdvanceTime>;

} // anonymous namespace

// ─── Worker ───────────────────────────────────────────────────────────────────

struct Coordinator::Worker {
    Worker(EventSink& sink, const EngineConfig& config)
        : engine(sink, config)
    {
        thread = std::jthread([this] { run(); });
    }

    /// False once the worker is stopping; the task is dropped.
    bool push(Task task) {
        {
            std::lock_guard lock(mutex);
            if (stopping) {
                return false;
            }
            queue.push_back(std::move(task));
            ++queued;
        }
        wake.notify_one();
        return true;
    }

    void stop() {
        {
            std::lock_guard lock(mutex);
            stopping = true;
        }
        wake.notify_one();
        if (thread.joinable()) {
            thread.join();
        }
    }

    void wait_idle() {
        std::unique_lock lock(mutex);
        idle.wait(lock, [this] { return done == queued; });
    }

    void run() {
        for (;;) {
            std::deque<Task> batch;
            {
                std::unique_lock lock(mutex);
                wake.wait(lock, [this] { return !queue.empty() || stopping; });
                if (queue.empty()) {
                    break;  // stopping and drained
                }
                batch.swap(queue);
            }

            {
                std::lock_guard guard(engine_mutex);
                for (const auto& task : batch) {
                    apply(task);
                }
            }

            {
                std::lock_guard lock(mutex);
                done += batch.size();
            }
            idle.notify_all();
        }

        std::lock_guard guard(engine_mutex);
        engine.shutdown();
    }

    void apply(const Task& task) {
        std::visit([this](const auto& t) {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, Reading>) {
                (void)engine.ingest_reading(t);
            } else if constexpr (std::is_same_v<T, EndBackfill>) {
                engine.end_backfill(t.complete);
            } else if constexpr (std::is_same_v<T, EndBackfillFor>) {
                engine.end_backfill(t.sensor_id, t.complete);
            } else if constexpr (std::is_same_v<T, EndSession>) {
                engine.end_session(t.sensor_id);
            } else {
                engine.advance_time(t.now);
            }
        }, task);
    }

    std::mutex              mutex;
    std::condition_variable wake;
    std::condition_variable idle;
    std::deque<Task>        queue;
    std::size_t             queued   = 0;
    std::size_t             done     = 0;
    bool                    stopping = false;

    mutable std::mutex engine_mutex;
    Engine             engine;
    std::jthread       thread;
};

// ─── Constructor / destructor ─────────────────────────────────────────────────

Coordinator::Coordinator(EventSink& sink, EngineConfig config)
    : sink_(sink)
    , verbose_(config.verbose)
{
    if (!config.is_valid()) {
        if (verbose_) {
            fmt::print(stderr, "[coldstream] invalid engine configuration, using defaults\n");
        }
        config         = EngineConfig{};
        config.verbose = verbose_;
    }
    workers_.reserve(config.worker_count);
    for (std::size_t i = 0; i < config.worker_count; ++i) {
        workers_.push_back(std::make_unique<Worker>(sink_, config));
    }
}

Coordinator::~Coordinator() {
    shutdown();
}

// ─── Intake ───────────────────────────────────────────────────────────────────

std::size_t Coordinator::shard_of(const SensorId& sensor_id) const noexcept {
    return std::hash<SensorId>{}(sensor_id) % workers_.size();
}

IngestStatus Coordinator::submit(const RawRecord& record, Source source) {
    ++records_;
    if (!accepting_.load()) {
        ++rejected_;
        return IngestStatus::kStopped;
    }

    auto result = EventNormalizer::normalize(record, source);
    if (!result.ok()) {
        if (!is_malformed(result.error)) {
            ++ignored_;
            return IngestStatus::kIgnored;
        }
        ++malformed_;
        if (verbose_) {
            fmt::print(stderr, "[coldstream] dropped malformed {} record ({}) from '{}'\n",
                       to_string(source), to_string(result.error), record.target_name);
        }
        sink_.on_malformed(MalformedReport{
            .source = source,
            .error  = result.error,
            .record = record,
        });
        return IngestStatus::kMalformed;
    }

    const auto shard = shard_of(result.reading->sensor_id);
    if (!workers_[shard]->push(std::move(*result.reading))) {
        ++rejected_;
        return IngestStatus::kStopped;
    }
    return IngestStatus::kAccepted;
}

std::size_t Coordinator::submit_page(std::span<const RawRecord> page) {
    std::size_t accepted = 0;
    for (const auto& record : page) {
        if (submit(record, Source::Historical) == IngestStatus::kAccepted) {
            ++accepted;
        }
    }
    return accepted;
}

// ─── Control ──────────────────────────────────────────────────────────────────

void Coordinator::end_backfill(bool complete) {
    if (!accepting_.load()) {
        return;
    }
    for (auto& w : workers_) {
        (void)w->push(EndBackfill{complete});
    }
}

void Coordinator::end_backfill(const SensorId& sensor_id, bool complete) {
    if (!accepting_.load()) {
        return;
    }
    (void)workers_[shard_of(sensor_id)]->push(EndBackfillFor{sensor_id, complete});
}

void Coordinator::end_session(const SensorId& sensor_id) {
    if (!accepting_.load()) {
        return;
    }
    (void)workers_[shard_of(sensor_id)]->push(EndSession{sensor_id});
}

void Coordinator::advance_time(double now) {
    if (!accepting_.load()) {
        return;
    }
    for (auto& w : workers_) {
        (void)w->push(AdvanceTime{now});
    }
}

void Coordinator::wait_idle() {
    for (auto& w : workers_) {
        w->wait_idle();
    }
}

void Coordinator::shutdown() {
    if (!accepting_.exchange(false)) {
        return;
    }
    for (auto& w : workers_) {
        w->stop();
    }
    if (verbose_) {
        const auto c = counters();
        fmt::print(stderr,
                   "[coldstream] coordinator stopped: {} records, {} malformed, "
                   "{} events opened, {} interrupted\n",
                   c.records, c.malformed, c.events_opened, c.events_interrupted);
    }
}

// ─── Queries ──────────────────────────────────────────────────────────────────

EngineCounters Coordinator::counters() const {
    EngineCounters total;
    for (const auto& w : workers_) {
        std::lock_guard guard(w->engine_mutex);
        total += w->engine.counters();
    }
    // Workers only ever see normalized readings; intake is counted here.
    total.records    = records_.load();
    total.malformed += malformed_.load();
    total.ignored   += ignored_.load();
    total.rejected  += rejected_.load();
    return total;
}

} // namespace coldstream::core
