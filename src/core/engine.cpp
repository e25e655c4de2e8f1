/// @file src/core/engine.cpp
/// @brief Engine — single-threaded coordinator of the per-sensor pipelines.

#include "coldstream/engine.hpp"

#include "sensor_pipeline.hpp"

#include <fmt/format.h>

#include <utility>

namespace coldstream::core {

std::string_view to_string(IngestStatus status) noexcept {
    switch (status) {
        case IngestStatus::kAccepted:  return "ACCEPTED";
        case IngestStatus::kMalformed: return "MALFORMED";
        case IngestStatus::kIgnored:   return "IGNORED";
        case IngestStatus::kStopped:   return "STOPPED";
    }
    return "UNKNOWN";
}

EngineCounters& EngineCounters::operator+=(const EngineCounters& o) noexcept {
    records            += o.records;
    malformed          += o.malformed;
    ignored            += o.ignored;
    rejected           += o.rejected;
    released           += o.released;
    duplicates         += o.duplicates;
    stale              += o.stale;
    gaps               += o.gaps;
    gap_tolerated      += o.gap_tolerated;
    events_opened      += o.events_opened;
    events_closed      += o.events_closed;
    events_interrupted += o.events_interrupted;
    events_truncated   += o.events_truncated;
    return *this;
}

// ─── Engine constructor ───────────────────────────────────────────────────────

Engine::Engine(EventSink& sink, EngineConfig config)
    : sink_(sink)
    , config_(std::move(config))
{
    if (!config_.is_valid()) {
        const bool verbose = config_.verbose;
        if (verbose) {
            fmt::print(stderr, "[coldstream] invalid engine configuration, using defaults\n");
        }
        config_         = EngineConfig{};
        config_.verbose = verbose;
    }
}

Engine::~Engine() = default;

// ─── Routing ──────────────────────────────────────────────────────────────────

SensorPipeline& Engine::pipeline(const SensorId& sensor_id) {
    auto it = pipelines_.find(sensor_id);
    if (it != pipelines_.end()) {
        return *it->second;
    }

    auto created = std::make_unique<SensorPipeline>(sensor_id, config_, sink_);
    if (backfill_result_) {
        created->end_backfill(*backfill_result_);
    }
    if (config_.verbose) {
        fmt::print(stderr, "[coldstream] new sensor {}\n", sensor_id);
    }
    return *pipelines_.emplace(sensor_id, std::move(created)).first->second;
}

void Engine::register_sensor(const SensorId& sensor_id) {
    if (accepting_ && !sensor_id.empty()) {
        (void)pipeline(sensor_id);
    }
}

IngestStatus Engine::ingest(const RawRecord& record, Source source) {
    ++intake_.records;
    if (!accepting_) {
        ++intake_.rejected;
        return IngestStatus::kStopped;
    }

    auto result = EventNormalizer::normalize(record, source);
    if (!result.ok()) {
        if (!is_malformed(result.error)) {
            ++intake_.ignored;
            return IngestStatus::kIgnored;
        }
        ++intake_.malformed;
        if (config_.verbose) {
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

    pipeline(result.reading->sensor_id).push(*result.reading);
    return IngestStatus::kAccepted;
}

std::size_t Engine::ingest_historical_page(std::span<const RawRecord> page) {
    std::size_t accepted = 0;
    for (const auto& record : page) {
        if (ingest(record, Source::Historical) == IngestStatus::kAccepted) {
            ++accepted;
        }
    }
    return accepted;
}

IngestStatus Engine::ingest_reading(const Reading& reading) {
    ++intake_.records;
    if (!accepting_) {
        ++intake_.rejected;
        return IngestStatus::kStopped;
    }
    // Markers are produced by the fusion buffer, never accepted as input.
    if (reading.sensor_id.empty() || reading.is_marker()) {
        ++intake_.malformed;
        return IngestStatus::kMalformed;
    }
    pipeline(reading.sensor_id).push(reading);
    return IngestStatus::kAccepted;
}

// ─── Control ──────────────────────────────────────────────────────────────────

void Engine::end_backfill(bool complete) {
    if (!accepting_ || backfill_result_) {
        return;
    }
    backfill_result_ = complete;
    if (config_.verbose) {
        fmt::print(stderr, "[coldstream] backfill {} for {} sensors\n",
                   complete ? "complete" : "incomplete", pipelines_.size());
    }
    for (auto& [id, p] : pipelines_) {
        p->end_backfill(complete);
    }
}

void Engine::end_backfill(const SensorId& sensor_id, bool complete) {
    if (accepting_) {
        pipeline(sensor_id).end_backfill(complete);
    }
}

void Engine::advance_time(double now) {
    if (!accepting_) {
        return;
    }
    for (auto& [id, p] : pipelines_) {
        p->expire(now);
    }
}

void Engine::end_session(const SensorId& sensor_id) {
    if (!accepting_) {
        return;
    }
    if (auto it = pipelines_.find(sensor_id); it != pipelines_.end()) {
        it->second->close_session();
    }
}

void Engine::shutdown() {
    if (!accepting_) {
        return;
    }
    accepting_ = false;
    for (auto& [id, p] : pipelines_) {
        p->shutdown();
    }
    if (config_.verbose) {
        const auto c = counters();
        fmt::print(stderr,
                   "[coldstream] shutdown: {} records, {} malformed, {} fused, "
                   "{} gaps, {} events opened, {} interrupted\n",
                   c.records, c.malformed, c.released, c.gaps,
                   c.events_opened, c.events_interrupted);
    }
}

// ─── Queries ──────────────────────────────────────────────────────────────────

EngineCounters Engine::counters() const {
    EngineCounters total = intake_;
    for (const auto& [id, p] : pipelines_) {
        total += p->counters();
    }
    return total;
}

std::vector<SensorId> Engine::sensor_ids() const {
    std::vector<SensorId> ids;
    ids.reserve(pipelines_.size());
    for (const auto& [id, p] : pipelines_) {
        ids.push_back(id);
    }
    return ids;
}

std::optional<AnomalyState> Engine::state(const SensorId& sensor_id) const {
    auto it = pipelines_.find(sensor_id);
    if (it == pipelines_.end()) {
        return std::nullopt;
    }
    return it->second->classifier().state();
}

std::optional<RollingStats> Engine::stats(const SensorId& sensor_id) const {
    auto it = pipelines_.find(sensor_id);
    if (it == pipelines_.end()) {
        return std::nullopt;
    }
    return it->second->tracker().stats();
}

} // namespace coldstream::core
