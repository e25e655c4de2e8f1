/// @file src/core/sensor_pipeline.cpp
/// @brief SensorPipeline — Fusion Buffer → Tracker → Classifier for one sensor.

#include "sensor_pipeline.hpp"

#include <fmt/format.h>

#include <utility>

namespace coldstream::core {

// ─── Constructor ──────────────────────────────────────────────────────────────

SensorPipeline::SensorPipeline(SensorId sensor_id, const EngineConfig& config,
                               EventSink& sink)
    : fusion_(sensor_id, config.fusion)
    , tracker_(config.window)
    , classifier_(std::move(sensor_id), config.classifier)
    , sink_(sink)
    , trace_(config.emit_trace)
    , verbose_(config.verbose)
{}

// ─── Input ────────────────────────────────────────────────────────────────────

void SensorPipeline::push(const Reading& reading) {
    if (reading.source == Source::Historical) {
        fusion_.push_historical(reading, released_);
    } else {
        fusion_.push_live(reading, released_);
    }
    process();
}

void SensorPipeline::end_backfill(bool complete) {
    fusion_.end_backfill(complete, released_);
    if (!complete && verbose_) {
        fmt::print(stderr, "[coldstream] {}: backfill incomplete, continuing live-only\n",
                   fusion_.sensor_id());
    }
    process();
}

void SensorPipeline::expire(double now) {
    fusion_.expire(now, released_);
    process();
}

void SensorPipeline::close_session() {
    fusion_.close(released_);
    process();
}

void SensorPipeline::shutdown() {
    fusion_.flush(released_);
    process();
    if (auto ended = classifier_.interrupt()) {
        emit(*ended);
    }
}

// ─── Processing ───────────────────────────────────────────────────────────────

void SensorPipeline::process() {
    for (const auto& reading : released_) {
        Classification classification;
        if (reading.is_marker()) {
            tracker_.reset();
            classification = classifier_.on_gap(events_);
            if (verbose_) {
                fmt::print(stderr, "[coldstream] {}: data gap before t={:.3f}\n",
                           reading.sensor_id, reading.timestamp);
            }
        } else {
            const auto& stats = tracker_.update(reading.timestamp, *reading.temperature);
            classification = classifier_.on_reading(reading.timestamp, *reading.temperature,
                                                    stats, events_);
        }

        if (trace_) {
            sink_.on_trace(TraceRecord{
                .reading        = reading,
                .stats          = tracker_.stats(),
                .classification = classification,
            });
        }
        for (const auto& event : events_) {
            emit(event);
        }
        events_.clear();
    }
    released_.clear();
}

void SensorPipeline::emit(const AnomalyEvent& event) {
    switch (event.status) {
        case EventStatus::Open:           ++event_counts_.events_opened;      break;
        case EventStatus::Closed:         ++event_counts_.events_closed;      break;
        case EventStatus::Interrupted:    ++event_counts_.events_interrupted; break;
        case EventStatus::TruncatedByGap: ++event_counts_.events_truncated;   break;
    }
    if (verbose_) {
        fmt::print(stderr, "[coldstream] {}\n", format_event(event));
    }
    sink_.on_event(event);
}

// ─── Counters ─────────────────────────────────────────────────────────────────

EngineCounters SensorPipeline::counters() const {
    EngineCounters c = event_counts_;
    const auto& f    = fusion_.counters();
    c.released      = f.released;
    c.duplicates    = f.duplicates;
    c.stale         = f.stale;
    c.gaps          = f.gaps;
    c.gap_tolerated = f.gap_tolerated;
    return c;
}

} // namespace coldstream::core
