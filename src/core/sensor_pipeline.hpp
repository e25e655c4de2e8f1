#pragma once

/// @file src/core/sensor_pipeline.hpp
/// @brief SensorPipeline — Fusion Buffer → Tracker → Classifier for one sensor.
///
/// Owned by exactly one Engine; only the thread driving that Engine touches
/// it. Fused readings flow through the tracker and the classifier in
/// release order, and every resulting event or trace is handed to the sink
/// before the next reading is processed.

#include "coldstream/config.hpp"
#include "coldstream/engine.hpp"
#include "coldstream/sink.hpp"
#include "coldstream/types.hpp"

#include "../classifier/anomaly_classifier.hpp"
#include "../fusion/fusion_buffer.hpp"
#include "../stats/rolling_stats.hpp"

#include <vector>

namespace coldstream::core {

class SensorPipeline {
public:
    SensorPipeline(SensorId sensor_id, const EngineConfig& config, EventSink& sink);

    /// Route by `reading.source` into the fusion buffer and process whatever
    /// it releases.
    void push(const Reading& reading);

    void end_backfill(bool complete);
    void expire(double now);
    void close_session();

    /// Flush pending readings and interrupt an open event.
    void shutdown();

    /// Fusion and event counters of this sensor.
    [[nodiscard]] EngineCounters counters() const;

    [[nodiscard]] const fusion::FusionBuffer&            fusion() const noexcept { return fusion_; }
    [[nodiscard]] const stats::RollingStatsTracker&      tracker() const noexcept { return tracker_; }
    [[nodiscard]] const classifier::AnomalyClassifier&   classifier() const noexcept { return classifier_; }

private:
    /// Feed `released_` through tracker and classifier, then clear it.
    void process();
    void emit(const AnomalyEvent& event);

    fusion::FusionBuffer          fusion_;
    stats::RollingStatsTracker    tracker_;
    classifier::AnomalyClassifier classifier_;
    EventSink&                    sink_;
    bool                          trace_;
    bool                          verbose_;

    std::vector<Reading>      released_;
    std::vector<AnomalyEvent> events_;
    EngineCounters            event_counts_{};
};

} // namespace coldstream::core
