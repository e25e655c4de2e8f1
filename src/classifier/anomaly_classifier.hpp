#pragma once

/// @file src/classifier/anomaly_classifier.hpp
/// @brief AnomalyClassifier — per-sensor hysteresis state machine.
///
/// # Module: Anomaly Classifier
///
/// ## States and Transitions
/// With soft = expected_max − margin and hard = expected_max:
/// ```
///   NORMAL     → WARMING     T > soft, or short-term slope > slope_threshold
///                            for k consecutive readings
///   WARMING    → ANOMALOUS   T > hard after ≥ k WARMING readings, or T held
///                            above soft for longer than warming_grace_period
///                            (opens an AnomalyEvent starting at WARMING entry)
///   WARMING    → NORMAL      T ≤ soft and slope back under threshold
///   ANOMALOUS  → RECOVERING  T < soft
///   RECOVERING → ANOMALOUS   T ≥ soft before recovery_hold_period elapses
///                            (same event continues)
///   RECOVERING → NORMAL      T < soft for recovery_hold_period (closes event)
/// ```
/// Durations are measured between reading timestamps only, so bursty
/// backfill and real-time input classify identically.
///
/// ## Gaps and Warm-up
/// A DATA_GAP marker forces NORMAL and notes UNVERIFIED_GAP; an open event is
/// emitted as TRUNCATED_BY_GAP ending at the last reading before the gap.
/// While the window holds fewer than `min_samples` readings the sensor stays
/// NORMAL with the WARMING_UP note (and UNVERIFIED_GAP after a gap).
///
/// ## Guarantees
/// - peak_temperature is the maximum over every reading from start_time to
///   end_time inclusive
/// - At most one event is open per sensor

#include "coldstream/config.hpp"
#include "coldstream/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace coldstream::classifier {

class AnomalyClassifier {
public:
    explicit AnomalyClassifier(SensorId sensor_id, ClassifierConfig config = ClassifierConfig{});

    /// Classify one fused reading. Emitted events (open or ended) are
    /// appended to `events`.
    Classification on_reading(double timestamp, double temperature,
                              const RollingStats& stats,
                              std::vector<AnomalyEvent>& events);

    /// Handle a DATA_GAP marker.
    Classification on_gap(std::vector<AnomalyEvent>& events);

    /// Close the open event, if any, as INTERRUPTED at the last reading seen.
    [[nodiscard]] std::optional<AnomalyEvent> interrupt();

    [[nodiscard]] AnomalyState state() const noexcept { return state_; }
    [[nodiscard]] const std::optional<AnomalyEvent>& open_event() const noexcept { return open_; }
    [[nodiscard]] std::optional<double> last_seen() const noexcept { return last_seen_; }
    [[nodiscard]] const ClassifierConfig& config() const noexcept { return config_; }

private:
    void enter_warming(double timestamp, double temperature);
    void escalate(AnomalyKind kind, std::vector<AnomalyEvent>& events);
    void end_event(double end_time, EventStatus status, std::vector<AnomalyEvent>& events);
    void reset_episode() noexcept;

    SensorId         sensor_id_;
    ClassifierConfig config_;
    AnomalyState     state_ = AnomalyState::Normal;

    // Episode bookkeeping (WARMING entry until back to NORMAL).
    double                warming_start_   = 0.0;
    std::size_t           warming_samples_ = 0;
    std::optional<double> above_soft_since_;
    std::optional<double> recovering_since_;
    double                peak_ = 0.0;

    std::size_t                 slope_streak_ = 0;
    bool                        gap_pending_  = false;
    std::optional<double>       last_seen_;
    std::optional<AnomalyEvent> open_;
    std::uint64_t               next_event_id_ = 1;
};

} // namespace coldstream::classifier
