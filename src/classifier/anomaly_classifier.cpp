/// @file src/classifier/anomaly_classifier.cpp
/// @brief AnomalyClassifier — per-sensor hysteresis state machine.

#include "anomaly_classifier.hpp"

#include <algorithm>
#include <utility>

namespace coldstream::classifier {

// ─── Constructor ──────────────────────────────────────────────────────────────

AnomalyClassifier::AnomalyClassifier(SensorId sensor_id, ClassifierConfig config)
    : sensor_id_(std::move(sensor_id))
    , config_(config)
{}

// ─── on_reading ───────────────────────────────────────────────────────────────

Classification
AnomalyClassifier::on_reading(double timestamp, double temperature,
                              const RollingStats& stats,
                              std::vector<AnomalyEvent>& events) {
    last_seen_ = timestamp;

    std::uint8_t notes = kNoNote;
    if (temperature < config_.expected_min) {
        notes |= kBelowExpectedMin;
    }

    // A fresh window is not evidence yet, and right after a gap a single
    // sample never is. An excursion already in progress keeps being tracked
    // even if eviction thins the window.
    const bool refilling = gap_pending_ && stats.count < 2;
    if (state_ == AnomalyState::Normal && (stats.count < config_.min_samples || refilling)) {
        notes |= kWarmingUp;
        if (gap_pending_) {
            notes |= kUnverifiedGap;
        }
        slope_streak_ = 0;
        return {.state = state_, .notes = notes};
    }
    gap_pending_ = false;

    const double soft = config_.soft_threshold();
    const double hard = config_.expected_max;
    const bool rising = stats.short_term_slope && *stats.short_term_slope > config_.slope_threshold;
    slope_streak_ = rising ? slope_streak_ + 1 : 0;

    if (state_ != AnomalyState::Normal) {
        peak_ = std::max(peak_, temperature);
        if (open_) {
            open_->peak_temperature = peak_;
        }
    }

    switch (state_) {
        case AnomalyState::Normal:
            if (temperature > soft || slope_streak_ >= config_.k) {
                enter_warming(timestamp, temperature);
            }
            break;

        case AnomalyState::Warming:
            if (temperature > soft) {
                if (!above_soft_since_) {
                    above_soft_since_ = timestamp;
                }
            } else {
                above_soft_since_.reset();
            }

            if (temperature > hard && warming_samples_ >= config_.k) {
                escalate(AnomalyKind::OverTemperature, events);
            } else if (above_soft_since_ &&
                       timestamp - *above_soft_since_ > config_.warming_grace_period_s) {
                escalate(AnomalyKind::SustainedWarming, events);
            } else if (temperature <= soft && !rising) {
                // Receded before escalation: pure debounce, nothing emitted.
                state_ = AnomalyState::Normal;
                reset_episode();
            } else {
                ++warming_samples_;
            }
            break;

        case AnomalyState::Anomalous:
            if (temperature < soft) {
                state_ = AnomalyState::Recovering;
                recovering_since_ = timestamp;
            }
            break;

        case AnomalyState::Recovering:
            if (temperature >= soft) {
                state_ = AnomalyState::Anomalous;
                recovering_since_.reset();
            } else if (timestamp - *recovering_since_ >= config_.recovery_hold_period_s) {
                end_event(timestamp, EventStatus::Closed, events);
                state_ = AnomalyState::Normal;
                reset_episode();
            }
            break;
    }

    return {.state = state_, .notes = notes};
}

// ─── on_gap ───────────────────────────────────────────────────────────────────

Classification AnomalyClassifier::on_gap(std::vector<AnomalyEvent>& events) {
    if (open_) {
        end_event(last_seen_.value_or(open_->start_time), EventStatus::TruncatedByGap, events);
    }
    state_ = AnomalyState::Normal;
    reset_episode();
    slope_streak_ = 0;
    gap_pending_  = true;
    return {.state = state_, .notes = kUnverifiedGap};
}

// ─── interrupt ────────────────────────────────────────────────────────────────

std::optional<AnomalyEvent> AnomalyClassifier::interrupt() {
    if (!open_) {
        return std::nullopt;
    }
    std::vector<AnomalyEvent> ended;
    end_event(last_seen_.value_or(open_->start_time), EventStatus::Interrupted, ended);
    state_ = AnomalyState::Normal;
    reset_episode();
    return ended.front();
}

// ─── Transitions ──────────────────────────────────────────────────────────────

void AnomalyClassifier::enter_warming(double timestamp, double temperature) {
    state_            = AnomalyState::Warming;
    warming_start_    = timestamp;
    warming_samples_  = 1;
    peak_             = temperature;
    above_soft_since_.reset();
    if (temperature > config_.soft_threshold()) {
        above_soft_since_ = timestamp;
    }
}

void AnomalyClassifier::escalate(AnomalyKind kind, std::vector<AnomalyEvent>& events) {
    state_ = AnomalyState::Anomalous;
    open_  = AnomalyEvent{
        .sensor_id        = sensor_id_,
        .event_id         = next_event_id_++,
        .start_time       = warming_start_,
        .end_time         = std::nullopt,
        .peak_temperature = peak_,
        .kind             = kind,
        .status           = EventStatus::Open,
    };
    events.push_back(*open_);
}

void AnomalyClassifier::end_event(double end_time, EventStatus status,
                                  std::vector<AnomalyEvent>& events) {
    open_->end_time         = end_time;
    open_->peak_temperature = peak_;
    open_->status           = status;
    events.push_back(std::move(*open_));
    open_.reset();
}

void AnomalyClassifier::reset_episode() noexcept {
    warming_start_   = 0.0;
    warming_samples_ = 0;
    above_soft_since_.reset();
    recovering_since_.reset();
    peak_ = 0.0;
}

} // namespace coldstream::classifier
