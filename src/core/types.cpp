/// @file src/core/types.cpp
/// @brief String conversions and config validation for the shared types.

#include "coldstream/config.hpp"
#include "coldstream/types.hpp"

#include <cmath>

namespace coldstream {

// ─── to_string ────────────────────────────────────────────────────────────────

std::string_view to_string(Source source) noexcept {
    switch (source) {
        case Source::Historical: return "HISTORICAL";
        case Source::Live:       return "LIVE";
    }
    return "UNKNOWN";
}

std::string_view to_string(AnomalyState state) noexcept {
    switch (state) {
        case AnomalyState::Normal:     return "NORMAL";
        case AnomalyState::Warming:    return "WARMING";
        case AnomalyState::Anomalous:  return "ANOMALOUS";
        case AnomalyState::Recovering: return "RECOVERING";
    }
    return "UNKNOWN";
}

std::string_view to_string(AnomalyKind kind) noexcept {
    switch (kind) {
        case AnomalyKind::OverTemperature:  return "OVER_TEMPERATURE";
        case AnomalyKind::SustainedWarming: return "SUSTAINED_WARMING";
    }
    return "UNKNOWN";
}

std::string_view to_string(EventStatus status) noexcept {
    switch (status) {
        case EventStatus::Open:           return "OPEN";
        case EventStatus::Closed:         return "CLOSED";
        case EventStatus::Interrupted:    return "INTERRUPTED";
        case EventStatus::TruncatedByGap: return "TRUNCATED_BY_GAP";
    }
    return "UNKNOWN";
}

// ─── RollingStats ─────────────────────────────────────────────────────────────

double RollingStats::stddev() const noexcept {
    return variance > 0.0 ? std::sqrt(variance) : 0.0;
}

// ─── Config validation ────────────────────────────────────────────────────────

bool FusionConfig::is_valid() const noexcept {
    if (dedup_tolerance_s && (!std::isfinite(*dedup_tolerance_s) || *dedup_tolerance_s <= 0.0)) {
        return false;
    }
    if (!std::isfinite(hold_timeout_s) || hold_timeout_s < 0.0) return false;
    if (!std::isfinite(gap_factor) || gap_factor <= 1.0) return false;
    if (interval_history == 0) return false;
    if (!std::isfinite(live_reorder_window_s) || live_reorder_window_s < 0.0) return false;
    return true;
}

bool WindowConfig::is_valid() const noexcept {
    // The short-term slope needs three samples to fit in the window.
    return std::isfinite(horizon_s) && horizon_s > 0.0 && max_samples >= 3;
}

bool ClassifierConfig::is_valid() const noexcept {
    if (!std::isfinite(expected_min) || !std::isfinite(expected_max)) return false;
    if (expected_min >= expected_max) return false;
    if (!std::isfinite(margin) || margin < 0.0) return false;
    if (!std::isfinite(slope_threshold) || slope_threshold <= 0.0) return false;
    if (k == 0) return false;
    // One sample carries no slope; a refilled window needs at least two.
    if (min_samples < 2) return false;
    if (!std::isfinite(warming_grace_period_s) || warming_grace_period_s < 0.0) return false;
    if (!std::isfinite(recovery_hold_period_s) || recovery_hold_period_s < 0.0) return false;
    return true;
}

bool EngineConfig::is_valid() const noexcept {
    return fusion.is_valid() && window.is_valid() && classifier.is_valid() && worker_count > 0;
}

} // namespace coldstream
