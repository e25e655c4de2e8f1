/// @file src/stats/rolling_stats.cpp
/// @brief RollingStatsTracker — bounded-memory incremental window statistics.

#include "rolling_stats.hpp"

#include "coldstream/constants.hpp"

#include <algorithm>

namespace coldstream::stats {

namespace {

constexpr double SECONDS_PER_MINUTE = 60.0;

} // anonymous namespace

// ─── Constructor ──────────────────────────────────────────────────────────────

RollingStatsTracker::RollingStatsTracker(WindowConfig config) noexcept
    : config_(config)
{}

// ─── update ───────────────────────────────────────────────────────────────────

const RollingStats&
RollingStatsTracker::update(double timestamp, double temperature) noexcept {
    if (window_.empty()) {
        origin_ = timestamp;
    }

    const WindowSample sample{.timestamp = timestamp, .temperature = temperature};
    window_.push_back(sample);
    add(point(sample));
    evict();
    refresh();
    return stats_;
}

// ─── reset ────────────────────────────────────────────────────────────────────

void RollingStatsTracker::reset() noexcept {
    window_.clear();
    origin_   = 0.0;
    mean_     = Eigen::Vector2d::Zero();
    comoment_ = Eigen::Matrix2d::Zero();
    stats_    = RollingStats{};
}

// ─── Welford add / remove ─────────────────────────────────────────────────────

Eigen::Vector2d RollingStatsTracker::point(const WindowSample& s) const noexcept {
    return Eigen::Vector2d((s.timestamp - origin_) / SECONDS_PER_MINUTE, s.temperature);
}

void RollingStatsTracker::add(const Eigen::Vector2d& x) noexcept {
    // window_ already contains x.
    const auto n = static_cast<double>(window_.size());
    const Eigen::Vector2d delta = x - mean_;
    mean_ += delta / n;
    comoment_ += delta * (x - mean_).transpose();
}

void RollingStatsTracker::remove(const Eigen::Vector2d& x) noexcept {
    // window_ no longer contains x.
    const auto remaining = window_.size();
    if (remaining == 0) {
        mean_     = Eigen::Vector2d::Zero();
        comoment_ = Eigen::Matrix2d::Zero();
        return;
    }
    const Eigen::Vector2d old_mean = mean_;
    mean_ -= (x - mean_) / static_cast<double>(remaining);
    comoment_ -= (x - mean_) * (x - old_mean).transpose();
}

void RollingStatsTracker::evict() noexcept {
    const double newest = window_.back().timestamp;
    while (window_.size() > config_.max_samples ||
           (window_.size() > 1 && newest - window_.front().timestamp > config_.horizon_s)) {
        const Eigen::Vector2d x = point(window_.front());
        window_.pop_front();
        remove(x);
    }
}

// ─── refresh ──────────────────────────────────────────────────────────────────

void RollingStatsTracker::refresh() noexcept {
    const std::size_t n = window_.size();
    const WindowSample& last = window_.back();

    stats_.count          = n;
    stats_.mean           = mean_(1);
    stats_.last_value     = last.temperature;
    stats_.last_timestamp = last.timestamp;

    // Eviction can leave a slightly negative residue.
    stats_.variance = n >= 2 ? std::max(0.0, comoment_(1, 1) / static_cast<double>(n - 1)) : 0.0;

    if (n >= 2 && comoment_(0, 0) > constants::FLOAT_EPSILON) {
        stats_.long_term_slope = comoment_(0, 1) / comoment_(0, 0);
    } else {
        stats_.long_term_slope.reset();
    }

    if (n >= constants::SHORT_TERM_SPAN) {
        const WindowSample& first = window_[n - constants::SHORT_TERM_SPAN];
        const double minutes = (last.timestamp - first.timestamp) / SECONDS_PER_MINUTE;
        if (minutes > 0.0) {
            stats_.short_term_slope = (last.temperature - first.temperature) / minutes;
        } else {
            stats_.short_term_slope.reset();
        }
    } else {
        stats_.short_term_slope.reset();
    }
}

} // namespace coldstream::stats
