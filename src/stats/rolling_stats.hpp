#pragma once

/// @file src/stats/rolling_stats.hpp
/// @brief RollingStatsTracker — bounded-memory incremental window statistics.
///
/// # Module: Rolling Statistics Tracker
///
/// ## Responsibility
/// Maintain, for one sensor, the SensorWindow of recent samples and the
/// RollingStats derived from it, updated in O(1) amortized per reading.
///
/// ## Method
/// Each sample is the point x = (t, T) with t in minutes since the window
/// origin. The tracker keeps the running mean x̄ and the co-moment matrix
///   C = Σ (xᵢ − x̄)(xᵢ − x̄)ᵀ
/// with Welford's update on insertion and its exact inverse on eviction:
///   add:    δ = x − x̄;  x̄ += δ / n;  C += δ (x − x̄)ᵀ
///   remove: x̄' = x̄ − (x − x̄)/(n − 1);  C −= (x − x̄')(x − x̄)ᵀ
/// From C:
///   variance(T)     = C₁₁ / (n − 1)
///   long_term_slope = C₀₁ / C₀₀       (least-squares °C/min over the window)
/// The short-term slope is the chord over the most recent 3 samples.
///
/// ## Window Bound
/// A sample is evicted once it is older than `horizon_s` relative to the
/// newest sample, or once the window holds more than `max_samples`,
/// whichever bound bites first.
///
/// ## Guarantees
/// - Never recomputes from scratch while the window is live
/// - `reset()` (used across a DATA_GAP) clears slope continuity and the window

#include "coldstream/config.hpp"
#include "coldstream/types.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <deque>

namespace coldstream::stats {

/// One sample held in a SensorWindow.
struct WindowSample {
    double timestamp;    ///< UTC epoch seconds
    double temperature;  ///< °C
};

class RollingStatsTracker {
public:
    explicit RollingStatsTracker(WindowConfig config = WindowConfig{}) noexcept;

    /// Add a sample, evict what falls outside the bounds, and return the
    /// updated statistics. Samples must arrive in increasing time order.
    const RollingStats& update(double timestamp, double temperature) noexcept;

    /// Drop the window and all statistics.
    void reset() noexcept;

    [[nodiscard]] const RollingStats& stats() const noexcept { return stats_; }
    [[nodiscard]] std::size_t size() const noexcept { return window_.size(); }
    [[nodiscard]] const std::deque<WindowSample>& window() const noexcept { return window_; }

private:
    [[nodiscard]] Eigen::Vector2d point(const WindowSample& s) const noexcept;

    void add(const Eigen::Vector2d& x) noexcept;
    void remove(const Eigen::Vector2d& x) noexcept;
    void evict() noexcept;
    void refresh() noexcept;

    WindowConfig             config_;
    std::deque<WindowSample> window_;
    double                   origin_ = 0.0;  ///< Epoch seconds of t = 0
    Eigen::Vector2d          mean_   = Eigen::Vector2d::Zero();
    Eigen::Matrix2d          comoment_ = Eigen::Matrix2d::Zero();
    RollingStats             stats_{};
};

} // namespace coldstream::stats
