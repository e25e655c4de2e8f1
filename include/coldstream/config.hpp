#pragma once

/// @file include/coldstream/config.hpp
/// @brief Configuration structs for fusion, windowing and classification.
///
/// All fields carry the defaults from constants.hpp. A struct whose
/// `is_valid()` returns false is rejected by the Engine, which then falls
/// back to the defaults.

#include "coldstream/constants.hpp"

#include <cstddef>
#include <optional>

namespace coldstream {

// ─── FusionConfig ─────────────────────────────────────────────────────────────

struct FusionConfig {
    /// Two readings closer than this are duplicates. When unset the buffer
    /// uses half the tracked sampling interval, or DEFAULT_DEDUP_TOLERANCE_S
    /// before any interval has been observed. Must be positive when set.
    std::optional<double> dedup_tolerance_s;

    double      hold_timeout_s        = constants::DEFAULT_HOLD_TIMEOUT_S;
    double      gap_factor            = constants::DEFAULT_GAP_FACTOR;
    std::size_t interval_history      = constants::DEFAULT_INTERVAL_HISTORY;
    double      live_reorder_window_s = constants::DEFAULT_LIVE_REORDER_WINDOW_S;

    [[nodiscard]] bool is_valid() const noexcept;
};

// ─── WindowConfig ─────────────────────────────────────────────────────────────

struct WindowConfig {
    double      horizon_s   = constants::DEFAULT_WINDOW_HORIZON_S;
    std::size_t max_samples = constants::DEFAULT_WINDOW_MAX_SAMPLES;

    [[nodiscard]] bool is_valid() const noexcept;
};

// ─── ClassifierConfig ─────────────────────────────────────────────────────────

struct ClassifierConfig {
    double      expected_min           = constants::DEFAULT_EXPECTED_MIN;
    double      expected_max           = constants::DEFAULT_EXPECTED_MAX;
    double      margin                 = constants::DEFAULT_MARGIN;
    double      slope_threshold        = constants::DEFAULT_SLOPE_THRESHOLD;  ///< °C/min
    std::size_t k                      = constants::DEFAULT_DEBOUNCE_SAMPLES;
    double      warming_grace_period_s = constants::DEFAULT_WARMING_GRACE_PERIOD_S;
    double      recovery_hold_period_s = constants::DEFAULT_RECOVERY_HOLD_PERIOD_S;
    std::size_t min_samples            = constants::DEFAULT_MIN_SAMPLES;  ///< at least 2

    /// expected_max - margin: the soft threshold.
    [[nodiscard]] double soft_threshold() const noexcept { return expected_max - margin; }

    [[nodiscard]] bool is_valid() const noexcept;
};

// ─── EngineConfig ─────────────────────────────────────────────────────────────

struct EngineConfig {
    FusionConfig     fusion{};
    WindowConfig     window{};
    ClassifierConfig classifier{};

    /// Emit a TraceRecord for every fused Reading.
    bool emit_trace = false;

    /// If true, print diagnostics to stderr.
    bool verbose = false;

    /// Worker threads used by the Coordinator. Ignored by Engine.
    std::size_t worker_count = 2;

    [[nodiscard]] bool is_valid() const noexcept;
};

} // namespace coldstream
