#pragma once

#include <cstddef>

/// @file include/coldstream/constants.hpp
/// @brief Default thresholds and bounds for the coldstream engine.
///
/// These are the documented defaults of the configuration structs in
/// config.hpp. Nothing in the engine reads them directly.

namespace coldstream::constants {

// ─── Fusion ───────────────────────────────────────────────────────────────────

/// Duplicate tolerance used before a sampling interval has been observed.
static constexpr double DEFAULT_DEDUP_TOLERANCE_S = 0.5;

/// Longest a live reading waits for backfill to catch up (data time).
static constexpr double DEFAULT_HOLD_TIMEOUT_S = 120.0;

/// A gap is declared when the inter-arrival delta exceeds this multiple of
/// the expected sampling interval.
static constexpr double DEFAULT_GAP_FACTOR = 3.0;

/// Number of recent inter-arrival deltas averaged into the expected interval.
static constexpr std::size_t DEFAULT_INTERVAL_HISTORY = 4;

/// Live reorder window. Zero releases live readings as soon as order allows.
static constexpr double DEFAULT_LIVE_REORDER_WINDOW_S = 0.0;

// ─── Window ───────────────────────────────────────────────────────────────────

/// Time bound of a sensor window: the last 60 minutes.
static constexpr double DEFAULT_WINDOW_HORIZON_S = 60.0 * 60.0;

/// Count cap of a sensor window (one sample every 5 s for an hour).
static constexpr std::size_t DEFAULT_WINDOW_MAX_SAMPLES = 720;

/// Number of most recent readings spanned by the short-term slope.
static constexpr std::size_t SHORT_TERM_SPAN = 3;

// ─── Classifier ───────────────────────────────────────────────────────────────

/// Critical storage temperature (°C).
static constexpr double DEFAULT_EXPECTED_MAX = 4.0;

/// Lower plausibility bound for a cold room (°C).
static constexpr double DEFAULT_EXPECTED_MIN = -30.0;

/// Hysteresis margin below expected_max (°C).
static constexpr double DEFAULT_MARGIN = 1.0;

/// Rise rate that counts as warming (°C/min).
static constexpr double DEFAULT_SLOPE_THRESHOLD = 0.5;

/// Consecutive samples required before escalation.
static constexpr std::size_t DEFAULT_DEBOUNCE_SAMPLES = 2;

static constexpr double DEFAULT_WARMING_GRACE_PERIOD_S  = 10.0 * 60.0;
static constexpr double DEFAULT_RECOVERY_HOLD_PERIOD_S  = 5.0 * 60.0;

/// Samples a fresh window needs before classification starts.
static constexpr std::size_t DEFAULT_MIN_SAMPLES = 3;

// ─── Numerical ────────────────────────────────────────────────────────────────

/// Lowest physically possible temperature (°C). Anything colder is malformed.
static constexpr double ABSOLUTE_ZERO_C = -273.15;

static constexpr double FLOAT_EPSILON = 1e-12;

} // namespace coldstream::constants
