#pragma once

/// @file include/coldstream/types.hpp
/// @brief Shared value types for the coldstream fusion and anomaly engine.
///
/// Every module includes this file. It defines the canonical Reading record,
/// the per-sensor rolling statistics snapshot, the classifier state and the
/// AnomalyEvent handed to external consumers.
///
/// Timestamps are UTC epoch seconds stored as `double` throughout. Slopes are
/// expressed in °C per minute.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace coldstream {

/// Sensor identifier: the last path component of the vendor device name.
using SensorId = std::string;

// ─── Source ───────────────────────────────────────────────────────────────────

/// Which producer delivered a Reading.
enum class Source : std::uint8_t {
    Historical,  ///< Paged backfill of a bounded time range
    Live,        ///< Real-time event stream
};

[[nodiscard]] std::string_view to_string(Source source) noexcept;

// ─── Annotations ──────────────────────────────────────────────────────────────

/// Bit flags attached to a fused Reading by the Fusion Buffer.
enum Annotation : std::uint8_t {
    kNoAnnotation       = 0,
    kGapTolerated       = 1u << 0,  ///< Live reading released by hold timeout
    kBackfillIncomplete = 1u << 1,  ///< Historical paging for this sensor failed
    kDataGap            = 1u << 2,  ///< Synthetic marker: discontinuity in the data
};

// ─── Reading ──────────────────────────────────────────────────────────────────

/// One normalized temperature sample, or a gap marker when `temperature` is
/// empty. Treated as immutable once released by the Fusion Buffer.
struct Reading {
    SensorId              sensor_id;
    double                timestamp = 0.0;               ///< UTC epoch seconds
    std::optional<double> temperature;                   ///< °C; empty for markers
    Source                source = Source::Historical;
    std::uint8_t          annotations = kNoAnnotation;

    [[nodiscard]] bool is_marker() const noexcept { return !temperature.has_value(); }

    [[nodiscard]] bool has(Annotation flag) const noexcept {
        return (annotations & flag) != 0;
    }
};

// ─── RollingStats ─────────────────────────────────────────────────────────────

/// Incremental aggregate over a sensor's window.
///
/// `short_term_slope` is the chord (last - first) / elapsed over the most
/// recent 3 readings, so a step shows up at full size. `long_term_slope` is
/// the ordinary least-squares slope over the whole window, not its
/// end-to-end chord, so one outlier at either end does not set the trend.
/// Both are in °C/min and empty until enough samples exist.
struct RollingStats {
    std::size_t           count = 0;
    double                mean = 0.0;
    double                variance = 0.0;  ///< Bessel-corrected; 0 for count < 2
    double                last_value = 0.0;
    double                last_timestamp = 0.0;
    std::optional<double> short_term_slope;
    std::optional<double> long_term_slope;

    [[nodiscard]] double stddev() const noexcept;
};

// ─── Classifier state ─────────────────────────────────────────────────────────

/// Per-sensor anomaly state. Only classifier transitions change it.
enum class AnomalyState : std::uint8_t {
    Normal,
    Warming,
    Anomalous,
    Recovering,
};

[[nodiscard]] std::string_view to_string(AnomalyState state) noexcept;

/// Notes attached to a classification result.
enum ClassifierNote : std::uint8_t {
    kNoNote           = 0,
    kUnverifiedGap    = 1u << 0,  ///< State forced to Normal by a data gap
    kWarmingUp        = 1u << 1,  ///< Fewer than min_samples in the window
    kBelowExpectedMin = 1u << 2,  ///< Temperature under expected_min
};

/// Classifier output for one fused Reading.
struct Classification {
    AnomalyState state = AnomalyState::Normal;
    std::uint8_t notes = kNoNote;

    [[nodiscard]] bool has(ClassifierNote note) const noexcept {
        return (notes & note) != 0;
    }
};

// ─── AnomalyEvent ─────────────────────────────────────────────────────────────

/// What escalated the excursion into ANOMALOUS.
enum class AnomalyKind : std::uint8_t {
    OverTemperature,   ///< Hard threshold exceeded after k warming samples
    SustainedWarming,  ///< Soft threshold held for longer than the grace period
};

[[nodiscard]] std::string_view to_string(AnomalyKind kind) noexcept;

/// Lifecycle status of an AnomalyEvent.
enum class EventStatus : std::uint8_t {
    Open,            ///< end_time empty; more readings may extend it
    Closed,          ///< Recovery hold satisfied
    Interrupted,     ///< Engine shut down while the event was open
    TruncatedByGap,  ///< A data gap forced the sensor back to Normal
};

[[nodiscard]] std::string_view to_string(EventStatus status) noexcept;

/// An excursion from WARMING entry through recovery. Emitted once when it
/// opens and once when it ends; `event_id` correlates the two.
struct AnomalyEvent {
    SensorId              sensor_id;
    std::uint64_t         event_id = 0;
    double                start_time = 0.0;  ///< First WARMING entry
    std::optional<double> end_time;
    double                peak_temperature = 0.0;
    AnomalyKind           kind = AnomalyKind::OverTemperature;
    EventStatus           status = EventStatus::Open;
};

// ─── Trace ────────────────────────────────────────────────────────────────────

/// Debug snapshot produced for every fused Reading (markers included) when
/// tracing is enabled.
struct TraceRecord {
    Reading        reading;
    RollingStats   stats;
    Classification classification;
};

} // namespace coldstream
