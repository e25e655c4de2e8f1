#pragma once

/// @file include/coldstream/normalizer.hpp
/// @brief EventNormalizer — raw vendor records to canonical Readings.
///
/// # Module: Event Normalizer
///
/// ## Responsibility
/// Convert a raw sensor record from either the historical pager or the live
/// stream into a `Reading`. Pure: no state, no side effects.
///
/// ## Accepted Formats
/// - `target_name`: a device resource path, e.g.
///   `projects/bsarslgg7oekgsc2jb20/devices/bjei2dqdqfcg00a9ga3g`. The sensor
///   id is the last path component.
/// - `update_time`: RFC 3339 (`2020-03-05T10:15:30.123456Z`, `Z` or `±hh:mm`
///   offset, `T` or space separator) or a plain unix-time number in seconds
///   (local export format).
/// - `temperature`: decimal text in °C. Non-finite values and values below
///   absolute zero are rejected.
///
/// ## Guarantees
/// - Never throws on malformed input
/// - Identical input always yields an identical Reading

#include "coldstream/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace coldstream {

// ─── RawRecord ────────────────────────────────────────────────────────────────

/// A record as delivered by a source collaborator, fields still textual.
struct RawRecord {
    std::string target_name;
    std::string event_type = "temperature";
    std::string update_time;
    std::string temperature;
};

// ─── RecordError ──────────────────────────────────────────────────────────────

/// Why a RawRecord did not produce a Reading.
///
/// Every value except `kNone` and `kNotTemperatureEvent` is a
/// MALFORMED_RECORD.
enum class RecordError {
    kNone,
    kMissingSensorId,
    kMissingTimestamp,
    kBadTimestamp,
    kMissingTemperature,
    kBadTemperature,
    kNotTemperatureEvent,
};

[[nodiscard]] std::string_view to_string(RecordError error) noexcept;

/// True for the errors that count as MALFORMED_RECORD.
[[nodiscard]] bool is_malformed(RecordError error) noexcept;

/// Result of a normalization attempt. Exactly one of `reading` or a non-kNone
/// `error` is set.
struct NormalizeResult {
    std::optional<Reading> reading;
    RecordError            error = RecordError::kNone;

    [[nodiscard]] bool ok() const noexcept { return reading.has_value(); }
};

// ─── EventNormalizer ──────────────────────────────────────────────────────────

/// Stateless conversion of RawRecord into Reading.
class EventNormalizer {
public:
    EventNormalizer() = delete;

    /// Normalize one record delivered by `source`.
    ///
    /// # Returns
    /// A Reading stamped with `source`, or the first error found, checked in
    /// the order: event type, sensor id, timestamp, temperature.
    [[nodiscard]] static NormalizeResult
    normalize(const RawRecord& record, Source source) noexcept;

    /// Parse an RFC 3339 or unix-seconds timestamp into UTC epoch seconds.
    ///
    /// # Returns
    /// - `Some(seconds)` for a valid, finite timestamp
    /// - `None` for empty, out-of-range or unparsable text
    [[nodiscard]] static std::optional<double>
    parse_timestamp(std::string_view text) noexcept;

    /// Parse a temperature in °C. Rejects non-finite values and values below
    /// absolute zero.
    [[nodiscard]] static std::optional<double>
    parse_temperature(std::string_view text) noexcept;

    /// Last path component of a device resource path. Empty if the path is
    /// empty or ends in '/'.
    [[nodiscard]] static std::string_view
    sensor_id_from_target(std::string_view target_name) noexcept;
};

}  // namespace coldstream
