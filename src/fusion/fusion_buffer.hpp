#pragma once

/// @file src/fusion/fusion_buffer.hpp
/// @brief FusionBuffer — per-sensor merge of historical backfill and live stream.
///
/// # Module: Stream Fusion Buffer
///
/// ## Responsibility
/// Produce one duplicate-free, strictly time-ordered Reading sequence per
/// sensor from two independently arriving inputs:
///   - historical pages, time-ascending, page boundaries transparent
///   - live readings, possibly out of order within a reorder window,
///     possibly replayed after a transport reconnect
///
/// ## Merge Rules
/// - Two readings closer than the dedup tolerance are duplicates. The live
///   one wins over a historical one; a later live duplicate replaces an
///   earlier pending one.
/// - A live reading is held in the pending live buffer until the historical
///   watermark reaches its timestamp, backfill ends, or `hold_timeout_s` of
///   live data time passes. A timeout release carries `kGapTolerated`.
/// - Anything at or before the last released timestamp (plus tolerance) is
///   dropped: it was either already fused or arrived too late to keep order.
///
/// ## Gap Detection
/// The expected sampling interval is the mean of the most recent
/// `interval_history` non-gap deltas. A delta larger than
/// `gap_factor × interval` releases a `kDataGap` marker (no temperature)
/// before the reading that closed the gap. The marker is stamped one
/// interval after the last released reading so the sequence stays strictly
/// increasing.
///
/// ## Guarantees
/// - Released timestamps strictly increase
/// - Re-feeding an already fused batch releases nothing
/// - Timeouts use data time only, never the wall clock
///
/// ## NOT Responsible For
/// - Statistics or classification (see rolling_stats.hpp, anomaly_classifier.hpp)

#include "coldstream/config.hpp"
#include "coldstream/types.hpp"

#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

namespace coldstream::fusion {

/// Backfill progress for one sensor.
enum class BackfillState {
    Pending,     ///< Historical pages may still arrive
    Complete,    ///< Paging reached the end of the range
    Incomplete,  ///< Paging failed; live-only operation (BACKFILL_INCOMPLETE)
};

/// Merge bookkeeping for one sensor.
struct FusionCursor {
    std::optional<double> last_fused_timestamp;
    std::deque<Reading>   pending_historical_tail;  ///< sorted ascending
    std::deque<Reading>   pending_live_buffer;      ///< sorted ascending
};

/// Per-sensor counters. Summed by the Engine.
struct FusionCounters {
    std::size_t released      = 0;  ///< Readings released, markers excluded
    std::size_t duplicates    = 0;  ///< Dropped within tolerance of another reading
    std::size_t stale         = 0;  ///< Dropped because order had moved past them
    std::size_t gaps          = 0;  ///< DATA_GAP markers released
    std::size_t gap_tolerated = 0;  ///< Live readings released by hold timeout
};

class FusionBuffer {
public:
    explicit FusionBuffer(SensorId sensor_id, FusionConfig config = FusionConfig{});

    /// Accept one historical reading and append whatever became releasable
    /// to `out`.
    void push_historical(const Reading& reading, std::vector<Reading>& out);

    /// Accept one live reading and append whatever became releasable to
    /// `out`. Also expires held readings against the newest live timestamp.
    void push_live(const Reading& reading, std::vector<Reading>& out);

    /// Mark the end of historical paging. `complete == false` switches the
    /// sensor to live-only operation and tags subsequent readings
    /// `kBackfillIncomplete`.
    void end_backfill(bool complete, std::vector<Reading>& out);

    /// Release held live readings older than `now - hold_timeout_s`.
    void expire(double now, std::vector<Reading>& out);

    /// Release everything still pending, in order, ignoring holds.
    void flush(std::vector<Reading>& out);

    /// End the stream session: flush and drop the pending buffers.
    /// The last fused timestamp is kept so ordering survives a new session.
    void close(std::vector<Reading>& out);

    [[nodiscard]] const SensorId&       sensor_id() const noexcept { return sensor_id_; }
    [[nodiscard]] const FusionCursor&   cursor() const noexcept { return cursor_; }
    [[nodiscard]] const FusionCounters& counters() const noexcept { return counters_; }
    [[nodiscard]] BackfillState         backfill_state() const noexcept { return backfill_; }

    /// Mean of the recent inter-arrival deltas; empty before the first delta.
    [[nodiscard]] std::optional<double> expected_interval() const noexcept;

    /// Tolerance currently used for duplicate detection.
    [[nodiscard]] double dedup_tolerance() const noexcept;

private:
    /// Release in timestamp order as far as the hold rules allow. With
    /// `force`, holds are ignored.
    void drain(std::vector<Reading>& out, bool force = false);

    /// Live head may leave the reorder window.
    [[nodiscard]] bool past_reorder_window(double ts) const noexcept;

    /// True once no historical reading earlier than `ts` can still arrive.
    [[nodiscard]] bool backfill_covers(double ts) const noexcept;

    /// Append `reading` to `out`, preceded by a gap marker if needed.
    void release(Reading reading, std::vector<Reading>& out);

    /// True if `ts` is earlier than the last released timestamp + tolerance.
    [[nodiscard]] bool already_passed(double ts) const noexcept;

    void record_interval(double delta);

    /// Insert into a sorted deque.
    static void insert_sorted(std::deque<Reading>& buf, Reading reading);

    /// Index of the entry within `tol` of `ts`, if any.
    [[nodiscard]] static std::optional<std::size_t>
    find_near(const std::deque<Reading>& buf, double ts, double tol) noexcept;

    SensorId              sensor_id_;
    FusionConfig          config_;
    FusionCursor          cursor_;
    FusionCounters        counters_;
    BackfillState         backfill_ = BackfillState::Pending;
    std::optional<double> historical_watermark_;
    std::optional<double> live_high_water_;
    std::deque<double>    intervals_;
    double                interval_sum_ = 0.0;
};

} // namespace coldstream::fusion
