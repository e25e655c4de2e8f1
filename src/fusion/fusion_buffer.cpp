/// @file src/fusion/fusion_buffer.cpp
/// @brief FusionBuffer — per-sensor merge of historical backfill and live stream.

#include "fusion_buffer.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace coldstream::fusion {

namespace {

[[nodiscard]] bool earlier(const Reading& a, const Reading& b) noexcept {
    return a.timestamp < b.timestamp;
}

/// Equal timestamps collide even with a zero tolerance.
[[nodiscard]] bool collides(double a, double b, double tol) noexcept {
    return a == b || std::abs(a - b) < tol;
}

} // anonymous namespace

// ─── Constructor ──────────────────────────────────────────────────────────────

FusionBuffer::FusionBuffer(SensorId sensor_id, FusionConfig config)
    : sensor_id_(std::move(sensor_id))
    , config_(std::move(config))
{}

// ─── Accessors ────────────────────────────────────────────────────────────────

std::optional<double> FusionBuffer::expected_interval() const noexcept {
    if (intervals_.empty()) {
        return std::nullopt;
    }
    return interval_sum_ / static_cast<double>(intervals_.size());
}

double FusionBuffer::dedup_tolerance() const noexcept {
    if (config_.dedup_tolerance_s) {
        return *config_.dedup_tolerance_s;
    }
    if (const auto interval = expected_interval()) {
        return *interval * 0.5;
    }
    return constants::DEFAULT_DEDUP_TOLERANCE_S;
}

// ─── push_historical ──────────────────────────────────────────────────────────

void FusionBuffer::push_historical(const Reading& reading, std::vector<Reading>& out) {
    if (reading.is_marker()) {
        return;
    }

    // Coverage advances even for readings we end up dropping.
    historical_watermark_ = historical_watermark_
        ? std::max(*historical_watermark_, reading.timestamp)
        : reading.timestamp;

    const double tol = dedup_tolerance();
    if (already_passed(reading.timestamp)) {
        if (collides(reading.timestamp, *cursor_.last_fused_timestamp, tol)) {
            ++counters_.duplicates;
        } else {
            ++counters_.stale;
        }
        drain(out);
        return;
    }

    // A pending live reading at the same instant is authoritative.
    if (find_near(cursor_.pending_live_buffer, reading.timestamp, tol) ||
        find_near(cursor_.pending_historical_tail, reading.timestamp, tol)) {
        ++counters_.duplicates;
        drain(out);
        return;
    }

    insert_sorted(cursor_.pending_historical_tail, reading);
    drain(out);
}

// ─── push_live ────────────────────────────────────────────────────────────────

void FusionBuffer::push_live(const Reading& reading, std::vector<Reading>& out) {
    if (reading.is_marker()) {
        return;
    }

    live_high_water_ = live_high_water_
        ? std::max(*live_high_water_, reading.timestamp)
        : reading.timestamp;

    const double tol = dedup_tolerance();
    if (already_passed(reading.timestamp)) {
        // Replay after a reconnect lands here.
        if (collides(reading.timestamp, *cursor_.last_fused_timestamp, tol)) {
            ++counters_.duplicates;
        } else {
            ++counters_.stale;
        }
        expire(*live_high_water_, out);
        return;
    }

    auto& live = cursor_.pending_live_buffer;
    auto& hist = cursor_.pending_historical_tail;

    if (const auto idx = find_near(live, reading.timestamp, tol)) {
        // Latest live delivery carries the backend-corrected value.
        live.erase(live.begin() + static_cast<std::ptrdiff_t>(*idx));
        ++counters_.duplicates;
    } else if (const auto hidx = find_near(hist, reading.timestamp, tol)) {
        hist.erase(hist.begin() + static_cast<std::ptrdiff_t>(*hidx));
        ++counters_.duplicates;
    }

    insert_sorted(live, reading);
    drain(out);
    expire(*live_high_water_, out);
}

// ─── end_backfill ─────────────────────────────────────────────────────────────

void FusionBuffer::end_backfill(bool complete, std::vector<Reading>& out) {
    if (backfill_ == BackfillState::Pending) {
        backfill_ = complete ? BackfillState::Complete : BackfillState::Incomplete;
    }
    drain(out);
}

// ─── expire ───────────────────────────────────────────────────────────────────

void FusionBuffer::expire(double now, std::vector<Reading>& out) {
    auto& live = cursor_.pending_live_buffer;
    while (!live.empty()) {
        const double ts = live.front().timestamp;
        if (backfill_covers(ts) || ts + config_.hold_timeout_s > now) {
            break;
        }
        // Any historical reading before `ts` was already released by drain().
        Reading held = std::move(live.front());
        live.pop_front();
        held.annotations = static_cast<std::uint8_t>(held.annotations | kGapTolerated);
        ++counters_.gap_tolerated;
        release(std::move(held), out);
    }
    drain(out);
}

// ─── flush / close ────────────────────────────────────────────────────────────

void FusionBuffer::flush(std::vector<Reading>& out) {
    drain(out, /*force=*/true);
}

void FusionBuffer::close(std::vector<Reading>& out) {
    flush(out);
    cursor_.pending_historical_tail = {};
    cursor_.pending_live_buffer     = {};
    live_high_water_.reset();
}

// ─── drain ────────────────────────────────────────────────────────────────────

void FusionBuffer::drain(std::vector<Reading>& out, bool force) {
    auto& hist = cursor_.pending_historical_tail;
    auto& live = cursor_.pending_live_buffer;

    while (!hist.empty() || !live.empty()) {
        if (!hist.empty() && !live.empty() &&
            collides(hist.front().timestamp, live.front().timestamp, dedup_tolerance())) {
            hist.pop_front();
            ++counters_.duplicates;
            continue;
        }

        if (!hist.empty() && (live.empty() || hist.front().timestamp < live.front().timestamp)) {
            Reading next = std::move(hist.front());
            hist.pop_front();
            release(std::move(next), out);
            continue;
        }

        const double ts = live.front().timestamp;
        const bool covered = backfill_covers(ts);
        if (!force && (!covered || !past_reorder_window(ts))) {
            return;
        }

        Reading next = std::move(live.front());
        live.pop_front();
        if (!covered) {
            next.annotations = static_cast<std::uint8_t>(next.annotations | kGapTolerated);
            ++counters_.gap_tolerated;
        }
        release(std::move(next), out);
    }
}

// ─── Hold predicates ──────────────────────────────────────────────────────────

bool FusionBuffer::past_reorder_window(double ts) const noexcept {
    if (config_.live_reorder_window_s <= 0.0 || !live_high_water_) {
        return true;
    }
    return ts <= *live_high_water_ - config_.live_reorder_window_s;
}

bool FusionBuffer::backfill_covers(double ts) const noexcept {
    if (backfill_ != BackfillState::Pending) {
        return true;
    }
    // Historical pages are ascending: everything up to the watermark is in.
    return historical_watermark_ && *historical_watermark_ >= ts - dedup_tolerance();
}

bool FusionBuffer::already_passed(double ts) const noexcept {
    return cursor_.last_fused_timestamp &&
           (ts <= *cursor_.last_fused_timestamp ||
            ts < *cursor_.last_fused_timestamp + dedup_tolerance());
}

// ─── release ──────────────────────────────────────────────────────────────────

void FusionBuffer::release(Reading reading, std::vector<Reading>& out) {
    // The tolerance widens once the sampling interval is learned.
    if (already_passed(reading.timestamp)) {
        ++counters_.duplicates;
        return;
    }

    if (backfill_ == BackfillState::Incomplete) {
        reading.annotations = static_cast<std::uint8_t>(reading.annotations | kBackfillIncomplete);
    }

    if (const auto last = cursor_.last_fused_timestamp) {
        const double delta    = reading.timestamp - *last;
        const auto   interval = expected_interval();
        if (interval && delta > config_.gap_factor * *interval) {
            out.push_back(Reading{
                .sensor_id   = sensor_id_,
                .timestamp   = *last + *interval,
                .temperature = std::nullopt,
                .source      = reading.source,
                .annotations = static_cast<std::uint8_t>(
                    kDataGap | (reading.annotations & kBackfillIncomplete)),
            });
            ++counters_.gaps;
        } else {
            record_interval(delta);
        }
    }

    cursor_.last_fused_timestamp = reading.timestamp;
    out.push_back(std::move(reading));
    ++counters_.released;
}

// ─── Helpers ──────────────────────────────────────────────────────────────────

void FusionBuffer::record_interval(double delta) {
    intervals_.push_back(delta);
    interval_sum_ += delta;
    if (intervals_.size() > config_.interval_history) {
        interval_sum_ -= intervals_.front();
        intervals_.pop_front();
    }
}

void FusionBuffer::insert_sorted(std::deque<Reading>& buf, Reading reading) {
    // Live data is nearly in order, so the common case appends.
    if (buf.empty() || !earlier(reading, buf.back())) {
        buf.push_back(std::move(reading));
        return;
    }
    const auto pos = std::upper_bound(buf.begin(), buf.end(), reading, earlier);
    buf.insert(pos, std::move(reading));
}

std::optional<std::size_t>
FusionBuffer::find_near(const std::deque<Reading>& buf, double ts, double tol) noexcept {
    auto pos = std::lower_bound(
        buf.begin(), buf.end(), ts - tol,
        [](const Reading& r, double value) { return r.timestamp < value; });
    for (; pos != buf.end() && pos->timestamp <= ts + tol; ++pos) {
        if (collides(pos->timestamp, ts, tol)) {
            return static_cast<std::size_t>(pos - buf.begin());
        }
    }
    return std::nullopt;
}

} // namespace coldstream::fusion
