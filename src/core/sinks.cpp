/// @file src/core/sinks.cpp
/// @brief EventQueue, FormattingSink and the text formats they share.

#include "coldstream/sink.hpp"

#include <fmt/format.h>

#include <utility>

namespace coldstream {

// ─── Formatting ───────────────────────────────────────────────────────────────

std::string format_event(const AnomalyEvent& event) {
    return fmt::format(
        "EVENT sensor={} id={} kind={} status={} start={:.3f} end={} peak={:.3f}",
        event.sensor_id,
        event.event_id,
        to_string(event.kind),
        to_string(event.status),
        event.start_time,
        event.end_time ? fmt::format("{:.3f}", *event.end_time) : std::string("-"),
        event.peak_temperature);
}

std::string format_trace(const TraceRecord& trace) {
    const auto& r = trace.reading;
    const auto& s = trace.stats;
    const auto opt = [](const std::optional<double>& v) {
        return v ? fmt::format("{:.4f}", *v) : std::string("-");
    };
    return fmt::format(
        "TRACE sensor={} t={:.3f} temp={} src={} flags={:#04x} state={} notes={:#04x} "
        "n={} mean={:.4f} sd={:.4f} slope_s={} slope_l={}",
        r.sensor_id,
        r.timestamp,
        opt(r.temperature),
        to_string(r.source),
        r.annotations,
        to_string(trace.classification.state),
        trace.classification.notes,
        s.count,
        s.mean,
        s.stddev(),
        opt(s.short_term_slope),
        opt(s.long_term_slope));
}

std::string format_malformed(const MalformedReport& report) {
    return fmt::format("MALFORMED src={} error={} target={}",
                       to_string(report.source),
                       to_string(report.error),
                       report.record.target_name);
}

// ─── EventQueue ───────────────────────────────────────────────────────────────

void EventQueue::on_event(const AnomalyEvent& event) {
    std::lock_guard lock(mutex_);
    events_.push_back(event);
}

void EventQueue::on_trace(const TraceRecord& trace) {
    std::lock_guard lock(mutex_);
    traces_.push_back(trace);
}

void EventQueue::on_malformed(const MalformedReport& report) {
    std::lock_guard lock(mutex_);
    malformed_.push_back(report);
}

std::vector<AnomalyEvent> EventQueue::drain() {
    std::lock_guard lock(mutex_);
    return std::exchange(events_, {});
}

std::vector<TraceRecord> EventQueue::drain_traces() {
    std::lock_guard lock(mutex_);
    return std::exchange(traces_, {});
}

std::vector<MalformedReport> EventQueue::drain_malformed() {
    std::lock_guard lock(mutex_);
    return std::exchange(malformed_, {});
}

std::size_t EventQueue::pending() const {
    std::lock_guard lock(mutex_);
    return events_.size();
}

// ─── FormattingSink ───────────────────────────────────────────────────────────

void FormattingSink::on_event(const AnomalyEvent& event) {
    const auto line = format_event(event);
    std::lock_guard lock(mutex_);
    text_ += line;
    text_ += '\n';
}

void FormattingSink::on_trace(const TraceRecord& trace) {
    const auto line = format_trace(trace);
    std::lock_guard lock(mutex_);
    text_ += line;
    text_ += '\n';
}

void FormattingSink::on_malformed(const MalformedReport& report) {
    const auto line = format_malformed(report);
    std::lock_guard lock(mutex_);
    text_ += line;
    text_ += '\n';
}

std::string FormattingSink::text() const {
    std::lock_guard lock(mutex_);
    return text_;
}

void FormattingSink::clear() {
    std::lock_guard lock(mutex_);
    text_.clear();
}

} // namespace coldstream
