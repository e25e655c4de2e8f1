#pragma once

/// @file include/coldstream/sink.hpp
/// @brief Output interface of the engine and two ready-made consumers.
///
/// # Module: Event Sinks
///
/// The engine hands every AnomalyEvent (open and ended), every trace snapshot
/// (when tracing is on) and every dropped malformed record to an EventSink.
/// Logging and plotting collaborators implement it.
///
/// Sinks passed to the Coordinator are called from several worker threads
/// and must be thread-safe; both sinks in this header are.

#include "coldstream/normalizer.hpp"
#include "coldstream/types.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace coldstream {

/// A record dropped as MALFORMED_RECORD.
struct MalformedReport {
    Source      source;
    RecordError error;
    RawRecord   record;
};

// ─── EventSink ────────────────────────────────────────────────────────────────

class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void on_event(const AnomalyEvent& event) = 0;
    virtual void on_trace(const TraceRecord& /*trace*/) {}
    virtual void on_malformed(const MalformedReport& /*report*/) {}
};

// ─── EventQueue ───────────────────────────────────────────────────────────────

/// Thread-safe in-memory multiplexer. Consumers poll with drain().
class EventQueue final : public EventSink {
public:
    void on_event(const AnomalyEvent& event) override;
    void on_trace(const TraceRecord& trace) override;
    void on_malformed(const MalformedReport& report) override;

    /// Take all events queued so far, in arrival order.
    [[nodiscard]] std::vector<AnomalyEvent> drain();

    /// Take all trace snapshots queued so far, in arrival order.
    [[nodiscard]] std::vector<TraceRecord> drain_traces();

    [[nodiscard]] std::vector<MalformedReport> drain_malformed();

    [[nodiscard]] std::size_t pending() const;

private:
    mutable std::mutex           mutex_;
    std::vector<AnomalyEvent>    events_;
    std::vector<TraceRecord>     traces_;
    std::vector<MalformedReport> malformed_;
};

// ─── FormattingSink ───────────────────────────────────────────────────────────

/// Renders everything it receives as one text line per item. The text is
/// byte-stable for identical input, which makes it the replay reference.
class FormattingSink final : public EventSink {
public:
    void on_event(const AnomalyEvent& event) override;
    void on_trace(const TraceRecord& trace) override;
    void on_malformed(const MalformedReport& report) override;

    [[nodiscard]] std::string text() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::string        text_;
};

// ─── Formatting ───────────────────────────────────────────────────────────────

/// `EVENT sensor=<id> id=<n> kind=<kind> status=<status> start=<t> end=<t|-> peak=<T>`
[[nodiscard]] std::string format_event(const AnomalyEvent& event);

/// `TRACE sensor=<id> t=<t> temp=<T|-> src=<src> flags=<hex> state=<state> ...`
[[nodiscard]] std::string format_trace(const TraceRecord& trace);

/// `MALFORMED src=<src> error=<code> target=<name>`
[[nodiscard]] std::string format_malformed(const MalformedReport& report);

} // namespace coldstream
