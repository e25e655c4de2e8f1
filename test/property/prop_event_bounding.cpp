/**
 * @file  prop_event_bounding.cpp
 * @brief Property: every ended AnomalyEvent is well formed and its peak is
 *        the maximum temperature over [start_time, end_time].
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_event_bounding
 *
 * Random one-minute temperature series around a 4 °C threshold are pushed
 * through a full Engine and shut down. For the emitted events:
 *   - each OPEN event is followed by exactly one terminal event, same id
 *   - at most one event is open per sensor at any time
 *   - start_time <= end_time
 *   - peak_temperature == max temperature of the readings in [start, end]
 *   - the peak exceeds the soft threshold
 */

#include <rapidcheck.h>

#include <algorithm>
#include <string>
#include <vector>

#include "coldstream/engine.hpp"
#include "coldstream/sink.hpp"

using namespace coldstream;
using namespace coldstream::core;

namespace {

constexpr double BASE = 1'600'000'000.0;

RawRecord record(double ts, int temp) {
    RawRecord r;
    r.target_name = "projects/p/devices/s";
    r.update_time = std::to_string(ts);
    r.temperature = std::to_string(temp);
    return r;
}

} // anonymous namespace

int main() {
    rc::check(
        "event_bounding: peak bounded by readings, lifecycle paired",
        [] {
            const auto temps = *rc::gen::container<std::vector<int>>(rc::gen::inRange(-4, 12));

            EventQueue sink;
            Engine engine(sink);
            std::vector<double> times;
            for (std::size_t i = 0; i < temps.size(); ++i) {
                times.push_back(BASE + 60.0 * static_cast<double>(i));
                engine.ingest(record(times.back(), temps[i]), Source::Historical);
            }
            engine.end_backfill(true);
            engine.shutdown();

            const double soft = engine.config().classifier.soft_threshold();
            const auto events = sink.drain();
            RC_ASSERT(events.size() % 2 == 0);

            for (std::size_t i = 0; i < events.size(); i += 2) {
                const auto& open = events[i];
                const auto& done = events[i + 1];
                RC_ASSERT(open.status == EventStatus::Open);
                RC_ASSERT(!open.end_time.has_value());
                RC_ASSERT(done.status != EventStatus::Open);
                RC_ASSERT(done.event_id == open.event_id);
                RC_ASSERT(done.start_time == open.start_time);
                RC_ASSERT(done.end_time.has_value());
                RC_ASSERT(done.start_time <= *done.end_time);

                int peak = -1000;
                for (std::size_t j = 0; j < temps.size(); ++j) {
                    if (times[j] >= done.start_time && times[j] <= *done.end_time) {
                        peak = std::max(peak, temps[j]);
                    }
                }
                RC_ASSERT(done.peak_temperature == static_cast<double>(peak));
                RC_ASSERT(done.peak_temperature > soft);

                if (i + 2 < events.size()) {
                    RC_ASSERT(events[i + 2].start_time > *done.end_time);
                }
            }
        }
    );

    return 0;
}
