/**
 * @file  fuzz_engine.cpp
 * @brief libFuzzer target for the full Engine pipeline (end-to-end)
 *
 * Build:
 *   cmake -DCOLDSTREAM_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_engine
 *
 * Run for 60 seconds:
 *   ./fuzz_engine -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no exception for any byte sequence.
 *   2. Per sensor, fused trace timestamps strictly increase.
 *   3. Every OPEN event is followed by exactly one terminal event with the
 *      same id, and nothing is left open after shutdown().
 *   4. Every offered record is counted exactly once at intake:
 *        records == malformed + ignored + rejected + (pushed to fusion)
 *
 * Fuzzer strategy:
 *   Each 6-byte chunk is one operation:
 *     byte 0      opcode: historical, live, end backfill, advance time,
 *                 garbage record, end session
 *     byte 1      sensor (one of four)
 *     bytes 2..3  timestamp offset in seconds (little endian)
 *     bytes 4..5  temperature in hundredths of a degree, signed
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "coldstream/engine.hpp"
#include "coldstream/sink.hpp"

using namespace coldstream;
using namespace coldstream::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    constexpr double BASE = 1'600'000'000.0;

    EngineConfig cfg;
    cfg.emit_trace = true;
    EventQueue sink;
    Engine engine(sink, cfg);

    std::size_t accepted = 0;
    std::size_t offered  = 0;
    for (std::size_t i = 0; i + 6 <= size; i += 6) {
        const uint8_t  op     = data[i] % 6;
        const SensorId sensor = "s" + std::to_string(data[i + 1] % 4);
        const double   ts     = BASE + static_cast<double>(data[i + 2] | (data[i + 3] << 8));
        const auto     raw    = static_cast<int16_t>(data[i + 4] | (data[i + 5] << 8));

        RawRecord record;
        record.target_name = "projects/fuzz/devices/" + sensor;
        record.update_time = std::to_string(ts);
        record.temperature = std::to_string(raw / 100.0);

        switch (op) {
            case 0:
            case 1: {
                ++offered;
                const auto st = engine.ingest(record, op == 0 ? Source::Historical : Source::Live);
                if (st == IngestStatus::kAccepted) ++accepted;
                break;
            }
            case 2: engine.end_backfill(sensor, (data[i + 1] & 0x80) == 0); break;
            case 3: engine.advance_time(ts); break;
            case 4:
                ++offered;
                record.update_time.assign(reinterpret_cast<const char*>(data + i + 2), 4);
                if (engine.ingest(record, Source::Live) == IngestStatus::kAccepted) ++accepted;
                break;
            default: engine.end_session(sensor); break;
        }
    }
    engine.shutdown();

    // ── Invariant 4: intake accounting ────────────────────────────────────────
    const auto c = engine.counters();
    assert(c.records == offered);
    assert(c.records == c.malformed + c.ignored + c.rejected + accepted);

    // ── Invariant 2: per-sensor ordering ──────────────────────────────────────
    std::map<SensorId, double> last;
    for (const auto& t : sink.drain_traces()) {
        assert(std::isfinite(t.reading.timestamp));
        const auto it = last.find(t.reading.sensor_id);
        if (it != last.end()) {
            assert(it->second < t.reading.timestamp);
        }
        last[t.reading.sensor_id] = t.reading.timestamp;
    }

    // ── Invariant 3: event lifecycle ──────────────────────────────────────────
    std::map<SensorId, uint64_t> open;
    for (const auto& e : sink.drain()) {
        if (e.status == EventStatus::Open) {
            assert(open.count(e.sensor_id) == 0);
            open[e.sensor_id] = e.event_id;
        } else {
            const auto it = open.find(e.sensor_id);
            assert(it != open.end() && it->second == e.event_id);
            assert(e.end_time.has_value() && e.start_time <= *e.end_time);
            open.erase(it);
        }
    }
    assert(open.empty());

    return 0;
}
