/**
 * @file  fuzz_normalizer.cpp
 * @brief libFuzzer target for EventNormalizer::normalize and its parsers
 *
 * Build:
 *   cmake -DCOLDSTREAM_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_normalizer
 *
 * Run for 60 seconds:
 *   ./fuzz_normalizer -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no exception for any byte sequence.
 *   2. Exactly one of reading / error is set.
 *   3. An accepted Reading has a non-empty sensor id without '/', a finite
 *      timestamp and a finite temperature at or above absolute zero.
 *   4. normalize() is pure: a second call gives an identical result.
 *
 * Fuzzer strategy:
 *   Input is split on '\n' into target_name, event_type, update_time and
 *   temperature. Missing trailing fields stay empty. The whole input is also
 *   fed to the timestamp and temperature parsers directly.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "coldstream/constants.hpp"
#include "coldstream/normalizer.hpp"

using namespace coldstream;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{reinterpret_cast<const char*>(data), size};

    // ── Direct parsers ────────────────────────────────────────────────────────
    if (const auto ts = EventNormalizer::parse_timestamp(input)) {
        assert(std::isfinite(*ts));
    }
    if (const auto t = EventNormalizer::parse_temperature(input)) {
        assert(std::isfinite(*t));
        assert(*t >= constants::ABSOLUTE_ZERO_C);
    }

    // ── Full record ───────────────────────────────────────────────────────────
    std::string fields[4];
    std::size_t field = 0;
    for (char c : input) {
        if (c == '\n' && field < 3) {
            ++field;
            continue;
        }
        fields[field].push_back(c);
    }

    RawRecord record;
    record.target_name = fields[0];
    if (field >= 1) record.event_type = fields[1];
    record.update_time = fields[2];
    record.temperature = fields[3];

    const auto result = EventNormalizer::normalize(record, Source::Live);
    assert(result.ok() == (result.error == RecordError::kNone));

    if (result.ok()) {
        const Reading& r = *result.reading;
        assert(!r.sensor_id.empty());
        assert(r.sensor_id.find('/') == std::string::npos);
        assert(std::isfinite(r.timestamp));
        assert(r.temperature.has_value());
        assert(std::isfinite(*r.temperature));
        assert(*r.temperature >= constants::ABSOLUTE_ZERO_C);
        assert(r.source == Source::Live);
    }

    const auto again = EventNormalizer::normalize(record, Source::Live);
    assert(again.error == result.error);
    assert(again.ok() == result.ok());
    if (again.ok()) {
        assert(again.reading->timestamp == result.reading->timestamp);
        assert(*again.reading->temperature == *result.reading->temperature);
    }

    return 0;
}
