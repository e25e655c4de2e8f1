/// @file src/normalizer/event_normalizer.cpp
/// @brief EventNormalizer — raw vendor records to canonical Readings.

#include "coldstream/normalizer.hpp"
#include "coldstream/constants.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <system_error>

namespace coldstream {

// ─── Internal helpers ─────────────────────────────────────────────────────────

namespace {

[[nodiscard]] std::string_view trim(std::string_view text) noexcept {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

/// Parse the whole of `text` as a finite double.
[[nodiscard]] std::optional<double> parse_finite(std::string_view text) noexcept {
    if (text.empty()) {
        return std::nullopt;
    }
    // from_chars rejects a leading '+'; vendor exports occasionally carry one.
    if (text.front() == '+') {
        text.remove_prefix(1);
    }
    double value = 0.0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

/// Read exactly `width` decimal digits at `pos`, advancing it.
[[nodiscard]] bool read_fixed(std::string_view text, std::size_t& pos,
                              std::size_t width, int& out) noexcept {
    if (pos + width > text.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = 0; i < width; ++i) {
        const char c = text[pos + i];
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += width;
    out = value;
    return true;
}

[[nodiscard]] bool expect(std::string_view text, std::size_t& pos, char c) noexcept {
    if (pos >= text.size() || text[pos] != c) {
        return false;
    }
    ++pos;
    return true;
}

[[nodiscard]] bool is_leap(int year) noexcept {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

[[nodiscard]] int days_in_month(int year, int month) noexcept {
    static constexpr int DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap(year)) {
        return 29;
    }
    return DAYS[month - 1];
}

/// Days since 1970-01-01 for a proleptic Gregorian date.
[[nodiscard]] std::int64_t days_from_civil(int year, int month, int day) noexcept {
    const std::int64_t y   = static_cast<std::int64_t>(year) - (month <= 2 ? 1 : 0);
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const std::int64_t yoe = y - era * 400;
    const std::int64_t mp  = (month + 9) % 12;
    const std::int64_t doy = (153 * mp + 2) / 5 + day - 1;
    const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

/// YYYY-MM-DD(T| )hh:mm:ss[.frac](Z|±hh:mm)
[[nodiscard]] std::optional<double> parse_rfc3339(std::string_view text) noexcept {
    std::size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

    if (!read_fixed(text, pos, 4, year) || !expect(text, pos, '-') ||
        !read_fixed(text, pos, 2, month) || !expect(text, pos, '-') ||
        !read_fixed(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (pos >= text.size() || (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ')) {
        return std::nullopt;
    }
    ++pos;
    if (!read_fixed(text, pos, 2, hour) || !expect(text, pos, ':') ||
        !read_fixed(text, pos, 2, minute) || !expect(text, pos, ':') ||
        !read_fixed(text, pos, 2, second)) {
        return std::nullopt;
    }

    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || day > days_in_month(year, month)) return std::nullopt;
    if (hour > 23 || minute > 59 || second > 60) return std::nullopt;

    double fraction = 0.0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        double scale = 0.1;
        std::size_t digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            fraction += (text[pos] - '0') * scale;
            scale *= 0.1;
            ++pos;
            ++digits;
        }
        if (digits == 0) {
            return std::nullopt;
        }
    }

    if (pos >= text.size()) {
        return std::nullopt;  // offset is mandatory
    }

    std::int64_t offset_s = 0;
    const char zone = text[pos];
    if (zone == 'Z' || zone == 'z') {
        ++pos;
    } else if (zone == '+' || zone == '-') {
        ++pos;
        int off_h = 0, off_m = 0;
        if (!read_fixed(text, pos, 2, off_h) || !expect(text, pos, ':') ||
            !read_fixed(text, pos, 2, off_m)) {
            return std::nullopt;
        }
        if (off_h > 23 || off_m > 59) {
            return std::nullopt;
        }
        offset_s = (off_h * 3600 + off_m * 60) * (zone == '+' ? 1 : -1);
    } else {
        return std::nullopt;
    }

    if (pos != text.size()) {
        return std::nullopt;
    }

    const std::int64_t whole = days_from_civil(year, month, day) * 86400
                             + hour * 3600 + minute * 60 + second
                             - offset_s;
    return static_cast<double>(whole) + fraction;
}

} // anonymous namespace

// ─── RecordError ──────────────────────────────────────────────────────────────

std::string_view to_string(RecordError error) noexcept {
    switch (error) {
        case RecordError::kNone:                return "NONE";
        case RecordError::kMissingSensorId:     return "MISSING_SENSOR_ID";
        case RecordError::kMissingTimestamp:    return "MISSING_TIMESTAMP";
        case RecordError::kBadTimestamp:        return "BAD_TIMESTAMP";
        case RecordError::kMissingTemperature:  return "MISSING_TEMPERATURE";
        case RecordError::kBadTemperature:      return "BAD_TEMPERATURE";
        case RecordError::kNotTemperatureEvent: return "NOT_TEMPERATURE_EVENT";
    }
    return "UNKNOWN";
}

bool is_malformed(RecordError error) noexcept {
    return error != RecordError::kNone && error != RecordError::kNotTemperatureEvent;
}

// ─── EventNormalizer::sensor_id_from_target ───────────────────────────────────

std::string_view
EventNormalizer::sensor_id_from_target(std::string_view target_name) noexcept {
    const auto name = trim(target_name);
    const auto slash = name.rfind('/');
    if (slash == std::string_view::npos) {
        return name;
    }
    return name.substr(slash + 1);
}

// ─── EventNormalizer::parse_timestamp ─────────────────────────────────────────

std::optional<double>
EventNormalizer::parse_timestamp(std::string_view text) noexcept {
    const auto value = trim(text);
    if (value.empty()) {
        return std::nullopt;
    }
    // A date always has '-' in position 4; a unix time never does.
    if (value.size() >= 5 && value[4] == '-') {
        return parse_rfc3339(value);
    }
    return parse_finite(value);
}

// ─── EventNormalizer::parse_temperature ───────────────────────────────────────

std::optional<double>
EventNormalizer::parse_temperature(std::string_view text) noexcept {
    auto value = parse_finite(trim(text));
    if (!value || *value < constants::ABSOLUTE_ZERO_C) {
        return std::nullopt;
    }
    return value;
}

// ─── EventNormalizer::normalize ───────────────────────────────────────────────

NormalizeResult
EventNormalizer::normalize(const RawRecord& record, Source source) noexcept {
    if (trim(record.event_type) != "temperature") {
        return {.reading = std::nullopt, .error = RecordError::kNotTemperatureEvent};
    }

    const auto sensor_id = sensor_id_from_target(record.target_name);
    if (sensor_id.empty()) {
        return {.reading = std::nullopt, .error = RecordError::kMissingSensorId};
    }

    if (trim(record.update_time).empty()) {
        return {.reading = std::nullopt, .error = RecordError::kMissingTimestamp};
    }
    const auto timestamp = parse_timestamp(record.update_time);
    if (!timestamp) {
        return {.reading = std::nullopt, .error = RecordError::kBadTimestamp};
    }

    if (trim(record.temperature).empty()) {
        return {.reading = std::nullopt, .error = RecordError::kMissingTemperature};
    }
    const auto temperature = parse_temperature(record.temperature);
    if (!temperature) {
        return {.reading = std::nullopt, .error = RecordError::kBadTemperature};
    }

    return {
        .reading = Reading{
            .sensor_id   = SensorId(sensor_id),
            .timestamp   = *timestamp,
            .temperature = *temperature,
            .source      = source,
            .annotations = kNoAnnotation,
        },
        .error = RecordError::kNone,
    };
}

}  // namespace coldstream
