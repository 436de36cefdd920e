#pragma once

#include <string>
#include <ctime>
#include <optional>
#include <cstdint>

namespace util {
    std::string format_utc(std::time_t t, const char* fmt);
    // "HH:MM" of a UTC instant
    std::string utc_hhmm(std::time_t t);
    // ISO-8601 with "Z" or "+hh:mm" offset -> epoch seconds
    std::optional<int64_t> parse_iso8601(const std::string& text);
    std::string redact_dsn(const std::string& dsn);
}
