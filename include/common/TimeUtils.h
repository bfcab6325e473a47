#pragma once

#include <string>

namespace capsim {
namespace utils {

// ISO-8601 -> UTC epoch ms.
// Accepts YYYY-MM-DDTHH:MM:SS (or a space separator), optional fractional
// seconds, optional 'Z' / +HH:MM / -HH:MM. Missing offset is read as UTC.
// Throws std::invalid_argument on malformed input.
long long parseIso8601Ms(const std::string& iso_string);

// UTC epoch ms -> "YYYY-MM-DDTHH:MM:SSZ" (".mmm" appended when non-zero)
std::string formatIso8601(long long ts_ms);

// Upbit exports mix epoch seconds and epoch milliseconds.
long long toMsTimestamp(long long ts);

} // namespace utils
} // namespace capsim
