#include "common/TimeUtils.h"

#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace capsim {
namespace utils {

long long parseIso8601Ms(const std::string& iso_string) {
    std::string normalized = iso_string;
    // "2024-01-01 09:00:00" 형식도 허용
    if (normalized.size() > 10 && normalized[10] == ' ') {
        normalized[10] = 'T';
    }

    std::tm tm = {};
    std::istringstream ss(normalized);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        // Date-only values are midnight UTC.
        std::istringstream date_only(normalized);
        tm = {};
        date_only >> std::get_time(&tm, "%Y-%m-%d");
        if (date_only.fail() || date_only.peek() != std::char_traits<char>::eof()) {
            throw std::invalid_argument("Failed to parse timestamp: " + iso_string);
        }
        const time_t tt = timegm(&tm);
        return static_cast<long long>(tt) * 1000LL;
    }

    long long millis = 0;
    if (ss.peek() == '.') {
        ss.ignore();
        std::string digits;
        while (std::isdigit(ss.peek())) {
            digits += static_cast<char>(ss.get());
        }
        if (digits.empty()) {
            throw std::invalid_argument("Empty fractional seconds in timestamp: " + iso_string);
        }
        // 밀리초 해상도까지만 사용
        while (digits.size() < 3) {
            digits += '0';
        }
        millis = std::stoll(digits.substr(0, 3));
    }

    long long offset_ms = 0;
    char sign_or_z = 0;
    if (ss >> sign_or_z) {
        if (sign_or_z == 'Z' || sign_or_z == 'z') {
            offset_ms = 0;
        } else if (sign_or_z == '+' || sign_or_z == '-') {
            int offset_h = 0;
            int offset_m = 0;
            char colon = ' ';
            if (!(ss >> std::setw(2) >> offset_h >> colon >> std::setw(2) >> offset_m) || colon != ':') {
                throw std::invalid_argument("Failed to parse timezone offset: " + iso_string);
            }
            offset_ms = (static_cast<long long>(offset_h) * 3600LL + offset_m * 60LL) * 1000LL;
            if (sign_or_z == '-') {
                offset_ms = -offset_ms;
            }
        } else {
            throw std::invalid_argument("Invalid timezone indicator '" + std::string(1, sign_or_z) +
                                        "' in timestamp: " + iso_string);
        }
    }

    const time_t tt = timegm(&tm);
    if (tt == static_cast<time_t>(-1)) {
        throw std::invalid_argument("Failed to convert timestamp to epoch: " + iso_string);
    }
    return static_cast<long long>(tt) * 1000LL + millis - offset_ms;
}

std::string formatIso8601(long long ts_ms) {
    long long seconds = ts_ms / 1000LL;
    long long millis = ts_ms % 1000LL;
    if (millis < 0) {
        millis += 1000LL;
        seconds -= 1;
    }

    const time_t tt = static_cast<time_t>(seconds);
    std::tm utc_tm{};
    gmtime_r(&tt, &utc_tm);

    std::ostringstream oss;
    oss << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%S");
    if (millis != 0) {
        oss << '.' << std::setfill('0') << std::setw(3) << millis;
    }
    oss << 'Z';
    return oss.str();
}

long long toMsTimestamp(long long ts) {
    // 1e11 미만은 초 단위 (ms 기준이면 1973년 이전 데이터)
    if (ts > 0 && ts < 100000000000LL) {
        return ts * 1000LL;
    }
    return ts;
}

} // namespace utils
} // namespace capsim
