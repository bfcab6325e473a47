#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace capsim {

// 모든 시각은 UTC epoch milliseconds (long long)
constexpr long long MS_PER_SECOND = 1000LL;
constexpr long long MS_PER_HOUR = 3600LL * 1000LL;

struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long timestamp;

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, long long t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

// Entry signal produced outside the engine (strategy scripts, notebooks, ...)
struct Signal {
    long long timestamp = 0;
    double price = 0.0;
    std::optional<double> score;
    nlohmann::json metadata = nlohmann::json::object();

    Signal() = default;
    Signal(long long ts, double p) : timestamp(ts), price(p) {}
    Signal(long long ts, double p, double s) : timestamp(ts), price(p), score(s) {}
};

} // namespace capsim
