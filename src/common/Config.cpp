#include "common/Config.h"
#include "common/Errors.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace capsim {

namespace {
std::string toLowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

risk::SizingMode parseSizingMode(const std::string& raw) {
    const std::string mode = toLowerCopy(raw);
    if (mode == "kelly") {
        return risk::SizingMode::KELLY;
    }
    if (mode == "fixed") {
        return risk::SizingMode::FIXED;
    }
    throw ConfigError("unknown sizing.mode: " + raw);
}

long long hoursToMs(double hours) {
    return static_cast<long long>(std::llround(hours * static_cast<double>(MS_PER_HOUR)));
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

backtest::BacktestConfig Config::applyOverrides(backtest::BacktestConfig base,
                                                const nlohmann::json& j) {
    try {
        if (j.contains("backtest")) {
            const auto& b = j["backtest"];
            base.initial_capital = b.value("initial_capital", base.initial_capital);
            base.market = b.value("market", base.market);
        }

        if (j.contains("cost")) {
            const auto& c = j["cost"];
            base.cost.fee_rate = c.value("fee_rate", base.cost.fee_rate);
            base.cost.slippage_rate = c.value("slippage_rate", base.cost.slippage_rate);
            base.cost.min_order_value = c.value("min_order_value", base.cost.min_order_value);
        }

        if (j.contains("sizing")) {
            const auto& s = j["sizing"];
            if (s.contains("mode")) {
                base.sizing.mode = parseSizingMode(s["mode"].get<std::string>());
            }
            base.sizing.min_fraction = s.value("min_fraction", base.sizing.min_fraction);
            base.sizing.max_fraction = s.value("max_fraction", base.sizing.max_fraction);
            base.sizing.half_kelly = s.value("half_kelly", base.sizing.half_kelly);
            base.sizing.damping = s.value("damping", base.sizing.damping);
            base.sizing.lookback_trades = s.value("lookback_trades", base.sizing.lookback_trades);
            base.sizing.min_trades = s.value("min_trades", base.sizing.min_trades);
            base.sizing.default_fraction = s.value("default_fraction", base.sizing.default_fraction);
            base.sizing.fixed_fraction = s.value("fixed_fraction", base.sizing.fixed_fraction);
        }

        if (j.contains("exit")) {
            const auto& e = j["exit"];
            base.exit.take_profit = e.value("take_profit", base.exit.take_profit);
            base.exit.stop_loss = e.value("stop_loss", base.exit.stop_loss);

            // max_hold_hours 가 우선, 없으면 초 단위 키
            if (e.contains("max_hold_hours")) {
                base.exit.max_hold_duration_ms = hoursToMs(e["max_hold_hours"].get<double>());
            } else if (e.contains("max_hold_duration_sec")) {
                base.exit.max_hold_duration_ms =
                    e["max_hold_duration_sec"].get<long long>() * MS_PER_SECOND;
            }

            if (e.contains("trailing_stop")) {
                const auto& t = e["trailing_stop"];
                auto& trailing = base.exit.trailing_stop;
                trailing.enabled = t.value("enabled", trailing.enabled);
                trailing.activation_pct = t.value("activation_pct", trailing.activation_pct);
                trailing.trail_pct = t.value("trail_pct", trailing.trail_pct);
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid config value: ") + e.what());
    }

    return base;
}

void Config::loadFromJson(const nlohmann::json& j) {
    backtest::BacktestConfig parsed = applyOverrides(backtest::BacktestConfig{}, j);
    parsed.validate();

    std::vector<backtest::ScenarioConfig> scenarios;
    if (j.contains("scenarios")) {
        if (!j["scenarios"].is_array()) {
            throw ConfigError("scenarios must be an array");
        }
        int index = 0;
        for (const auto& item : j["scenarios"]) {
            backtest::ScenarioConfig scenario;
            scenario.name = item.value("name", "scenario_" + std::to_string(index));
            scenario.config = applyOverrides(parsed, item);
            try {
                scenario.config.validate();
            } catch (const ConfigError& e) {
                throw ConfigError("scenario '" + scenario.name + "': " + e.what());
            }
            scenarios.push_back(std::move(scenario));
            ++index;
        }
    }

    std::string log_level = log_level_;
    std::string log_dir = log_dir_;
    std::string journal_path = journal_path_;
    if (j.contains("backtest")) {
        const auto& b = j["backtest"];
        log_level = b.value("log_level", std::string("info"));
        log_dir = b.value("log_dir", std::string("logs"));
        journal_path = b.value("journal_path", std::string("logs/run_journal.jsonl"));
    }

    // 전부 성공한 뒤에만 반영
    backtest_config_ = parsed;
    scenarios_ = std::move(scenarios);
    log_level_ = log_level;
    log_dir_ = log_dir;
    journal_path_ = journal_path;
}

void Config::load(const std::string& path, std::ostream& console) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    console << "설정 파일 경로: " << config_path << std::endl;

    if (!std::filesystem::exists(config_path)) {
        console << "경고: 설정 파일을 찾을 수 없습니다: " << config_path << std::endl;
        console << "기본값을 사용합니다." << std::endl;
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw ConfigError("cannot open config file: " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("config parse error (" + config_path.string() + "): " + e.what());
    }

    loadFromJson(j);

    console << "설정 파일 로드 완료" << std::endl;
    console << "Config Loaded: Capital=" << backtest_config_.initial_capital
            << ", Fee=" << backtest_config_.cost.fee_rate
            << ", Slippage=" << backtest_config_.cost.slippage_rate
            << ", Scenarios=" << scenarios_.size() << std::endl;
}

} // namespace capsim
