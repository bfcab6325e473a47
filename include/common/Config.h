#pragma once

#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "backtest/BacktestConfig.h"

namespace capsim {

class Config {
public:
    static Config& getInstance();

    // 파일이 없으면 기본값 유지, 파싱/검증 실패는 ConfigError
    // 진행 메시지는 console 로 (--json 모드에서는 std::cerr)
    void load(const std::string& config_path, std::ostream& console = std::cout);
    void loadFromJson(const nlohmann::json& j);

    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }
    std::string getJournalPath() const { return journal_path_; }
    double getInitialCapital() const { return backtest_config_.initial_capital; }

    // 실행마다 독립된 사본을 받는다
    backtest::BacktestConfig getBacktestConfig() const { return backtest_config_; }
    std::vector<backtest::ScenarioConfig> getScenarios() const { return scenarios_; }

    // base 위에 JSON 섹션(backtest/cost/sizing/exit)을 덮어쓴 설정 반환
    static backtest::BacktestConfig applyOverrides(backtest::BacktestConfig base,
                                                   const nlohmann::json& j);

private:
    Config() = default;

    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
    std::string journal_path_ = "logs/run_journal.jsonl";

    backtest::BacktestConfig backtest_config_;
    std::vector<backtest::ScenarioConfig> scenarios_;
};

} // namespace capsim
