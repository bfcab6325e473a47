#include "common/Logger.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "backtest/BacktestEngine.h"
#include "backtest/DataHistory.h"
#include "backtest/ScenarioRunner.h"
#include "core/state/RunJournalJsonl.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace capsim;

namespace {

struct CliOptions {
    std::string config_path = "config/config.json";
    std::string bars_path;
    std::string signals_path;
    std::string report_path;
    std::string journal_path;
    std::string from_date;
    std::string to_date;
    double initial_capital = -1.0;
    int workers = 0;
    bool json_mode = false;
};

void printUsage() {
    std::cout << "사용법: capsim_backtest --bars <candles.csv|json> --signals <signals.json> [옵션]\n"
              << "  --config <path>            설정 파일 (기본: config/config.json)\n"
              << "  --out <path>               리포트 JSON 저장 경로\n"
              << "  --journal <path>           실행 저널(JSONL) 경로\n"
              << "  --from <iso8601>           이 시각 이전 봉 제외\n"
              << "  --to <iso8601>             이 시각 이후 봉 제외\n"
              << "  --initial-capital <krw>    초기 자본 override\n"
              << "  --workers <n>              시나리오 병렬 실행 스레드 수\n"
              << "  --json                     리포트를 stdout 에 JSON 으로 출력\n";
}

// 잘못된 인자는 ConfigError
CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto nextValue = [&](const std::string& name) -> std::string {
            if (i + 1 >= argc) {
                throw ConfigError("missing value for " + name);
            }
            return argv[++i];
        };

        if (arg == "--bars") {
            options.bars_path = nextValue(arg);
        } else if (arg == "--signals") {
            options.signals_path = nextValue(arg);
        } else if (arg == "--config") {
            options.config_path = nextValue(arg);
        } else if (arg == "--out") {
            options.report_path = nextValue(arg);
        } else if (arg == "--journal") {
            options.journal_path = nextValue(arg);
        } else if (arg == "--from") {
            options.from_date = nextValue(arg);
        } else if (arg == "--to") {
            options.to_date = nextValue(arg);
        } else if (arg == "--json") {
            options.json_mode = true;
        } else if (arg == "--initial-capital" || arg == "--workers") {
            const std::string value = nextValue(arg);
            try {
                if (arg == "--workers") {
                    options.workers = std::stoi(value);
                } else {
                    options.initial_capital = std::stod(value);
                }
            } catch (const std::exception&) {
                throw ConfigError("invalid " + arg + " value: " + value);
            }
        } else {
            throw ConfigError("unknown argument: " + arg);
        }
    }

    if (options.bars_path.empty() || options.signals_path.empty()) {
        throw ConfigError("--bars and --signals are required");
    }
    return options;
}

void printSummary(const std::string& title, const backtest::BacktestReport& report) {
    const auto& s = report.stats;
    std::cout << "\n" << title << "\n";
    std::cout << "---------------------------------------------\n";
    std::cout << "초기 자본:   " << static_cast<long long>(s.initial_capital) << " KRW\n";
    std::cout << "최종 자본:   " << static_cast<long long>(s.final_capital) << " KRW\n";
    std::cout << "총 수익률:   " << std::fixed << std::setprecision(2) << s.total_return_pct << "%\n";
    std::cout << "MDD:        " << s.max_drawdown_pct << "%\n";
    std::cout << "총 거래 수:  " << s.total_trades << "\n";
    std::cout << "승리 거래:   " << s.winning_trades << "\n";
    std::cout << "패배 거래:   " << s.losing_trades << "\n";
    std::cout << "승률:        " << (s.win_rate * 100.0) << "%\n";
    std::cout << "Sharpe:      " << std::setprecision(3) << s.sharpe_ratio << "\n";
    std::cout << "Profit Factor: " << s.profit_factor << "\n";
    std::cout << "Expectancy:  " << static_cast<long long>(s.expectancy) << " KRW/trade\n";
    std::cout << "총 수수료:   " << static_cast<long long>(s.total_fees) << " KRW\n";
    if (!s.exit_reason_counts.empty()) {
        std::cout << "청산 사유:\n";
        for (const auto& [reason, count] : s.exit_reason_counts) {
            std::cout << "  - " << reason << ": " << count << "\n";
        }
    }
    const auto& f = report.signal_funnel;
    std::cout << "신호: total=" << f.total
              << " entered=" << f.entered
              << " ignored(position open)=" << f.ignored_position_open
              << " skipped(capital)=" << f.skipped_insufficient_capital
              << " out of range=" << (f.before_first_bar + f.after_last_bar) << "\n";
    std::cout << "---------------------------------------------\n";
}

void writeJsonFile(const std::string& path, const nlohmann::json& j) {
    const std::filesystem::path out_path(path);
    if (out_path.has_parent_path()) {
        std::filesystem::create_directories(out_path.parent_path());
    }
    std::ofstream out(out_path);
    if (!out.is_open()) {
        throw BacktestError("cannot write report: " + path);
    }
    out << j.dump(2) << "\n";
    LOG_INFO("Report written: {}", path);
}

void persistJournal(const std::string& path, const std::vector<core::JournalEvent>& events) {
    core::RunJournalJsonl journal(path);
    const size_t written = journal.appendAll(events);
    if (written != events.size()) {
        LOG_WARN("Journal {}: wrote {} of {} events", path, written, events.size());
    } else {
        LOG_INFO("Journal {}: {} events (last seq {})", path, written, journal.lastSeq());
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2 || std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h") {
        printUsage();
        return argc < 2 ? 1 : 0;
    }

    try {
        const CliOptions options = parseArgs(argc, argv);

        auto& config = Config::getInstance();
        config.load(options.config_path, options.json_mode ? std::cerr : std::cout);

        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel(), options.json_mode);

        if (!options.json_mode) {
            std::cout << "\n";
            std::cout << "=============================================\n";
            std::cout << "       capsim Backtest v1.0\n";
            std::cout << "       신호 기반 단일 자산 백테스트\n";
            std::cout << "=============================================\n\n";
        }

        backtest::BacktestConfig base = config.getBacktestConfig();
        if (options.initial_capital > 0.0) {
            base.initial_capital = options.initial_capital;
        }
        base.validate();

        auto bars = backtest::DataHistory::loadCandles(options.bars_path);
        if (!options.from_date.empty() || !options.to_date.empty()) {
            bars = backtest::DataHistory::filterByDate(bars, options.from_date, options.to_date);
            LOG_INFO("Date filter [{}, {}]: {} candles", options.from_date, options.to_date, bars.size());
        }
        const auto signals = backtest::DataHistory::loadSignalsJSON(options.signals_path);
        const std::string journal_path =
            options.journal_path.empty() ? config.getJournalPath() : options.journal_path;

        auto scenarios = config.getScenarios();
        if (scenarios.empty()) {
            backtest::BacktestEngine engine(base, "base");
            const auto report = engine.run(bars, signals);
            persistJournal(journal_path, engine.journalEvents());

            const nlohmann::json j = report.toJson();
            if (!options.report_path.empty()) {
                writeJsonFile(options.report_path, j);
            }
            if (options.json_mode) {
                std::cout << j.dump() << "\n";
            } else {
                printSummary("백테스트 결과", report);
            }
            return 0;
        }

        if (options.initial_capital > 0.0) {
            for (auto& scenario : scenarios) {
                scenario.config.initial_capital = options.initial_capital;
            }
        }

        backtest::ScenarioRunner runner(options.workers);
        const auto results = runner.runAll(scenarios, bars, signals);

        nlohmann::json j;
        j["scenarios"] = nlohmann::json::array();
        std::vector<core::JournalEvent> events;
        int failed = 0;
        for (const auto& result : results) {
            nlohmann::json row;
            row["name"] = result.name;
            if (result.ok()) {
                row["report"] = result.report->toJson();
                events.insert(events.end(), result.journal.begin(), result.journal.end());
                if (!options.json_mode) {
                    printSummary("시나리오: " + result.name, *result.report);
                }
            } else {
                row["error"] = result.error;
                ++failed;
                std::cerr << "시나리오 실패: " << result.name << " - " << result.error << "\n";
            }
            j["scenarios"].push_back(std::move(row));
        }
        persistJournal(journal_path, events);

        if (!options.report_path.empty()) {
            writeJsonFile(options.report_path, j);
        }
        if (options.json_mode) {
            std::cout << j.dump() << "\n";
        }
        return failed == 0 ? 0 : 3;

    } catch (const ConfigError& e) {
        LOG_ERROR("Configuration error: {}", e.what());
        std::cerr << "설정 오류: " << e.what() << "\n";
        printUsage();
        return 2;
    } catch (const BacktestError& e) {
        LOG_ERROR("Backtest aborted: {}", e.what());
        std::cerr << "백테스트 실패: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "치명적 오류: " << e.what() << "\n";
        return 1;
    }
}
