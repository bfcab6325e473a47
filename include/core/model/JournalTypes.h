#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace capsim {
namespace core {

enum class JournalEventType {
    POSITION_OPENED,
    POSITION_CLOSED,
    SIGNAL_SKIPPED,
    RUN_COMPLETED
};

const char* journalEventTypeToString(JournalEventType type);
JournalEventType journalEventTypeFromString(const std::string& value);

struct JournalEvent {
    std::uint64_t seq = 0;             // 저널에 기록될 때 부여
    long long ts_ms = 0;               // 시뮬레이션 시각
    JournalEventType type = JournalEventType::SIGNAL_SKIPPED;
    std::string run_id;                // 시나리오 이름
    std::string market;
    nlohmann::json payload = nlohmann::json::object();
};

} // namespace core
} // namespace capsim
