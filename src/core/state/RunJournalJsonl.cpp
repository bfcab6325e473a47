#include "core/state/RunJournalJsonl.h"
#include "common/Logger.h"

#include <algorithm>
#include <fstream>

namespace capsim {
namespace core {

namespace {
std::uint64_t parseSeq(const nlohmann::json& line) {
    return line.value("seq", static_cast<std::uint64_t>(0));
}

nlohmann::json toLine(const JournalEvent& event, std::uint64_t seq) {
    nlohmann::json line;
    line["seq"] = seq;
    line["ts_ms"] = event.ts_ms;
    line["type"] = journalEventTypeToString(event.type);
    line["run_id"] = event.run_id;
    line["market"] = event.market;
    line["payload"] = event.payload;
    return line;
}
}

const char* journalEventTypeToString(JournalEventType type) {
    switch (type) {
        case JournalEventType::POSITION_OPENED: return "POSITION_OPENED";
        case JournalEventType::POSITION_CLOSED: return "POSITION_CLOSED";
        case JournalEventType::SIGNAL_SKIPPED: return "SIGNAL_SKIPPED";
        case JournalEventType::RUN_COMPLETED: return "RUN_COMPLETED";
    }
    return "SIGNAL_SKIPPED";
}

JournalEventType journalEventTypeFromString(const std::string& value) {
    if (value == "POSITION_OPENED") return JournalEventType::POSITION_OPENED;
    if (value == "POSITION_CLOSED") return JournalEventType::POSITION_CLOSED;
    if (value == "RUN_COMPLETED") return JournalEventType::RUN_COMPLETED;
    return JournalEventType::SIGNAL_SKIPPED;
}

RunJournalJsonl::RunJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        try {
            nlohmann::json line = nlohmann::json::parse(row);
            last_seq_ = (std::max)(last_seq_, parseSeq(line));
        } catch (const nlohmann::json::exception& e) {
            ++malformed_lines_;
            LOG_WARN("Journal {}: malformed line skipped ({})", file_path_.string(), e.what());
        }
    }
}

bool RunJournalJsonl::append(const JournalEvent& event) {
    return appendAll({event}) == 1;
}

size_t RunJournalJsonl::appendAll(const std::vector<JournalEvent>& events) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path());
    }
    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        LOG_ERROR("Journal {}: cannot open for append", file_path_.string());
        return 0;
    }

    size_t written = 0;
    for (const auto& event : events) {
        const std::uint64_t next_seq = last_seq_ + 1;
        out << toLine(event, next_seq).dump() << "\n";
        if (!out) {
            LOG_ERROR("Journal {}: write failed at seq {}", file_path_.string(), next_seq);
            break;
        }
        last_seq_ = next_seq;
        ++written;
    }
    out.flush();
    return written;
}

std::vector<JournalEvent> RunJournalJsonl::readFrom(std::uint64_t seq_inclusive) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<JournalEvent> out;
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }

        nlohmann::json line;
        try {
            line = nlohmann::json::parse(row);
        } catch (const nlohmann::json::parse_error&) {
            // 중간에 잘린 줄 (비정상 종료)
            continue;
        }

        const auto seq = parseSeq(line);
        if (seq < seq_inclusive) {
            continue;
        }

        JournalEvent event;
        event.seq = seq;
        event.ts_ms = line.value("ts_ms", 0LL);
        event.type = journalEventTypeFromString(line.value("type", std::string("SIGNAL_SKIPPED")));
        event.run_id = line.value("run_id", std::string());
        event.market = line.value("market", std::string());
        event.payload = line.value("payload", nlohmann::json::object());
        out.push_back(std::move(event));
    }

    return out;
}

std::uint64_t RunJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

size_t RunJournalJsonl::malformedLines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return malformed_lines_;
}

} // namespace core
} // namespace capsim
