#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <vector>

#include "core/contracts/IRunJournal.h"

namespace capsim {
namespace core {

// 한 줄에 이벤트 하나 (JSON Lines). 기존 파일이 있으면 seq 를 이어서 부여
class RunJournalJsonl : public IRunJournal {
public:
    explicit RunJournalJsonl(std::filesystem::path file_path);

    bool append(const JournalEvent& event) override;
    std::vector<JournalEvent> readFrom(std::uint64_t seq_inclusive) override;
    std::uint64_t lastSeq() const override;

    // 실행 종료 후 메모리 저널을 한 번에 기록. 기록된 개수 반환
    size_t appendAll(const std::vector<JournalEvent>& events);

    size_t malformedLines() const;

private:
    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
    size_t malformed_lines_ = 0;
};

} // namespace core
} // namespace capsim
