#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>

#include "core/contracts/ITrainingJournal.h"

namespace harvestcast {
namespace core {

class TrainingJournalJsonl : public ITrainingJournal {
public:
    explicit TrainingJournalJsonl(std::filesystem::path file_path);

    bool append(const TrainingEvent& event) override;
    std::vector<TrainingEvent> readFrom(std::uint64_t seq_inclusive) override;
    std::uint64_t lastSeq() const override;

private:
    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
};

} // namespace core
} // namespace harvestcast
