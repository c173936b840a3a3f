#pragma once

#include <cstdint>
#include <vector>

#include "core/model/JournalTypes.h"

namespace harvestcast {
namespace core {

class ITrainingJournal {
public:
    virtual ~ITrainingJournal() = default;

    // Assigns the next sequence number; event.seq is ignored
    virtual bool append(const TrainingEvent& event) = 0;
    virtual std::vector<TrainingEvent> readFrom(std::uint64_t seq_inclusive) = 0;
    virtual std::uint64_t lastSeq() const = 0;
};

} // namespace core
} // namespace harvestcast
