#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace harvestcast {
namespace core {

enum class TrainingOutcome {
    TRAINED,
    INSUFFICIENT_DATA,
    FAILED
};

// One line of the training journal
struct TrainingEvent {
    std::uint64_t seq = 0;
    long long ts_ms = 0;
    std::string key;
    TrainingOutcome outcome = TrainingOutcome::TRAINED;
    std::size_t data_points = 0;
    std::string reason;
};

std::string toString(TrainingOutcome outcome);
TrainingOutcome trainingOutcomeFromString(const std::string& value);

} // namespace core
} // namespace harvestcast
