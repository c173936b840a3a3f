#include "core/state/TrainingJournalJsonl.h"

#include <algorithm>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/Logger.h"

namespace harvestcast {
namespace core {

namespace {
std::uint64_t parseSeq(const nlohmann::json& line) {
    return line.value("seq", static_cast<std::uint64_t>(0));
}
}

std::string toString(TrainingOutcome outcome) {
    switch (outcome) {
        case TrainingOutcome::TRAINED: return "TRAINED";
        case TrainingOutcome::INSUFFICIENT_DATA: return "INSUFFICIENT_DATA";
        case TrainingOutcome::FAILED: return "FAILED";
    }
    return "FAILED";
}

TrainingOutcome trainingOutcomeFromString(const std::string& value) {
    if (value == "TRAINED") return TrainingOutcome::TRAINED;
    if (value == "INSUFFICIENT_DATA") return TrainingOutcome::INSUFFICIENT_DATA;
    return TrainingOutcome::FAILED;
}

TrainingJournalJsonl::TrainingJournalJsonl(std::filesystem::path file_path)
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
            LOG_WARN("Training journal: skipping malformed line in {}: {}",
                     file_path_.string(), e.what());
        }
    }
}

bool TrainingJournalJsonl::append(const TrainingEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            LOG_ERROR("Training journal: cannot create {}: {}",
                      file_path_.parent_path().string(), ec.message());
            return false;
        }
    }

    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        LOG_ERROR("Training journal: cannot open {}", file_path_.string());
        return false;
    }

    const std::uint64_t next_seq = last_seq_ + 1;
    nlohmann::json line;
    line["seq"] = next_seq;
    line["ts_ms"] = event.ts_ms;
    line["key"] = event.key;
    line["outcome"] = toString(event.outcome);
    line["data_points"] = event.data_points;
    line["reason"] = event.reason;

    out << line.dump() << "\n";
    if (!out) {
        return false;
    }
    last_seq_ = next_seq;
    return true;
}

std::vector<TrainingEvent> TrainingJournalJsonl::readFrom(std::uint64_t seq_inclusive) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<TrainingEvent> out;
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
        } catch (const nlohmann::json::exception& e) {
            LOG_WARN("Training journal: skipping malformed line: {}", e.what());
            continue;
        }

        const auto seq = parseSeq(line);
        if (seq < seq_inclusive) {
            continue;
        }

        TrainingEvent event;
        event.seq = seq;
        event.ts_ms = line.value("ts_ms", 0LL);
        event.key = line.value("key", std::string());
        event.outcome = trainingOutcomeFromString(line.value("outcome", std::string("FAILED")));
        event.data_points = line.value("data_points", static_cast<std::size_t>(0));
        event.reason = line.value("reason", std::string());
        out.push_back(std::move(event));
    }

    return out;
}

std::uint64_t TrainingJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

} // namespace core
} // namespace harvestcast
