#include "core/state/TrainingJournalJsonl.h"

#include <filesystem>
#include <fstream>
#include <iostream>

int main() {
    const auto path = std::filesystem::temp_directory_path() / "harvestcast_test_journal.jsonl";
    std::error_code ec;
    std::filesystem::remove(path, ec);

    {
        harvestcast::core::TrainingJournalJsonl journal(path);

        harvestcast::core::TrainingEvent first;
        first.ts_ms = 1000;
        first.key = "wheat|punjab|all";
        first.outcome = harvestcast::core::TrainingOutcome::TRAINED;
        first.data_points = 180;

        harvestcast::core::TrainingEvent second;
        second.ts_ms = 2000;
        second.key = "onion|punjab|all";
        second.outcome = harvestcast::core::TrainingOutcome::INSUFFICIENT_DATA;
        second.data_points = 12;
        second.reason = "need >= 30 points";

        if (!journal.append(first)) {
            std::cerr << "[TEST] append(first) failed\n";
            return 1;
        }
        if (!journal.append(second)) {
            std::cerr << "[TEST] append(second) failed\n";
            return 1;
        }
        if (journal.lastSeq() != 2) {
            std::cerr << "[TEST] lastSeq should be 2, got " << journal.lastSeq() << "\n";
            return 1;
        }
    }

    // A malformed line does not stop sequence recovery
    {
        std::ofstream out(path, std::ios::app);
        out << "{broken\n";
    }

    harvestcast::core::TrainingJournalJsonl reopened(path);
    if (reopened.lastSeq() != 2) {
        std::cerr << "[TEST] reopened journal should resume at seq 2\n";
        return 1;
    }

    const auto rows = reopened.readFrom(2);
    if (rows.size() != 1) {
        std::cerr << "[TEST] readFrom(2) should return one row, got " << rows.size() << "\n";
        return 1;
    }
    if (rows.front().key != "onion|punjab|all" ||
        rows.front().outcome != harvestcast::core::TrainingOutcome::INSUFFICIENT_DATA ||
        rows.front().data_points != 12) {
        std::cerr << "[TEST] unexpected row: " << rows.front().key << "\n";
        return 1;
    }

    harvestcast::core::TrainingEvent third;
    third.key = "rice|punjab|all";
    reopened.append(third);
    if (reopened.readFrom(0).size() != 3) {
        std::cerr << "[TEST] expected 3 rows after reopening\n";
        return 1;
    }

    std::filesystem::remove(path, ec);
    std::cout << "[TEST] TrainingJournal PASSED\n";
    return 0;
}
