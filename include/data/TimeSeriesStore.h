#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "common/Types.h"

namespace harvestcast {
namespace data {

// In-memory holder of raw dated price observations.
// Single writer (ingest), many concurrent readers.
class TimeSeriesStore {
public:
    using Clock = std::function<DayNumber()>;

    // clock supplies "today" for window cutoffs; defaults to the system clock
    explicit TimeSeriesStore(Clock clock = Clock());

    void ingest(const std::vector<PricePoint>& points);
    std::size_t size() const;
    DayNumber today() const;

    // Ascending by date; empty when nothing matches. Empty/unset filters match all.
    std::vector<PricePoint> query(
        const std::string& commodity,
        const std::optional<std::string>& region,
        const std::optional<std::string>& market,
        int window_days
    ) const;

    // One sample per date: mean modal price across the matching markets
    std::vector<SeriesSample> aggregateForModeling(
        const std::string& commodity,
        const std::string& region,
        const std::optional<std::string>& market = std::nullopt,
        int window_days = 365
    ) const;

    // Latest observation per market, newest first
    std::vector<PricePoint> latestPrices(
        const std::string& commodity,
        const std::optional<std::string>& region = std::nullopt,
        std::size_t limit = 20
    ) const;

    std::vector<std::string> commodities() const;
    std::vector<std::string> regions() const;
    std::vector<std::string> commoditiesInRegion(const std::string& region) const;
    std::vector<std::string> marketsInRegion(const std::string& region) const;

private:
    struct Row {
        PricePoint point;
        std::string commodity_key;
        std::string region_key;
        std::string market_key;
    };

    static bool matches(const std::string& key, const std::optional<std::string>& filter);
    std::vector<std::string> distinctNames(const std::optional<std::string>& region,
                                           std::string Row::*key,
                                           std::string PricePoint::*name) const;

    Clock clock_;
    mutable std::shared_mutex mutex_;
    std::vector<Row> rows_;
};

} // namespace data
} // namespace harvestcast
