#include "common/DateUtils.h"
#include "data/TimeSeriesStore.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

using namespace harvestcast;

static int fail(const std::string& message) {
    std::cerr << "[TEST] " << message << "\n";
    return 1;
}

int main() {
    const DayNumber today = utils::DateUtils::fromCivil(2024, 3, 31);
    data::TimeSeriesStore store([today]() { return today; });

    if (!store.query("Wheat", std::nullopt, std::nullopt, 30).empty()) {
        return fail("empty store should return an empty query");
    }

    store.ingest({
        PricePoint("Wheat", "Punjab", "Khanna", today - 2, 2100, 2300, 2200),
        PricePoint("wheat ", "PUNJAB", "Ludhiana", today - 2, 2000, 2200, 2100),
        PricePoint("Wheat", "Punjab", "Khanna", today - 10, 2000, 2200, 2150),
        PricePoint("Wheat", "Punjab", "Khanna", today - 40, 1900, 2100, 2000),
        PricePoint("Wheat", "Haryana", "Karnal", today - 1, 2050, 2250, 2180),
        PricePoint("Onion", "Punjab", "Khanna", today - 5, 900, 1300, 1100),
    });

    if (store.size() != 6) {
        return fail("size should be 6, got " + std::to_string(store.size()));
    }

    // Case and whitespace insensitive matching, window cutoff, ascending dates
    const auto punjab = store.query("WHEAT", std::string("punjab"), std::nullopt, 30);
    if (punjab.size() != 3) {
        return fail("expected 3 Punjab wheat rows in 30 days, got " + std::to_string(punjab.size()));
    }
    for (std::size_t i = 1; i < punjab.size(); ++i) {
        assert(punjab[i - 1].date <= punjab[i].date);
    }
    if (punjab.front().date != today - 10) {
        return fail("query result is not sorted ascending");
    }

    // Window edge is inclusive
    if (store.query("Wheat", std::string("Punjab"), std::string("Khanna"), 10).size() != 2) {
        return fail("cutoff day should be included");
    }

    // Empty region filter matches every region
    if (store.query("Wheat", std::string(""), std::nullopt, 30).size() != 4) {
        return fail("empty region filter should match all regions");
    }

    if (!store.query("Rice", std::string("Punjab"), std::nullopt, 365).empty()) {
        return fail("unknown commodity should yield an empty result");
    }

    const auto series = store.aggregateForModeling("Wheat", "Punjab", std::nullopt, 365);
    if (series.size() != 3) {
        return fail("aggregate should produce one sample per date");
    }
    if (std::abs(series.back().price - 2150.0) > 1e-9) {
        return fail("aggregate should average markets on the same date");
    }

    const auto khanna = store.aggregateForModeling("Wheat", "Punjab", std::string("Khanna"), 365);
    if (khanna.size() != 3 || std::abs(khanna.back().price - 2200.0) > 1e-9) {
        return fail("market-filtered aggregate mismatch");
    }

    const auto latest = store.latestPrices("Wheat", std::nullopt, 10);
    if (latest.size() != 3 || latest.front().market != "Karnal") {
        return fail("latestPrices should return one row per market, newest first");
    }
    if (store.latestPrices("Wheat", std::nullopt, 1).size() != 1) {
        return fail("latestPrices should honor the limit");
    }

    const auto in_punjab = store.commoditiesInRegion("punjab");
    if (in_punjab.size() != 2) {
        return fail("expected two commodities in Punjab");
    }
    if (store.regions().size() != 2) {
        return fail("expected two regions");
    }
    if (store.marketsInRegion("Punjab").size() != 2) {
        return fail("expected two markets in Punjab");
    }

    std::cout << "[TEST] TimeSeriesStore PASSED\n";
    return 0;
}
