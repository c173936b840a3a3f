#include "data/TimeSeriesStore.h"

#include <algorithm>
#include <map>
#include <mutex>

#include "common/DateUtils.h"
#include "common/SeriesKey.h"

namespace harvestcast {
namespace data {

TimeSeriesStore::TimeSeriesStore(Clock clock)
    : clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = &utils::DateUtils::today;
    }
}

void TimeSeriesStore::ingest(const std::vector<PricePoint>& points) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    rows_.reserve(rows_.size() + points.size());
    for (const auto& point : points) {
        Row row;
        row.point = point;
        row.commodity_key = utils::normalizeName(point.commodity);
        row.region_key = utils::normalizeName(point.region);
        row.market_key = utils::normalizeName(point.market);
        rows_.push_back(std::move(row));
    }
}

std::size_t TimeSeriesStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return rows_.size();
}

DayNumber TimeSeriesStore::today() const {
    return clock_();
}

bool TimeSeriesStore::matches(const std::string& key, const std::optional<std::string>& filter) {
    if (!filter) {
        return true;
    }
    const std::string wanted = utils::normalizeName(*filter);
    return wanted.empty() || wanted == key;
}

std::vector<PricePoint> TimeSeriesStore::query(
    const std::string& commodity,
    const std::optional<std::string>& region,
    const std::optional<std::string>& market,
    int window_days
) const {
    const std::string commodity_key = utils::normalizeName(commodity);
    const DayNumber cutoff = today() - window_days;

    std::vector<PricePoint> out;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& row : rows_) {
            if (row.commodity_key != commodity_key) continue;
            if (!matches(row.region_key, region)) continue;
            if (!matches(row.market_key, market)) continue;
            if (row.point.date < cutoff) continue;
            out.push_back(row.point);
        }
    }

    std::stable_sort(out.begin(), out.end(), [](const PricePoint& a, const PricePoint& b) {
        return a.date < b.date;
    });
    return out;
}

std::vector<SeriesSample> TimeSeriesStore::aggregateForModeling(
    const std::string& commodity,
    const std::string& region,
    const std::optional<std::string>& market,
    int window_days
) const {
    const auto points = query(commodity, region, market, window_days);

    std::map<DayNumber, std::pair<double, int>> by_date;
    for (const auto& p : points) {
        auto& acc = by_date[p.date];
        acc.first += p.modal_price;
        acc.second += 1;
    }

    std::vector<SeriesSample> series;
    series.reserve(by_date.size());
    for (const auto& entry : by_date) {
        SeriesSample sample;
        sample.date = entry.first;
        sample.price = entry.second.first / entry.second.second;
        series.push_back(sample);
    }
    return series;
}

std::vector<PricePoint> TimeSeriesStore::latestPrices(
    const std::string& commodity,
    const std::optional<std::string>& region,
    std::size_t limit
) const {
    const std::string commodity_key = utils::normalizeName(commodity);

    std::map<std::string, PricePoint> latest_by_market;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& row : rows_) {
            if (row.commodity_key != commodity_key) continue;
            if (!matches(row.region_key, region)) continue;
            auto it = latest_by_market.find(row.market_key);
            if (it == latest_by_market.end() || row.point.date > it->second.date) {
                latest_by_market[row.market_key] = row.point;
            }
        }
    }

    std::vector<PricePoint> out;
    out.reserve(latest_by_market.size());
    for (auto& entry : latest_by_market) {
        out.push_back(std::move(entry.second));
    }
    std::stable_sort(out.begin(), out.end(), [](const PricePoint& a, const PricePoint& b) {
        return a.date > b.date;
    });
    if (out.size() > limit) {
        out.resize(limit);
    }
    return out;
}

std::vector<std::string> TimeSeriesStore::distinctNames(
    const std::optional<std::string>& region, std::string Row::*key, std::string PricePoint::*name) const {
    const std::optional<std::string> region_key =
        region ? std::optional<std::string>(utils::normalizeName(*region)) : std::nullopt;

    // First spelling seen wins for display; identity is the normalized key
    std::map<std::string, std::string> names;
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& row : rows_) {
        if (region_key && row.region_key != *region_key) continue;
        names.emplace(row.*key, row.point.*name);
    }

    std::vector<std::string> out;
    out.reserve(names.size());
    for (const auto& entry : names) {
        out.push_back(entry.second);
    }
    return out;
}

std::vector<std::string> TimeSeriesStore::commodities() const {
    return distinctNames(std::nullopt, &Row::commodity_key, &PricePoint::commodity);
}

std::vector<std::string> TimeSeriesStore::regions() const {
    return distinctNames(std::nullopt, &Row::region_key, &PricePoint::region);
}

std::vector<std::string> TimeSeriesStore::commoditiesInRegion(const std::string& region) const {
    return distinctNames(region, &Row::commodity_key, &PricePoint::commodity);
}

std::vector<std::string> TimeSeriesStore::marketsInRegion(const std::string& region) const {
    return distinctNames(region, &Row::market_key, &PricePoint::market);
}

} // namespace data
} // namespace harvestcast
