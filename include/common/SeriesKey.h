#pragma once

#include <optional>
#include <string>

namespace harvestcast {

// Normalized (commodity, region, market|"all") identity of a modeled series.
// Matching is case-insensitive and whitespace-normalized.
struct SeriesKey {
    std::string commodity;
    std::string region;
    std::string market;  // "all" when the series spans every market in the region

    static SeriesKey make(const std::string& commodity,
                          const std::string& region,
                          const std::optional<std::string>& market = std::nullopt);

    // "<commodity>|<region>|<market>" over the normalized parts.
    // Distinct identities never share a string.
    std::string str() const;

    bool isAllMarkets() const { return market == "all"; }

    bool operator==(const SeriesKey& other) const {
        return commodity == other.commodity && region == other.region && market == other.market;
    }
};

namespace utils {
// Lowercase, trim, collapse internal whitespace runs to a single space
std::string normalizeName(const std::string& value);
}

} // namespace harvestcast
