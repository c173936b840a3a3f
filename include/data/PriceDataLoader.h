#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace harvestcast {
namespace data {

class PriceDataLoader {
public:
    // Load mandi prices from an agmarknet CSV export.
    // Header columns (any order): State, District Name, Market Name, Commodity,
    // Price Date, Min Price (Rs./Quintal), Max Price (Rs./Quintal),
    // Modal Price (Rs./Quintal)
    static std::vector<PricePoint> loadCSV(const std::string& file_path);
};

} // namespace data
} // namespace harvestcast
