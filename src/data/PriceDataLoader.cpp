#include "data/PriceDataLoader.h"
#include <fstream>
#include <sstream>
#include <map>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include "common/DateUtils.h"
#include "common/Logger.h"

namespace harvestcast {
namespace data {

namespace {
std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // Strip UTF-8 BOM if present at first cell.
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

// Quote-aware split; commas inside "..." stay in the cell
std::vector<std::string> splitRow(const std::string& line) {
    std::vector<std::string> row;
    std::string cell;
    bool quoted = false;
    for (char c : line) {
        if (c == '"') {
            quoted = !quoted;
            cell.push_back(c);
        } else if (c == ',' && !quoted) {
            row.push_back(normalizeCell(cell));
            cell.clear();
        } else {
            cell.push_back(c);
        }
    }
    row.push_back(normalizeCell(cell));
    return row;
}

std::string lowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

struct ColumnMap {
    int state = -1;
    int district = -1;
    int market = -1;
    int commodity = -1;
    int date = -1;
    int min_price = -1;
    int max_price = -1;
    int modal_price = -1;

    bool valid() const {
        return market >= 0 && commodity >= 0 && date >= 0 && modal_price >= 0;
    }
};

ColumnMap mapHeader(const std::vector<std::string>& header) {
    ColumnMap cols;
    for (int i = 0; i < static_cast<int>(header.size()); ++i) {
        const std::string name = lowerCopy(header[i]);
        if (name == "state") cols.state = i;
        else if (name == "district name" || name == "district") cols.district = i;
        else if (name == "market name" || name == "market") cols.market = i;
        else if (name == "commodity") cols.commodity = i;
        else if (name == "price date" || name == "arrival date" || name == "date") cols.date = i;
        else if (name.rfind("min price", 0) == 0) cols.min_price = i;
        else if (name.rfind("max price", 0) == 0) cols.max_price = i;
        else if (name.rfind("modal price", 0) == 0) cols.modal_price = i;
    }
    return cols;
}

std::string cellAt(const std::vector<std::string>& row, int index) {
    if (index < 0 || index >= static_cast<int>(row.size())) {
        return "";
    }
    return row[index];
}

// Whole cell must be a finite number; "2,100" or "NaN" is rejected
double parsePrice(const std::string& cell) {
    std::size_t pos = 0;
    const double value = std::stod(cell, &pos);
    if (pos != cell.size()) {
        throw std::invalid_argument("trailing characters in price '" + cell + "'");
    }
    if (!std::isfinite(value)) {
        throw std::invalid_argument("non-finite price '" + cell + "'");
    }
    return value;
}

double priceAt(const std::vector<std::string>& row, int index, double fallback) {
    const std::string cell = cellAt(row, index);
    if (cell.empty()) {
        return fallback;
    }
    return parsePrice(cell);
}
}

std::vector<PricePoint> PriceDataLoader::loadCSV(const std::string& file_path) {
    std::vector<PricePoint> points;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return points;
    }

    std::string line;
    if (!std::getline(file, line)) {
        LOG_WARN("Empty CSV file: {}", file_path);
        return points;
    }

    const ColumnMap cols = mapHeader(splitRow(line));
    if (!cols.valid()) {
        LOG_ERROR("CSV header missing required columns: {}", file_path);
        return points;
    }

    std::size_t skipped = 0;
    while (std::getline(file, line)) {
        if (trim(line).empty()) continue;
        const auto row = splitRow(line);

        const auto date = utils::DateUtils::parse(cellAt(row, cols.date));
        if (!date) {
            ++skipped;
            continue;
        }

        try {
            PricePoint point;
            point.commodity = cellAt(row, cols.commodity);
            point.region = cellAt(row, cols.state);
            point.market = cellAt(row, cols.market);
            point.district = cellAt(row, cols.district);
            point.date = *date;
            point.modal_price = parsePrice(cellAt(row, cols.modal_price));
            point.min_price = priceAt(row, cols.min_price, point.modal_price);
            point.max_price = priceAt(row, cols.max_price, point.modal_price);
            points.push_back(std::move(point));
        } catch (const std::exception& e) {
            ++skipped;
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    std::stable_sort(points.begin(), points.end(), [](const PricePoint& a, const PricePoint& b) {
        return a.date < b.date;
    });

    LOG_INFO("Loaded {} price records from {} ({} skipped)", points.size(), file_path, skipped);
    return points;
}

} // namespace data
} // namespace harvestcast
