#include "common/SeriesKey.h"

#include <cctype>

namespace harvestcast {

namespace utils {
std::string normalizeName(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    bool pending_space = false;
    for (unsigned char c : value) {
        if (std::isspace(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}
}

namespace {
// '|' separates parts; a literal '|' or backslash inside a part is escaped
std::string escapedPart(const std::string& normalized) {
    std::string out;
    out.reserve(normalized.size());
    for (char c : normalized) {
        if (c == '|' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}
}

SeriesKey SeriesKey::make(const std::string& commodity,
                          const std::string& region,
                          const std::optional<std::string>& market) {
    SeriesKey key;
    key.commodity = utils::normalizeName(commodity);
    key.region = utils::normalizeName(region);
    std::string m = market ? utils::normalizeName(*market) : std::string();
    key.market = m.empty() ? "all" : m;
    return key;
}

std::string SeriesKey::str() const {
    return escapedPart(commodity) + "|" + escapedPart(region) + "|" + escapedPart(market);
}

} // namespace harvestcast
