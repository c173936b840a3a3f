#pragma once

#include <optional>
#include <string>

#include "common/Types.h"

namespace harvestcast {
namespace utils {

class DateUtils {
public:
    static DayNumber fromCivil(int year, int month, int day);
    static void toCivil(DayNumber days, int& year, int& month, int& day);

    // Accepts "2024-01-15" and the agmarknet export form "15 Jan 2024"
    static std::optional<DayNumber> parse(const std::string& text);

    // ISO yyyy-mm-dd
    static std::string format(DayNumber days);

    static int month(DayNumber days);
    static std::string monthName(int month);

    static DayNumber today();
    static long long nowMs();
};

} // namespace utils
} // namespace harvestcast
