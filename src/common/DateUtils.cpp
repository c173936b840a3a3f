#include "common/DateUtils.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <sstream>

namespace harvestcast {
namespace utils {

namespace {
const std::array<const char*, 12> kMonthNames = {
    "January", "February", "March", "April", "May", "June",
    "July", "August", "September", "October", "November", "December"
};

bool isLeap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeap(year)) {
        return 29;
    }
    return kDays[month - 1];
}

bool validCivil(int year, int month, int day) {
    return year >= 1 && month >= 1 && month <= 12 &&
           day >= 1 && day <= daysInMonth(year, month);
}

int monthFromAbbrev(std::string token) {
    std::transform(token.begin(), token.end(), token.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (token.size() < 3) {
        return 0;
    }
    token = token.substr(0, 3);
    for (int i = 0; i < 12; ++i) {
        std::string name = kMonthNames[i];
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name.compare(0, 3, token) == 0) {
            return i + 1;
        }
    }
    return 0;
}
}

// Civil calendar <-> day count (H. Hinnant's days_from_civil / civil_from_days)
DayNumber DateUtils::fromCivil(int year, int month, int day) {
    year -= month <= 2 ? 1 : 0;
    const int era = (year >= 0 ? year : year - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int>(doe) - 719468;
}

void DateUtils::toCivil(DayNumber days, int& year, int& month, int& day) {
    days += 719468;
    const int era = (days >= 0 ? days : days - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(days - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    year = static_cast<int>(yoe) + era * 400 + (month <= 2 ? 1 : 0);
}

std::optional<DayNumber> DateUtils::parse(const std::string& text) {
    int y = 0;
    int m = 0;
    int d = 0;
    char tail = 0;

    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%c", &y, &m, &d, &tail) == 3) {
        if (!validCivil(y, m, d)) {
            return std::nullopt;
        }
        return fromCivil(y, m, d);
    }

    std::istringstream iss(text);
    std::string day_token;
    std::string month_token;
    std::string year_token;
    if (!(iss >> day_token >> month_token >> year_token)) {
        return std::nullopt;
    }
    try {
        d = std::stoi(day_token);
        y = std::stoi(year_token);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    m = monthFromAbbrev(month_token);
    if (!validCivil(y, m, d)) {
        return std::nullopt;
    }
    return fromCivil(y, m, d);
}

std::string DateUtils::format(DayNumber days) {
    int y = 0;
    int m = 0;
    int d = 0;
    toCivil(days, y, m, d);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", y, m, d);
    return buffer;
}

int DateUtils::month(DayNumber days) {
    int y = 0;
    int m = 0;
    int d = 0;
    toCivil(days, y, m, d);
    return m;
}

std::string DateUtils::monthName(int month) {
    if (month < 1 || month > 12) {
        return "Unknown";
    }
    return kMonthNames[month - 1];
}

DayNumber DateUtils::today() {
    const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    const auto hours = std::chrono::duration_cast<std::chrono::hours>(since_epoch).count();
    return static_cast<DayNumber>(hours / 24);
}

long long DateUtils::nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace utils
} // namespace harvestcast
