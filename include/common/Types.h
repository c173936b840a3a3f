#pragma once

#include <string>
#include <utility>
#include <vector>

namespace harvestcast {

// Days since 1970-01-01 on the proleptic Gregorian calendar
using DayNumber = int;
using Price = double;

// One mandi observation, immutable once ingested
struct PricePoint {
    std::string commodity;
    std::string region;
    std::string market;
    std::string district;
    DayNumber date;
    Price min_price;
    Price max_price;
    Price modal_price;

    PricePoint() : date(0), min_price(0), max_price(0), modal_price(0) {}

    PricePoint(std::string c, std::string r, std::string m, DayNumber d,
               Price lo, Price hi, Price modal)
        : commodity(std::move(c)), region(std::move(r)), market(std::move(m))
        , date(d), min_price(lo), max_price(hi), modal_price(modal) {}
};

// Date-aggregated modeling sample (mean modal price across markets)
struct SeriesSample {
    DayNumber date = 0;
    Price price = 0.0;
};

} // namespace harvestcast
