#include "forecast/TrainedModel.h"

namespace harvestcast {
namespace forecast {

bool Forecast::seasonalParticipated() const {
    for (const auto& point : points) {
        if (point.contributing_models.seasonal_trend) {
            return true;
        }
    }
    return false;
}

std::string toString(ForecastTrend value) {
    switch (value) {
        case ForecastTrend::RISING: return "rising";
        case ForecastTrend::FALLING: return "falling";
        case ForecastTrend::STABLE: return "stable";
        case ForecastTrend::UNKNOWN: return "unknown";
    }
    return "unknown";
}

} // namespace forecast
} // namespace harvestcast
