#include "analytics/Statistics.h"
#include <cmath>
#include <numeric>
#include <algorithm>
#include <cstddef>

namespace harvestcast {
namespace analytics {

double Statistics::mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    const double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

double Statistics::sampleStdDev(const std::vector<double>& values) {
    return sampleStdDev(values, mean(values));
}

double Statistics::sampleStdDev(const std::vector<double>& values, double mean) {
    if (values.size() < 2) return 0.0;
    double sq_sum = 0.0;
    for (double v : values) {
        sq_sum += (v - mean) * (v - mean);
    }
    return std::sqrt(sq_sum / static_cast<double>(values.size() - 1));
}

double Statistics::populationStdDev(const std::vector<double>& values) {
    return populationStdDev(values, mean(values));
}

double Statistics::populationStdDev(const std::vector<double>& values, double mean) {
    if (values.empty()) return 0.0;
    double sq_sum = 0.0;
    for (double v : values) {
        sq_sum += (v - mean) * (v - mean);
    }
    return std::sqrt(sq_sum / static_cast<double>(values.size()));
}

double Statistics::trailingMean(const std::vector<double>& values, std::size_t window) {
    if (values.empty() || window == 0) return 0.0;
    const std::size_t n = std::min(window, values.size());
    const double sum = std::accumulate(values.end() - static_cast<std::ptrdiff_t>(n), values.end(), 0.0);
    return sum / static_cast<double>(n);
}

Statistics::LinearFit Statistics::fitLine(const std::vector<double>& values) {
    LinearFit fit;
    const std::size_t n = values.size();
    if (n == 0) return fit;
    if (n == 1) {
        fit.intercept = values.front();
        return fit;
    }

    // x = 0..n-1
    const double x_mean = static_cast<double>(n - 1) / 2.0;
    const double y_mean = mean(values);

    double sxy = 0.0;
    double sxx = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double dx = static_cast<double>(i) - x_mean;
        sxy += dx * (values[i] - y_mean);
        sxx += dx * dx;
    }

    fit.slope = (sxx > 0.0) ? sxy / sxx : 0.0;
    fit.intercept = y_mean - fit.slope * x_mean;
    return fit;
}

double Statistics::coefficientOfVariation(double std_dev, double mean) {
    if (mean <= 0.0) return 0.0;
    return std_dev / mean * 100.0;
}

} // namespace analytics
} // namespace harvestcast
