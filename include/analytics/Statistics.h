#pragma once

#include <cstddef>
#include <vector>

namespace harvestcast {
namespace analytics {

// Numeric helpers shared by analytics and forecasting. Empty or too-short
// inputs return 0 rather than failing.
class Statistics {
public:
    static double mean(const std::vector<double>& values);

    // Bessel-corrected (n - 1)
    static double sampleStdDev(const std::vector<double>& values);
    static double sampleStdDev(const std::vector<double>& values, double mean);

    // Divides by n
    static double populationStdDev(const std::vector<double>& values);
    static double populationStdDev(const std::vector<double>& values, double mean);

    // Mean of the last `window` values (all of them when shorter)
    static double trailingMean(const std::vector<double>& values, std::size_t window);

    // Degree-1 least squares of values against their index 0..n-1
    struct LinearFit {
        double slope;
        double intercept;

        LinearFit() : slope(0), intercept(0) {}
        double at(double x) const { return intercept + slope * x; }
    };
    static LinearFit fitLine(const std::vector<double>& values);

    // Coefficient of variation in percent; 0 when mean is not positive
    static double coefficientOfVariation(double std_dev, double mean);
};

} // namespace analytics
} // namespace harvestcast
