#include "forecast/SeasonalTrendModel.h"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>

#include "common/Logger.h"

namespace harvestcast {
namespace forecast {

namespace {
constexpr double kPi = 3.14159265358979323846;

// Design row: [1, t/t_scale, sin(2πkt/P), cos(2πkt/P) ...]
void fillRow(Eigen::MatrixXd& X, Eigen::Index row, double t, double t_scale,
             double period, int order) {
    X(row, 0) = 1.0;
    X(row, 1) = t / t_scale;
    for (int k = 1; k <= order; ++k) {
        const double angle = 2.0 * kPi * k * t / period;
        X(row, 2 * k) = std::sin(angle);
        X(row, 2 * k + 1) = std::cos(angle);
    }
}
}

SeasonalTrendParams SeasonalTrendModel::fit(const std::vector<SeriesSample>& series,
                                            const SeasonalConfig& config) {
    SeasonalTrendParams params;
    params.period_days = config.period_days;
    params.interval_z = config.interval_z;
    params.sample_size = series.size();

    if (!config.enabled || series.size() < 2 || config.period_days <= 0.0) {
        return params;
    }

    const DayNumber origin = series.front().date;
    const int span = series.back().date - origin;
    const int order = std::max(0, config.fourier_order);
    const Eigen::Index n = static_cast<Eigen::Index>(series.size());
    const Eigen::Index cols = 2 + 2 * order;

    if (span < config.min_span_days || n <= cols) {
        LOG_DEBUG("Seasonal sub-model skipped: span {} days, {} samples", span, n);
        return params;
    }

    double y_scale = 0.0;
    for (const auto& s : series) {
        y_scale = std::max(y_scale, std::abs(s.price));
    }
    if (y_scale <= 0.0) {
        y_scale = 1.0;
    }
    const double t_scale = static_cast<double>(span);

    Eigen::MatrixXd X(n, cols);
    Eigen::VectorXd y(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const auto& s = series[static_cast<std::size_t>(i)];
        fillRow(X, i, static_cast<double>(s.date - origin), t_scale, config.period_days, order);
        y(i) = s.price / y_scale;
    }

    // Ridge on the Fourier block only; intercept and slope stay unpenalized
    Eigen::MatrixXd A = X.transpose() * X;
    if (config.prior_scale > 0.0) {
        const double ridge = 1.0 / (config.prior_scale * config.prior_scale);
        for (Eigen::Index j = 2; j < cols; ++j) {
            A(j, j) += ridge;
        }
    }
    const Eigen::VectorXd b = X.transpose() * y;

    Eigen::LDLT<Eigen::MatrixXd> ldlt(A);
    if (ldlt.info() != Eigen::Success) {
        LOG_WARN("Seasonal sub-model: decomposition failed");
        return params;
    }
    const Eigen::VectorXd beta = ldlt.solve(b);
    if (ldlt.info() != Eigen::Success || !beta.allFinite()) {
        LOG_WARN("Seasonal sub-model: non-finite coefficients");
        return params;
    }

    const Eigen::VectorXd residuals = y - X * beta;
    const double dof = static_cast<double>(std::max<Eigen::Index>(1, n - cols));

    params.available = true;
    params.origin = origin;
    params.t_scale = t_scale;
    params.y_scale = y_scale;
    params.intercept = beta(0);
    params.slope = beta(1);
    params.sin_coeffs.resize(static_cast<std::size_t>(order));
    params.cos_coeffs.resize(static_cast<std::size_t>(order));
    for (int k = 1; k <= order; ++k) {
        params.sin_coeffs[k - 1] = beta(2 * k);
        params.cos_coeffs[k - 1] = beta(2 * k + 1);
    }
    params.residual_std = std::sqrt(residuals.squaredNorm() / dof) * y_scale;
    return params;
}

std::optional<SeasonalTrendModel::Estimate> SeasonalTrendModel::predict(
    const SeasonalTrendParams& params, DayNumber date, int steps_ahead) {
    if (!params.available || params.t_scale <= 0.0 ||
        params.sin_coeffs.size() != params.cos_coeffs.size()) {
        return std::nullopt;
    }

    const double t = static_cast<double>(date - params.origin);
    double normalized = params.intercept + params.slope * (t / params.t_scale);
    for (std::size_t k = 1; k <= params.sin_coeffs.size(); ++k) {
        const double angle = 2.0 * kPi * static_cast<double>(k) * t / params.period_days;
        normalized += params.sin_coeffs[k - 1] * std::sin(angle) +
                      params.cos_coeffs[k - 1] * std::cos(angle);
    }

    const double n = static_cast<double>(std::max<std::size_t>(1, params.sample_size));
    const double h = static_cast<double>(std::max(0, steps_ahead));
    const double half_width = params.interval_z * params.residual_std * std::sqrt(1.0 + h / n);

    Estimate estimate;
    estimate.value = normalized * params.y_scale;
    estimate.lower = estimate.value - half_width;
    estimate.upper = estimate.value + half_width;
    if (!std::isfinite(estimate.value) || !std::isfinite(half_width)) {
        return std::nullopt;
    }
    return estimate;
}

} // namespace forecast
} // namespace harvestcast
