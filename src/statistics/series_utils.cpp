#include "tsdiag/statistics/series_utils.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iterator>
#include <numeric>
#include <sstream>

namespace tsdiag {
namespace statistics {

Result<void> validate_series(const std::vector<double>& data, size_t min_size,
                             const std::string& component, const std::string& name) {
    if (data.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, name + " cannot be empty", component);
    }
    if (data.size() < min_size) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                name + " requires at least " + std::to_string(min_size) +
                                    " observations, got " + std::to_string(data.size()),
                                component);
    }

    auto bad = std::find_if(data.begin(), data.end(), [](double v) { return !std::isfinite(v); });
    if (bad != data.end()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                name + " contains a missing or non-finite value at index " +
                                    std::to_string(std::distance(data.begin(), bad)),
                                component);
    }

    auto [lo, hi] = std::minmax_element(data.begin(), data.end());
    double scale = std::max(1.0, std::max(std::abs(*lo), std::abs(*hi)));
    if (*hi - *lo <= 1e-12 * scale) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                name + " is constant (zero variance)", component);
    }

    return Result<void>();
}

Result<void> validate_same_length(const std::vector<double>& x, const std::vector<double>& y,
                                  const std::string& component) {
    if (x.size() != y.size()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Time series must have the same length (x: " +
                                    std::to_string(x.size()) + ", y: " + std::to_string(y.size()) +
                                    ")",
                                component);
    }
    return Result<void>();
}

double mean(const std::vector<double>& data) {
    if (data.empty()) return 0.0;
    return std::accumulate(data.begin(), data.end(), 0.0) / data.size();
}

double sum_squared_deviations(const std::vector<double>& data) {
    double m = mean(data);
    double ss = 0.0;
    for (double v : data) {
        ss += (v - m) * (v - m);
    }
    return ss;
}

std::vector<double> difference(const std::vector<double>& data) {
    std::vector<double> diff;
    if (data.size() < 2) return diff;
    diff.reserve(data.size() - 1);
    for (size_t i = 1; i < data.size(); ++i) {
        diff.push_back(data[i] - data[i - 1]);
    }
    return diff;
}

std::vector<double> autocorrelations(const std::vector<double>& data, int max_lag) {
    const size_t n = data.size();
    const double m = mean(data);
    const double denom = sum_squared_deviations(data);

    std::vector<double> acf(std::max(0, max_lag), 0.0);
    if (denom <= 0.0) return acf;

    for (int lag = 1; lag <= max_lag; ++lag) {
        double sum = 0.0;
        for (size_t t = lag; t < n; ++t) {
            sum += (data[t] - m) * (data[t - lag] - m);
        }
        acf[lag - 1] = sum / denom;
    }
    return acf;
}

double pearson_correlation(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.size() != y.size() || x.empty()) return 0.0;

    const double mx = mean(x);
    const double my = mean(y);
    double sxy = 0.0, sxx = 0.0, syy = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        sxy += (x[i] - mx) * (y[i] - my);
        sxx += (x[i] - mx) * (x[i] - mx);
        syy += (y[i] - my) * (y[i] - my);
    }

    double denom = std::sqrt(sxx * syy);
    if (denom < 1e-10) return 0.0;
    return std::clamp(sxy / denom, -1.0, 1.0);
}

std::string format_fixed(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

std::string format_percent(double alpha) {
    std::ostringstream ss;
    ss << alpha * 100.0 << "%";
    return ss.str();
}

}  // namespace statistics
}  // namespace tsdiag
