#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "tsdiag/core/error.hpp"

namespace tsdiag {
namespace statistics {

// ============================================================================
// Input Validation
// ============================================================================

/**
 * @brief Check that a series is usable by a test
 *
 * Fails with INVALID_ARGUMENT when the series is empty, shorter than
 * min_size, contains NaN or infinite values, or has zero variance.
 *
 * @param data Series to check
 * @param min_size Minimum number of observations required
 * @param component Name of the calling test, used in the error
 * @param name Name of the series in messages
 */
Result<void> validate_series(const std::vector<double>& data, size_t min_size,
                             const std::string& component,
                             const std::string& name = "Data");

/**
 * @brief Check that two series have the same length
 */
Result<void> validate_same_length(const std::vector<double>& x, const std::vector<double>& y,
                                  const std::string& component);

// ============================================================================
// Numeric Helpers
// ============================================================================

double mean(const std::vector<double>& data);

/**
 * @brief Sum of squared deviations from the mean
 */
double sum_squared_deviations(const std::vector<double>& data);

/**
 * @brief First differences, size n - 1
 */
std::vector<double> difference(const std::vector<double>& data);

/**
 * @brief Sample autocorrelations at lags 1..max_lag
 *
 * Uses the biased estimator r_k = sum_{t>k} (x_t - m)(x_{t-k} - m) / sum_t (x_t - m)^2,
 * which keeps every value in [-1, 1].
 */
std::vector<double> autocorrelations(const std::vector<double>& data, int max_lag);

/**
 * @brief Pearson correlation, 0.0 when either side has no variance
 */
double pearson_correlation(const std::vector<double>& x, const std::vector<double>& y);

/**
 * @brief Format a number with a fixed number of decimals for reports
 */
std::string format_fixed(double value, int precision = 4);

/**
 * @brief Format a significance level as a percentage, e.g. 0.05 -> "5%"
 */
std::string format_percent(double alpha);

}  // namespace statistics
}  // namespace tsdiag
