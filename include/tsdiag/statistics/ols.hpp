#pragma once

#include <Eigen/Dense>
#include <string>
#include "tsdiag/core/error.hpp"

namespace tsdiag {
namespace statistics {

/**
 * @brief Ordinary least squares fit of a single response
 */
struct RegressionFit {
    Eigen::VectorXd coefficients;
    Eigen::VectorXd standard_errors;
    Eigen::VectorXd residuals;
    double rss{0.0};     // Residual sum of squares
    double sigma2{0.0};  // rss / degrees_of_freedom
    int n_obs{0};
    int n_params{0};
    int degrees_of_freedom{0};
};

/**
 * @brief Fit y = X b + e by the normal equations
 *
 * Coefficients come from an LDLT solve of X'X b = X'y; standard errors from
 * sigma2 * diag((X'X)^{-1}). Fails with INVALID_ARGUMENT when X has fewer rows
 * than columns plus one, when X is rank deficient, or when the results are not
 * finite.
 *
 * @param X Design matrix (observations x regressors)
 * @param y Response vector
 * @param component Name of the calling test, used in errors
 */
Result<RegressionFit> fit_ols(const Eigen::MatrixXd& X, const Eigen::VectorXd& y,
                              const std::string& component = "OLS");

/**
 * @brief Residuals of regressing every column of Y on Z
 *
 * An empty Z (zero columns) returns Y unchanged.
 */
Result<Eigen::MatrixXd> ols_residuals(const Eigen::MatrixXd& Z, const Eigen::MatrixXd& Y,
                                      const std::string& component = "OLS");

/**
 * @brief Check that a design matrix has full column rank
 */
bool has_full_column_rank(const Eigen::MatrixXd& X);

}  // namespace statistics
}  // namespace tsdiag
