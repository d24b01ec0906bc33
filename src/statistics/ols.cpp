#include "tsdiag/statistics/ols.hpp"
#include <cmath>

namespace tsdiag {
namespace statistics {

namespace {

// Relative pivot threshold for the rank decision
constexpr double RANK_TOLERANCE = 1e-10;

}  // anonymous namespace

bool has_full_column_rank(const Eigen::MatrixXd& X) {
    if (X.cols() == 0) return true;
    if (X.rows() < X.cols()) return false;

    // Scale columns to unit norm so intercept and trend columns compare fairly
    Eigen::MatrixXd scaled = X;
    for (Eigen::Index j = 0; j < scaled.cols(); ++j) {
        double norm = scaled.col(j).norm();
        if (norm == 0.0) return false;
        scaled.col(j) /= norm;
    }

    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(scaled);
    qr.setThreshold(RANK_TOLERANCE);
    return qr.rank() == X.cols();
}

Result<RegressionFit> fit_ols(const Eigen::MatrixXd& X, const Eigen::VectorXd& y,
                              const std::string& component) {
    const int n_obs = static_cast<int>(X.rows());
    const int n_params = static_cast<int>(X.cols());

    if (y.size() != X.rows()) {
        return make_error<RegressionFit>(ErrorCode::INVALID_ARGUMENT,
                                         "Design matrix and response have different row counts",
                                         component);
    }
    if (n_params == 0) {
        return make_error<RegressionFit>(ErrorCode::INVALID_ARGUMENT,
                                         "Design matrix has no columns", component);
    }
    if (n_obs <= n_params) {
        return make_error<RegressionFit>(
            ErrorCode::INVALID_ARGUMENT,
            "Insufficient observations for regression (" + std::to_string(n_obs) +
                " observations, " + std::to_string(n_params) + " parameters)",
            component);
    }
    if (!has_full_column_rank(X)) {
        return make_error<RegressionFit>(ErrorCode::INVALID_ARGUMENT,
                                         "Design matrix is rank deficient (collinear regressors)",
                                         component);
    }

    // OLS estimation using LDLT decomposition of the normal equations
    Eigen::LDLT<Eigen::MatrixXd> ldlt = (X.transpose() * X).ldlt();
    if (ldlt.info() != Eigen::Success || !ldlt.isPositive()) {
        return make_error<RegressionFit>(ErrorCode::INVALID_ARGUMENT,
                                         "Normal equations are not positive definite", component);
    }

    RegressionFit fit;
    fit.n_obs = n_obs;
    fit.n_params = n_params;
    fit.degrees_of_freedom = n_obs - n_params;
    fit.coefficients = ldlt.solve(X.transpose() * y);
    fit.residuals = y - X * fit.coefficients;
    fit.rss = fit.residuals.squaredNorm();
    fit.sigma2 = fit.rss / fit.degrees_of_freedom;

    Eigen::MatrixXd xtx_inv = ldlt.solve(Eigen::MatrixXd::Identity(n_params, n_params));
    fit.standard_errors = (fit.sigma2 * xtx_inv.diagonal().array()).max(0.0).sqrt().matrix();

    if (!fit.coefficients.allFinite() || !fit.standard_errors.allFinite() ||
        !std::isfinite(fit.rss)) {
        return make_error<RegressionFit>(ErrorCode::INVALID_ARGUMENT,
                                         "Regression produced non-finite estimates", component);
    }

    return Result<RegressionFit>(std::move(fit));
}

Result<Eigen::MatrixXd> ols_residuals(const Eigen::MatrixXd& Z, const Eigen::MatrixXd& Y,
                                      const std::string& component) {
    if (Z.cols() == 0) {
        return Result<Eigen::MatrixXd>(Eigen::MatrixXd(Y));
    }
    if (Z.rows() != Y.rows()) {
        return make_error<Eigen::MatrixXd>(ErrorCode::INVALID_ARGUMENT,
                                           "Regressors and responses have different row counts",
                                           component);
    }
    if (Z.rows() <= Z.cols() || !has_full_column_rank(Z)) {
        return make_error<Eigen::MatrixXd>(ErrorCode::INVALID_ARGUMENT,
                                           "Auxiliary regressors are rank deficient", component);
    }

    Eigen::LDLT<Eigen::MatrixXd> ldlt = (Z.transpose() * Z).ldlt();
    Eigen::MatrixXd coefficients = ldlt.solve(Z.transpose() * Y);
    Eigen::MatrixXd residuals = Y - Z * coefficients;
    if (!residuals.allFinite()) {
        return make_error<Eigen::MatrixXd>(ErrorCode::INVALID_ARGUMENT,
                                           "Auxiliary regression produced non-finite residuals",
                                           component);
    }
    return Result<Eigen::MatrixXd>(std::move(residuals));
}

}  // namespace statistics
}  // namespace tsdiag
