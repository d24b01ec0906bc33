#include "tsdiag/statistics/serial_correlation_tests.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include "tsdiag/core/logger.hpp"
#include "tsdiag/statistics/distributions.hpp"
#include "tsdiag/statistics/series_utils.hpp"

namespace tsdiag {
namespace statistics {

namespace {

std::string autocorrelation_label(double rho) {
    if (rho > 0.3) return "positive";
    if (rho < -0.3) return "negative";
    return "negligible";
}

}  // anonymous namespace

// ============================================================================
// DurbinWatsonResult
// ============================================================================

std::string DurbinWatsonResult::interpret(double /*alpha*/) const {
    if (statistic < 1.5) {
        return "Strong positive autocorrelation (DW < 1.5)";
    } else if (statistic < 1.8) {
        return "Moderate positive autocorrelation (1.5 ≤ DW < 1.8)";
    } else if (statistic < 2.2) {
        return "No significant autocorrelation (1.8 ≤ DW < 2.2)";
    } else if (statistic < 2.5) {
        return "Moderate negative autocorrelation (2.2 ≤ DW < 2.5)";
    }
    return "Strong negative autocorrelation (DW ≥ 2.5)";
}

std::string DurbinWatsonResult::evaluate(double alpha) const {
    const std::string label = autocorrelation_label(autocorrelation);

    bool supported = false;
    std::string alternative_text;
    switch (alternative) {
        case Alternative::GREATER:
            supported = label == "positive";
            alternative_text = "positive autocorrelation";
            break;
        case Alternative::LESS:
            supported = label == "negative";
            alternative_text = "negative autocorrelation";
            break;
        case Alternative::TWO_SIDED:
            supported = label != "negligible";
            alternative_text = "autocorrelation of either sign";
            break;
    }

    std::ostringstream ss;
    ss << "Durbin-Watson statistic: " << format_fixed(statistic) << " (ρ ≈ "
       << format_fixed(autocorrelation) << ", " << label << " autocorrelation)\n"
       << interpret(alpha) << "\n"
       << "Conclusion: Alternative (" << alternative_to_string(alternative) << ": "
       << alternative_text << ") is " << (supported ? "supported" : "not supported");
    return ss.str();
}

std::string DurbinWatsonResult::to_string() const {
    std::ostringstream ss;
    ss << "Durbin-Watson Test\n"
       << "  Sample size: " << sample_size << "\n"
       << "  Test statistic (DW): " << format_fixed(statistic) << "\n"
       << "  Autocorrelation (ρ): " << format_fixed(autocorrelation) << "\n"
       << "  Alternative: " << alternative_to_string(alternative) << "\n\n"
       << "  " << interpret();
    return ss.str();
}

// ============================================================================
// PortmanteauResult
// ============================================================================

Result<double> PortmanteauResult::autocorrelation(int lag) const {
    if (lag < 1 || lag > static_cast<int>(autocorrelations.size())) {
        return make_error<double>(ErrorCode::INVALID_ARGUMENT,
                                  "Lag must be between 1 and " +
                                      std::to_string(autocorrelations.size()) + " (got " +
                                      std::to_string(lag) + ")",
                                  "PortmanteauResult");
    }
    return autocorrelations[lag - 1];
}

std::string PortmanteauResult::interpret(double alpha) const {
    std::ostringstream ss;
    if (reject_null(alpha)) {
        ss << "Reject H0: Residuals show significant autocorrelation";
    } else {
        ss << "Fail to reject H0: No significant autocorrelation in residuals";
    }
    ss << " (Q = " << format_fixed(statistic) << ", p = " << format_fixed(p_value) << ")";
    return ss.str();
}

std::string PortmanteauResult::evaluate(double alpha) const {
    std::ostringstream ss;
    ss << "Ljung-Box test:\n"
       << "Q statistic: " << format_fixed(statistic) << "\n"
       << "Lags: " << lags << ", degrees of freedom: " << degrees_of_freedom << "\n"
       << "p-value: " << format_fixed(p_value) << "\n"
       << "Conclusion: "
       << (reject_null(alpha) ? "Residuals are autocorrelated" : "Residuals appear independent")
       << " at " << format_percent(alpha) << " significance level";
    return ss.str();
}

std::string PortmanteauResult::to_string() const {
    std::ostringstream ss;
    ss << "Ljung-Box Test\n"
       << "  Sample size: " << sample_size << "\n"
       << "  Lags: " << lags << "\n"
       << "  Fitted parameters: " << fitdf << "\n"
       << "  Degrees of freedom: " << degrees_of_freedom << "\n"
       << "  Q statistic: " << format_fixed(statistic) << "\n"
       << "  p-value: " << format_fixed(p_value) << "\n"
       << "  Autocorrelations:\n";
    for (size_t k = 0; k < autocorrelations.size(); ++k) {
        ss << "    Lag " << (k + 1) << ": " << format_fixed(autocorrelations[k]) << "\n";
    }
    ss << "\n  " << interpret();
    return ss.str();
}

// ============================================================================
// TurningPointResult
// ============================================================================

std::string TurningPointResult::interpret(double alpha) const {
    std::ostringstream ss;
    if (!reject_null(alpha)) {
        ss << "Fail to reject H0: Series appears random";
    } else if (statistic < 0) {
        ss << "Reject H0: Too few turning points, series shows trend or persistence";
    } else {
        ss << "Reject H0: Too many turning points, series oscillates";
    }
    ss << " (Z = " << format_fixed(statistic) << ", p = " << format_fixed(p_value) << ")";
    return ss.str();
}

std::string TurningPointResult::evaluate(double alpha) const {
    std::ostringstream ss;
    ss << "Turning Point test:\n"
       << "Turning points: " << turning_points << " (expected "
       << format_fixed(expected_turning_points, 2) << ")\n"
       << "Z-statistic: " << format_fixed(statistic) << "\n"
       << "p-value: " << format_fixed(p_value) << "\n"
       << "Conclusion: Series appears " << (reject_null(alpha) ? "non-random" : "random")
       << " at " << format_percent(alpha) << " significance level";
    return ss.str();
}

std::string TurningPointResult::to_string() const {
    std::ostringstream ss;
    ss << "Turning Point Test\n"
       << "  Sample size: " << sample_size << "\n"
       << "  Turning points: " << turning_points << " (peaks: " << peaks
       << ", troughs: " << troughs << ")\n"
       << "  Possible turning points: " << possible_turning_points << "\n"
       << "  Expected: " << format_fixed(expected_turning_points, 2) << "\n"
       << "  Variance: " << format_fixed(variance) << "\n"
       << "  Z-statistic: " << format_fixed(statistic) << "\n"
       << "  p-value: " << format_fixed(p_value) << "\n\n"
       << "  " << interpret();
    return ss.str();
}

// ============================================================================
// Durbin-Watson Test Implementation
// ============================================================================

DurbinWatsonTest::DurbinWatsonTest(DurbinWatsonConfig config) : config_(std::move(config)) {}

Result<DurbinWatsonResult> DurbinWatsonTest::test(const std::vector<double>& residuals) const {
    auto config_check = config_.validate();
    if (config_check.is_error()) {
        return forward_error<DurbinWatsonResult>(config_check, "DurbinWatsonTest");
    }

    auto valid = validate_series(residuals, MIN_OBSERVATIONS, "DurbinWatsonTest", "Residuals");
    if (valid.is_error()) {
        DEBUG("Durbin-Watson input rejected: " << valid.error()->what());
        return forward_error<DurbinWatsonResult>(valid, "DurbinWatsonTest");
    }

    double numerator = 0.0;
    double denominator = residuals[0] * residuals[0];
    for (size_t t = 1; t < residuals.size(); ++t) {
        double diff = residuals[t] - residuals[t - 1];
        numerator += diff * diff;
        denominator += residuals[t] * residuals[t];
    }

    DurbinWatsonResult result;
    result.statistic = numerator / denominator;
    result.autocorrelation = 1.0 - result.statistic / 2.0;
    result.sample_size = static_cast<int>(residuals.size());
    result.alternative = config_.alternative;

    DEBUG("Durbin-Watson: n=" << result.sample_size << ", DW=" << result.statistic
          << ", alternative=" << alternative_to_string(config_.alternative));
    return Result<DurbinWatsonResult>(std::move(result));
}

// ============================================================================
// Ljung-Box Test Implementation
// ============================================================================

LjungBoxTest::LjungBoxTest(PortmanteauConfig config) : config_(std::move(config)) {}

Result<PortmanteauResult> LjungBoxTest::test(const std::vector<double>& residuals) const {
    auto config_check = config_.validate();
    if (config_check.is_error()) {
        return forward_error<PortmanteauResult>(config_check, "LjungBoxTest");
    }

    auto valid = validate_series(residuals, MIN_OBSERVATIONS, "LjungBoxTest", "Residuals");
    if (valid.is_error()) {
        DEBUG("Ljung-Box input rejected: " << valid.error()->what());
        return forward_error<PortmanteauResult>(valid, "LjungBoxTest");
    }

    const int n = static_cast<int>(residuals.size());
    const int lags = config_.lags < 0 ? select_lag_order(residuals.size()) : config_.lags;
    if (lags >= n) {
        return make_error<PortmanteauResult>(
            ErrorCode::INVALID_ARGUMENT,
            "Lags (" + std::to_string(lags) + ") must be less than the sample size (" +
                std::to_string(n) + ")",
            "LjungBoxTest");
    }
    if (config_.fitdf >= lags) {
        return make_error<PortmanteauResult>(
            ErrorCode::INVALID_ARGUMENT,
            "fitdf (" + std::to_string(config_.fitdf) + ") must be less than lags (" +
                std::to_string(lags) + ")",
            "LjungBoxTest");
    }

    DEBUG("Ljung-Box test: n=" << n << ", lags=" << lags << ", fitdf=" << config_.fitdf);

    PortmanteauResult result;
    result.sample_size = n;
    result.lags = lags;
    result.fitdf = config_.fitdf;
    result.degrees_of_freedom = lags - config_.fitdf;
    result.autocorrelations = autocorrelations(residuals, lags);

    double sum = 0.0;
    for (int k = 1; k <= lags; ++k) {
        double rho = result.autocorrelations[k - 1];
        sum += rho * rho / (n - k);
    }
    result.statistic = static_cast<double>(n) * (n + 2) * sum;
    result.p_value = chi_squared_upper_tail(result.statistic, result.degrees_of_freedom);

    DEBUG("Ljung-Box Q=" << result.statistic << ", p=" << result.p_value);
    return Result<PortmanteauResult>(std::move(result));
}

int LjungBoxTest::select_lag_order(size_t n_obs) const {
    return std::max(1, std::min(10, static_cast<int>(n_obs / 5)));
}

// ============================================================================
// Turning Point Test Implementation
// ============================================================================

Result<TurningPointResult> TurningPointTest::test(const std::vector<double>& data) const {
    auto valid = validate_series(data, MIN_OBSERVATIONS, "TurningPointTest");
    if (valid.is_error()) {
        DEBUG("Turning point input rejected: " << valid.error()->what());
        return forward_error<TurningPointResult>(valid, "TurningPointTest");
    }

    const int n = static_cast<int>(data.size());

    TurningPointResult result;
    result.sample_size = n;
    result.possible_turning_points = n - 2;

    // Strict local extrema among interior points
    for (int i = 1; i < n - 1; ++i) {
        if (data[i] > data[i - 1] && data[i] > data[i + 1]) {
            ++result.peaks;
        } else if (data[i] < data[i - 1] && data[i] < data[i + 1]) {
            ++result.troughs;
        }
    }
    result.turning_points = result.peaks + result.troughs;

    result.expected_turning_points = 2.0 * (n - 2) / 3.0;
    result.variance = (16.0 * n - 29.0) / 90.0;
    result.statistic =
        (result.turning_points - result.expected_turning_points) / std::sqrt(result.variance);
    result.p_value = normal_two_sided(result.statistic);

    DEBUG("Turning point test: n=" << n << ", T=" << result.turning_points
          << ", Z=" << result.statistic);
    return Result<TurningPointResult>(std::move(result));
}

}  // namespace statistics
}  // namespace tsdiag
