#pragma once

#include <string>
#include <vector>
#include "tsdiag/core/error.hpp"

namespace tsdiag {
namespace statistics {

/**
 * @brief Deterministic terms included in a regression
 */
enum class TestSpecification {
    NONE,   // No deterministic terms
    DRIFT,  // Intercept only ("const" in Johansen terms)
    TREND   // Intercept and linear trend
};

/**
 * @brief Stationarity hypothesis tested by KPSS
 */
enum class KPSSType {
    LEVEL,  // Level stationarity
    TREND   // Trend stationarity
};

/**
 * @brief Alternative hypothesis for the Durbin-Watson verdict
 */
enum class Alternative {
    TWO_SIDED,  // Autocorrelation of either sign
    GREATER,    // Positive autocorrelation
    LESS        // Negative autocorrelation
};

/**
 * @brief Critical values of a statistic at the tabulated significance levels
 */
struct CriticalValueRow {
    double one_percent{0.0};
    double five_percent{0.0};
    double ten_percent{0.0};

    /**
     * @brief Value for a significance level (0.01, 0.05 or 0.10)
     * Levels between the tabulated ones use the stricter column.
     */
    double at(double alpha) const;
};

/**
 * @brief Parse "none", "drift" or "trend"; "const" is accepted for "drift"
 */
Result<TestSpecification> parse_specification(const std::string& name);
std::string specification_to_string(TestSpecification spec);

/**
 * @brief Johansen vocabulary: "none", "const" or "trend"
 */
std::string johansen_specification_to_string(TestSpecification spec);

Result<KPSSType> parse_kpss_type(const std::string& name);
std::string kpss_type_to_string(KPSSType type);

/**
 * @brief Parse "two.sided", "greater" or "less"
 */
Result<Alternative> parse_alternative(const std::string& name);
std::string alternative_to_string(Alternative alternative);

/**
 * @brief Index into the critical value tables for a specification
 */
int specification_index(TestSpecification spec);

/**
 * @brief Default lag bound used when a test selects its own lag order
 *
 * floor(n^{1/3}) capped at 10.
 */
int default_lag_order(size_t n_obs);

// ============================================================================
// Base Classes
// ============================================================================

/**
 * @brief Base class for tests run over a single series
 * @tparam ResultT Result record produced by the test
 */
template <typename ResultT>
class UnivariateTest {
public:
    virtual ~UnivariateTest() = default;

    /**
     * @brief Perform the statistical test
     * @param data Input time series, never modified
     * @return Test result, or INVALID_ARGUMENT on unusable input
     */
    virtual Result<ResultT> test(const std::vector<double>& data) const = 0;

    virtual std::string get_name() const = 0;
};

/**
 * @brief Base class for tests relating two series
 * @tparam ResultT Result record produced by the test
 */
template <typename ResultT>
class BivariateTest {
public:
    virtual ~BivariateTest() = default;

    virtual Result<ResultT> test(const std::vector<double>& x,
                                 const std::vector<double>& y) const = 0;

    virtual std::string get_name() const = 0;
};

}  // namespace statistics
}  // namespace tsdiag
