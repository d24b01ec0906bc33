#pragma once

#include <string>
#include <vector>
#include "tsdiag/core/error.hpp"
#include "tsdiag/statistics/test_config.hpp"
#include "tsdiag/statistics/types.hpp"
#include "tsdiag/statistics/unit_root_tests.hpp"

namespace tsdiag {
namespace statistics {

/**
 * @brief Consensus of the unit root battery
 */
enum class UnitRootVerdict {
    STATIONARY,                // >= 2 of DF/ADF/ADF-GLS reject, KPSS does not
    UNIT_ROOT,                 // None reject, KPSS rejects
    MIXED_LEANING_STATIONARY,  // >= 2 reject, KPSS rejects as well
    MIXED_LEANING_UNIT_ROOT,   // Fewer than 2 reject, KPSS rejects
    INCONCLUSIVE               // Fewer than 2 reject, KPSS does not
};

std::string verdict_to_string(UnitRootVerdict verdict);

/**
 * @brief Results of DF, ADF, ADF-GLS and KPSS on the same series
 */
struct UnitRootResult {
    DFResult df;
    ADFResult adf;
    ADFGLSResult adf_gls;
    KPSSResult kpss;
    int sample_size{0};
    TestSpecification specification{TestSpecification::DRIFT};

    /**
     * @brief Number of DF/ADF/ADF-GLS tests rejecting the unit root at alpha
     */
    int unit_root_rejections(double alpha = 0.05) const;
    bool kpss_rejects(double alpha = 0.05) const { return kpss.reject_null(alpha); }

    UnitRootVerdict verdict(double alpha = 0.05) const;
    bool is_stationary(double alpha = 0.05) const;
    bool has_unit_root(double alpha = 0.05) const;

    std::string consensus(double alpha = 0.05) const;
    std::string summary(double alpha = 0.05) const;
    std::string to_string() const { return summary(); }
};

/**
 * @brief Runs the unit root tests and the KPSS stationarity test together
 *
 * KPSS is run for level stationarity under none/drift and for trend
 * stationarity under trend.
 */
class UnitRootBattery : public UnivariateTest<UnitRootResult> {
public:
    explicit UnitRootBattery(UnitRootConfig config = UnitRootConfig());

    Result<UnitRootResult> test(const std::vector<double>& data) const override;
    std::string get_name() const override { return "Unit Root Test Battery"; }

    static constexpr size_t MIN_OBSERVATIONS = ADFGLSTest::MIN_OBSERVATIONS;

private:
    UnitRootConfig config_;
};

}  // namespace statistics
}  // namespace tsdiag
