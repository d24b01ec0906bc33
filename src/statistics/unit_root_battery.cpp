#include "tsdiag/statistics/unit_root_battery.hpp"
#include <sstream>
#include "tsdiag/core/logger.hpp"
#include "tsdiag/statistics/series_utils.hpp"

namespace tsdiag {
namespace statistics {

std::string verdict_to_string(UnitRootVerdict verdict) {
    switch (verdict) {
        case UnitRootVerdict::STATIONARY: return "STATIONARY";
        case UnitRootVerdict::UNIT_ROOT: return "UNIT_ROOT";
        case UnitRootVerdict::MIXED_LEANING_STATIONARY: return "MIXED_LEANING_STATIONARY";
        case UnitRootVerdict::MIXED_LEANING_UNIT_ROOT: return "MIXED_LEANING_UNIT_ROOT";
        case UnitRootVerdict::INCONCLUSIVE: return "INCONCLUSIVE";
    }
    return "UNKNOWN";
}

// ============================================================================
// UnitRootResult
// ============================================================================

int UnitRootResult::unit_root_rejections(double alpha) const {
    int count = 0;
    if (df.reject_null(alpha)) ++count;
    if (adf.reject_null(alpha)) ++count;
    if (adf_gls.reject_null(alpha)) ++count;
    return count;
}

UnitRootVerdict UnitRootResult::verdict(double alpha) const {
    const int rejections = unit_root_rejections(alpha);
    const bool kpss_reject = kpss_rejects(alpha);

    if (rejections >= 2 && !kpss_reject) return UnitRootVerdict::STATIONARY;
    if (rejections == 0 && kpss_reject) return UnitRootVerdict::UNIT_ROOT;
    if (rejections >= 2) return UnitRootVerdict::MIXED_LEANING_STATIONARY;
    if (kpss_reject) return UnitRootVerdict::MIXED_LEANING_UNIT_ROOT;
    return UnitRootVerdict::INCONCLUSIVE;
}

bool UnitRootResult::is_stationary(double alpha) const {
    return verdict(alpha) == UnitRootVerdict::STATIONARY;
}

bool UnitRootResult::has_unit_root(double alpha) const {
    return verdict(alpha) == UnitRootVerdict::UNIT_ROOT;
}

std::string UnitRootResult::consensus(double alpha) const {
    const int rejections = unit_root_rejections(alpha);
    std::ostringstream ss;
    switch (verdict(alpha)) {
        case UnitRootVerdict::STATIONARY:
            ss << "Strong evidence of STATIONARITY:\n"
               << "- " << rejections << "/3 unit root tests reject the null hypothesis\n"
               << "- KPSS test does not reject stationarity\n"
               << "Conclusion: Series appears to be stationary";
            break;
        case UnitRootVerdict::UNIT_ROOT:
            ss << "Strong evidence of UNIT ROOT (non-stationarity):\n"
               << "- All unit root tests fail to reject the null hypothesis\n"
               << "- KPSS test rejects stationarity\n"
               << "Conclusion: Series appears to have a unit root";
            break;
        case UnitRootVerdict::MIXED_LEANING_STATIONARY:
            ss << "Mixed evidence, leaning toward STATIONARITY:\n"
               << "- " << rejections << "/3 unit root tests reject the null hypothesis\n"
               << "- But KPSS suggests non-stationarity\n"
               << "Conclusion: Results are conflicting, but majority suggests stationarity";
            break;
        case UnitRootVerdict::MIXED_LEANING_UNIT_ROOT:
            ss << "Mixed evidence, leaning toward UNIT ROOT:\n"
               << "- " << rejections << "/3 unit root tests reject the null hypothesis\n"
               << "- KPSS test rejects stationarity\n"
               << "Conclusion: Results are conflicting, but evidence suggests unit root";
            break;
        case UnitRootVerdict::INCONCLUSIVE:
            ss << "INCONCLUSIVE evidence:\n"
               << "- " << rejections << "/3 unit root tests reject the null hypothesis\n"
               << "- KPSS test does not reject stationarity\n"
               << "Conclusion: Results are mixed, consider additional analysis";
            break;
    }
    return ss.str();
}

std::string UnitRootResult::summary(double alpha) const {
    const std::string rule(60, '=');
    std::ostringstream ss;
    ss << "Unit Root Test Summary\n" << rule << "\n"
       << "Sample size: " << sample_size << "\n"
       << "Type: " << specification_to_string(specification) << "\n"
       << "Significance level: " << format_percent(alpha) << "\n"
       << rule << "\n\n";

    ss << "1. Dickey-Fuller Test:\n"
       << "   Statistic: " << format_fixed(df.statistic) << "\n"
       << "   Critical value (" << format_percent(alpha)
       << "): " << format_fixed(df.critical_value(alpha)) << "\n"
       << "   Conclusion: " << df.interpret(alpha) << "\n\n";

    ss << "2. Augmented Dickey-Fuller Test:\n"
       << "   Lags: " << adf.lags << "\n"
       << "   Statistic: " << format_fixed(adf.statistic) << "\n"
       << "   Critical value (" << format_percent(alpha)
       << "): " << format_fixed(adf.critical_value(alpha)) << "\n"
       << "   Conclusion: " << adf.interpret(alpha) << "\n\n";

    ss << "3. ADF-GLS Test:\n"
       << "   Lags: " << adf_gls.lags << "\n"
       << "   Statistic: " << format_fixed(adf_gls.statistic) << "\n"
       << "   Critical value (" << format_percent(alpha)
       << "): " << format_fixed(adf_gls.critical_value(alpha)) << "\n"
       << "   Conclusion: " << adf_gls.interpret(alpha) << "\n\n";

    ss << "4. KPSS Test (tests stationarity, opposite null):\n"
       << "   Lags: " << kpss.lags << "\n"
       << "   Statistic: " << format_fixed(kpss.statistic) << "\n"
       << "   Critical value (" << format_percent(alpha)
       << "): " << format_fixed(kpss.critical_value(alpha)) << "\n"
       << "   Conclusion: " << kpss.interpret(alpha) << "\n\n";

    ss << rule << "\n"
       << "Overall Assessment:\n"
       << rule << "\n"
       << consensus(alpha);
    return ss.str();
}

// ============================================================================
// Unit Root Battery Implementation
// ============================================================================

UnitRootBattery::UnitRootBattery(UnitRootConfig config) : config_(std::move(config)) {}

Result<UnitRootResult> UnitRootBattery::test(const std::vector<double>& data) const {
    auto config_check = config_.validate();
    if (config_check.is_error()) {
        return forward_error<UnitRootResult>(config_check, "UnitRootBattery");
    }

    auto valid = validate_series(data, MIN_OBSERVATIONS, "UnitRootBattery");
    if (valid.is_error()) {
        DEBUG("Unit root battery input rejected: " << valid.error()->what());
        return forward_error<UnitRootResult>(valid, "UnitRootBattery");
    }

    DFTestConfig df_config;
    df_config.specification = config_.specification;

    ADFTestConfig adf_config;
    adf_config.specification = config_.specification;
    adf_config.lags = config_.lags;

    ADFGLSTestConfig gls_config;
    gls_config.specification = config_.specification;
    gls_config.lags = config_.lags;

    KPSSTestConfig kpss_config;
    kpss_config.type = config_.specification == TestSpecification::TREND ? KPSSType::TREND
                                                                          : KPSSType::LEVEL;

    auto df = DFTest(df_config).test(data);
    if (df.is_error()) {
        return forward_error<UnitRootResult>(df, "UnitRootBattery");
    }
    auto adf = ADFTest(adf_config).test(data);
    if (adf.is_error()) {
        return forward_error<UnitRootResult>(adf, "UnitRootBattery");
    }
    auto adf_gls = ADFGLSTest(gls_config).test(data);
    if (adf_gls.is_error()) {
        return forward_error<UnitRootResult>(adf_gls, "UnitRootBattery");
    }
    auto kpss = KPSSTest(kpss_config).test(data);
    if (kpss.is_error()) {
        return forward_error<UnitRootResult>(kpss, "UnitRootBattery");
    }

    UnitRootResult result;
    result.df = df.value();
    result.adf = adf.value();
    result.adf_gls = adf_gls.value();
    result.kpss = kpss.value();
    result.sample_size = static_cast<int>(data.size());
    result.specification = config_.specification;

    INFO("Unit root battery (n=" << result.sample_size << ", "
         << specification_to_string(result.specification) << "): "
         << result.unit_root_rejections() << "/3 unit root rejections, KPSS "
         << (result.kpss_rejects() ? "rejects" : "does not reject") << " stationarity -> "
         << verdict_to_string(result.verdict()));
    return Result<UnitRootResult>(std::move(result));
}

}  // namespace statistics
}  // namespace tsdiag
