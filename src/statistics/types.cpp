#include "tsdiag/statistics/types.hpp"
#include <algorithm>
#include <cmath>
#include "tsdiag/statistics/critical_values.hpp"

namespace tsdiag {
namespace statistics {

double CriticalValueRow::at(double alpha) const {
    switch (critical_values::significance_index(alpha)) {
        case 0: return one_percent;
        case 1: return five_percent;
        default: return ten_percent;
    }
}

Result<TestSpecification> parse_specification(const std::string& name) {
    if (name == "none") return TestSpecification::NONE;
    if (name == "drift" || name == "const") return TestSpecification::DRIFT;
    if (name == "trend") return TestSpecification::TREND;
    return make_error<TestSpecification>(
        ErrorCode::INVALID_ARGUMENT,
        "Type must be 'none', 'drift', or 'trend' (got '" + name + "')", "TestSpecification");
}

std::string specification_to_string(TestSpecification spec) {
    switch (spec) {
        case TestSpecification::NONE: return "none";
        case TestSpecification::DRIFT: return "drift";
        case TestSpecification::TREND: return "trend";
    }
    return "unknown";
}

std::string johansen_specification_to_string(TestSpecification spec) {
    return spec == TestSpecification::DRIFT ? "const" : specification_to_string(spec);
}

Result<KPSSType> parse_kpss_type(const std::string& name) {
    if (name == "level") return KPSSType::LEVEL;
    if (name == "trend") return KPSSType::TREND;
    return make_error<KPSSType>(ErrorCode::INVALID_ARGUMENT,
                                "Type must be 'level' or 'trend' (got '" + name + "')",
                                "KPSSType");
}

std::string kpss_type_to_string(KPSSType type) {
    return type == KPSSType::TREND ? "trend" : "level";
}

Result<Alternative> parse_alternative(const std::string& name) {
    if (name == "two.sided") return Alternative::TWO_SIDED;
    if (name == "greater") return Alternative::GREATER;
    if (name == "less") return Alternative::LESS;
    return make_error<Alternative>(
        ErrorCode::INVALID_ARGUMENT,
        "Alternative must be 'two.sided', 'greater', or 'less' (got '" + name + "')",
        "Alternative");
}

std::string alternative_to_string(Alternative alternative) {
    switch (alternative) {
        case Alternative::TWO_SIDED: return "two.sided";
        case Alternative::GREATER: return "greater";
        case Alternative::LESS: return "less";
    }
    return "unknown";
}

int specification_index(TestSpecification spec) {
    switch (spec) {
        case TestSpecification::NONE: return critical_values::SPEC_NONE;
        case TestSpecification::TREND: return critical_values::SPEC_TREND;
        default: return critical_values::SPEC_DRIFT;
    }
}

int default_lag_order(size_t n_obs) {
    int lag = static_cast<int>(std::floor(std::cbrt(static_cast<double>(n_obs)) + 1e-9));
    return std::min(10, lag);
}

}  // namespace statistics
}  // namespace tsdiag
