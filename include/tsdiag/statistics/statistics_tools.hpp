#pragma once

// Umbrella header for the diagnostic test battery

#include "tsdiag/statistics/causality_tests.hpp"
#include "tsdiag/statistics/cointegration_tests.hpp"
#include "tsdiag/statistics/critical_values.hpp"
#include "tsdiag/statistics/distributions.hpp"
#include "tsdiag/statistics/ols.hpp"
#include "tsdiag/statistics/serial_correlation_tests.hpp"
#include "tsdiag/statistics/series_utils.hpp"
#include "tsdiag/statistics/structural_break_tests.hpp"
#include "tsdiag/statistics/test_config.hpp"
#include "tsdiag/statistics/types.hpp"
#include "tsdiag/statistics/unit_root_battery.hpp"
#include "tsdiag/statistics/unit_root_tests.hpp"
