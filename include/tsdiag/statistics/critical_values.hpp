#pragma once

#include <vector>

namespace tsdiag {
namespace statistics {
namespace critical_values {

// Specification indices shared by every table below
constexpr int SPEC_NONE = 0;
constexpr int SPEC_DRIFT = 1;  // Constant ("const" for Johansen)
constexpr int SPEC_TREND = 2;  // Constant + linear trend

// Significance indices: 0=1%, 1=5%, 2=10%
constexpr int N_SIG_LEVELS = 3;
constexpr double significance_levels[N_SIG_LEVELS] = {0.01, 0.05, 0.10};

/**
 * @brief Map a significance level to its table column
 * Levels between the tabulated ones round down to the stricter level.
 */
inline int significance_index(double significance) {
    if (significance <= 0.01) return 0;
    if (significance <= 0.05) return 1;
    return 2;
}

// ============================================================================
// Dickey-Fuller Critical Values: MacKinnon response surface
// ============================================================================
// cv(T) = b0 + b1/T + b2/T^2 + b3/T^3
// Indexed by [specification][significance][coefficient]

constexpr double df_response_surface[3][N_SIG_LEVELS][4] = {
    // none
    {{-2.66, -2.62, -1.26, 0.00}, {-1.95, -1.95, -0.99, 0.00}, {-1.60, -1.62, -0.88, 0.00}},
    // drift
    {{-3.75, -3.52, -1.79, -0.38}, {-3.00, -2.89, -1.47, -0.27}, {-2.63, -2.58, -1.29, -0.22}},
    // trend
    {{-4.38, -3.95, -1.95, -0.40}, {-3.60, -3.43, -1.68, -0.31}, {-3.24, -3.13, -1.53, -0.26}},
};

/**
 * @brief Dickey-Fuller critical value for a sample of T observations
 * @param specification SPEC_NONE, SPEC_DRIFT or SPEC_TREND
 * @param sig_idx Significance index (0=1%, 1=5%, 2=10%)
 * @param T Effective number of observations
 */
inline double df_critical_value(int specification, int sig_idx, int T) {
    const double* b = df_response_surface[specification][sig_idx];
    const double t = static_cast<double>(T);
    return b[0] + b[1] / t + b[2] / (t * t) + b[3] / (t * t * t);
}

// ============================================================================
// ADF Critical Values: MacKinnon (1996)
// ============================================================================
// Tables indexed by [sample_size_idx][significance_idx]
// Sample size indices: 0=25, 1=50, 2=100, 3=250, 4=500, 5=inf

constexpr int ADF_N_SAMPLE_SIZES = 6;

constexpr int adf_sample_sizes[ADF_N_SAMPLE_SIZES] = {25, 50, 100, 250, 500, 100000};

constexpr double adf_cv_no_constant[ADF_N_SAMPLE_SIZES][N_SIG_LEVELS] = {
    // 1%,     5%,     10%
    {-2.66, -1.95, -1.60},  // n=25
    {-2.62, -1.95, -1.61},  // n=50
    {-2.60, -1.95, -1.61},  // n=100
    {-2.58, -1.95, -1.62},  // n=250
    {-2.58, -1.95, -1.62},  // n=500
    {-2.58, -1.95, -1.62},  // n=inf
};

constexpr double adf_cv_constant[ADF_N_SAMPLE_SIZES][N_SIG_LEVELS] = {
    {-3.75, -3.00, -2.63},
    {-3.58, -2.93, -2.60},
    {-3.51, -2.89, -2.58},
    {-3.46, -2.87, -2.57},
    {-3.44, -2.87, -2.57},
    {-3.43, -2.86, -2.57},
};

constexpr double adf_cv_constant_trend[ADF_N_SAMPLE_SIZES][N_SIG_LEVELS] = {
    {-4.38, -3.60, -3.24},
    {-4.15, -3.50, -3.18},
    {-4.04, -3.45, -3.15},
    {-3.99, -3.43, -3.13},
    {-3.98, -3.42, -3.13},
    {-3.96, -3.41, -3.12},
};

/**
 * @brief Linear interpolation in a sample-size indexed table
 * Sample sizes outside the table are clamped to its first or last row.
 */
template <int N>
double interpolate_by_sample_size(const int (&sizes)[N], const double (&table)[N][N_SIG_LEVELS],
                                  int n_obs, int sig_idx) {
    if (n_obs <= sizes[0]) {
        return table[0][sig_idx];
    }
    for (int i = 0; i < N - 1; ++i) {
        if (n_obs <= sizes[i + 1]) {
            double t = static_cast<double>(n_obs - sizes[i]) /
                       static_cast<double>(sizes[i + 1] - sizes[i]);
            return table[i][sig_idx] * (1.0 - t) + table[i + 1][sig_idx] * t;
        }
    }
    return table[N - 1][sig_idx];
}

/**
 * @brief Interpolate ADF critical value by sample size
 * @param n_obs Effective number of observations
 * @param specification SPEC_NONE, SPEC_DRIFT or SPEC_TREND
 * @param sig_idx Significance index (0=1%, 1=5%, 2=10%)
 */
inline double interpolate_adf_cv(int n_obs, int specification, int sig_idx) {
    switch (specification) {
        case SPEC_NONE:
            return interpolate_by_sample_size(adf_sample_sizes, adf_cv_no_constant, n_obs, sig_idx);
        case SPEC_TREND:
            return interpolate_by_sample_size(adf_sample_sizes, adf_cv_constant_trend, n_obs,
                                              sig_idx);
        default:
            return interpolate_by_sample_size(adf_sample_sizes, adf_cv_constant, n_obs, sig_idx);
    }
}

// ============================================================================
// ADF-GLS Critical Values: Elliott, Rothenberg and Stock (1996)
// ============================================================================
// The demeaned (drift) statistic follows the no-constant Dickey-Fuller
// distribution, so drift and none share adf_cv_no_constant. The detrended
// statistic has its own table (ERS Table 1).

constexpr int GLS_N_SAMPLE_SIZES = 4;

constexpr int gls_sample_sizes[GLS_N_SAMPLE_SIZES] = {50, 100, 200, 100000};

constexpr double gls_cv_trend[GLS_N_SAMPLE_SIZES][N_SIG_LEVELS] = {
    // 1%,     5%,     10%
    {-3.77, -3.19, -2.89},  // n=50
    {-3.58, -3.03, -2.74},  // n=100
    {-3.46, -2.93, -2.64},  // n=200
    {-3.48, -2.89, -2.57},  // n=inf
};

inline double interpolate_gls_cv(int n_obs, int specification, int sig_idx) {
    if (specification == SPEC_TREND) {
        return interpolate_by_sample_size(gls_sample_sizes, gls_cv_trend, n_obs, sig_idx);
    }
    return interpolate_by_sample_size(adf_sample_sizes, adf_cv_no_constant, n_obs, sig_idx);
}

// ============================================================================
// KPSS Critical Values: Kwiatkowski et al. (1992)
// ============================================================================

constexpr double kpss_cv_level[N_SIG_LEVELS] = {0.739, 0.463, 0.347};
constexpr double kpss_cv_trend[N_SIG_LEVELS] = {0.216, 0.146, 0.119};

inline double kpss_critical_value(int sig_idx, bool has_trend) {
    return has_trend ? kpss_cv_trend[sig_idx] : kpss_cv_level[sig_idx];
}

// ============================================================================
// Johansen Trace Critical Values: Osterwald-Lenum (1992)
// ============================================================================
// Indexed by [k - r - 1][significance_idx] where k is the number of series and
// r the rank under H0. Columns are ordered 1%, 5%, 10% like the tables above.

constexpr int JOHANSEN_MAX_TABULATED = 5;

// No deterministic terms
constexpr double johansen_trace_none[JOHANSEN_MAX_TABULATED][N_SIG_LEVELS] = {
    {6.51, 3.84, 2.86},
    {16.31, 12.53, 10.47},
    {29.75, 24.31, 21.63},
    {45.58, 39.89, 36.58},
    {66.52, 59.46, 55.44},
};

// Constant in the VAR
constexpr double johansen_trace_const[JOHANSEN_MAX_TABULATED][N_SIG_LEVELS] = {
    {6.65, 3.76, 2.69},
    {20.04, 15.41, 13.33},
    {35.65, 29.68, 26.79},
    {54.46, 47.21, 43.95},
    {76.07, 68.52, 64.84},
};

// Constant and linear trend
constexpr double johansen_trace_trend[JOHANSEN_MAX_TABULATED][N_SIG_LEVELS] = {
    {6.63, 3.84, 2.71},
    {23.15, 18.40, 16.16},
    {41.08, 35.01, 32.06},
    {62.52, 55.25, 51.65},
    {87.77, 79.34, 75.10},
};

/**
 * @brief Trace critical value for H0: rank <= r
 *
 * Beyond the tabulated dimensions the value is extrapolated quadratically from
 * the last three rows. The tabulated values grow roughly with the square of
 * k - r, so a linear step would understate them. The extrapolated values are
 * approximate (constant, 5%, k - r = 6: 93.61 against 94.15 published).
 *
 * @param k_minus_r Number of series minus the rank under test (>= 1)
 * @param specification SPEC_NONE, SPEC_DRIFT or SPEC_TREND
 * @param sig_idx Significance index (0=1%, 1=5%, 2=10%)
 */
inline double johansen_trace_cv(int k_minus_r, int specification, int sig_idx) {
    const double (*table)[N_SIG_LEVELS];
    switch (specification) {
        case SPEC_NONE: table = johansen_trace_none; break;
        case SPEC_TREND: table = johansen_trace_trend; break;
        default: table = johansen_trace_const; break;
    }

    if (k_minus_r <= JOHANSEN_MAX_TABULATED) {
        return table[k_minus_r - 1][sig_idx];
    }

    double last = table[JOHANSEN_MAX_TABULATED - 1][sig_idx];
    double previous = table[JOHANSEN_MAX_TABULATED - 2][sig_idx];
    double step = last - previous;
    double curvature = step - (previous - table[JOHANSEN_MAX_TABULATED - 3][sig_idx]);
    int m = k_minus_r - JOHANSEN_MAX_TABULATED;
    return last + m * step + curvature * m * (m + 1) / 2.0;
}

/**
 * @brief Trace critical values for r = 0 .. n_series - 1
 */
inline std::vector<double> johansen_trace_critical_values(int n_series, int specification,
                                                          int sig_idx) {
    std::vector<double> cv(n_series);
    for (int r = 0; r < n_series; ++r) {
        cv[r] = johansen_trace_cv(n_series - r, specification, sig_idx);
    }
    return cv;
}

}  // namespace critical_values
}  // namespace statistics
}  // namespace tsdiag
