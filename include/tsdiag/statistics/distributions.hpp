#pragma once

namespace tsdiag {
namespace statistics {

// Upper-tail and two-sided p-values of the reference distributions used by the
// tests. All results are clamped to [0, 1].

/**
 * @brief P(X > q) for X ~ chi-square(df)
 */
double chi_squared_upper_tail(double q, int df);

/**
 * @brief P(X > f) for X ~ F(df1, df2)
 */
double fisher_f_upper_tail(double f, int df1, int df2);

/**
 * @brief P(|Z| > |z|) for Z ~ N(0, 1)
 */
double normal_two_sided(double z);

}  // namespace statistics
}  // namespace tsdiag
