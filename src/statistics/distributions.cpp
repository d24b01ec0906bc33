#include "tsdiag/statistics/distributions.hpp"
#include <algorithm>
#include <boost/math/distributions/chi_squared.hpp>
#include <boost/math/distributions/fisher_f.hpp>
#include <boost/math/distributions/normal.hpp>
#include <cmath>

namespace tsdiag {
namespace statistics {

double chi_squared_upper_tail(double q, int df) {
    if (q <= 0.0) return 1.0;
    boost::math::chi_squared dist(static_cast<double>(df));
    return std::clamp(boost::math::cdf(boost::math::complement(dist, q)), 0.0, 1.0);
}

double fisher_f_upper_tail(double f, int df1, int df2) {
    if (f <= 0.0) return 1.0;
    boost::math::fisher_f dist(static_cast<double>(df1), static_cast<double>(df2));
    return std::clamp(boost::math::cdf(boost::math::complement(dist, f)), 0.0, 1.0);
}

double normal_two_sided(double z) {
    boost::math::normal dist(0.0, 1.0);
    // Two-sided p-value: P(|Z| > |z|) = 2 * P(Z > |z|)
    double p = 2.0 * boost::math::cdf(boost::math::complement(dist, std::fabs(z)));
    return std::clamp(p, 0.0, 1.0);
}

}  // namespace statistics
}  // namespace tsdiag
