#include "include/normal_quantile.hpp"

#include <array>
#include <cmath>
#include <limits>
#include <numbers>

namespace sigmaxfer::stats {

namespace {

// Acklam's rational approximation, relative error 1.15e-9 before refinement.
constexpr std::array<double, 6> a = {-3.969683028665376e+01, 2.209460984245205e+02,
                                     -2.759285104469687e+02, 1.383577518672690e+02,
                                     -3.066479806614716e+01, 2.506628277459239e+00};
constexpr std::array<double, 5> b = {-5.447609879822406e+01, 1.615858368580409e+02,
                                     -1.556989798598866e+02, 6.680131188771972e+01,
                                     -1.328068155288572e+01};
constexpr std::array<double, 6> c = {-7.784894002430293e-03, -3.223964580411365e-01,
                                     -2.400758277161838e+00, -2.549732539343734e+00,
                                     4.374664141464968e+00,  2.938163982698783e+00};
constexpr std::array<double, 4> d = {7.784695709041462e-03, 3.224671290700398e-01,
                                     2.445134137142996e+00, 3.754408661907416e+00};

constexpr double p_low = 0.02425;
constexpr double p_high = 1.0 - p_low;

double tail(double q) noexcept {
    double num = ((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5];
    double den = (((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0;
    return num / den;
}

}  // namespace

double normal_cdf(double x) noexcept {
    return 0.5 * std::erfc(-x / std::numbers::sqrt2);
}

double inverse_normal_cdf(double p) noexcept {
    if (std::isnan(p) || p < 0.0 || p > 1.0) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    if (p == 0.0) return -std::numeric_limits<double>::infinity();
    if (p == 1.0) return std::numeric_limits<double>::infinity();

    double x;
    if (p < p_low) {
        x = tail(std::sqrt(-2.0 * std::log(p)));
    } else if (p <= p_high) {
        double q = p - 0.5;
        double r = q * q;
        double num = (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) * q;
        double den = ((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0;
        x = num / den;
    } else {
        x = -tail(std::sqrt(-2.0 * std::log1p(-p)));
    }

    // One Halley step against the exact CDF.
    double e = normal_cdf(x) - p;
    double u = e * std::sqrt(2.0 * std::numbers::pi) * std::exp(x * x / 2.0);
    return x - u / (1.0 + x * u / 2.0);
}

}  // namespace sigmaxfer::stats
