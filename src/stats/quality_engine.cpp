#include "include/quality_engine.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <utility>

#include "include/normal_quantile.hpp"

namespace sigmaxfer::stats {

StatisticalQualityEngine::StatisticalQualityEngine(std::vector<double> samples)
    : samples_(std::move(samples)) {}

StatisticalQualityEngine::StatisticalQualityEngine(std::span<const double> samples)
    : samples_(samples.begin(), samples.end()) {}

double StatisticalQualityEngine::mean() const {
    if (samples_.empty()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    double sum = std::accumulate(samples_.begin(), samples_.end(), 0.0);
    return sum / static_cast<double>(samples_.size());
}

double StatisticalQualityEngine::std_dev() const {
    if (samples_.empty()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    const double m = mean();
    double sq = 0.0;
    for (double v : samples_) {
        sq += (v - m) * (v - m);
    }
    return std::sqrt(sq / static_cast<double>(samples_.size()));
}

double StatisticalQualityEngine::capability_index(double usl, double lsl) const {
    if (!has_sufficient_data()) {
        return 0.0;
    }

    const double m = mean();
    const double sigma = std_dev();
    if (sigma == 0.0) {
        return 0.0;
    }

    const double upper = (usl - m) / (Config::CONTROL_LIMIT_SIGMAS * sigma);
    const double lower = (m - lsl) / (Config::CONTROL_LIMIT_SIGMAS * sigma);
    if (std::isnan(upper) || std::isnan(lower)) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return std::min(upper, lower);
}

std::optional<ControlLimits> StatisticalQualityEngine::control_chart_limits() const {
    if (!has_sufficient_data()) {
        return std::nullopt;
    }

    const double m = mean();
    const double spread = Config::CONTROL_LIMIT_SIGMAS * std_dev();
    return ControlLimits{m, m + spread, m - spread};
}

double StatisticalQualityEngine::sigma_level(double defect_threshold) const {
    if (!has_sufficient_data()) {
        return 0.0;
    }

    std::size_t defects = 0;
    for (double v : samples_) {
        if (v < defect_threshold) {
            ++defects;
        }
    }

    const double defect_rate = static_cast<double>(defects) / static_cast<double>(samples_.size());
    if (defect_rate >= 1.0) {
        return 0.0;
    }

    return inverse_normal_cdf(1.0 - defect_rate) + Config::SIGMA_LONG_TERM_SHIFT;
}

std::vector<std::size_t> StatisticalQualityEngine::out_of_limit_points() const {
    std::vector<std::size_t> indices;
    auto limits = control_chart_limits();
    if (!limits) {
        return indices;
    }

    for (std::size_t i = 0; i < samples_.size(); ++i) {
        if (samples_[i] > limits->upper_limit || samples_[i] < limits->lower_limit) {
            indices.push_back(i);
        }
    }
    return indices;
}

}  // namespace sigmaxfer::stats
