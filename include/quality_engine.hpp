#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include "config.hpp"
#include "results.hpp"

namespace sigmaxfer::stats {

// SPC indicators over a throughput series. Every figure is recomputed on request.
// Samples are not validated: NaN or negative values propagate into the results.
class StatisticalQualityEngine {
   public:
    explicit StatisticalQualityEngine(std::vector<double> samples);
    explicit StatisticalQualityEngine(std::span<const double> samples);

    [[nodiscard]] std::size_t sample_count() const noexcept { return samples_.size(); }
    [[nodiscard]] const std::vector<double>& samples() const noexcept { return samples_; }
    [[nodiscard]] bool has_sufficient_data() const noexcept {
        return samples_.size() >= Config::MIN_SPC_SAMPLES;
    }

    // NaN for an empty series.
    [[nodiscard]] double mean() const;
    // Population standard deviation (divides by N).
    [[nodiscard]] double std_dev() const;

    // min((usl - mean) / 3σ, (mean - lsl) / 3σ); 0.0 with fewer than two samples or σ = 0.
    [[nodiscard]] double capability_index(double usl, double lsl) const;

    // mean ± 3σ; empty with fewer than two samples.
    [[nodiscard]] std::optional<ControlLimits> control_chart_limits() const;

    // Φ⁻¹(1 - defect_rate) + 1.5 where a defect is a sample below the threshold.
    // 0.0 with fewer than two samples or when every sample is a defect.
    [[nodiscard]] double sigma_level(
        double defect_threshold = Config::DEFAULT_DEFECT_THRESHOLD_MBPS) const;

    // Indices of samples strictly outside the control limits.
    [[nodiscard]] std::vector<std::size_t> out_of_limit_points() const;

   private:
    std::vector<double> samples_;
};

}  // namespace sigmaxfer::stats
