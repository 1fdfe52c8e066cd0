#include "include/quality_report.hpp"

#include <vector>

#include "include/quality_engine.hpp"

namespace sigmaxfer {

QualityReportBuilder::QualityReportBuilder(SpecLimits limits) : limits_(limits) {}

QualityReport QualityReportBuilder::build(std::span<const TransferRecord> records,
                                          std::chrono::system_clock::time_point generated_at) const {
    QualityReport report;
    report.spec_limits = limits_;
    report.generated_at = generated_at;

    if (records.empty()) {
        return report;
    }

    std::vector<double> throughputs;
    throughputs.reserve(records.size());
    for (const auto& r : records) {
        throughputs.push_back(r.throughput_mbps());
    }

    stats::StatisticalQualityEngine engine(throughputs);

    report.throughput_stats = ThroughputStats{
        engine.mean(),
        engine.std_dev(),
        engine.capability_index(limits_.usl, limits_.lsl),
        engine.sigma_level(limits_.defect_threshold),
        engine.sample_count(),
    };

    if (auto limits = engine.control_chart_limits()) {
        report.control_chart = ControlChart{*limits, engine.samples(), engine.out_of_limit_points()};
    }

    report.transfer_records.assign(records.begin(), records.end());
    return report;
}

}  // namespace sigmaxfer
