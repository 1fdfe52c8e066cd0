#include "include/cli_renderer.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <print>
#include <string>
#include <string_view>

#include "include/color.hpp"
#include "include/config.hpp"
#include "include/utils.hpp"

using sigmaxfer::ControlChart;
using sigmaxfer::QualityReport;
using sigmaxfer::TransferOutcome;
using sigmaxfer::TransferRecord;

namespace CliRenderer {

namespace {

std::string format_metric(double value) {
    if (std::isnan(value)) return "n/a";
    if (std::isinf(value)) return value > 0 ? "inf" : "-inf";
    return std::format("{:.3f}", value);
}

}

std::string format_speed(double mbps) {
    if (mbps >= 1000.0) {
        return std::format("{:.2f} Gbps", mbps / 1000.0);
    }
    return std::format("{:.2f} Mbps", mbps);
}

void render_transfer_result(const TransferOutcome& outcome, const TransferRecord* record) {
    const bool color = Color::enabled();
    std::string label = std::format(" {} -> {}", outcome.job.local.filename().string(), outcome.job.remote);

    if (outcome.success && record) {
        std::println("{:<40} {}  {} in {:.2f} s",
                     label,
                     Color::colorize("✓", Color::GREEN, color),
                     Color::colorize(format_speed(record->throughput_mbps()), Color::YELLOW, color),
                     format_bytes(record->size_bytes()),
                     record->duration_seconds());
    } else {
        std::println("{:<40} {}", label, Color::colorize("✗ Failed", Color::RED, color));
    }
}

void render_quality_stats(const QualityReport& report) {
    const bool color = Color::enabled();
    if (report.empty()) {
        std::println(" {}", Color::colorize("No successful transfers, nothing to analyze", Color::YELLOW, color));
        return;
    }

    const auto& s = report.throughput_stats;
    const int w = Config::APP_INFO_LABEL_WIDTH;
    std::println(" -> {}", Color::colorize("Throughput Quality", Color::BOLD, color));
    std::println(" {:<{}} : {}", "Samples", w, s.sample_count);
    std::println(" {:<{}} : {}", "Mean", w, Color::colorize(format_speed(s.mean), Color::CYAN, color));
    std::println(" {:<{}} : {}", "Std Dev", w, Color::colorize(format_speed(s.std_dev), Color::CYAN, color));
    std::println(" {:<{}} : {} (USL {}, LSL {})",
                 "Cpk", w,
                 Color::colorize(format_metric(s.cpk), Color::YELLOW, color),
                 format_speed(report.spec_limits.usl),
                 format_speed(report.spec_limits.lsl));
    std::println(" {:<{}} : {} (defect < {})",
                 "Sigma Level", w,
                 Color::colorize(format_metric(s.sigma_level), Color::YELLOW, color),
                 format_speed(report.spec_limits.defect_threshold));
}

std::vector<std::string> control_chart_lines(const ControlChart& chart, int track_width, bool use_color) {
    std::vector<std::string> lines;
    const auto& limits = chart.limits;
    const int width = std::max(track_width, 3);

    double lo = limits.lower_limit;
    double hi = limits.upper_limit;
    for (double v : chart.points) {
        if (!std::isfinite(v)) continue;
        lo = std::min(lo, v);
        hi = std::max(hi, v);
    }
    if (!std::isfinite(lo) || !std::isfinite(hi)) {
        return lines;
    }
    if (hi <= lo) {
        hi = lo + 1.0;
    }

    auto column = [&](double v) {
        double pos = (v - lo) / (hi - lo) * static_cast<double>(width - 1);
        return std::clamp(static_cast<int>(std::lround(pos)), 0, width - 1);
    };

    lines.push_back(std::format("L = LCL {:.2f}   C = center {:.2f}   U = UCL {:.2f}",
                                limits.lower_limit, limits.center, limits.upper_limit));

    for (std::size_t i = 0; i < chart.points.size(); ++i) {
        std::string track(static_cast<std::size_t>(width), ' ');
        track[static_cast<std::size_t>(column(limits.lower_limit))] = 'L';
        track[static_cast<std::size_t>(column(limits.center))] = 'C';
        track[static_cast<std::size_t>(column(limits.upper_limit))] = 'U';

        const double v = chart.points[i];
        if (std::isfinite(v)) {
            track[static_cast<std::size_t>(column(v))] = '*';
        }

        const bool outside =
            std::ranges::find(chart.out_of_limit, i) != chart.out_of_limit.end();
        std::string row = std::format("#{:<3} {:>10.2f} |{}|{}", i + 1, v, track, outside ? " !" : "");
        lines.push_back(outside ? Color::colorize(row, Color::RED, use_color) : row);
    }
    return lines;
}

void render_control_chart(const ControlChart& chart) {
    std::println(" -> {}", Color::colorize("Throughput Control Chart (Mbps)", Color::BOLD, Color::enabled()));
    for (const auto& line : control_chart_lines(chart, Config::CHART_BAR_WIDTH, Color::enabled())) {
        std::println(" {}", line);
    }
}

}  // namespace CliRenderer
