#include "include/report_writer.hpp"

#include <cerrno>
#include <format>
#include <fstream>
#include <memory>
#include <system_error>

#include <nlohmann/json.hpp>
#include <zlib.h>

#include "include/config.hpp"
#include "include/utils.hpp"

using json = nlohmann::json;

namespace sigmaxfer {

namespace {

struct GzCloser {
    void operator()(gzFile_s* f) const noexcept {
        if (f) gzclose(f);
    }
};

json record_to_json(const TransferRecord& r) {
    return json{
        {"filename", r.filename()},
        {"remote_path", r.remote_path()},
        {"size_bytes", r.size_bytes()},
        {"duration_seconds", r.duration_seconds()},
        {"throughput_mbps", r.throughput_mbps()},
        {"digest_hex", r.digest_hex()},
        {"timestamp", format_timestamp(r.timestamp())},
        {"attempts", r.attempts()},
    };
}

std::expected<void, std::string> write_gzip(const std::string& text,
                                            const std::filesystem::path& path) {
    std::unique_ptr<gzFile_s, GzCloser> out(gzopen(path.c_str(), "wb"));
    if (!out) {
        return std::unexpected(std::format("Cannot open '{}' for writing", path.string()));
    }

    if (!text.empty()) {
        int written = gzwrite(out.get(), text.data(), static_cast<unsigned>(text.size()));
        if (written != static_cast<int>(text.size())) {
            int errnum = 0;
            const char* msg = gzerror(out.get(), &errnum);
            return std::unexpected(
                std::format("Compressed write to '{}' failed: {}", path.string(), msg ? msg : "unknown"));
        }
    }

    if (gzclose(out.release()) != Z_OK) {
        return std::unexpected(std::format("Failed to finish '{}'", path.string()));
    }
    return {};
}

}  // namespace

json ReportWriter::to_json(const QualityReport& report) {
    if (report.empty()) {
        return json::object();
    }

    const auto& s = report.throughput_stats;
    json j;
    j["throughput_stats"] = {
        {"mean", s.mean},
        {"std_dev", s.std_dev},
        {"cpk", s.cpk},
        {"sigma_level", s.sigma_level},
        {"sample_count", s.sample_count},
    };

    if (report.control_chart) {
        const auto& chart = *report.control_chart;
        j["control_chart"] = {
            {"center", chart.limits.center},
            {"upper_limit", chart.limits.upper_limit},
            {"lower_limit", chart.limits.lower_limit},
            {"points", chart.points},
            {"out_of_limit", chart.out_of_limit},
        };
    }

    j["spec_limits"] = {
        {"usl", report.spec_limits.usl},
        {"lsl", report.spec_limits.lsl},
        {"defect_threshold", report.spec_limits.defect_threshold},
    };

    json records = json::array();
    for (const auto& r : report.transfer_records) {
        records.push_back(record_to_json(r));
    }
    j["transfer_records"] = std::move(records);
    j["generated_at"] = format_timestamp(report.generated_at);
    return j;
}

std::expected<void, std::string> ReportWriter::write(const QualityReport& report,
                                                     const std::filesystem::path& path) {
    const std::string text = to_json(report).dump(Config::REPORT_JSON_INDENT) + "\n";

    if (path.extension() == ".gz") {
        return write_gzip(text, path);
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(std::format("Cannot save report '{}': {}",
                                           path.string(),
                                           std::system_category().message(errno)));
    }
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.flush();
    if (!out) {
        return std::unexpected(std::format("Write to '{}' failed", path.string()));
    }
    return {};
}

}  // namespace sigmaxfer
