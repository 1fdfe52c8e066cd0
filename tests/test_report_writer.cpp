#include <array>
#include <chrono>
#include <cstdint>
#include <format>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <zlib.h>

#include "include/quality_report.hpp"
#include "include/report_writer.hpp"
#include "tests/test_support.hpp"

using namespace sigmaxfer;
using sigmaxfer::test_support::TempDir;
using json = nlohmann::json;

namespace {

QualityReport sample_report(const std::vector<double>& mbps) {
    std::vector<TransferRecord> records;
    for (std::size_t i = 0; i < mbps.size(); ++i) {
        records.emplace_back(std::format("f{}.bin", i),
                             std::format("/srv/f{}.bin", i),
                             static_cast<std::uint64_t>(mbps[i] * 125'000.0),
                             1.0,
                             std::string(64, 'c'),
                             std::chrono::system_clock::now());
    }
    return QualityReportBuilder().build(records);
}

std::string read_gzip(const std::filesystem::path& path) {
    gzFile in = gzopen(path.c_str(), "rb");
    if (!in) return {};
    std::string text;
    std::array<char, 4096> buf{};
    int n = 0;
    while ((n = gzread(in, buf.data(), static_cast<unsigned>(buf.size()))) > 0) {
        text.append(buf.data(), static_cast<std::size_t>(n));
    }
    gzclose(in);
    return text;
}

}  // namespace

TEST(ReportWriter, EmptyReportIsEmptyObject) {
    QualityReport empty;
    auto j = ReportWriter::to_json(empty);
    EXPECT_TRUE(j.is_object());
    EXPECT_TRUE(j.empty());
}

TEST(ReportWriter, JsonShape) {
    auto j = ReportWriter::to_json(sample_report({5, 8, 12, 9, 11}));

    ASSERT_TRUE(j.contains("throughput_stats"));
    for (const char* key : {"mean", "std_dev", "cpk", "sigma_level", "sample_count"}) {
        EXPECT_TRUE(j["throughput_stats"].contains(key)) << key;
    }
    EXPECT_EQ(j["throughput_stats"]["sample_count"].get<std::size_t>(), 5u);

    ASSERT_TRUE(j.contains("control_chart"));
    EXPECT_EQ(j["control_chart"]["points"].size(), 5u);
    EXPECT_TRUE(j["control_chart"]["out_of_limit"].is_array());

    ASSERT_TRUE(j.contains("transfer_records"));
    ASSERT_EQ(j["transfer_records"].size(), 5u);
    const auto& first = j["transfer_records"][0];
    EXPECT_EQ(first["filename"], "f0.bin");
    EXPECT_EQ(first["remote_path"], "/srv/f0.bin");
    EXPECT_NEAR(first["throughput_mbps"].get<double>(), 5.0, 1e-9);
    EXPECT_EQ(first["attempts"], 1);

    EXPECT_DOUBLE_EQ(j["spec_limits"]["usl"].get<double>(), Config::DEFAULT_USL_MBPS);
    EXPECT_TRUE(j["generated_at"].is_string());
}

TEST(ReportWriter, SingleRecordOmitsControlChart) {
    auto j = ReportWriter::to_json(sample_report({50}));
    EXPECT_FALSE(j.contains("control_chart"));
    EXPECT_EQ(j["transfer_records"].size(), 1u);
}

TEST(ReportWriter, InfiniteSigmaLevelBecomesNull) {
    auto j = ReportWriter::to_json(sample_report({50, 60, 70}));
    auto text = j.dump();
    EXPECT_TRUE(json::parse(text)["throughput_stats"]["sigma_level"].is_null());
}

TEST(ReportWriter, WritesPlainJson) {
    TempDir dir;
    auto path = dir.path() / "report.json";
    ASSERT_TRUE(ReportWriter::write(sample_report({5, 8}), path).has_value());

    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    auto j = json::parse(ss.str());
    EXPECT_EQ(j["throughput_stats"]["sample_count"], 2);
}

TEST(ReportWriter, WritesGzipWhenAsked) {
    TempDir dir;
    auto path = dir.path() / "report.json.gz";
    ASSERT_TRUE(ReportWriter::write(sample_report({5, 8, 13}), path).has_value());

    std::ifstream raw(path, std::ios::binary);
    unsigned char magic[2] = {};
    raw.read(reinterpret_cast<char*>(magic), 2);
    EXPECT_EQ(magic[0], 0x1f);
    EXPECT_EQ(magic[1], 0x8b);

    auto j = json::parse(read_gzip(path));
    EXPECT_EQ(j["transfer_records"].size(), 3u);
}

TEST(ReportWriter, ReportsUnwritablePath) {
    TempDir dir;
    auto result = ReportWriter::write(sample_report({5, 8}), dir.path() / "missing" / "report.json");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("report.json"), std::string::npos);
}
