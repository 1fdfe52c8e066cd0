// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
// Copyright (c) 2025 Alfie Ardinata.

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"

namespace sigmaxfer {

// One completed, verified transfer. Immutable once created.
class TransferRecord {
   public:
    TransferRecord(std::string filename,
                   std::string remote_path,
                   std::uint64_t size_bytes,
                   double duration_seconds,
                   std::string digest_hex,
                   std::chrono::system_clock::time_point timestamp,
                   int attempts = 1);

    const std::string& filename() const noexcept { return filename_; }
    const std::string& remote_path() const noexcept { return remote_path_; }
    std::uint64_t size_bytes() const noexcept { return size_bytes_; }
    double duration_seconds() const noexcept { return duration_seconds_; }
    const std::string& digest_hex() const noexcept { return digest_hex_; }
    std::chrono::system_clock::time_point timestamp() const noexcept { return timestamp_; }
    int attempts() const noexcept { return attempts_; }

    // Always derived from size and duration.
    double throughput_mbps() const noexcept {
        return static_cast<double>(size_bytes_) * 8.0 / (duration_seconds_ * 1'000'000.0);
    }

   private:
    std::string filename_;
    std::string remote_path_;
    std::uint64_t size_bytes_;
    double duration_seconds_;
    std::string digest_hex_;
    std::chrono::system_clock::time_point timestamp_;
    int attempts_;
};

struct TransferJob {
    std::filesystem::path local;
    std::string remote;
};

struct TransferOutcome {
    TransferJob job;
    bool success = false;
};

struct SpecLimits {
    double usl = Config::DEFAULT_USL_MBPS;
    double lsl = Config::DEFAULT_LSL_MBPS;
    double defect_threshold = Config::DEFAULT_DEFECT_THRESHOLD_MBPS;
};

struct ControlLimits {
    double center = 0.0;
    double upper_limit = 0.0;
    double lower_limit = 0.0;
};

struct ThroughputStats {
    double mean = 0.0;
    double std_dev = 0.0;
    double cpk = 0.0;
    double sigma_level = 0.0;
    std::size_t sample_count = 0;
};

struct ControlChart {
    ControlLimits limits;
    std::vector<double> points;
    std::vector<std::size_t> out_of_limit;
};

struct QualityReport {
    ThroughputStats throughput_stats;
    std::optional<ControlChart> control_chart;
    SpecLimits spec_limits;
    std::vector<TransferRecord> transfer_records;
    std::chrono::system_clock::time_point generated_at{};

    bool empty() const noexcept { return transfer_records.empty(); }
};

}  // namespace sigmaxfer
