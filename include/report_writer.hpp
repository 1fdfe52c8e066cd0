#pragma once

#include <expected>
#include <filesystem>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "results.hpp"

namespace sigmaxfer {

class ReportWriter {
   public:
    // An empty report serializes to {}.
    static nlohmann::json to_json(const QualityReport& report);

    // Pretty-printed JSON; a ".gz" extension selects gzip compression.
    static std::expected<void, std::string> write(const QualityReport& report,
                                                  const std::filesystem::path& path);
};

}  // namespace sigmaxfer
