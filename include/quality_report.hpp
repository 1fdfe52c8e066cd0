#pragma once

#include <chrono>
#include <span>

#include "results.hpp"

namespace sigmaxfer {

// Assembles SPC figures and the raw records into one report. Pure: the
// records are read, never modified, so concurrent builders need no locking.
class QualityReportBuilder {
   public:
    explicit QualityReportBuilder(SpecLimits limits = {});

    [[nodiscard]] QualityReport build(
        std::span<const TransferRecord> records,
        std::chrono::system_clock::time_point generated_at = std::chrono::system_clock::now()) const;

    [[nodiscard]] const SpecLimits& limits() const noexcept { return limits_; }

   private:
    SpecLimits limits_;
};

}  // namespace sigmaxfer
