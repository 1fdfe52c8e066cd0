/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <string>
#include <vector>

#include "config.hpp"
#include "results.hpp"

namespace CliRenderer {
std::string format_speed(double mbps);

void render_transfer_result(const sigmaxfer::TransferOutcome& outcome,
                            const sigmaxfer::TransferRecord* record);
void render_quality_stats(const sigmaxfer::QualityReport& report);

// One row per sample: the value, then a track with L/C/U markers for the
// control limits and '*' for the sample itself.
std::vector<std::string> control_chart_lines(const sigmaxfer::ControlChart& chart,
                                             int track_width = Config::CHART_BAR_WIDTH,
                                             bool use_color = false);
void render_control_chart(const sigmaxfer::ControlChart& chart);
}  // namespace CliRenderer
