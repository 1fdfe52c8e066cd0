/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "results.hpp"
#include "session_config.hpp"

namespace sigmaxfer {

// Options given on the command line. Unset fields leave the configuration alone.
struct CommandLine {
    bool help = false;
    bool version = false;

    std::optional<std::filesystem::path> config_path;
    std::optional<std::string> host;
    std::optional<int> port;
    std::optional<std::string> username;
    std::optional<std::filesystem::path> key_path;
    std::optional<long> bandwidth_limit_kbps;
    std::optional<int> retries;
    std::optional<std::filesystem::path> report_path;
    std::optional<std::filesystem::path> log_file;
    bool no_verify = false;
    bool no_chart = false;
    bool verbose = false;

    std::vector<TransferJob> jobs;
};

// Arguments without the program name.
std::expected<CommandLine, std::string> parse_command_line(const std::vector<std::string>& args);

// Command line values win over the configuration file; positional jobs are
// appended after the configured ones.
void apply_overrides(const CommandLine& cli, SessionConfig& cfg);

}  // namespace sigmaxfer

class Application {
   public:
    int run(int argc, char* argv[]);

   private:
    void show_help(const std::string& app_name) const;
    void show_version() const;
};
