// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include "replay.hpp"

#include <bobe/core/bobe_exception.hpp>
#include <bobe/core/log_level_map.hpp>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace bobe;
namespace fs = std::filesystem;

int main(int const argc, char const *argv[])
{
    CLI::App cli{"bobe_replay"};
    cli.option_defaults()->always_capture_default();

    fs::path scenario_path;
    auto log_level = quill::LogLevel::Info;
    bool stop_on_error = false;

    cli.add_option("--scenario", scenario_path, "scenario json file")
        ->required()
        ->check(CLI::ExistingFile);
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));
    cli.add_flag(
        "--stop_on_error", stop_on_error, "stop at the first failed command");

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(time) [%(thread_id)] %(file_name):%(line_number) LOG_%(log_level)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    size_t failures = 0;
    try {
        std::ifstream in{scenario_path};
        auto const scenario = nlohmann::json::parse(in);
        Replay replay{scenario};
        LOG_INFO("replaying {}", scenario_path.string());
        failures = replay.run(stop_on_error);
    }
    catch (BobeException const &e) {
        e.print();
        return EXIT_FAILURE;
    }
    catch (nlohmann::json::exception const &e) {
        LOG_ERROR("malformed scenario: {}", e.what());
        return EXIT_FAILURE;
    }

    if (failures != 0) {
        LOG_ERROR("{} commands failed", failures);
        return EXIT_FAILURE;
    }
    LOG_INFO("replay finished");
    return EXIT_SUCCESS;
}
