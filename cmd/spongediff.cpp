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

#include <spongediff/core/bytes.hpp>
#include <spongediff/core/config.hpp>
#include <spongediff/core/hex.hpp>
#include <spongediff/core/log_level_map.hpp>
#include <spongediff/execution/candidate.hpp>
#include <spongediff/fuzz/fuzz_config.hpp>
#include <spongediff/fuzz/progress.hpp>
#include <spongediff/fuzz/report.hpp>
#include <spongediff/fuzz/run_controller.hpp>

#include <evmc/evmc.h>

#include <CLI/CLI.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace fs = std::filesystem;

using namespace spongediff;

namespace
{
    std::optional<Address> parse_address(std::string_view const hex)
    {
        auto const bytes = from_hex(hex);
        if (!bytes.has_value() || bytes->size() != sizeof(Address::bytes)) {
            return std::nullopt;
        }
        Address address;
        std::memcpy(address.bytes, bytes->data(), sizeof(address.bytes));
        return address;
    }
}

int main(int const argc, char const *argv[])
{
    CLI::App cli{"spongediff"};
    cli.option_defaults()->always_capture_default();

    fuzz::Config config;
    fs::path code_path;
    std::string address = "0xdead00000000000000000000000000000000beef";
    evmc_revision revision = EVMC_CANCUN;
    auto log_level = quill::LogLevel::Info;

    // the candidate code relies on SHR
    auto const rev_map = std::map<std::string, evmc_revision>{
        {"CONSTANTINOPLE", EVMC_CONSTANTINOPLE},
        {"PETERSBURG", EVMC_PETERSBURG},
        {"ISTANBUL", EVMC_ISTANBUL},
        {"BERLIN", EVMC_BERLIN},
        {"LONDON", EVMC_LONDON},
        {"PARIS", EVMC_PARIS},
        {"SHANGHAI", EVMC_SHANGHAI},
        {"CANCUN", EVMC_CANCUN},
        {"PRAGUE", EVMC_PRAGUE},
        {"LATEST", EVMC_LATEST_STABLE_REVISION}};

    cli.add_option(
        "-t,--thread_count", config.worker_count, "number of worker threads");
    cli.add_option(
        "-d,--diff_count",
        config.total_iterations,
        "total number of differential checks");
    cli.add_option(
        "-m,--max_input_bytes",
        config.max_input_bytes,
        "exclusive upper bound on the input length");
    // The candidate must hash in contract code, e.g. the deployed bytecode
    // of lib-keccak's StatefulSponge. A contract built on the KECCAK256
    // opcode shares the reference hasher inside evmone.
    cli.add_option(
           "--code",
           code_path,
           "hex file with the deployed candidate sponge bytecode")
        ->required()
        ->check(CLI::ExistingFile);
    cli.add_option("--address", address, "candidate deployment address")
        ->check([](std::string const &s) {
            return parse_address(s).has_value() ? std::string{}
                                                : std::string{"bad address"};
        });
    cli.add_option("--revision", revision, "EVM revision")
        ->transform(CLI::CheckedTransformer(rev_map, CLI::ignore_case))
        ->option_text("TEXT");
    cli.add_option("--seed", config.seed, "base seed, worker i uses seed + i");
    cli.add_option(
        "--progress_interval",
        config.progress_interval,
        "iterations between progress lines, 0 disables them");
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(ascii_time) [%(thread)] %(filename):%(lineno) LOG_%(level_name)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    auto code = fuzz::load_code(code_path);
    if (code.has_error()) {
        LOG_ERROR(
            "could not load candidate code from {}: {}",
            code_path.string(),
            code.assume_error().message().c_str());
        quill::flush();
        return EXIT_FAILURE;
    }
    LOG_INFO(
        "candidate code {} ({} bytes) at {}",
        code_path.string(),
        code.assume_value().size(),
        address);

    CandidateConfig candidate{
        .address = parse_address(address).value(),
        .code = std::move(code).assume_value(),
        .revision = revision};

    fuzz::LogProgressSink progress{config.progress_interval};
    fuzz::RunController controller{config, std::move(candidate), progress};

    auto const result = controller.run();
    if (result.has_error()) {
        if (controller.failure().has_value()) {
            LOG_ERROR("{}", fuzz::describe(*controller.failure()));
        }
        else {
            LOG_ERROR(
                "run failed: {}", result.assume_error().message().c_str());
        }
    }

    quill::flush();
    return result.has_error() ? EXIT_FAILURE : EXIT_SUCCESS;
}
