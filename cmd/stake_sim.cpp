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

#include <stakeledger/core/fmt/address_fmt.hpp>
#include <stakeledger/core/fmt/int_fmt.hpp>
#include <stakeledger/core/log_level_map.hpp>
#include <stakeledger/sim/scenario.hpp>
#include <stakeledger/staking/fmt/user_stake_fmt.hpp>

#include <CLI/CLI.hpp>
#include <quill/Quill.h>
#include <quill/bundled/fmt/core.h>
#include <quill/bundled/fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

using namespace stakeledger;

namespace
{
    void print_report(ScenarioReport const &report)
    {
        for (size_t i = 0; i < report.steps.size(); ++i) {
            auto const &step = report.steps[i];
            auto const &op = step.operation;
            fmt::println(
                "#{} {} account={} block={} amount={}",
                i,
                to_string(op.kind),
                op.account,
                op.block,
                op.amount);
            if (step.error.has_value()) {
                fmt::println("    FAILED: {}", step.error.value());
                continue;
            }
            fmt::println("    ok: {}", step.amount);
            for (auto const &event : step.events) {
                fmt::println("    event {}", describe_event(event));
            }
        }

        fmt::println("");
        for (auto const &account : report.accounts) {
            fmt::println(
                "{}: {} pending={} wallet={}",
                account.account,
                account.stake,
                account.pending,
                account.wallet);
        }
        fmt::println(
            "total staked={} total pending={} custody={}",
            report.total_staked,
            report.total_pending,
            report.custody_balance);
        fmt::println(
            "{} operations, {} failed",
            report.steps.size(),
            report.failures());
    }
}

int main(int argc, char *argv[])
{
    std::filesystem::path scenario_path;
    auto log_level = quill::LogLevel::Info;
    std::optional<uint64_t> payout_gap = std::nullopt;
    std::optional<std::string> minimum_stake = std::nullopt;
    std::optional<std::string> owner = std::nullopt;
    bool strict = false;

    CLI::App cli{"stake_sim"};
    cli.add_option("scenario", scenario_path, "JSON scenario to run")
        ->required()
        ->check(CLI::ExistingFile);
    cli.add_option("--payout-gap", payout_gap, "Override the payout gap");
    cli.add_option(
        "--minimum-stake", minimum_stake, "Override the minimum stake");
    cli.add_option("--owner", owner, "Override the ledger owner");
    cli.add_option("--log-level", log_level, "Level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));
    cli.add_flag(
        "--strict", strict, "Exit with status 2 if any operation failed");

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

    auto loaded = load_scenario(scenario_path);
    if (loaded.has_error()) {
        LOG_ERROR(
            "could not load {}: {}",
            scenario_path.string(),
            loaded.assume_error().message().c_str());
        quill::flush();
        return 1;
    }
    Scenario scenario = std::move(loaded).assume_value();

    if (payout_gap.has_value()) {
        if (payout_gap.value() == 0) {
            LOG_ERROR("--payout-gap must be non-zero");
            quill::flush();
            return 1;
        }
        scenario.config.payout_gap = payout_gap.value();
    }
    if (minimum_stake.has_value()) {
        auto const res = parse_amount(minimum_stake.value());
        if (res.has_error()) {
            quill::flush();
            return 1;
        }
        scenario.config.minimum_stake = res.assume_value();
    }
    if (owner.has_value()) {
        auto const res = parse_address(owner.value());
        if (res.has_error()) {
            quill::flush();
            return 1;
        }
        scenario.config.owner = res.assume_value();
    }

    fmt::println(
        "Running {} operations with owner={} payout_gap={} minimum_stake={}",
        scenario.operations.size(),
        scenario.config.owner,
        scenario.config.payout_gap,
        scenario.config.minimum_stake);

    auto const report = run_scenario(scenario);
    quill::flush();
    print_report(report);

    if (strict && report.failures() != 0) {
        return 2;
    }
    return 0;
}
