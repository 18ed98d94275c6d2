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

#pragma once

#include <stakeledger/core/address.hpp>
#include <stakeledger/core/config.hpp>
#include <stakeledger/core/int.hpp>
#include <stakeledger/core/result.hpp>
#include <stakeledger/state/log.hpp>
#include <stakeledger/staking/constants.hpp>
#include <stakeledger/staking/staking_ledger.hpp>
#include <stakeledger/staking/user_stake.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

STAKELEDGER_NAMESPACE_BEGIN

enum class OperationKind : uint8_t
{
    Stake,
    Claim,
    Unstake,
    Withdraw,
    SetMinimumStake,
};

char const *to_string(OperationKind);

struct Operation
{
    OperationKind kind;
    Address account{};
    uint64_t block{0};
    uint256_t amount{0};
};

struct Scenario
{
    LedgerConfig config{};
    Address custody{STAKING_LEDGER_ADDRESS};
    std::vector<std::pair<Address, uint256_t>> balances{};
    std::vector<Operation> operations{};
};

struct StepReport
{
    Operation operation;
    std::optional<std::string> error{};
    uint256_t amount{0};
    std::vector<Log> events{};
};

struct AccountReport
{
    Address account;
    UserStake stake;
    uint256_t pending;
    uint256_t wallet;
};

struct ScenarioReport
{
    std::vector<StepReport> steps{};
    std::vector<AccountReport> accounts{};
    uint256_t total_staked{0};
    uint256_t total_pending{0};
    uint256_t custody_balance{0};

    size_t failures() const;
};

// 0x-prefixed hex, at most 20 bytes
Result<Address> parse_address(std::string_view);

// decimal or 0x-prefixed hex
Result<uint256_t> parse_amount(std::string_view);

Result<Scenario> parse_scenario(nlohmann::json const &);
Result<Scenario> load_scenario(std::filesystem::path const &);

// Runs every operation in order against a fresh ledger backed by an
// in-memory gateway. Failed operations are recorded and do not stop the run.
ScenarioReport run_scenario(Scenario const &);

// Human readable rendering of a ledger event, e.g. "Stake(0x..., 100)".
std::string describe_event(Log const &);

STAKELEDGER_NAMESPACE_END
