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

#include <stakeledger/core/fmt/address_fmt.hpp> // NOLINT
#include <stakeledger/core/fmt/int_fmt.hpp> // NOLINT
#include <stakeledger/core/likely.h>
#include <stakeledger/sim/scenario.hpp>
#include <stakeledger/sim/scenario_error.hpp>
#include <stakeledger/state/fmt/log_fmt.hpp>
#include <stakeledger/state/state.hpp>
#include <stakeledger/staking/in_memory_token_gateway.hpp>

#include <boost/outcome/try.hpp>

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>

#include <intx/intx.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

#include <ankerl/unordered_dense.h>

#include <algorithm>
#include <cstring>
#include <fstream>
#include <iterator>
#include <stdexcept>

STAKELEDGER_ANONYMOUS_NAMESPACE_BEGIN

struct EventSignature
{
    bytes32_t topic;
    char const *name;
};

constexpr EventSignature EVENT_SIGNATURES[] = {
    {0xebedb8b3c678666e7f36970bc8f57abf6d8fa2e828c0da91ea5b75bf68ed101a_bytes32,
     "Stake"},
    {0x47cee97cb7acd717b3c0aa1435d004cd5b3c8c57d70dbceb4e4458bbd60e39d4_bytes32,
     "Claim"},
    {0x85082129d87b2fe11527cb1b3b7a520aeb5aa6913f88a3d8757fe40d1db02fdd_bytes32,
     "Unstake"},
    {0x884edad9ce6fa2440d8a54cc123490eb96d2768479d49ff9c7366125a9424364_bytes32,
     "Withdraw"},
    {0xdc4a0b2dc1fa27da98de2ac6f8fa373b4be405e1bf69fc3976597b6d56b79abc_bytes32,
     "MinimumStakeChanged"},
};

std::optional<OperationKind> parse_operation_kind(std::string_view const op)
{
    for (auto const kind :
         {OperationKind::Stake,
          OperationKind::Claim,
          OperationKind::Unstake,
          OperationKind::Withdraw,
          OperationKind::SetMinimumStake}) {
        if (op == to_string(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

Result<nlohmann::json const *>
require_field(nlohmann::json const &object, char const *const field)
{
    auto const it = object.find(field);
    if (STAKELEDGER_UNLIKELY(it == object.end())) {
        LOG_ERROR("scenario: missing field \"{}\"", field);
        return ScenarioError::MissingField;
    }
    return &*it;
}

Result<Address>
address_field(nlohmann::json const &value, char const *const field)
{
    if (STAKELEDGER_UNLIKELY(!value.is_string())) {
        LOG_ERROR("scenario: \"{}\" must be a hex string", field);
        return ScenarioError::InvalidAddress;
    }
    return parse_address(value.get<std::string>());
}

Result<uint256_t>
amount_field(nlohmann::json const &value, char const *const field)
{
    if (value.is_number_unsigned()) {
        return uint256_t{value.get<uint64_t>()};
    }
    if (STAKELEDGER_UNLIKELY(!value.is_string())) {
        LOG_ERROR(
            "scenario: \"{}\" must be an unsigned integer or a string", field);
        return ScenarioError::InvalidAmount;
    }
    return parse_amount(value.get<std::string>());
}

Result<uint64_t>
block_field(nlohmann::json const &value, char const *const field)
{
    if (STAKELEDGER_UNLIKELY(!value.is_number_unsigned())) {
        LOG_ERROR("scenario: \"{}\" must be an unsigned integer", field);
        return ScenarioError::InvalidAmount;
    }
    return value.get<uint64_t>();
}

Result<LedgerConfig> parse_config(nlohmann::json const &doc)
{
    BOOST_OUTCOME_TRY(auto const config, require_field(doc, "config"));
    if (STAKELEDGER_UNLIKELY(!config->is_object())) {
        LOG_ERROR("scenario: \"config\" must be an object");
        return ScenarioError::MalformedDocument;
    }

    LedgerConfig result{};

    BOOST_OUTCOME_TRY(auto const owner, require_field(*config, "owner"));
    BOOST_OUTCOME_TRY(result.owner, address_field(*owner, "owner"));

    BOOST_OUTCOME_TRY(auto const gap, require_field(*config, "payout_gap"));
    BOOST_OUTCOME_TRY(result.payout_gap, block_field(*gap, "payout_gap"));
    if (STAKELEDGER_UNLIKELY(result.payout_gap == 0)) {
        LOG_ERROR("scenario: \"payout_gap\" must be non-zero");
        return ScenarioError::InvalidAmount;
    }

    if (auto const it = config->find("minimum_stake"); it != config->end()) {
        BOOST_OUTCOME_TRY(
            result.minimum_stake, amount_field(*it, "minimum_stake"));
    }

    return result;
}

Result<Operation> parse_operation(nlohmann::json const &value)
{
    if (STAKELEDGER_UNLIKELY(!value.is_object())) {
        LOG_ERROR("scenario: every operation must be an object");
        return ScenarioError::MalformedDocument;
    }

    BOOST_OUTCOME_TRY(auto const op, require_field(value, "op"));
    if (STAKELEDGER_UNLIKELY(!op->is_string())) {
        LOG_ERROR("scenario: \"op\" must be a string");
        return ScenarioError::UnknownOperation;
    }
    auto const kind = parse_operation_kind(op->get<std::string>());
    if (STAKELEDGER_UNLIKELY(!kind.has_value())) {
        LOG_ERROR("scenario: unknown operation \"{}\"", op->get<std::string>());
        return ScenarioError::UnknownOperation;
    }

    Operation result{.kind = kind.value()};

    BOOST_OUTCOME_TRY(auto const account, require_field(value, "account"));
    BOOST_OUTCOME_TRY(result.account, address_field(*account, "account"));

    bool const needs_block = result.kind == OperationKind::Stake ||
                             result.kind == OperationKind::Claim ||
                             result.kind == OperationKind::Unstake;
    if (needs_block) {
        BOOST_OUTCOME_TRY(auto const block, require_field(value, "block"));
        BOOST_OUTCOME_TRY(result.block, block_field(*block, "block"));
    }
    else if (auto const it = value.find("block"); it != value.end()) {
        BOOST_OUTCOME_TRY(result.block, block_field(*it, "block"));
    }

    bool const needs_amount = result.kind == OperationKind::Stake ||
                              result.kind == OperationKind::SetMinimumStake;
    if (needs_amount) {
        BOOST_OUTCOME_TRY(auto const amount, require_field(value, "amount"));
        BOOST_OUTCOME_TRY(result.amount, amount_field(*amount, "amount"));
    }

    return result;
}

void record_outcome(StepReport &step, Result<void> const &res)
{
    if (res.has_error()) {
        step.error = res.assume_error().message().c_str();
    }
}

void record_outcome(StepReport &step, Result<uint256_t> const &res)
{
    if (res.has_error()) {
        step.error = res.assume_error().message().c_str();
        return;
    }
    step.amount = res.assume_value();
}

STAKELEDGER_ANONYMOUS_NAMESPACE_END

STAKELEDGER_NAMESPACE_BEGIN

char const *to_string(OperationKind const kind)
{
    switch (kind) {
    case OperationKind::Stake:
        return "stake";
    case OperationKind::Claim:
        return "claim";
    case OperationKind::Unstake:
        return "unstake";
    case OperationKind::Withdraw:
        return "withdraw";
    case OperationKind::SetMinimumStake:
        return "set_minimum_stake";
    }
    return "unknown";
}

size_t ScenarioReport::failures() const
{
    return static_cast<size_t>(
        std::ranges::count_if(steps, [](StepReport const &step) {
            return step.error.has_value();
        }));
}

Result<Address> parse_address(std::string_view const hex)
{
    if (STAKELEDGER_UNLIKELY(!hex.starts_with("0x") || hex.size() == 2)) {
        LOG_ERROR("scenario: address \"{}\" is not 0x-prefixed hex", hex);
        return ScenarioError::InvalidAddress;
    }
    auto const address = evmc::from_hex<Address>(hex);
    if (STAKELEDGER_UNLIKELY(!address.has_value())) {
        LOG_ERROR("scenario: invalid address \"{}\"", hex);
        return ScenarioError::InvalidAddress;
    }
    return address.value();
}

Result<uint256_t> parse_amount(std::string_view const text)
{
    if (STAKELEDGER_UNLIKELY(text.empty())) {
        LOG_ERROR("scenario: empty amount");
        return ScenarioError::InvalidAmount;
    }
    try {
        return intx::from_string<uint256_t>(std::string{text});
    }
    catch (std::invalid_argument const &) {
        LOG_ERROR("scenario: amount \"{}\" is not a number", text);
    }
    catch (std::out_of_range const &) {
        LOG_ERROR("scenario: amount \"{}\" does not fit 256 bits", text);
    }
    return ScenarioError::InvalidAmount;
}

Result<Scenario> parse_scenario(nlohmann::json const &doc)
{
    if (STAKELEDGER_UNLIKELY(!doc.is_object())) {
        LOG_ERROR("scenario: document must be an object");
        return ScenarioError::MalformedDocument;
    }

    Scenario scenario{};
    BOOST_OUTCOME_TRY(scenario.config, parse_config(doc));

    if (auto const it = doc.find("custody"); it != doc.end()) {
        BOOST_OUTCOME_TRY(scenario.custody, address_field(*it, "custody"));
    }

    if (auto const it = doc.find("balances"); it != doc.end()) {
        if (STAKELEDGER_UNLIKELY(!it->is_object())) {
            LOG_ERROR("scenario: \"balances\" must be an object");
            return ScenarioError::MalformedDocument;
        }
        for (auto const &item : it->items()) {
            BOOST_OUTCOME_TRY(auto const account, parse_address(item.key()));
            BOOST_OUTCOME_TRY(
                auto const amount, amount_field(item.value(), "balances"));
            scenario.balances.emplace_back(account, amount);
        }
    }

    BOOST_OUTCOME_TRY(auto const operations, require_field(doc, "operations"));
    if (STAKELEDGER_UNLIKELY(!operations->is_array())) {
        LOG_ERROR("scenario: \"operations\" must be an array");
        return ScenarioError::MalformedDocument;
    }
    for (auto const &value : *operations) {
        BOOST_OUTCOME_TRY(auto const operation, parse_operation(value));
        scenario.operations.push_back(operation);
    }

    return scenario;
}

Result<Scenario> load_scenario(std::filesystem::path const &path)
{
    std::ifstream in{path};
    if (STAKELEDGER_UNLIKELY(!in)) {
        LOG_ERROR("scenario: cannot open {}", path.string());
        return ScenarioError::MalformedDocument;
    }
    auto const doc = nlohmann::json::parse(in, nullptr, false);
    if (STAKELEDGER_UNLIKELY(doc.is_discarded())) {
        LOG_ERROR("scenario: {} is not valid JSON", path.string());
        return ScenarioError::MalformedDocument;
    }
    return parse_scenario(doc);
}

ScenarioReport run_scenario(Scenario const &scenario)
{
    State state{};
    InMemoryTokenGateway gateway{scenario.custody};

    std::vector<Address> accounts{};
    ankerl::unordered_dense::set<Address> seen{};
    auto const track = [&](Address const &account) {
        if (account != scenario.custody && seen.insert(account).second) {
            accounts.push_back(account);
        }
    };

    track(scenario.config.owner);
    for (auto const &[account, amount] : scenario.balances) {
        gateway.mint(account, amount);
        track(account);
    }

    StakingLedger ledger{
        state, STAKING_LEDGER_ADDRESS, gateway, scenario.config};

    ScenarioReport report{};
    for (auto const &operation : scenario.operations) {
        track(operation.account);

        StepReport step{.operation = operation};
        size_t const log_count = state.logs().size();

        switch (operation.kind) {
        case OperationKind::Stake:
            record_outcome(
                step,
                ledger.stake(
                    operation.account, operation.amount, operation.block));
            if (!step.error.has_value()) {
                step.amount = operation.amount;
            }
            break;
        case OperationKind::Claim:
            record_outcome(
                step, ledger.claim(operation.account, operation.block));
            break;
        case OperationKind::Unstake:
            record_outcome(
                step, ledger.unstake(operation.account, operation.block));
            break;
        case OperationKind::Withdraw:
            record_outcome(step, ledger.withdraw(operation.account));
            break;
        case OperationKind::SetMinimumStake:
            record_outcome(
                step,
                ledger.set_minimum_stake(operation.account, operation.amount));
            if (!step.error.has_value()) {
                step.amount = operation.amount;
            }
            break;
        }

        auto const &logs = state.logs();
        step.events.assign(
            logs.begin() + static_cast<std::ptrdiff_t>(log_count), logs.end());
        report.steps.push_back(std::move(step));
    }

    for (auto const &account : accounts) {
        report.accounts.push_back(AccountReport{
            .account = account,
            .stake = ledger.get_stake(account),
            .pending = ledger.pending_withdrawal(account),
            .wallet = gateway.balance_of(account)});
    }
    report.total_staked = ledger.total_staked();
    report.total_pending = ledger.total_pending();
    report.custody_balance = gateway.balance_of(scenario.custody);
    return report;
}

std::string describe_event(Log const &log)
{
    if (log.topics.empty()) {
        return fmt::format("{}", log);
    }
    auto const it = std::ranges::find_if(
        EVENT_SIGNATURES, [&log](EventSignature const &signature) {
            return signature.topic == log.topics.front();
        });
    if (it == std::end(EVENT_SIGNATURES) || log.data.size() % 32 != 0) {
        return fmt::format("{}", log);
    }

    std::vector<std::string> args{};
    for (size_t i = 1; i < log.topics.size(); ++i) {
        Address account{};
        std::memcpy(
            account.bytes,
            log.topics[i].bytes + sizeof(bytes32_t) - sizeof(Address),
            sizeof(Address));
        args.push_back(fmt::format("{}", account));
    }
    for (size_t offset = 0; offset < log.data.size(); offset += 32) {
        args.push_back(intx::to_string(
            intx::be::unsafe::load<uint256_t>(log.data.data() + offset)));
    }
    return fmt::format("{}({})", it->name, fmt::join(args, ", "));
}

STAKELEDGER_NAMESPACE_END
