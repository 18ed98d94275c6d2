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

#include <stakeledger/core/assert.h>
#include <stakeledger/core/fmt/address_fmt.hpp> // NOLINT
#include <stakeledger/core/fmt/int_fmt.hpp> // NOLINT
#include <stakeledger/core/likely.h>
#include <stakeledger/state/abi_encode.hpp>
#include <stakeledger/state/events.hpp>
#include <stakeledger/state/state.hpp>
#include <stakeledger/staking/reentrancy_guard.hpp>
#include <stakeledger/staking/reward_accrual.hpp>
#include <stakeledger/staking/stake_error.hpp>
#include <stakeledger/staking/staking_ledger.hpp>
#include <stakeledger/staking/token_gateway.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

STAKELEDGER_NAMESPACE_BEGIN

StakingLedger::StakingLedger(
    State &state, Address const &ca, TokenGateway &gateway,
    LedgerConfig const &config)
    : state_{state}
    , ca_{ca}
    , gateway_{gateway}
    , pool_{state, ca}
    , vars{state, ca}
{
    STAKELEDGER_ASSERT(config.payout_gap != 0);

    auto const persisted = vars.config.load_checked();
    if (!persisted.has_value()) {
        vars.config.store(Config{
            .minimum_stake = config.minimum_stake,
            .payout_gap = config.payout_gap,
            .owner = config.owner});
        LOG_INFO(
            "StakingLedger {}: initialized with owner={} payout_gap={} "
            "minimum_stake={}",
            ca_,
            config.owner,
            config.payout_gap,
            config.minimum_stake);
        return;
    }

    if (persisted->owner != config.owner ||
        persisted->payout_gap.native() != config.payout_gap) {
        LOG_WARNING(
            "StakingLedger {}: ignoring supplied owner={} payout_gap={}, "
            "using persisted owner={} payout_gap={}",
            ca_,
            config.owner,
            config.payout_gap,
            persisted->owner,
            persisted->payout_gap.native());
    }
}

/////////////
// Events //
/////////////
void StakingLedger::emit_stake_event(
    Address const &account, uint256_t const &amount)
{
    constexpr bytes32_t signature{
        0xebedb8b3c678666e7f36970bc8f57abf6d8fa2e828c0da91ea5b75bf68ed101a_bytes32};
    EventBuilder builder(ca_, signature);
    auto const event = builder.add_topic(abi_encode_address(account))
                           .add_data(abi_encode_uint(u256_be{amount}))
                           .build();
    state_.store_log(event);
}

void StakingLedger::emit_claim_event(
    Address const &account, uint256_t const &amount)
{
    constexpr bytes32_t signature{
        0x47cee97cb7acd717b3c0aa1435d004cd5b3c8c57d70dbceb4e4458bbd60e39d4_bytes32};
    EventBuilder builder(ca_, signature);
    auto const event = builder.add_topic(abi_encode_address(account))
                           .add_data(abi_encode_uint(u256_be{amount}))
                           .build();
    state_.store_log(event);
}

void StakingLedger::emit_unstake_event(
    Address const &account, uint256_t const &amount)
{
    constexpr bytes32_t signature{
        0x85082129d87b2fe11527cb1b3b7a520aeb5aa6913f88a3d8757fe40d1db02fdd_bytes32};
    EventBuilder builder(ca_, signature);
    auto const event = builder.add_topic(abi_encode_address(account))
                           .add_data(abi_encode_uint(u256_be{amount}))
                           .build();
    state_.store_log(event);
}

void StakingLedger::emit_minimum_stake_changed_event(
    uint256_t const &old_value, uint256_t const &new_value)
{
    constexpr bytes32_t signature{
        0xdc4a0b2dc1fa27da98de2ac6f8fa373b4be405e1bf69fc3976597b6d56b79abc_bytes32};
    EventBuilder builder(ca_, signature);
    auto const event = builder.add_data(abi_encode_uint(u256_be{old_value}))
                           .add_data(abi_encode_uint(u256_be{new_value}))
                           .build();
    state_.store_log(event);
}

//////////////
// Helpers //
//////////////

Result<void>
StakingLedger::check_not_entered(char const *op, Address const &sender) const
{
    if (STAKELEDGER_UNLIKELY(entered_)) {
        LOG_WARNING(
            "StakingLedger {}: refused reentrant {} from {}", ca_, op, sender);
        return StakeError::ReentrantCall;
    }
    return outcome::success();
}

// Moves the stake's claimable reward into the withdrawal pool and returns it.
// The record is updated in place but not stored.
uint256_t StakingLedger::settle_rewards(
    Address const &account, UserStake &stake, uint64_t const block_number)
{
    uint256_t const reward =
        stakeledger::claimable(stake, block_number, payout_gap());
    if (reward == 0) {
        return 0;
    }
    stake.claimed = stake.claimed.native() + reward;
    pool_.credit(account, reward);
    emit_claim_event(account, reward);
    return reward;
}

Result<void> StakingLedger::stake_(
    Address const &sender, uint256_t const &amount,
    uint64_t const block_number)
{
    auto user_stake = vars.user_stake(sender);
    if (STAKELEDGER_UNLIKELY(user_stake.load().active)) {
        return StakeError::AlreadyStaked;
    }
    if (STAKELEDGER_UNLIKELY(amount == 0 || amount < minimum_stake())) {
        return StakeError::InvalidAmount;
    }

    user_stake.store(UserStake{
        .stake_amount = amount,
        .stake_start_block = block_number,
        .claimed = uint256_t{0},
        .active = true});
    vars.total_staked.store(total_staked() + amount);

    // external call strictly after the record is written
    auto const res = gateway_.deposit(sender, amount);
    if (STAKELEDGER_UNLIKELY(res.has_error())) {
        LOG_WARNING(
            "StakingLedger {}: deposit of {} from {} failed: {}",
            ca_,
            amount,
            sender,
            res.assume_error().message().c_str());
        return StakeError::TransferFailed;
    }

    emit_stake_event(sender, amount);
    return outcome::success();
}

Result<uint256_t>
StakingLedger::claim_(Address const &sender, uint64_t const block_number)
{
    auto user_stake = vars.user_stake(sender);
    auto stake = user_stake.load();
    if (STAKELEDGER_UNLIKELY(!stake.active)) {
        return StakeError::NoActiveStake;
    }

    uint256_t const reward = settle_rewards(sender, stake, block_number);
    if (STAKELEDGER_UNLIKELY(reward == 0)) {
        return StakeError::NothingToClaim;
    }
    user_stake.store(stake);
    return reward;
}

Result<uint256_t>
StakingLedger::unstake_(Address const &sender, uint64_t const block_number)
{
    auto user_stake = vars.user_stake(sender);
    auto stake = user_stake.load();
    if (STAKELEDGER_UNLIKELY(!stake.active)) {
        return StakeError::NoActiveStake;
    }

    // zero claimable is not an error here
    settle_rewards(sender, stake, block_number);

    uint256_t const principal = stake.stake_amount.native();
    STAKELEDGER_ASSERT(principal != 0);
    pool_.credit(sender, principal);

    user_stake.clear();
    uint256_t const staked = total_staked();
    STAKELEDGER_ASSERT(staked >= principal);
    vars.total_staked.store(staked - principal);

    emit_unstake_event(sender, principal);
    return principal;
}

Result<void> StakingLedger::set_minimum_stake_(
    Address const &sender, uint256_t const &amount)
{
    auto config = vars.config.load();
    if (STAKELEDGER_UNLIKELY(sender != config.owner)) {
        return StakeError::Unauthorized;
    }

    uint256_t const old_value = config.minimum_stake.native();
    config.minimum_stake = amount;
    vars.config.store(config);

    emit_minimum_stake_changed_event(old_value, amount);
    return outcome::success();
}

////////////////
// Operations //
////////////////

Result<void> StakingLedger::stake(
    Address const &sender, uint256_t const &amount,
    uint64_t const block_number)
{
    BOOST_OUTCOME_TRY(check_not_entered("stake", sender));
    ReentrancyGuard const guard{entered_};
    Checkpoint checkpoint{state_};

    BOOST_OUTCOME_TRY(stake_(sender, amount, block_number));

    checkpoint.commit();
    LOG_DEBUG(
        "StakingLedger {}: {} staked {} at block {}",
        ca_,
        sender,
        amount,
        block_number);
    return outcome::success();
}

Result<uint256_t>
StakingLedger::claim(Address const &sender, uint64_t const block_number)
{
    BOOST_OUTCOME_TRY(check_not_entered("claim", sender));
    ReentrancyGuard const guard{entered_};
    Checkpoint checkpoint{state_};

    BOOST_OUTCOME_TRY(auto const reward, claim_(sender, block_number));

    checkpoint.commit();
    LOG_DEBUG(
        "StakingLedger {}: {} claimed {} at block {}",
        ca_,
        sender,
        reward,
        block_number);
    return reward;
}

Result<uint256_t>
StakingLedger::unstake(Address const &sender, uint64_t const block_number)
{
    BOOST_OUTCOME_TRY(check_not_entered("unstake", sender));
    ReentrancyGuard const guard{entered_};
    Checkpoint checkpoint{state_};

    BOOST_OUTCOME_TRY(auto const principal, unstake_(sender, block_number));

    checkpoint.commit();
    LOG_DEBUG(
        "StakingLedger {}: {} unstaked {} at block {}",
        ca_,
        sender,
        principal,
        block_number);
    return principal;
}

Result<uint256_t> StakingLedger::withdraw(Address const &sender)
{
    BOOST_OUTCOME_TRY(check_not_entered("withdraw", sender));
    ReentrancyGuard const guard{entered_};

    BOOST_OUTCOME_TRY(auto const amount, pool_.withdraw(sender, gateway_));

    LOG_DEBUG("StakingLedger {}: {} withdrew {}", ca_, sender, amount);
    return amount;
}

Result<void> StakingLedger::set_minimum_stake(
    Address const &sender, uint256_t const &amount)
{
    BOOST_OUTCOME_TRY(check_not_entered("set_minimum_stake", sender));
    ReentrancyGuard const guard{entered_};
    Checkpoint checkpoint{state_};

    BOOST_OUTCOME_TRY(set_minimum_stake_(sender, amount));

    checkpoint.commit();
    LOG_DEBUG("StakingLedger {}: minimum stake set to {}", ca_, amount);
    return outcome::success();
}

///////////
// Views //
///////////

UserStake StakingLedger::get_stake(Address const &account) const
{
    return vars.user_stake(account).load();
}

uint256_t StakingLedger::earned(
    Address const &account, uint64_t const block_number) const
{
    return stakeledger::earned(get_stake(account), block_number, payout_gap());
}

uint256_t StakingLedger::claimable(
    Address const &account, uint64_t const block_number) const
{
    return stakeledger::claimable(
        get_stake(account), block_number, payout_gap());
}

uint256_t StakingLedger::pending_withdrawal(Address const &account) const
{
    return pool_.pending(account);
}

uint256_t StakingLedger::total_staked() const
{
    return vars.total_staked.load().native();
}

uint256_t StakingLedger::total_pending() const
{
    return pool_.total_pending();
}

uint256_t StakingLedger::minimum_stake() const
{
    return vars.config.load().minimum_stake.native();
}

uint64_t StakingLedger::payout_gap() const
{
    return vars.config.load().payout_gap.native();
}

Address StakingLedger::owner() const
{
    return vars.config.load().owner;
}

STAKELEDGER_NAMESPACE_END
