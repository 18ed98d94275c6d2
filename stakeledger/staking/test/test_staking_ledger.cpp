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

#include <stakeledger/core/address.hpp>
#include <stakeledger/core/bytes.hpp>
#include <stakeledger/core/int.hpp>
#include <stakeledger/state/abi_encode.hpp>
#include <stakeledger/state/big_endian.hpp>
#include <stakeledger/state/events.hpp>
#include <stakeledger/state/log.hpp>
#include <stakeledger/state/state.hpp>
#include <stakeledger/staking/constants.hpp>
#include <stakeledger/staking/stake_error.hpp>
#include <stakeledger/staking/staking_ledger.hpp>

#include "test_util.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>

using namespace stakeledger;
using namespace stakeledger::test;

namespace
{
    constexpr auto STAKE_SIGNATURE{
        0xebedb8b3c678666e7f36970bc8f57abf6d8fa2e828c0da91ea5b75bf68ed101a_bytes32};
    constexpr auto CLAIM_SIGNATURE{
        0x47cee97cb7acd717b3c0aa1435d004cd5b3c8c57d70dbceb4e4458bbd60e39d4_bytes32};
    constexpr auto UNSTAKE_SIGNATURE{
        0x85082129d87b2fe11527cb1b3b7a520aeb5aa6913f88a3d8757fe40d1db02fdd_bytes32};
    constexpr auto WITHDRAW_SIGNATURE{
        0x884edad9ce6fa2440d8a54cc123490eb96d2768479d49ff9c7366125a9424364_bytes32};
    constexpr auto MINIMUM_STAKE_CHANGED_SIGNATURE{
        0xdc4a0b2dc1fa27da98de2ac6f8fa373b4be405e1bf69fc3976597b6d56b79abc_bytes32};

    Log account_event(
        bytes32_t const &signature, Address const &account,
        uint256_t const &amount)
    {
        return EventBuilder(STAKING_LEDGER_ADDRESS, signature)
            .add_topic(abi_encode_address(account))
            .add_data(abi_encode_uint(u256_be{amount}))
            .build();
    }
}

struct Ledger : public ::testing::Test
{
    static constexpr auto OWNER{
        0x0000000000000000000000000000000000000e0e_address};
    static constexpr auto ALICE{
        0xa11ce00000000000000000000000000000000001_address};
    static constexpr auto BOB{
        0xb0b0000000000000000000000000000000000002_address};

    State state{};
    MockTokenGateway gateway{};
    StakingLedger ledger{
        state,
        STAKING_LEDGER_ADDRESS,
        gateway,
        LedgerConfig{.owner = OWNER, .payout_gap = 10, .minimum_stake = 50}};

    void check_inactive(Address const &account)
    {
        auto const stake = ledger.get_stake(account);
        EXPECT_FALSE(stake.active);
        EXPECT_EQ(stake.stake_amount.native(), 0);
        EXPECT_EQ(stake.stake_start_block.native(), 0);
        EXPECT_EQ(stake.claimed.native(), 0);
    }
};

TEST_F(Ledger, configuration)
{
    EXPECT_EQ(ledger.owner(), OWNER);
    EXPECT_EQ(ledger.payout_gap(), 10);
    EXPECT_EQ(ledger.minimum_stake(), 50);
    EXPECT_EQ(ledger.total_staked(), 0);
    EXPECT_EQ(ledger.total_pending(), 0);
    EXPECT_TRUE(state.logs().empty());
}

TEST_F(Ledger, persisted_configuration_wins)
{
    ASSERT_FALSE(ledger.set_minimum_stake(OWNER, 70).has_error());

    StakingLedger reopened{
        state,
        STAKING_LEDGER_ADDRESS,
        gateway,
        LedgerConfig{.owner = BOB, .payout_gap = 3, .minimum_stake = 1}};
    EXPECT_EQ(reopened.owner(), OWNER);
    EXPECT_EQ(reopened.payout_gap(), 10);
    EXPECT_EQ(reopened.minimum_stake(), 70);
}

TEST_F(Ledger, stake)
{
    ASSERT_FALSE(ledger.stake(ALICE, 100, 5).has_error());

    auto const stake = ledger.get_stake(ALICE);
    EXPECT_TRUE(stake.active);
    EXPECT_EQ(stake.stake_amount.native(), 100);
    EXPECT_EQ(stake.stake_start_block.native(), 5);
    EXPECT_EQ(stake.claimed.native(), 0);
    EXPECT_EQ(ledger.total_staked(), 100);
    check_inactive(BOB);

    ASSERT_EQ(gateway.calls.size(), 1);
    EXPECT_EQ(
        gateway.calls[0],
        (MockTokenGateway::Call{
            .kind = MockTokenGateway::Kind::Deposit,
            .account = ALICE,
            .amount = 100}));

    ASSERT_EQ(state.logs().size(), 1);
    EXPECT_EQ(state.logs()[0], account_event(STAKE_SIGNATURE, ALICE, 100));
}

TEST_F(Ledger, stake_below_minimum)
{
    EXPECT_TRUE(
        has_error(ledger.stake(ALICE, 49, 0), StakeError::InvalidAmount));
    EXPECT_TRUE(
        has_error(ledger.stake(ALICE, 0, 0), StakeError::InvalidAmount));
    check_inactive(ALICE);
    EXPECT_EQ(ledger.total_staked(), 0);
    EXPECT_TRUE(gateway.calls.empty());
    EXPECT_TRUE(state.logs().empty());

    EXPECT_FALSE(ledger.stake(ALICE, 50, 0).has_error());
}

TEST_F(Ledger, stake_zero_with_zero_minimum)
{
    ASSERT_FALSE(ledger.set_minimum_stake(OWNER, 0).has_error());
    EXPECT_TRUE(
        has_error(ledger.stake(ALICE, 0, 0), StakeError::InvalidAmount));
    EXPECT_FALSE(ledger.stake(ALICE, 1, 0).has_error());
}

TEST_F(Ledger, stake_twice)
{
    ASSERT_FALSE(ledger.stake(ALICE, 100, 0).has_error());
    EXPECT_TRUE(
        has_error(ledger.stake(ALICE, 200, 3), StakeError::AlreadyStaked));

    auto const stake = ledger.get_stake(ALICE);
    EXPECT_EQ(stake.stake_amount.native(), 100);
    EXPECT_EQ(stake.stake_start_block.native(), 0);
    EXPECT_EQ(ledger.total_staked(), 100);
    EXPECT_EQ(gateway.calls.size(), 1);
    EXPECT_EQ(state.logs().size(), 1);
}

TEST_F(Ledger, stake_deposit_fails)
{
    gateway.fail_deposit = true;
    EXPECT_TRUE(
        has_error(ledger.stake(ALICE, 100, 0), StakeError::TransferFailed));
    check_inactive(ALICE);
    EXPECT_EQ(ledger.total_staked(), 0);
    EXPECT_TRUE(state.logs().empty());
    EXPECT_EQ(state.depth(), 0);
    EXPECT_EQ(gateway.calls.size(), 1);
}

TEST_F(Ledger, record_written_before_deposit)
{
    bool active_during_deposit = false;
    gateway.on_deposit = [&] {
        active_during_deposit = ledger.get_stake(ALICE).active;
    };
    ASSERT_FALSE(ledger.stake(ALICE, 100, 0).has_error());
    EXPECT_TRUE(active_during_deposit);
}

TEST_F(Ledger, earned_schedule)
{
    ASSERT_FALSE(ledger.stake(ALICE, 100, 0).has_error());
    EXPECT_EQ(ledger.earned(ALICE, 10), 0);
    EXPECT_EQ(ledger.earned(ALICE, 11), 1);
    EXPECT_EQ(ledger.earned(ALICE, 19), 1);
    EXPECT_EQ(ledger.earned(ALICE, 20), 2);
    EXPECT_EQ(ledger.earned(ALICE, 21), 2);
    EXPECT_EQ(ledger.claimable(ALICE, 21), 2);
    EXPECT_EQ(ledger.earned(BOB, 21), 0);
}

TEST_F(Ledger, claim)
{
    ASSERT_FALSE(ledger.stake(ALICE, 100, 0).has_error());

    auto const res = ledger.claim(ALICE, 21);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value(), 2);
    EXPECT_EQ(ledger.pending_withdrawal(ALICE), 2);
    EXPECT_EQ(ledger.total_pending(), 2);
    EXPECT_EQ(ledger.get_stake(ALICE).claimed.native(), 2);
    EXPECT_EQ(ledger.get_stake(ALICE).stake_amount.native(), 100);
    EXPECT_EQ(ledger.claimable(ALICE, 21), 0);

    ASSERT_EQ(state.logs().size(), 2);
    EXPECT_EQ(state.logs()[1], account_event(CLAIM_SIGNATURE, ALICE, 2));

    EXPECT_TRUE(has_error(ledger.claim(ALICE, 21), StakeError::NothingToClaim));
    EXPECT_EQ(ledger.pending_withdrawal(ALICE), 2);
    EXPECT_EQ(state.logs().size(), 2);

    // the next whole gap
    auto const later = ledger.claim(ALICE, 30);
    ASSERT_FALSE(later.has_error());
    EXPECT_EQ(later.value(), 1);
    EXPECT_EQ(ledger.pending_withdrawal(ALICE), 3);
    EXPECT_EQ(ledger.get_stake(ALICE).claimed.native(), 3);
}

TEST_F(Ledger, claim_errors)
{
    EXPECT_TRUE(has_error(ledger.claim(ALICE, 100), StakeError::NoActiveStake));

    ASSERT_FALSE(ledger.stake(ALICE, 100, 0).has_error());
    EXPECT_TRUE(has_error(ledger.claim(ALICE, 10), StakeError::NothingToClaim));
    EXPECT_EQ(ledger.pending_withdrawal(ALICE), 0);
    EXPECT_EQ(ledger.get_stake(ALICE).claimed.native(), 0);
}

TEST_F(Ledger, unstake_after_claim)
{
    ASSERT_FALSE(ledger.stake(ALICE, 100, 0).has_error());
    ASSERT_FALSE(ledger.claim(ALICE, 21).has_error());

    auto const res = ledger.unstake(ALICE, 21);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value(), 100);
    EXPECT_EQ(ledger.pending_withdrawal(ALICE), 102);
    EXPECT_EQ(ledger.total_pending(), 102);
    EXPECT_EQ(ledger.total_staked(), 0);
    check_inactive(ALICE);

    // nothing left to claim, so only the unstake is recorded
    ASSERT_EQ(state.logs().size(), 3);
    EXPECT_EQ(state.logs()[2], account_event(UNSTAKE_SIGNATURE, ALICE, 100));

    // unstake never moves tokens
    EXPECT_EQ(gateway.calls.size(), 1);
}

TEST_F(Ledger, unstake_settles_rewards)
{
    ASSERT_FALSE(ledger.stake(ALICE, 100, 0).has_error());

    auto const res = ledger.unstake(ALICE, 35);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value(), 100);
    EXPECT_EQ(ledger.pending_withdrawal(ALICE), 103);
    check_inactive(ALICE);

    ASSERT_EQ(state.logs().size(), 3);
    EXPECT_EQ(state.logs()[1], account_event(CLAIM_SIGNATURE, ALICE, 3));
    EXPECT_EQ(state.logs()[2], account_event(UNSTAKE_SIGNATURE, ALICE, 100));
}

TEST_F(Ledger, unstake_errors)
{
    EXPECT_TRUE(has_error(ledger.unstake(ALICE, 5), StakeError::NoActiveStake));

    ASSERT_FALSE(ledger.stake(ALICE, 100, 0).has_error());
    ASSERT_FALSE(ledger.unstake(ALICE, 5).has_error());
    EXPECT_TRUE(has_error(ledger.unstake(ALICE, 6), StakeError::NoActiveStake));
    EXPECT_EQ(ledger.pending_withdrawal(ALICE), 100);
}

TEST_F(Ledger, withdraw)
{
    ASSERT_FALSE(ledger.stake(ALICE, 100, 0).has_error());
    ASSERT_FALSE(ledger.claim(ALICE, 21).has_error());
    ASSERT_FALSE(ledger.unstake(ALICE, 21).has_error());

    auto const res = ledger.withdraw(ALICE);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value(), 102);
    EXPECT_EQ(ledger.pending_withdrawal(ALICE), 0);
    EXPECT_EQ(ledger.total_pending(), 0);

    ASSERT_EQ(gateway.calls.size(), 2);
    EXPECT_EQ(
        gateway.calls[1],
        (MockTokenGateway::Call{
            .kind = MockTokenGateway::Kind::Payout,
            .account = ALICE,
            .amount = 102}));
    EXPECT_EQ(
        state.logs().back(), account_event(WITHDRAW_SIGNATURE, ALICE, 102));

    EXPECT_TRUE(
        has_error(ledger.withdraw(ALICE), StakeError::EmptyWithdrawPool));
    EXPECT_EQ(gateway.calls.size(), 2);
}

TEST_F(Ledger, withdraw_with_active_stake)
{
    ASSERT_FALSE(ledger.stake(ALICE, 100, 0).has_error());
    ASSERT_FALSE(ledger.claim(ALICE, 25).has_error());

    auto const res = ledger.withdraw(ALICE);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value(), 2);
    EXPECT_TRUE(ledger.get_stake(ALICE).active);
    EXPECT_EQ(ledger.get_stake(ALICE).claimed.native(), 2);
    EXPECT_EQ(ledger.claimable(ALICE, 25), 0);
}

TEST_F(Ledger, withdraw_payout_fails)
{
    ASSERT_FALSE(ledger.stake(ALICE, 100, 0).has_error());
    ASSERT_FALSE(ledger.unstake(ALICE, 1).has_error());
    auto const logs = state.logs().size();

    gateway.fail_payout = true;
    EXPECT_TRUE(has_error(ledger.withdraw(ALICE), StakeError::TransferFailed));
    EXPECT_EQ(ledger.pending_withdrawal(ALICE), 100);
    EXPECT_EQ(ledger.total_pending(), 100);
    EXPECT_EQ(state.logs().size(), logs);

    gateway.fail_payout = false;
    EXPECT_FALSE(ledger.withdraw(ALICE).has_error());
}

TEST_F(Ledger, restake)
{
    ASSERT_FALSE(ledger.stake(ALICE, 100, 0).has_error());
    ASSERT_FALSE(ledger.claim(ALICE, 21).has_error());
    ASSERT_FALSE(ledger.unstake(ALICE, 21).has_error());

    ASSERT_FALSE(ledger.stake(ALICE, 60, 40).has_error());
    auto const stake = ledger.get_stake(ALICE);
    EXPECT_TRUE(stake.active);
    EXPECT_EQ(stake.stake_amount.native(), 60);
    EXPECT_EQ(stake.stake_start_block.native(), 40);
    EXPECT_EQ(stake.claimed.native(), 0);
    EXPECT_EQ(ledger.earned(ALICE, 50), 0);
    EXPECT_EQ(ledger.earned(ALICE, 51), 1);
    EXPECT_EQ(ledger.total_staked(), 60);
    EXPECT_EQ(ledger.pending_withdrawal(ALICE), 102);
}

TEST_F(Ledger, accounts_are_independent)
{
    ASSERT_FALSE(ledger.stake(ALICE, 100, 0).has_error());
    ASSERT_FALSE(ledger.stake(BOB, 70, 5).has_error());
    EXPECT_EQ(ledger.total_staked(), 170);

    ASSERT_FALSE(ledger.unstake(ALICE, 21).has_error());
    EXPECT_EQ(ledger.pending_withdrawal(ALICE), 102);
    EXPECT_EQ(ledger.pending_withdrawal(BOB), 0);
    EXPECT_TRUE(ledger.get_stake(BOB).active);
    EXPECT_EQ(ledger.total_staked(), 70);
    EXPECT_EQ(ledger.claimable(BOB, 21), 1);
}

TEST_F(Ledger, set_minimum_stake)
{
    EXPECT_TRUE(has_error(
        ledger.set_minimum_stake(ALICE, 10), StakeError::Unauthorized));
    EXPECT_EQ(ledger.minimum_stake(), 50);
    EXPECT_TRUE(state.logs().empty());

    ASSERT_FALSE(ledger.set_minimum_stake(OWNER, 80).has_error());
    EXPECT_EQ(ledger.minimum_stake(), 80);
    EXPECT_EQ(ledger.owner(), OWNER);
    EXPECT_EQ(ledger.payout_gap(), 10);

    ASSERT_EQ(state.logs().size(), 1);
    EXPECT_EQ(
        state.logs()[0],
        EventBuilder(STAKING_LEDGER_ADDRESS, MINIMUM_STAKE_CHANGED_SIGNATURE)
            .add_data(abi_encode_uint(u256_be{50}))
            .add_data(abi_encode_uint(u256_be{80}))
            .build());
}

TEST_F(Ledger, minimum_stake_not_retroactive)
{
    ASSERT_FALSE(ledger.stake(ALICE, 60, 0).has_error());
    ASSERT_FALSE(ledger.set_minimum_stake(OWNER, 100).has_error());

    EXPECT_TRUE(ledger.get_stake(ALICE).active);
    EXPECT_EQ(ledger.get_stake(ALICE).stake_amount.native(), 60);
    EXPECT_FALSE(ledger.claim(ALICE, 21).has_error());

    EXPECT_TRUE(has_error(ledger.stake(BOB, 60, 0), StakeError::InvalidAmount));
    EXPECT_FALSE(ledger.stake(BOB, 100, 0).has_error());
}

TEST_F(Ledger, reentrant_withdraw_refused)
{
    ASSERT_FALSE(ledger.stake(ALICE, 100, 0).has_error());
    ASSERT_FALSE(ledger.unstake(ALICE, 5).has_error());

    bool refused = false;
    uint256_t pending_during_payout = 1;
    gateway.on_payout = [&] {
        pending_during_payout = ledger.pending_withdrawal(ALICE);
        refused = has_error(ledger.withdraw(ALICE), StakeError::ReentrantCall);
    };

    auto const res = ledger.withdraw(ALICE);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value(), 100);
    EXPECT_TRUE(refused);
    EXPECT_EQ(pending_during_payout, 0);

    // exactly one payout
    size_t payouts = 0;
    for (auto const &call : gateway.calls) {
        payouts += call.kind == MockTokenGateway::Kind::Payout;
    }
    EXPECT_EQ(payouts, 1);
    EXPECT_EQ(ledger.pending_withdrawal(ALICE), 0);
}

TEST_F(Ledger, reentrant_calls_during_deposit_refused)
{
    ASSERT_FALSE(ledger.stake(BOB, 100, 0).has_error());

    bool stake_refused = false;
    bool claim_refused = false;
    bool unstake_refused = false;
    bool admin_refused = false;
    gateway.on_deposit = [&] {
        stake_refused =
            has_error(ledger.stake(ALICE, 100, 0), StakeError::ReentrantCall);
        claim_refused =
            has_error(ledger.claim(BOB, 50), StakeError::ReentrantCall);
        unstake_refused =
            has_error(ledger.unstake(BOB, 50), StakeError::ReentrantCall);
        admin_refused = has_error(
            ledger.set_minimum_stake(OWNER, 1), StakeError::ReentrantCall);
    };

    ASSERT_FALSE(ledger.stake(ALICE, 100, 3).has_error());
    EXPECT_TRUE(stake_refused);
    EXPECT_TRUE(claim_refused);
    EXPECT_TRUE(unstake_refused);
    EXPECT_TRUE(admin_refused);

    EXPECT_EQ(ledger.get_stake(ALICE).stake_start_block.native(), 3);
    EXPECT_TRUE(ledger.get_stake(BOB).active);
    EXPECT_EQ(ledger.pending_withdrawal(BOB), 0);
    EXPECT_EQ(ledger.minimum_stake(), 50);
}

TEST_F(Ledger, guard_released_after_failure)
{
    gateway.fail_deposit = true;
    EXPECT_TRUE(
        has_error(ledger.stake(ALICE, 100, 0), StakeError::TransferFailed));
    gateway.fail_deposit = false;
    EXPECT_FALSE(ledger.stake(ALICE, 100, 0).has_error());
}
