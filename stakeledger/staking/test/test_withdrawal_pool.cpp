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
#include <stakeledger/core/int.hpp>
#include <stakeledger/state/state.hpp>
#include <stakeledger/staking/constants.hpp>
#include <stakeledger/staking/stake_error.hpp>
#include <stakeledger/staking/withdrawal_pool.hpp>

#include "test_util.hpp"

#include <gtest/gtest.h>

using namespace stakeledger;
using namespace stakeledger::test;

struct Pool : public ::testing::Test
{
    static constexpr auto ALICE{
        0xa11ce00000000000000000000000000000000001_address};
    static constexpr auto BOB{
        0xb0b0000000000000000000000000000000000002_address};

    State state{};
    MockTokenGateway gateway{};
    WithdrawalPool pool{state, STAKING_LEDGER_ADDRESS};
};

TEST_F(Pool, credit_accumulates)
{
    EXPECT_EQ(pool.pending(ALICE), 0);
    pool.credit(ALICE, 2);
    pool.credit(ALICE, 100);
    pool.credit(BOB, 7);
    EXPECT_EQ(pool.pending(ALICE), 102);
    EXPECT_EQ(pool.pending(BOB), 7);
    EXPECT_EQ(pool.total_pending(), 109);
}

TEST_F(Pool, withdraw_pays_and_zeroes)
{
    pool.credit(ALICE, 102);
    pool.credit(BOB, 5);

    auto const res = pool.withdraw(ALICE, gateway);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value(), 102);
    EXPECT_EQ(pool.pending(ALICE), 0);
    EXPECT_EQ(pool.pending(BOB), 5);
    EXPECT_EQ(pool.total_pending(), 5);

    ASSERT_EQ(gateway.calls.size(), 1);
    EXPECT_EQ(
        gateway.calls[0],
        (MockTokenGateway::Call{
            .kind = MockTokenGateway::Kind::Payout,
            .account = ALICE,
            .amount = 102}));

    ASSERT_EQ(state.logs().size(), 1);
    EXPECT_EQ(state.logs()[0].address, STAKING_LEDGER_ADDRESS);
    EXPECT_EQ(
        state.logs()[0].topics[0],
        0x884edad9ce6fa2440d8a54cc123490eb96d2768479d49ff9c7366125a9424364_bytes32);
}

TEST_F(Pool, withdraw_empty)
{
    EXPECT_TRUE(has_error(
        pool.withdraw(ALICE, gateway), StakeError::EmptyWithdrawPool));
    EXPECT_TRUE(gateway.calls.empty());

    pool.credit(ALICE, 3);
    ASSERT_FALSE(pool.withdraw(ALICE, gateway).has_error());
    EXPECT_TRUE(has_error(
        pool.withdraw(ALICE, gateway), StakeError::EmptyWithdrawPool));
    EXPECT_EQ(gateway.calls.size(), 1);
}

TEST_F(Pool, balance_zeroed_before_payout)
{
    pool.credit(ALICE, 10);
    uint256_t seen_pending = 1;
    uint256_t seen_total = 1;
    gateway.on_payout = [&] {
        seen_pending = pool.pending(ALICE);
        seen_total = pool.total_pending();
    };

    ASSERT_FALSE(pool.withdraw(ALICE, gateway).has_error());
    EXPECT_EQ(seen_pending, 0);
    EXPECT_EQ(seen_total, 0);
}

TEST_F(Pool, failed_payout_rolls_back)
{
    pool.credit(ALICE, 10);
    gateway.fail_payout = true;

    EXPECT_TRUE(
        has_error(pool.withdraw(ALICE, gateway), StakeError::TransferFailed));
    EXPECT_EQ(pool.pending(ALICE), 10);
    EXPECT_EQ(pool.total_pending(), 10);
    EXPECT_TRUE(state.logs().empty());
    EXPECT_EQ(state.depth(), 0);

    gateway.fail_payout = false;
    auto const res = pool.withdraw(ALICE, gateway);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value(), 10);
}
