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
#include <stakeledger/core/bytes.hpp>
#include <stakeledger/core/config.hpp>
#include <stakeledger/core/int.hpp>
#include <stakeledger/core/result.hpp>
#include <stakeledger/state/big_endian.hpp>
#include <stakeledger/state/storage_variable.hpp>
#include <stakeledger/staking/constants.hpp>
#include <stakeledger/staking/user_stake.hpp>
#include <stakeledger/staking/withdrawal_pool.hpp>

#include <bit>
#include <cstdint>

STAKELEDGER_NAMESPACE_BEGIN

class State;
class TokenGateway;

struct LedgerConfig
{
    Address owner;
    uint64_t payout_gap;
    uint256_t minimum_stake;
};

// Per-account staking ledger. Every mutating operation is atomic: it runs in
// a state checkpoint that is only accepted when the operation succeeds, so a
// failed call leaves no write and no event behind. Mutating operations also
// refuse to run while another one is in progress on the same ledger, which is
// only possible through a token gateway calling back in.
class StakingLedger
{
    State &state_;
    Address const &ca_;
    TokenGateway &gateway_;
    WithdrawalPool pool_;
    bool entered_{false};

public:
    StakingLedger(
        State &, Address const &, TokenGateway &, LedgerConfig const &);

    struct Config
    {
        u256_be minimum_stake;
        u64_be payout_gap;
        Address owner;
    };

    static_assert(sizeof(Config) == 60);
    static_assert(alignof(Config) == 1);
    static_assert(StorageVariable<Config>::N == 2);

    class Variables
    {
        State &state_;
        Address const &ca_;

        // Single slot constants all under prefix 0x0. Config spans two slots.
        // Slot 4 is owned by the withdrawal pool.
        static constexpr auto AddressConfig{
            0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};
        static constexpr auto AddressTotalStaked{
            0x0000000000000000000000000000000000000000000000000000000000000003_bytes32};

    public:
        explicit Variables(State &state, Address const &ca)
            : state_{state}
            , ca_{ca}
        {
        }

        StorageVariable<Config> config{state_, ca_, AddressConfig};
        StorageVariable<u256_be> total_staked{state_, ca_, AddressTotalStaked};

        // mapping (address => UserStake) user_stake
        auto user_stake(Address const &account) const noexcept
        {
            struct
            {
                uint8_t mask;
                Address address;
                uint8_t slots[11];
            } key{.mask = PrefixUserStake, .address = account, .slots = {}};

            return StorageVariable<UserStake>(
                state_, ca_, std::bit_cast<bytes32_t>(key));
        }
    } vars;

private:
    /////////////
    // Events //
    /////////////

    // event Stake(
    //     address indexed account,
    //     uint256         amount);
    void emit_stake_event(Address const &, uint256_t const &);

    // event Claim(
    //     address indexed account,
    //     uint256         amount);
    void emit_claim_event(Address const &, uint256_t const &);

    // event Unstake(
    //     address indexed account,
    //     uint256         amount);
    void emit_unstake_event(Address const &, uint256_t const &);

    // event MinimumStakeChanged(
    //     uint256         oldValue,
    //     uint256         newValue);
    void
    emit_minimum_stake_changed_event(uint256_t const &, uint256_t const &);

    /////////////
    // Helpers //
    /////////////
    Result<void> check_not_entered(char const *op, Address const &) const;
    uint256_t settle_rewards(Address const &, UserStake &, uint64_t);

    Result<void> stake_(Address const &, uint256_t const &, uint64_t);
    Result<uint256_t> claim_(Address const &, uint64_t);
    Result<uint256_t> unstake_(Address const &, uint64_t);
    Result<void> set_minimum_stake_(Address const &, uint256_t const &);

public:
    ////////////////
    // Operations //
    ////////////////
    Result<void> stake(
        Address const &sender, uint256_t const &amount, uint64_t block_number);

    // returns the reward credited to the withdrawal pool
    Result<uint256_t> claim(Address const &sender, uint64_t block_number);

    // returns the principal credited to the withdrawal pool
    Result<uint256_t> unstake(Address const &sender, uint64_t block_number);

    // returns the amount paid out
    Result<uint256_t> withdraw(Address const &sender);

    Result<void>
    set_minimum_stake(Address const &sender, uint256_t const &amount);

    ///////////
    // Views //
    ///////////
    UserStake get_stake(Address const &) const;
    uint256_t earned(Address const &, uint64_t block_number) const;
    uint256_t claimable(Address const &, uint64_t block_number) const;
    uint256_t pending_withdrawal(Address const &) const;
    uint256_t total_staked() const;
    uint256_t total_pending() const;
    uint256_t minimum_stake() const;
    uint64_t payout_gap() const;
    Address owner() const;
};

STAKELEDGER_NAMESPACE_END
