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
#include <stakeledger/staking/constants.hpp>
#include <stakeledger/staking/stake_error.hpp>
#include <stakeledger/staking/token_gateway.hpp>
#include <stakeledger/staking/withdrawal_pool.hpp>

#include <boost/outcome/success_failure.hpp>

#include <quill/Quill.h>

#include <bit>

STAKELEDGER_NAMESPACE_BEGIN

WithdrawalPool::WithdrawalPool(State &state, Address const &ca)
    : state_{state}
    , ca_{ca}
{
}

StorageVariable<u256_be>
WithdrawalPool::balance_of(Address const &account) const noexcept
{
    struct
    {
        uint8_t mask;
        Address address;
        uint8_t slots[11];
    } key{.mask = PrefixWithdrawalPool, .address = account, .slots = {}};

    return StorageVariable<u256_be>{state_, ca_, std::bit_cast<bytes32_t>(key)};
}

StorageVariable<u256_be> WithdrawalPool::total() const noexcept
{
    return StorageVariable<u256_be>{state_, ca_, AddressTotalPending};
}

void WithdrawalPool::emit_withdraw_event(
    Address const &account, uint256_t const &amount)
{
    constexpr bytes32_t signature{
        0x884edad9ce6fa2440d8a54cc123490eb96d2768479d49ff9c7366125a9424364_bytes32};
    auto const event = EventBuilder(ca_, signature)
                           .add_topic(abi_encode_address(account))
                           .add_data(abi_encode_uint(u256_be{amount}))
                           .build();
    state_.store_log(event);
}

uint256_t WithdrawalPool::pending(Address const &account) const
{
    return balance_of(account).load().native();
}

uint256_t WithdrawalPool::total_pending() const
{
    return total().load().native();
}

void WithdrawalPool::credit(Address const &account, uint256_t const &amount)
{
    STAKELEDGER_ASSERT(amount != 0);

    auto balance = balance_of(account);
    balance.store(balance.load().native() + amount);

    auto sum = total();
    sum.store(sum.load().native() + amount);
}

Result<uint256_t>
WithdrawalPool::withdraw(Address const &account, TokenGateway &gateway)
{
    Checkpoint checkpoint{state_};

    uint256_t const amount = balance_of(account).clear().native();
    if (STAKELEDGER_UNLIKELY(amount == 0)) {
        return StakeError::EmptyWithdrawPool;
    }

    auto sum = total();
    uint256_t const total_pending = sum.load().native();
    STAKELEDGER_ASSERT(total_pending >= amount);
    sum.store(total_pending - amount);

    // external call strictly after the balance is zeroed
    auto const res = gateway.payout(account, amount);
    if (STAKELEDGER_UNLIKELY(res.has_error())) {
        LOG_WARNING(
            "WithdrawalPool: payout of {} to {} failed: {}",
            amount,
            account,
            res.assume_error().message().c_str());
        return StakeError::TransferFailed;
    }

    emit_withdraw_event(account, amount);
    checkpoint.commit();
    return amount;
}

STAKELEDGER_NAMESPACE_END
