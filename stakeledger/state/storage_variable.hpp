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
#include <stakeledger/state/state.hpp>

#include <intx/intx.hpp>

#include <cstddef>
#include <optional>
#include <type_traits>

STAKELEDGER_NAMESPACE_BEGIN

// Typed view of sizeof(T) bytes of an account's storage, laid out over
// consecutive 32 byte slots starting at the key.
template <typename T>
    requires std::is_trivially_copyable_v<T>
class StorageVariable
{
public:
    static constexpr size_t N =
        (sizeof(T) + sizeof(bytes32_t) - 1) / sizeof(bytes32_t);

    struct Adapter
    {
        union
        {
            struct
            {
                bytes32_t raw[N];

                constexpr bytes32_t &operator[](size_t const i) noexcept
                {
                    return raw[i];
                }

                constexpr bytes32_t const &
                operator[](size_t const i) const noexcept
                {
                    return raw[i];
                }

            } slots;

            T typed;
        };

        Adapter()
            : slots{}
        {
        }

        Adapter(T const &t)
            : slots{}
        {
            typed = t;
        }
    };

private:
    State &state_;
    Address const &address_;
    uint256_t const offset_;

    void store_(Adapter const &adapter)
    {
        for (size_t i = 0; i < N; ++i) {
            state_.set_storage(
                address_,
                intx::be::store<bytes32_t>(offset_ + i),
                adapter.slots[i]);
        }
    }

public:
    StorageVariable(State &state, Address const &address, bytes32_t key)
        : state_{state}
        , address_{address}
        , offset_{intx::be::load<uint256_t>(key)}
    {
    }

    T load() const noexcept
    {
        Adapter value;
        for (size_t i = 0; i < N; ++i) {
            value.slots[i] = state_.get_storage(
                address_, intx::be::store<bytes32_t>(offset_ + i));
        }
        return value.typed;
    }

    std::optional<T> load_checked() const noexcept
    {
        Adapter value;
        bool has_data = false;
        for (size_t i = 0; i < N; ++i) {
            value.slots[i] = state_.get_storage(
                address_, intx::be::store<bytes32_t>(offset_ + i));
            has_data |= (value.slots[i] != bytes32_t{});
        }
        return has_data ? value.typed : std::optional<T>{};
    }

    void store(T const &value)
    {
        Adapter adapter(value);
        store_(adapter);
    }

    T clear()
    {
        Adapter adapter{};
        auto const res = load();
        store_(adapter);
        return res;
    }
};

STAKELEDGER_NAMESPACE_END
