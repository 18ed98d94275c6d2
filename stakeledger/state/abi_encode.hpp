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
#include <stakeledger/state/big_endian.hpp>

#include <algorithm>

STAKELEDGER_NAMESPACE_BEGIN

// Solidity ABI static word encodings. Every value occupies one 32 byte word,
// right aligned.

inline bytes32_t abi_encode_address(Address const &address) noexcept
{
    bytes32_t output{};
    std::copy_n(
        address.bytes,
        sizeof(Address),
        output.bytes + sizeof(bytes32_t) - sizeof(Address));
    return output;
}

template <BigEndianType T>
bytes32_t abi_encode_uint(T const &integer) noexcept
{
    static_assert(sizeof(T) <= sizeof(bytes32_t));
    bytes32_t output{};
    std::copy_n(
        integer.bytes, sizeof(T), output.bytes + sizeof(bytes32_t) - sizeof(T));
    return output;
}

STAKELEDGER_NAMESPACE_END
