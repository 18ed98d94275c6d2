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
#include <stakeledger/state/log.hpp>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <vector>

STAKELEDGER_NAMESPACE_BEGIN

// Key-value state the ledger runs on: (account, slot) -> 32 byte word, plus an
// append-only event log. Absent slots read as zero and storing zero erases the
// slot. Every mutation made after push() is journaled so that pop_reject() can
// restore the slots and the log to their value at the matching push().
class State
{
    using StorageMap = ankerl::unordered_dense::map<bytes32_t, bytes32_t>;

    struct JournalEntry
    {
        Address address;
        bytes32_t key;
        bytes32_t original;
    };

    struct Frame
    {
        std::vector<JournalEntry> journal;
        size_t log_count;
    };

    ankerl::unordered_dense::map<Address, StorageMap> storage_{};
    std::vector<Log> logs_{};
    std::vector<Frame> frames_{};

    void write_(Address const &, bytes32_t const &key, bytes32_t const &value);

public:
    bytes32_t get_storage(Address const &, bytes32_t const &key) const;
    void set_storage(
        Address const &, bytes32_t const &key, bytes32_t const &value);

    // number of non-zero slots held for an account
    size_t storage_size(Address const &) const;

    void store_log(Log const &);
    std::vector<Log> const &logs() const noexcept;

    ////////////////
    // Checkpoints //
    ////////////////
    void push();
    void pop_accept();
    void pop_reject();
    size_t depth() const noexcept;
};

// Scoped checkpoint: rejected on destruction unless committed.
class Checkpoint
{
    State &state_;
    bool committed_{false};

public:
    explicit Checkpoint(State &);
    Checkpoint(Checkpoint const &) = delete;
    Checkpoint &operator=(Checkpoint const &) = delete;
    ~Checkpoint();

    void commit();
};

STAKELEDGER_NAMESPACE_END
