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

#include <stakeledger/core/basic_formatter.hpp>
#include <stakeledger/core/fmt/address_fmt.hpp>
#include <stakeledger/core/fmt/bytes_fmt.hpp>
#include <stakeledger/state/log.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>
#include <quill/bundled/fmt/ranges.h>

#include <cstddef>
#include <span>

template <>
struct quill::copy_loggable<stakeledger::Log> : std::true_type
{
};

template <>
struct fmt::formatter<stakeledger::Log> : public stakeledger::BasicFormatter
{
    template <typename FormatContext>
    auto format(stakeledger::Log const &log, FormatContext &ctx) const
    {
        fmt::format_to(
            ctx.out(),
            "Log{{"
            "Address={} "
            "Topics={} "
            "Data=0x{:02x}"
            "}}",
            log.address,
            log.topics,
            fmt::join(std::as_bytes(std::span(log.data)), ""));
        return ctx.out();
    }
};
