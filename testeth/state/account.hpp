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

#include <testeth/core/address.hpp>
#include <testeth/core/byte_string.hpp>
#include <testeth/core/bytes.hpp>
#include <testeth/core/config.hpp>
#include <testeth/core/int.hpp>

#include <cstdint>
#include <map>
#include <vector>

TESTETH_NAMESPACE_BEGIN

struct Account
{
    uint256_t balance{0};
    uint64_t nonce{0};
    byte_string code{};
    // zero-valued slots are never stored
    std::map<bytes32_t, bytes32_t> storage{};

    friend bool operator==(Account const &, Account const &) = default;
};

using State = std::map<Address, Account>;

struct LogEntry
{
    Address address{};
    std::vector<bytes32_t> topics{};
    byte_string data{};

    friend bool operator==(LogEntry const &, LogEntry const &) = default;
};

bool operator<(LogEntry const &, LogEntry const &);

TESTETH_NAMESPACE_END
