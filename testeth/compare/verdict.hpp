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
#include <testeth/core/config.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

TESTETH_NAMESPACE_BEGIN

struct Pass
{
    friend bool operator==(Pass const &, Pass const &) = default;
};

/// First divergence between the expected and the actual outcome
struct Mismatch
{
    std::optional<Address> address;
    // "balance", "nonce", "code", "storage[<slot>]", "account", "logs[<i>]..."
    std::string field;
    std::string expected;
    std::string actual;
    std::string details;

    friend bool operator==(Mismatch const &, Mismatch const &) = default;
};

struct ToolError
{
    int exit_code{0};
    std::string stderr_text;

    friend bool operator==(ToolError const &, ToolError const &) = default;
};

struct Timeout
{
    friend bool operator==(Timeout const &, Timeout const &) = default;
};

struct LoadError
{
    std::string reason;

    friend bool operator==(LoadError const &, LoadError const &) = default;
};

using Verdict = std::variant<Pass, Mismatch, ToolError, Timeout, LoadError>;

enum class VerdictKind
{
    Pass,
    Mismatch,
    ToolError,
    Timeout,
    LoadError,
};

inline VerdictKind kind(Verdict const &verdict) noexcept
{
    return static_cast<VerdictKind>(verdict.index());
}

inline bool is_pass(Verdict const &verdict) noexcept
{
    return std::holds_alternative<Pass>(verdict);
}

std::string_view to_string(VerdictKind);

/// One line summary, e.g. "mismatch: 0x..aa balance: expected 100, actual 99"
std::string describe(Verdict const &);

TESTETH_NAMESPACE_END
