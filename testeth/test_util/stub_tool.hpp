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

#include <testeth/core/config.hpp>

#include <filesystem>
#include <string>
#include <string_view>

TESTETH_NAMESPACE_BEGIN

namespace test
{
    /// Temporary directory holding shell script stand-ins for VM tools;
    /// removed with everything in it on destruction
    class StubToolDir
    {
        std::filesystem::path dir_;

    public:
        StubToolDir();
        ~StubToolDir();

        StubToolDir(StubToolDir const &) = delete;
        StubToolDir &operator=(StubToolDir const &) = delete;

        std::filesystem::path const &path() const noexcept
        {
            return dir_;
        }

        /// Writes `#!/bin/sh` followed by `body` and marks it executable
        std::filesystem::path
        write_script(std::string_view name, std::string_view body) const;

        /// Script that drains stdin and prints `stdout_text`
        std::filesystem::path
        write_printer(std::string_view name, std::string_view stdout_text) const;

        std::filesystem::path
        write_file(std::string_view name, std::string_view contents) const;
    };

    /// Single account JSON state: {"<address>": {"balance": "<balance>", ...}}
    std::string single_account_state(
        std::string_view address, std::string_view balance);

    /// Test vector file with one case `name` whose account 0xaa holds
    /// `balance` before and after
    std::string single_account_vector(
        std::string_view name, std::string_view balance);
}

TESTETH_NAMESPACE_END
