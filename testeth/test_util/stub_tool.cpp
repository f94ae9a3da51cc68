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

#include <testeth/test_util/stub_tool.hpp>

#include <testeth/core/assert.h>
#include <testeth/core/basic_formatter.hpp>
#include <testeth/core/config.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

TESTETH_NAMESPACE_BEGIN

namespace test
{
    StubToolDir::StubToolDir()
    {
        auto templ =
            (std::filesystem::temp_directory_path() / "testeth_XXXXXX")
                .string();
        TESTETH_ASSERT(::mkdtemp(templ.data()) != nullptr);
        dir_ = templ;
    }

    StubToolDir::~StubToolDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path StubToolDir::write_script(
        std::string_view const name, std::string_view const body) const
    {
        auto const file = write_file(name, fmt::format("#!/bin/sh\n{}\n", body));
        std::filesystem::permissions(
            file,
            std::filesystem::perms::owner_all |
                std::filesystem::perms::group_read |
                std::filesystem::perms::group_exec);
        return file;
    }

    std::filesystem::path StubToolDir::write_printer(
        std::string_view const name, std::string_view const stdout_text) const
    {
        auto const payload = write_file(fmt::format("{}.out", name), stdout_text);
        return write_script(
            name, fmt::format("cat > /dev/null\ncat '{}'", payload.string()));
    }

    std::filesystem::path StubToolDir::write_file(
        std::string_view const name, std::string_view const contents) const
    {
        auto const file = dir_ / name;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream out{file, std::ios::binary | std::ios::trunc};
        out << contents;
        out.close();
        TESTETH_ASSERT(out.good());
        return file;
    }

    std::string single_account_state(
        std::string_view const address, std::string_view const balance)
    {
        return fmt::format(
            R"({{"{}": {{"balance": "{}", "nonce": "0x00", "code": "0x", )"
            R"("storage": {{}}}}}})",
            address,
            balance);
    }

    std::string single_account_vector(
        std::string_view const name, std::string_view const balance)
    {
        auto const state = single_account_state("0xaa", balance);
        return fmt::format(
            R"({{"{}": {{"pre": {}, "exec": {{"address": "0xaa", )"
            R"("code": "0x6001", "data": "0x", "gas": "0x0186a0"}}, )"
            R"("post": {}}}}})",
            name,
            state,
            state);
    }
}

TESTETH_NAMESPACE_END
