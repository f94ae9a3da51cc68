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

#include <testeth/exec/raw_outcome.hpp>
#include <testeth/normalize/execution_result.hpp>
#include <testeth/normalize/output_normalizer.hpp>
#include <testeth/normalize/unparsable_output.hpp>
#include <testeth/registry/tool_entry.hpp>
#include <testeth/vector/test_case.hpp>

#include <evmc/evmc.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

using namespace testeth;
using namespace evmc::literals;
using namespace std::chrono_literals;

namespace
{
    constexpr auto addr_aa = 0x00000000000000000000000000000000000000aa_address;
    constexpr auto addr_bb = 0x00000000000000000000000000000000000000bb_address;

    ToolEntry const json_tool{
        .name = "A", .path = "/bin/true", .args = {}, .dialect = Dialect::Json};
    ToolEntry const geth_tool{
        .name = "G", .path = "/bin/true", .args = {}, .dialect = Dialect::Geth};

    RawOutcome raw_with(std::string out, std::string err = {}, int exit_code = 0)
    {
        RawOutcome raw;
        raw.stdout_text = std::move(out);
        raw.stderr_text = std::move(err);
        raw.exit_code = exit_code;
        raw.duration = 5ms;
        return raw;
    }

    constexpr char const *GETH_OUTPUT = R"(#### TRACE ####
some trace line
{
  "root": "0x0000000000000000000000000000000000000000000000000000000000000000",
  "accounts": {
    "0x00000000000000000000000000000000000000aa": {
      "balance": "100",
      "nonce": 1,
      "root": "0x56e81f171bcc55a6ff8345e692c0f86e5b48e01b996cadc001622fb5e363b421",
      "codeHash": "0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470",
      "code": "0x6001",
      "storage": {
        "0x0000000000000000000000000000000000000000000000000000000000000001": "0x02"
      }
    }
  }
}
EVM gas used:    21003
execution time:  1.5ms
)";
}

TEST(JsonDialect, parses_post_gas_and_logs)
{
    OutputNormalizer const normalizer;
    auto const result = normalizer.normalize(
        json_tool,
        raw_with(R"({"post": {"0xaa": {"balance": "0x64", "nonce": "0x00"}},
                     "gasUsed": "0x5208",
                     "logs": [{"address": "0xbb", "topics": [], "data": "0x"}]})",
                 "warning\n"));
    ASSERT_EQ(result.post_state.size(), 1);
    EXPECT_EQ(result.post_state.at(addr_aa).balance, 100);
    EXPECT_EQ(result.resource_used, 21000);
    ASSERT_TRUE(result.logs.has_value());
    ASSERT_EQ(result.logs->size(), 1);
    EXPECT_EQ(result.logs->at(0).address, addr_bb);
    EXPECT_EQ(result.raw_duration, 5ms);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stderr_text, "warning\n");
    EXPECT_FALSE(result.reported_duration.has_value());
}

TEST(JsonDialect, logs_absent_means_none_emitted)
{
    OutputNormalizer const normalizer;
    auto const result = normalizer.normalize(
        json_tool, raw_with(R"({"post": {}, "gasUsed": 7})"));
    EXPECT_TRUE(result.post_state.empty());
    EXPECT_EQ(result.resource_used, 7);
    ASSERT_TRUE(result.logs.has_value());
    EXPECT_TRUE(result.logs->empty());
}

TEST(JsonDialect, unparsable)
{
    OutputNormalizer const normalizer;
    for (auto const *const out :
         {"", "not json", "{}", R"({"post": []})",
          R"({"post": {"0xaa": {"nonce": "1"}}})"}) {
        try {
            (void)normalizer.normalize(json_tool, raw_with(out));
            ADD_FAILURE() << "accepted: " << out;
        }
        catch (UnparsableOutput const &e) {
            EXPECT_EQ(e.tool_name(), "A");
            EXPECT_EQ(e.raw(), out);
        }
    }
}

TEST(JsonDialect, no_per_test_args)
{
    OutputNormalizer const normalizer;
    EXPECT_TRUE(normalizer.per_test_args(json_tool, TestCase{}).empty());
}

TEST(GethDialect, per_test_args)
{
    OutputNormalizer const normalizer;
    TestCase test;
    test.code = {0x60, 0x01};
    test.input = {0xab};
    test.gas = 100000;
    EXPECT_EQ(
        normalizer.per_test_args(geth_tool, test),
        (std::vector<std::string>{
            "--code",
            "6001",
            "--input",
            "ab",
            "--gas",
            "100000",
            "--dump",
            "--statdump",
            "run"}));
}

TEST(GethDialect, parses_dump_surrounded_by_noise)
{
    OutputNormalizer const normalizer;
    auto const result = normalizer.normalize(geth_tool, raw_with(GETH_OUTPUT));
    ASSERT_EQ(result.post_state.size(), 1);
    auto const &account = result.post_state.at(addr_aa);
    EXPECT_EQ(account.balance, 100);
    EXPECT_EQ(account.nonce, 1);
    EXPECT_EQ(account.code, (byte_string{0x60, 0x01}));
    EXPECT_EQ(account.storage.size(), 1);
    EXPECT_EQ(result.resource_used, 21003);
    ASSERT_TRUE(result.reported_duration.has_value());
    EXPECT_EQ(*result.reported_duration, 1500us);
    EXPECT_FALSE(result.logs.has_value());
}

TEST(GethDialect, statistics_on_stderr)
{
    OutputNormalizer const normalizer;
    auto const result = normalizer.normalize(
        geth_tool,
        raw_with(
            R"({"root": "0x", "accounts": {}})",
            "EVM gas used:    3\nvm took 812ns\n"));
    EXPECT_TRUE(result.post_state.empty());
    EXPECT_EQ(result.resource_used, 3);
    ASSERT_TRUE(result.reported_duration.has_value());
    EXPECT_EQ(*result.reported_duration, 812ns);
}

TEST(GethDialect, unparsable)
{
    OutputNormalizer const normalizer;
    EXPECT_THROW(
        (void)normalizer.normalize(geth_tool, raw_with("no dump here\n")),
        UnparsableOutput);
    EXPECT_THROW(
        (void)normalizer.normalize(
            geth_tool, raw_with(R"({"root": "0x", "other": {}})")),
        UnparsableOutput);
    EXPECT_THROW(
        (void)normalizer.normalize(
            geth_tool,
            raw_with(R"({"accounts": {}})", "EVM gas used: lots\n")),
        UnparsableOutput);
}
