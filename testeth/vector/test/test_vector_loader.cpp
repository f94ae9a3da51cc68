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
#include <testeth/vector/loader_error.hpp>
#include <testeth/vector/test_case.hpp>
#include <testeth/vector/test_vector_loader.hpp>

#include <evmc/evmc.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>
#include <string>

using namespace testeth;
using namespace testeth::test;
using namespace evmc::literals;

namespace
{
    constexpr auto addr_aa = 0x00000000000000000000000000000000000000aa_address;

    constexpr char const *FULL_VECTOR = R"({
        "t1": {
            "pre": {"0xaa": {"balance": "0x64", "nonce": "0x00",
                             "code": "0x", "storage": {}}},
            "exec": {"address": "0xaa", "code": "0x6001", "data": "0x0102",
                     "gas": "0x0186a0"},
            "post": {"0xaa": {"balance": "0x64", "nonce": "0x01",
                              "code": "0x", "storage": {"0x01": "0x02"}}},
            "logs": [{"address": "0xaa", "topics": ["0x01"], "data": "0x"}]
        }
    })";

    struct TestVectorLoaderTest : public ::testing::Test
    {
        StubToolDir dir;
    };
}

TEST(TestVectorParser, full_case)
{
    std::istringstream in{FULL_VECTOR};
    auto const tests = parse_test_vectors(in, "full.json");
    ASSERT_EQ(tests.size(), 1);
    auto const &t = tests[0];
    EXPECT_EQ(t.id, "full.json@t1");
    EXPECT_EQ(t.source, "full.json");
    EXPECT_EQ(t.code, (byte_string{0x60, 0x01}));
    EXPECT_EQ(t.input, (byte_string{0x01, 0x02}));
    EXPECT_EQ(t.gas, 100000);
    ASSERT_TRUE(t.pre_state.contains(addr_aa));
    EXPECT_EQ(t.pre_state.at(addr_aa).balance, 100);
    ASSERT_TRUE(t.expected_post_state.contains(addr_aa));
    EXPECT_EQ(t.expected_post_state.at(addr_aa).nonce, 1);
    EXPECT_EQ(t.expected_post_state.at(addr_aa).storage.size(), 1);
    ASSERT_TRUE(t.expected_logs.has_value());
    ASSERT_EQ(t.expected_logs->size(), 1);
    EXPECT_EQ(t.expected_logs->at(0).address, addr_aa);
}

TEST(TestVectorParser, input_overrides_exec_data)
{
    std::istringstream in{single_account_vector("t", "0x01").insert(
        1, R"("u": {"pre": {}, "post": {}, "input": "0xff",
                    "exec": {"code": "0x", "data": "0x01", "gas": "1"}}, )")};
    auto const tests = parse_test_vectors(in, "x.json");
    ASSERT_EQ(tests.size(), 2);
    EXPECT_EQ(tests[1].id, "x.json@u");
    EXPECT_EQ(tests[1].input, byte_string{0xff});
}

TEST(TestVectorParser, legacy_logs_hash_is_ignored)
{
    std::istringstream in{R"({"t": {"pre": {}, "post": {},
        "exec": {"code": "0x", "data": "0x", "gas": "1"},
        "logs": "0x1dcc4de8dec75d7aab85b567b6ccd41ad312451b948a7413f0a142fd40d49347"}})"};
    auto const tests = parse_test_vectors(in, "x.json");
    ASSERT_EQ(tests.size(), 1);
    EXPECT_FALSE(tests[0].expected_logs.has_value());
}

TEST(TestVectorParser, malformed)
{
    auto const expect_malformed = [](std::string const &text) {
        std::istringstream in{text};
        EXPECT_THROW(parse_test_vectors(in, "bad.json"), MalformedTestVector)
            << text;
    };
    // invalid json
    expect_malformed("{");
    // not an object
    expect_malformed("[]");
    // missing post
    expect_malformed(R"({"t": {"pre": {},
        "exec": {"code": "0x", "data": "0x", "gas": "1"}}})");
    // missing exec.gas
    expect_malformed(R"({"t": {"pre": {}, "post": {},
        "exec": {"code": "0x", "data": "0x"}}})");
    // invalid address
    expect_malformed(R"({"t": {"pre": {"0xzz": {"balance": "1", "nonce": "1"}},
        "post": {}, "exec": {"code": "0x", "data": "0x", "gas": "1"}}})");
    // duplicate id within the file
    expect_malformed(R"({
        "t": {"pre": {}, "post": {}, "exec": {"code": "0x", "data": "0x", "gas": "1"}},
        "t": {"pre": {}, "post": {}, "exec": {"code": "0x", "data": "0x", "gas": "2"}}})");
}

TEST(TestVectorParser, malformed_reports_path_and_reason)
{
    std::istringstream in{R"({"t": {"pre": {}}})"};
    try {
        parse_test_vectors(in, "dir/bad.json");
        FAIL() << "expected MalformedTestVector";
    }
    catch (MalformedTestVector const &e) {
        EXPECT_EQ(e.path(), "dir/bad.json");
        EXPECT_NE(e.reason().find("post"), std::string::npos);
    }
}

TEST_F(TestVectorLoaderTest, single_file)
{
    auto const file = dir.write_file("one.json", FULL_VECTOR);
    auto const tests = load_test_vectors(file);
    ASSERT_TRUE(tests.has_value());
    ASSERT_EQ(tests.value().size(), 1);
    EXPECT_EQ(tests.value()[0].source, file);
}

TEST_F(TestVectorLoaderTest, directory_in_path_order)
{
    dir.write_file("b/2.json", single_account_vector("b2", "0x01"));
    dir.write_file("a.json", single_account_vector("a", "0x01"));
    dir.write_file("b/1.json", single_account_vector("b1", "0x01"));
    dir.write_file("b/.hidden.json", single_account_vector("hidden", "0x01"));
    dir.write_file("vmInputLimits1.json", single_account_vector("limits", "0x01"));
    dir.write_file("notes.txt", "not a vector");

    auto const tests = load_test_vectors(dir.path());
    ASSERT_TRUE(tests.has_value());
    ASSERT_EQ(tests.value().size(), 3);
    EXPECT_EQ(tests.value()[0].id, (dir.path() / "a.json").string() + "@a");
    EXPECT_EQ(tests.value()[1].id, (dir.path() / "b/1.json").string() + "@b1");
    EXPECT_EQ(tests.value()[2].id, (dir.path() / "b/2.json").string() + "@b2");
}

TEST_F(TestVectorLoaderTest, loading_is_idempotent)
{
    dir.write_file("x.json", FULL_VECTOR);
    dir.write_file("y.json", single_account_vector("y", "0x05"));
    auto const first = load_test_vectors(dir.path());
    auto const second = load_test_vectors(dir.path());
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first.value(), second.value());
}

TEST_F(TestVectorLoaderTest, malformed_file_is_skipped)
{
    dir.write_file("good.json", single_account_vector("good", "0x01"));
    auto const bad = dir.write_file("bad.json", "{\"t\": ");

    auto const report = load_test_vectors_report(dir.path());
    ASSERT_TRUE(report.has_value());
    ASSERT_EQ(report.value().cases.size(), 1);
    EXPECT_EQ(
        report.value().cases[0].id, (dir.path() / "good.json").string() + "@good");
    ASSERT_EQ(report.value().malformed.size(), 1);
    EXPECT_EQ(report.value().malformed[0].path(), bad);
}

TEST_F(TestVectorLoaderTest, same_name_in_different_files_gets_distinct_ids)
{
    auto const a = dir.write_file("a.json", single_account_vector("t", "0x01"));
    auto const b = dir.write_file("b.json", single_account_vector("t", "0x02"));
    auto const tests = load_test_vectors(dir.path());
    ASSERT_TRUE(tests.has_value());
    ASSERT_EQ(tests.value().size(), 2);
    EXPECT_EQ(tests.value()[0].id, a.string() + "@t");
    EXPECT_EQ(tests.value()[1].id, b.string() + "@t");
    EXPECT_NE(tests.value()[0].id, tests.value()[1].id);
}

TEST_F(TestVectorLoaderTest, no_test_cases_found)
{
    dir.write_file("bad.json", "[]");
    dir.write_file("empty.json", "{}");
    auto const tests = load_test_vectors(dir.path());
    ASSERT_TRUE(tests.has_error());
    EXPECT_EQ(tests.error(), LoaderError::NoTestCasesFound);

    auto const empty_dir = dir.path() / "empty";
    std::filesystem::create_directories(empty_dir);
    auto const none = load_test_vectors(empty_dir);
    ASSERT_TRUE(none.has_error());
    EXPECT_EQ(none.error(), LoaderError::NoTestCasesFound);
}

TEST_F(TestVectorLoaderTest, path_not_found)
{
    auto const tests = load_test_vectors(dir.path() / "missing");
    ASSERT_TRUE(tests.has_error());
    EXPECT_EQ(tests.error(), LoaderError::PathNotFound);
}
