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

#include <testeth/vector/test_vector_loader.hpp>

#include <testeth/core/basic_formatter.hpp>
#include <testeth/core/config.hpp>
#include <testeth/core/result.hpp>
#include <testeth/state/from_json.hpp>
#include <testeth/state/state_json.hpp>
#include <testeth/vector/loader_error.hpp>
#include <testeth/vector/test_case.hpp>

#include <nlohmann/json.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <exception>
#include <filesystem>
#include <fstream>
#include <istream>
#include <iterator>
#include <optional>
#include <string>
#include <system_error>
#include <unordered_set>
#include <utility>
#include <vector>

TESTETH_ANONYMOUS_NAMESPACE_BEGIN

bool is_eligible_test_file(std::filesystem::path const &path)
{
    auto const filename = path.filename().string();
    // vmInputLimits vectors are stress inputs, not comparable cases
    return path.extension() == ".json" && !filename.starts_with(".") &&
           !filename.starts_with("vmInputLimits");
}

TestCase
parse_test_case(std::string const &name, nlohmann::json const &j_test)
{
    TestCase test;
    test.pre_state = state_from_json(require_field(j_test, "pre", "test"), "pre");

    auto const &j_exec = require_field(j_test, "exec", "test");
    test.code = require_field(j_exec, "code", "exec").get<byte_string>();
    test.input = require_field(j_exec, "data", "exec").get<byte_string>();
    test.gas = integer_from_json(require_field(j_exec, "gas", "exec"));
    if (auto const it = j_test.find("input"); it != j_test.end()) {
        test.input = it->get<byte_string>();
    }

    test.expected_post_state =
        state_from_json(require_field(j_test, "post", "test"), "post");

    // legacy vectors carry a logs hash instead of the entries
    if (auto const it = j_test.find("logs"); it != j_test.end() &&
                                             it->is_array()) {
        test.expected_logs = logs_from_json(*it);
    }
    return test;
}

TESTETH_ANONYMOUS_NAMESPACE_END

TESTETH_NAMESPACE_BEGIN

MalformedTestVector::MalformedTestVector(
    std::filesystem::path path, std::string reason)
    : std::runtime_error{fmt::format("{}: {}", path.string(), reason)}
    , path_{std::move(path)}
    , reason_{std::move(reason)}
{
}

std::vector<TestCase> parse_test_vectors(
    std::istream &input, std::filesystem::path const &source)
{
    std::unordered_set<std::string> seen;
    std::optional<std::string> duplicate;
    auto const detect_duplicates = [&](int const depth,
                                       nlohmann::json::parse_event_t const event,
                                       nlohmann::json &parsed) {
        if (depth == 1 && event == nlohmann::json::parse_event_t::key) {
            auto name = parsed.get<std::string>();
            if (!seen.insert(name).second && !duplicate.has_value()) {
                duplicate = std::move(name);
            }
        }
        return true;
    };

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(input, detect_duplicates);
    }
    catch (nlohmann::json::exception const &e) {
        throw MalformedTestVector{source, e.what()};
    }

    if (!j.is_object()) {
        throw MalformedTestVector{
            source, "expected an object of named test cases"};
    }
    if (duplicate.has_value()) {
        throw MalformedTestVector{
            source, fmt::format("duplicate test id '{}'", *duplicate)};
    }

    std::vector<TestCase> tests;
    tests.reserve(j.size());
    for (auto const &[name, j_test] : j.items()) {
        try {
            tests.push_back(parse_test_case(name, j_test));
        }
        catch (std::exception const &e) {
            throw MalformedTestVector{
                source, fmt::format("test '{}': {}", name, e.what())};
        }
        // the source path keeps ids unique across files
        tests.back().id = fmt::format("{}@{}", source.string(), name);
        tests.back().source = source;
    }
    return tests;
}

std::vector<TestCase> load_test_file(std::filesystem::path const &path)
{
    if (path.extension() != ".json") {
        throw MalformedTestVector{
            path,
            fmt::format(
                "unsupported test file format: {}", path.extension().string())};
    }
    std::ifstream in{path};
    if (!in) {
        throw MalformedTestVector{path, "could not open file"};
    }
    return parse_test_vectors(in, path);
}

std::vector<std::filesystem::path>
discover_test_files(std::filesystem::path const &dir)
{
    namespace fs = std::filesystem;

    std::vector<fs::path> files;
    for (auto const &entry : fs::recursive_directory_iterator{
             dir, fs::directory_options::skip_permission_denied}) {
        if (entry.is_regular_file() && is_eligible_test_file(entry.path())) {
            files.push_back(entry.path());
        }
    }
    std::ranges::sort(files);
    return files;
}

Result<LoadReport>
load_test_vectors_report(std::filesystem::path const &path)
{
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        LOG_ERROR("test vector path {} does not exist", path.string());
        return LoaderError::PathNotFound;
    }

    std::vector<fs::path> files;
    if (fs::is_directory(path, ec)) {
        files = discover_test_files(path);
    }
    else if (!path.filename().string().starts_with("vmInputLimits")) {
        files.push_back(path);
    }

    LoadReport report;
    for (auto const &file : files) {
        try {
            auto tests = load_test_file(file);
            LOG_DEBUG("loaded {} tests from {}", tests.size(), file.string());
            std::ranges::move(tests, std::back_inserter(report.cases));
        }
        catch (MalformedTestVector const &e) {
            LOG_WARNING("skipping malformed test vector {}", e.what());
            report.malformed.push_back(e);
        }
    }

    if (report.cases.empty()) {
        LOG_ERROR("no test cases found in {}", path.string());
        return LoaderError::NoTestCasesFound;
    }
    return report;
}

Result<std::vector<TestCase>>
load_test_vectors(std::filesystem::path const &path)
{
    BOOST_OUTCOME_TRY(auto report, load_test_vectors_report(path));
    return std::move(report.cases);
}

TESTETH_NAMESPACE_END
