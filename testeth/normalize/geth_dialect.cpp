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

#include <testeth/normalize/dialect_parser.hpp>

#include <testeth/core/config.hpp>
#include <testeth/exec/raw_outcome.hpp>
#include <testeth/normalize/execution_result.hpp>
#include <testeth/state/state_json.hpp>
#include <testeth/vector/test_case.hpp>

#include <evmc/hex.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

TESTETH_ANONYMOUS_NAMESPACE_BEGIN

constexpr std::string_view GAS_USED_MARKER = "EVM gas used:";

constexpr std::array<std::string_view, 2> TIMING_MARKERS = {
    "execution time:", "vm took"};

std::string_view skip_spaces(std::string_view s)
{
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    return s;
}

/// Text following `marker` on the same line, if the marker occurs
std::optional<std::string_view>
find_value(std::string_view const text, std::string_view const marker)
{
    auto const pos = text.find(marker);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    auto rest = text.substr(pos + marker.size());
    rest = rest.substr(0, rest.find('\n'));
    return skip_spaces(rest);
}

std::optional<uint64_t> parse_gas_used(std::string_view const text)
{
    auto const value = find_value(text, GAS_USED_MARKER);
    if (!value) {
        return std::nullopt;
    }
    uint64_t gas{};
    auto const [ptr, ec] =
        std::from_chars(value->data(), value->data() + value->size(), gas);
    if (ec != std::errc{} || ptr == value->data()) {
        throw std::invalid_argument{
            "malformed gas used: " + std::string{*value}};
    }
    return gas;
}

/// Go duration strings: `812ns`, `12.5µs`, `1.234ms`, `2.1s`
std::optional<std::chrono::nanoseconds> parse_duration(std::string_view s)
{
    double value{};
    auto const [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr == s.data()) {
        return std::nullopt;
    }
    s.remove_prefix(static_cast<size_t>(ptr - s.data()));

    static constexpr std::array<std::pair<std::string_view, double>, 5> units =
        {{{"ns", 1.0},
          {"\xc2\xb5s", 1e3},
          {"us", 1e3},
          {"ms", 1e6},
          {"s", 1e9}}};
    for (auto const &[suffix, scale] : units) {
        if (s.starts_with(suffix)) {
            return std::chrono::nanoseconds{
                static_cast<int64_t>(value * scale)};
        }
    }
    return std::nullopt;
}

std::optional<std::chrono::nanoseconds>
parse_reported_duration(std::string_view const text)
{
    for (auto const marker : TIMING_MARKERS) {
        if (auto const value = find_value(text, marker)) {
            if (auto const d = parse_duration(*value)) {
                return d;
            }
        }
    }
    return std::nullopt;
}

/// The dump is the first line-leading JSON object that has `accounts`
nlohmann::json find_state_dump(std::string const &out)
{
    size_t pos = 0;
    while ((pos = out.find('{', pos)) != std::string::npos) {
        if (pos == 0 || out[pos - 1] == '\n') {
            std::istringstream is{out.substr(pos)};
            nlohmann::json j;
            try {
                is >> j;
                if (j.is_object() && j.contains("accounts")) {
                    return j;
                }
            }
            catch (nlohmann::json::parse_error const &) {
                // not the dump, keep scanning
            }
        }
        ++pos;
    }
    throw std::invalid_argument{"no state dump with \"accounts\" in output"};
}

TESTETH_ANONYMOUS_NAMESPACE_END

TESTETH_NAMESPACE_BEGIN

std::vector<std::string> GethDialect::per_test_args(TestCase const &test) const
{
    return {
        "--code",
        evmc::hex(test.code),
        "--input",
        evmc::hex(test.input),
        "--gas",
        std::to_string(test.gas),
        "--dump",
        "--statdump",
        "run"};
}

void GethDialect::parse(RawOutcome const &raw, ExecutionResult &result) const
{
    auto const dump = find_state_dump(raw.stdout_text);
    result.post_state = state_from_json(dump.at("accounts"), "accounts");

    std::array<std::string_view, 2> const texts = {
        raw.stdout_text, raw.stderr_text};
    for (auto const text : texts) {
        if (auto const gas = parse_gas_used(text)) {
            result.resource_used = *gas;
            break;
        }
    }
    for (auto const text : texts) {
        if (auto const d = parse_reported_duration(text)) {
            result.reported_duration = d;
            break;
        }
    }
}

TESTETH_NAMESPACE_END
