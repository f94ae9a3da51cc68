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

#include <testeth/compare/result_comparator.hpp>

#include <testeth/compare/verdict.hpp>
#include <testeth/core/address.hpp>
#include <testeth/core/basic_formatter.hpp>
#include <testeth/core/bytes.hpp>
#include <testeth/core/config.hpp>
#include <testeth/core/fmt/address_fmt.hpp>
#include <testeth/core/fmt/bytes_fmt.hpp>
#include <testeth/core/fmt/int_fmt.hpp>
#include <testeth/exec/raw_outcome.hpp>
#include <testeth/normalize/execution_result.hpp>
#include <testeth/normalize/output_normalizer.hpp>
#include <testeth/normalize/unparsable_output.hpp>
#include <testeth/registry/tool_entry.hpp>
#include <testeth/state/account.hpp>
#include <testeth/vector/test_case.hpp>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

TESTETH_ANONYMOUS_NAMESPACE_BEGIN

template <typename Expected, typename Actual>
Mismatch make_mismatch(
    std::optional<Address> const address, std::string field,
    Expected const &expected, Actual const &actual)
{
    Mismatch m{
        .address = address,
        .field = std::move(field),
        .expected = fmt::format("{}", expected),
        .actual = fmt::format("{}", actual),
        .details = {}};
    if (address.has_value()) {
        m.details = fmt::format(
            "{} {}: expected {}, actual {}",
            *address,
            m.field,
            m.expected,
            m.actual);
    }
    else {
        m.details = fmt::format(
            "{}: expected {}, actual {}", m.field, m.expected, m.actual);
    }
    return m;
}

std::optional<Mismatch> compare_account(
    Address const &address, Account const &expected, Account const &actual)
{
    if (expected.balance != actual.balance) {
        return make_mismatch(
            address, "balance", expected.balance, actual.balance);
    }
    if (expected.nonce != actual.nonce) {
        return make_mismatch(address, "nonce", expected.nonce, actual.nonce);
    }
    if (expected.code != actual.code) {
        return make_mismatch(address, "code", expected.code, actual.code);
    }

    // merge walk over both slot maps; an absent slot reads as zero
    auto e = expected.storage.begin();
    auto a = actual.storage.begin();
    while (e != expected.storage.end() || a != actual.storage.end()) {
        if (a == actual.storage.end() ||
            (e != expected.storage.end() && e->first < a->first)) {
            return make_mismatch(
                address,
                fmt::format("storage[{}]", e->first),
                e->second,
                bytes32_t{});
        }
        if (e == expected.storage.end() || a->first < e->first) {
            return make_mismatch(
                address,
                fmt::format("storage[{}]", a->first),
                bytes32_t{},
                a->second);
        }
        if (e->second != a->second) {
            return make_mismatch(
                address,
                fmt::format("storage[{}]", e->first),
                e->second,
                a->second);
        }
        ++e;
        ++a;
    }
    return std::nullopt;
}

std::optional<Mismatch>
compare_state(State const &expected, State const &actual)
{
    auto e = expected.begin();
    auto a = actual.begin();
    while (e != expected.end() || a != actual.end()) {
        if (a == actual.end() || (e != expected.end() && e->first < a->first)) {
            return make_mismatch(e->first, "account", "present", "absent");
        }
        if (e == expected.end() || a->first < e->first) {
            return make_mismatch(a->first, "account", "absent", "present");
        }
        if (auto m = compare_account(e->first, e->second, a->second)) {
            return m;
        }
        ++e;
        ++a;
    }
    return std::nullopt;
}

std::optional<Mismatch> compare_logs(
    std::vector<LogEntry> const &expected, std::vector<LogEntry> const &actual)
{
    size_t const n = std::min(expected.size(), actual.size());
    for (size_t i = 0; i < n; ++i) {
        auto const &e = expected[i];
        auto const &a = actual[i];
        if (e.address != a.address) {
            return make_mismatch(
                e.address, fmt::format("logs[{}].address", i), e.address, a.address);
        }
        if (e.topics != a.topics) {
            return make_mismatch(
                e.address,
                fmt::format("logs[{}].topics", i),
                fmt::format("[{}]", fmt::join(e.topics, ", ")),
                fmt::format("[{}]", fmt::join(a.topics, ", ")));
        }
        if (e.data != a.data) {
            return make_mismatch(
                e.address, fmt::format("logs[{}].data", i), e.data, a.data);
        }
    }
    if (expected.size() != actual.size()) {
        return make_mismatch(
            std::nullopt, "logs.length", expected.size(), actual.size());
    }
    return std::nullopt;
}

TESTETH_ANONYMOUS_NAMESPACE_END

TESTETH_NAMESPACE_BEGIN

ResultComparator::ResultComparator(LogOrder const log_order)
    : log_order_{log_order}
{
}

Verdict ResultComparator::compare(
    ExecutionResult const &result, TestCase const &expected) const
{
    if (auto m = compare_state(expected.expected_post_state, result.post_state)) {
        return std::move(*m);
    }

    if (!expected.expected_logs.has_value() || !result.logs.has_value()) {
        return Pass{};
    }
    if (log_order_ == LogOrder::Strict) {
        if (auto m = compare_logs(*expected.expected_logs, *result.logs)) {
            return std::move(*m);
        }
        return Pass{};
    }

    auto sorted_expected = *expected.expected_logs;
    auto sorted_actual = *result.logs;
    std::sort(sorted_expected.begin(), sorted_expected.end());
    std::sort(sorted_actual.begin(), sorted_actual.end());
    if (auto m = compare_logs(sorted_expected, sorted_actual)) {
        m->details += " (unordered)";
        return std::move(*m);
    }
    return Pass{};
}

Verdict ResultComparator::evaluate(
    OutputNormalizer const &normalizer, ToolEntry const &tool,
    RawOutcome const &raw, TestCase const &expected,
    ExecutionResult *const normalized) const
{
    if (raw.timed_out) {
        return Timeout{};
    }
    try {
        auto result = normalizer.normalize(tool, raw);
        auto verdict = compare(result, expected);
        if (normalized) {
            *normalized = std::move(result);
        }
        return verdict;
    }
    catch (UnparsableOutput const &e) {
        if (raw.exit_code != 0) {
            return ToolError{
                .exit_code = raw.exit_code, .stderr_text = raw.stderr_text};
        }
        return LoadError{fmt::format(
            "unparsable output from {}: {}", e.tool_name(), e.what())};
    }
}

TESTETH_NAMESPACE_END
