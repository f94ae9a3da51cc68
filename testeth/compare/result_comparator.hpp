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

#include <testeth/compare/verdict.hpp>
#include <testeth/core/config.hpp>
#include <testeth/exec/raw_outcome.hpp>
#include <testeth/normalize/execution_result.hpp>
#include <testeth/normalize/output_normalizer.hpp>
#include <testeth/registry/tool_entry.hpp>
#include <testeth/vector/test_case.hpp>

TESTETH_NAMESPACE_BEGIN

/// Whether logs must match in order or only as a multiset
enum class LogOrder
{
    Strict,
    Unordered,
};

class ResultComparator
{
    LogOrder log_order_;

public:
    explicit ResultComparator(LogOrder = LogOrder::Strict);

    /// Structural comparison of post state, then logs. Addresses are visited
    /// in ascending order, so the reported divergence is deterministic.
    Verdict compare(ExecutionResult const &, TestCase const &) const;

    /// Classifies a raw outcome: a timeout wins over any partial output,
    /// unparsable output is a tool error for a non-zero exit and a load
    /// error otherwise, anything else is compared. When `normalized` is not
    /// null it receives the parsed result, if there was one.
    Verdict evaluate(
        OutputNormalizer const &, ToolEntry const &, RawOutcome const &,
        TestCase const &, ExecutionResult *normalized = nullptr) const;
};

TESTETH_NAMESPACE_END
