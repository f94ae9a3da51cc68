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

#include <testeth/compare/verdict.hpp>

#include <testeth/core/basic_formatter.hpp>
#include <testeth/core/config.hpp>

#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

TESTETH_NAMESPACE_BEGIN

static_assert(std::variant_size_v<Verdict> == 5);

std::string_view to_string(VerdictKind const kind)
{
    switch (kind) {
    case VerdictKind::Pass:
        return "pass";
    case VerdictKind::Mismatch:
        return "mismatch";
    case VerdictKind::ToolError:
        return "tool error";
    case VerdictKind::Timeout:
        return "timeout";
    case VerdictKind::LoadError:
        return "load error";
    }
    return "unknown";
}

std::string describe(Verdict const &verdict)
{
    return std::visit(
        [](auto const &v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Pass>) {
                return "pass";
            }
            else if constexpr (std::is_same_v<T, Mismatch>) {
                return fmt::format("mismatch: {}", v.details);
            }
            else if constexpr (std::is_same_v<T, ToolError>) {
                auto const eol = v.stderr_text.find('\n');
                return fmt::format(
                    "tool error: exit code {}: {}",
                    v.exit_code,
                    v.stderr_text.substr(0, eol));
            }
            else if constexpr (std::is_same_v<T, Timeout>) {
                return "timeout";
            }
            else {
                return fmt::format("load error: {}", v.reason);
            }
        },
        verdict);
}

TESTETH_NAMESPACE_END
