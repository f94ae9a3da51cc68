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
#include <testeth/core/basic_formatter.hpp>
#include <testeth/core/byte_string.hpp>
#include <testeth/core/bytes.hpp>
#include <testeth/core/config.hpp>
#include <testeth/core/int.hpp>

#include <evmc/hex.hpp>

#include <intx/intx.hpp>

#include <nlohmann/adl_serializer.hpp>
#include <nlohmann/json.hpp>

#include <charconv>
#include <cstdint>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

TESTETH_NAMESPACE_BEGIN

/**
 * Parses a uint64_t from a json blob that is either an unsigned integer or a
 * string holding a `0x` prefixed hexadecimal or a decimal number. The
 * nlohmann::json conversion cannot be used because test vectors mostly carry
 * integers as hex strings.
 * @param j json blob
 * @return the parsed integer
 * @throws std::invalid_argument if the blob is not a well formed integer
 */
[[nodiscard]] inline uint64_t integer_from_json(nlohmann::json const &j)
{
    auto error_message = [&j](auto const message_suffix) {
        return fmt::format(
            "integer_from_json was called with {}, json_type: {}, error: {}",
            j.dump(),
            j.type_name(),
            message_suffix);
    };

    if (j.is_number_unsigned()) {
        return j.get<uint64_t>();
    }
    if (!j.is_string()) {
        throw std::invalid_argument{
            error_message("only string or unsigned integer values are allowed")};
    }

    auto const string = j.get<std::string>();
    std::string_view trimmed{string};
    int base = 10;
    if (trimmed.starts_with("0x") || trimmed.starts_with("0X")) {
        trimmed.remove_prefix(2);
        base = 16;
    }
    if (trimmed.empty()) {
        // "0x" is how some vectors spell zero
        if (base == 16) {
            return 0;
        }
        throw std::invalid_argument{error_message("empty string")};
    }
    uint64_t value{};
    auto const *const begin = trimmed.data();
    auto const *const end = trimmed.data() + trimmed.size();
    auto const parse_result = std::from_chars(begin, end, value, base);
    if (parse_result.ec == std::errc::result_out_of_range) {
        throw std::invalid_argument{error_message("result_out_of_range")};
    }
    if (parse_result.ec != std::errc{} || parse_result.ptr != end) {
        throw std::invalid_argument{
            error_message("std::from_chars did not fully consume the input")};
    }
    return value;
}

TESTETH_NAMESPACE_END

namespace nlohmann
{
    template <>
    struct adl_serializer<testeth::Address>
    {
        static void from_json(nlohmann::json const &json, testeth::Address &o)
        {
            auto const maybe_address =
                json.is_string()
                    ? evmc::from_hex<testeth::Address>(json.get<std::string>())
                    : std::nullopt;
            if (!maybe_address) {
                throw std::invalid_argument{
                    fmt::format("invalid address {}", json.dump())};
            }
            o = maybe_address.value();
        }
    };

    template <>
    struct adl_serializer<testeth::byte_string>
    {
        static void
        from_json(nlohmann::json const &json, testeth::byte_string &o)
        {
            auto const maybe_byte_string =
                json.is_string() ? evmc::from_hex(json.get<std::string>())
                                 : std::nullopt;
            if (!maybe_byte_string) {
                throw std::invalid_argument{
                    fmt::format("invalid hex string {}", json.dump())};
            }
            o = maybe_byte_string.value();
        }
    };

    template <>
    struct adl_serializer<testeth::bytes32_t>
    {
        static void from_json(nlohmann::json const &json, testeth::bytes32_t &o)
        {
            auto const maybe_bytes32 =
                json.is_string()
                    ? evmc::from_hex<testeth::bytes32_t>(json.get<std::string>())
                    : std::nullopt;
            if (!maybe_bytes32) {
                throw std::invalid_argument{
                    fmt::format("invalid 32 byte word {}", json.dump())};
            }
            o = maybe_bytes32.value();
        }
    };

    template <>
    struct adl_serializer<testeth::uint256_t>
    {
        static void from_json(nlohmann::json const &json, testeth::uint256_t &o)
        {
            if (json.is_number_unsigned()) {
                o = testeth::uint256_t{json.get<uint64_t>()};
                return;
            }
            if (!json.is_string()) {
                throw std::invalid_argument{
                    fmt::format("invalid 256 bit integer {}", json.dump())};
            }
            auto const string = json.get<std::string>();
            if (string == "0x" || string == "0X") {
                o = 0;
                return;
            }
            try {
                o = intx::from_string<testeth::uint256_t>(string);
            }
            catch (std::exception const &) {
                throw std::invalid_argument{
                    fmt::format("invalid 256 bit integer {}", json.dump())};
            }
        }
    };
}
