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

#include <bobe/core/address.hpp>
#include <bobe/core/bobe_exception.hpp>
#include <bobe/core/int.hpp>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <string>

namespace nlohmann
{
    template <>
    struct adl_serializer<bobe::Address>
    {
        static void from_json(nlohmann::json const &json, bobe::Address &o)
        {
            auto const maybe_address =
                evmc::from_hex<bobe::Address>(json.get<std::string>());
            BOBE_THROW(maybe_address.has_value(), "malformed address");
            o = maybe_address.value();
        }
    };

    // decimal or 0x prefixed strings, or plain json integers
    template <>
    struct adl_serializer<bobe::uint256_t>
    {
        static void from_json(nlohmann::json const &json, bobe::uint256_t &o)
        {
            if (json.is_number_unsigned()) {
                o = bobe::uint256_t{json.get<uint64_t>()};
                return;
            }
            o = intx::from_string<bobe::uint256_t>(json.get<std::string>());
        }
    };
}
