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

#include <spongediff/fuzz/config.hpp>

#include <boost/outcome/config.hpp>
// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

SPONGEDIFF_FUZZ_NAMESPACE_BEGIN

enum class FuzzError
{
    Success = 0,
    DigestMismatch,
    Cancelled,
};

enum class ConfigError
{
    Success = 0,
    ZeroWorkers,
    ZeroMaxInputBytes,
    EmptyCode,
    InvalidHex,
    FileNotFound,
};

SPONGEDIFF_FUZZ_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<spongediff::fuzz::FuzzError>
    : quick_status_code_from_enum_defaults<spongediff::fuzz::FuzzError>
{
    static constexpr auto const domain_name = "Fuzz Error";
    static constexpr auto const domain_uuid =
        "9c07e3d1-52a8-4f6b-b0e4-1d8a6f23c945";

    static std::initializer_list<mapping> const &value_mappings();
};

template <>
struct quick_status_code_from_enum<spongediff::fuzz::ConfigError>
    : quick_status_code_from_enum_defaults<spongediff::fuzz::ConfigError>
{
    static constexpr auto const domain_name = "Config Error";
    static constexpr auto const domain_uuid =
        "e2a4b8f0-7c19-4d3e-a6b5-38f0c1d9e7a2";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
