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

#include <spongediff/fuzz/error.hpp>

#include <boost/outcome/config.hpp>
#include <boost/outcome/success_failure.hpp>

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<spongediff::fuzz::FuzzError>::mapping> const &
quick_status_code_from_enum<spongediff::fuzz::FuzzError>::value_mappings()
{
    using spongediff::fuzz::FuzzError;

    static std::initializer_list<mapping> const v = {
        {FuzzError::Success, "success", {errc::success}},
        {FuzzError::DigestMismatch, "digest mismatch", {}},
        {FuzzError::Cancelled, "cancelled", {errc::operation_canceled}},
    };

    return v;
}

std::initializer_list<
    quick_status_code_from_enum<spongediff::fuzz::ConfigError>::mapping> const &
quick_status_code_from_enum<spongediff::fuzz::ConfigError>::value_mappings()
{
    using spongediff::fuzz::ConfigError;

    static std::initializer_list<mapping> const v = {
        {ConfigError::Success, "success", {errc::success}},
        {ConfigError::ZeroWorkers, "worker count must be positive", {}},
        {ConfigError::ZeroMaxInputBytes,
         "max input bytes must be positive",
         {}},
        {ConfigError::EmptyCode, "candidate code is empty", {}},
        {ConfigError::InvalidHex, "candidate code is not valid hex", {}},
        {ConfigError::FileNotFound,
         "candidate code file not found",
         {errc::no_such_file_or_directory}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
