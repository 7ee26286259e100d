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

#include <spongediff/core/assert.h>
#include <spongediff/core/byte_string.hpp>
#include <spongediff/core/hex.hpp>
#include <spongediff/core/result.hpp>
#include <spongediff/fuzz/config.hpp>
#include <spongediff/fuzz/error.hpp>
#include <spongediff/fuzz/fuzz_config.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

SPONGEDIFF_FUZZ_NAMESPACE_BEGIN

Result<void> Config::validate() const
{
    if (worker_count == 0) {
        return ConfigError::ZeroWorkers;
    }
    if (max_input_bytes == 0) {
        return ConfigError::ZeroMaxInputBytes;
    }
    return success();
}

uint64_t Config::iterations_per_worker() const noexcept
{
    SPONGEDIFF_ASSERT(worker_count > 0);
    return total_iterations / worker_count;
}

uint64_t Config::dropped_iterations() const noexcept
{
    SPONGEDIFF_ASSERT(worker_count > 0);
    return total_iterations % worker_count;
}

Result<byte_string> decode_code(std::string_view const hex)
{
    auto code = from_hex(hex);
    if (!code.has_value()) {
        return ConfigError::InvalidHex;
    }
    if (code->empty()) {
        return ConfigError::EmptyCode;
    }
    return std::move(*code);
}

Result<byte_string> load_code(std::filesystem::path const &path)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return ConfigError::FileNotFound;
    }
    std::ifstream in{path};
    if (!in) {
        return ConfigError::FileNotFound;
    }
    std::string const text{
        std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    return decode_code(text);
}

SPONGEDIFF_FUZZ_NAMESPACE_END
