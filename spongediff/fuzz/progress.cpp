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

#include <spongediff/fuzz/config.hpp>
#include <spongediff/fuzz/progress.hpp>

#include <quill/Quill.h>

#include <cstddef>
#include <cstdint>

SPONGEDIFF_FUZZ_NAMESPACE_BEGIN

LogProgressSink::LogProgressSink(uint64_t const interval)
    : interval_{interval}
{
}

void LogProgressSink::on_progress(
    size_t const worker, uint64_t const completed, uint64_t const total)
{
    if (interval_ == 0 || completed % interval_ != 0) {
        return;
    }
    LOG_INFO("Thread {} {}/{}", worker, completed, total);
}

void LogProgressSink::on_done(size_t const worker)
{
    LOG_INFO("Thread {} DONE", worker);
}

SPONGEDIFF_FUZZ_NAMESPACE_END
