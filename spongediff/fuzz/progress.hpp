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

#include <cstddef>
#include <cstdint>

SPONGEDIFF_FUZZ_NAMESPACE_BEGIN

// Called concurrently from every worker thread.
class ProgressSink
{
public:
    virtual ~ProgressSink() = default;

    virtual void
    on_progress(size_t worker, uint64_t completed, uint64_t total) = 0;

    virtual void on_done(size_t worker) = 0;
};

class NullProgressSink final : public ProgressSink
{
public:
    void on_progress(size_t, uint64_t, uint64_t) override {}

    void on_done(size_t) override {}
};

// Logs every `interval` completed iterations and a DONE line per worker.
class LogProgressSink final : public ProgressSink
{
    uint64_t const interval_;

public:
    explicit LogProgressSink(uint64_t interval);

    void on_progress(size_t worker, uint64_t completed, uint64_t total) override;

    void on_done(size_t worker) override;
};

SPONGEDIFF_FUZZ_NAMESPACE_END
