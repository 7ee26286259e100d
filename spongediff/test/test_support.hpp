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

#include <spongediff/core/byte_string.hpp>
#include <spongediff/core/hex.hpp>
#include <spongediff/execution/candidate.hpp>
#include <spongediff/fuzz/progress.hpp>

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <string>
#include <vector>

namespace spongediff::test
{
    inline CandidateConfig load_candidate(std::filesystem::path const &path)
    {
        std::ifstream in{path};
        std::string const text{
            std::istreambuf_iterator<char>{in},
            std::istreambuf_iterator<char>{}};
        auto code = from_hex(text);
        EXPECT_TRUE(code.has_value() && !code->empty()) << path;
        return CandidateConfig{.code = code.value_or(byte_string{})};
    }

    class CountingProgressSink final : public fuzz::ProgressSink
    {
        mutable std::mutex mutex_;
        std::vector<uint64_t> completed_;
        std::vector<uint64_t> calls_;
        std::vector<unsigned> done_;

    public:
        explicit CountingProgressSink(size_t const workers)
            : completed_(workers)
            , calls_(workers)
            , done_(workers)
        {
        }

        void on_progress(
            size_t const worker, uint64_t const completed,
            uint64_t const total) override
        {
            std::scoped_lock const lock{mutex_};
            ASSERT_LT(worker, completed_.size());
            EXPECT_LE(completed, total);
            EXPECT_EQ(completed, completed_[worker] + 1);
            completed_[worker] = completed;
            ++calls_[worker];
        }

        void on_done(size_t const worker) override
        {
            std::scoped_lock const lock{mutex_};
            ASSERT_LT(worker, done_.size());
            ++done_[worker];
        }

        uint64_t completed(size_t const worker) const
        {
            std::scoped_lock const lock{mutex_};
            return completed_.at(worker);
        }

        uint64_t calls(size_t const worker) const
        {
            std::scoped_lock const lock{mutex_};
            return calls_.at(worker);
        }

        unsigned done(size_t const worker) const
        {
            std::scoped_lock const lock{mutex_};
            return done_.at(worker);
        }
    };
}
