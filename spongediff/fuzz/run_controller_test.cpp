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

#include <spongediff/core/keccak.hpp>
#include <spongediff/execution/candidate_error.hpp>
#include <spongediff/fuzz/error.hpp>
#include <spongediff/fuzz/fuzz_config.hpp>
#include <spongediff/fuzz/progress.hpp>
#include <spongediff/fuzz/report.hpp>
#include <spongediff/fuzz/run_controller.hpp>
#include <spongediff/test/test_support.hpp>

#include <evmc/evmc.h>

#include <gtest/gtest.h>

#include <test_resource_data.h>

#include <cstddef>
#include <variant>

using namespace spongediff;
using namespace spongediff::fuzz;

TEST(RunController, partition)
{
    test::CountingProgressSink progress{4};
    RunController controller{
        Config{.max_input_bytes = 8, .seed = 1},
        test::load_candidate(test_resource::stateful_sponge),
        progress};
    EXPECT_FALSE(controller.run().has_error());
    EXPECT_FALSE(controller.failure().has_value());
    for (size_t i = 0; i < 4; ++i) {
        EXPECT_EQ(progress.completed(i), 25000);
        EXPECT_EQ(progress.done(i), 1);
    }
}

TEST(RunController, remainder_dropped)
{
    test::CountingProgressSink progress{3};
    RunController controller{
        Config{.worker_count = 3, .total_iterations = 10},
        test::load_candidate(test_resource::stateful_sponge),
        progress};
    EXPECT_FALSE(controller.run().has_error());
    for (size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(progress.completed(i), 3);
    }
}

TEST(RunController, empty_input)
{
    test::CountingProgressSink progress{2};
    RunController controller{
        Config{.worker_count = 2, .total_iterations = 100, .max_input_bytes = 1},
        test::load_candidate(test_resource::stateful_sponge),
        progress};
    EXPECT_FALSE(controller.run().has_error());
    EXPECT_EQ(progress.completed(0), 50);
    EXPECT_EQ(progress.completed(1), 50);
}

TEST(RunController, zero_digest_fails_fast)
{
    NullProgressSink progress;
    RunController controller{
        Config{.max_input_bytes = 1},
        test::load_candidate(test_resource::zero_digest),
        progress};
    auto const res = controller.run();
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), FuzzError::DigestMismatch);

    ASSERT_TRUE(controller.failure().has_value());
    auto const &report = std::get<MismatchReport>(*controller.failure());
    EXPECT_LT(report.worker, 4);
    EXPECT_EQ(report.iteration, 0);
    EXPECT_TRUE(report.input.empty());
    EXPECT_EQ(report.digests.reference, NULL_HASH);
}

TEST(RunController, execution_fault)
{
    NullProgressSink progress;
    RunController controller{
        Config{.worker_count = 2},
        test::load_candidate(test_resource::reverting),
        progress};
    auto const res = controller.run();
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), CandidateError::AbsorbFailed);

    auto const &fault = std::get<ExecutionFault>(*controller.failure());
    EXPECT_EQ(fault.iteration, 0);
    EXPECT_EQ(fault.status, EVMC_REVERT);
}

TEST(RunController, invalid_config)
{
    NullProgressSink progress;
    RunController controller{
        Config{.worker_count = 0},
        test::load_candidate(test_resource::stateful_sponge),
        progress};
    auto const res = controller.run();
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ConfigError::ZeroWorkers);
    EXPECT_FALSE(controller.failure().has_value());
}

TEST(RunController, seeded_run_is_reproducible)
{
    NullProgressSink progress;
    Config const config{.worker_count = 1, .total_iterations = 1000, .seed = 99};

    RunController c1{
        config, test::load_candidate(test_resource::leaky_sponge), progress};
    RunController c2{
        config, test::load_candidate(test_resource::leaky_sponge), progress};
    ASSERT_TRUE(c1.run().has_error());
    ASSERT_TRUE(c2.run().has_error());

    auto const &r1 = std::get<MismatchReport>(*c1.failure());
    auto const &r2 = std::get<MismatchReport>(*c2.failure());
    EXPECT_EQ(r1.iteration, r2.iteration);
    EXPECT_EQ(r1.input, r2.input);
    EXPECT_EQ(r1.digests.candidate, r2.digests.candidate);
}
