/**
 * @file test_parallel_transfer.cpp
 * @brief Concurrency tests for parallel chunk dispatch
 *
 * This file contains tests for:
 * - Bounded in-flight uploads
 * - Commit ordering independent of completion order
 * - Serialized access to a shared, non-thread-safe source
 * - Retry, failure and cancellation while workers are running
 */

#include "test_fixtures.h"

#include <kcenon/blob_transfer/transfer/upload_strategy.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::blob_transfer::test {

// =============================================================================
// Parallel Transfer Test Fixture
// =============================================================================

class ParallelTransferTest : public ::testing::Test {
protected:
    void SetUp() override { endpoint_.call_delay = std::chrono::milliseconds(5); }

    recording_blob_endpoint endpoint_;
};

TEST_F(ParallelTransferTest, InFlightUploadsBoundedByParallelism) {
    auto data = make_pattern(12 * 1024);
    memory_source_stream source(data);
    endpoint_.call_delay = std::chrono::milliseconds(20);

    transfer_coordinator coordinator(fast_spec(blob_kind::block, 1024, data.size(), 3),
                                     endpoint_);
    auto result = coordinator.run(source);

    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_LE(endpoint_.max_concurrent_calls(), 3);
    EXPECT_GE(endpoint_.max_concurrent_calls(), 2);
    EXPECT_EQ(endpoint_.count("put_block"), 12u);
    EXPECT_EQ(endpoint_.content(), data);
}

TEST_F(ParallelTransferTest, ParallelStateSequence) {
    auto data = make_pattern(4096);
    memory_source_stream source(data);
    transfer_coordinator coordinator(fast_spec(blob_kind::block, 1024, data.size(), 2),
                                     endpoint_);

    std::vector<transfer_state> states;
    coordinator.on_state_change(
        [&states](transfer_state, transfer_state to) { states.push_back(to); });

    ASSERT_TRUE(coordinator.run(source).has_value());
    EXPECT_EQ(states, (std::vector<transfer_state>{transfer_state::splitting,
                                                   transfer_state::parallel_dispatch,
                                                   transfer_state::committing,
                                                   transfer_state::done}));
}

TEST_F(ParallelTransferTest, CommitOrderIgnoresCompletionOrder) {
    auto data = make_pattern(8 * 1000);
    memory_source_stream source(data);

    // The first block finishes last
    auto slow_id = block_id_for_offset(0);
    endpoint_.set_failure_hook([slow_id](const recorded_call& call) -> std::optional<error> {
        if (call.operation == "put_block" && call.block_id == slow_id) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        return std::nullopt;
    });

    transfer_coordinator coordinator(fast_spec(blob_kind::block, 1000, data.size(), 4),
                                     endpoint_);
    auto result = coordinator.run(source);

    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto lists = endpoint_.calls_of("put_block_list");
    ASSERT_EQ(lists.size(), 1u);
    ASSERT_EQ(lists[0].block_ids.size(), 8u);
    for (std::size_t i = 0; i < 8; ++i) {
        EXPECT_EQ(lists[0].block_ids[i], block_id_for_offset(i * 1000));
    }

    const auto& tokens = result.value().tokens;
    EXPECT_TRUE(std::is_sorted(tokens.begin(), tokens.end(),
                               [](const ordered_commit_token& a, const ordered_commit_token& b) {
                                   return a.offset < b.offset;
                               }));
    EXPECT_EQ(endpoint_.content(), data);
}

TEST_F(ParallelTransferTest, TwentySixBytesInChunksOfFive) {
    auto data = to_bytes("abcdefghijklmnopqrstuvwxyz");
    memory_source_stream source(data);

    transfer_coordinator coordinator(fast_spec(blob_kind::block, 5, data.size(), 3), endpoint_);
    auto result = coordinator.run(source);

    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(endpoint_.count("put_block"), 6u);

    auto lists = endpoint_.calls_of("put_block_list");
    ASSERT_EQ(lists.size(), 1u);
    std::vector<std::string> expected;
    for (uint64_t offset : {0, 5, 10, 15, 20, 25}) {
        expected.push_back(block_id_for_offset(offset));
    }
    EXPECT_EQ(lists[0].block_ids, expected);
    EXPECT_EQ(endpoint_.content(), data);
}

TEST_F(ParallelTransferTest, SharedSourceNeverAccessedConcurrently) {
    auto data = make_pattern(64 * 1024);
    exclusive_access_stream source(data);

    auto spec = fast_spec(blob_kind::block, 4096, data.size(), 8);
    spec.buffer_capacity = 1024;
    transfer_coordinator coordinator(spec, endpoint_);

    auto result = coordinator.run(source);

    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_FALSE(source.overlap_detected());
    EXPECT_GT(source.access_count(), 0u);
    EXPECT_EQ(endpoint_.content(), data);
}

TEST_F(ParallelTransferTest, ProgressSumsToLength) {
    auto data = make_pattern(10 * 1000 + 7);
    memory_source_stream source(data);
    transfer_coordinator coordinator(fast_spec(blob_kind::block, 1000, data.size(), 4),
                                     endpoint_);

    std::mutex reports_mutex;
    std::vector<transfer_progress> reports;
    coordinator.on_progress([&](const transfer_progress& p) {
        std::lock_guard<std::mutex> lock(reports_mutex);
        reports.push_back(p);
    });

    ASSERT_TRUE(coordinator.run(source).has_value());

    ASSERT_EQ(reports.size(), 12u);
    EXPECT_EQ(reports.front().bytes_completed, 0u);
    for (std::size_t i = 1; i < reports.size(); ++i) {
        EXPECT_GT(reports[i].bytes_completed, reports[i - 1].bytes_completed);
        EXPECT_EQ(reports[i].total_bytes, data.size());
    }
    EXPECT_EQ(reports.back().bytes_completed, data.size());
}

TEST_F(ParallelTransferTest, TransientFailuresRetriedAcrossWorkers) {
    auto data = make_pattern(8 * 512);
    memory_source_stream source(data);
    endpoint_.fail_next("put_block", error_code::transient_transport_error, 3);

    transfer_coordinator coordinator(fast_spec(blob_kind::block, 512, data.size(), 4),
                                     endpoint_);
    auto result = coordinator.run(source);

    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result.value().retry_count, 3u);
    EXPECT_EQ(endpoint_.count("put_block"), 11u);
    EXPECT_EQ(endpoint_.content(), data);
}

TEST_F(ParallelTransferTest, RetryExhaustionStopsAllWorkers) {
    auto data = make_pattern(16 * 512);
    memory_source_stream source(data);

    auto doomed_id = block_id_for_offset(3 * 512);
    endpoint_.set_failure_hook([doomed_id](const recorded_call& call) -> std::optional<error> {
        if (call.operation == "put_block" && call.block_id == doomed_id) {
            return error{error_code::transient_transport_error, "connection reset"};
        }
        return std::nullopt;
    });

    transfer_coordinator coordinator(fast_spec(blob_kind::block, 512, data.size(), 2),
                                     endpoint_);
    auto result = coordinator.run(source);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::retries_exhausted);
    ASSERT_TRUE(result.error().chunk_offset.has_value());
    EXPECT_EQ(*result.error().chunk_offset, 3u * 512);
    EXPECT_EQ(endpoint_.count("put_block_list"), 0u);
    EXPECT_EQ(coordinator.state(), transfer_state::failed);
}

TEST_F(ParallelTransferTest, NonRetryableFailureIsReturned) {
    auto data = make_pattern(8 * 512);
    memory_source_stream source(data);
    endpoint_.fail_next("put_block", error_code::condition_not_satisfied, 1);

    transfer_coordinator coordinator(fast_spec(blob_kind::block, 512, data.size(), 4),
                                     endpoint_);
    auto result = coordinator.run(source);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::condition_not_satisfied);
    EXPECT_EQ(endpoint_.count("put_block_list"), 0u);
}

TEST_F(ParallelTransferTest, CancelStopsDispatch) {
    auto data = make_pattern(64 * 512);
    memory_source_stream source(data);
    endpoint_.call_delay = std::chrono::milliseconds(10);

    transfer_coordinator coordinator(fast_spec(blob_kind::block, 512, data.size(), 2),
                                     endpoint_);
    coordinator.on_progress([&coordinator](const transfer_progress& p) {
        if (p.bytes_completed > 0) {
            coordinator.cancel();
        }
    });

    auto result = coordinator.run(source);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::transfer_cancelled);
    EXPECT_LT(endpoint_.count("put_block"), 64u);
    EXPECT_EQ(endpoint_.count("put_block_list"), 0u);
}

TEST_F(ParallelTransferTest, ParallelPageWritesOmitIfMatch) {
    auto data = make_pattern(8 * 512);
    memory_source_stream source(data);
    auto spec = fast_spec(blob_kind::page, 1024, data.size(), 4);
    spec.if_match = "\"ignored\"";

    transfer_coordinator coordinator(spec, endpoint_);
    auto result = coordinator.run(source);

    ASSERT_TRUE(result.has_value()) << result.error().message;
    auto writes = endpoint_.calls_of("update_page");
    ASSERT_EQ(writes.size(), 4u);
    for (const auto& write : writes) {
        EXPECT_FALSE(write.if_match.has_value());
        EXPECT_EQ(write.range_start % 512, 0u);
        EXPECT_EQ(write.range_end - write.range_start + 1, 1024u);
    }
    EXPECT_EQ(endpoint_.content(), data);
}

TEST_F(ParallelTransferTest, SharedPoolIsUsed) {
    auto data = make_pattern(4 * 1024);
    memory_source_stream source(data);
    auto pool = adapters::upload_pool_factory::create(2, "shared_test_pool");

    transfer_coordinator coordinator(fast_spec(blob_kind::block, 1024, data.size(), 2),
                                     endpoint_, pool);
    auto result = coordinator.run(source);

    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_LE(endpoint_.max_concurrent_calls(), 2);
    EXPECT_EQ(pool->pending_tasks(), 0u);
    EXPECT_EQ(endpoint_.content(), data);
}

TEST_F(ParallelTransferTest, FewerRangesThanWorkers) {
    auto data = make_pattern(1500);
    memory_source_stream source(data);

    transfer_coordinator coordinator(fast_spec(blob_kind::block, 1000, data.size(), 8),
                                     endpoint_);
    auto result = coordinator.run(source);

    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result.value().chunk_count, 2u);
    EXPECT_LE(endpoint_.max_concurrent_calls(), 2);
}

TEST_F(ParallelTransferTest, UploadStartsAtCurrentSourcePosition) {
    auto data = make_pattern(200);
    byte_buffer expected(data.begin() + 100, data.end());

    for (uint32_t parallelism : {1u, 4u}) {
        SCOPED_TRACE("parallelism " + std::to_string(parallelism));

        recording_blob_endpoint endpoint;
        memory_source_stream source(data);
        ASSERT_TRUE(source.seek(100).has_value());

        transfer_coordinator coordinator(fast_spec(blob_kind::block, 10, 100, parallelism),
                                         endpoint);
        auto result = coordinator.run(source);

        ASSERT_TRUE(result.has_value()) << result.error().message;
        EXPECT_EQ(result.value().tokens.front().offset, 0u);
        EXPECT_EQ(endpoint.content(), expected);
    }
}

TEST_F(ParallelTransferTest, PartialLastRangeFails) {
    auto data = make_pattern(3500);
    memory_source_stream source(data);

    transfer_coordinator coordinator(fast_spec(blob_kind::block, 1000, 4000, 2), endpoint_);
    auto result = coordinator.run(source);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::source_read_error);
    EXPECT_EQ(endpoint_.count("put_block_list"), 0u);
}

TEST_F(ParallelTransferTest, SourceShorterThanDeclaredFails) {
    auto data = make_pattern(3000);
    memory_source_stream source(data);

    transfer_coordinator coordinator(fast_spec(blob_kind::block, 1000, 4000, 2), endpoint_);
    auto result = coordinator.run(source);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::source_read_error);
    EXPECT_EQ(endpoint_.count("put_block_list"), 0u);
}

}  // namespace kcenon::blob_transfer::test
