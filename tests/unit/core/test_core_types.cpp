/**
 * @file test_core_types.cpp
 * @brief Unit tests for core types (error codes, result, chunk and commit tokens)
 */

#include <gtest/gtest.h>

#include <kcenon/blob_transfer/core/chunk_types.h>
#include <kcenon/blob_transfer/core/types.h>

#include <string>

namespace kcenon::blob_transfer::test {

// =============================================================================
// error_code Tests
// =============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, ErrorCodeRanges) {
    // Precondition errors: -300 to -319
    EXPECT_EQ(static_cast<int>(error_code::precondition_violation), -300);
    EXPECT_EQ(static_cast<int>(error_code::invalid_state), -302);

    // Transport errors: -320 to -339
    EXPECT_EQ(static_cast<int>(error_code::transient_transport_error), -320);
    EXPECT_EQ(static_cast<int>(error_code::condition_not_satisfied), -322);

    // Encoding, source and control errors
    EXPECT_EQ(static_cast<int>(error_code::encoding_error), -340);
    EXPECT_EQ(static_cast<int>(error_code::source_read_error), -360);
    EXPECT_EQ(static_cast<int>(error_code::transfer_cancelled), -380);
}

TEST_F(ErrorCodeTest, ToString) {
    EXPECT_STREQ(to_string(error_code::success), "success");
    EXPECT_STREQ(to_string(error_code::retries_exhausted), "retries exhausted");
    EXPECT_STREQ(to_string(error_code::transfer_cancelled), "transfer cancelled");
}

TEST_F(ErrorCodeTest, ErrorCarriesOffset) {
    error err{error_code::transient_transport_error, "503 from service", 8192};

    EXPECT_TRUE(static_cast<bool>(err));
    ASSERT_TRUE(err.chunk_offset.has_value());
    EXPECT_EQ(*err.chunk_offset, 8192u);

    error plain{error_code::invalid_state};
    EXPECT_EQ(plain.message, "invalid state");
    EXPECT_FALSE(plain.chunk_offset.has_value());
}

TEST_F(ErrorCodeTest, DefaultErrorIsSuccess) {
    error err;
    EXPECT_FALSE(static_cast<bool>(err));
}

// =============================================================================
// result Tests
// =============================================================================

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, HoldsValue) {
    result<int> r = 42;

    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), 42);
}

TEST_F(ResultTest, HoldsError) {
    result<std::string> r = unexpected(error{error_code::encoding_error, "bad padding"});

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::encoding_error);
    EXPECT_EQ(r.error().message, "bad padding");
}

TEST_F(ResultTest, VoidResult) {
    result<void> ok;
    EXPECT_TRUE(ok.has_value());

    result<void> failed = unexpected(error{error_code::transfer_cancelled});
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, error_code::transfer_cancelled);
}

// =============================================================================
// chunk and commit token Tests
// =============================================================================

class ChunkTypesTest : public ::testing::Test {};

TEST_F(ChunkTypesTest, ChunkConstruction) {
    byte_buffer payload(10, std::byte{0x42});
    chunk c(3, 30, payload, true);

    EXPECT_EQ(c.index, 3u);
    EXPECT_EQ(c.offset, 30u);
    EXPECT_EQ(c.size(), 10u);
    EXPECT_TRUE(c.is_final);
}

TEST_F(ChunkTypesTest, CommitTokenVariants) {
    commit_token block = block_id_token{"MDAw"};
    commit_token page = page_commit_token{"\"etag\"", "Mon, 01 Jan 2024 00:00:00 GMT"};
    commit_token append = append_commit_token{1024, "\"etag\"", ""};

    EXPECT_TRUE(std::holds_alternative<block_id_token>(block));
    EXPECT_TRUE(std::holds_alternative<page_commit_token>(page));
    ASSERT_TRUE(std::holds_alternative<append_commit_token>(append));
    EXPECT_EQ(std::get<append_commit_token>(append).next_offset, 1024u);
}

TEST_F(ChunkTypesTest, TokenEquality) {
    EXPECT_EQ(block_id_token{"a"}, block_id_token{"a"});
    EXPECT_NE(block_id_token{"a"}, block_id_token{"b"});
    EXPECT_EQ((append_commit_token{5, "e", "t"}), (append_commit_token{5, "e", "t"}));
}

}  // namespace kcenon::blob_transfer::test
