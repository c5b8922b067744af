// =============================================================================
// Result Store Tests
// =============================================================================

#include <gtest/gtest.h>
#include "dispatcher/result_store.hpp"
#include "common/base64.hpp"
#include "common/errors.hpp"
#include "common/hash.hpp"
#include "tests/fakes.hpp"

class ResultStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        cfg_.transport_ceiling = 10;
        cfg_.result_ttl_ms     = 1000;
        store_ = std::make_unique<ResultStore>(cfg_, [this] { return now_; });
    }

    // Pull every chunk, checking checksums and the last-chunk flag
    std::string pull_all(const JobResponse& resp) {
        std::string text;
        for (u32 i = 0; i < resp.total_chunks; ++i) {
            ResultChunkReply r = store_->pull(resp.result_id, i);
            EXPECT_EQ(r.checksum, hash::xxh3_32(r.chunk));
            EXPECT_EQ(r.is_last, i + 1 == resp.total_chunks);
            text += r.chunk;
        }
        return text;
    }

    RelayConfig                  cfg_;
    u64                          now_{5000};
    std::unique_ptr<ResultStore> store_;
};

TEST_F(ResultStoreTest, SingleMediaDescriptor) {
    JobResult result = SingleMedia{pattern_bytes(40), "video/mp4"};
    EncodedResult enc = media::encode_result(result);

    JobResponse resp = store_->store("r1", enc);
    EXPECT_TRUE(resp.chunked);
    EXPECT_FALSE(resp.multiple);
    EXPECT_EQ(resp.result_id, "r1");
    EXPECT_EQ(resp.mime_type, "video/mp4");
    EXPECT_EQ(resp.total_length, enc.items[0].base64.size());
    EXPECT_EQ(resp.total_chunks, 6u);  // 56 chars at 10 per chunk

    std::string text = pull_all(resp);
    EXPECT_EQ(text, enc.items[0].base64);
    EXPECT_EQ(base64::decode(text), pattern_bytes(40));
}

TEST_F(ResultStoreTest, MultiMediaIsSerialized) {
    MultiMedia mm;
    mm.items.push_back({"a.mp4", pattern_bytes(12, 1), "video/mp4"});
    mm.items.push_back({"b.webm", pattern_bytes(30, 2), "video/webm"});
    EncodedResult enc = media::encode_result(mm);

    JobResponse resp = store_->store("r2", enc);
    EXPECT_TRUE(resp.multiple);
    EXPECT_TRUE(resp.mime_type.empty());

    EncodedResult back = media::parse_multi(pull_all(resp));
    ASSERT_EQ(back.items.size(), 2u);
    EXPECT_EQ(back.items[0].name, "a.mp4");
    EXPECT_EQ(back.items[1].base64, enc.items[1].base64);
}

TEST_F(ResultStoreTest, EntryRemovedAfterLastChunk) {
    JobResponse resp = store_->store("r1", media::encode_result(SingleMedia{pattern_bytes(20), "video/mp4"}));
    ASSERT_GT(resp.total_chunks, 1u);
    store_->pull("r1", 0);
    EXPECT_TRUE(store_->contains("r1"));
    store_->pull("r1", resp.total_chunks - 1);
    EXPECT_FALSE(store_->contains("r1"));

    try {
        store_->pull("r1", 0);
        FAIL() << "expected TransferNotFound";
    } catch (const RelayError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TRANSFER_NOT_FOUND);
        EXPECT_EQ(std::string(e.what()), "Result not found: r1");
    }
}

TEST_F(ResultStoreTest, IndexPastEnd) {
    JobResponse resp = store_->store("r1", media::encode_result(SingleMedia{pattern_bytes(5), "video/mp4"}));
    try {
        store_->pull("r1", resp.total_chunks);
        FAIL() << "expected Protocol";
    } catch (const RelayError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::PROTOCOL);
    }
    EXPECT_TRUE(store_->contains("r1"));
}

TEST_F(ResultStoreTest, EmptyMediaIsOneEmptyChunk) {
    JobResponse resp = store_->store("r1", media::encode_result(SingleMedia{{}, "video/mp4"}));
    EXPECT_EQ(resp.total_chunks, 1u);
    EXPECT_EQ(resp.total_length, 0u);
    ResultChunkReply r = store_->pull("r1", 0);
    EXPECT_TRUE(r.chunk.empty());
    EXPECT_TRUE(r.is_last);
}

TEST_F(ResultStoreTest, EmptyResultRejected) {
    EXPECT_THROW(store_->store("r1", EncodedResult{}), RelayError);
}

TEST_F(ResultStoreTest, UnclaimedResultsExpire) {
    store_->store("r1", media::encode_result(SingleMedia{pattern_bytes(5), "video/mp4"}));
    now_ += 500;
    store_->store("r2", media::encode_result(SingleMedia{pattern_bytes(5), "video/mp4"}));
    now_ += 600;
    EXPECT_EQ(store_->evict_expired(), 1u);
    EXPECT_FALSE(store_->contains("r1"));
    EXPECT_TRUE(store_->contains("r2"));
}
