// =============================================================================
// Worker Runtime Tests
// =============================================================================

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "worker/worker_runtime.hpp"
#include "common/base64.hpp"
#include "common/chunking.hpp"
#include "common/hash.hpp"
#include "tests/fakes.hpp"

using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;
using ::testing::_;

class WorkerRuntimeTest : public ::testing::Test {
protected:
    void start(ConversionEngine& engine) {
        auto pair = LocalPort::create_pair();
        dispatcher_side_ = pair.first;
        dispatcher_side_->start([this](Message m) { got_.push(std::move(m)); },
                                [this] { got_.disconnected(); });
        runtime_ = std::make_unique<WorkerRuntime>(pair.second, engine, archives_, fetcher_, cfg_);
        runtime_->start();
    }

    void TearDown() override {
        runtime_.reset();
        if (dispatcher_side_) dispatcher_side_->close();
    }

    void send(const Message& m) { dispatcher_side_->post(m); }

    JobStart job(u64 id, JobKind kind, u32 tab, const std::string& url = "",
                 const std::string& payload = "") {
        JobStart js;
        js.job_id     = id;
        js.kind       = kind;
        js.tab_id     = tab;
        js.source_url = url;
        js.payload    = payload;
        return js;
    }

    WorkerResult wait_result() {
        EXPECT_TRUE(got_.wait_for_type<WorkerResult>());
        auto results = got_.of_type<WorkerResult>();
        return results.empty() ? WorkerResult{} : results.front();
    }

    bool saw_progress(u32 tab, const std::string& status, u32 pct) {
        for (const auto& p : got_.of_type<Progress>()) {
            if (p.tab_id == tab && p.status == status && p.progress == pct) return true;
        }
        return false;
    }

    MessageCollector             got_;
    RelayConfig                  cfg_;
    PrefixEngine                 prefix_;
    NiceMock<MockEngine>         mock_;
    FakeArchiveReader            archives_;
    FakeFetcher                  fetcher_;
    std::shared_ptr<MessagePort> dispatcher_side_;
    std::unique_ptr<WorkerRuntime> runtime_;
};

TEST_F(WorkerRuntimeTest, AnnouncesHelloThenReady) {
    start(prefix_);
    ASSERT_TRUE(got_.wait_for_type<WorkerReady>());
    auto msgs = got_.messages();
    ASSERT_GE(msgs.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<WorkerHello>(msgs[0]));
    EXPECT_TRUE(std::holds_alternative<WorkerReady>(msgs[1]));
    EXPECT_TRUE(prefix_.loaded());
}

TEST_F(WorkerRuntimeTest, NoReadyWhenEngineLoadFails) {
    EXPECT_CALL(mock_, load())
        .WillOnce(Throw(RelayError(ErrorKind::ENGINE_FAILURE, "ffmpeg not found")));
    EXPECT_CALL(mock_, run(_, _))
        .WillOnce(Throw(RelayError(ErrorKind::ENGINE_FAILURE, "ffmpeg not found")));
    fetcher_.serve("http://host/clip.avi", bytes_of("RIFF"));
    start(mock_);

    // Jobs are still accepted and report the engine's own error
    send(job(1, JobKind::TRANSCODE, 1, "http://host/clip.avi"));
    WorkerResult r = wait_result();
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error_kind, ErrorKind::ENGINE_FAILURE);
    EXPECT_EQ(r.error, "ffmpeg not found");
    EXPECT_TRUE(got_.of_type<WorkerReady>().empty());
}

TEST_F(WorkerRuntimeTest, TranscodeProducesMp4) {
    fetcher_.serve("http://host/movies/clip.MKV", bytes_of("matroska"));
    start(prefix_);

    send(job(5, JobKind::TRANSCODE, 2, "http://host/movies/clip.MKV"));
    WorkerResult r = wait_result();
    ASSERT_TRUE(r.ok) << r.error;
    EXPECT_EQ(r.job_id, 5u);
    EXPECT_FALSE(r.result.multiple);
    ASSERT_EQ(r.result.items.size(), 1u);
    EXPECT_EQ(r.result.items[0].mime_type, "video/mp4");
    EXPECT_EQ(text_of(base64::decode(r.result.items[0].base64)), "MP4:matroska");

    ASSERT_EQ(prefix_.jobs().size(), 1u);
    EXPECT_EQ(prefix_.jobs()[0], "input.mkv -> output.mp4");

    EXPECT_TRUE(saw_progress(2, "Downloading video...", 0));
    EXPECT_TRUE(saw_progress(2, "Transcoding...", 50));
    EXPECT_TRUE(saw_progress(2, "Transcoding...", 100));
}

TEST_F(WorkerRuntimeTest, FetchFailureIsNetworkError) {
    start(prefix_);
    send(job(2, JobKind::TRANSCODE, 1, "http://host/missing.avi"));
    WorkerResult r = wait_result();
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.job_id, 2u);
    EXPECT_EQ(r.error_kind, ErrorKind::NETWORK_FAILURE);
    EXPECT_EQ(r.error, "Fetch failed: 404");
}

TEST_F(WorkerRuntimeTest, EngineErrorPassesThroughVerbatim) {
    ON_CALL(mock_, loaded()).WillByDefault(Return(true));
    EXPECT_CALL(mock_, run(_, _))
        .WillOnce(Throw(RelayError(ErrorKind::ENGINE_FAILURE,
                                   "ffmpeg exited with code 1: Invalid data found")));
    fetcher_.serve("http://host/clip.flv", bytes_of("FLV"));
    start(mock_);

    send(job(3, JobKind::TRANSCODE, 1, "http://host/clip.flv"));
    WorkerResult r = wait_result();
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error_kind, ErrorKind::ENGINE_FAILURE);
    EXPECT_EQ(r.error, "ffmpeg exited with code 1: Invalid data found");
}

TEST_F(WorkerRuntimeTest, ExtractFromUrlPicksFirstMedia) {
    archives_.add("__MACOSX/._b.webm", bytes_of("meta"));
    archives_.add("docs/", {}, true);
    archives_.add("b.webm", bytes_of("webm-bytes"));
    archives_.add("a.mp4", bytes_of("mp4-bytes"));
    fetcher_.serve("http://host/videos.zip", bytes_of("PK\x03\x04"));
    start(prefix_);

    send(job(4, JobKind::EXTRACT_ARCHIVE_URL, 9, "http://host/videos.zip"));
    WorkerResult r = wait_result();
    ASSERT_TRUE(r.ok) << r.error;
    EXPECT_FALSE(r.result.multiple);
    EXPECT_EQ(r.result.items[0].mime_type, "video/webm");
    EXPECT_EQ(text_of(base64::decode(r.result.items[0].base64)), "webm-bytes");
    EXPECT_TRUE(prefix_.jobs().empty());

    ASSERT_EQ(archives_.opened().size(), 1u);
    EXPECT_EQ(text_of(archives_.opened()[0]), "PK\x03\x04");
    EXPECT_TRUE(saw_progress(9, "Done!", 100));
}

TEST_F(WorkerRuntimeTest, ExtractWithoutMediaFails) {
    archives_.add("readme.txt", bytes_of("hello"));
    fetcher_.serve("http://host/docs.zip", bytes_of("PK"));
    start(prefix_);

    send(job(6, JobKind::EXTRACT_ARCHIVE_URL, 1, "http://host/docs.zip"));
    WorkerResult r = wait_result();
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error_kind, ErrorKind::NO_MEDIA_FOUND);
    EXPECT_EQ(r.error, "No video file found in archive");
}

TEST_F(WorkerRuntimeTest, UnreadableArchiveIsEngineFailure) {
    archives_.set_fail(true);
    start(prefix_);

    send(job(7, JobKind::EXTRACT_ARCHIVE_DATA, 1, "", base64::encode(bytes_of("garbage"))));
    WorkerResult r = wait_result();
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error_kind, ErrorKind::ENGINE_FAILURE);
    EXPECT_EQ(r.error, "End of central directory not found");
}

TEST_F(WorkerRuntimeTest, ExtractFromDataReturnsEveryMediaSorted) {
    archives_.add("c.avi", bytes_of("avi"));
    archives_.add("a.mp4", bytes_of("mp4"));
    archives_.add("notes.txt", bytes_of("text"));
    archives_.add("b.mkv", bytes_of("mkv"));
    start(prefix_);

    send(job(8, JobKind::EXTRACT_ARCHIVE_DATA, 3, "", base64::encode(bytes_of("zip"))));
    WorkerResult r = wait_result();
    ASSERT_TRUE(r.ok) << r.error;
    ASSERT_TRUE(r.result.multiple);

    JobResult decoded = media::decode_result(r.result);
    const auto& mm = std::get<MultiMedia>(decoded);
    ASSERT_EQ(mm.items.size(), 3u);
    EXPECT_EQ(mm.items[0].name, "a.mp4");
    EXPECT_EQ(text_of(mm.items[0].data), "mp4");
    EXPECT_EQ(mm.items[1].name, "b.mkv");
    EXPECT_EQ(text_of(mm.items[1].data), "MP4:mkv");
    EXPECT_EQ(mm.items[2].name, "c.avi");
    EXPECT_EQ(text_of(mm.items[2].data), "MP4:avi");
    for (const auto& item : mm.items) EXPECT_EQ(item.mime_type, "video/mp4");

    auto jobs = prefix_.jobs();
    ASSERT_EQ(jobs.size(), 2u);
    EXPECT_EQ(jobs[0], "input_1.mkv -> output_1.mp4");
    EXPECT_EQ(jobs[1], "input_2.avi -> output_2.mp4");

    EXPECT_TRUE(saw_progress(3, "Extracting video 1/3...", 0));
    EXPECT_TRUE(saw_progress(3, "Transcoding video 3/3...", 100));
}

TEST_F(WorkerRuntimeTest, MalformedPayloadIsProtocolError) {
    start(prefix_);
    send(job(9, JobKind::EXTRACT_ARCHIVE_DATA, 1, "", "not*base64"));
    WorkerResult r = wait_result();
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error_kind, ErrorKind::PROTOCOL);
}

TEST_F(WorkerRuntimeTest, ChunkedInputAndChunkedResult) {
    cfg_.transport_ceiling = 16;
    archives_.add("b.avi", pattern_bytes(20, 2));
    archives_.add("a.mp4", pattern_bytes(40, 1));
    start(prefix_);

    std::vector<u8> zip = pattern_bytes(50, 9);
    std::string text = base64::encode(zip);
    auto parts = chunking::split(text, cfg_.transport_ceiling);
    ASSERT_EQ(parts.size(), 5u);

    JobDataStart ds;
    ds.job_id       = 11;
    ds.tab_id       = 4;
    ds.total_chunks = (u32)parts.size();
    ds.total_length = text.size();
    send(ds);
    for (u32 i = (u32)parts.size(); i-- > 0;) {
        JobDataChunk c;
        c.chunk_index = i;
        c.chunk       = parts[i];
        c.checksum    = hash::xxh3_32(parts[i]);
        send(c);
    }
    send(JobDataEnd{});

    ASSERT_TRUE(got_.wait_for_type<ResultEnd>());
    EXPECT_TRUE(got_.of_type<WorkerResult>().empty());
    ASSERT_EQ(archives_.opened().size(), 1u);
    EXPECT_EQ(archives_.opened()[0], zip);

    auto starts = got_.of_type<ResultStart>();
    ASSERT_EQ(starts.size(), 1u);
    EXPECT_EQ(starts[0].job_id, 11u);
    EXPECT_TRUE(starts[0].multiple);

    std::string joined;
    auto chunks = got_.of_type<ResultChunk>();
    ASSERT_EQ(chunks.size(), starts[0].total_chunks);
    EXPECT_EQ(starts[0].total_chunks, chunking::chunk_count(starts[0].total_length, 16));
    for (u32 i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].chunk_index, i);
        EXPECT_EQ(chunks[i].checksum, hash::xxh3_32(chunks[i].chunk));
        EXPECT_LE(chunks[i].chunk.size(), 16u);
        joined += chunks[i].chunk;
    }
    EXPECT_EQ(joined.size(), starts[0].total_length);

    JobResult decoded = media::decode_result(media::parse_multi(joined));
    const auto& mm = std::get<MultiMedia>(decoded);
    ASSERT_EQ(mm.items.size(), 2u);
    EXPECT_EQ(mm.items[0].data, pattern_bytes(40, 1));
    std::vector<u8> transcoded = bytes_of("MP4:");
    std::vector<u8> raw = pattern_bytes(20, 2);
    transcoded.insert(transcoded.end(), raw.begin(), raw.end());
    EXPECT_EQ(mm.items[1].data, transcoded);
}

TEST_F(WorkerRuntimeTest, ResultExactlyAtCeilingIsSentWhole) {
    cfg_.transport_ceiling = 16;
    fetcher_.serve("http://host/clip.avi", bytes_of("RIFFAVI!"));  // "MP4:" + 8 bytes
    start(prefix_);

    send(job(21, JobKind::TRANSCODE, 1, "http://host/clip.avi"));
    WorkerResult r = wait_result();
    ASSERT_TRUE(r.ok) << r.error;
    ASSERT_EQ(r.result.items.size(), 1u);
    EXPECT_EQ(r.result.items[0].base64.size(), 16u);
    EXPECT_TRUE(got_.of_type<ResultStart>().empty());
}

TEST_F(WorkerRuntimeTest, ResultOneOverCeilingIsChunked) {
    cfg_.transport_ceiling = 15;
    fetcher_.serve("http://host/clip.avi", bytes_of("RIFFAVI!"));
    start(prefix_);

    send(job(22, JobKind::TRANSCODE, 1, "http://host/clip.avi"));
    ASSERT_TRUE(got_.wait_for_type<ResultEnd>());
    EXPECT_TRUE(got_.of_type<WorkerResult>().empty());
    auto starts = got_.of_type<ResultStart>();
    ASSERT_EQ(starts.size(), 1u);
    EXPECT_EQ(starts[0].job_id, 22u);
    EXPECT_EQ(starts[0].total_length, 16u);
    EXPECT_EQ(starts[0].total_chunks, 2u);
    EXPECT_EQ(got_.of_type<ResultChunk>().size(), 2u);
}

TEST_F(WorkerRuntimeTest, CorruptInputChunkFailsJob) {
    cfg_.transport_ceiling = 8;
    start(prefix_);

    JobDataStart ds;
    ds.job_id       = 12;
    ds.tab_id       = 1;
    ds.total_chunks = 2;
    ds.total_length = 16;
    send(ds);
    JobDataChunk c0;
    c0.chunk_index = 0;
    c0.chunk       = "AAAAAAAA";
    c0.checksum    = hash::xxh3_32(c0.chunk) + 1;
    send(c0);
    JobDataChunk c1;
    c1.chunk_index = 1;
    c1.chunk       = "BBBBBBBB";
    c1.checksum    = hash::xxh3_32(c1.chunk);
    send(c1);
    send(JobDataEnd{});

    WorkerResult r = wait_result();
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.job_id, 12u);
    EXPECT_EQ(r.error_kind, ErrorKind::PROTOCOL);
    EXPECT_TRUE(archives_.opened().empty());
}

TEST_F(WorkerRuntimeTest, MissingInputChunkIsIncomplete) {
    cfg_.transport_ceiling = 8;
    start(prefix_);

    JobDataStart ds;
    ds.job_id       = 13;
    ds.tab_id       = 1;
    ds.total_chunks = 2;
    ds.total_length = 16;
    send(ds);
    JobDataChunk c0;
    c0.chunk_index = 0;
    c0.chunk       = "AAAAAAAA";
    c0.checksum    = hash::xxh3_32(c0.chunk);
    send(c0);
    send(JobDataEnd{});

    WorkerResult r = wait_result();
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error_kind, ErrorKind::INCOMPLETE_TRANSFER);
}
