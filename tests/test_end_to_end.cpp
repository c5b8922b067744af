// =============================================================================
// End-to-End Tests: client -> dispatcher -> worker in one process
// =============================================================================

#include <gtest/gtest.h>
#include "client/client_app.hpp"
#include "client/dispatcher_link.hpp"
#include "client/transfer_orchestrator.hpp"
#include "dispatcher/dispatcher_server.hpp"
#include "worker/worker_runtime.hpp"
#include "common/base64.hpp"
#include "common/chunking.hpp"
#include "common/file_io.hpp"
#include "tests/fakes.hpp"
#include <algorithm>
#include <chrono>
#include <thread>

class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        cfg_.transport_ceiling        = 150;
        cfg_.ready_timeout_ms         = 1000;
        cfg_.connect_poll_interval_ms = 10;
        cfg_.connect_poll_attempts    = 100;
        cfg_.job_timeout_ms           = 5000;
        cfg_.large_job_timeout_ms     = 5000;
    }

    void TearDown() override {
        orch_.reset();
        link_.reset();
        if (server_thread_.joinable()) {
            server_->stop();
            server_thread_.join();
        }
        server_.reset();
        dispatcher_.reset();
        manager_.reset();
        host_.reset();
    }

    // Worker runs the real WorkerRuntime, unless silent_ is set: then it
    // announces itself and never answers a job.
    void build() {
        host_ = std::make_unique<ThreadWorkerHost>([this](std::shared_ptr<MessagePort> port)
                                                   -> std::shared_ptr<void> {
            if (silent_) {
                port->start([this](Message m) { silent_inbox_.push(std::move(m)); }, nullptr);
                port->post(WorkerHello{1});
                port->post(WorkerReady{});
                silent_port_ = port;
                return port;
            }
            auto rt = std::make_shared<WorkerRuntime>(port, engine_, archives_,
                                                      worker_fetcher_, cfg_);
            rt->start();
            return rt;
        });
        manager_    = std::make_unique<WorkerManager>(*host_, cfg_);
        transfers_  = std::make_unique<TransferStore>(cfg_);
        results_    = std::make_unique<ResultStore>(cfg_);
        dispatcher_ = std::make_unique<Dispatcher>(*manager_, *transfers_, *results_, router_, cfg_);
        server_     = std::make_unique<DispatcherServer>(socket_path(), *dispatcher_, router_, cfg_);
    }

    // Client attached to the server over an in-process port pair
    TransferOrchestrator& connect_local(u32 tab = 1) {
        auto pair = LocalPort::create_pair();
        server_->attach(pair.first);
        link_ = std::make_unique<DispatcherLink>(pair.second);
        orch_ = std::make_unique<TransferOrchestrator>(*link_, client_fetcher_, cfg_, tab);
        orch_->set_status_handler([this](const std::string& text, u32) {
            std::lock_guard<std::mutex> lk(status_mutex_);
            statuses_.push_back(text);
        });
        return *orch_;
    }

    void serve_socket() {
        server_->listen();
        server_thread_ = std::thread([this] { server_->run(); });
    }

    std::string socket_path() { return (dir_.path() / "vidbridge.sock").string(); }

    bool saw_status(const std::string& s) {
        std::lock_guard<std::mutex> lk(status_mutex_);
        return std::find(statuses_.begin(), statuses_.end(), s) != statuses_.end();
    }

    file_io::TempDir                      dir_{"vidbridge_e2e_"};
    RelayConfig                           cfg_;
    PrefixEngine                          engine_;
    FakeArchiveReader                     archives_;
    FakeFetcher                           worker_fetcher_;
    FakeFetcher                           client_fetcher_;
    MessageCollector                      silent_inbox_;
    bool                                  silent_{false};
    std::shared_ptr<MessagePort>          silent_port_;
    std::mutex                            status_mutex_;
    std::vector<std::string>              statuses_;
    ProgressRouter                        router_;
    std::unique_ptr<ThreadWorkerHost>     host_;
    std::unique_ptr<WorkerManager>        manager_;
    std::unique_ptr<TransferStore>        transfers_;
    std::unique_ptr<ResultStore>          results_;
    std::unique_ptr<Dispatcher>           dispatcher_;
    std::unique_ptr<DispatcherServer>     server_;
    std::thread                           server_thread_;
    std::unique_ptr<DispatcherLink>       link_;
    std::unique_ptr<TransferOrchestrator> orch_;
};

// Upload above the ceiling goes up in chunks; the small result comes
// back inline.
TEST_F(EndToEndTest, LargeUploadSmallResult) {
    std::vector<u8> zip = pattern_bytes(300);        // 400 chars of base64
    std::vector<u8> video = pattern_bytes(60, 3);
    archives_.add("readme.txt", bytes_of("hi"));
    archives_.add("clip.avi", video);
    client_fetcher_.serve("http://host/clip.zip", zip);
    build();

    JobResult r = connect_local().extract_archive("http://host/clip.zip");

    const auto& single = std::get<SingleMedia>(r);
    std::vector<u8> expected = bytes_of("MP4:");
    expected.insert(expected.end(), video.begin(), video.end());
    EXPECT_EQ(single.data, expected);
    EXPECT_EQ(single.mime_type, "video/mp4");

    ASSERT_EQ(archives_.opened().size(), 1u);
    EXPECT_EQ(archives_.opened()[0], zip);
    EXPECT_TRUE(saw_status("Transferring... 33%"));
    EXPECT_TRUE(saw_status("Transferring... 100%"));
    EXPECT_FALSE(saw_status("Receiving result... 100%"));

    EXPECT_EQ(transfers_->size(), 0u);
    EXPECT_EQ(results_->size(), 0u);
    EXPECT_EQ(dispatcher_->pending_job_id(), 0u);
}

// Three videos in scrambled archive order come back sorted by name
TEST_F(EndToEndTest, ArchiveWithThreeVideos) {
    archives_.add("c.mkv", bytes_of("third"));
    archives_.add("__MACOSX/._a.mp4", bytes_of("junk"));
    archives_.add("a.mp4", bytes_of("first"));
    archives_.add("b.webm", bytes_of("second"));
    client_fetcher_.serve("http://host/three.zip", bytes_of("PK"));
    build();

    JobResult r = connect_local().extract_archive("http://host/three.zip");

    const auto& mm = std::get<MultiMedia>(r);
    ASSERT_EQ(mm.items.size(), 3u);
    EXPECT_EQ(mm.items[0].name, "a.mp4");
    EXPECT_EQ(text_of(mm.items[0].data), "first");
    EXPECT_EQ(mm.items[1].name, "b.webm");
    EXPECT_EQ(mm.items[1].mime_type, "video/webm");
    EXPECT_EQ(mm.items[2].name, "c.mkv");
    EXPECT_EQ(text_of(mm.items[2].data), "MP4:third");
    EXPECT_EQ(mm.items[2].mime_type, "video/mp4");
}

// Result above the ceiling travels worker -> dispatcher in chunks, is
// stored, and is pulled by the client
TEST_F(EndToEndTest, LargeResultIsPulled) {
    std::vector<u8> source = pattern_bytes(500, 5);
    worker_fetcher_.serve("http://host/big.flv", source);
    build();

    JobResult r = connect_local(7).transcode("http://host/big.flv");

    std::vector<u8> expected = bytes_of("MP4:");
    expected.insert(expected.end(), source.begin(), source.end());
    EXPECT_EQ(std::get<SingleMedia>(r).data, expected);
    EXPECT_TRUE(saw_status("Receiving result... 100%"));
    EXPECT_TRUE(saw_status("Transcoding..."));
    EXPECT_EQ(results_->size(), 0u);
    ASSERT_EQ(engine_.jobs().size(), 1u);
    EXPECT_EQ(engine_.jobs()[0], "input.flv -> output.mp4");
}

// The worker never answers: the caller gets JobTimeout, the slot is
// empty, and a late answer changes nothing
TEST_F(EndToEndTest, SilentWorkerTimesOut) {
    silent_ = true;
    cfg_.job_timeout_ms = 150;
    build();

    try {
        connect_local().transcode("http://host/clip.avi");
        FAIL() << "expected JobTimeout";
    } catch (const RelayError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::JOB_TIMEOUT);
        EXPECT_EQ(std::string(e.what()), "Transcoding timed out");
    }
    EXPECT_EQ(dispatcher_->pending_job_id(), 0u);

    auto jobs = silent_inbox_.of_type<JobStart>();
    ASSERT_EQ(jobs.size(), 1u);
    WorkerResult late;
    late.job_id = jobs[0].job_id;
    late.ok     = true;
    late.result = media::encode_result(SingleMedia{bytes_of("late"), "video/mp4"});
    silent_port_->post(late);

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(dispatcher_->pending_job_id(), 0u);
    EXPECT_EQ(results_->size(), 0u);
}

TEST_F(EndToEndTest, WorkerErrorReachesClient) {
    archives_.add("notes.txt", bytes_of("no video here"));
    worker_fetcher_.serve("http://host/docs.zip", bytes_of("PK"));
    build();

    try {
        connect_local().extract_archive_remote("http://host/docs.zip");
        FAIL() << "expected NoMediaFound";
    } catch (const RelayError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NO_MEDIA_FOUND);
        EXPECT_EQ(std::string(e.what()), "No video file found in archive");
    }
}

// Full client over the Unix socket, writing the playable files
TEST_F(EndToEndTest, ClientAppOverSocket) {
    archives_.add("b.avi", bytes_of("bee"));
    archives_.add("a.mp4", bytes_of("ay"));
    std::string zip_path = (dir_.path() / "videos.zip").string();
    file_io::write_file(zip_path, bytes_of("PK archive"));
    build();
    serve_socket();

    ClientConfig cc;
    cc.socket_path = socket_path();
    cc.mode        = ClientMode::EXTRACT;
    cc.url         = zip_path;
    cc.out_dir     = (dir_.path() / "out").string();
    cc.retry_secs  = 2;
    cc.relay       = cfg_;
    ClientApp app(cc);
    EXPECT_EQ(app.run(), 0);

    EXPECT_EQ(text_of(file_io::read_file((dir_.path() / "out" / "a.mp4").string())), "ay");
    EXPECT_EQ(text_of(file_io::read_file((dir_.path() / "out" / "b.mp4").string())), "MP4:bee");
    ASSERT_EQ(archives_.opened().size(), 1u);
    EXPECT_EQ(text_of(archives_.opened()[0]), "PK archive");
}

TEST_F(EndToEndTest, ClientAppReportsFailure) {
    build();
    serve_socket();

    ClientConfig cc;
    cc.socket_path = socket_path();
    cc.mode        = ClientMode::TRANSCODE;
    cc.url         = "http://host/missing.avi";
    cc.out_dir     = (dir_.path() / "out").string();
    cc.retry_secs  = 2;
    cc.relay       = cfg_;
    ClientApp app(cc);
    EXPECT_EQ(app.run(), 1);
    EXPECT_FALSE(fs::exists(dir_.path() / "out"));
}

TEST_F(EndToEndTest, ClientAppWithoutDispatcher) {
    ClientConfig cc;
    cc.socket_path = socket_path();
    cc.url         = "http://host/clip.avi";
    cc.out_dir     = (dir_.path() / "out").string();
    cc.retry_secs  = 0;
    ClientApp app(cc);
    EXPECT_EQ(app.run(), 1);
}

TEST(ClientOutputNameTest, ExtensionFollowsMimeType) {
    EXPECT_EQ(ClientApp::output_name("clip.avi", "video/mp4"), "clip.mp4");
    EXPECT_EQ(ClientApp::output_name("clip.m4v", "video/mp4"), "clip.m4v");
    EXPECT_EQ(ClientApp::output_name("clip.MP4", "video/mp4"), "clip.MP4");
    EXPECT_EQ(ClientApp::output_name("dir/clip.webm", "video/webm"), "dir/clip.webm");
    EXPECT_EQ(ClientApp::output_name("movie", "video/ogg"), "movie.ogg");
    EXPECT_EQ(ClientApp::output_name("", "video/mp4"), "video.mp4");
}
