// =============================================================================
// Message Port Tests
// =============================================================================

#include <gtest/gtest.h>
#include "common/message_port.hpp"
#include "common/socket.hpp"
#include "tests/fakes.hpp"
#include <stdexcept>

namespace {

Progress progress_msg(u32 pct) {
    Progress p;
    p.tab_id   = 7;
    p.status   = "Converting... " + std::to_string(pct) + "%";
    p.progress = pct;
    return p;
}

void start_collecting(MessagePort& port, MessageCollector& into) {
    port.start([&into](Message m) { into.push(std::move(m)); },
               [&into] { into.disconnected(); });
}

} // namespace

// ---- LocalPort ----

TEST(LocalPortTest, DeliversInPostOrder) {
    MessageCollector got;
    auto pair = LocalPort::create_pair();
    start_collecting(*pair.second, got);
    pair.first->start([](Message) {}, nullptr);

    for (u32 i = 0; i < 100; ++i) pair.first->post(progress_msg(i));

    ASSERT_TRUE(got.wait_for([](const std::vector<Message>& ms) { return ms.size() == 100; }));
    auto seen = got.of_type<Progress>();
    for (u32 i = 0; i < seen.size(); ++i) EXPECT_EQ(seen[i].progress, i);
}

TEST(LocalPortTest, MessagesPostedBeforeStartAreKept) {
    MessageCollector got;
    auto pair = LocalPort::create_pair();
    pair.first->post(WorkerHello{42});
    pair.first->post(WorkerReady{});

    start_collecting(*pair.second, got);
    ASSERT_TRUE(got.wait_for_type<WorkerReady>());
    auto hello = got.of_type<WorkerHello>();
    ASSERT_EQ(hello.size(), 1u);
    EXPECT_EQ(hello[0].pid, 42u);
}

TEST(LocalPortTest, CloseDisconnectsBothSides) {
    MessageCollector left, right;
    auto pair = LocalPort::create_pair();
    start_collecting(*pair.first, left);
    start_collecting(*pair.second, right);

    pair.first->close();
    EXPECT_TRUE(left.wait_closed());
    EXPECT_TRUE(right.wait_closed());
    EXPECT_FALSE(pair.first->connected());
    EXPECT_FALSE(pair.second->connected());

    EXPECT_THROW(pair.first->post(WorkerReady{}), std::runtime_error);
    EXPECT_THROW(pair.second->post(WorkerReady{}), std::runtime_error);
}

TEST(LocalPortTest, HandlerExceptionDoesNotStopDelivery) {
    MessageCollector got;
    auto pair = LocalPort::create_pair();
    pair.second->start([&got](Message m) {
        if (std::holds_alternative<WorkerHello>(m)) throw std::runtime_error("boom");
        got.push(std::move(m));
    }, nullptr);

    pair.first->post(WorkerHello{1});
    pair.first->post(WorkerReady{});
    EXPECT_TRUE(got.wait_for_type<WorkerReady>());
}

TEST(LocalPortTest, StartTwiceIsAnError) {
    auto pair = LocalPort::create_pair();
    pair.first->start([](Message) {}, nullptr);
    EXPECT_THROW(pair.first->start([](Message) {}, nullptr), std::logic_error);
}

// ---- SocketPort ----

class SocketPortTest : public ::testing::Test {
protected:
    void make_ports(bool compress) {
        auto socks = StreamSocket::make_pair();
        a_ = std::make_shared<SocketPort>(std::move(socks.first), compress);
        b_ = std::make_shared<SocketPort>(std::move(socks.second), compress);
        start_collecting(*a_, got_a_);
        start_collecting(*b_, got_b_);
    }

    void TearDown() override {
        if (a_) a_->close();
        if (b_) b_->close();
    }

    // Ports are destroyed first, joining the threads that feed the collectors
    MessageCollector            got_a_, got_b_;
    std::shared_ptr<SocketPort> a_, b_;
};

TEST_F(SocketPortTest, ExchangesTypedMessages) {
    make_ports(true);

    JobStart js;
    js.job_id     = 9;
    js.kind       = JobKind::EXTRACT_ARCHIVE_URL;
    js.tab_id     = 3;
    js.source_url = "http://host/videos.zip";
    a_->post(js);
    b_->post(progress_msg(50));

    ASSERT_TRUE(got_b_.wait_for_type<JobStart>());
    ASSERT_TRUE(got_a_.wait_for_type<Progress>());

    JobStart back = got_b_.of_type<JobStart>().front();
    EXPECT_EQ(back.job_id, 9u);
    EXPECT_EQ(back.kind, JobKind::EXTRACT_ARCHIVE_URL);
    EXPECT_EQ(back.tab_id, 3u);
    EXPECT_EQ(back.source_url, "http://host/videos.zip");
    EXPECT_EQ(got_a_.of_type<Progress>().front().progress, 50u);
}

TEST_F(SocketPortTest, LargeCompressibleMessage) {
    make_ports(true);

    ResultChunk rc;
    rc.chunk_index = 1;
    rc.chunk       = std::string(2 * 1024 * 1024, 'Q');
    rc.checksum    = 77;
    a_->post(rc);

    ASSERT_TRUE(got_b_.wait_for_type<ResultChunk>());
    ResultChunk back = got_b_.of_type<ResultChunk>().front();
    EXPECT_EQ(back.chunk, rc.chunk);
    EXPECT_EQ(back.checksum, 77u);
}

TEST_F(SocketPortTest, UncompressedPeers) {
    make_ports(false);

    JobDataChunk c;
    c.chunk_index = 4;
    c.chunk       = std::string(200000, 'z');
    a_->post(c);

    ASSERT_TRUE(got_b_.wait_for_type<JobDataChunk>());
    EXPECT_EQ(got_b_.of_type<JobDataChunk>().front().chunk.size(), 200000u);
}

TEST_F(SocketPortTest, CloseReachesPeer) {
    make_ports(true);
    a_->close();
    EXPECT_TRUE(got_a_.wait_closed());
    EXPECT_TRUE(got_b_.wait_closed());
    EXPECT_THROW(a_->post(WorkerReady{}), std::runtime_error);
}
