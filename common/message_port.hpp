#pragma once

// ============================================================
// message_port.hpp -- Asynchronous, in-order message channel
//                     between two contexts
//
// Every port delivers inbound messages on one thread of its own,
// in the order the peer posted them. post() never waits for the
// peer to handle the message.
// ============================================================

#include "platform.hpp"
#include "message.hpp"
#include "socket.hpp"
#include <memory>
#include <functional>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <deque>
#include <atomic>
#include <utility>

class MessagePort {
public:
    using MessageHandler    = std::function<void(Message)>;
    using DisconnectHandler = std::function<void()>;

    virtual ~MessagePort() = default;

    // Begin delivery. on_disconnect runs once, on the delivery thread,
    // after the last message.
    virtual void start(MessageHandler on_message, DisconnectHandler on_disconnect) = 0;

    // Throws std::runtime_error when the port is closed or the write fails
    virtual void post(const Message& msg) = 0;

    // Idempotent; safe to call from a handler
    virtual void close() = 0;

    virtual bool connected() const = 0;
};

// In-process pair: each side's post() lands in the other side's inbox.
class LocalPort : public MessagePort {
public:
    static std::pair<std::shared_ptr<LocalPort>, std::shared_ptr<LocalPort>> create_pair();

    ~LocalPort() override;

    void start(MessageHandler on_message, DisconnectHandler on_disconnect) override;
    void post(const Message& msg) override;
    void close() override;
    bool connected() const override;

    struct Inbox {
        std::mutex              mutex;
        std::condition_variable cv;
        std::deque<Message>     queue;
        bool                    closed{false};
    };

private:
    LocalPort(std::shared_ptr<Inbox> inbox, std::shared_ptr<Inbox> peer);

    std::shared_ptr<Inbox> inbox_;
    std::shared_ptr<Inbox> peer_;
    std::thread            delivery_;
};

// Framed port over a connected stream socket. Payloads of at least
// COMPRESS_MIN_PAYLOAD bytes are zstd-compressed when enabled.
class SocketPort : public MessagePort {
public:
    SocketPort(StreamSocket sock, bool compress_frames);
    ~SocketPort() override;

    SocketPort(const SocketPort&) = delete;
    SocketPort& operator=(const SocketPort&) = delete;

    void start(MessageHandler on_message, DisconnectHandler on_disconnect) override;
    void post(const Message& msg) override;
    void close() override;
    bool connected() const override;

    struct Shared {
        StreamSocket      sock;
        std::mutex        write_mutex;
        std::atomic<bool> closed{false};
        bool              compress{true};
    };

private:
    std::shared_ptr<Shared> shared_;
    std::thread             reader_;
};

namespace proto {

// Frame payload for msg: flags set to FRAME_FLAG_ZSTD when compressed
std::vector<u8> pack_frame_payload(const Message& msg, bool compress, u16& flags);

// Inverse of pack_frame_payload; throws std::runtime_error on bad input
Message unpack_frame_payload(MsgType type, u16 flags, const std::vector<u8>& payload);

} // namespace proto
