// ============================================================
// message_port.cpp -- LocalPort and SocketPort
// ============================================================

#include "message_port.hpp"
#include "protocol_io.hpp"
#include "compress.hpp"
#include "logger.hpp"
#include <stdexcept>

namespace {

void dispatch_one(const MessagePort::MessageHandler& on_message, Message msg) {
    MsgType type = proto::message_type(msg);
    try {
        on_message(std::move(msg));
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Handler for ") + proto::message_name(type) +
                  " failed: " + e.what());
    }
}

void local_delivery_loop(std::shared_ptr<LocalPort::Inbox> inbox,
                         MessagePort::MessageHandler on_message,
                         MessagePort::DisconnectHandler on_disconnect) {
    for (;;) {
        Message msg;
        {
            std::unique_lock<std::mutex> lk(inbox->mutex);
            inbox->cv.wait(lk, [&] { return !inbox->queue.empty() || inbox->closed; });
            if (inbox->queue.empty()) break;  // closed and drained
            msg = std::move(inbox->queue.front());
            inbox->queue.pop_front();
        }
        dispatch_one(on_message, std::move(msg));
    }
    if (on_disconnect) on_disconnect();
}

void socket_reader_loop(std::shared_ptr<SocketPort::Shared> shared,
                        MessagePort::MessageHandler on_message,
                        MessagePort::DisconnectHandler on_disconnect) {
    std::vector<u8> payload;
    for (;;) {
        FrameHeader hdr{};
        bool ok = false;
        try {
            ok = shared->sock.read_frame(hdr, payload);
        } catch (const std::exception& e) {
            if (!shared->closed) LOG_WARN(std::string("Port read failed: ") + e.what());
            break;
        }
        if (!ok) break;

        Message msg;
        try {
            msg = proto::unpack_frame_payload((MsgType)hdr.msg_type, hdr.flags, payload);
        } catch (const std::exception& e) {
            // Framing is intact, only this message is lost
            LOG_ERROR("Dropping malformed frame (type=" + std::to_string(hdr.msg_type) +
                      "): " + e.what());
            continue;
        }
        dispatch_one(on_message, std::move(msg));
    }
    shared->closed = true;
    if (on_disconnect) on_disconnect();
}

void join_or_detach(std::thread& t) {
    if (!t.joinable()) return;
    if (t.get_id() == std::this_thread::get_id()) {
        // Last owner dropped from inside a handler; the loop only
        // touches state it co-owns, so it may finish on its own.
        t.detach();
    } else {
        t.join();
    }
}

} // namespace

// ---------------------------------------------------------------
// LocalPort
// ---------------------------------------------------------------

std::pair<std::shared_ptr<LocalPort>, std::shared_ptr<LocalPort>> LocalPort::create_pair() {
    auto a = std::make_shared<Inbox>();
    auto b = std::make_shared<Inbox>();
    std::shared_ptr<LocalPort> left(new LocalPort(a, b));
    std::shared_ptr<LocalPort> right(new LocalPort(b, a));
    return {left, right};
}

LocalPort::LocalPort(std::shared_ptr<Inbox> inbox, std::shared_ptr<Inbox> peer)
    : inbox_(std::move(inbox))
    , peer_(std::move(peer))
{}

LocalPort::~LocalPort() {
    close();
    join_or_detach(delivery_);
}

void LocalPort::start(MessageHandler on_message, DisconnectHandler on_disconnect) {
    if (delivery_.joinable()) {
        throw std::logic_error("LocalPort already started");
    }
    delivery_ = std::thread(local_delivery_loop, inbox_,
                            std::move(on_message), std::move(on_disconnect));
}

void LocalPort::post(const Message& msg) {
    {
        std::lock_guard<std::mutex> lk(inbox_->mutex);
        if (inbox_->closed) throw std::runtime_error("Port closed");
    }
    {
        std::lock_guard<std::mutex> lk(peer_->mutex);
        if (peer_->closed) throw std::runtime_error("Peer port closed");
        peer_->queue.push_back(msg);
    }
    peer_->cv.notify_one();
}

void LocalPort::close() {
    for (auto* box : {inbox_.get(), peer_.get()}) {
        {
            std::lock_guard<std::mutex> lk(box->mutex);
            box->closed = true;
        }
        box->cv.notify_all();
    }
}

bool LocalPort::connected() const {
    std::lock_guard<std::mutex> lk(inbox_->mutex);
    return !inbox_->closed;
}

// ---------------------------------------------------------------
// SocketPort
// ---------------------------------------------------------------

SocketPort::SocketPort(StreamSocket sock, bool compress_frames)
    : shared_(std::make_shared<Shared>())
{
    shared_->sock     = std::move(sock);
    shared_->compress = compress_frames;
}

SocketPort::~SocketPort() {
    close();
    join_or_detach(reader_);
}

void SocketPort::start(MessageHandler on_message, DisconnectHandler on_disconnect) {
    if (reader_.joinable()) {
        throw std::logic_error("SocketPort already started");
    }
    reader_ = std::thread(socket_reader_loop, shared_,
                          std::move(on_message), std::move(on_disconnect));
}

void SocketPort::post(const Message& msg) {
    if (shared_->closed) throw std::runtime_error("Port closed");
    u16 flags = 0;
    std::vector<u8> payload = proto::pack_frame_payload(msg, shared_->compress, flags);
    std::lock_guard<std::mutex> lk(shared_->write_mutex);
    shared_->sock.write_frame(proto::message_type(msg), flags,
                              payload.data(), (u32)payload.size());
}

void SocketPort::close() {
    if (!shared_->closed.exchange(true)) {
        // The reader still owns the descriptor; shutdown wakes it
        shared_->sock.shutdown();
    }
}

bool SocketPort::connected() const {
    return !shared_->closed;
}

// ---------------------------------------------------------------
// Frame payload packing
// ---------------------------------------------------------------

namespace proto {

std::vector<u8> pack_frame_payload(const Message& msg, bool compress, u16& flags) {
    flags = 0;
    std::vector<u8> raw = encode_payload(msg);
    if (compress && raw.size() >= COMPRESS_MIN_PAYLOAD) {
        std::vector<u8> z = compress::compress_to_vec(raw.data(), raw.size());
        if (z.size() + 4 < raw.size()) {
            WireWriter w;
            w.u32v((u32)raw.size());
            std::vector<u8> out = w.take();
            out.insert(out.end(), z.begin(), z.end());
            flags = FRAME_FLAG_ZSTD;
            raw = std::move(out);
        }
    }
    if (raw.size() > MAX_FRAME_LEN) {
        throw std::runtime_error(std::string("Frame too large: ") + message_name(message_type(msg)) +
                                 " payload " + std::to_string(raw.size()) + " bytes");
    }
    return raw;
}

Message unpack_frame_payload(MsgType type, u16 flags, const std::vector<u8>& payload) {
    if (!(flags & FRAME_FLAG_ZSTD)) {
        return decode_payload(type, payload.data(), payload.size());
    }
    WireReader r(payload);
    u32 raw_len = r.u32v();
    if (raw_len > MAX_FRAME_LEN) {
        throw std::runtime_error("Decompressed frame too large: " + std::to_string(raw_len));
    }
    std::vector<u8> raw = compress::decompress_to_vec(payload.data() + 4, payload.size() - 4,
                                                      raw_len);
    return decode_payload(type, raw.data(), raw.size());
}

} // namespace proto
