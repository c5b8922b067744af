#pragma once

// ============================================================
// dispatcher_link.hpp -- Client end of the dispatcher connection
//
// One request is outstanding at a time; the reply is the next
// non-PROGRESS message. PROGRESS frames may arrive at any time and
// go to the progress handler on the port's delivery thread.
// ============================================================

#include "../common/platform.hpp"
#include "../common/errors.hpp"
#include "../common/message.hpp"
#include "../common/message_port.hpp"
#include <memory>
#include <mutex>
#include <condition_variable>
#include <deque>
#include <functional>
#include <atomic>
#include <string>

class DispatcherLink {
public:
    using ProgressFn = std::function<void(const Progress&)>;

    // Starts delivery on the port
    explicit DispatcherLink(std::shared_ptr<MessagePort> port);
    ~DispatcherLink();

    DispatcherLink(const DispatcherLink&) = delete;
    DispatcherLink& operator=(const DispatcherLink&) = delete;

    // Connect to a dispatcher socket, retrying with back-off for up to
    // retry_secs. Throws RelayError(NETWORK_FAILURE).
    static std::unique_ptr<DispatcherLink> connect(const std::string& socket_path,
                                                   int retry_secs, bool compress_frames,
                                                   const std::atomic<bool>* stop = nullptr);

    void set_progress_handler(ProgressFn fn);

    // Send and wait for the reply. ERROR_REPLY is rethrown as RelayError;
    // a lost connection is RelayError(NETWORK_FAILURE).
    Message request(const Message& req);

    // request() expecting a reply of type T; anything else is
    // RelayError(PROTOCOL)
    template<typename T>
    T call(const Message& req) {
        Message reply = request(req);
        if (auto* r = std::get_if<T>(&reply)) return std::move(*r);
        throw RelayError(ErrorKind::PROTOCOL,
                         std::string("Unexpected reply ") +
                         proto::message_name(proto::message_type(reply)) + " to " +
                         proto::message_name(proto::message_type(req)));
    }

    void close();

private:
    void on_message(Message msg);
    void on_disconnect();

    std::shared_ptr<MessagePort> port_;

    std::mutex              call_mutex_;  // one request at a time

    std::mutex              mutex_;
    std::condition_variable cv_;
    std::deque<Message>     replies_;
    bool                    closed_{false};
    ProgressFn              on_progress_;
};
