// ============================================================
// dispatcher_link.cpp
// ============================================================

#include "dispatcher_link.hpp"
#include "../common/logger.hpp"
#include "../common/socket.hpp"
#include <chrono>
#include <thread>
#include <algorithm>
#include <iostream>

DispatcherLink::DispatcherLink(std::shared_ptr<MessagePort> port)
    : port_(std::move(port))
{
    port_->start([this](Message msg) { on_message(std::move(msg)); },
                 [this] { on_disconnect(); });
}

DispatcherLink::~DispatcherLink() {
    close();
    // Joins the delivery thread while this object is still alive
    port_.reset();
}

void DispatcherLink::close() {
    if (port_) port_->close();
}

std::unique_ptr<DispatcherLink> DispatcherLink::connect(const std::string& socket_path,
                                                        int retry_secs, bool compress_frames,
                                                        const std::atomic<bool>* stop) {
    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() + std::chrono::seconds(retry_secs > 0 ? retry_secs : 0);

    int delay_ms = 250;
    const int max_delay_ms = 4000;

    for (;;) {
        try {
            StreamSocket sock = StreamSocket::connect_unix(socket_path);
            LOG_DEBUG("Connected to dispatcher at " + socket_path);
            return std::make_unique<DispatcherLink>(
                std::make_shared<SocketPort>(std::move(sock), compress_frames));
        } catch (const std::exception& e) {
            if (clock::now() >= deadline || (stop && stop->load())) {
                throw RelayError(ErrorKind::NETWORK_FAILURE,
                                 "Cannot reach dispatcher at " + socket_path + ": " + e.what());
            }
            std::cerr << "[vidbridge] dispatcher not ready, retry in "
                      << delay_ms / 1000.0 << "s\n";
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
            delay_ms = std::min(delay_ms * 2, max_delay_ms);
        }
    }
}

void DispatcherLink::set_progress_handler(ProgressFn fn) {
    std::lock_guard<std::mutex> lk(mutex_);
    on_progress_ = std::move(fn);
}

void DispatcherLink::on_message(Message msg) {
    if (auto* p = std::get_if<Progress>(&msg)) {
        ProgressFn fn;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            fn = on_progress_;
        }
        if (fn) fn(*p);
        return;
    }
    {
        std::lock_guard<std::mutex> lk(mutex_);
        replies_.push_back(std::move(msg));
    }
    cv_.notify_all();
}

void DispatcherLink::on_disconnect() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

Message DispatcherLink::request(const Message& req) {
    std::lock_guard<std::mutex> call_lk(call_mutex_);
    try {
        port_->post(req);
    } catch (const std::exception& e) {
        throw RelayError(ErrorKind::NETWORK_FAILURE,
                         std::string("Dispatcher connection lost: ") + e.what());
    }

    Message reply;
    {
        std::unique_lock<std::mutex> lk(mutex_);
        cv_.wait(lk, [this] { return !replies_.empty() || closed_; });
        if (replies_.empty()) {
            throw RelayError(ErrorKind::NETWORK_FAILURE, "Dispatcher connection lost");
        }
        reply = std::move(replies_.front());
        replies_.pop_front();
    }

    if (auto* err = std::get_if<ErrorReply>(&reply)) {
        throw RelayError(err->kind, err->message);
    }
    return reply;
}
