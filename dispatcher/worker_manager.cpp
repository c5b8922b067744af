// ============================================================
// worker_manager.cpp
// ============================================================

#include "worker_manager.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include <chrono>

WorkerManager::WorkerManager(WorkerHost& host, const RelayConfig& cfg)
    : host_(host)
    , cfg_(cfg)
{
    host_.set_connect_handler([this](std::shared_ptr<MessagePort> port) {
        on_host_connect(std::move(port));
    });
}

WorkerManager::~WorkerManager() {
    host_.set_connect_handler(nullptr);
    std::shared_ptr<MessagePort> conn, cand;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        conn = std::move(connection_);
        cand = std::move(candidate_);
        on_message_ = nullptr;
    }
    if (conn) conn->close();
    if (cand) cand->close();
}

void WorkerManager::set_message_handler(MessageFn fn) {
    std::lock_guard<std::mutex> lk(mutex_);
    on_message_ = std::move(fn);
}

std::shared_ptr<MessagePort> WorkerManager::connection() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return connection_;
}

bool WorkerManager::ready() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return ready_;
}

void WorkerManager::on_host_connect(std::shared_ptr<MessagePort> port) {
    MessagePort* raw = port.get();
    std::shared_ptr<MessagePort> replaced;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        replaced  = std::move(candidate_);
        candidate_ = port;
    }
    if (replaced) replaced->close();

    // Handlers hold the raw pointer only: the port owns them
    port->start([this, raw](Message msg) { on_port_message(raw, std::move(msg)); },
                [this, raw] { on_port_disconnect(raw); });
}

void WorkerManager::on_port_message(MessagePort* port, Message msg) {
    if (auto* hello = std::get_if<WorkerHello>(&msg)) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (candidate_.get() == port) {
            connection_ = std::move(candidate_);
            ready_ = false;
            LOG_INFO("Worker connected (pid " + std::to_string(hello->pid) + ")");
        }
        cv_.notify_all();
        return;
    }
    if (std::holds_alternative<WorkerReady>(msg)) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (connection_.get() == port) {
            ready_ = true;
            LOG_INFO("Worker ready");
        }
        cv_.notify_all();
        return;
    }

    MessageFn fn;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (connection_.get() != port) {
            LOG_WARN(std::string("Dropping ") + proto::message_name(proto::message_type(msg)) +
                     " from a stale worker connection");
            return;
        }
        fn = on_message_;
    }
    if (fn) fn(std::move(msg));
}

void WorkerManager::on_port_disconnect(MessagePort* port) {
    // May drop the last reference; the port then detaches this thread
    std::shared_ptr<MessagePort> gone;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (connection_.get() == port) {
            gone = std::move(connection_);
            ready_ = false;
            stale_context_ = true;
            LOG_WARN("Worker disconnected");
        } else if (candidate_.get() == port) {
            gone = std::move(candidate_);
            stale_context_ = true;
            LOG_WARN("Worker closed before announcing itself");
        }
        cv_.notify_all();
    }
}

void WorkerManager::create_or_join() {
    std::shared_future<void> fut;
    bool owner = false;
    std::promise<void> promise;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (creating_) {
            fut = creation_;
        } else {
            creating_ = true;
            owner     = true;
            creation_ = promise.get_future().share();
            fut       = creation_;
        }
    }

    if (owner) {
        try {
            bool stale = false;
            {
                std::lock_guard<std::mutex> lk(mutex_);
                std::swap(stale, stale_context_);
            }
            // The host may still see the old context alive (a process
            // draining its jobs) though its connection is gone
            if (stale) {
                LOG_INFO("Destroying disconnected worker context");
                host_.destroy_context();
            }
            if (!host_.has_context()) {
                LOG_INFO("Creating worker context");
                host_.create_context();
            }
            promise.set_value();
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("Worker context creation failed: ") + e.what());
            promise.set_exception(std::make_exception_ptr(
                RelayError(ErrorKind::CREATION_TIMEOUT,
                           std::string("Worker context creation failed: ") + e.what())));
        }
        std::lock_guard<std::mutex> lk(mutex_);
        creating_ = false;
    }

    fut.get();
}

std::shared_ptr<MessagePort> WorkerManager::ensure_worker() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (connection_) return connection_;
    }

    create_or_join();

    std::unique_lock<std::mutex> lk(mutex_);
    auto interval = std::chrono::milliseconds(cfg_.connect_poll_interval_ms);
    for (u32 attempt = 0; attempt < cfg_.connect_poll_attempts; ++attempt) {
        if (cv_.wait_for(lk, interval, [this] { return connection_ != nullptr; })) {
            return connection_;
        }
    }
    if (connection_) return connection_;
    throw RelayError(ErrorKind::CREATION_TIMEOUT, "Worker context did not connect");
}

Readiness WorkerManager::wait_ready() {
    std::unique_lock<std::mutex> lk(mutex_);
    if (cv_.wait_for(lk, std::chrono::milliseconds(cfg_.ready_timeout_ms),
                     [this] { return ready_; })) {
        return Readiness::READY;
    }
    LOG_WARN("Worker not ready after " + std::to_string(cfg_.ready_timeout_ms) +
             " ms, proceeding");
    return Readiness::TIMED_OUT_PROCEED;
}
