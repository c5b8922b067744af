#pragma once

// ============================================================
// worker_manager.hpp -- Lazily creates the worker context and
//                       holds the connection to it
//
//   ensure_worker():
//     connection held?            -> return it
//     no context, none in flight  -> create, record the in-flight future
//     creation in flight          -> await the same future
//     then poll for WORKER_HELLO every connect_poll_interval_ms,
//     at most connect_poll_attempts times -> CREATION_TIMEOUT
//
//   wait_ready(): up to ready_timeout_ms for WORKER_READY; expiry
//   is logged and the caller proceeds.
//
// A disconnect clears the connection and the ready flag and marks the
// context stale. The next request destroys the stale context, whatever
// the host still reports for it, and runs the whole sequence again.
// ============================================================

#include "worker_host.hpp"
#include "../common/config.hpp"
#include "../common/message_port.hpp"
#include <memory>
#include <mutex>
#include <condition_variable>
#include <future>
#include <functional>

enum class Readiness {
    READY,
    TIMED_OUT_PROCEED,
};

class WorkerManager {
public:
    using MessageFn = std::function<void(Message)>;

    WorkerManager(WorkerHost& host, const RelayConfig& cfg);
    ~WorkerManager();

    WorkerManager(const WorkerManager&) = delete;
    WorkerManager& operator=(const WorkerManager&) = delete;

    // Receives every worker message except HELLO and READY, on the
    // port's delivery thread
    void set_message_handler(MessageFn fn);

    // Throws RelayError(CREATION_TIMEOUT)
    std::shared_ptr<MessagePort> ensure_worker();

    Readiness wait_ready();

    std::shared_ptr<MessagePort> connection() const;
    bool ready() const;

private:
    void on_host_connect(std::shared_ptr<MessagePort> port);
    void on_port_message(MessagePort* port, Message msg);
    void on_port_disconnect(MessagePort* port);

    // Runs the host's creation once for all concurrent callers
    void create_or_join();

    WorkerHost&  host_;
    RelayConfig  cfg_;

    mutable std::mutex           mutex_;
    std::condition_variable      cv_;
    std::shared_ptr<MessagePort> connection_;
    std::shared_ptr<MessagePort> candidate_;  // started, no HELLO yet
    bool                         ready_{false};
    bool                         creating_{false};
    bool                         stale_context_{false};
    std::shared_future<void>     creation_;
    MessageFn                    on_message_;
};
