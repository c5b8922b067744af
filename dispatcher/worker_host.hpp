#pragma once

// ============================================================
// worker_host.hpp -- Where the worker context lives
//
// A host creates the worker context and hands the dispatcher the
// port that reaches it. The port is not yet started; the manager
// treats it as the live connection once WORKER_HELLO arrives on it.
// ============================================================

#include "../common/platform.hpp"
#include "../common/message_port.hpp"
#include <memory>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

class WorkerHost {
public:
    using ConnectHandler = std::function<void(std::shared_ptr<MessagePort>)>;

    virtual ~WorkerHost() = default;

    // Called once per created context with its dispatcher-side port
    virtual void set_connect_handler(ConnectHandler fn) = 0;

    virtual bool has_context() = 0;

    // Start a new context. Throws std::runtime_error if it cannot be started.
    virtual void create_context() = 0;

    virtual void destroy_context() = 0;
};

// vidbridge_worker child process, connected over a socketpair (--fd N)
class ProcessWorkerHost : public WorkerHost {
public:
    ProcessWorkerHost(std::string worker_path, std::vector<std::string> extra_args,
                      bool compress_frames);
    ~ProcessWorkerHost() override;

    void set_connect_handler(ConnectHandler fn) override;
    bool has_context() override;
    void create_context() override;
    void destroy_context() override;

private:
    void reap_locked();

    std::string              worker_path_;
    std::vector<std::string> extra_args_;
    bool                     compress_;

    std::mutex               mutex_;
    ConnectHandler           on_connect_;
    pid_t                    pid_{-1};
};

// Worker side built in this process on a LocalPort pair
class ThreadWorkerHost : public WorkerHost {
public:
    // Builds the worker on its port; the returned handle keeps it alive
    using WorkerFactory = std::function<std::shared_ptr<void>(std::shared_ptr<MessagePort>)>;

    explicit ThreadWorkerHost(WorkerFactory factory);
    ~ThreadWorkerHost() override;

    void set_connect_handler(ConnectHandler fn) override;
    bool has_context() override;
    void create_context() override;
    void destroy_context() override;

private:
    WorkerFactory         factory_;

    std::mutex            mutex_;
    ConnectHandler        on_connect_;
    std::shared_ptr<void> worker_;
    std::shared_ptr<MessagePort> worker_port_;
};
