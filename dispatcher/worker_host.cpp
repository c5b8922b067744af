// ============================================================
// worker_host.cpp
// ============================================================

#include "worker_host.hpp"
#include "../common/logger.hpp"
#include <sys/wait.h>
#include <stdexcept>

// ---- ProcessWorkerHost ----

ProcessWorkerHost::ProcessWorkerHost(std::string worker_path, std::vector<std::string> extra_args,
                                     bool compress_frames)
    : worker_path_(std::move(worker_path))
    , extra_args_(std::move(extra_args))
    , compress_(compress_frames)
{}

ProcessWorkerHost::~ProcessWorkerHost() {
    destroy_context();
}

void ProcessWorkerHost::set_connect_handler(ConnectHandler fn) {
    std::lock_guard<std::mutex> lk(mutex_);
    on_connect_ = std::move(fn);
}

void ProcessWorkerHost::reap_locked() {
    if (pid_ <= 0) return;
    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == pid_ || (r < 0 && errno == ECHILD)) {
        if (r == pid_ && WIFEXITED(status)) {
            LOG_INFO("Worker process " + std::to_string(pid_) + " exited with code " +
                     std::to_string(WEXITSTATUS(status)));
        } else {
            LOG_WARN("Worker process " + std::to_string(pid_) + " is gone");
        }
        pid_ = -1;
    }
}

bool ProcessWorkerHost::has_context() {
    std::lock_guard<std::mutex> lk(mutex_);
    reap_locked();
    return pid_ > 0;
}

void ProcessWorkerHost::create_context() {
    ConnectHandler on_connect;
    std::shared_ptr<MessagePort> port;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        reap_locked();
        if (pid_ > 0) return;

        auto pair = StreamSocket::make_pair();
        int child_fd = pair.second.native();

        // argv is built before fork; the child only execs
        std::vector<std::string> args;
        args.push_back(worker_path_);
        args.push_back("--fd");
        args.push_back(std::to_string(child_fd));
        if (!compress_) args.push_back("--no-compress");
        for (auto& a : extra_args_) args.push_back(a);

        std::vector<char*> cargv;
        for (auto& a : args) cargv.push_back(const_cast<char*>(a.c_str()));
        cargv.push_back(nullptr);

        pid_t pid = ::fork();
        if (pid < 0) {
            throw std::runtime_error("fork() failed: " + socket_error_str(errno));
        }
        if (pid == 0) {
            ::fcntl(child_fd, F_SETFD, 0);
            ::execvp(cargv[0], cargv.data());
            _exit(127);
        }

        pair.second.close();
        pid_ = pid;
        LOG_INFO("Started worker process " + std::to_string(pid) + " (" + worker_path_ + ")");

        port = std::make_shared<SocketPort>(std::move(pair.first), compress_);
        on_connect = on_connect_;
    }
    if (on_connect) on_connect(std::move(port));
}

void ProcessWorkerHost::destroy_context() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (pid_ <= 0) return;
    ::kill(pid_, SIGTERM);
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
    LOG_INFO("Stopped worker process " + std::to_string(pid_));
    pid_ = -1;
}

// ---- ThreadWorkerHost ----

ThreadWorkerHost::ThreadWorkerHost(WorkerFactory factory)
    : factory_(std::move(factory))
{}

ThreadWorkerHost::~ThreadWorkerHost() {
    destroy_context();
}

void ThreadWorkerHost::set_connect_handler(ConnectHandler fn) {
    std::lock_guard<std::mutex> lk(mutex_);
    on_connect_ = std::move(fn);
}

bool ThreadWorkerHost::has_context() {
    std::lock_guard<std::mutex> lk(mutex_);
    return worker_ && worker_port_ && worker_port_->connected();
}

void ThreadWorkerHost::create_context() {
    ConnectHandler on_connect;
    std::shared_ptr<MessagePort> dispatcher_side;
    std::shared_ptr<void> stale;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (worker_ && worker_port_ && worker_port_->connected()) return;
        stale = std::move(worker_);

        auto pair = LocalPort::create_pair();
        dispatcher_side = pair.first;
        worker_port_    = pair.second;
        on_connect      = on_connect_;
    }
    // Released outside the lock: a worker's destructor waits for its port
    stale.reset();

    // Hand over the dispatcher side before the worker starts posting, so
    // HELLO is queued on a port somebody listens to.
    if (on_connect) on_connect(dispatcher_side);

    std::shared_ptr<MessagePort> worker_port;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        worker_port = worker_port_;
    }
    std::shared_ptr<void> worker = factory_(worker_port);
    if (!worker) {
        throw std::runtime_error("Worker factory returned no worker");
    }
    std::lock_guard<std::mutex> lk(mutex_);
    worker_ = std::move(worker);
    LOG_INFO("Started in-process worker");
}

void ThreadWorkerHost::destroy_context() {
    std::shared_ptr<void> worker;
    std::shared_ptr<MessagePort> port;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        worker = std::move(worker_);
        port   = std::move(worker_port_);
    }
    if (port) port->close();
    worker.reset();
}
