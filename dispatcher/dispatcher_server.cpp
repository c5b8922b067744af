// ============================================================
// dispatcher_server.cpp
// ============================================================

#include "dispatcher_server.hpp"
#include "../common/logger.hpp"
#include <algorithm>

// ---- ProgressRouter ----

void ProgressRouter::bind(u32 tab_id, const std::shared_ptr<MessagePort>& port) {
    std::lock_guard<std::mutex> lk(mutex_);
    tabs_[tab_id] = port;
}

void ProgressRouter::unbind(const MessagePort* port) {
    std::lock_guard<std::mutex> lk(mutex_);
    for (auto it = tabs_.begin(); it != tabs_.end();) {
        auto p = it->second.lock();
        if (!p || p.get() == port) {
            it = tabs_.erase(it);
        } else {
            ++it;
        }
    }
}

void ProgressRouter::relay(const Progress& progress) {
    std::shared_ptr<MessagePort> port;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = tabs_.find(progress.tab_id);
        if (it == tabs_.end()) return;
        port = it->second.lock();
    }
    if (!port || !port->connected()) return;
    port->post(progress);
}

// ---- DispatcherServer ----

DispatcherServer::DispatcherServer(std::string socket_path, Dispatcher& dispatcher,
                                   ProgressRouter& router, const RelayConfig& cfg)
    : socket_path_(std::move(socket_path))
    , dispatcher_(dispatcher)
    , router_(router)
    , cfg_(cfg)
{}

DispatcherServer::~DispatcherServer() {
    stop();
    close_all();
}

void DispatcherServer::listen() {
    listen_sock_ = StreamSocket::listen_unix(socket_path_);
    running_.store(true);
    LOG_INFO("Dispatcher listening on " + socket_path_);
}

int DispatcherServer::run() {
    if (!listen_sock_.is_valid()) listen();

    accept_loop();

    close_all();
    listen_sock_.close();
    ::unlink(socket_path_.c_str());
    LOG_INFO("Dispatcher stopped after " + std::to_string(accepted_) + " connections");
    return 0;
}

void DispatcherServer::stop() {
    running_.store(false);
    // shutdown() wakes accept(); close happens on the run() thread
    listen_sock_.shutdown();
}

void DispatcherServer::accept_loop() {
    while (running_.load()) {
        try {
            StreamSocket sock = listen_sock_.accept();
            if (!running_.load()) break;
            ++accepted_;
            LOG_DEBUG("Accepted client connection #" + std::to_string(accepted_));
            attach(std::make_shared<SocketPort>(std::move(sock), cfg_.compress_frames));
        } catch (const std::exception& e) {
            if (!running_.load()) break;
            LOG_ERROR("accept_loop: " + std::string(e.what()));
        }
    }
}

void DispatcherServer::attach(std::shared_ptr<MessagePort> port) {
    std::weak_ptr<MessagePort> weak = port;
    const MessagePort* raw = port.get();
    {
        std::lock_guard<std::mutex> lk(clients_mutex_);
        clients_.push_back(port);
    }
    port->start([this, weak](Message msg) { on_request(weak, std::move(msg)); },
                [this, raw] { on_client_gone(raw); });
}

void DispatcherServer::on_request(const std::weak_ptr<MessagePort>& weak, Message msg) {
    // Progress for a tab goes to the connection that last submitted for it
    if (auto port = weak.lock()) {
        if (auto* req = std::get_if<JobRequest>(&msg)) {
            router_.bind(req->tab_id, port);
        } else if (auto* proc = std::get_if<UploadProcess>(&msg)) {
            router_.bind(proc->tab_id, port);
        }
    }

    // No strong reference while the request runs, so close_all() joins
    // this thread
    Message reply = dispatcher_.handle_request(msg);
    auto port = weak.lock();
    if (!port) return;
    try {
        port->post(reply);
    } catch (const std::exception& e) {
        LOG_WARN(std::string("Client went away before its reply: ") + e.what());
    }
}

void DispatcherServer::on_client_gone(const MessagePort* port) {
    router_.unbind(port);
    std::shared_ptr<MessagePort> gone;
    {
        std::lock_guard<std::mutex> lk(clients_mutex_);
        auto it = std::find_if(clients_.begin(), clients_.end(),
                               [port](const std::shared_ptr<MessagePort>& p) { return p.get() == port; });
        if (it != clients_.end()) {
            gone = std::move(*it);
            clients_.erase(it);
        }
    }
    LOG_DEBUG("Client disconnected");
}

void DispatcherServer::close_all() {
    std::vector<std::shared_ptr<MessagePort>> clients;
    {
        std::lock_guard<std::mutex> lk(clients_mutex_);
        clients.swap(clients_);
    }
    for (auto& c : clients) c->close();
    // Joins each client's thread; a job in flight finishes or times out first
    clients.clear();
}
