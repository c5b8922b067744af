#pragma once

// ============================================================
// dispatcher_server.hpp -- Unix-socket front end of the dispatcher
//
// Concurrency model:
//   accept_loop()  -> accepts one client socket at a time and wraps
//                     it in a SocketPort.
//   port thread    -> one per client; reads a request, runs it
//                     through Dispatcher::handle_request and writes
//                     the reply. Job requests block this thread only.
//   ProgressRouter -> remembers which connection submitted each tab
//                     id and pushes PROGRESS frames there.
// ============================================================

#include "dispatcher.hpp"
#include "../common/config.hpp"
#include "../common/socket.hpp"
#include "../common/message_port.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <memory>
#include <atomic>
#include <mutex>

class ProgressRouter : public ProgressSink {
public:
    void bind(u32 tab_id, const std::shared_ptr<MessagePort>& port);
    void unbind(const MessagePort* port);

    // Dropped silently when the tab has no live connection
    void relay(const Progress& progress) override;

private:
    std::mutex                                            mutex_;
    std::unordered_map<u32, std::weak_ptr<MessagePort>>   tabs_;
};

class DispatcherServer {
public:
    DispatcherServer(std::string socket_path, Dispatcher& dispatcher,
                     ProgressRouter& router, const RelayConfig& cfg);
    ~DispatcherServer();

    // Bind the socket; separate from run() so callers know it is listening
    void listen();

    // Blocks until stop() is called
    int run();

    // Safe from a signal handler
    void stop();

    // Serve one already connected client port (accepted sockets, or an
    // in-process LocalPort)
    void attach(std::shared_ptr<MessagePort> port);

    const std::string& socket_path() const { return socket_path_; }

private:
    void accept_loop();
    void on_request(const std::weak_ptr<MessagePort>& weak, Message msg);
    void on_client_gone(const MessagePort* port);
    void close_all();

    std::string      socket_path_;
    Dispatcher&      dispatcher_;
    ProgressRouter&  router_;
    RelayConfig      cfg_;

    StreamSocket      listen_sock_;
    std::atomic<bool> running_{false};

    std::mutex                               clients_mutex_;
    std::vector<std::shared_ptr<MessagePort>> clients_;
    u64                                      accepted_{0};
};
