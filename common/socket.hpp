#pragma once

// ============================================================
// socket.hpp -- RAII stream socket wrapper (AF_UNIX)
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include <string>
#include <stdexcept>
#include <vector>
#include <utility>

class StreamSocket {
public:
    StreamSocket() = default;
    explicit StreamSocket(socket_t fd);
    ~StreamSocket();

    // Non-copyable
    StreamSocket(const StreamSocket&) = delete;
    StreamSocket& operator=(const StreamSocket&) = delete;

    // Movable
    StreamSocket(StreamSocket&& o) noexcept;
    StreamSocket& operator=(StreamSocket&& o) noexcept;

    // Client: connect to a Unix-domain socket path
    static StreamSocket connect_unix(const std::string& path);

    // Server: unlink any stale path, bind + listen
    static StreamSocket listen_unix(const std::string& path, int backlog = 64);

    // Connected pair for a parent/child process (socketpair AF_UNIX)
    static std::pair<StreamSocket, StreamSocket> make_pair();

    // Accept one connection (blocking)
    StreamSocket accept();

    // Send exactly 'len' bytes; throws on error
    void send_all(const void* buf, size_t len);

    // Receive exactly 'len' bytes; returns false on clean close
    bool recv_all(void* buf, size_t len);

    // Send a complete frame (header + payload)
    void write_frame(MsgType type, u16 flags, const void* payload, u32 payload_len);

    // Read next frame: fills header, resizes payload_buf and reads payload
    // Returns false on clean close (peer disconnected)
    bool read_frame(FrameHeader& hdr, std::vector<u8>& payload_buf);

    bool is_valid() const { return fd_ != INVALID_SOCKET_VAL; }
    socket_t native() const { return fd_; }

    // Wake a thread blocked in recv on this socket
    void shutdown();

    void close();

private:
    socket_t fd_{INVALID_SOCKET_VAL};
};
