// ============================================================
// socket.cpp -- StreamSocket implementation
// ============================================================

#include "socket.hpp"
#include "protocol_io.hpp"
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>
#include <algorithm>
#include <sys/uio.h>

StreamSocket::StreamSocket(socket_t fd) : fd_(fd) {}

StreamSocket::~StreamSocket() {
    close();
}

StreamSocket::StreamSocket(StreamSocket&& o) noexcept : fd_(o.fd_) {
    o.fd_ = INVALID_SOCKET_VAL;
}

StreamSocket& StreamSocket::operator=(StreamSocket&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        o.fd_ = INVALID_SOCKET_VAL;
    }
    return *this;
}

static sockaddr_un unix_addr(const std::string& path) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
        throw std::runtime_error("Invalid socket path: " + path);
    }
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
    return addr;
}

StreamSocket StreamSocket::connect_unix(const std::string& path) {
    sockaddr_un addr = unix_addr(path);
    StreamSocket s(::socket(AF_UNIX, SOCK_STREAM, 0));
    if (!s.is_valid()) {
        throw std::runtime_error("socket() failed: " + socket_error_str(last_socket_error()));
    }
    if (::connect(s.fd_, (sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VAL) {
        throw std::runtime_error("connect(" + path + ") failed: " +
                                 socket_error_str(last_socket_error()));
    }
    return s;
}

StreamSocket StreamSocket::listen_unix(const std::string& path, int backlog) {
    sockaddr_un addr = unix_addr(path);
    StreamSocket s(::socket(AF_UNIX, SOCK_STREAM, 0));
    if (!s.is_valid()) {
        throw std::runtime_error("socket() failed: " + socket_error_str(last_socket_error()));
    }
    ::unlink(path.c_str());
    if (::bind(s.fd_, (sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VAL) {
        throw std::runtime_error("bind(" + path + ") failed: " +
                                 socket_error_str(last_socket_error()));
    }
    if (::listen(s.fd_, backlog) == SOCKET_ERROR_VAL) {
        throw std::runtime_error("listen() failed: " + socket_error_str(last_socket_error()));
    }
    return s;
}

std::pair<StreamSocket, StreamSocket> StreamSocket::make_pair() {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) {
        throw std::runtime_error("socketpair() failed: " + socket_error_str(last_socket_error()));
    }
    return {StreamSocket(fds[0]), StreamSocket(fds[1])};
}

StreamSocket StreamSocket::accept() {
    socket_t client = ::accept(fd_, nullptr, nullptr);
    if (client == INVALID_SOCKET_VAL) {
        throw std::runtime_error("accept() failed: " + socket_error_str(last_socket_error()));
    }
    return StreamSocket(client);
}

void StreamSocket::send_all(const void* buf, size_t len) {
    const char* p = static_cast<const char*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
        ssize_t sent = ::send(fd_, p, remaining, MSG_NOSIGNAL);
        if (sent <= 0) {
            if (sent == 0) {
                throw std::runtime_error("Connection closed during send");
            }
            int err = last_socket_error();
            if (err == EINTR) continue;
            throw std::runtime_error("send() failed: " + socket_error_str(err));
        }
        p += sent;
        remaining -= static_cast<size_t>(sent);
    }
}

bool StreamSocket::recv_all(void* buf, size_t len) {
    char* p = static_cast<char*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
        ssize_t received = ::recv(fd_, p, remaining, 0);
        if (received == 0) return false; // clean close
        if (received < 0) {
            int err = last_socket_error();
            if (err == EINTR) continue;
            throw std::runtime_error("recv() failed: " + socket_error_str(err));
        }
        p += received;
        remaining -= static_cast<size_t>(received);
    }
    return true;
}

void StreamSocket::write_frame(MsgType type, u16 flags, const void* payload, u32 payload_len) {
    u8 hdr_buf[8];
    FrameHeader hdr;
    hdr.msg_type    = static_cast<u16>(type);
    hdr.flags       = flags;
    hdr.payload_len = payload_len;
    proto::encode_header(hdr, hdr_buf);

    if (payload_len == 0 || !payload) {
        send_all(hdr_buf, 8);
        return;
    }

    // writev: merge header + payload into one syscall, handle partial sends
    size_t total = 8 + (size_t)payload_len;
    size_t sent_total = 0;
    while (sent_total < total) {
        struct iovec cur[2];
        int cur_cnt = 0;
        size_t skip = sent_total;
        for (int i = 0; i < 2; ++i) {
            size_t seg_len = (i == 0) ? 8 : (size_t)payload_len;
            const char* seg_base = (i == 0) ? reinterpret_cast<const char*>(hdr_buf)
                                             : static_cast<const char*>(payload);
            if (skip >= seg_len) { skip -= seg_len; continue; }
            cur[cur_cnt].iov_base = const_cast<char*>(seg_base + skip);
            cur[cur_cnt].iov_len  = seg_len - skip;
            skip = 0;
            ++cur_cnt;
        }
        msghdr mh{};
        mh.msg_iov    = cur;
        mh.msg_iovlen = cur_cnt;
        ssize_t n = ::sendmsg(fd_, &mh, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("sendmsg failed: " + socket_error_str(errno));
        }
        sent_total += (size_t)n;
    }
}

bool StreamSocket::read_frame(FrameHeader& hdr, std::vector<u8>& payload_buf) {
    u8 hdr_buf[8];
    if (!recv_all(hdr_buf, 8)) return false;
    hdr = proto::decode_header(hdr_buf);
    if (hdr.payload_len > MAX_FRAME_LEN) {
        throw std::runtime_error("Frame too large: " + std::to_string(hdr.payload_len));
    }
    payload_buf.resize(hdr.payload_len);
    if (hdr.payload_len > 0) {
        if (!recv_all(payload_buf.data(), hdr.payload_len)) return false;
    }
    return true;
}

void StreamSocket::shutdown() {
    if (fd_ != INVALID_SOCKET_VAL) {
        ::shutdown(fd_, SHUT_RDWR);
    }
}

void StreamSocket::close() {
    if (fd_ != INVALID_SOCKET_VAL) {
        CLOSE_SOCKET(fd_);
        fd_ = INVALID_SOCKET_VAL;
    }
}
