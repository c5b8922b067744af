#pragma once

// ============================================================
// platform.hpp -- POSIX socket/process abstraction
//   vidbridge relies on fork(), socketpair() and AF_UNIX
//   sockets, so only POSIX hosts are supported.
// ============================================================

#include <string>
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <stdexcept>

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <csignal>

using socket_t = int;
#define INVALID_SOCKET_VAL (-1)
#define SOCKET_ERROR_VAL   (-1)
#define CLOSE_SOCKET(s)    ::close(s)

inline int last_socket_error() { return errno; }
inline std::string socket_error_str(int err) {
    return std::string(strerror(err)) + " (errno=" + std::to_string(err) + ")";
}

namespace platform {

// Writing to a peer that went away must surface as EPIPE, not kill the process.
inline void ignore_sigpipe() {
    std::signal(SIGPIPE, SIG_IGN);
}

} // namespace platform

// ---- Portable types ----
using u8  = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
using i8  = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;
