// ============================================================
// subprocess.cpp -- fork/exec with piped stdout and stderr
// ============================================================

#include "subprocess.hpp"
#include "../common/logger.hpp"
#include <stdexcept>
#include <cstring>
#include <poll.h>
#include <sys/wait.h>

static constexpr size_t ERR_TAIL_BYTES = 4096;

namespace {

// Owns a pipe end until handed over
struct Fd {
    int fd{-1};
    ~Fd() { reset(); }
    void reset() { if (fd >= 0) { ::close(fd); fd = -1; } }
};

void make_pipe(Fd& rd, Fd& wr) {
    int p[2];
    if (::pipe2(p, O_CLOEXEC) != 0) {
        throw std::runtime_error("pipe() failed: " + socket_error_str(errno));
    }
    rd.fd = p[0];
    wr.fd = p[1];
}

struct Child {
    pid_t pid{-1};
    Fd    out;
    Fd    err;
};

Child spawn(const std::vector<std::string>& argv, const std::string& cwd) {
    if (argv.empty()) {
        throw std::invalid_argument("subprocess: empty argv");
    }
    Fd out_rd, out_wr, err_rd, err_wr;
    make_pipe(out_rd, out_wr);
    make_pipe(err_rd, err_wr);

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        throw std::runtime_error("fork() failed: " + socket_error_str(errno));
    }
    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        ::dup2(out_wr.fd, STDOUT_FILENO);
        ::dup2(err_wr.fd, STDERR_FILENO);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) _exit(126);
        ::execvp(cargv[0], cargv.data());
        _exit(127);
    }

    Child c;
    c.pid = pid;
    c.out.fd = out_rd.fd; out_rd.fd = -1;
    c.err.fd = err_rd.fd; err_rd.fd = -1;
    return c;
}

int wait_exit(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error("waitpid() failed: " + socket_error_str(errno));
        }
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}

// Pumps both pipes until EOF on each
void pump(Child& c, const std::function<void(const char*, size_t)>& on_out,
          std::string& err_tail) {
    char buf[16 * 1024];
    while (c.out.fd >= 0 || c.err.fd >= 0) {
        pollfd pfds[2];
        nfds_t n = 0;
        if (c.out.fd >= 0) pfds[n++] = pollfd{c.out.fd, POLLIN, 0};
        if (c.err.fd >= 0) pfds[n++] = pollfd{c.err.fd, POLLIN, 0};
        if (::poll(pfds, n, -1) < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("poll() failed: " + socket_error_str(errno));
        }
        for (nfds_t i = 0; i < n; ++i) {
            if (!(pfds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t r = ::read(pfds[i].fd, buf, sizeof(buf));
            if (r < 0 && errno == EINTR) continue;
            Fd& which = (pfds[i].fd == c.out.fd) ? c.out : c.err;
            if (r <= 0) {
                which.reset();
                continue;
            }
            if (&which == &c.out) {
                on_out(buf, (size_t)r);
            } else {
                err_tail.append(buf, (size_t)r);
                if (err_tail.size() > ERR_TAIL_BYTES) {
                    err_tail.erase(0, err_tail.size() - ERR_TAIL_BYTES);
                }
            }
        }
    }
}

} // namespace

namespace subprocess {

std::string describe(const std::vector<std::string>& argv) {
    std::string s;
    for (const auto& a : argv) {
        if (!s.empty()) s += ' ';
        s += a;
    }
    return s;
}

Result run(const std::vector<std::string>& argv, const std::string& cwd,
           const LineFn& on_line) {
    LOG_DEBUG("exec: " + describe(argv));
    Child c = spawn(argv, cwd);
    Result res;
    std::string pending;
    pump(c, [&](const char* p, size_t n) {
        if (!on_line) return;
        pending.append(p, n);
        size_t start = 0, eol;
        while ((eol = pending.find('\n', start)) != std::string::npos) {
            std::string line = pending.substr(start, eol - start);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            on_line(line);
            start = eol + 1;
        }
        pending.erase(0, start);
    }, res.err_tail);
    if (on_line && !pending.empty()) on_line(pending);
    res.exit_code = wait_exit(c.pid);
    if (res.exit_code == 127) {
        throw std::runtime_error("Cannot execute " + argv[0]);
    }
    return res;
}

std::vector<u8> capture(const std::vector<std::string>& argv) {
    Child c = spawn(argv, "");
    std::vector<u8> out;
    std::string err_tail;
    pump(c, [&](const char* p, size_t n) {
        out.insert(out.end(), p, p + n);
    }, err_tail);
    int code = wait_exit(c.pid);
    if (code != 0) {
        std::string msg = "Command failed (" + std::to_string(code) + "): " + describe(argv);
        if (!err_tail.empty()) msg += ": " + err_tail;
        throw std::runtime_error(msg);
    }
    return out;
}

} // namespace subprocess
