//===----------------------------------------------------------------------===//
//                         runnerd
//
// process/pty_process.cpp
//
// Pseudo-terminal process implementation
//===----------------------------------------------------------------------===//

#include "process/pty_process.hpp"
#include "logging/logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>
#include <fcntl.h>
#include <poll.h>
#include <stdlib.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>
#include <utmp.h>

namespace runnerd {

namespace {

constexpr int kWriteTimeoutMs = 1000;

std::string ErrnoText(int err) {
    return std::string(std::strerror(err));
}

} // anonymous namespace

PtyProcessPtr PtyProcess::Spawn(const std::string& command) {
    // Both ends of the terminal are opened close-on-exec so a concurrent
    // spawn on another thread cannot inherit them.
    int master_fd = posix_openpt(O_RDWR | O_NOCTTY | O_CLOEXEC);
    if (master_fd < 0) {
        throw std::runtime_error("Failed to allocate pseudo-terminal: " + ErrnoText(errno));
    }

    char slave_name[128];
    if (grantpt(master_fd) < 0 || unlockpt(master_fd) < 0 ||
        ptsname_r(master_fd, slave_name, sizeof(slave_name)) != 0) {
        int err = errno;
        close(master_fd);
        throw std::runtime_error("Failed to unlock pseudo-terminal: " + ErrnoText(err));
    }

    int slave_fd = open(slave_name, O_RDWR | O_NOCTTY | O_CLOEXEC);
    if (slave_fd < 0) {
        int err = errno;
        close(master_fd);
        throw std::runtime_error("Failed to open " + std::string(slave_name) + ": " + ErrnoText(err));
    }

    struct winsize ws;
    std::memset(&ws, 0, sizeof(ws));
    ws.ws_row = 24;
    ws.ws_col = 80;
    ioctl(slave_fd, TIOCSWINSZ, &ws);

    // The child reports a failed exec through this pipe; a successful exec
    // closes it and the parent reads EOF.
    int exec_pipe[2];
    if (pipe2(exec_pipe, O_CLOEXEC) < 0) {
        int err = errno;
        close(slave_fd);
        close(master_fd);
        throw std::runtime_error("Failed to create pipe: " + ErrnoText(err));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(exec_pipe[0]);
        close(exec_pipe[1]);
        close(slave_fd);
        close(master_fd);
        throw std::runtime_error("Failed to fork: " + ErrnoText(err));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        close(exec_pipe[0]);
        close(master_fd);

        // New session with the slave as controlling terminal on fds 0-2.
        // dup2 leaves the copies without close-on-exec.
        if (login_tty(slave_fd) < 0) {
            int err = errno;
            ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }

        // Whatever else the server had open (client sockets, log files)
        // must not reach the user's program.
        if (close_range(3, ~0U, CLOSE_RANGE_CLOEXEC) < 0) {
            long max_fd = sysconf(_SC_OPEN_MAX);
            for (int fd = 3; fd < max_fd; fd++) {
                if (fd != exec_pipe[1]) {
                    close(fd);
                }
            }
        }

        sigset_t all;
        sigemptyset(&all);
        sigprocmask(SIG_SETMASK, &all, nullptr);
        signal(SIGPIPE, SIG_DFL);
        execl("/bin/bash", "bash", "-c", command.c_str(), static_cast<char*>(nullptr));
        int err = errno;
        ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    close(exec_pipe[1]);
    close(slave_fd);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(exec_pipe[0]);

    if (n > 0) {
        int status = 0;
        waitpid(pid, &status, 0);
        close(master_fd);
        throw std::runtime_error("Failed to execute /bin/bash: " + ErrnoText(child_errno));
    }

    int flags = fcntl(master_fd, F_GETFL);
    if (flags >= 0) {
        fcntl(master_fd, F_SETFL, flags | O_NONBLOCK);
    }

    LOG_DEBUG("pty", "Spawned pid " + std::to_string(pid) + " on " + slave_name);

    return PtyProcessPtr(new PtyProcess(pid, master_fd));
}

PtyProcess::PtyProcess(pid_t pid, int master_fd)
    : pid_(pid)
    , master_fd_(master_fd) {
}

PtyProcess::~PtyProcess() {
    Kill();
    if (master_fd_ >= 0) {
        close(master_fd_);
    }
}

bool PtyProcess::IsAlive() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (exited_) {
        return false;
    }

    int status = 0;
    pid_t result = waitpid(pid_, &status, WNOHANG);
    if (result == 0) {
        return true;
    }
    if (result == pid_) {
        exit_status_ = status;
    }
    // result < 0 (ECHILD): somebody else reaped it, treat as gone
    exited_ = true;
    return false;
}

PtyProcess::ReadResult PtyProcess::Read(size_t max_bytes, std::chrono::milliseconds timeout) {
    ReadResult result;

    struct pollfd pfd;
    pfd.fd = master_fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int ready = poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready == 0) {
        result.status = ReadStatus::TIMEOUT;
        return result;
    }
    if (ready < 0) {
        if (errno == EINTR) {
            result.status = ReadStatus::TIMEOUT;
            return result;
        }
        result.status = ReadStatus::FAILED;
        result.error = "poll failed: " + ErrnoText(errno);
        return result;
    }

    if (pfd.revents & POLLIN) {
        std::string buffer(max_bytes, '\0');
        ssize_t n = read(master_fd_, &buffer[0], max_bytes);
        if (n > 0) {
            buffer.resize(static_cast<size_t>(n));
            result.status = ReadStatus::DATA;
            result.data = std::move(buffer);
            return result;
        }
        if (n == 0 || errno == EIO) {
            // Linux reports EIO on the master once the slave side is gone
            result.status = ReadStatus::END_OF_STREAM;
            return result;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            result.status = ReadStatus::TIMEOUT;
            return result;
        }
        result.status = ReadStatus::FAILED;
        result.error = "read failed: " + ErrnoText(errno);
        return result;
    }

    if (pfd.revents & (POLLHUP | POLLERR | POLLNVAL)) {
        result.status = ReadStatus::END_OF_STREAM;
        return result;
    }

    result.status = ReadStatus::TIMEOUT;
    return result;
}

void PtyProcess::WriteLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    WriteAll(line + "\n");
}

void PtyProcess::WriteAll(const std::string& data) {
    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t n = write(master_fd_, data.data() + offset, data.size() - offset);
        if (n > 0) {
            offset += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            struct pollfd pfd;
            pfd.fd = master_fd_;
            pfd.events = POLLOUT;
            pfd.revents = 0;
            int ready = poll(&pfd, 1, kWriteTimeoutMs);
            if (ready > 0 && (pfd.revents & POLLOUT)) {
                continue;
            }
            throw std::runtime_error("terminal input is not accepting data");
        }
        throw std::runtime_error("write failed: " + ErrnoText(errno));
    }
}

void PtyProcess::Kill() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (exited_) {
        return;
    }

    // login_tty() made the child a session leader, so its pid is the group id
    if (kill(-pid_, SIGKILL) < 0) {
        kill(pid_, SIGKILL);
    }

    int status = 0;
    pid_t result;
    do {
        result = waitpid(pid_, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == pid_) {
        exit_status_ = status;
    }
    exited_ = true;

    LOG_DEBUG("pty", "Killed pid " + std::to_string(pid_));
}

} // namespace runnerd
