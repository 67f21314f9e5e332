//===----------------------------------------------------------------------===//
//                         runnerd
//
// process/pty_process.hpp
//
// Child process attached to a pseudo-terminal
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <sys/types.h>

namespace runnerd {

class PtyProcess {
public:
    enum class ReadStatus {
        DATA,           // `data` holds the bytes read
        TIMEOUT,        // nothing became readable within the timeout
        END_OF_STREAM,  // all slave descriptors are closed
        FAILED          // read error, `error` holds the reason
    };

    struct ReadResult {
        ReadStatus status = ReadStatus::TIMEOUT;
        std::string data;
        std::string error;
    };

    // Run `/bin/bash -c command` on a new pseudo-terminal.
    // Throws std::runtime_error if the terminal cannot be allocated or the
    // shell cannot be executed.
    static PtyProcessPtr Spawn(const std::string& command);

    ~PtyProcess();

    // Non-copyable
    PtyProcess(const PtyProcess&) = delete;
    PtyProcess& operator=(const PtyProcess&) = delete;

    pid_t GetPid() const { return pid_; }

    // Reaps the child if it has exited
    bool IsAlive();

    // Wait at most `timeout` for output and read up to `max_bytes` of it
    ReadResult Read(size_t max_bytes, std::chrono::milliseconds timeout);

    // Writes `line` and a line terminator to the terminal input.
    // Throws std::runtime_error on failure.
    void WriteLine(const std::string& line);

    // SIGKILL the process group and reap the child. No-op once exited.
    void Kill();

    // Raw wait status, valid once IsAlive() returned false
    int GetExitStatus() const { return exit_status_; }

private:
    PtyProcess(pid_t pid, int master_fd);

    void WriteAll(const std::string& data);

    pid_t pid_;
    int master_fd_;

    std::mutex state_mutex_;
    bool exited_ = false;
    int exit_status_ = 0;

    std::mutex write_mutex_;
};

} // namespace runnerd
