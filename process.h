#ifndef SNAPVAULT_PROCESS_H
#define SNAPVAULT_PROCESS_H

#include <string>
#include <sys/types.h>
#include <vector>

namespace snapvault {

// A spawned child with optional pipes. Pipe ends kept by the parent are
// close-on-exec so sibling stages never inherit them and EOF propagates.
// Stderr goes to an unlinked temp file so it can never fill up and block.
class Process {
public:
    struct Options {
        bool pipe_stdin = false;
        int stdin_fd = -1;        // used when not piped; -1 inherits
        bool null_stdin = false;
        bool pipe_stdout = false;
        int stdout_fd = -1;       // used when not piped; -1 inherits
        bool null_stdout = false;
        bool capture_stderr = true;
    };

    Process() = default;
    ~Process();
    Process(Process &&other) noexcept;
    Process &operator=(Process &&other) noexcept;
    Process(const Process &) = delete;
    Process &operator=(const Process &) = delete;

    bool start(const std::vector<std::string> &argv, const Options &options, std::string *err);

    bool started() const { return pid_ > 0; }
    bool running() const { return pid_ > 0 && !exited_; }
    pid_t pid() const { return pid_; }
    int stdin_fd() const { return stdin_fd_; }
    int stdout_fd() const { return stdout_fd_; }
    const std::vector<std::string> &argv() const { return argv_; }
    std::string command_line() const;

    // Hands the stdout pipe to the caller (e.g. as the next stage's stdin).
    int release_stdout();

    // Waits up to timeout_seconds (< 0: no limit). On timeout the child is
    // killed and reaped and false is returned.
    bool wait(int timeout_seconds, int *exit_code);
    int exit_code() const { return exit_code_; }
    void kill();

    std::string stderr_text();

    void close_stdin();
    void close_stdout();
    void close_pipes();

private:
    void reap(int status);
    void reset();

    pid_t pid_ = -1;
    bool exited_ = false;
    int exit_code_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    std::vector<std::string> argv_;
};

// Bound for short commands: listings, df, mkdir, snapshot creation.
const int kCommandTimeout = 600;

// read(2) that gives up at `deadline` (a monotonic_seconds() value, < 0 waits
// forever). Returns -1 with errno set to ETIMEDOUT once the deadline passes.
ssize_t read_until(int fd, char *buf, size_t len, double deadline);

// Runs to completion collecting stdout and stderr. The child is killed once
// `timeout_seconds` have passed, even while it holds stdout open.
int run_capture(const std::vector<std::string> &argv, std::string *out, std::string *err_text, int timeout_seconds);

bool write_all(int fd, const char *data, size_t len, std::string *err);

// Blocks SIGPIPE on the calling thread so writes to a closed pipe fail with
// EPIPE; any SIGPIPE raised meanwhile is consumed before unblocking.
class ScopedSigpipeBlock {
public:
    ScopedSigpipeBlock();
    ~ScopedSigpipeBlock();
    ScopedSigpipeBlock(const ScopedSigpipeBlock &) = delete;
    ScopedSigpipeBlock &operator=(const ScopedSigpipeBlock &) = delete;

private:
    bool was_blocked_ = false;
};

}

#endif
