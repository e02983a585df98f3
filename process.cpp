#include "process.h"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>
#include <utility>

#include "util.h"

namespace snapvault {

static void close_fd(int *fd) {
    if (*fd >= 0) {
        ::close(*fd);
        *fd = -1;
    }
}

Process::~Process() {
    if (running()) {
        kill();
    }
    close_pipes();
    close_fd(&stderr_fd_);
}

Process::Process(Process &&other) noexcept {
    *this = std::move(other);
}

Process &Process::operator=(Process &&other) noexcept {
    if (this != &other) {
        if (running()) kill();
        close_pipes();
        close_fd(&stderr_fd_);
        pid_ = other.pid_;
        exited_ = other.exited_;
        exit_code_ = other.exit_code_;
        stdin_fd_ = other.stdin_fd_;
        stdout_fd_ = other.stdout_fd_;
        stderr_fd_ = other.stderr_fd_;
        argv_ = std::move(other.argv_);
        other.reset();
    }
    return *this;
}

void Process::reset() {
    pid_ = -1;
    exited_ = false;
    exit_code_ = -1;
    stdin_fd_ = -1;
    stdout_fd_ = -1;
    stderr_fd_ = -1;
    argv_.clear();
}

bool Process::start(const std::vector<std::string> &argv, const Options &options, std::string *err) {
    if (argv.empty()) {
        *err = "empty command";
        return false;
    }
    if (started()) {
        *err = "process already started";
        return false;
    }
    argv_ = argv;

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_file = -1;
    if (options.pipe_stdin && pipe2(in_pipe, O_CLOEXEC) != 0) {
        *err = std::string("pipe: ") + std::strerror(errno);
        return false;
    }
    if (options.pipe_stdout && pipe2(out_pipe, O_CLOEXEC) != 0) {
        *err = std::string("pipe: ") + std::strerror(errno);
        close_fd(&in_pipe[0]);
        close_fd(&in_pipe[1]);
        return false;
    }
    if (options.capture_stderr) {
        FILE *tmp = std::tmpfile();
        if (tmp) {
            err_file = fcntl(fileno(tmp), F_DUPFD_CLOEXEC, 0);
            std::fclose(tmp);
        }
    }

    std::vector<char *> args;
    for (const auto &s : argv_) {
        args.push_back(const_cast<char *>(s.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        *err = std::string("fork: ") + std::strerror(errno);
        close_fd(&in_pipe[0]);
        close_fd(&in_pipe[1]);
        close_fd(&out_pipe[0]);
        close_fd(&out_pipe[1]);
        close_fd(&err_file);
        return false;
    }
    if (pid == 0) {
        signal(SIGPIPE, SIG_DFL);
        if (options.pipe_stdin) {
            dup2(in_pipe[0], 0);
        } else if (options.stdin_fd >= 0) {
            dup2(options.stdin_fd, 0);
        } else if (options.null_stdin) {
            int fd = ::open("/dev/null", O_RDONLY);
            if (fd >= 0) dup2(fd, 0);
        }
        if (options.pipe_stdout) {
            dup2(out_pipe[1], 1);
        } else if (options.stdout_fd >= 0) {
            dup2(options.stdout_fd, 1);
        } else if (options.null_stdout) {
            int fd = ::open("/dev/null", O_WRONLY);
            if (fd >= 0) dup2(fd, 1);
        }
        if (err_file >= 0) {
            dup2(err_file, 2);
        }
        execvp(args[0], args.data());
        _exit(127);
    }

    pid_ = pid;
    close_fd(&in_pipe[0]);
    close_fd(&out_pipe[1]);
    stdin_fd_ = in_pipe[1];
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_file;
    return true;
}

std::string Process::command_line() const {
    return shell_join(argv_);
}

int Process::release_stdout() {
    int fd = stdout_fd_;
    stdout_fd_ = -1;
    return fd;
}

void Process::reap(int status) {
    exited_ = true;
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    } else {
        exit_code_ = 1;
    }
}

bool Process::wait(int timeout_seconds, int *exit_code) {
    if (!started()) {
        if (exit_code) *exit_code = -1;
        return false;
    }
    if (exited_) {
        if (exit_code) *exit_code = exit_code_;
        return true;
    }
    double deadline = timeout_seconds < 0 ? 0.0 : monotonic_seconds() + timeout_seconds;
    long sleep_ms = 5;
    for (;;) {
        int status = 0;
        pid_t r = waitpid(pid_, &status, timeout_seconds < 0 ? 0 : WNOHANG);
        if (r == pid_) {
            reap(status);
            if (exit_code) *exit_code = exit_code_;
            return true;
        }
        if (r < 0 && errno != EINTR) {
            exited_ = true;
            exit_code_ = 1;
            if (exit_code) *exit_code = exit_code_;
            return true;
        }
        if (timeout_seconds >= 0 && monotonic_seconds() >= deadline) {
            kill();
            if (exit_code) *exit_code = exit_code_;
            return false;
        }
        if (timeout_seconds >= 0) {
            struct timespec ts = {0, sleep_ms * 1000000L};
            nanosleep(&ts, nullptr);
            if (sleep_ms < 100) sleep_ms *= 2;
        }
    }
}

void Process::kill() {
    if (!running()) return;
    ::kill(pid_, SIGKILL);
    int status = 0;
    while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
    reap(status);
}

std::string Process::stderr_text() {
    std::string out;
    if (stderr_fd_ < 0) return out;
    char buf[4096];
    off_t off = 0;
    for (;;) {
        ssize_t n = pread(stderr_fd_, buf, sizeof(buf), off);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        out.append(buf, static_cast<size_t>(n));
        off += n;
    }
    return out;
}

void Process::close_stdin() {
    close_fd(&stdin_fd_);
}

void Process::close_stdout() {
    close_fd(&stdout_fd_);
}

void Process::close_pipes() {
    close_fd(&stdin_fd_);
    close_fd(&stdout_fd_);
}

ssize_t read_until(int fd, char *buf, size_t len, double deadline) {
    for (;;) {
        int wait_ms = -1;
        if (deadline >= 0) {
            double left = deadline - monotonic_seconds();
            if (left <= 0) {
                errno = ETIMEDOUT;
                return -1;
            }
            wait_ms = static_cast<int>(left * 1000) + 1;
        }
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int r = poll(&pfd, 1, wait_ms);
        if (r < 0) {
            if (errno == EINTR) continue;
            return -1;
        }
        if (r == 0) continue;
        ssize_t n = ::read(fd, buf, len);
        if (n < 0 && errno == EINTR) continue;
        return n;
    }
}

int run_capture(const std::vector<std::string> &argv, std::string *out, std::string *err_text, int timeout_seconds) {
    Process proc;
    Process::Options options;
    options.pipe_stdout = true;
    options.null_stdin = true;
    std::string err;
    if (!proc.start(argv, options, &err)) {
        if (err_text) *err_text = err;
        return 127;
    }
    double deadline = timeout_seconds < 0 ? -1.0 : monotonic_seconds() + timeout_seconds;
    std::string collected;
    char buf[8192];
    for (;;) {
        ssize_t n = read_until(proc.stdout_fd(), buf, sizeof(buf), deadline);
        if (n < 0) {
            if (errno != ETIMEDOUT) break;
            proc.kill();
            int rc = 1;
            proc.wait(0, &rc);
            if (err_text) *err_text = "timed out after " + std::to_string(timeout_seconds) + "s";
            return rc;
        }
        if (n == 0) break;
        collected.append(buf, static_cast<size_t>(n));
    }
    proc.close_stdout();
    int remaining = -1;
    if (deadline >= 0) remaining = std::max(1, static_cast<int>(deadline - monotonic_seconds()));
    int rc = 1;
    if (!proc.wait(remaining, &rc)) {
        if (err_text) *err_text = "timed out after " + std::to_string(timeout_seconds) + "s";
        return rc;
    }
    if (out) *out = collected;
    if (err_text) *err_text = proc.stderr_text();
    return rc;
}

bool write_all(int fd, const char *data, size_t len, std::string *err) {
    size_t off = 0;
    while (off < len) {
        ssize_t w = ::write(fd, data + off, len - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            if (err) *err = std::string("write: ") + std::strerror(errno);
            return false;
        }
        off += static_cast<size_t>(w);
    }
    return true;
}

ScopedSigpipeBlock::ScopedSigpipeBlock() {
    sigset_t set, old;
    sigemptyset(&set);
    sigaddset(&set, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &set, &old);
    was_blocked_ = sigismember(&old, SIGPIPE) == 1;
}

ScopedSigpipeBlock::~ScopedSigpipeBlock() {
    if (was_blocked_) return;
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGPIPE);
    struct timespec zero = {0, 0};
    while (sigtimedwait(&set, nullptr, &zero) > 0) {
    }
    pthread_sigmask(SIG_UNBLOCK, &set, nullptr);
}

}
