#include "transfer.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <thread>
#include <utility>
#include <unistd.h>

#include "chunked.h"
#include "estimate.h"
#include "process.h"
#include "util.h"

namespace snapvault {

static const CompressionTool COMPRESSION_TOOLS[] = {
    {"gzip", {"gzip", "-c"}, "gzip -d"},
    {"pigz", {"pigz", "-c"}, "pigz -d"},
    {"zstd", {"zstd", "-c", "-q", "-T0"}, "zstd -d -q"},
    {"lz4", {"lz4", "-c", "-q"}, "lz4 -d -q"},
    {"lzop", {"lzop", "-c"}, "lzop -d"},
    {"xz", {"xz", "-c", "-T0"}, "xz -d"},
};

const CompressionTool *find_compression(const std::string &name) {
    for (const auto &tool : COMPRESSION_TOOLS) {
        if (name == tool.name) return &tool;
    }
    return nullptr;
}

bool is_known_compression(const std::string &name) {
    return name.empty() || name == "none" || find_compression(name) != nullptr;
}

namespace {

struct PumpState {
    int in_fd = -1;
    int out_fd = -1;
    std::atomic<uint64_t> bytes{0};
    std::string error;
    bool report = false;
    int interval = 10;
    Log *log = nullptr;
};

// Copies the send stream into the rest of the pipeline. Closing both ends on
// exit lets send see EPIPE when downstream died and downstream see EOF.
void run_pump(PumpState *state) {
    ScopedSigpipeBlock block;
    std::vector<char> buf(256 * 1024);
    double started = monotonic_seconds();
    double last_report = started;
    for (;;) {
        ssize_t n = ::read(state->in_fd, buf.data(), buf.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            state->error = std::string("reading send stream: ") + std::strerror(errno);
            break;
        }
        if (n == 0) break;
        std::string write_err;
        if (!write_all(state->out_fd, buf.data(), static_cast<size_t>(n), &write_err)) {
            state->error = "writing to pipeline: " + write_err;
            break;
        }
        uint64_t total = state->bytes += static_cast<uint64_t>(n);
        double now = monotonic_seconds();
        if (state->report && now - last_report >= state->interval) {
            double rate = total / (now - started);
            state->log->info("%s transferred (%s/s)", format_size(total).c_str(),
                             format_size(static_cast<uint64_t>(rate)).c_str());
            last_report = now;
        }
    }
    ::close(state->in_fd);
    ::close(state->out_fd);
}

struct StageResult {
    std::string failure;

    void check(Process &proc, int timeout_seconds) {
        if (!proc.started()) return;
        int rc = -1;
        if (!proc.wait(timeout_seconds, &rc)) {
            add(proc.command_line() + " timed out after " + std::to_string(timeout_seconds) + "s");
            return;
        }
        if (rc != 0) {
            std::string msg = proc.command_line() + " exited with " + std::to_string(rc);
            std::string excerpt = tail_excerpt(proc.stderr_text(), 300);
            if (!excerpt.empty()) msg += ": " + excerpt;
            add(msg);
        }
    }
    void add(const std::string &msg) {
        if (!failure.empty()) failure += "; ";
        failure += msg;
    }
};

void close_fd(int *fd) {
    if (*fd >= 0) {
        ::close(*fd);
        *fd = -1;
    }
}

}

TransferEngine::TransferEngine(TransactionLog *journal, Log &log) : journal_(journal), log_(log) {}

TransferEngine::~TransferEngine() = default;

bool TransferEngine::preflight(SourceEndpoint &source, Endpoint &destination, const Snapshot &snapshot,
                               const Snapshot *parent, const TransferOptions &options, uint64_t *estimate,
                               Error *err) {
    *estimate = 0;
    bool plain = !find_compression(options.compress) && options.rate_limit == 0;
    bool want_progress = options.show_progress && plain && log_.interactive();
    if (!options.check_space && !want_progress) return true;

    Error est_err;
    bool estimated = options.check_space
                         ? estimate_transfer_size(source, snapshot, parent, estimate, &est_err)
                         : measure_usage_delta(source, snapshot, parent, estimate, &est_err);
    if (!estimated) {
        log_.warn("cannot estimate size of %s: %s", snapshot.name().c_str(), est_err.message.c_str());
        *estimate = 0;
        return true;
    }
    log_.info("estimated transfer size: %s", format_size(*estimate).c_str());
    if (!options.check_space) return true;

    Error space_err;
    if (!check_space(destination, *estimate, options.safety_margin, options.force, log_, &space_err)) {
        if (space_err.kind == ErrorKind::InsufficientSpace) {
            if (err) *err = space_err;
            return false;
        }
        log_.warn("space check skipped: %s", space_err.message.c_str());
    }
    return true;
}

bool TransferEngine::send_snapshot(SourceEndpoint &source, Endpoint &destination, const Snapshot &snapshot,
                                   const Snapshot *parent, const TransferOptions &options, Error *err) {
    Error local;
    Error *e = err ? err : &local;
    last_bytes_ = 0;

    if (!is_known_compression(options.compress)) {
        return set_error(e, ErrorKind::Abort, "unknown compression " + options.compress);
    }
    if (!destination.ensure_directory(e)) return false;

    uint64_t estimate = 0;
    if (!preflight(source, destination, snapshot, parent, options, &estimate, e)) return false;

    log_.info("%s %s to %s%s%s", parent ? "incremental transfer of" : "full transfer of", snapshot.name().c_str(),
              destination.describe().c_str(), parent ? " based on " : "", parent ? parent->name().c_str() : "");
    double started = monotonic_seconds();

    if (options.chunked) {
        if (!chunked_) return set_error(e, ErrorKind::Abort, "chunked transfers need a state directory");
        TransactionScope scope(journal_, "chunked_transfer", source.get_id(), destination.get_id(), snapshot.name(),
                               parent ? parent->name() : "");
        TransferManifest manifest;
        if (!chunked_->send_chunked(source, destination, snapshot, parent, &manifest, e)) {
            scope.set_details("transfer id " + manifest.transfer_id);
            scope.fail(e->message);
            return false;
        }
        last_bytes_ = manifest.total_size;
        scope.set_size(static_cast<int64_t>(manifest.total_size));
        scope.set_details("transfer id " + manifest.transfer_id + ", " + std::to_string(manifest.chunk_count()) +
                          " chunks");
        scope.complete();
    } else {
        TransactionScope scope(journal_, "transfer", source.get_id(), destination.get_id(), snapshot.name(),
                               parent ? parent->name() : "");
        bool direct = destination.is_remote() && destination.supports_direct_pipe() &&
                      !find_compression(options.compress) && options.rate_limit == 0;
        bool ok = direct ? run_direct(source, destination, snapshot, parent, options, e)
                         : run_filtered(source, destination, snapshot, parent, options, estimate, e);
        if (!ok) {
            scope.fail(e->message);
            return false;
        }
        if (!direct) scope.set_size(static_cast<int64_t>(last_bytes_));
        scope.complete();
    }

    double elapsed = monotonic_seconds() - started;
    if (last_bytes_ > 0) {
        log_.info("transferred %s in %.1fs", format_size(last_bytes_).c_str(), elapsed);
    } else {
        log_.info("transfer finished in %.1fs", elapsed);
    }
    return true;
}

bool TransferEngine::run_direct(SourceEndpoint &source, Endpoint &destination, const Snapshot &snapshot,
                                const Snapshot *parent, const TransferOptions &options, Error *err) {
    Process send;
    Process buffer;
    Process receive;
    if (!source.send(snapshot, parent, options.clones, &send, err)) {
        return rethrow_as(err, ErrorKind::Transfer, "");
    }
    int upstream = send.release_stdout();

    std::vector<std::string> buffer_argv = destination.direct_buffer_command();
    if (!buffer_argv.empty()) {
        Process::Options buffer_options;
        buffer_options.stdin_fd = upstream;
        buffer_options.pipe_stdout = true;
        std::string start_err;
        if (!buffer.start(buffer_argv, buffer_options, &start_err)) {
            close_fd(&upstream);
            return set_error(err, ErrorKind::Transfer, "cannot start " + shell_join(buffer_argv) + ": " + start_err);
        }
        close_fd(&upstream);
        upstream = buffer.release_stdout();
    }

    bool started = destination.receive(upstream, "", &receive, err);
    close_fd(&upstream);
    if (!started) return rethrow_as(err, ErrorKind::Transfer, "");

    StageResult result;
    result.check(send, options.send_timeout);
    result.check(buffer, options.filter_timeout);
    result.check(receive, options.receive_timeout);
    if (!result.failure.empty()) {
        return set_error(err, ErrorKind::Transfer, "transfer of " + snapshot.name() + " failed: " + result.failure);
    }
    return true;
}

bool TransferEngine::run_filtered(SourceEndpoint &source, Endpoint &destination, const Snapshot &snapshot,
                                  const Snapshot *parent, const TransferOptions &options, uint64_t estimate,
                                  Error *err) {
    const CompressionTool *tool = find_compression(options.compress);
    if (tool && !find_in_path(tool->compress[0])) {
        return set_error(err, ErrorKind::Transfer, "compression tool " + tool->compress[0] + " not found");
    }
    bool limit = options.rate_limit > 0;
    if (limit && !find_in_path("pv")) {
        log_.warn("pv not found, transferring without rate limit");
        limit = false;
    }
    bool rich = options.show_progress && estimate > 0 && !tool && options.rate_limit == 0 && log_.interactive() &&
                find_in_path("pv");

    Process send;
    std::vector<Process> filters;
    std::vector<int> filter_timeouts;
    Process receive;

    if (!source.send(snapshot, parent, options.clones, &send, err)) {
        return rethrow_as(err, ErrorKind::Transfer, "");
    }

    int pump_pipe[2];
    if (pipe2(pump_pipe, O_CLOEXEC) != 0) {
        send.kill();
        return set_error(err, ErrorKind::Transfer, std::string("pipe: ") + std::strerror(errno));
    }
    PumpState pump;
    pump.in_fd = send.release_stdout();
    pump.out_fd = pump_pipe[1];
    pump.report = options.show_progress && !rich;
    pump.interval = options.progress_interval;
    pump.log = &log_;
    std::thread pump_thread(run_pump, &pump);
    int upstream = pump_pipe[0];

    std::vector<std::pair<std::vector<std::string>, bool>> stages;
    if (tool) stages.push_back(std::make_pair(tool->compress, true));
    if (limit) stages.push_back(std::make_pair(std::vector<std::string>{"pv", "-q", "-L", std::to_string(options.rate_limit)}, true));
    if (rich) stages.push_back(std::make_pair(std::vector<std::string>{"pv", "-s", std::to_string(estimate)}, false));

    std::string start_failure;
    for (const auto &stage : stages) {
        Process proc;
        Process::Options stage_options;
        stage_options.stdin_fd = upstream;
        stage_options.pipe_stdout = true;
        stage_options.capture_stderr = stage.second;
        std::string start_err;
        if (!proc.start(stage.first, stage_options, &start_err)) {
            start_failure = "cannot start " + shell_join(stage.first) + ": " + start_err;
            break;
        }
        close_fd(&upstream);
        upstream = proc.release_stdout();
        filters.push_back(std::move(proc));
        filter_timeouts.push_back(options.filter_timeout);
    }
    if (start_failure.empty()) {
        Error receive_err;
        if (!destination.receive(upstream, tool ? tool->decompress : "", &receive, &receive_err)) {
            start_failure = receive_err.message;
        }
    }
    close_fd(&upstream);

    if (!start_failure.empty()) {
        send.kill();
        for (auto &proc : filters) proc.kill();
        pump_thread.join();
        return set_error(err, ErrorKind::Transfer, start_failure);
    }

    StageResult result;
    result.check(send, options.send_timeout);
    for (size_t i = 0; i < filters.size(); ++i) result.check(filters[i], filter_timeouts[i]);
    result.check(receive, options.receive_timeout);
    pump_thread.join();
    if (!pump.error.empty()) result.add(pump.error);
    last_bytes_ = pump.bytes;

    if (!result.failure.empty()) {
        return set_error(err, ErrorKind::Transfer, "transfer of " + snapshot.name() + " failed: " + result.failure);
    }
    return true;
}

}
