#include "estimate.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <unistd.h>

#include "process.h"
#include "util.h"

namespace snapvault {

bool measure_send_stream(SourceEndpoint &source, const Snapshot &snapshot, const Snapshot *parent,
                         uint64_t *out, Error *err) {
    std::vector<std::string> argv = source.send_argv(snapshot, parent, {}, true);
    Process proc;
    Process::Options options;
    options.null_stdin = true;
    options.pipe_stdout = true;
    std::string start_err;
    if (!proc.start(argv, options, &start_err)) {
        return set_error(err, ErrorKind::Abort, "cannot start " + shell_join(argv) + ": " + start_err);
    }
    uint64_t total = 0;
    char buf[65536];
    for (;;) {
        ssize_t n = ::read(proc.stdout_fd(), buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            proc.kill();
            return set_error(err, ErrorKind::Abort, std::string("reading send stream: ") + std::strerror(errno));
        }
        if (n == 0) break;
        total += static_cast<uint64_t>(n);
    }
    proc.close_stdout();
    int rc = -1;
    if (!proc.wait(3600, &rc) || rc != 0) {
        return set_error(err, ErrorKind::Abort, "no-data send exited with " + std::to_string(rc) + ": " +
                                                    tail_excerpt(proc.stderr_text(), 200));
    }
    *out = total;
    return true;
}

static bool disk_usage(const std::string &path, uint64_t *out, Error *err) {
    std::string text;
    std::string err_text;
    int rc = run_capture({"du", "-sb", path}, &text, &err_text, 3600);
    if (rc != 0) {
        return set_error(err, ErrorKind::Abort, "du " + path + " failed: " + tail_excerpt(err_text, 200));
    }
    char *end = nullptr;
    unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (end == text.c_str()) return set_error(err, ErrorKind::Abort, "unexpected du output for " + path);
    *out = value;
    return true;
}

bool measure_usage_delta(SourceEndpoint &source, const Snapshot &snapshot, const Snapshot *parent,
                         uint64_t *out, Error *err) {
    uint64_t used = 0;
    if (!disk_usage(snapshot.relocated(source.path()).path(), &used, err)) return false;
    if (!parent) {
        *out = used;
        return true;
    }
    uint64_t parent_used = 0;
    if (!disk_usage(parent->relocated(source.path()).path(), &parent_used, err)) return false;
    *out = used > parent_used ? used - parent_used : 0;
    return true;
}

bool estimate_transfer_size(SourceEndpoint &source, const Snapshot &snapshot, const Snapshot *parent,
                            uint64_t *out, Error *err) {
    uint64_t stream = 0;
    uint64_t delta = 0;
    Error stream_err;
    Error delta_err;
    bool have_stream = measure_send_stream(source, snapshot, parent, &stream, &stream_err);
    bool have_delta = measure_usage_delta(source, snapshot, parent, &delta, &delta_err);
    if (!have_stream && !have_delta) {
        return set_error(err, ErrorKind::Abort, stream_err.message + "; " + delta_err.message);
    }
    *out = stream > delta ? stream : delta;
    return true;
}

bool check_space(Endpoint &destination, uint64_t estimate, double margin, bool force, Log &log, Error *err) {
    SpaceInfo space;
    if (!destination.get_space_info(&space, err)) return false;
    uint64_t required = static_cast<uint64_t>(static_cast<double>(estimate) * (1.0 + margin));
    log.debug("space check on %s: need %s, free %s", destination.describe().c_str(), format_size(required).c_str(),
              format_size(space.free_bytes).c_str());
    if (required <= space.free_bytes) return true;
    std::string msg = "insufficient space on " + destination.describe() + ": need " + format_size(required) +
                      " (estimate " + format_size(estimate) + " + " + std::to_string(static_cast<int>(margin * 100)) +
                      "% margin), " + format_size(space.free_bytes) + " available";
    if (force) {
        log.warn("%s; continuing because of --force", msg.c_str());
        return true;
    }
    return set_error(err, ErrorKind::InsufficientSpace, msg);
}

}
