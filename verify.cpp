#include "verify.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <unistd.h>

#include "process.h"
#include "util.h"

namespace snapvault {

static const int kStreamTimeout = 3600;

const char *verify_level_label(VerifyLevel level) {
    switch (level) {
        case VerifyLevel::Metadata:
            return "metadata";
        case VerifyLevel::Stream:
            return "stream";
        default:
            return "unknown";
    }
}

bool parse_verify_level(const std::string &text, VerifyLevel *out) {
    if (text == "metadata") {
        *out = VerifyLevel::Metadata;
    } else if (text == "stream") {
        *out = VerifyLevel::Stream;
    } else {
        return false;
    }
    return true;
}

size_t VerifyReport::passed() const {
    size_t n = 0;
    for (const auto &r : results) {
        if (r.passed) n++;
    }
    return n;
}

size_t VerifyReport::failed() const {
    return results.size() - passed();
}

static bool list_backups(SourceEndpoint &backup, const std::string &snapshot_name, VerifyReport *report,
                         std::vector<Snapshot> *out, Error *err) {
    if (!backup.list_snapshots(true, out, err)) return rethrow_as(err, ErrorKind::Verify, "");
    if (out->empty()) {
        report->errors.push_back("no snapshots found at " + backup.describe());
        return true;
    }
    if (snapshot_name.empty()) return true;
    for (const auto &s : *out) {
        if (s.name() == snapshot_name) {
            out->assign(1, s);
            return true;
        }
    }
    report->errors.push_back("snapshot " + snapshot_name + " not found at " + backup.describe());
    out->clear();
    return true;
}

bool verify_metadata(SourceEndpoint &backup, Endpoint *source, const std::string &snapshot_name, Log &log,
                     VerifyReport *report, Error *err) {
    report->level = VerifyLevel::Metadata;
    report->location = backup.get_id();
    std::vector<Snapshot> all;
    if (!backup.list_snapshots(true, &all, err)) return rethrow_as(err, ErrorKind::Verify, "");
    std::vector<Snapshot> selected;
    if (!list_backups(backup, snapshot_name, report, &selected, err)) return false;

    for (const auto &s : selected) {
        VerifyResult result;
        result.name = s.name();
        result.passed = true;
        const Snapshot *parent = find_older_parent(s, all);
        result.message = parent ? "incremental basis " + parent->name() : "full";
        report->results.push_back(result);
    }

    if (source) {
        std::vector<Snapshot> source_snapshots;
        if (!source->list_snapshots(true, &source_snapshots, err)) return rethrow_as(err, ErrorKind::Verify, "");
        for (const auto &s : source_snapshots) {
            if (!contains(all, s)) {
                report->errors.push_back(s.name() + " exists at " + source->describe() + " but not in the backup");
            }
        }
    }
    log.info("metadata check of %s: %zu snapshot(s), %zu error(s)", backup.describe().c_str(),
             report->results.size(), report->errors.size());
    return true;
}

static bool drain_send(SourceEndpoint &backup, const Snapshot &snapshot, const Snapshot *parent, uint64_t *bytes,
                       std::string *failure) {
    std::vector<std::string> argv = backup.send_argv(snapshot, parent, {}, false);
    Process proc;
    Process::Options options;
    options.null_stdin = true;
    options.pipe_stdout = true;
    if (!proc.start(argv, options, failure)) return false;
    std::vector<char> buf(256 * 1024);
    *bytes = 0;
    double deadline = monotonic_seconds() + kStreamTimeout;
    for (;;) {
        ssize_t n = read_until(proc.stdout_fd(), buf.data(), buf.size(), deadline);
        if (n < 0) {
            *failure = errno == ETIMEDOUT ? "send timed out" : std::string("read: ") + std::strerror(errno);
            proc.kill();
            return false;
        }
        if (n == 0) break;
        *bytes += static_cast<uint64_t>(n);
    }
    int rc = -1;
    if (!proc.wait(std::max(1, static_cast<int>(deadline - monotonic_seconds())), &rc)) {
        *failure = "send timed out";
        return false;
    }
    if (rc != 0) {
        *failure = "send exited with " + std::to_string(rc) + ": " + tail_excerpt(proc.stderr_text(), 300);
        return false;
    }
    return true;
}

bool verify_stream(SourceEndpoint &backup, const std::string &snapshot_name, Log &log, VerifyReport *report,
                   Error *err) {
    report->level = VerifyLevel::Stream;
    report->location = backup.get_id();
    std::vector<Snapshot> all;
    if (!backup.list_snapshots(true, &all, err)) return rethrow_as(err, ErrorKind::Verify, "");
    std::vector<Snapshot> selected;
    if (!list_backups(backup, snapshot_name, report, &selected, err)) return false;

    const std::string lock_id = "restore:" + random_hex(4);
    for (const auto &s : selected) {
        const Snapshot *parent = find_older_parent(s, all);
        VerifyResult result;
        result.name = s.name();

        Error lock_err;
        bool locked = backup.set_lock(s, lock_id, true, false, &lock_err);
        bool parent_locked = locked && (!parent || backup.set_lock(*parent, lock_id, true, true, &lock_err));
        if (!locked || !parent_locked) {
            result.message = lock_err.message;
        } else {
            uint64_t bytes = 0;
            std::string failure;
            result.passed = drain_send(backup, s, parent, &bytes, &failure);
            result.message = result.passed ? format_size(bytes) + " stream" : failure;
        }
        Error unlock_err;
        if (parent_locked && parent && !backup.set_lock(*parent, lock_id, false, true, &unlock_err)) {
            log.warn("%s", unlock_err.message.c_str());
        }
        if (locked && !backup.set_lock(s, lock_id, false, false, &unlock_err)) {
            log.warn("%s", unlock_err.message.c_str());
        }
        log.info("%s %s: %s", result.passed ? "ok" : "FAILED", s.name().c_str(), result.message.c_str());
        report->results.push_back(result);
    }
    return true;
}

bool verify_backups(SourceEndpoint &backup, Endpoint *source, VerifyLevel level, const std::string &snapshot_name,
                    Log &log, VerifyReport *report, Error *err) {
    log.heading(std::string("Verifying ") + backup.describe() + " (" + verify_level_label(level) + ")");
    if (level == VerifyLevel::Stream) return verify_stream(backup, snapshot_name, log, report, err);
    return verify_metadata(backup, source, snapshot_name, log, report, err);
}

}
