#include "endpoint.h"

#include <cstdio>

#include "util.h"

namespace snapvault {

Endpoint::Endpoint(const EndpointConfig &config, Log &log)
    : config_(config), log_(log), catalog_(config.path, config.prefix, log) {}

Endpoint::~Endpoint() = default;

bool Endpoint::prepare(Error *err) {
    return ensure_directory(err);
}

bool Endpoint::snapshot_exists(const std::string &name, Error *err) {
    std::vector<Snapshot> snapshots;
    if (!list_snapshots(true, &snapshots, err)) return false;
    for (const auto &s : snapshots) {
        if (s.name() == name) return true;
    }
    if (err) err->message.clear();
    return false;
}

bool Endpoint::list_snapshots(bool flush_cache, std::vector<Snapshot> *out, Error *err) {
    if (flush_cache) catalog_.invalidate();
    if (!catalog_.cached()) {
        std::vector<std::string> entries;
        if (!list_directory(&entries, err)) {
            return rethrow_as(err, ErrorKind::Abort, "cannot list " + describe());
        }
        catalog_.store(entries);
    }
    if (out) *out = catalog_.snapshots();
    return true;
}

void Endpoint::add_snapshot(const Snapshot &snapshot) {
    catalog_.add(snapshot);
}

bool Endpoint::delete_snapshots(const std::vector<Snapshot> &snapshots, const LockMap &locks,
                                std::vector<Snapshot> *removed, Error *err) {
    if (removed) removed->clear();
    std::vector<std::string> failed;
    for (const auto &s : snapshots) {
        if (is_locked(locks, s)) {
            log_.info("skipping deletion of locked snapshot %s", s.name().c_str());
            continue;
        }
        log_.info("removing snapshot %s from %s", s.name().c_str(), describe().c_str());
        std::vector<Snapshot> one(1, s.relocated(path()));
        bool ok = true;
        for (const auto &argv : deletion_commands(one)) {
            Error run_err;
            if (!exec(argv, nullptr, &run_err)) {
                log_.error("%s", run_err.message.c_str());
                ok = false;
                break;
            }
        }
        if (ok) {
            catalog_.remove(s);
            if (removed) removed->push_back(s);
        } else {
            failed.push_back(s.name());
        }
    }
    if (failed.empty()) return true;
    // a failed deletion leaves the directory in an unknown state
    catalog_.invalidate();
    std::string names;
    for (const auto &name : failed) names += (names.empty() ? "" : ", ") + name;
    return set_error(err, ErrorKind::Abort, "failed to delete from " + describe() + ": " + names);
}

bool Endpoint::delete_old_snapshots(int keep, const LockMap &locks, std::vector<Snapshot> *deleted, Error *err) {
    if (deleted) deleted->clear();
    std::vector<Snapshot> snapshots;
    if (!list_snapshots(false, &snapshots, err)) return false;
    std::vector<Snapshot> victims = select_unlocked_for_deletion(snapshots, locks, keep);
    if (victims.empty()) return true;
    return delete_snapshots(victims, locks, deleted, err);
}

std::vector<std::string> Endpoint::receive_command() const {
    std::vector<std::string> argv = {"btrfs", "receive"};
    if (config_.btrfs_debug) argv.push_back("-vv");
    argv.push_back(path());
    return argv;
}

std::vector<std::string> Endpoint::receive_argv(const std::string &decompress) const {
    if (decompress.empty()) return wrap_command(receive_command());
    return wrap_command({"sh", "-c", decompress + " | " + shell_join(receive_command())});
}

bool Endpoint::receive(int stdin_fd, const std::string &decompress, Process *out, Error *err) {
    Process::Options options;
    options.stdin_fd = stdin_fd;
    options.null_stdout = true;
    return spawn(receive_argv(decompress), options, out, err);
}

std::vector<std::vector<std::string>> Endpoint::deletion_commands(const std::vector<Snapshot> &snapshots) const {
    std::vector<std::vector<std::string>> commands;
    if (snapshots.empty()) return commands;
    if (config_.convert_rw) {
        for (const auto &s : snapshots) {
            commands.push_back({"btrfs", "property", "set", "-ts", s.path(), "ro", "false"});
        }
    }
    std::vector<std::string> argv = {"btrfs", "subvolume", "delete"};
    for (const auto &s : snapshots) argv.push_back(s.path());
    commands.push_back(argv);
    if (config_.subvolume_sync) commands.push_back({"btrfs", "subvolume", "sync", path()});
    return commands;
}

bool Endpoint::open_staged_receive(const std::string &, uint64_t, Process *, Error *err) {
    return set_error(err, ErrorKind::Transfer, describe() + " does not support staged receive");
}

bool Endpoint::commit_staged_receive(const std::string &, int, Error *err) {
    return set_error(err, ErrorKind::Transfer, describe() + " does not support staged receive");
}

bool Endpoint::discard_staged_receive(const std::string &, Error *) {
    return true;
}

bool Endpoint::exec(const std::vector<std::string> &argv, std::string *output, Error *err) {
    std::vector<std::string> cmd = wrap_command(argv);
    log_.debug("running: %s", shell_join(cmd).c_str());
    std::string out;
    std::string err_text;
    int rc = run_capture(cmd, &out, &err_text, kCommandTimeout);
    if (output) *output = out;
    if (rc != 0) {
        std::string msg = "command failed (exit " + std::to_string(rc) + "): " + shell_join(argv);
        std::string excerpt = tail_excerpt(err_text, 400);
        if (!excerpt.empty()) msg += ": " + excerpt;
        return set_error(err, ErrorKind::Abort, msg);
    }
    return true;
}

bool Endpoint::spawn(const std::vector<std::string> &argv, const Process::Options &options, Process *out,
                     Error *err) {
    log_.debug("starting: %s", shell_join(argv).c_str());
    std::string start_err;
    if (!out->start(argv, options, &start_err)) {
        return set_error(err, ErrorKind::Transfer, "cannot start " + shell_join(argv) + ": " + start_err);
    }
    return true;
}

SourceEndpoint::SourceEndpoint(const EndpointConfig &config, Log &log)
    : Endpoint(config, log), locks_(path_join(config.path, config.lock_file_name), log) {}

std::string SourceEndpoint::lock_file_path() const {
    return locks_.path();
}

bool SourceEndpoint::load_locks(Error *err) {
    return locks_.load(err);
}

bool SourceEndpoint::set_lock(const Snapshot &snapshot, const std::string &lock_id, bool active, bool parent,
                              Error *err) {
    log_.debug("%s %slock %s on %s", active ? "setting" : "removing", parent ? "parent " : "", lock_id.c_str(),
               snapshot.name().c_str());
    return locks_.set_lock(snapshot, lock_id, active, parent, err);
}

bool SourceEndpoint::release_locks(const std::string &lock_id, Error *err) {
    std::vector<Snapshot> known;
    if (!list_snapshots(true, &known, err)) return false;
    return locks_.release_all(lock_id, known, err);
}

std::vector<std::string> SourceEndpoint::send_command(const Snapshot &snapshot, const Snapshot *parent,
                                                      const std::vector<Snapshot> &clones, bool no_data) const {
    std::vector<std::string> argv = {"btrfs", "send"};
    if (config_.btrfs_debug) {
        argv.push_back("-vv");
    } else {
        argv.push_back("--quiet");
    }
    if (no_data) argv.push_back("--no-data");
    if (parent) {
        argv.push_back("-p");
        argv.push_back(parent->relocated(path()).path());
    }
    for (const auto &c : clones) {
        argv.push_back("-c");
        argv.push_back(c.relocated(path()).path());
    }
    argv.push_back(snapshot.relocated(path()).path());
    return argv;
}

std::vector<std::string> SourceEndpoint::send_argv(const Snapshot &snapshot, const Snapshot *parent,
                                                   const std::vector<Snapshot> &clones, bool no_data) const {
    return wrap_command(send_command(snapshot, parent, clones, no_data));
}

bool SourceEndpoint::send(const Snapshot &snapshot, const Snapshot *parent, const std::vector<Snapshot> &clones,
                          Process *out, Error *err) {
    Process::Options options;
    options.null_stdin = true;
    options.pipe_stdout = true;
    return spawn(send_argv(snapshot, parent, clones, false), options, out, err);
}

bool SourceEndpoint::prune(int keep, std::vector<Snapshot> *deleted, Error *err) {
    if (!locks_.load(err)) return false;
    return delete_old_snapshots(keep, locks_.entries(), deleted, err);
}

}
