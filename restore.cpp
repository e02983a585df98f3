#include "restore.h"

#include <algorithm>
#include <utility>

#include "util.h"

namespace snapvault {

std::vector<Snapshot> get_restore_chain(const Snapshot &target, const std::vector<Snapshot> &backups,
                                        const std::vector<Snapshot> &existing) {
    std::vector<Snapshot> chain;
    const Snapshot *current = &target;
    while (current && !contains(existing, *current)) {
        chain.push_back(*current);
        current = find_older_parent(*current, backups);
    }
    std::reverse(chain.begin(), chain.end());
    return chain;
}

const Snapshot *find_snapshot_by_name(const std::vector<Snapshot> &snapshots, const std::string &name) {
    for (const auto &s : snapshots) {
        if (s.name() == name) return &s;
    }
    return nullptr;
}

const Snapshot *find_snapshot_before_time(const std::vector<Snapshot> &snapshots, time_t when) {
    const Snapshot *found = nullptr;
    for (const auto &s : snapshots) {
        if (s.timestamp() <= when && (!found || s.timestamp() > found->timestamp())) found = &s;
    }
    return found;
}

namespace {

// Holds restore locks on the backup side and drops them on scope exit.
class RestoreLock {
public:
    RestoreLock(SourceEndpoint &backup, const std::string &lock_id, Log &log)
        : backup_(backup), lock_id_(lock_id), log_(log) {}
    ~RestoreLock() { release(); }
    RestoreLock(const RestoreLock &) = delete;
    RestoreLock &operator=(const RestoreLock &) = delete;

    bool acquire(const Snapshot &snapshot, const Snapshot *parent, Error *err) {
        if (!backup_.set_lock(snapshot, lock_id_, true, false, err)) return false;
        held_.push_back(std::make_pair(snapshot, false));
        if (parent) {
            if (!backup_.set_lock(*parent, lock_id_, true, true, err)) return false;
            held_.push_back(std::make_pair(*parent, true));
        }
        return true;
    }

    void release() {
        for (const auto &entry : held_) {
            Error err;
            if (!backup_.set_lock(entry.first, lock_id_, false, entry.second, &err)) {
                log_.warn("cannot release restore lock on %s: %s", entry.first.name().c_str(), err.message.c_str());
            }
        }
        held_.clear();
    }

private:
    SourceEndpoint &backup_;
    std::string lock_id_;
    Log &log_;
    std::vector<std::pair<Snapshot, bool>> held_;
};

}

bool restore_snapshots(SourceEndpoint &backup, Endpoint &local, TransferEngine &engine,
                       const RestoreOptions &options, Log &log, RestoreReport *report, Error *err) {
    log.heading("Restoring from " + backup.describe());
    std::vector<Snapshot> backups;
    std::vector<Snapshot> existing;
    if (!backup.list_snapshots(true, &backups, err)) return rethrow_as(err, ErrorKind::Restore, "");
    if (backups.empty()) {
        return set_error(err, ErrorKind::Restore, "no snapshots found at " + backup.describe());
    }
    if (!local.prepare(err) || !local.list_snapshots(true, &existing, err)) {
        return rethrow_as(err, ErrorKind::Restore, "");
    }
    std::vector<Snapshot> skip_against = options.skip_existing ? existing : std::vector<Snapshot>();

    std::vector<Snapshot> targets;
    if (options.all) {
        targets = backups;
    } else if (!options.snapshot_name.empty()) {
        const Snapshot *found = find_snapshot_by_name(backups, options.snapshot_name);
        if (!found) {
            return set_error(err, ErrorKind::Restore, "snapshot " + options.snapshot_name + " not found at " +
                                                          backup.describe());
        }
        targets.push_back(*found);
    } else if (options.has_before) {
        const Snapshot *found = find_snapshot_before_time(backups, options.before);
        if (!found) {
            return set_error(err, ErrorKind::Restore,
                             "no snapshot at or before " + format_timestamp(options.before));
        }
        targets.push_back(*found);
    } else {
        targets.push_back(backups.back());
    }

    std::vector<Snapshot> plan;
    for (const auto &target : targets) {
        std::vector<Snapshot> chain;
        if (options.incremental) {
            chain = get_restore_chain(target, backups, skip_against);
        } else if (!contains(skip_against, target)) {
            chain.push_back(target);
        }
        for (const auto &s : chain) {
            if (!contains(plan, s)) plan.push_back(s);
        }
    }
    sort_snapshots(&plan);
    for (const auto &t : targets) {
        if (contains(skip_against, t)) report->skipped.push_back(t.name());
    }
    report->plan = plan;

    if (plan.empty()) {
        log.info("nothing to restore");
        return true;
    }
    log.info("restore plan: %s", join_names(plan, ", ").c_str());
    if (options.dry_run) return true;

    const std::string lock_id = "restore:" + random_hex(4);
    std::vector<Snapshot> restored = existing;
    for (const auto &s : plan) {
        const Snapshot *parent = nullptr;
        if (options.incremental) {
            const Snapshot *older = find_older_parent(s, backups);
            if (older && contains(restored, *older)) parent = older;
        }
        RestoreLock lock(backup, lock_id, log);
        Error step_err;
        bool ok = lock.acquire(s, parent, &step_err) &&
                  engine.send_snapshot(backup, local, s, parent, options.transfer, &step_err);
        if (ok) {
            Error exists_err;
            if (!local.snapshot_exists(s.name(), &exists_err)) {
                ok = false;
                step_err.message = s.name() + " is missing at " + local.describe() + " after receive";
            }
        }
        lock.release();
        if (!ok) {
            log.error("restore of %s failed: %s", s.name().c_str(), step_err.message.c_str());
            report->failed.push_back(s.name());
            continue;
        }
        local.add_snapshot(s.relocated(local.path()));
        restored.push_back(s);
        sort_snapshots(&restored);
        report->restored.push_back(s.name());
    }
    log.info("%zu restored, %zu failed", report->restored.size(), report->failed.size());
    return true;
}

}
