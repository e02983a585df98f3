#include "planner.h"

#include <algorithm>
#include <cstdlib>
#include <limits>
#include <set>

namespace snapvault {

std::vector<Snapshot> plan_transfers(const std::vector<Snapshot> &source, const std::vector<Snapshot> &destination,
                                     int keep) {
    size_t first = 0;
    if (keep > 0 && source.size() > static_cast<size_t>(keep)) first = source.size() - keep;
    std::vector<Snapshot> candidates;
    for (size_t i = first; i < source.size(); ++i) {
        if (!contains(destination, source[i])) candidates.push_back(source[i]);
    }
    return candidates;
}

std::vector<Snapshot> present_snapshots(const std::vector<Snapshot> &source,
                                        const std::vector<Snapshot> &destination, const LockMap &locks,
                                        const std::string &destination_id) {
    std::vector<Snapshot> present;
    for (const auto &s : source) {
        if (!contains(destination, s)) continue;
        if (is_locked_by(locks, s, destination_id)) continue;
        present.push_back(s);
    }
    return present;
}

bool select_next_transfer(const std::vector<Snapshot> &candidates, const std::vector<Snapshot> &source,
                          const std::vector<Snapshot> &present, bool incremental, TransferChoice *out) {
    if (candidates.empty()) return false;
    if (!incremental) {
        out->snapshot = candidates.back();
        out->has_parent = false;
        return true;
    }

    const Snapshot *best = nullptr;
    const Snapshot *best_parent = nullptr;
    long best_distance = std::numeric_limits<long>::max();
    for (const auto &candidate : candidates) {
        const Snapshot *parent = find_parent(candidate, present);
        long distance = std::numeric_limits<long>::max();
        if (parent) distance = std::labs(static_cast<long>(index_of(source, candidate)) - index_of(source, *parent));
        if (!best || distance < best_distance) {
            best = &candidate;
            best_parent = parent;
            best_distance = distance;
        }
    }
    out->snapshot = *best;
    out->has_parent = best_parent != nullptr;
    if (best_parent) out->parent = *best_parent;
    return true;
}

static bool lock_pair(SourceEndpoint &source, const TransferChoice &choice, const std::string &lock_id, Error *err) {
    if (!source.set_lock(choice.snapshot, lock_id, true, false, err)) return false;
    if (choice.has_parent && !source.set_lock(choice.parent, lock_id, true, true, err)) return false;
    return true;
}

// Parent locks are keyed by destination id only, so a parent shared with a
// failed transfer of this run keeps its lock.
static bool unlock_pair(SourceEndpoint &source, const TransferChoice &choice, const std::string &lock_id,
                        const std::set<std::string> &held_parents, Error *err) {
    if (!source.set_lock(choice.snapshot, lock_id, false, false, err)) return false;
    if (choice.has_parent && held_parents.count(choice.parent.name()) == 0 &&
        !source.set_lock(choice.parent, lock_id, false, true, err)) {
        return false;
    }
    return true;
}

bool sync_snapshots(SourceEndpoint &source, Endpoint &destination, TransferEngine &engine,
                    const SyncOptions &options, Log &log, SyncReport *report, Error *err) {
    log.heading("Transferring to " + destination.describe());
    const std::string lock_id = destination.get_id();

    std::vector<Snapshot> source_snapshots;
    std::vector<Snapshot> destination_snapshots;
    if (!source.load_locks(err) || !source.list_snapshots(false, &source_snapshots, err) ||
        !destination.prepare(err) || !destination.list_snapshots(true, &destination_snapshots, err)) {
        report->aborted = true;
        report->abort_message = err ? err->message : "";
        return false;
    }

    std::vector<Snapshot> candidates;
    if (!options.only.empty()) {
        bool known = false;
        for (const auto &s : source_snapshots) {
            if (s.name() != options.only) continue;
            known = true;
            if (contains(destination_snapshots, s)) {
                log.info("%s is already present at %s", s.name().c_str(), destination.describe().c_str());
            } else {
                candidates.push_back(s);
            }
        }
        if (!known) log.warn("snapshot %s not found at %s", options.only.c_str(), source.describe().c_str());
    } else {
        candidates = plan_transfers(source_snapshots, destination_snapshots, options.keep_backups);
    }

    if (candidates.empty()) {
        log.info("no snapshots need to be transferred");
    } else {
        log.info("going to transfer %zu snapshot(s): %s", candidates.size(), join_names(candidates, ", ").c_str());
    }

    std::set<std::string> held_parents;
    while (!candidates.empty()) {
        std::vector<Snapshot> present;
        if (options.incremental) {
            present = present_snapshots(source_snapshots, destination_snapshots, source.locks().entries(), lock_id);
        }
        TransferChoice choice;
        if (!select_next_transfer(candidates, source_snapshots, present, options.incremental, &choice)) break;
        candidates.erase(std::find(candidates.begin(), candidates.end(), choice.snapshot));

        if (!lock_pair(source, choice, lock_id, err)) {
            report->aborted = true;
            report->abort_message = err ? err->message : "";
            return false;
        }

        Error transfer_err;
        if (!engine.send_snapshot(source, destination, choice.snapshot, choice.has_parent ? &choice.parent : nullptr,
                                  options.transfer, &transfer_err)) {
            if (transfer_err.kind == ErrorKind::Abort) {
                if (err) *err = transfer_err;
                report->aborted = true;
                report->abort_message = transfer_err.message;
                return false;
            }
            if (transfer_err.kind == ErrorKind::InsufficientSpace) {
                // nothing reached the destination, so the locks can go
                log.error("%s", transfer_err.message.c_str());
                report->failed.push_back(choice.snapshot.name());
                Error unlock_err;
                if (!unlock_pair(source, choice, lock_id, held_parents, &unlock_err)) {
                    log.warn("%s", unlock_err.message.c_str());
                }
                report->aborted = true;
                report->abort_message = transfer_err.message;
                if (err) *err = transfer_err;
                return false;
            }
            log.error("%s", transfer_err.message.c_str());
            log.warn("keeping lock on %s until a later run succeeds or it is unlocked",
                     choice.snapshot.name().c_str());
            report->failed.push_back(choice.snapshot.name());
            if (choice.has_parent) held_parents.insert(choice.parent.name());
            continue;
        }

        if (!unlock_pair(source, choice, lock_id, held_parents, err)) {
            report->aborted = true;
            report->abort_message = err ? err->message : "";
            return false;
        }
        destination.add_snapshot(choice.snapshot.relocated(destination.path()));
        if (!destination.list_snapshots(false, &destination_snapshots, err)) {
            report->aborted = true;
            report->abort_message = err ? err->message : "";
            return false;
        }
        report->transferred.push_back(choice.snapshot.name());
    }

    log.info("%zu transferred, %zu failed", report->transferred.size(), report->failed.size());

    if (options.keep_backups > 0) {
        if (!source.load_locks(err)) {
            report->aborted = true;
            report->abort_message = err ? err->message : "";
            return false;
        }
        if (!destination.delete_old_snapshots(options.keep_backups, source.locks().entries(), &report->deleted,
                                              err)) {
            report->aborted = true;
            report->abort_message = err ? err->message : "";
            return false;
        }
    }
    return true;
}

}
