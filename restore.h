#ifndef SNAPVAULT_RESTORE_H
#define SNAPVAULT_RESTORE_H

#include <ctime>
#include <string>
#include <vector>

#include "endpoint.h"
#include "error.h"
#include "log.h"
#include "snapshot.h"
#include "transfer.h"

namespace snapvault {

// Snapshots to restore so that `target` can be received, oldest first: the
// target and its strictly older ancestors in `backups`, stopping at the first
// one already in `existing`.
std::vector<Snapshot> get_restore_chain(const Snapshot &target, const std::vector<Snapshot> &backups,
                                        const std::vector<Snapshot> &existing);

const Snapshot *find_snapshot_by_name(const std::vector<Snapshot> &snapshots, const std::string &name);
// Latest snapshot taken at or before `when`.
const Snapshot *find_snapshot_before_time(const std::vector<Snapshot> &snapshots, time_t when);

struct RestoreOptions {
    std::string snapshot_name;     // empty: latest
    bool has_before = false;
    time_t before = 0;
    bool all = false;
    bool incremental = true;
    bool skip_existing = true;
    bool dry_run = false;
    TransferOptions transfer;
};

struct RestoreReport {
    std::vector<Snapshot> plan;
    std::vector<std::string> restored;
    std::vector<std::string> skipped;
    std::vector<std::string> failed;

    bool ok() const { return failed.empty(); }
};

// Receives snapshots from a backup directory back into `local`. Each
// transfer holds a `restore:<session>` lock on the backup side. A failed
// snapshot is reported and the rest of the chain is still attempted.
bool restore_snapshots(SourceEndpoint &backup, Endpoint &local, TransferEngine &engine,
                       const RestoreOptions &options, Log &log, RestoreReport *report, Error *err);

}

#endif
