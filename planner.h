#ifndef SNAPVAULT_PLANNER_H
#define SNAPVAULT_PLANNER_H

#include <string>
#include <vector>

#include "endpoint.h"
#include "error.h"
#include "lock_table.h"
#include "log.h"
#include "snapshot.h"
#include "transfer.h"

namespace snapvault {

// The newest `keep` source snapshots (all when keep <= 0) that the
// destination does not have, in source order.
std::vector<Snapshot> plan_transfers(const std::vector<Snapshot> &source, const std::vector<Snapshot> &destination,
                                     int keep);

// Snapshots on both sides usable as incremental parents. Snapshots locked by
// `destination_id` are mid-transfer there and are left out.
std::vector<Snapshot> present_snapshots(const std::vector<Snapshot> &source,
                                        const std::vector<Snapshot> &destination, const LockMap &locks,
                                        const std::string &destination_id);

struct TransferChoice {
    Snapshot snapshot;
    bool has_parent = false;
    Snapshot parent;
};

// Incremental: the candidate whose parent is closest to it in the source
// list (first one on ties, full transfer when none has a parent).
// Otherwise the newest candidate without parent. False when empty.
bool select_next_transfer(const std::vector<Snapshot> &candidates, const std::vector<Snapshot> &source,
                          const std::vector<Snapshot> &present, bool incremental, TransferChoice *out);

struct SyncOptions {
    int keep_backups = 0;          // destination retention and plan window
    bool incremental = true;
    std::string only;              // transfer just this snapshot name
    TransferOptions transfer;
};

struct SyncReport {
    std::vector<std::string> transferred;
    std::vector<std::string> failed;
    std::vector<Snapshot> deleted;
    bool aborted = false;
    std::string abort_message;

    bool ok() const { return failed.empty() && !aborted; }
};

// Brings `destination` up to date with `source`: one (snapshot, parent) pair
// at a time is locked, transferred and unlocked. A failed transfer keeps its
// locks and is not retried in this run. Returns false only when the run was
// aborted; per-snapshot failures are reported in `report`.
bool sync_snapshots(SourceEndpoint &source, Endpoint &destination, TransferEngine &engine,
                    const SyncOptions &options, Log &log, SyncReport *report, Error *err);

}

#endif
