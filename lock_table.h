#ifndef SNAPVAULT_LOCK_TABLE_H
#define SNAPVAULT_LOCK_TABLE_H

#include <map>
#include <set>
#include <string>
#include <vector>

#include "error.h"
#include "log.h"
#include "snapshot.h"

namespace snapvault {

struct LockSet {
    std::set<std::string> locks;
    std::set<std::string> parent_locks;

    bool empty() const { return locks.empty() && parent_locks.empty(); }
    bool operator==(const LockSet &other) const {
        return locks == other.locks && parent_locks == other.parent_locks;
    }
};

// snapshot name -> lock set; absent names are unlocked
using LockMap = std::map<std::string, LockSet>;

// Lock file content -> map. Empty text is an empty table; anything that is not
// {"name": {"locks": [str...], "parent_locks": [str...]}} is an error.
bool parse_locks(const std::string &text, LockMap *out, std::string *err);
// Pretty-printed JSON, entries with no locks omitted.
std::string serialize_locks(const LockMap &locks);

bool is_locked(const LockMap &locks, const Snapshot &snapshot);
bool is_locked_by(const LockMap &locks, const Snapshot &snapshot, const std::string &lock_id);

// Unlocked snapshots that retention may delete, oldest first, so that `keep`
// unlocked ones remain. keep <= 0 keeps everything.
std::vector<Snapshot> select_unlocked_for_deletion(const std::vector<Snapshot> &snapshots,
                                                   const LockMap &locks, int keep);

// Per-snapshot lock sets persisted in one JSON file. Every mutation is a full
// read-modify-write under an exclusive flock(2) on the file, so concurrent
// runs for other destinations see and keep each other's locks.
class LockTable {
public:
    LockTable(const std::string &path, Log &log);

    const std::string &path() const { return path_; }
    const LockMap &entries() const { return entries_; }

    bool load(Error *err);
    LockSet get(const Snapshot &snapshot) const;

    // Adds or removes `lock_id`. Entries written by other runs are kept, even
    // for snapshots this process has not listed.
    bool set_lock(const Snapshot &snapshot, const std::string &lock_id, bool active, bool parent, Error *err);

    // Drops `lock_id` (or every lock when empty) from all snapshots. `known` is
    // a fresh listing; entries for snapshots missing from it are dropped.
    bool release_all(const std::string &lock_id, const std::vector<Snapshot> &known, Error *err);

private:
    template <typename Fn>
    bool update(Fn mutate, Error *err);

    std::string path_;
    Log &log_;
    LockMap entries_;
};

}

#endif
