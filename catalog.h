#ifndef SNAPVAULT_CATALOG_H
#define SNAPVAULT_CATALOG_H

#include <string>
#include <vector>

#include "log.h"
#include "snapshot.h"

namespace snapvault {

// Turns raw directory entries into snapshots of `location`, ascending by time.
// Entries may be bare names or paths; anything that is not a direct child of
// `location`, lacks the prefix, or carries an unparsable timestamp is skipped.
std::vector<Snapshot> parse_listing(const std::string &location, const std::string &prefix,
                                    const std::vector<std::string> &entries, Log &log);

// Ordered snapshot list of one endpoint. The cache is filled lazily by the
// owning endpoint and kept in step by add()/remove(); invalidate() forces the
// next listing to rescan.
class SnapshotCatalog {
public:
    SnapshotCatalog(const std::string &location, const std::string &prefix, Log &log);

    bool cached() const { return cached_; }
    const std::vector<Snapshot> &snapshots() const { return snapshots_; }
    const std::string &location() const { return location_; }
    const std::string &prefix() const { return prefix_; }

    void store(const std::vector<std::string> &entries);
    void add(const Snapshot &snapshot);
    void remove(const Snapshot &snapshot);
    void invalidate();

private:
    std::string location_;
    std::string prefix_;
    Log &log_;
    bool cached_ = false;
    std::vector<Snapshot> snapshots_;
};

}

#endif
