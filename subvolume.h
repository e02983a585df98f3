#ifndef SNAPVAULT_SUBVOLUME_H
#define SNAPVAULT_SUBVOLUME_H

#include <string>
#include <vector>

#include "error.h"
#include "local_endpoint.h"
#include "log.h"
#include "snapshot.h"

namespace snapvault {

// A btrfs subvolume whose read-only snapshots are stored in `snapshots`.
class Subvolume {
public:
    Subvolume(const std::string &path, LocalEndpoint &snapshots, Log &log);
    virtual ~Subvolume() = default;

    const std::string &path() const { return path_; }
    LocalEndpoint &snapshots() { return snapshots_; }

    bool prepare(Error *err);
    // Takes a snapshot named prefix + now and registers it in the catalog.
    bool take_snapshot(bool sync, Snapshot *out, Error *err);

protected:
    virtual std::vector<std::vector<std::string>> snapshot_commands(const Snapshot &snapshot, bool sync) const;

private:
    std::string path_;
    LocalEndpoint &snapshots_;
    Log &log_;
};

}

#endif
