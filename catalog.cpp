#include "catalog.h"

#include <algorithm>

#include "util.h"

namespace snapvault {

std::vector<Snapshot> parse_listing(const std::string &location, const std::string &prefix,
                                    const std::vector<std::string> &entries, Log &log) {
    std::vector<Snapshot> out;
    for (const auto &entry : entries) {
        std::string name = entry;
        if (entry.find('/') != std::string::npos) {
            if (absolute_path(path_dirname(entry)) != absolute_path(location)) continue;
            name = path_basename(entry);
        }
        if (name.compare(0, prefix.size(), prefix) != 0) continue;
        Snapshot snapshot;
        if (!Snapshot::parse(location, prefix, name, &snapshot)) {
            log.warn("could not parse date from: %s", name.c_str());
            continue;
        }
        if (contains(out, snapshot)) continue;
        out.push_back(snapshot);
    }
    sort_snapshots(&out);
    return out;
}

SnapshotCatalog::SnapshotCatalog(const std::string &location, const std::string &prefix, Log &log)
    : location_(location), prefix_(prefix), log_(log) {}

void SnapshotCatalog::store(const std::vector<std::string> &entries) {
    snapshots_ = parse_listing(location_, prefix_, entries, log_);
    cached_ = true;
    log_.debug("populated snapshot cache of %s with %zu items", location_.c_str(), snapshots_.size());
}

void SnapshotCatalog::add(const Snapshot &snapshot) {
    if (!cached_) return;
    if (contains(snapshots_, snapshot)) return;
    Snapshot local = snapshot.relocated(location_);
    auto pos = std::upper_bound(snapshots_.begin(), snapshots_.end(), local);
    snapshots_.insert(pos, local);
}

void SnapshotCatalog::remove(const Snapshot &snapshot) {
    if (!cached_) return;
    auto it = std::find(snapshots_.begin(), snapshots_.end(), snapshot);
    if (it != snapshots_.end()) snapshots_.erase(it);
}

void SnapshotCatalog::invalidate() {
    cached_ = false;
    snapshots_.clear();
}

}
