#ifndef SNAPVAULT_SNAPSHOT_H
#define SNAPVAULT_SNAPSHOT_H

#include <ctime>
#include <string>
#include <vector>

namespace snapvault {

// strftime/strptime layout of the timestamp suffix, e.g. 20260101-120000.
extern const char *SNAPSHOT_TIME_FORMAT;

std::string format_timestamp(time_t t);
bool parse_timestamp(const std::string &text, time_t *out);

// Immutable point-in-time copy. Identity is (prefix, timestamp); the location
// only says where this particular copy lives. Lock state is held by the
// LockTable, keyed by name().
class Snapshot {
public:
    Snapshot() = default;
    Snapshot(const std::string &location, const std::string &prefix, time_t timestamp);

    // Timestamp is "now" truncated to the precision of the name format.
    static Snapshot now(const std::string &location, const std::string &prefix);
    // Parses `name` as prefix + timestamp. Returns false when it does not match.
    static bool parse(const std::string &location, const std::string &prefix, const std::string &name, Snapshot *out);

    const std::string &location() const { return location_; }
    const std::string &prefix() const { return prefix_; }
    time_t timestamp() const { return timestamp_; }
    std::string name() const;
    std::string path() const;

    Snapshot relocated(const std::string &location) const;

    bool operator==(const Snapshot &other) const;
    bool operator!=(const Snapshot &other) const { return !(*this == other); }
    // Ordering is only defined within one prefix; throws std::logic_error otherwise.
    bool operator<(const Snapshot &other) const;
    bool operator>(const Snapshot &other) const { return other < *this; }
    bool operator<=(const Snapshot &other) const { return !(other < *this); }
    bool operator>=(const Snapshot &other) const { return !(*this < other); }

private:
    std::string location_;
    std::string prefix_;
    time_t timestamp_ = 0;
};

bool contains(const std::vector<Snapshot> &snapshots, const Snapshot &snapshot);
int index_of(const std::vector<Snapshot> &snapshots, const Snapshot &snapshot);
void sort_snapshots(std::vector<Snapshot> *snapshots);
std::string join_names(const std::vector<Snapshot> &snapshots, const char *sep);

// Best incremental basis for `candidate` among `present` (ascending by time).
// nullptr when candidate is already present or present is empty; otherwise the
// nearest strictly older entry, falling back to the oldest entry.
const Snapshot *find_parent(const Snapshot &candidate, const std::vector<Snapshot> &present);

// Nearest strictly older entry of `snapshots`, never a newer one.
const Snapshot *find_older_parent(const Snapshot &snapshot, const std::vector<Snapshot> &snapshots);

}

#endif
