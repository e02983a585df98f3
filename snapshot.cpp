#include "snapshot.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <stdexcept>

#include "util.h"

namespace snapvault {

const char *SNAPSHOT_TIME_FORMAT = "%Y%m%d-%H%M%S";

std::string format_timestamp(time_t t) {
    return format_local_time(t, SNAPSHOT_TIME_FORMAT);
}

bool parse_timestamp(const std::string &text, time_t *out) {
    // YYYYmmdd-HHMMSS, nothing more and nothing less
    if (text.size() != 15 || text[8] != '-') return false;
    for (size_t i = 0; i < text.size(); i++) {
        if (i == 8) continue;
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
    }
    struct tm tm;
    std::memset(&tm, 0, sizeof(tm));
    const char *end = strptime(text.c_str(), SNAPSHOT_TIME_FORMAT, &tm);
    if (!end || *end != '\0') return false;
    tm.tm_isdst = -1;
    time_t t = mktime(&tm);
    if (t == static_cast<time_t>(-1)) return false;
    // reject values mktime had to normalize, e.g. month 13
    if (format_timestamp(t) != text) return false;
    *out = t;
    return true;
}

Snapshot::Snapshot(const std::string &location, const std::string &prefix, time_t timestamp)
    : location_(location), prefix_(prefix), timestamp_(timestamp) {}

Snapshot Snapshot::now(const std::string &location, const std::string &prefix) {
    time_t t = 0;
    if (!parse_timestamp(format_timestamp(time(nullptr)), &t)) {
        t = time(nullptr);
    }
    return Snapshot(location, prefix, t);
}

bool Snapshot::parse(const std::string &location, const std::string &prefix, const std::string &name, Snapshot *out) {
    if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    time_t t = 0;
    if (!parse_timestamp(name.substr(prefix.size()), &t)) {
        return false;
    }
    *out = Snapshot(location, prefix, t);
    return true;
}

std::string Snapshot::name() const {
    return prefix_ + format_timestamp(timestamp_);
}

std::string Snapshot::path() const {
    return path_join(location_, name());
}

Snapshot Snapshot::relocated(const std::string &location) const {
    return Snapshot(location, prefix_, timestamp_);
}

bool Snapshot::operator==(const Snapshot &other) const {
    return prefix_ == other.prefix_ && timestamp_ == other.timestamp_;
}

bool Snapshot::operator<(const Snapshot &other) const {
    if (prefix_ != other.prefix_) {
        throw std::logic_error("prefixes don't match: " + prefix_ + " vs " + other.prefix_);
    }
    return timestamp_ < other.timestamp_;
}

bool contains(const std::vector<Snapshot> &snapshots, const Snapshot &snapshot) {
    return std::find(snapshots.begin(), snapshots.end(), snapshot) != snapshots.end();
}

int index_of(const std::vector<Snapshot> &snapshots, const Snapshot &snapshot) {
    auto it = std::find(snapshots.begin(), snapshots.end(), snapshot);
    if (it == snapshots.end()) return -1;
    return static_cast<int>(it - snapshots.begin());
}

void sort_snapshots(std::vector<Snapshot> *snapshots) {
    std::sort(snapshots->begin(), snapshots->end());
}

std::string join_names(const std::vector<Snapshot> &snapshots, const char *sep) {
    std::string out;
    for (size_t i = 0; i < snapshots.size(); i++) {
        if (i > 0) out += sep;
        out += snapshots[i].name();
    }
    return out;
}

const Snapshot *find_parent(const Snapshot &candidate, const std::vector<Snapshot> &present) {
    if (contains(present, candidate)) {
        return nullptr;
    }
    for (auto it = present.rbegin(); it != present.rend(); ++it) {
        if (*it < candidate) {
            return &*it;
        }
    }
    if (!present.empty()) {
        return &present.front();
    }
    return nullptr;
}

const Snapshot *find_older_parent(const Snapshot &snapshot, const std::vector<Snapshot> &snapshots) {
    const Snapshot *best = nullptr;
    for (const auto &s : snapshots) {
        if (s < snapshot && (!best || *best < s)) {
            best = &s;
        }
    }
    return best;
}

}
