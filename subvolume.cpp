#include "subvolume.h"

#include <sys/stat.h>
#include <unistd.h>

#include "process.h"
#include "util.h"

namespace snapvault {

Subvolume::Subvolume(const std::string &path, LocalEndpoint &snapshots, Log &log)
    : path_(path), snapshots_(snapshots), log_(log) {}

bool Subvolume::prepare(Error *err) {
    struct stat st;
    if (stat(path_.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
        return set_error(err, ErrorKind::Abort, "source " + path_ + " is not a directory");
    }
    if (snapshots_.config().fs_checks && !is_subvolume(path_)) {
        return set_error(err, ErrorKind::Abort, "source " + path_ + " is not a btrfs subvolume");
    }
    return snapshots_.prepare(err);
}

std::vector<std::vector<std::string>> Subvolume::snapshot_commands(const Snapshot &snapshot, bool sync) const {
    std::vector<std::string> take = {"btrfs", "subvolume", "snapshot", "-r", path_, snapshot.path()};
    if (snapshots_.config().use_sudo && geteuid() != 0) take.insert(take.begin(), {"sudo", "-n"});
    std::vector<std::vector<std::string>> commands(1, take);
    if (sync) commands.push_back({"sync"});
    return commands;
}

bool Subvolume::take_snapshot(bool sync, Snapshot *out, Error *err) {
    Snapshot snapshot = Snapshot::now(snapshots_.path(), snapshots_.prefix());
    Error probe;
    if (snapshots_.snapshot_exists(snapshot.name(), &probe)) {
        return set_error(err, ErrorKind::Abort, "snapshot " + snapshot.name() + " already exists");
    }
    log_.info("creating snapshot %s", snapshot.path().c_str());
    for (const auto &argv : snapshot_commands(snapshot, sync)) {
        std::string out_text;
        std::string err_text;
        int rc = run_capture(argv, &out_text, &err_text, kCommandTimeout);
        if (rc != 0) {
            std::string msg = "command failed (exit " + std::to_string(rc) + "): " + shell_join(argv);
            std::string excerpt = tail_excerpt(err_text, 400);
            if (!excerpt.empty()) msg += ": " + excerpt;
            return set_error(err, ErrorKind::Abort, msg);
        }
    }
    snapshots_.add_snapshot(snapshot);
    if (out) *out = snapshot;
    return true;
}

}
