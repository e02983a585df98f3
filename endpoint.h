#ifndef SNAPVAULT_ENDPOINT_H
#define SNAPVAULT_ENDPOINT_H

#include <cstdint>
#include <string>
#include <vector>

#include "catalog.h"
#include "error.h"
#include "lock_table.h"
#include "log.h"
#include "process.h"
#include "snapshot.h"

namespace snapvault {

struct SpaceInfo {
    uint64_t free_bytes = 0;
    uint64_t total_bytes = 0;
};

struct EndpointConfig {
    std::string path;                 // snapshot directory
    std::string prefix;
    std::string lock_file_name = ".outstanding_transfers";
    bool convert_rw = false;
    bool subvolume_sync = false;
    bool btrfs_debug = false;
    bool fs_checks = true;
    bool use_sudo = true;
};

// Storage/transport collaborator a snapshot can be received into. Owns the
// snapshot catalog of its directory.
class Endpoint {
public:
    Endpoint(const EndpointConfig &config, Log &log);
    virtual ~Endpoint();
    Endpoint(const Endpoint &) = delete;
    Endpoint &operator=(const Endpoint &) = delete;

    const EndpointConfig &config() const { return config_; }
    const std::string &path() const { return config_.path; }
    const std::string &prefix() const { return config_.prefix; }
    Log &log() const { return log_; }

    // Stable identity, used as the lock id for transfers to this endpoint.
    virtual std::string get_id() const = 0;
    virtual std::string describe() const { return get_id(); }
    virtual bool is_remote() const { return false; }

    virtual bool prepare(Error *err);
    virtual bool ensure_directory(Error *err) = 0;
    virtual bool get_space_info(SpaceInfo *out, Error *err) = 0;
    virtual bool snapshot_exists(const std::string &name, Error *err);

    bool list_snapshots(bool flush_cache, std::vector<Snapshot> *out, Error *err);
    void add_snapshot(const Snapshot &snapshot);
    // Skips (and logs) every snapshot that has an entry in `locks`. `removed`
    // gets the snapshots actually deleted; any failed deletion is an error.
    bool delete_snapshots(const std::vector<Snapshot> &snapshots, const LockMap &locks,
                          std::vector<Snapshot> *removed, Error *err);
    bool delete_old_snapshots(int keep, const LockMap &locks, std::vector<Snapshot> *deleted, Error *err);

    // Starts the receiving side reading from `stdin_fd`. A non-empty
    // `decompress` shell fragment is run in front of the receiver.
    bool receive(int stdin_fd, const std::string &decompress, Process *out, Error *err);

    // Remote endpoints that can take a send stream over one hop.
    virtual bool supports_direct_pipe() const { return false; }
    virtual std::vector<std::string> direct_buffer_command() const { return {}; }

    // Staged receive: bytes are appended to a staging file on the endpoint and
    // only replayed into `btrfs receive` on commit, so an interrupted upload
    // can continue at `offset`.
    virtual bool supports_staged_receive() const { return false; }
    virtual bool open_staged_receive(const std::string &transfer_id, uint64_t offset, Process *out, Error *err);
    virtual bool commit_staged_receive(const std::string &transfer_id, int timeout_seconds, Error *err);
    virtual bool discard_staged_receive(const std::string &transfer_id, Error *err);

    virtual std::vector<std::string> receive_argv(const std::string &decompress) const;

protected:
    virtual bool list_directory(std::vector<std::string> *entries, Error *err) = 0;
    virtual std::vector<std::string> wrap_command(const std::vector<std::string> &argv) const = 0;
    virtual std::vector<std::string> receive_command() const;
    virtual std::vector<std::vector<std::string>> deletion_commands(const std::vector<Snapshot> &snapshots) const;

    // Runs a wrapped command to completion; failures become Abort errors
    // carrying the exit code and a stderr excerpt.
    bool exec(const std::vector<std::string> &argv, std::string *output, Error *err);
    bool spawn(const std::vector<std::string> &argv, const Process::Options &options, Process *out, Error *err);

    EndpointConfig config_;
    Log &log_;
    SnapshotCatalog catalog_;
};

// An endpoint that can produce send streams and therefore guards its
// snapshots with a lock table.
class SourceEndpoint : public Endpoint {
public:
    SourceEndpoint(const EndpointConfig &config, Log &log);

    const LockTable &locks() const { return locks_; }
    std::string lock_file_path() const;

    bool load_locks(Error *err);
    bool set_lock(const Snapshot &snapshot, const std::string &lock_id, bool active, bool parent, Error *err);
    // Removes `lock_id` from every snapshot; an empty id clears all locks.
    // Locks on snapshots that no longer exist are dropped as well.
    bool release_locks(const std::string &lock_id, Error *err);

    bool send(const Snapshot &snapshot, const Snapshot *parent, const std::vector<Snapshot> &clones,
              Process *out, Error *err);
    std::vector<std::string> send_argv(const Snapshot &snapshot, const Snapshot *parent,
                                       const std::vector<Snapshot> &clones, bool no_data) const;

    // Retention against this endpoint's own locks.
    bool prune(int keep, std::vector<Snapshot> *deleted, Error *err);

protected:
    virtual std::vector<std::string> send_command(const Snapshot &snapshot, const Snapshot *parent,
                                                  const std::vector<Snapshot> &clones, bool no_data) const;

    LockTable locks_;
};

}

#endif
