#ifndef SNAPVAULT_LOCAL_ENDPOINT_H
#define SNAPVAULT_LOCAL_ENDPOINT_H

#include <string>
#include <vector>

#include "endpoint.h"

namespace snapvault {

// Filesystem type of the mount containing `path` ("" when unknown).
std::string filesystem_type(const std::string &path);
bool is_btrfs(const std::string &path);
// btrfs subvolume roots always carry inode 256.
bool is_subvolume(const std::string &path);

class LocalEndpoint : public SourceEndpoint {
public:
    LocalEndpoint(const EndpointConfig &config, Log &log);

    std::string get_id() const override { return path(); }
    std::string describe() const override { return "(Local) " + path(); }

    bool prepare(Error *err) override;
    bool ensure_directory(Error *err) override;
    bool get_space_info(SpaceInfo *out, Error *err) override;
    bool snapshot_exists(const std::string &name, Error *err) override;

protected:
    bool list_directory(std::vector<std::string> *entries, Error *err) override;
    // btrfs invocations get `sudo -n` when not running as root.
    std::vector<std::string> wrap_command(const std::vector<std::string> &argv) const override;
};

}

#endif
