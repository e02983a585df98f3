#ifndef SNAPVAULT_CONFIG_H
#define SNAPVAULT_CONFIG_H

#include <cstdint>
#include <string>
#include <vector>

#include "endpoint.h"
#include "log.h"
#include "ssh_endpoint.h"
#include "transfer.h"

namespace snapvault {

struct TargetConfig {
    std::string path;                 // local path, ssh://... or shell://...
    bool ssh_sudo = false;
    std::string ssh_key;
    std::vector<std::string> ssh_opts;
    std::string compress;
    uint64_t rate_limit = 0;
    bool check_space = false;
    double safety_margin = 0.10;
    bool force = false;
    bool chunked = false;
    uint64_t chunk_size = 64ull * 1024 * 1024;
};

struct VolumeConfig {
    std::string path;
    std::string snapshot_dir = ".snapshots";
    std::string prefix;
    int keep_snapshots = 0;
    int keep_backups = 0;
    bool incremental = true;
    bool enabled = true;
    bool fs_checks = true;
    bool btrfs_debug = false;
    bool subvolume_sync = false;
    bool convert_rw = false;
    std::vector<TargetConfig> targets;

    // Absolute snapshot directory.
    std::string snapshot_path() const;
};

struct Config {
    LogLevel log_level = LogLevel::Info;
    std::string transaction_log;
    std::string state_dir = "/var/lib/snapvault";
    std::string lock_file_name = ".outstanding_transfers";
    std::vector<VolumeConfig> volumes;
};

// "/home/user" -> "home-user-", "/" -> "root-"
std::string default_prefix(const std::string &volume_path);

bool parse_config(const std::string &path, Config *cfg, std::string *err);
bool parse_config_text(const std::string &text, Config *cfg, std::string *err);

EndpointConfig source_endpoint_config(const Config &cfg, const VolumeConfig &volume);
EndpointConfig target_endpoint_config(const Config &cfg, const VolumeConfig &volume);
SshOptions target_ssh_options(const TargetConfig &target);
TransferOptions target_transfer_options(const TargetConfig &target);

}

#endif
