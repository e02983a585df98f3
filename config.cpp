#include "config.h"

#include <yaml-cpp/yaml.h>

#include "util.h"

namespace snapvault {

std::string VolumeConfig::snapshot_path() const {
    if (!snapshot_dir.empty() && snapshot_dir[0] == '/') return absolute_path(snapshot_dir);
    return absolute_path(path_join(path, snapshot_dir));
}

std::string default_prefix(const std::string &volume_path) {
    std::string prefix;
    for (char c : volume_path) {
        if (c == '/') {
            if (!prefix.empty() && prefix.back() != '-') prefix += '-';
        } else {
            prefix += c;
        }
    }
    while (!prefix.empty() && prefix.back() == '-') prefix.pop_back();
    if (prefix.empty()) prefix = "root";
    return prefix + "-";
}

static bool parse_size_node(const YAML::Node &node, uint64_t *out, std::string *err) {
    std::string text = node.as<std::string>();
    if (!parse_size(text, out)) {
        *err = "invalid size " + text;
        return false;
    }
    return true;
}

static bool validate_target(const TargetConfig &target, std::string *err) {
    if (target.path.empty()) {
        *err = "target path is empty";
        return false;
    }
    if (!is_known_compression(target.compress)) {
        *err = "unknown compression " + target.compress;
        return false;
    }
    if (target.chunk_size == 0) {
        *err = "chunk_size must be greater than zero";
        return false;
    }
    if (target.safety_margin < 0 || target.safety_margin >= 1) {
        *err = "safety_margin must be in [0, 1)";
        return false;
    }
    return true;
}

static bool validate_volume(const VolumeConfig &volume, std::string *err) {
    if (volume.path.empty()) {
        *err = "volume path is empty";
        return false;
    }
    if (volume.path[0] != '/') {
        *err = "volume path must be absolute";
        return false;
    }
    if (path_has_parent_dir(volume.path)) {
        *err = "volume path must not contain ..";
        return false;
    }
    if (path_has_parent_dir(volume.snapshot_dir)) {
        *err = "snapshot_dir must not contain ..";
        return false;
    }
    if (volume.prefix.find('/') != std::string::npos) {
        *err = "prefix must not contain /";
        return false;
    }
    if (volume.keep_snapshots < 0 || volume.keep_backups < 0) {
        *err = "keep counts must not be negative";
        return false;
    }
    return true;
}

static bool parse_root(const YAML::Node &root, Config *cfg, std::string *err) {
    try {
        if (root["log_level"]) {
            std::string level = root["log_level"].as<std::string>();
            if (!parse_log_level(level, &cfg->log_level)) {
                *err = "invalid log_level " + level;
                return false;
            }
        }
        cfg->transaction_log = root["transaction_log"].as<std::string>(cfg->transaction_log);
        cfg->state_dir = root["state_dir"].as<std::string>(cfg->state_dir);
        cfg->lock_file_name = root["lock_file_name"].as<std::string>(cfg->lock_file_name);
        if (cfg->lock_file_name.empty() || cfg->lock_file_name.find('/') != std::string::npos) {
            *err = "lock_file_name must be a plain file name";
            return false;
        }
        if (!root["volumes"] || !root["volumes"].IsSequence() || root["volumes"].size() == 0) {
            *err = "missing volumes";
            return false;
        }
        for (const auto &node : root["volumes"]) {
            VolumeConfig volume;
            volume.path = node["path"].as<std::string>("");
            volume.snapshot_dir = node["snapshot_dir"].as<std::string>(volume.snapshot_dir);
            volume.prefix = node["prefix"].as<std::string>(default_prefix(volume.path));
            volume.keep_snapshots = node["keep_snapshots"].as<int>(0);
            volume.keep_backups = node["keep_backups"].as<int>(0);
            volume.incremental = node["incremental"].as<bool>(true);
            volume.enabled = node["enabled"].as<bool>(true);
            volume.fs_checks = node["fs_checks"].as<bool>(true);
            volume.btrfs_debug = node["btrfs_debug"].as<bool>(false);
            volume.subvolume_sync = node["subvolume_sync"].as<bool>(false);
            volume.convert_rw = node["convert_rw"].as<bool>(false);
            if (!validate_volume(volume, err)) {
                *err = "volume " + volume.path + ": " + *err;
                return false;
            }
            if (node["targets"]) {
                for (const auto &t : node["targets"]) {
                    TargetConfig target;
                    target.path = t["path"].as<std::string>("");
                    target.ssh_sudo = t["ssh_sudo"].as<bool>(false);
                    target.ssh_key = t["ssh_key"].as<std::string>("");
                    if (t["ssh_opts"]) {
                        for (const auto &opt : t["ssh_opts"]) {
                            target.ssh_opts.push_back(opt.as<std::string>());
                        }
                    }
                    target.compress = t["compress"].as<std::string>("");
                    if (target.compress == "none") target.compress.clear();
                    if (t["rate_limit"] && !parse_size_node(t["rate_limit"], &target.rate_limit, err)) {
                        *err = "volume " + volume.path + ", target " + target.path + ": rate_limit: " + *err;
                        return false;
                    }
                    target.check_space = t["check_space"].as<bool>(false);
                    target.safety_margin = t["safety_margin"].as<double>(target.safety_margin);
                    target.force = t["force"].as<bool>(false);
                    target.chunked = t["chunked"].as<bool>(false);
                    if (t["chunk_size"] && !parse_size_node(t["chunk_size"], &target.chunk_size, err)) {
                        *err = "volume " + volume.path + ", target " + target.path + ": chunk_size: " + *err;
                        return false;
                    }
                    if (!validate_target(target, err)) {
                        *err = "volume " + volume.path + ", target " + target.path + ": " + *err;
                        return false;
                    }
                    volume.targets.push_back(target);
                }
            }
            cfg->volumes.push_back(volume);
        }
        return true;
    } catch (const std::exception &e) {
        *err = e.what();
        return false;
    }
}

bool parse_config(const std::string &path, Config *cfg, std::string *err) {
    try {
        return parse_root(YAML::LoadFile(path), cfg, err);
    } catch (const std::exception &e) {
        *err = e.what();
        return false;
    }
}

bool parse_config_text(const std::string &text, Config *cfg, std::string *err) {
    try {
        return parse_root(YAML::Load(text), cfg, err);
    } catch (const std::exception &e) {
        *err = e.what();
        return false;
    }
}

EndpointConfig source_endpoint_config(const Config &cfg, const VolumeConfig &volume) {
    EndpointConfig ec;
    ec.path = volume.snapshot_path();
    ec.prefix = volume.prefix;
    ec.lock_file_name = cfg.lock_file_name;
    ec.convert_rw = volume.convert_rw;
    ec.subvolume_sync = volume.subvolume_sync;
    ec.btrfs_debug = volume.btrfs_debug;
    ec.fs_checks = volume.fs_checks;
    return ec;
}

EndpointConfig target_endpoint_config(const Config &cfg, const VolumeConfig &volume) {
    EndpointConfig ec = source_endpoint_config(cfg, volume);
    // filled in by choose_endpoint from the target spec
    ec.path.clear();
    return ec;
}

SshOptions target_ssh_options(const TargetConfig &target) {
    SshOptions ssh;
    ssh.identity_file = target.ssh_key;
    ssh.ssh_opts = target.ssh_opts;
    ssh.ssh_sudo = target.ssh_sudo;
    return ssh;
}

TransferOptions target_transfer_options(const TargetConfig &target) {
    TransferOptions options;
    options.compress = target.compress;
    options.rate_limit = target.rate_limit;
    options.check_space = target.check_space;
    options.safety_margin = target.safety_margin;
    options.force = target.force;
    options.chunked = target.chunked;
    return options;
}

}
