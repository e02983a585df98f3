#include "local_endpoint.h"

#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <dirent.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <unistd.h>

#include "util.h"

namespace snapvault {

// /proc/mounts escapes blanks in paths as \040 and friends.
static std::string unescape_mount_field(const char *field) {
    std::string out;
    for (const char *p = field; *p; ++p) {
        if (p[0] == '\\' && p[1] >= '0' && p[1] <= '7' && p[2] >= '0' && p[2] <= '7' && p[3] >= '0' && p[3] <= '7') {
            out += static_cast<char>((p[1] - '0') * 64 + (p[2] - '0') * 8 + (p[3] - '0'));
            p += 3;
        } else {
            out += *p;
        }
    }
    return out;
}

std::string filesystem_type(const std::string &path) {
    char real[PATH_MAX];
    if (!realpath(path.c_str(), real)) return "";
    std::string target(real);

    FILE *f = std::fopen("/proc/mounts", "r");
    if (!f) return "";
    std::string best_mount;
    std::string best_type;
    char line[4096];
    while (std::fgets(line, sizeof(line), f)) {
        char *p = line;
        char *fields[6];
        int n = 0;
        while (*p && n < 6) {
            while (*p == ' ' || *p == '\t') p++;
            if (!*p || *p == '\n') break;
            fields[n++] = p;
            while (*p && *p != ' ' && *p != '\t' && *p != '\n') p++;
            if (*p) { *p = '\0'; p++; }
        }
        if (n < 3) continue;
        std::string mount = unescape_mount_field(fields[1]);
        bool under = mount == "/" ||
                     (target.compare(0, mount.size(), mount) == 0 &&
                      (target.size() == mount.size() || target[mount.size()] == '/'));
        // later entries shadow earlier ones on the same mount point
        if (under && mount.size() >= best_mount.size()) {
            best_mount = mount;
            best_type = fields[2];
        }
    }
    std::fclose(f);
    return best_type;
}

bool is_btrfs(const std::string &path) {
    return filesystem_type(path) == "btrfs";
}

bool is_subvolume(const std::string &path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) return false;
    return S_ISDIR(st.st_mode) && st.st_ino == 256;
}

LocalEndpoint::LocalEndpoint(const EndpointConfig &config, Log &log)
    : SourceEndpoint(config, log) {}

bool LocalEndpoint::prepare(Error *err) {
    if (!ensure_directory(err)) return false;
    if (config_.fs_checks && !is_btrfs(path())) {
        return set_error(err, ErrorKind::Abort, path() + " is not on a btrfs filesystem");
    }
    return true;
}

bool LocalEndpoint::ensure_directory(Error *err) {
    struct stat st;
    if (stat(path().c_str(), &st) == 0) {
        if (!S_ISDIR(st.st_mode)) {
            return set_error(err, ErrorKind::Abort, path() + " exists and is not a directory");
        }
        return true;
    }
    log_.info("creating directory %s", path().c_str());
    std::string mk_err;
    if (!make_dirs(path(), 0755, &mk_err)) {
        return set_error(err, ErrorKind::Abort, "cannot create " + path() + ": " + mk_err);
    }
    return true;
}

bool LocalEndpoint::get_space_info(SpaceInfo *out, Error *err) {
    struct statvfs vfs;
    if (statvfs(path().c_str(), &vfs) != 0) {
        return set_error(err, ErrorKind::Abort, "statvfs " + path() + ": " + std::strerror(errno));
    }
    out->free_bytes = static_cast<uint64_t>(vfs.f_bavail) * vfs.f_frsize;
    out->total_bytes = static_cast<uint64_t>(vfs.f_blocks) * vfs.f_frsize;
    return true;
}

bool LocalEndpoint::snapshot_exists(const std::string &name, Error *) {
    struct stat st;
    return stat(path_join(path(), name).c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool LocalEndpoint::list_directory(std::vector<std::string> *entries, Error *err) {
    DIR *dir = opendir(path().c_str());
    if (!dir) {
        return set_error(err, ErrorKind::Abort, "opendir " + path() + ": " + std::strerror(errno));
    }
    struct dirent *ent;
    while ((ent = readdir(dir)) != nullptr) {
        if (std::strcmp(ent->d_name, ".") == 0 || std::strcmp(ent->d_name, "..") == 0) continue;
        entries->push_back(ent->d_name);
    }
    closedir(dir);
    return true;
}

std::vector<std::string> LocalEndpoint::wrap_command(const std::vector<std::string> &argv) const {
    if (!config_.use_sudo || geteuid() == 0 || argv.empty()) return argv;
    bool elevate = argv[0] == "btrfs";
    if (!elevate && argv[0] == "sh" && argv.size() >= 3) {
        elevate = argv[2].find("btrfs ") != std::string::npos;
    }
    if (!elevate) return argv;
    std::vector<std::string> out = {"sudo", "-n"};
    out.insert(out.end(), argv.begin(), argv.end());
    return out;
}

}
