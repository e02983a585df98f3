#include "util.h"

#include <cerrno>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <ftw.h>
#include <limits.h>
#include <random>
#include <sys/stat.h>
#include <unistd.h>

namespace snapvault {

std::string format_size(uint64_t bytes) {
    static const char *units[] = {"KiB", "MiB", "GiB", "TiB", "PiB"};
    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }
    double value = static_cast<double>(bytes);
    int unit = -1;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        unit++;
    }
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f %s", value, units[unit]);
    return buf;
}

bool parse_size(const std::string &text, uint64_t *out) {
    size_t i = 0;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) i++;
    size_t start = i;
    bool seen_dot = false;
    while (i < text.size() && (std::isdigit(static_cast<unsigned char>(text[i])) || (text[i] == '.' && !seen_dot))) {
        if (text[i] == '.') seen_dot = true;
        i++;
    }
    if (i == start) return false;
    double value = std::strtod(text.substr(start, i - start).c_str(), nullptr);

    std::string unit;
    for (; i < text.size(); i++) {
        if (std::isspace(static_cast<unsigned char>(text[i]))) continue;
        unit += static_cast<char>(std::toupper(static_cast<unsigned char>(text[i])));
    }

    double multiplier = 1.0;
    if (unit.empty() || unit == "B") {
        multiplier = 1.0;
    } else if (unit == "K" || unit == "KIB") {
        multiplier = 1024.0;
    } else if (unit == "M" || unit == "MIB") {
        multiplier = 1024.0 * 1024.0;
    } else if (unit == "G" || unit == "GIB") {
        multiplier = 1024.0 * 1024.0 * 1024.0;
    } else if (unit == "T" || unit == "TIB") {
        multiplier = 1024.0 * 1024.0 * 1024.0 * 1024.0;
    } else if (unit == "KB") {
        multiplier = 1e3;
    } else if (unit == "MB") {
        multiplier = 1e6;
    } else if (unit == "GB") {
        multiplier = 1e9;
    } else if (unit == "TB") {
        multiplier = 1e12;
    } else {
        return false;
    }
    *out = static_cast<uint64_t>(value * multiplier);
    return true;
}

bool path_has_parent_dir(const std::string &path) {
    size_t i = 0;
    while (i < path.size()) {
        while (i < path.size() && path[i] == '/') i++;
        if (i >= path.size()) break;
        size_t start = i;
        while (i < path.size() && path[i] != '/') i++;
        size_t len = i - start;
        if (len == 2 && path[start] == '.' && path[start + 1] == '.') {
            return true;
        }
    }
    return false;
}

std::string path_join(const std::string &dir, const std::string &name) {
    if (dir.empty()) return name;
    if (name.empty()) return dir;
    if (name[0] == '/') return name;
    if (dir[dir.size() - 1] == '/') return dir + name;
    return dir + "/" + name;
}

std::string path_dirname(const std::string &path) {
    size_t end = path.size();
    while (end > 1 && path[end - 1] == '/') end--;
    size_t slash = path.rfind('/', end - 1);
    if (slash == std::string::npos) return ".";
    if (slash == 0) return "/";
    return path.substr(0, slash);
}

std::string path_basename(const std::string &path) {
    size_t end = path.size();
    while (end > 1 && path[end - 1] == '/') end--;
    size_t slash = path.rfind('/', end - 1);
    if (slash == std::string::npos) return path.substr(0, end);
    return path.substr(slash + 1, end - slash - 1);
}

std::string absolute_path(const std::string &path) {
    std::string p = path;
    if (!p.empty() && p[0] == '~') {
        const char *home = getenv("HOME");
        if (home) p = std::string(home) + p.substr(1);
    }
    if (p.empty() || p[0] != '/') {
        char cwd[PATH_MAX];
        if (getcwd(cwd, sizeof(cwd))) {
            p = path_join(cwd, p);
        }
    }
    // collapse "//", "/./" and trailing slashes without touching the filesystem
    std::vector<std::string> parts;
    size_t i = 0;
    while (i < p.size()) {
        while (i < p.size() && p[i] == '/') i++;
        size_t start = i;
        while (i < p.size() && p[i] != '/') i++;
        std::string part = p.substr(start, i - start);
        if (part.empty() || part == ".") continue;
        if (part == "..") {
            if (!parts.empty()) parts.pop_back();
            continue;
        }
        parts.push_back(part);
    }
    std::string out;
    for (const auto &part : parts) out += "/" + part;
    return out.empty() ? "/" : out;
}

bool make_dirs(const std::string &path, int mode, std::string *err) {
    if (path.empty()) return true;
    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        if (S_ISDIR(st.st_mode)) return true;
        if (err) *err = path + " exists and is not a directory";
        return false;
    }
    std::string parent = path_dirname(path);
    if (parent != path && parent != "." && !make_dirs(parent, mode, err)) {
        return false;
    }
    if (mkdir(path.c_str(), static_cast<mode_t>(mode)) != 0 && errno != EEXIST) {
        if (err) *err = "mkdir " + path + ": " + std::strerror(errno);
        return false;
    }
    return true;
}

bool read_file(const std::string &path, std::string *out, std::string *err) {
    FILE *f = std::fopen(path.c_str(), "rb");
    if (!f) {
        if (err) *err = "open " + path + ": " + std::strerror(errno);
        return false;
    }
    out->clear();
    char buf[8192];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
        out->append(buf, n);
    }
    bool ok = !std::ferror(f);
    std::fclose(f);
    if (!ok && err) *err = "read " + path + ": " + std::strerror(errno);
    return ok;
}

bool write_file_atomic(const std::string &path, const std::string &content, std::string *err) {
    std::string tmp = path + ".tmp." + std::to_string(static_cast<int>(getpid()));
    int fd = ::open(tmp.c_str(), O_CREAT | O_TRUNC | O_WRONLY | O_CLOEXEC, 0644);
    if (fd < 0) {
        if (err) *err = "create " + tmp + ": " + std::strerror(errno);
        return false;
    }
    size_t off = 0;
    while (off < content.size()) {
        ssize_t w = ::write(fd, content.data() + off, content.size() - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            if (err) *err = "write " + tmp + ": " + std::strerror(errno);
            ::close(fd);
            ::unlink(tmp.c_str());
            return false;
        }
        off += static_cast<size_t>(w);
    }
    if (::fsync(fd) != 0 || ::close(fd) != 0) {
        if (err) *err = "sync " + tmp + ": " + std::strerror(errno);
        ::unlink(tmp.c_str());
        return false;
    }
    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        if (err) *err = "rename " + tmp + ": " + std::strerror(errno);
        ::unlink(tmp.c_str());
        return false;
    }
    return true;
}

static int remove_cb(const char *fpath, const struct stat *sb, int typeflag, struct FTW *ftwbuf) {
    (void)sb;
    (void)typeflag;
    (void)ftwbuf;
    return remove(fpath);
}

int remove_tree(const std::string &path) {
    return nftw(path.c_str(), remove_cb, 64, FTW_DEPTH | FTW_PHYS);
}

std::string random_hex(size_t bytes) {
    static const char digits[] = "0123456789abcdef";
    std::random_device rd;
    std::string out;
    out.reserve(bytes * 2);
    for (size_t i = 0; i < bytes; i++) {
        unsigned v = rd() & 0xff;
        out += digits[v >> 4];
        out += digits[v & 0xf];
    }
    return out;
}

double monotonic_seconds() {
    auto now = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

std::string format_local_time(time_t t, const char *fmt) {
    struct tm tm;
    localtime_r(&t, &tm);
    char buf[128];
    size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
}

std::string shell_quote(const std::string &arg) {
    if (arg.empty()) return "''";
    bool safe = true;
    for (char c : arg) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || std::strchr("@%+=:,./-_", c))) {
            safe = false;
            break;
        }
    }
    if (safe) return arg;
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::string shell_join(const std::vector<std::string> &argv) {
    std::string out;
    for (size_t i = 0; i < argv.size(); i++) {
        if (i > 0) out += ' ';
        out += shell_quote(argv[i]);
    }
    return out;
}

bool find_in_path(const std::string &program) {
    if (program.find('/') != std::string::npos) {
        return access(program.c_str(), X_OK) == 0;
    }
    const char *path = getenv("PATH");
    if (!path) return false;
    std::string dirs = path;
    size_t start = 0;
    while (start <= dirs.size()) {
        size_t end = dirs.find(':', start);
        if (end == std::string::npos) end = dirs.size();
        std::string dir = dirs.substr(start, end - start);
        if (dir.empty()) dir = ".";
        if (access(path_join(dir, program).c_str(), X_OK) == 0) return true;
        start = end + 1;
    }
    return false;
}

std::string tail_excerpt(const std::string &text, size_t max_len) {
    size_t end = text.size();
    while (end > 0 && std::isspace(static_cast<unsigned char>(text[end - 1]))) end--;
    size_t start = end > max_len ? end - max_len : 0;
    std::string out = text.substr(start, end - start);
    if (start > 0) out = "..." + out;
    return out;
}

}
