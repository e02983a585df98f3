#include "lock_table.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <sstream>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <json/json.h>

namespace snapvault {

bool parse_locks(const std::string &text, LockMap *out, std::string *err) {
    out->clear();
    size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return true;
    }

    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string parse_err;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &parse_err)) {
        *err = "invalid lock file format: " + parse_err;
        return false;
    }
    if (!root.isObject()) {
        *err = "invalid lock file format: top level is not an object";
        return false;
    }
    for (const auto &name : root.getMemberNames()) {
        const Json::Value &entry = root[name];
        if (!entry.isObject()) {
            *err = "invalid lock file format: entry " + name + " is not an object";
            return false;
        }
        LockSet set;
        for (const auto &type : entry.getMemberNames()) {
            std::set<std::string> *target = nullptr;
            if (type == "locks") {
                target = &set.locks;
            } else if (type == "parent_locks") {
                target = &set.parent_locks;
            } else {
                *err = "invalid lock file format: unknown lock type " + type + " in " + name;
                return false;
            }
            const Json::Value &ids = entry[type];
            if (!ids.isArray()) {
                *err = "invalid lock file format: " + name + "." + type + " is not a list";
                return false;
            }
            for (const auto &id : ids) {
                if (!id.isString()) {
                    *err = "invalid lock file format: non-string lock in " + name;
                    return false;
                }
                target->insert(id.asString());
            }
        }
        if (!set.empty()) {
            (*out)[name] = set;
        }
    }
    return true;
}

std::string serialize_locks(const LockMap &locks) {
    Json::Value root(Json::objectValue);
    for (const auto &kv : locks) {
        if (kv.second.empty()) continue;
        Json::Value entry(Json::objectValue);
        if (!kv.second.locks.empty()) {
            Json::Value ids(Json::arrayValue);
            for (const auto &id : kv.second.locks) ids.append(id);
            entry["locks"] = ids;
        }
        if (!kv.second.parent_locks.empty()) {
            Json::Value ids(Json::arrayValue);
            for (const auto &id : kv.second.parent_locks) ids.append(id);
            entry["parent_locks"] = ids;
        }
        root[kv.first] = entry;
    }
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "    ";
    return Json::writeString(builder, root) + "\n";
}

bool is_locked(const LockMap &locks, const Snapshot &snapshot) {
    auto it = locks.find(snapshot.name());
    return it != locks.end() && !it->second.empty();
}

bool is_locked_by(const LockMap &locks, const Snapshot &snapshot, const std::string &lock_id) {
    auto it = locks.find(snapshot.name());
    return it != locks.end() && it->second.locks.count(lock_id) > 0;
}

std::vector<Snapshot> select_unlocked_for_deletion(const std::vector<Snapshot> &snapshots,
                                                   const LockMap &locks, int keep) {
    std::vector<Snapshot> unlocked;
    for (const auto &s : snapshots) {
        if (!is_locked(locks, s)) unlocked.push_back(s);
    }
    if (keep <= 0 || unlocked.size() <= static_cast<size_t>(keep)) {
        return {};
    }
    sort_snapshots(&unlocked);
    unlocked.resize(unlocked.size() - static_cast<size_t>(keep));
    return unlocked;
}

namespace {

// flock(2) held for the lifetime of the object
class FileGuard {
public:
    FileGuard() = default;
    ~FileGuard() {
        if (fd_ >= 0) {
            flock(fd_, LOCK_UN);
            ::close(fd_);
        }
    }
    FileGuard(const FileGuard &) = delete;
    FileGuard &operator=(const FileGuard &) = delete;

    bool open(const std::string &path, bool exclusive, std::string *err) {
        int flags = exclusive ? (O_RDWR | O_CREAT) : O_RDONLY;
        fd_ = ::open(path.c_str(), flags | O_CLOEXEC, 0644);
        if (fd_ < 0) {
            *err = "open " + path + ": " + std::strerror(errno);
            return false;
        }
        while (flock(fd_, exclusive ? LOCK_EX : LOCK_SH) != 0) {
            if (errno == EINTR) continue;
            *err = "flock " + path + ": " + std::strerror(errno);
            return false;
        }
        return true;
    }

    bool read_all(std::string *out, std::string *err) {
        out->clear();
        if (lseek(fd_, 0, SEEK_SET) < 0) {
            *err = std::string("seek: ") + std::strerror(errno);
            return false;
        }
        char buf[8192];
        for (;;) {
            ssize_t n = ::read(fd_, buf, sizeof(buf));
            if (n < 0) {
                if (errno == EINTR) continue;
                *err = std::string("read: ") + std::strerror(errno);
                return false;
            }
            if (n == 0) break;
            out->append(buf, static_cast<size_t>(n));
        }
        return true;
    }

    bool replace(const std::string &content, std::string *err) {
        if (ftruncate(fd_, 0) != 0) {
            *err = std::string("truncate: ") + std::strerror(errno);
            return false;
        }
        size_t off = 0;
        while (off < content.size()) {
            ssize_t w = ::pwrite(fd_, content.data() + off, content.size() - off, static_cast<off_t>(off));
            if (w < 0) {
                if (errno == EINTR) continue;
                *err = std::string("write: ") + std::strerror(errno);
                return false;
            }
            off += static_cast<size_t>(w);
        }
        if (fsync(fd_) != 0) {
            *err = std::string("fsync: ") + std::strerror(errno);
            return false;
        }
        return true;
    }

private:
    int fd_ = -1;
};

}

LockTable::LockTable(const std::string &path, Log &log) : path_(path), log_(log) {}

bool LockTable::load(Error *err) {
    struct stat st;
    if (stat(path_.c_str(), &st) != 0) {
        if (errno == ENOENT) {
            entries_.clear();
            return true;
        }
        return set_error(err, ErrorKind::Abort, "error on reading lock file " + path_ + ": " + std::strerror(errno));
    }
    FileGuard guard;
    std::string text;
    std::string msg;
    LockMap parsed;
    if (!guard.open(path_, false, &msg) || !guard.read_all(&text, &msg) || !parse_locks(text, &parsed, &msg)) {
        log_.error("error on reading lock file %s: %s", path_.c_str(), msg.c_str());
        return set_error(err, ErrorKind::Abort, "error on reading lock file " + path_ + ": " + msg);
    }
    entries_ = parsed;
    return true;
}

LockSet LockTable::get(const Snapshot &snapshot) const {
    auto it = entries_.find(snapshot.name());
    if (it == entries_.end()) return LockSet();
    return it->second;
}

template <typename Fn>
bool LockTable::update(Fn mutate, Error *err) {
    FileGuard guard;
    std::string text;
    std::string msg;
    LockMap current;
    if (!guard.open(path_, true, &msg) || !guard.read_all(&text, &msg) || !parse_locks(text, &current, &msg)) {
        log_.error("error on reading lock file %s: %s", path_.c_str(), msg.c_str());
        return set_error(err, ErrorKind::Abort, "error on reading lock file " + path_ + ": " + msg);
    }

    mutate(&current);

    LockMap next;
    for (const auto &kv : current) {
        if (!kv.second.empty()) next[kv.first] = kv.second;
    }
    log_.debug("writing lock file: %s", path_.c_str());
    if (!guard.replace(serialize_locks(next), &msg)) {
        log_.error("error on writing lock file %s: %s", path_.c_str(), msg.c_str());
        return set_error(err, ErrorKind::Abort, "error on writing lock file " + path_ + ": " + msg);
    }
    entries_ = next;
    return true;
}

bool LockTable::set_lock(const Snapshot &snapshot, const std::string &lock_id, bool active, bool parent,
                         Error *err) {
    std::string name = snapshot.name();
    bool ok = update([&](LockMap *locks) {
        LockSet &set = (*locks)[name];
        std::set<std::string> &ids = parent ? set.parent_locks : set.locks;
        if (active) {
            ids.insert(lock_id);
        } else {
            ids.erase(lock_id);
        }
    }, err);
    if (ok) {
        log_.debug("lock state for %s and lock_id %s changed to %s (parent = %s)", name.c_str(), lock_id.c_str(),
                   active ? "true" : "false", parent ? "true" : "false");
    }
    return ok;
}

bool LockTable::release_all(const std::string &lock_id, const std::vector<Snapshot> &known, Error *err) {
    std::set<std::string> names;
    for (const auto &s : known) names.insert(s.name());
    return update([&](LockMap *locks) {
        for (auto &kv : *locks) {
            if (lock_id.empty() || names.count(kv.first) == 0) {
                kv.second = LockSet();
                continue;
            }
            kv.second.locks.erase(lock_id);
            kv.second.parent_locks.erase(lock_id);
        }
    }, err);
}

}
