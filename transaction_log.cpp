#include "transaction_log.h"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <deque>
#include <fstream>
#include <memory>
#include <unistd.h>

#include <json/json.h>

#include "util.h"

namespace snapvault {

std::string serialize_record(const TransactionRecord &record) {
    Json::Value root(Json::objectValue);
    root["timestamp"] = record.timestamp;
    root["pid"] = static_cast<Json::Int64>(record.pid);
    root["action"] = record.action;
    root["status"] = record.status;
    if (!record.source.empty()) root["source"] = record.source;
    if (!record.destination.empty()) root["destination"] = record.destination;
    if (!record.snapshot.empty()) root["snapshot"] = record.snapshot;
    if (!record.parent.empty()) root["parent"] = record.parent;
    if (record.size_bytes >= 0) root["size_bytes"] = static_cast<Json::Int64>(record.size_bytes);
    if (record.duration_seconds >= 0) {
        root["duration_seconds"] = std::round(record.duration_seconds * 1000.0) / 1000.0;
    }
    if (!record.error.empty()) root["error"] = record.error;
    if (!record.details.empty()) root["details"] = record.details;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, root);
}

static std::string string_member(const Json::Value &root, const char *key) {
    const Json::Value &v = root[key];
    return v.isString() ? v.asString() : std::string();
}

bool parse_record(const std::string &line, TransactionRecord *out) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errs;
    if (!reader->parse(line.data(), line.data() + line.size(), &root, &errs)) return false;
    if (!root.isObject() || !root["action"].isString() || !root["status"].isString()) return false;

    TransactionRecord r;
    r.timestamp = string_member(root, "timestamp");
    if (root["pid"].isIntegral()) r.pid = static_cast<long>(root["pid"].asInt64());
    r.action = root["action"].asString();
    r.status = root["status"].asString();
    r.source = string_member(root, "source");
    r.destination = string_member(root, "destination");
    r.snapshot = string_member(root, "snapshot");
    r.parent = string_member(root, "parent");
    if (root["size_bytes"].isIntegral()) r.size_bytes = root["size_bytes"].asInt64();
    if (root["duration_seconds"].isNumeric()) r.duration_seconds = root["duration_seconds"].asDouble();
    r.error = string_member(root, "error");
    r.details = string_member(root, "details");
    *out = r;
    return true;
}

TransactionLog::TransactionLog(const std::string &path, Log &log) : path_(path), log_(log) {
    if (path_.empty()) return;
    std::string err;
    if (!make_dirs(path_dirname(path_), 0755, &err)) {
        log_.warn("cannot create transaction log directory: %s", err.c_str());
    }
}

void TransactionLog::record(TransactionRecord record) {
    if (path_.empty()) return;
    if (record.timestamp.empty()) record.timestamp = format_local_time(std::time(nullptr), "%Y-%m-%dT%H:%M:%S");
    if (record.pid == 0) record.pid = static_cast<long>(getpid());
    std::string line = serialize_record(record) + "\n";

    std::lock_guard<std::mutex> guard(mutex_);
    FILE *f = std::fopen(path_.c_str(), "a");
    if (!f) {
        log_.warn("cannot open transaction log %s: %s", path_.c_str(), std::strerror(errno));
        return;
    }
    if (std::fwrite(line.data(), 1, line.size(), f) != line.size()) {
        log_.warn("cannot write transaction log %s: %s", path_.c_str(), std::strerror(errno));
    }
    std::fclose(f);
}

std::vector<TransactionRecord> TransactionLog::read(size_t limit, const std::string &action,
                                                    const std::string &status) const {
    std::deque<TransactionRecord> window;
    if (path_.empty()) return {};
    std::ifstream in(path_);
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        TransactionRecord r;
        if (!parse_record(line, &r)) continue;
        if (!action.empty() && r.action != action) continue;
        if (!status.empty() && r.status != status) continue;
        window.push_back(r);
        if (limit > 0 && window.size() > limit) window.pop_front();
    }
    return std::vector<TransactionRecord>(window.begin(), window.end());
}

TransactionStats TransactionLog::stats() const {
    TransactionStats stats;
    for (const auto &r : read(0, "", "")) {
        stats.total++;
        if (r.status == "completed") stats.completed[r.action]++;
        if (r.status == "failed") stats.failed[r.action]++;
    }
    return stats;
}

TransactionScope::TransactionScope(TransactionLog *log, const std::string &action, const std::string &source,
                                   const std::string &destination, const std::string &snapshot,
                                   const std::string &parent)
    : log_(log), started_(monotonic_seconds()) {
    base_.action = action;
    base_.source = source;
    base_.destination = destination;
    base_.snapshot = snapshot;
    base_.parent = parent;
    if (log_) {
        TransactionRecord r = base_;
        r.status = "started";
        log_->record(r);
    }
}

TransactionScope::~TransactionScope() {
    if (!finished_) finish("failed", "interrupted");
}

void TransactionScope::complete() {
    finish("completed", "");
}

void TransactionScope::fail(const std::string &message) {
    finish("failed", message);
}

void TransactionScope::finish(const std::string &status, const std::string &error) {
    if (finished_) return;
    finished_ = true;
    if (!log_) return;
    TransactionRecord r = base_;
    r.status = status;
    r.error = error;
    r.size_bytes = size_bytes_;
    r.details = details_;
    r.duration_seconds = monotonic_seconds() - started_;
    log_->record(r);
}

}
