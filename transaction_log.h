#ifndef SNAPVAULT_TRANSACTION_LOG_H
#define SNAPVAULT_TRANSACTION_LOG_H

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "log.h"

namespace snapvault {

struct TransactionRecord {
    std::string timestamp;        // filled in by record() when empty
    long pid = 0;
    std::string action;           // transfer, chunked_transfer, restore, verify, snapshot, prune
    std::string status;           // started, completed, failed
    std::string source;
    std::string destination;
    std::string snapshot;
    std::string parent;
    int64_t size_bytes = -1;      // < 0: unknown
    double duration_seconds = -1; // < 0: not measured
    std::string error;
    std::string details;
};

struct TransactionStats {
    size_t total = 0;
    std::map<std::string, size_t> completed;   // per action
    std::map<std::string, size_t> failed;
};

std::string serialize_record(const TransactionRecord &record);
bool parse_record(const std::string &line, TransactionRecord *out);

// Append-only JSON-lines audit log. An empty path disables it. Write failures
// are reported as warnings only.
class TransactionLog {
public:
    TransactionLog(const std::string &path, Log &log);

    bool enabled() const { return !path_.empty(); }
    const std::string &path() const { return path_; }

    void record(TransactionRecord record);

    // Newest `limit` (0: all) records matching action/status ("" matches any),
    // in file order.
    std::vector<TransactionRecord> read(size_t limit, const std::string &action, const std::string &status) const;
    TransactionStats stats() const;

private:
    std::string path_;
    Log &log_;
    std::mutex mutex_;
};

// Records `started` on construction and exactly one closing record: completed,
// failed, or failed with "interrupted" when neither was called.
class TransactionScope {
public:
    TransactionScope(TransactionLog *log, const std::string &action, const std::string &source,
                     const std::string &destination, const std::string &snapshot, const std::string &parent);
    ~TransactionScope();
    TransactionScope(const TransactionScope &) = delete;
    TransactionScope &operator=(const TransactionScope &) = delete;

    void set_size(int64_t bytes) { size_bytes_ = bytes; }
    void set_details(const std::string &details) { details_ = details; }
    void complete();
    void fail(const std::string &message);

private:
    void finish(const std::string &status, const std::string &error);

    TransactionLog *log_;
    TransactionRecord base_;
    double started_;
    int64_t size_bytes_ = -1;
    std::string details_;
    bool finished_ = false;
};

}

#endif
