#ifndef SNAPVAULT_VERIFY_H
#define SNAPVAULT_VERIFY_H

#include <string>
#include <vector>

#include "endpoint.h"
#include "error.h"
#include "log.h"

namespace snapvault {

enum class VerifyLevel {
    Metadata,
    Stream
};

const char *verify_level_label(VerifyLevel level);
bool parse_verify_level(const std::string &text, VerifyLevel *out);

struct VerifyResult {
    std::string name;
    bool passed = false;
    std::string message;
};

struct VerifyReport {
    VerifyLevel level = VerifyLevel::Metadata;
    std::string location;
    std::vector<VerifyResult> results;
    std::vector<std::string> errors;

    size_t passed() const;
    size_t failed() const;
    bool ok() const { return errors.empty() && failed() == 0; }
};

// Checks the backup listing, and with `source` set, that every source
// snapshot made it to the backup.
bool verify_metadata(SourceEndpoint &backup, Endpoint *source, const std::string &snapshot_name, Log &log,
                     VerifyReport *report, Error *err);

// Produces and drains the send stream of each backup snapshot (against its
// nearest older one) under a restore lock; a non-zero exit fails it.
bool verify_stream(SourceEndpoint &backup, const std::string &snapshot_name, Log &log, VerifyReport *report,
                   Error *err);

bool verify_backups(SourceEndpoint &backup, Endpoint *source, VerifyLevel level, const std::string &snapshot_name,
                    Log &log, VerifyReport *report, Error *err);

}

#endif
