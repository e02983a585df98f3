#ifndef SNAPVAULT_ESTIMATE_H
#define SNAPVAULT_ESTIMATE_H

#include <cstdint>

#include "endpoint.h"
#include "error.h"
#include "log.h"
#include "snapshot.h"

namespace snapvault {

// Size of the `--no-data` send stream (metadata only).
bool measure_send_stream(SourceEndpoint &source, const Snapshot &snapshot, const Snapshot *parent,
                         uint64_t *out, Error *err);
// `du -sb` of the snapshot, minus that of the parent for incrementals.
bool measure_usage_delta(SourceEndpoint &source, const Snapshot &snapshot, const Snapshot *parent,
                         uint64_t *out, Error *err);

// Larger of the two measurements; fails only when neither works.
bool estimate_transfer_size(SourceEndpoint &source, const Snapshot &snapshot, const Snapshot *parent,
                            uint64_t *out, Error *err);

// Compares estimate * (1 + margin) against the destination's free space.
// InsufficientSpace unless `force`, which downgrades it to a warning.
bool check_space(Endpoint &destination, uint64_t estimate, double margin, bool force, Log &log, Error *err);

}

#endif
