#ifndef SNAPVAULT_TRANSFER_H
#define SNAPVAULT_TRANSFER_H

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "endpoint.h"
#include "error.h"
#include "log.h"
#include "snapshot.h"
#include "transaction_log.h"

namespace snapvault {

class ChunkedTransferManager;

struct CompressionTool {
    const char *name;
    std::vector<std::string> compress;
    const char *decompress;       // shell fragment run in front of receive
};

// nullptr for unknown names; "" and "none" map to nullptr as well, check
// with is_known_compression() first.
const CompressionTool *find_compression(const std::string &name);
bool is_known_compression(const std::string &name);

struct TransferOptions {
    std::string compress;             // "" or "none": no compression
    uint64_t rate_limit = 0;          // bytes per second, 0: unlimited
    bool check_space = false;
    double safety_margin = 0.10;
    bool force = false;
    bool show_progress = true;
    bool chunked = false;
    std::vector<Snapshot> clones;
    int send_timeout = 3600;
    int filter_timeout = 3600;
    int receive_timeout = 300;
    int progress_interval = 10;
};

// Runs one snapshot transfer. The process pipeline is
//   send -> pump -> [compress] -> [rate limit] -> [pv] -> receive
// where the pump is an in-process thread counting bytes; remote endpoints
// that can take the stream directly get send -> [buffer] -> receive.
class TransferEngine {
public:
    TransferEngine(TransactionLog *journal, Log &log);
    virtual ~TransferEngine();

    // Chunked transfers are only available once a manager is attached.
    void set_chunked_manager(ChunkedTransferManager *manager) { chunked_ = manager; }

    virtual bool send_snapshot(SourceEndpoint &source, Endpoint &destination, const Snapshot &snapshot,
                               const Snapshot *parent, const TransferOptions &options, Error *err);

    uint64_t last_bytes() const { return last_bytes_; }

protected:
    bool preflight(SourceEndpoint &source, Endpoint &destination, const Snapshot &snapshot,
                   const Snapshot *parent, const TransferOptions &options, uint64_t *estimate, Error *err);
    bool run_direct(SourceEndpoint &source, Endpoint &destination, const Snapshot &snapshot,
                    const Snapshot *parent, const TransferOptions &options, Error *err);
    bool run_filtered(SourceEndpoint &source, Endpoint &destination, const Snapshot &snapshot,
                      const Snapshot *parent, const TransferOptions &options, uint64_t estimate, Error *err);

    TransactionLog *journal_;
    Log &log_;
    ChunkedTransferManager *chunked_ = nullptr;
    uint64_t last_bytes_ = 0;
};

}

#endif
