#ifndef SNAPVAULT_CHUNKED_H
#define SNAPVAULT_CHUNKED_H

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "endpoint.h"
#include "error.h"
#include "log.h"
#include "process.h"
#include "snapshot.h"

namespace snapvault {

enum class TransferStatus {
    Pending,
    Chunking,
    Transferring,
    Completed,
    Failed
};

enum class ChunkStatus {
    Pending,
    Transferred,
    Failed
};

const char *transfer_status_label(TransferStatus status);
bool parse_transfer_status(const std::string &text, TransferStatus *out);
const char *chunk_status_label(ChunkStatus status);
bool parse_chunk_status(const std::string &text, ChunkStatus *out);

struct ChunkMeta {
    int sequence = 0;
    uint64_t size = 0;
    std::string checksum;     // sha256, lowercase hex
    ChunkStatus status = ChunkStatus::Pending;
    std::string error;
};

struct TransferManifest {
    std::string transfer_id;
    std::string snapshot_name;
    std::string source;
    std::string destination;
    std::string parent_name;
    uint64_t total_size = 0;
    bool chunking_complete = false;   // chunk set frozen, safe to resume
    TransferStatus status = TransferStatus::Pending;
    std::string error_message;
    std::string created_at;
    std::string updated_at;
    std::vector<ChunkMeta> chunks;

    int chunk_count() const { return static_cast<int>(chunks.size()); }
    // Sequences of chunks not yet transferred, ascending.
    std::vector<int> pending_chunks() const;
    // Lowest pending sequence, -1 when everything was transferred.
    int resume_point() const;
    // Bytes covered by the chunks before resume_point().
    uint64_t transferred_bytes() const;
};

std::string manifest_to_json(const TransferManifest &manifest);
bool manifest_from_json(const std::string &text, TransferManifest *out, std::string *err);

std::string sha256_hex(const char *data, size_t len);

// Destination side of a chunked transfer. begin() gets the byte offset the
// destination already holds; finish() returns once the data is durable.
class ChunkSink {
public:
    virtual ~ChunkSink() = default;
    virtual bool begin(uint64_t offset, Error *err) = 0;
    virtual bool write_chunk(const ChunkMeta &chunk, const char *data, size_t len, Error *err) = 0;
    virtual bool finish(Error *err) = 0;
    virtual void abort() = 0;
};

// Pipes every chunk into one live `receive` on the destination.
class ReceiveSink : public ChunkSink {
public:
    ReceiveSink(Endpoint &destination, int receive_timeout);
    ~ReceiveSink() override;

    bool begin(uint64_t offset, Error *err) override;
    bool write_chunk(const ChunkMeta &chunk, const char *data, size_t len, Error *err) override;
    bool finish(Error *err) override;
    void abort() override;

private:
    Endpoint &destination_;
    int receive_timeout_;
    int write_fd_ = -1;
    Process receive_;
};

// Appends chunks to the destination's staging file and replays it into
// `btrfs receive` on finish.
class StagedSink : public ChunkSink {
public:
    StagedSink(Endpoint &destination, const std::string &transfer_id, int receive_timeout);
    ~StagedSink() override;

    bool begin(uint64_t offset, Error *err) override;
    bool write_chunk(const ChunkMeta &chunk, const char *data, size_t len, Error *err) override;
    bool finish(Error *err) override;
    void abort() override;

private:
    Endpoint &destination_;
    std::string transfer_id_;
    int receive_timeout_;
    Process upload_;
};

// Splits send streams into checksummed chunk files under
// <state_dir>/transfers/<id>/ and drives them to a destination, persisting
// the manifest after every state change so an interrupted transfer can be
// resumed from the first chunk not yet transferred.
class ChunkedTransferManager {
public:
    static constexpr uint64_t DEFAULT_CHUNK_SIZE = 64ull * 1024 * 1024;

    ChunkedTransferManager(const std::string &state_dir, uint64_t chunk_size, Log &log);
    virtual ~ChunkedTransferManager() = default;

    std::string transfers_dir() const;
    std::string transfer_dir(const std::string &transfer_id) const;
    std::string chunk_path(const std::string &transfer_id, int sequence) const;
    uint64_t chunk_size() const { return chunk_size_; }
    void set_receive_timeout(int seconds) { receive_timeout_ = seconds; }
    void set_send_timeout(int seconds) { send_timeout_ = seconds; }

    bool create_transfer(const std::string &snapshot_name, const std::string &source,
                         const std::string &destination, const std::string &parent_name,
                         TransferManifest *out, Error *err);
    bool save_manifest(TransferManifest *manifest, Error *err);
    bool load_manifest(const std::string &transfer_id, TransferManifest *out, Error *err);

    // Reads `fd` to EOF into chunk files; the chunk set is frozen afterwards.
    // Gives up when the stream has not ended within the send timeout.
    bool chunk_stream(TransferManifest *manifest, int fd, Error *err);
    // Sends chunks in sequence order; with pending_only, transferred chunks
    // are skipped and the sink starts at the resume offset.
    bool transfer_chunks(TransferManifest *manifest, ChunkSink &sink, bool pending_only, Error *err);
    bool complete_transfer(TransferManifest *manifest, Error *err);
    // Marks the transfer failed and persists it; never fails itself.
    void fail_transfer(TransferManifest *manifest, const std::string &reason);

    // Loads a transfer that can be resumed (chunk set frozen, not completed).
    bool resume_transfer(const std::string &transfer_id, TransferManifest *out, Error *err);

    bool list_transfers(std::vector<TransferManifest> *out, Error *err) const;
    bool cleanup_transfer(const std::string &transfer_id, Error *err);
    int cleanup_completed();

    // Full cycle for one snapshot: create, chunk the send stream, transfer.
    bool send_chunked(SourceEndpoint &source, Endpoint &destination, const Snapshot &snapshot,
                      const Snapshot *parent, TransferManifest *out, Error *err);
    // Continues a stored transfer to `destination` (whose id must match).
    bool resume(const std::string &transfer_id, Endpoint &destination, TransferManifest *out, Error *err);

protected:
    virtual std::unique_ptr<ChunkSink> make_sink(Endpoint &destination, const TransferManifest &manifest);
    bool deliver(TransferManifest *manifest, Endpoint &destination, Error *err);

private:
    std::string state_dir_;
    uint64_t chunk_size_;
    int receive_timeout_ = 300;
    int send_timeout_ = 3600;
    Log &log_;
};

}

#endif
