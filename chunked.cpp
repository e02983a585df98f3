#include "chunked.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <json/json.h>
#include <openssl/evp.h>

#include "util.h"

namespace snapvault {

const char *transfer_status_label(TransferStatus status) {
    switch (status) {
        case TransferStatus::Pending:
            return "pending";
        case TransferStatus::Chunking:
            return "chunking";
        case TransferStatus::Transferring:
            return "transferring";
        case TransferStatus::Completed:
            return "completed";
        case TransferStatus::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

bool parse_transfer_status(const std::string &text, TransferStatus *out) {
    static const TransferStatus all[] = {TransferStatus::Pending, TransferStatus::Chunking,
                                         TransferStatus::Transferring, TransferStatus::Completed,
                                         TransferStatus::Failed};
    for (TransferStatus s : all) {
        if (text == transfer_status_label(s)) {
            *out = s;
            return true;
        }
    }
    return false;
}

const char *chunk_status_label(ChunkStatus status) {
    switch (status) {
        case ChunkStatus::Pending:
            return "pending";
        case ChunkStatus::Transferred:
            return "transferred";
        case ChunkStatus::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

bool parse_chunk_status(const std::string &text, ChunkStatus *out) {
    static const ChunkStatus all[] = {ChunkStatus::Pending, ChunkStatus::Transferred, ChunkStatus::Failed};
    for (ChunkStatus s : all) {
        if (text == chunk_status_label(s)) {
            *out = s;
            return true;
        }
    }
    return false;
}

std::vector<int> TransferManifest::pending_chunks() const {
    std::vector<int> pending;
    for (const auto &c : chunks) {
        if (c.status != ChunkStatus::Transferred) pending.push_back(c.sequence);
    }
    return pending;
}

int TransferManifest::resume_point() const {
    std::vector<int> pending = pending_chunks();
    if (pending.empty()) return -1;
    return *std::min_element(pending.begin(), pending.end());
}

uint64_t TransferManifest::transferred_bytes() const {
    int point = resume_point();
    uint64_t bytes = 0;
    for (const auto &c : chunks) {
        if (point >= 0 && c.sequence >= point) continue;
        bytes += c.size;
    }
    return bytes;
}

std::string manifest_to_json(const TransferManifest &manifest) {
    Json::Value root(Json::objectValue);
    root["transfer_id"] = manifest.transfer_id;
    root["snapshot_name"] = manifest.snapshot_name;
    root["source"] = manifest.source;
    root["destination"] = manifest.destination;
    if (manifest.parent_name.empty()) {
        root["parent_name"] = Json::Value(Json::nullValue);
    } else {
        root["parent_name"] = manifest.parent_name;
    }
    root["chunk_count"] = manifest.chunk_count();
    root["total_size"] = static_cast<Json::UInt64>(manifest.total_size);
    root["chunking_complete"] = manifest.chunking_complete;
    root["status"] = transfer_status_label(manifest.status);
    root["error_message"] = manifest.error_message;
    root["created_at"] = manifest.created_at;
    root["updated_at"] = manifest.updated_at;
    Json::Value chunks(Json::arrayValue);
    for (const auto &c : manifest.chunks) {
        Json::Value chunk(Json::objectValue);
        chunk["sequence"] = c.sequence;
        chunk["size"] = static_cast<Json::UInt64>(c.size);
        chunk["checksum"] = c.checksum;
        chunk["status"] = chunk_status_label(c.status);
        if (!c.error.empty()) chunk["error"] = c.error;
        chunks.append(chunk);
    }
    root["chunks"] = chunks;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "    ";
    return Json::writeString(builder, root) + "\n";
}

bool manifest_from_json(const std::string &text, TransferManifest *out, std::string *err) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errs;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) {
        *err = "invalid manifest: " + errs;
        return false;
    }
    if (!root.isObject() || !root["transfer_id"].isString() || !root["snapshot_name"].isString() ||
        !root["destination"].isString() || !root["status"].isString() || !root["chunks"].isArray()) {
        *err = "manifest is missing required fields";
        return false;
    }
    TransferManifest m;
    m.transfer_id = root["transfer_id"].asString();
    m.snapshot_name = root["snapshot_name"].asString();
    m.source = root.get("source", "").asString();
    m.destination = root["destination"].asString();
    if (root["parent_name"].isString()) m.parent_name = root["parent_name"].asString();
    m.total_size = root.get("total_size", 0).asUInt64();
    m.chunking_complete = root.get("chunking_complete", false).asBool();
    if (!parse_transfer_status(root["status"].asString(), &m.status)) {
        *err = "unknown transfer status " + root["status"].asString();
        return false;
    }
    m.error_message = root.get("error_message", "").asString();
    m.created_at = root.get("created_at", "").asString();
    m.updated_at = root.get("updated_at", "").asString();
    for (const auto &chunk : root["chunks"]) {
        if (!chunk.isObject() || !chunk["sequence"].isInt() || !chunk["size"].isIntegral() ||
            !chunk["checksum"].isString() || !chunk["status"].isString()) {
            *err = "malformed chunk entry";
            return false;
        }
        ChunkMeta c;
        c.sequence = chunk["sequence"].asInt();
        c.size = chunk["size"].asUInt64();
        c.checksum = chunk["checksum"].asString();
        if (!parse_chunk_status(chunk["status"].asString(), &c.status)) {
            *err = "unknown chunk status " + chunk["status"].asString();
            return false;
        }
        c.error = chunk.get("error", "").asString();
        m.chunks.push_back(c);
    }
    if (root.isMember("chunk_count") && root["chunk_count"].asInt() != m.chunk_count()) {
        *err = "chunk_count does not match chunk list";
        return false;
    }
    *out = m;
    return true;
}

namespace {

class Sha256 {
public:
    Sha256() : ctx_(EVP_MD_CTX_new()) {
        if (ctx_) EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr);
    }
    ~Sha256() { EVP_MD_CTX_free(ctx_); }
    Sha256(const Sha256 &) = delete;
    Sha256 &operator=(const Sha256 &) = delete;

    void update(const char *data, size_t len) { EVP_DigestUpdate(ctx_, data, len); }

    std::string hex() {
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int len = 0;
        EVP_DigestFinal_ex(ctx_, digest, &len);
        static const char digits[] = "0123456789abcdef";
        std::string out;
        for (unsigned int i = 0; i < len; ++i) {
            out += digits[digest[i] >> 4];
            out += digits[digest[i] & 0x0f];
        }
        return out;
    }

private:
    EVP_MD_CTX *ctx_;
};

std::string now_text() {
    return format_local_time(std::time(nullptr), "%Y-%m-%dT%H:%M:%S");
}

bool valid_transfer_id(const std::string &id) {
    return !id.empty() && id.find('/') == std::string::npos && id != "." && id != "..";
}

}

std::string sha256_hex(const char *data, size_t len) {
    Sha256 sha;
    sha.update(data, len);
    return sha.hex();
}

ReceiveSink::ReceiveSink(Endpoint &destination, int receive_timeout)
    : destination_(destination), receive_timeout_(receive_timeout) {}

ReceiveSink::~ReceiveSink() {
    abort();
}

bool ReceiveSink::begin(uint64_t, Error *err) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        return set_error(err, ErrorKind::Transfer, std::string("pipe: ") + std::strerror(errno));
    }
    bool started = destination_.receive(fds[0], "", &receive_, err);
    ::close(fds[0]);
    if (!started) {
        ::close(fds[1]);
        return rethrow_as(err, ErrorKind::Transfer, "");
    }
    write_fd_ = fds[1];
    return true;
}

bool ReceiveSink::write_chunk(const ChunkMeta &chunk, const char *data, size_t len, Error *err) {
    ScopedSigpipeBlock block;
    std::string write_err;
    if (!write_all(write_fd_, data, len, &write_err)) {
        std::string excerpt = tail_excerpt(receive_.stderr_text(), 300);
        return set_error(err, ErrorKind::Transfer, "chunk " + std::to_string(chunk.sequence) + ": " + write_err +
                                                       (excerpt.empty() ? "" : ": " + excerpt));
    }
    return true;
}

bool ReceiveSink::finish(Error *err) {
    if (write_fd_ >= 0) {
        ::close(write_fd_);
        write_fd_ = -1;
    }
    int rc = -1;
    if (!receive_.wait(receive_timeout_, &rc)) {
        return set_error(err, ErrorKind::Transfer,
                         "receive timed out after " + std::to_string(receive_timeout_) + "s");
    }
    if (rc != 0) {
        return set_error(err, ErrorKind::Transfer, "receive exited with " + std::to_string(rc) + ": " +
                                                       tail_excerpt(receive_.stderr_text(), 300));
    }
    return true;
}

void ReceiveSink::abort() {
    if (write_fd_ >= 0) {
        ::close(write_fd_);
        write_fd_ = -1;
    }
    if (receive_.running()) receive_.kill();
}

StagedSink::StagedSink(Endpoint &destination, const std::string &transfer_id, int receive_timeout)
    : destination_(destination), transfer_id_(transfer_id), receive_timeout_(receive_timeout) {}

StagedSink::~StagedSink() {
    abort();
}

bool StagedSink::begin(uint64_t offset, Error *err) {
    return destination_.open_staged_receive(transfer_id_, offset, &upload_, err);
}

bool StagedSink::write_chunk(const ChunkMeta &chunk, const char *data, size_t len, Error *err) {
    ScopedSigpipeBlock block;
    std::string write_err;
    if (!write_all(upload_.stdin_fd(), data, len, &write_err)) {
        std::string excerpt = tail_excerpt(upload_.stderr_text(), 300);
        return set_error(err, ErrorKind::Transfer, "chunk " + std::to_string(chunk.sequence) + ": " + write_err +
                                                       (excerpt.empty() ? "" : ": " + excerpt));
    }
    return true;
}

bool StagedSink::finish(Error *err) {
    upload_.close_stdin();
    int rc = -1;
    if (!upload_.wait(receive_timeout_, &rc) || rc != 0) {
        return set_error(err, ErrorKind::Transfer, "upload to " + destination_.describe() + " exited with " +
                                                       std::to_string(rc) + ": " +
                                                       tail_excerpt(upload_.stderr_text(), 300));
    }
    return destination_.commit_staged_receive(transfer_id_, receive_timeout_, err);
}

void StagedSink::abort() {
    // chunks already written must reach the staging file for the next attempt
    upload_.close_stdin();
    if (upload_.running()) {
        int rc = -1;
        upload_.wait(receive_timeout_, &rc);
    }
}

ChunkedTransferManager::ChunkedTransferManager(const std::string &state_dir, uint64_t chunk_size, Log &log)
    : state_dir_(state_dir), chunk_size_(chunk_size > 0 ? chunk_size : DEFAULT_CHUNK_SIZE), log_(log) {}

std::string ChunkedTransferManager::transfers_dir() const {
    return path_join(state_dir_, "transfers");
}

std::string ChunkedTransferManager::transfer_dir(const std::string &transfer_id) const {
    return path_join(transfers_dir(), transfer_id);
}

std::string ChunkedTransferManager::chunk_path(const std::string &transfer_id, int sequence) const {
    char name[32];
    std::snprintf(name, sizeof(name), "chunk_%06d.bin", sequence);
    return path_join(transfer_dir(transfer_id), name);
}

bool ChunkedTransferManager::create_transfer(const std::string &snapshot_name, const std::string &source,
                                             const std::string &destination, const std::string &parent_name,
                                             TransferManifest *out, Error *err) {
    TransferManifest m;
    m.transfer_id = format_local_time(std::time(nullptr), "%Y%m%d-%H%M%S") + "-" + random_hex(4);
    m.snapshot_name = snapshot_name;
    m.source = source;
    m.destination = destination;
    m.parent_name = parent_name;
    m.status = TransferStatus::Pending;
    m.created_at = now_text();

    std::string mk_err;
    if (!make_dirs(transfer_dir(m.transfer_id), 0700, &mk_err)) {
        return set_error(err, ErrorKind::Transfer, "cannot create transfer directory: " + mk_err);
    }
    if (!save_manifest(&m, err)) return false;
    log_.debug("created chunked transfer %s for %s", m.transfer_id.c_str(), snapshot_name.c_str());
    *out = m;
    return true;
}

bool ChunkedTransferManager::save_manifest(TransferManifest *manifest, Error *err) {
    manifest->updated_at = now_text();
    std::string write_err;
    std::string path = path_join(transfer_dir(manifest->transfer_id), "manifest.json");
    if (!write_file_atomic(path, manifest_to_json(*manifest), &write_err)) {
        return set_error(err, ErrorKind::Transfer, "cannot save manifest: " + write_err);
    }
    return true;
}

bool ChunkedTransferManager::load_manifest(const std::string &transfer_id, TransferManifest *out, Error *err) {
    if (!valid_transfer_id(transfer_id)) {
        return set_error(err, ErrorKind::Abort, "invalid transfer id " + transfer_id);
    }
    std::string text;
    std::string read_err;
    if (!read_file(path_join(transfer_dir(transfer_id), "manifest.json"), &text, &read_err)) {
        return set_error(err, ErrorKind::Abort, "unknown transfer " + transfer_id + ": " + read_err);
    }
    std::string parse_err;
    if (!manifest_from_json(text, out, &parse_err)) {
        return set_error(err, ErrorKind::Abort, "transfer " + transfer_id + ": " + parse_err);
    }
    return true;
}

bool ChunkedTransferManager::chunk_stream(TransferManifest *manifest, int fd, Error *err) {
    manifest->status = TransferStatus::Chunking;
    manifest->chunks.clear();
    manifest->total_size = 0;
    manifest->chunking_complete = false;
    if (!save_manifest(manifest, err)) {
        fail_transfer(manifest, err ? err->message : "cannot save manifest");
        return false;
    }

    std::vector<char> buf(1024 * 1024);
    double deadline = monotonic_seconds() + send_timeout_;
    bool eof = false;
    while (!eof) {
        ChunkMeta chunk;
        chunk.sequence = manifest->chunk_count();
        std::string path = chunk_path(manifest->transfer_id, chunk.sequence);
        int out = ::open(path.c_str(), O_CREAT | O_TRUNC | O_WRONLY | O_CLOEXEC, 0600);
        if (out < 0) {
            std::string msg = "chunk " + std::to_string(chunk.sequence) + ": open " + path + ": " + std::strerror(errno);
            fail_transfer(manifest, msg);
            return set_error(err, ErrorKind::Transfer, msg);
        }
        Sha256 sha;
        std::string failure;
        while (chunk.size < chunk_size_) {
            size_t want = static_cast<size_t>(std::min<uint64_t>(buf.size(), chunk_size_ - chunk.size));
            ssize_t n = read_until(fd, buf.data(), want, deadline);
            if (n < 0) {
                if (errno == ETIMEDOUT) {
                    failure = "send stream timed out after " + std::to_string(send_timeout_) + "s";
                } else {
                    failure = std::string("reading send stream: ") + std::strerror(errno);
                }
                break;
            }
            if (n == 0) {
                eof = true;
                break;
            }
            std::string write_err;
            if (!write_all(out, buf.data(), static_cast<size_t>(n), &write_err)) {
                failure = write_err;
                break;
            }
            sha.update(buf.data(), static_cast<size_t>(n));
            chunk.size += static_cast<uint64_t>(n);
        }
        if (failure.empty() && fsync(out) != 0) failure = std::string("fsync: ") + std::strerror(errno);
        ::close(out);
        if (!failure.empty()) {
            std::string msg = "chunk " + std::to_string(chunk.sequence) + ": " + failure;
            fail_transfer(manifest, msg);
            return set_error(err, ErrorKind::Transfer, msg);
        }
        if (chunk.size == 0) {
            ::unlink(path.c_str());
            break;
        }
        chunk.checksum = sha.hex();
        manifest->chunks.push_back(chunk);
        manifest->total_size += chunk.size;
        if (!save_manifest(manifest, err)) {
            fail_transfer(manifest, err ? err->message : "cannot save manifest");
            return false;
        }
        log_.debug("chunk %d: %s", chunk.sequence, format_size(chunk.size).c_str());
    }
    if (manifest->chunks.empty()) {
        fail_transfer(manifest, "send stream was empty");
        return set_error(err, ErrorKind::Transfer, "send stream of " + manifest->snapshot_name + " was empty");
    }
    return true;
}

bool ChunkedTransferManager::transfer_chunks(TransferManifest *manifest, ChunkSink &sink, bool pending_only,
                                             Error *err) {
    Error local;
    Error *e = err ? err : &local;
    manifest->status = TransferStatus::Transferring;
    manifest->error_message.clear();
    if (!save_manifest(manifest, e)) {
        fail_transfer(manifest, e->message);
        return false;
    }

    uint64_t offset = pending_only ? manifest->transferred_bytes() : 0;
    if (!sink.begin(offset, e)) {
        fail_transfer(manifest, e->message);
        return rethrow_as(e, ErrorKind::Transfer, "");
    }

    std::string data;
    for (auto &chunk : manifest->chunks) {
        if (pending_only && chunk.status == ChunkStatus::Transferred) continue;
        std::string read_err;
        std::string failure;
        if (!read_file(chunk_path(manifest->transfer_id, chunk.sequence), &data, &read_err)) {
            failure = read_err;
        } else if (data.size() != chunk.size || sha256_hex(data.data(), data.size()) != chunk.checksum) {
            failure = "checksum mismatch";
        } else if (!sink.write_chunk(chunk, data.data(), data.size(), e)) {
            failure = e->message;
        }
        if (!failure.empty()) {
            chunk.status = ChunkStatus::Failed;
            chunk.error = failure;
            sink.abort();
            std::string msg = "chunk " + std::to_string(chunk.sequence) + " of transfer " + manifest->transfer_id +
                              " failed: " + failure;
            fail_transfer(manifest, msg);
            return set_error(e, ErrorKind::Transfer, msg);
        }
        chunk.status = ChunkStatus::Transferred;
        chunk.error.clear();
        if (!save_manifest(manifest, e)) {
            sink.abort();
            fail_transfer(manifest, e->message);
            return false;
        }
    }

    if (!sink.finish(e)) {
        fail_transfer(manifest, e->message);
        return rethrow_as(e, ErrorKind::Transfer, "transfer " + manifest->transfer_id);
    }
    return true;
}

bool ChunkedTransferManager::complete_transfer(TransferManifest *manifest, Error *err) {
    manifest->status = TransferStatus::Completed;
    manifest->error_message.clear();
    if (!save_manifest(manifest, err)) return false;
    for (const auto &c : manifest->chunks) {
        ::unlink(chunk_path(manifest->transfer_id, c.sequence).c_str());
    }
    log_.debug("chunked transfer %s completed", manifest->transfer_id.c_str());
    return true;
}

void ChunkedTransferManager::fail_transfer(TransferManifest *manifest, const std::string &reason) {
    manifest->status = TransferStatus::Failed;
    manifest->error_message = reason;
    Error save_err;
    if (!save_manifest(manifest, &save_err)) {
        log_.warn("cannot record failure of transfer %s: %s", manifest->transfer_id.c_str(),
                  save_err.message.c_str());
    }
}

bool ChunkedTransferManager::resume_transfer(const std::string &transfer_id, TransferManifest *out, Error *err) {
    if (!load_manifest(transfer_id, out, err)) return false;
    if (out->status == TransferStatus::Completed) {
        return set_error(err, ErrorKind::Abort, "transfer " + transfer_id + " is already completed");
    }
    if (!out->chunking_complete) {
        return set_error(err, ErrorKind::Abort, "transfer " + transfer_id +
                                                    " was interrupted while chunking and cannot be resumed");
    }
    log_.info("resuming transfer %s of %s at chunk %d of %d", transfer_id.c_str(), out->snapshot_name.c_str(),
              out->resume_point(), out->chunk_count());
    return true;
}

bool ChunkedTransferManager::list_transfers(std::vector<TransferManifest> *out, Error *err) const {
    out->clear();
    DIR *dir = opendir(transfers_dir().c_str());
    if (!dir) {
        if (errno == ENOENT) return true;
        return set_error(err, ErrorKind::Abort, "opendir " + transfers_dir() + ": " + std::strerror(errno));
    }
    std::vector<std::string> ids;
    struct dirent *ent;
    while ((ent = readdir(dir)) != nullptr) {
        std::string name = ent->d_name;
        if (name == "." || name == "..") continue;
        ids.push_back(name);
    }
    closedir(dir);
    std::sort(ids.begin(), ids.end());

    for (const auto &id : ids) {
        std::string text;
        std::string read_err;
        if (!read_file(path_join(transfer_dir(id), "manifest.json"), &text, &read_err)) continue;
        TransferManifest m;
        std::string parse_err;
        if (!manifest_from_json(text, &m, &parse_err)) {
            log_.warn("skipping transfer %s: %s", id.c_str(), parse_err.c_str());
            continue;
        }
        out->push_back(m);
    }
    return true;
}

bool ChunkedTransferManager::cleanup_transfer(const std::string &transfer_id, Error *err) {
    if (!valid_transfer_id(transfer_id)) {
        return set_error(err, ErrorKind::Abort, "invalid transfer id " + transfer_id);
    }
    std::string dir = transfer_dir(transfer_id);
    struct stat st;
    if (stat(dir.c_str(), &st) != 0) {
        return set_error(err, ErrorKind::Abort, "unknown transfer " + transfer_id);
    }
    if (remove_tree(dir) != 0) {
        return set_error(err, ErrorKind::Abort, "cannot remove " + dir + ": " + std::strerror(errno));
    }
    return true;
}

int ChunkedTransferManager::cleanup_completed() {
    std::vector<TransferManifest> transfers;
    Error err;
    if (!list_transfers(&transfers, &err)) {
        log_.warn("%s", err.message.c_str());
        return 0;
    }
    int removed = 0;
    for (const auto &m : transfers) {
        if (m.status != TransferStatus::Completed) continue;
        if (cleanup_transfer(m.transfer_id, &err)) {
            removed++;
        } else {
            log_.warn("%s", err.message.c_str());
        }
    }
    return removed;
}

std::unique_ptr<ChunkSink> ChunkedTransferManager::make_sink(Endpoint &destination,
                                                             const TransferManifest &manifest) {
    if (destination.supports_staged_receive()) {
        return std::make_unique<StagedSink>(destination, manifest.transfer_id, receive_timeout_);
    }
    return std::make_unique<ReceiveSink>(destination, receive_timeout_);
}

bool ChunkedTransferManager::deliver(TransferManifest *manifest, Endpoint &destination, Error *err) {
    std::unique_ptr<ChunkSink> sink = make_sink(destination, *manifest);
    // a local receive is atomic as a whole, so it always gets the full stream
    bool pending_only = destination.supports_staged_receive();
    if (!transfer_chunks(manifest, *sink, pending_only, err)) return false;
    return complete_transfer(manifest, err);
}

bool ChunkedTransferManager::send_chunked(SourceEndpoint &source, Endpoint &destination, const Snapshot &snapshot,
                                          const Snapshot *parent, TransferManifest *out, Error *err) {
    Error local;
    Error *e = err ? err : &local;
    TransferManifest &manifest = *out;
    if (!create_transfer(snapshot.name(), source.get_id(), destination.get_id(), parent ? parent->name() : "",
                         &manifest, e)) {
        return false;
    }

    Process send;
    if (!source.send(snapshot, parent, {}, &send, e)) {
        fail_transfer(&manifest, e->message);
        return rethrow_as(e, ErrorKind::Transfer, "");
    }
    int fd = send.release_stdout();
    bool chunked = chunk_stream(&manifest, fd, e);
    ::close(fd);
    if (!chunked) {
        send.kill();
        return false;
    }
    int rc = -1;
    if (!send.wait(send_timeout_, &rc) || rc != 0) {
        std::string msg = send.command_line() + " exited with " + std::to_string(rc) + ": " +
                          tail_excerpt(send.stderr_text(), 300);
        fail_transfer(&manifest, msg);
        return set_error(e, ErrorKind::Transfer, msg);
    }
    manifest.chunking_complete = true;
    if (!save_manifest(&manifest, e)) {
        fail_transfer(&manifest, e->message);
        return false;
    }
    log_.info("transfer %s: %d chunks, %s", manifest.transfer_id.c_str(), manifest.chunk_count(),
              format_size(manifest.total_size).c_str());
    return deliver(&manifest, destination, e);
}

bool ChunkedTransferManager::resume(const std::string &transfer_id, Endpoint &destination, TransferManifest *out,
                                    Error *err) {
    if (!resume_transfer(transfer_id, out, err)) return false;
    if (out->destination != destination.get_id()) {
        return set_error(err, ErrorKind::Abort, "transfer " + transfer_id + " belongs to " + out->destination +
                                                    ", not " + destination.get_id());
    }
    return deliver(out, destination, err);
}

}
