#include <gtest/gtest.h>

#include <cstdio>
#include <fcntl.h>
#include <memory>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

#include "chunked.h"
#include "test_support.h"
#include "transaction_log.h"
#include "transfer.h"

using namespace snapvault;
using snapvault::testing::FakeDestination;
using snapvault::testing::FakeSource;
using snapvault::testing::TempDir;
using snapvault::testing::quiet_log;
using snapvault::testing::snap;

namespace {

std::string make_payload(size_t size) {
    std::string data;
    data.reserve(size);
    unsigned value = 12345;
    for (size_t i = 0; i < size; ++i) {
        value = value * 1103515245u + 12345u;
        data += static_cast<char>(value >> 16);
    }
    return data;
}

// Records what reaches the destination instead of delivering it.
class RecordingSink : public ChunkSink {
public:
    bool begin(uint64_t offset, Error *) override {
        begin_offset = offset;
        return true;
    }
    bool write_chunk(const ChunkMeta &chunk, const char *, size_t len, Error *) override {
        sequences.push_back(chunk.sequence);
        bytes += len;
        return true;
    }
    bool finish(Error *) override {
        finished = true;
        return true;
    }
    void abort() override { aborted = true; }

    uint64_t begin_offset = 0;
    std::vector<int> sequences;
    uint64_t bytes = 0;
    bool finished = false;
    bool aborted = false;
};

// Local stand-in for a remote endpoint with a resumable staging file; the
// commit step moves the staged stream to received.bin.
class StagingDestination : public FakeDestination {
public:
    using FakeDestination::FakeDestination;

    std::string get_id() const override { return "staging:" + path(); }
    bool supports_staged_receive() const override { return true; }

    std::string staging_file(const std::string &id) const { return path_join(path(), ".staging/" + id + ".stream"); }

    bool open_staged_receive(const std::string &id, uint64_t offset, Process *out, Error *err) override {
        std::string file = shell_quote(staging_file(id));
        std::string size = std::to_string(offset);
        std::string script = "mkdir -p " + shell_quote(path_dirname(staging_file(id))) + " && touch " + file +
                             " && if [ $(stat -c %s " + file + ") -lt " + size + " ]; then exit 1; fi" +
                             " && truncate -s " + size + " " + file + " && exec cat >> " + file;
        Process::Options options;
        options.pipe_stdin = true;
        options.null_stdout = true;
        offsets.push_back(offset);
        return spawn({"sh", "-c", script}, options, out, err);
    }
    bool commit_staged_receive(const std::string &id, int, Error *err) override {
        if (std::rename(staging_file(id).c_str(), received_file().c_str()) != 0) {
            return set_error(err, ErrorKind::Transfer, "cannot commit staged stream");
        }
        return true;
    }

    std::vector<uint64_t> offsets;
};

// Fails the first write of chunk `fail_at`, then behaves like `inner`.
class FailOnceSink : public ChunkSink {
public:
    FailOnceSink(std::unique_ptr<ChunkSink> inner, int *fail_at) : inner_(std::move(inner)), fail_at_(fail_at) {}

    bool begin(uint64_t offset, Error *err) override { return inner_->begin(offset, err); }
    bool write_chunk(const ChunkMeta &chunk, const char *data, size_t len, Error *err) override {
        if (chunk.sequence == *fail_at_) {
            *fail_at_ = -1;
            return set_error(err, ErrorKind::Transfer, "connection reset");
        }
        return inner_->write_chunk(chunk, data, len, err);
    }
    bool finish(Error *err) override { return inner_->finish(err); }
    void abort() override { inner_->abort(); }

private:
    std::unique_ptr<ChunkSink> inner_;
    int *fail_at_;
};

class FlakyManager : public ChunkedTransferManager {
public:
    using ChunkedTransferManager::ChunkedTransferManager;

    int fail_at = -1;

protected:
    std::unique_ptr<ChunkSink> make_sink(Endpoint &destination, const TransferManifest &manifest) override {
        return std::make_unique<FailOnceSink>(ChunkedTransferManager::make_sink(destination, manifest), &fail_at);
    }
};

class ChunkedTest : public ::testing::Test {
protected:
    ChunkedTest()
        : source(dir.sub("src"), "home-", quiet_log()),
          snapshot(snap(dir.sub("src"), "home-", "20240101-120000")),
          payload(make_payload(10 * 1000)) {}

    void SetUp() override { ASSERT_TRUE(source.make(snapshot, payload)); }

    // Chunks the payload through a fresh transfer of `manager`.
    void chunk_payload(ChunkedTransferManager &manager, TransferManifest *m) {
        Error err;
        ASSERT_TRUE(manager.create_transfer(snapshot.name(), source.get_id(), "dest", "", m, &err)) << err.message;
        std::string file = dir.sub("stream.bin");
        std::string write_err;
        ASSERT_TRUE(write_file_atomic(file, payload, &write_err));
        int fd = ::open(file.c_str(), O_RDONLY);
        ASSERT_GE(fd, 0);
        bool ok = manager.chunk_stream(m, fd, &err);
        ::close(fd);
        ASSERT_TRUE(ok) << err.message;
        m->chunking_complete = true;
        ASSERT_TRUE(manager.save_manifest(m, &err));
    }

    TempDir dir;
    FakeSource source;
    Snapshot snapshot;
    std::string payload;
};

}

TEST(ManifestTest, ResumePointAndTransferredBytes) {
    TransferManifest m;
    for (int i = 0; i < 10; ++i) {
        ChunkMeta c;
        c.sequence = i;
        c.size = 100;
        c.status = i <= 5 ? ChunkStatus::Transferred : ChunkStatus::Pending;
        m.chunks.push_back(c);
    }
    EXPECT_EQ(6, m.resume_point());
    EXPECT_EQ((std::vector<int>{6, 7, 8, 9}), m.pending_chunks());
    EXPECT_EQ(600u, m.transferred_bytes());

    for (auto &c : m.chunks) c.status = ChunkStatus::Transferred;
    EXPECT_EQ(-1, m.resume_point());
    EXPECT_EQ(1000u, m.transferred_bytes());
}

TEST(ManifestTest, JsonKeepsAllFields) {
    TransferManifest m;
    m.transfer_id = "20240101-120000-0a1b2c3d";
    m.snapshot_name = "home-20240101-120000";
    m.source = "/home/.snapshots";
    m.destination = "ssh://nas/backups";
    m.total_size = 150;
    m.chunking_complete = true;
    m.status = TransferStatus::Failed;
    m.error_message = "chunk 1 failed";
    ChunkMeta a;
    a.sequence = 0;
    a.size = 100;
    a.checksum = sha256_hex("a", 1);
    a.status = ChunkStatus::Transferred;
    ChunkMeta b;
    b.sequence = 1;
    b.size = 50;
    b.checksum = sha256_hex("b", 1);
    b.status = ChunkStatus::Failed;
    b.error = "connection reset";
    m.chunks = {a, b};

    std::string text = manifest_to_json(m);
    EXPECT_NE(std::string::npos, text.find("\"parent_name\" : null"));
    EXPECT_NE(std::string::npos, text.find("\"chunk_count\" : 2"));

    TransferManifest back;
    std::string err;
    ASSERT_TRUE(manifest_from_json(text, &back, &err)) << err;
    EXPECT_EQ(m.transfer_id, back.transfer_id);
    EXPECT_TRUE(back.parent_name.empty());
    EXPECT_TRUE(back.chunking_complete);
    EXPECT_EQ(TransferStatus::Failed, back.status);
    ASSERT_EQ(2, back.chunk_count());
    EXPECT_EQ(ChunkStatus::Failed, back.chunks[1].status);
    EXPECT_EQ("connection reset", back.chunks[1].error);
    EXPECT_EQ(1, back.resume_point());
}

TEST(ManifestTest, RejectsBrokenDocuments) {
    const char *bad[] = {
        "{",
        "[]",
        "{\"transfer_id\": \"x\"}",
        "{\"transfer_id\": \"x\", \"snapshot_name\": \"s\", \"destination\": \"d\", \"status\": \"bogus\", "
        "\"chunks\": []}",
        "{\"transfer_id\": \"x\", \"snapshot_name\": \"s\", \"destination\": \"d\", \"status\": \"pending\", "
        "\"chunks\": [{\"sequence\": 0}]}",
        "{\"transfer_id\": \"x\", \"snapshot_name\": \"s\", \"destination\": \"d\", \"status\": \"pending\", "
        "\"chunk_count\": 3, \"chunks\": []}",
    };
    for (const char *text : bad) {
        TransferManifest m;
        std::string err;
        EXPECT_FALSE(manifest_from_json(text, &m, &err)) << text;
        EXPECT_FALSE(err.empty());
    }
}

TEST(ManifestTest, Sha256MatchesKnownDigest) {
    EXPECT_EQ("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", sha256_hex("abc", 3));
}

TEST_F(ChunkedTest, StreamIsSplitIntoChecksummedChunks) {
    ChunkedTransferManager manager(dir.sub("state"), 1000, quiet_log());
    TransferManifest m;
    chunk_payload(manager, &m);
    ASSERT_EQ(10, m.chunk_count());
    EXPECT_EQ(payload.size(), m.total_size);
    for (const auto &c : m.chunks) {
        EXPECT_EQ(1000u, c.size);
        EXPECT_EQ(sha256_hex(payload.data() + c.sequence * 1000, 1000), c.checksum);
    }

    TransferManifest loaded;
    Error err;
    ASSERT_TRUE(manager.load_manifest(m.transfer_id, &loaded, &err)) << err.message;
    EXPECT_EQ(TransferStatus::Chunking, loaded.status);
    EXPECT_TRUE(loaded.chunking_complete);
    EXPECT_FALSE(manager.load_manifest("../etc", &loaded, &err));
}

TEST_F(ChunkedTest, PendingOnlyResumesAfterTransferredChunks) {
    ChunkedTransferManager manager(dir.sub("state"), 1000, quiet_log());
    TransferManifest m;
    chunk_payload(manager, &m);
    for (int i = 0; i <= 5; ++i) m.chunks[i].status = ChunkStatus::Transferred;

    RecordingSink resumed;
    Error err;
    ASSERT_TRUE(manager.transfer_chunks(&m, resumed, true, &err)) << err.message;
    EXPECT_EQ(6000u, resumed.begin_offset);
    EXPECT_EQ((std::vector<int>{6, 7, 8, 9}), resumed.sequences);
    EXPECT_EQ(4000u, resumed.bytes);
    EXPECT_TRUE(resumed.finished);
    EXPECT_EQ(-1, m.resume_point());

    RecordingSink full;
    ASSERT_TRUE(manager.transfer_chunks(&m, full, false, &err)) << err.message;
    EXPECT_EQ(0u, full.begin_offset);
    EXPECT_EQ(10u, full.sequences.size());
}

TEST_F(ChunkedTest, CorruptChunkFailsTransfer) {
    ChunkedTransferManager manager(dir.sub("state"), 1000, quiet_log());
    TransferManifest m;
    chunk_payload(manager, &m);
    std::string write_err;
    ASSERT_TRUE(write_file_atomic(manager.chunk_path(m.transfer_id, 3), std::string(1000, 'z'), &write_err));

    RecordingSink sink;
    Error err;
    EXPECT_FALSE(manager.transfer_chunks(&m, sink, true, &err));
    EXPECT_EQ(ErrorKind::Transfer, err.kind);
    EXPECT_NE(std::string::npos, err.message.find("chunk 3 of transfer " + m.transfer_id));
    EXPECT_TRUE(sink.aborted);
    EXPECT_FALSE(sink.finished);
    EXPECT_EQ((std::vector<int>{0, 1, 2}), sink.sequences);

    TransferManifest stored;
    ASSERT_TRUE(manager.load_manifest(m.transfer_id, &stored, &err));
    EXPECT_EQ(TransferStatus::Failed, stored.status);
    EXPECT_EQ(ChunkStatus::Failed, stored.chunks[3].status);
    EXPECT_EQ("checksum mismatch", stored.chunks[3].error);
    EXPECT_EQ(3, stored.resume_point());
}

TEST_F(ChunkedTest, StalledSendStreamTimesOut) {
    ChunkedTransferManager manager(dir.sub("state"), 1000, quiet_log());
    manager.set_send_timeout(1);
    TransferManifest m;
    Error err;
    ASSERT_TRUE(manager.create_transfer(snapshot.name(), source.get_id(), "dest", "", &m, &err)) << err.message;

    Process stalled;
    Process::Options options;
    options.null_stdin = true;
    options.pipe_stdout = true;
    std::string start_err;
    ASSERT_TRUE(stalled.start({"sh", "-c", "printf abc; exec sleep 30"}, options, &start_err)) << start_err;

    double started = monotonic_seconds();
    EXPECT_FALSE(manager.chunk_stream(&m, stalled.stdout_fd(), &err));
    EXPECT_LT(monotonic_seconds() - started, 10.0);
    EXPECT_EQ(ErrorKind::Transfer, err.kind);
    EXPECT_NE(std::string::npos, err.message.find("timed out"));
    EXPECT_EQ(TransferStatus::Failed, m.status);
    stalled.kill();
}

TEST_F(ChunkedTest, LocalDestinationGetsWholeStream) {
    FakeDestination destination(dir.sub("dst"), "home-", quiet_log());
    ChunkedTransferManager manager(dir.sub("state"), 4096, quiet_log());
    TransferManifest m;
    Error err;
    ASSERT_TRUE(manager.send_chunked(source, destination, snapshot, nullptr, &m, &err)) << err.message;
    EXPECT_EQ(payload, destination.received());
    EXPECT_EQ(TransferStatus::Completed, m.status);
    EXPECT_EQ(3, m.chunk_count());
    EXPECT_EQ(destination.get_id(), m.destination);

    std::string chunk;
    std::string read_err;
    EXPECT_FALSE(read_file(manager.chunk_path(m.transfer_id, 0), &chunk, &read_err));

    std::vector<TransferManifest> transfers;
    ASSERT_TRUE(manager.list_transfers(&transfers, &err));
    ASSERT_EQ(1u, transfers.size());
    EXPECT_EQ(TransferStatus::Completed, transfers[0].status);

    Error resume_err;
    TransferManifest again;
    EXPECT_FALSE(manager.resume(m.transfer_id, destination, &again, &resume_err));

    EXPECT_EQ(1, manager.cleanup_completed());
    ASSERT_TRUE(manager.list_transfers(&transfers, &err));
    EXPECT_TRUE(transfers.empty());
}

TEST_F(ChunkedTest, InterruptedStagedTransferResumes) {
    StagingDestination destination(dir.sub("dst"), "home-", quiet_log());
    FlakyManager manager(dir.sub("state"), 1000, quiet_log());
    manager.fail_at = 6;

    TransferManifest m;
    Error err;
    EXPECT_FALSE(manager.send_chunked(source, destination, snapshot, nullptr, &m, &err));
    EXPECT_EQ(ErrorKind::Transfer, err.kind);
    EXPECT_NE(std::string::npos, err.message.find("connection reset"));
    EXPECT_TRUE(destination.received().empty());

    FakeDestination other(dir.sub("other"), "home-", quiet_log());
    TransferManifest wrong;
    Error wrong_err;
    EXPECT_FALSE(manager.resume(m.transfer_id, other, &wrong, &wrong_err));
    EXPECT_EQ(ErrorKind::Abort, wrong_err.kind);

    TransferManifest resumed;
    Error resume_err;
    ASSERT_TRUE(manager.resume(m.transfer_id, destination, &resumed, &resume_err)) << resume_err.message;
    EXPECT_EQ(TransferStatus::Completed, resumed.status);
    EXPECT_EQ((std::vector<uint64_t>{0, 6000}), destination.offsets);
    EXPECT_EQ(payload, destination.received());
}

TEST_F(ChunkedTest, EngineRecordsChunkedTransfers) {
    FakeDestination destination(dir.sub("dst"), "home-", quiet_log());
    ChunkedTransferManager manager(dir.sub("state"), 4096, quiet_log());
    TransactionLog journal(dir.sub("transactions.jsonl"), quiet_log());
    TransferEngine engine(&journal, quiet_log());
    engine.set_chunked_manager(&manager);
    TransferOptions options;
    options.chunked = true;
    options.show_progress = false;

    Error err;
    ASSERT_TRUE(engine.send_snapshot(source, destination, snapshot, nullptr, options, &err)) << err.message;
    EXPECT_EQ(payload, destination.received());
    EXPECT_EQ(payload.size(), engine.last_bytes());
    auto done = journal.read(0, "chunked_transfer", "completed");
    ASSERT_EQ(1u, done.size());
    EXPECT_NE(std::string::npos, done[0].details.find("3 chunks"));
}

TEST_F(ChunkedTest, ChunkingMidwayIsNotResumable) {
    ChunkedTransferManager manager(dir.sub("state"), 1000, quiet_log());
    TransferManifest m;
    chunk_payload(manager, &m);
    m.chunking_complete = false;
    Error err;
    ASSERT_TRUE(manager.save_manifest(&m, &err));

    TransferManifest loaded;
    EXPECT_FALSE(manager.resume_transfer(m.transfer_id, &loaded, &err));
    EXPECT_NE(std::string::npos, err.message.find("cannot be resumed"));

    EXPECT_TRUE(manager.cleanup_transfer(m.transfer_id, &err));
    EXPECT_FALSE(manager.cleanup_transfer(m.transfer_id, &err));
}
