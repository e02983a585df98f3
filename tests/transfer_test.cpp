#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "estimate.h"
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

// Reports a nearly full filesystem.
class FullDestination : public FakeDestination {
public:
    using FakeDestination::FakeDestination;

    bool get_space_info(SpaceInfo *out, Error *) override {
        out->free_bytes = 1;
        out->total_bytes = 1024;
        return true;
    }
};

// Streams the whole snapshot, then exits non-zero.
class FailingSendSource : public FakeSource {
public:
    using FakeSource::FakeSource;

protected:
    std::vector<std::string> send_command(const Snapshot &snapshot, const Snapshot *parent,
                                          const std::vector<Snapshot> &clones, bool no_data) const override {
        if (no_data) return FakeSource::send_command(snapshot, parent, clones, no_data);
        std::string stream = path_join(snapshot.relocated(path()).path(), "stream");
        return {"sh", "-c", "cat " + shell_quote(stream) + "; echo parent not found >&2; exit 5"};
    }
};

class TransferTest : public ::testing::Test {
protected:
    TransferTest()
        : source(dir.sub("src"), "home-", quiet_log()),
          destination(dir.sub("dst"), "home-", quiet_log()),
          journal(dir.sub("transactions.jsonl"), quiet_log()),
          engine(&journal, quiet_log()),
          snapshot(snap(dir.sub("src"), "home-", "20240101-120000")) {}

    void SetUp() override {
        ASSERT_TRUE(source.make(snapshot, payload));
        options.show_progress = false;
    }

    const std::string payload = std::string(300000, 'x') + "tail";
    TempDir dir;
    FakeSource source;
    FakeDestination destination;
    TransactionLog journal;
    TransferEngine engine;
    Snapshot snapshot;
    TransferOptions options;
};

}

TEST_F(TransferTest, FullTransferDeliversStream) {
    Error err;
    ASSERT_TRUE(engine.send_snapshot(source, destination, snapshot, nullptr, options, &err)) << err.message;
    EXPECT_EQ(payload, destination.received());
    EXPECT_EQ(payload.size(), engine.last_bytes());

    auto records = journal.read(0, "transfer", "");
    ASSERT_EQ(2u, records.size());
    EXPECT_EQ("started", records[0].status);
    EXPECT_EQ(snapshot.name(), records[0].snapshot);
    EXPECT_EQ(source.get_id(), records[0].source);
    EXPECT_EQ(destination.get_id(), records[0].destination);
    EXPECT_EQ("completed", records[1].status);
    EXPECT_EQ(static_cast<int64_t>(payload.size()), records[1].size_bytes);
}

TEST_F(TransferTest, CompressedTransferIsDecompressedOnReceive) {
    if (!find_in_path("gzip")) GTEST_SKIP() << "gzip not installed";
    options.compress = "gzip";
    Error err;
    ASSERT_TRUE(engine.send_snapshot(source, destination, snapshot, nullptr, options, &err)) << err.message;
    EXPECT_EQ(payload, destination.received());
    EXPECT_EQ(payload.size(), engine.last_bytes());
}

TEST_F(TransferTest, FailingReceiverIsATransferError) {
    destination.receive_script = "cat > /dev/null; echo receiver gave up >&2; exit 3";
    Error err;
    EXPECT_FALSE(engine.send_snapshot(source, destination, snapshot, nullptr, options, &err));
    EXPECT_EQ(ErrorKind::Transfer, err.kind);
    EXPECT_NE(std::string::npos, err.message.find("exited with 3"));
    EXPECT_NE(std::string::npos, err.message.find("receiver gave up"));

    auto failed = journal.read(0, "transfer", "failed");
    ASSERT_EQ(1u, failed.size());
    EXPECT_EQ(err.message, failed[0].error);
}

TEST_F(TransferTest, FailingSendFailsEvenWhenReceiveSucceeds) {
    FailingSendSource failing(dir.sub("src"), "home-", quiet_log());
    Error err;
    EXPECT_FALSE(engine.send_snapshot(failing, destination, snapshot, nullptr, options, &err));
    EXPECT_EQ(ErrorKind::Transfer, err.kind);
    EXPECT_NE(std::string::npos, err.message.find("exited with 5"));
    EXPECT_NE(std::string::npos, err.message.find("parent not found"));
    EXPECT_EQ(payload, destination.received());
    EXPECT_EQ(1u, journal.read(0, "transfer", "failed").size());
}

TEST_F(TransferTest, UnknownCompressionAborts) {
    options.compress = "bzip9";
    Error err;
    EXPECT_FALSE(engine.send_snapshot(source, destination, snapshot, nullptr, options, &err));
    EXPECT_EQ(ErrorKind::Abort, err.kind);
    EXPECT_TRUE(journal.read(0, "", "").empty());
}

TEST_F(TransferTest, ChunkedNeedsManager) {
    options.chunked = true;
    Error err;
    EXPECT_FALSE(engine.send_snapshot(source, destination, snapshot, nullptr, options, &err));
    EXPECT_EQ(ErrorKind::Abort, err.kind);
}

TEST_F(TransferTest, SpaceCheckStopsTransfer) {
    FullDestination full(dir.sub("full"), "home-", quiet_log());
    options.check_space = true;
    Error err;
    EXPECT_FALSE(engine.send_snapshot(source, full, snapshot, nullptr, options, &err));
    EXPECT_EQ(ErrorKind::InsufficientSpace, err.kind);
    EXPECT_TRUE(full.received().empty());

    options.force = true;
    Error forced;
    ASSERT_TRUE(engine.send_snapshot(source, full, snapshot, nullptr, options, &forced)) << forced.message;
    EXPECT_EQ(payload, full.received());
}

TEST(CompressionTest, KnownTools) {
    EXPECT_TRUE(is_known_compression(""));
    EXPECT_TRUE(is_known_compression("none"));
    EXPECT_TRUE(is_known_compression("zstd"));
    EXPECT_FALSE(is_known_compression("bzip9"));
    EXPECT_EQ(nullptr, find_compression("none"));
    const CompressionTool *lz4 = find_compression("lz4");
    ASSERT_NE(nullptr, lz4);
    EXPECT_STREQ("lz4 -d -q", lz4->decompress);
}

TEST(EstimateTest, CheckSpaceHonoursMarginAndForce) {
    TempDir dir;
    FullDestination full(dir.sub("full"), "home-", quiet_log());
    Error err;
    EXPECT_TRUE(check_space(full, 0, 0.1, false, quiet_log(), &err));
    EXPECT_FALSE(check_space(full, 100, 0.1, false, quiet_log(), &err));
    EXPECT_EQ(ErrorKind::InsufficientSpace, err.kind);
    EXPECT_NE(std::string::npos, err.message.find("insufficient space"));
    EXPECT_TRUE(check_space(full, 100, 0.1, true, quiet_log(), &err));
}
