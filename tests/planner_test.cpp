#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "planner.h"
#include "test_support.h"

using namespace snapvault;
using snapvault::testing::FakeDestination;
using snapvault::testing::FakeSource;
using snapvault::testing::RecordingEngine;
using snapvault::testing::TempDir;
using snapvault::testing::quiet_log;
using snapvault::testing::snap;

namespace {

typedef std::pair<std::string, std::string> Sent;

std::vector<Snapshot> snaps(const std::string &location, const std::vector<std::string> &stamps) {
    std::vector<Snapshot> out;
    for (const auto &stamp : stamps) out.push_back(snap(location, "home-", stamp));
    return out;
}

}

TEST(PlanTransfersTest, MissingSnapshotsInSourceOrder) {
    auto source = snaps("/src", {"20240101-000000", "20240102-000000", "20240103-000000", "20240104-000000"});
    auto destination = snaps("/dst", {"20240102-000000"});
    EXPECT_EQ((std::vector<Snapshot>{source[0], source[2], source[3]}), plan_transfers(source, destination, 0));
    EXPECT_EQ((std::vector<Snapshot>{source[2], source[3]}), plan_transfers(source, destination, 3));
    EXPECT_EQ((std::vector<Snapshot>{source[3]}), plan_transfers(source, destination, 1));
    EXPECT_TRUE(plan_transfers(source, source, 0).empty());
}

TEST(PresentSnapshotsTest, SkipsSnapshotsMidTransferToThisDestination) {
    auto source = snaps("/src", {"20240101-000000", "20240102-000000", "20240103-000000"});
    auto destination = snaps("/dst", {"20240101-000000", "20240102-000000"});
    LockMap locks;
    locks[source[1].name()].locks.insert("/dst");
    locks[source[0].name()].locks.insert("/other");
    locks[source[0].name()].parent_locks.insert("/dst");

    EXPECT_EQ((std::vector<Snapshot>{source[0]}), present_snapshots(source, destination, locks, "/dst"));
    EXPECT_EQ((std::vector<Snapshot>{source[1]}), present_snapshots(source, destination, locks, "/other"));
}

TEST(SelectNextTransferTest, PrefersClosestParent) {
    auto source = snaps("/src", {"20240101-000000", "20240102-000000", "20240103-000000"});
    std::vector<Snapshot> candidates = {source[1], source[2]};
    std::vector<Snapshot> present = {source[0]};

    TransferChoice choice;
    ASSERT_TRUE(select_next_transfer(candidates, source, present, true, &choice));
    EXPECT_EQ(source[1], choice.snapshot);
    ASSERT_TRUE(choice.has_parent);
    EXPECT_EQ(source[0], choice.parent);

    ASSERT_TRUE(select_next_transfer(candidates, source, {}, true, &choice));
    EXPECT_EQ(source[1], choice.snapshot);
    EXPECT_FALSE(choice.has_parent);

    ASSERT_TRUE(select_next_transfer(candidates, source, present, false, &choice));
    EXPECT_EQ(source[2], choice.snapshot);
    EXPECT_FALSE(choice.has_parent);

    EXPECT_FALSE(select_next_transfer({}, source, present, true, &choice));
}

class SyncTest : public ::testing::Test {
protected:
    SyncTest()
        : source(dir.sub("src"), "home-", quiet_log()), destination(dir.sub("dst"), "home-", quiet_log()) {}

    void SetUp() override {
        for (const char *stamp : {"20240101-000000", "20240102-000000", "20240103-000000"}) {
            all.push_back(snap(source.path(), "home-", stamp));
            ASSERT_TRUE(source.make(all.back(), stamp));
        }
        std::string err;
        ASSERT_TRUE(make_dirs(all[0].relocated(destination.path()).path(), 0755, &err));
    }

    std::vector<Snapshot> destination_snapshots() {
        std::vector<Snapshot> listed;
        Error err;
        EXPECT_TRUE(destination.list_snapshots(true, &listed, &err)) << err.message;
        return listed;
    }

    LockSet lock_of(const Snapshot &s) {
        Error err;
        EXPECT_TRUE(source.load_locks(&err)) << err.message;
        return source.locks().get(s);
    }

    TempDir dir;
    FakeSource source;
    FakeDestination destination;
    RecordingEngine engine;
    std::vector<Snapshot> all;
    SyncOptions options;
    SyncReport report;
};

TEST_F(SyncTest, IncrementalChainFollowsPreviousTransfer) {
    Error err;
    ASSERT_TRUE(sync_snapshots(source, destination, engine, options, quiet_log(), &report, &err)) << err.message;
    std::vector<Sent> expected = {Sent(all[1].name(), all[0].name()), Sent(all[2].name(), all[1].name())};
    EXPECT_EQ(expected, engine.sent);
    EXPECT_TRUE(report.ok());
    EXPECT_EQ((std::vector<std::string>{all[1].name(), all[2].name()}), report.transferred);
    EXPECT_EQ(all, destination_snapshots());
    for (const auto &s : all) EXPECT_TRUE(lock_of(s).empty()) << s.name();
}

TEST_F(SyncTest, FullModeSendsWithoutParent) {
    options.incremental = false;
    Error err;
    ASSERT_TRUE(sync_snapshots(source, destination, engine, options, quiet_log(), &report, &err)) << err.message;
    std::vector<Sent> expected = {Sent(all[2].name(), ""), Sent(all[1].name(), "")};
    EXPECT_EQ(expected, engine.sent);
}

TEST_F(SyncTest, FailedTransferKeepsItsLock) {
    engine.fail[all[1].name()] = ErrorKind::Transfer;
    Error err;
    ASSERT_TRUE(sync_snapshots(source, destination, engine, options, quiet_log(), &report, &err)) << err.message;
    EXPECT_FALSE(report.ok());
    EXPECT_FALSE(report.aborted);
    EXPECT_EQ((std::vector<std::string>{all[1].name()}), report.failed);
    EXPECT_EQ((std::vector<std::string>{all[2].name()}), report.transferred);
    EXPECT_EQ(Sent(all[2].name(), all[0].name()), engine.sent.back());
    EXPECT_EQ(1u, lock_of(all[1]).locks.count(destination.get_id()));
    EXPECT_TRUE(lock_of(all[2]).empty());
    // C succeeded with the same parent, A still backs the failed B
    EXPECT_EQ(1u, lock_of(all[0]).parent_locks.count(destination.get_id()));

    // the stale locks protect both snapshots from source retention
    std::vector<Snapshot> deleted;
    ASSERT_TRUE(source.prune(1, &deleted, &err)) << err.message;
    EXPECT_TRUE(deleted.empty());
    std::vector<Snapshot> listed;
    ASSERT_TRUE(source.list_snapshots(true, &listed, &err)) << err.message;
    EXPECT_EQ(all, listed);
}

TEST_F(SyncTest, InsufficientSpaceStopsRunAndReleasesLocks) {
    engine.fail[all[1].name()] = ErrorKind::InsufficientSpace;
    Error err;
    EXPECT_FALSE(sync_snapshots(source, destination, engine, options, quiet_log(), &report, &err));
    EXPECT_EQ(ErrorKind::InsufficientSpace, err.kind);
    EXPECT_TRUE(report.aborted);
    EXPECT_EQ(1u, engine.sent.size());
    for (const auto &s : all) EXPECT_TRUE(lock_of(s).empty()) << s.name();
}

TEST_F(SyncTest, AbortStopsRun) {
    engine.fail[all[1].name()] = ErrorKind::Abort;
    Error err;
    EXPECT_FALSE(sync_snapshots(source, destination, engine, options, quiet_log(), &report, &err));
    EXPECT_EQ(ErrorKind::Abort, err.kind);
    EXPECT_EQ(1u, engine.sent.size());
}

TEST_F(SyncTest, OnlyTransfersNamedSnapshot) {
    options.only = all[2].name();
    Error err;
    ASSERT_TRUE(sync_snapshots(source, destination, engine, options, quiet_log(), &report, &err)) << err.message;
    std::vector<Sent> expected = {Sent(all[2].name(), all[0].name())};
    EXPECT_EQ(expected, engine.sent);

    options.only = "home-20991231-000000";
    SyncReport unknown;
    ASSERT_TRUE(sync_snapshots(source, destination, engine, options, quiet_log(), &unknown, &err));
    EXPECT_TRUE(unknown.transferred.empty());
}

TEST_F(SyncTest, RetentionOnDestinationAfterTransfers) {
    options.keep_backups = 2;
    Error err;
    ASSERT_TRUE(sync_snapshots(source, destination, engine, options, quiet_log(), &report, &err)) << err.message;
    EXPECT_EQ((std::vector<Snapshot>{all[0]}), report.deleted);
    EXPECT_EQ((std::vector<Snapshot>{all[1], all[2]}), destination_snapshots());
}
