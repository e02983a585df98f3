#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <vector>

#include "lock_table.h"
#include "test_support.h"

using namespace snapvault;
using snapvault::testing::FakeSource;
using snapvault::testing::TempDir;
using snapvault::testing::quiet_log;
using snapvault::testing::snap;

TEST(LockTableTest, SerializeThenParseKeepsLockSets) {
    LockMap locks;
    locks["p-20260101-000000"].locks = {"/backup/a", "ssh://nas/b"};
    locks["p-20260102-000000"].parent_locks = {"/backup/a"};
    locks["p-20260103-000000"] = LockSet();

    LockMap parsed;
    std::string err;
    ASSERT_TRUE(parse_locks(serialize_locks(locks), &parsed, &err)) << err;
    EXPECT_EQ(2u, parsed.size());
    EXPECT_TRUE(parsed["p-20260101-000000"] == locks["p-20260101-000000"]);
    EXPECT_TRUE(parsed["p-20260102-000000"] == locks["p-20260102-000000"]);
}

TEST(LockTableTest, DuplicateIdsCollapse) {
    LockMap parsed;
    std::string err;
    ASSERT_TRUE(parse_locks(R"({"p-20260101-000000": {"locks": ["x", "x", "y"]}})", &parsed, &err));
    EXPECT_EQ(2u, parsed["p-20260101-000000"].locks.size());
}

TEST(LockTableTest, EmptyTextIsEmptyTable) {
    LockMap parsed;
    std::string err;
    EXPECT_TRUE(parse_locks("  \n", &parsed, &err));
    EXPECT_TRUE(parsed.empty());
}

TEST(LockTableTest, MalformedContentIsAnError) {
    const char *bad[] = {
        "{not json",
        "[]",
        R"({"p-20260101-000000": []})",
        R"({"p-20260101-000000": {"holds": ["x"]}})",
        R"({"p-20260101-000000": {"locks": "x"}})",
        R"({"p-20260101-000000": {"locks": [1]}})",
    };
    for (const char *text : bad) {
        LockMap parsed;
        std::string err;
        EXPECT_FALSE(parse_locks(text, &parsed, &err)) << text;
        EXPECT_FALSE(err.empty());
    }
}

TEST(LockTableTest, LockedOldSnapshotIsNotDeleted) {
    Snapshot a = snap("/s", "p-", "20260101-000000");
    Snapshot b = snap("/s", "p-", "20260102-000000");
    LockMap locks;
    locks[a.name()].locks.insert("destX");
    EXPECT_TRUE(select_unlocked_for_deletion({a, b}, locks, 1).empty());
}

TEST(LockTableTest, DeletionLeavesKeepUnlockedAndSkipsLocked) {
    std::vector<Snapshot> all;
    for (int day = 1; day <= 9; ++day) {
        all.push_back(snap("/s", "p-", "2026010" + std::to_string(day) + "-000000"));
    }
    LockMap locks;
    locks[all[0].name()].locks.insert("d1");
    locks[all[3].name()].parent_locks.insert("d2");
    size_t unlocked = all.size() - 2;

    for (int keep = 0; keep <= 10; ++keep) {
        std::vector<Snapshot> victims = select_unlocked_for_deletion(all, locks, keep);
        for (const auto &v : victims) EXPECT_FALSE(is_locked(locks, v));
        size_t remaining = unlocked - victims.size();
        if (keep == 0) {
            EXPECT_EQ(unlocked, remaining);
        } else {
            EXPECT_EQ(std::min(static_cast<size_t>(keep), unlocked), remaining);
        }
        if (!victims.empty()) EXPECT_EQ(all[1], victims.front());
    }
}

TEST(LockTableTest, SetLockPersists) {
    TempDir tmp;
    std::string path = tmp.sub("locks");
    Snapshot a = snap(tmp.path(), "p-", "20260101-000000");
    Snapshot b = snap(tmp.path(), "p-", "20260102-000000");

    LockTable table(path, quiet_log());
    Error err;
    ASSERT_TRUE(table.load(&err));
    ASSERT_TRUE(table.set_lock(a, "dest1", true, false, &err)) << err.message;
    ASSERT_TRUE(table.set_lock(b, "dest1", true, true, &err)) << err.message;

    LockTable reread(path, quiet_log());
    ASSERT_TRUE(reread.load(&err));
    EXPECT_EQ(1u, reread.get(a).locks.count("dest1"));
    EXPECT_EQ(1u, reread.get(b).parent_locks.count("dest1"));

    ASSERT_TRUE(table.set_lock(a, "dest1", false, false, &err));
    ASSERT_TRUE(reread.load(&err));
    EXPECT_TRUE(reread.get(a).empty());
    EXPECT_EQ(1u, reread.get(b).parent_locks.count("dest1"));
}

TEST(LockTableTest, WritersForDifferentDestinationsKeepEachOthersLocks) {
    TempDir tmp;
    std::string path = tmp.sub("locks");
    Snapshot a = snap(tmp.path(), "p-", "20260101-000000");
    LockTable first(path, quiet_log());
    LockTable second(path, quiet_log());
    Error err;
    ASSERT_TRUE(first.set_lock(a, "one", true, false, &err));
    ASSERT_TRUE(second.set_lock(a, "two", true, false, &err));
    ASSERT_TRUE(first.set_lock(a, "one", false, false, &err));

    LockTable reader(path, quiet_log());
    ASSERT_TRUE(reader.load(&err));
    EXPECT_EQ(std::set<std::string>{"two"}, reader.get(a).locks);
}

TEST(LockTableTest, ReleaseAllForOneIdOrEverything) {
    TempDir tmp;
    std::string path = tmp.sub("locks");
    Snapshot a = snap(tmp.path(), "p-", "20260101-000000");
    Snapshot b = snap(tmp.path(), "p-", "20260102-000000");
    LockTable table(path, quiet_log());
    Error err;
    ASSERT_TRUE(table.set_lock(a, "x", true, false, &err));
    ASSERT_TRUE(table.set_lock(a, "y", true, true, &err));
    ASSERT_TRUE(table.set_lock(b, "x", true, true, &err));

    ASSERT_TRUE(table.release_all("x", {a, b}, &err));
    EXPECT_TRUE(table.get(b).empty());
    EXPECT_EQ(1u, table.get(a).parent_locks.count("y"));

    ASSERT_TRUE(table.release_all("", {a, b}, &err));
    EXPECT_TRUE(table.entries().empty());
}

TEST(LockTableTest, ReleaseAllDropsVanishedSnapshots) {
    TempDir tmp;
    std::string path = tmp.sub("locks");
    Snapshot a = snap(tmp.path(), "p-", "20260101-000000");
    Snapshot b = snap(tmp.path(), "p-", "20260102-000000");
    LockTable table(path, quiet_log());
    Error err;
    ASSERT_TRUE(table.set_lock(a, "x", true, false, &err));
    ASSERT_TRUE(table.set_lock(b, "y", true, false, &err));

    // a is gone from the listing
    ASSERT_TRUE(table.release_all("x", {b}, &err));
    EXPECT_TRUE(table.get(a).empty());
    EXPECT_EQ(std::set<std::string>{"y"}, table.get(b).locks);
}

TEST(LockTableTest, LockOnSnapshotCreatedByAnotherRunSurvives) {
    TempDir tmp;
    FakeSource first(tmp.path(), "home-", quiet_log());
    FakeSource second(tmp.path(), "home-", quiet_log());
    Snapshot a = snap(tmp.path(), "home-", "20260101-000000");
    Snapshot b = snap(tmp.path(), "home-", "20260102-000000");
    Snapshot c = snap(tmp.path(), "home-", "20260103-000000");
    ASSERT_TRUE(first.make(a, "a"));
    ASSERT_TRUE(first.make(b, "b"));

    Error err;
    std::vector<Snapshot> cached;
    ASSERT_TRUE(first.list_snapshots(true, &cached, &err)) << err.message;
    ASSERT_EQ(2u, cached.size());

    ASSERT_TRUE(second.make(c, "c"));
    ASSERT_TRUE(second.set_lock(c, "ssh://nas/backups", true, false, &err)) << err.message;

    // first still has the listing without c
    ASSERT_TRUE(first.set_lock(b, "/mnt/backup", true, false, &err)) << err.message;

    LockTable reader(first.lock_file_path(), quiet_log());
    ASSERT_TRUE(reader.load(&err));
    EXPECT_EQ(std::set<std::string>{"ssh://nas/backups"}, reader.get(c).locks);
    EXPECT_EQ(std::set<std::string>{"/mnt/backup"}, reader.get(b).locks);
}

TEST(LockTableTest, UnreadableFileAborts) {
    TempDir tmp;
    std::string path = tmp.sub("locks");
    std::string werr;
    ASSERT_TRUE(write_file_atomic(path, "{broken", &werr));
    LockTable table(path, quiet_log());
    Error err;
    EXPECT_FALSE(table.load(&err));
    EXPECT_EQ(ErrorKind::Abort, err.kind);
    Snapshot a = snap(tmp.path(), "p-", "20260101-000000");
    EXPECT_FALSE(table.set_lock(a, "x", true, false, &err));
}
