#include <gtest/gtest.h>

#include <fstream>

#include "test_support.h"
#include "transaction_log.h"

using namespace snapvault;
using snapvault::testing::TempDir;
using snapvault::testing::quiet_log;

namespace {

TransactionRecord make_record(const std::string &action, const std::string &status, const std::string &snapshot) {
    TransactionRecord r;
    r.action = action;
    r.status = status;
    r.snapshot = snapshot;
    return r;
}

}

TEST(TransactionLogTest, SerializeOmitsUnsetFields) {
    TransactionRecord r = make_record("transfer", "completed", "home-20240101-000000");
    r.timestamp = "2024-01-01T00:00:00";
    r.pid = 42;
    r.duration_seconds = 1.23456;
    std::string line = serialize_record(r);
    EXPECT_EQ(std::string::npos, line.find('\n'));
    EXPECT_EQ(std::string::npos, line.find("size_bytes"));
    EXPECT_EQ(std::string::npos, line.find("parent"));

    TransactionRecord back;
    ASSERT_TRUE(parse_record(line, &back));
    EXPECT_EQ("transfer", back.action);
    EXPECT_EQ(42, back.pid);
    EXPECT_DOUBLE_EQ(1.235, back.duration_seconds);
    EXPECT_EQ(-1, back.size_bytes);
}

TEST(TransactionLogTest, ParseRejectsRecordsWithoutActionOrStatus) {
    TransactionRecord r;
    EXPECT_FALSE(parse_record("not json", &r));
    EXPECT_FALSE(parse_record("[1, 2]", &r));
    EXPECT_FALSE(parse_record("{\"action\": \"transfer\"}", &r));
}

TEST(TransactionLogTest, ReadFiltersAndKeepsNewest) {
    TempDir dir;
    TransactionLog log(dir.sub("log/transactions.jsonl"), quiet_log());
    ASSERT_TRUE(log.enabled());
    log.record(make_record("transfer", "started", "a"));
    log.record(make_record("transfer", "completed", "a"));
    log.record(make_record("prune", "completed", ""));
    log.record(make_record("transfer", "started", "b"));
    log.record(make_record("transfer", "failed", "b"));

    EXPECT_EQ(5u, log.read(0, "", "").size());

    auto transfers = log.read(2, "transfer", "");
    ASSERT_EQ(2u, transfers.size());
    EXPECT_EQ("started", transfers[0].status);
    EXPECT_EQ("b", transfers[0].snapshot);
    EXPECT_EQ("failed", transfers[1].status);

    auto completed = log.read(0, "", "completed");
    ASSERT_EQ(2u, completed.size());
    EXPECT_EQ("transfer", completed[0].action);
    EXPECT_EQ("prune", completed[1].action);
    EXPECT_FALSE(completed[0].timestamp.empty());
    EXPECT_NE(0, completed[0].pid);
}

TEST(TransactionLogTest, InvalidLinesAreSkipped) {
    TempDir dir;
    std::string path = dir.sub("transactions.jsonl");
    TransactionLog log(path, quiet_log());
    log.record(make_record("snapshot", "completed", "x"));
    {
        std::ofstream out(path, std::ios::app);
        out << "garbage line\n\n{\"status\": \"completed\"}\n";
    }
    log.record(make_record("snapshot", "failed", "y"));

    auto all = log.read(0, "", "");
    ASSERT_EQ(2u, all.size());
    EXPECT_EQ("x", all[0].snapshot);
    EXPECT_EQ("y", all[1].snapshot);
}

TEST(TransactionLogTest, StatsCountPerAction) {
    TempDir dir;
    TransactionLog log(dir.sub("transactions.jsonl"), quiet_log());
    log.record(make_record("transfer", "started", "a"));
    log.record(make_record("transfer", "completed", "a"));
    log.record(make_record("transfer", "failed", "b"));
    log.record(make_record("restore", "completed", "a"));

    TransactionStats stats = log.stats();
    EXPECT_EQ(4u, stats.total);
    EXPECT_EQ(1u, stats.completed["transfer"]);
    EXPECT_EQ(1u, stats.completed["restore"]);
    EXPECT_EQ(1u, stats.failed["transfer"]);
    EXPECT_EQ(0u, stats.failed.count("restore"));
}

TEST(TransactionLogTest, EmptyPathDisablesLog) {
    TransactionLog log("", quiet_log());
    EXPECT_FALSE(log.enabled());
    log.record(make_record("transfer", "started", "a"));
    EXPECT_TRUE(log.read(0, "", "").empty());
}

TEST(TransactionScopeTest, RecordsStartAndCompletion) {
    TempDir dir;
    TransactionLog log(dir.sub("transactions.jsonl"), quiet_log());
    {
        TransactionScope scope(&log, "transfer", "/src", "/dst", "home-20240101-000000", "home-20231231-000000");
        scope.set_size(1024);
        scope.complete();
        scope.fail("ignored after completion");
    }
    auto records = log.read(0, "", "");
    ASSERT_EQ(2u, records.size());
    EXPECT_EQ("started", records[0].status);
    EXPECT_EQ("home-20231231-000000", records[0].parent);
    EXPECT_EQ("completed", records[1].status);
    EXPECT_EQ(1024, records[1].size_bytes);
    EXPECT_GE(records[1].duration_seconds, 0.0);
    EXPECT_TRUE(records[1].error.empty());
}

TEST(TransactionScopeTest, UnfinishedScopeIsInterrupted) {
    TempDir dir;
    TransactionLog log(dir.sub("transactions.jsonl"), quiet_log());
    {
        TransactionScope scope(&log, "restore", "/backup", "/restore", "home-20240101-000000", "");
    }
    auto failed = log.read(0, "restore", "failed");
    ASSERT_EQ(1u, failed.size());
    EXPECT_EQ("interrupted", failed[0].error);
}
