#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

#include "history/download_ledger.h"
#include "test_support.h"

using testsupport::TempDir;

namespace {

DownloadRecord makeRecord(const std::string& video_id) {
    DownloadRecord record;
    record.video_id = video_id;
    record.playlist_id = "PL123";
    record.downloaded_at = DownloadLedger::currentTimestamp();
    record.filepath = "/library/" + video_id + ".webm";
    return record;
}

TEST(DownloadLedgerTest, OpenCreatesDatabaseAndParents) {
    TempDir dir;
    DownloadLedger ledger(dir.file("database/db.sqlite"));

    ASSERT_TRUE(ledger.open());
    EXPECT_TRUE(ledger.isOpen());
    EXPECT_EQ(ledger.count(), 0u);
    EXPECT_FALSE(ledger.contains("abc123"));
}

TEST(DownloadLedgerTest, InsertedRecordIsVisible) {
    TempDir dir;
    std::string db_path = dir.file("db.sqlite");
    DownloadLedger ledger(db_path);
    ASSERT_TRUE(ledger.open());

    ASSERT_TRUE(DownloadLedger::insertRecord(db_path, makeRecord("abc123")));

    EXPECT_TRUE(ledger.contains("abc123"));
    DownloadRecord record;
    ASSERT_TRUE(ledger.getRecord("abc123", record));
    EXPECT_EQ(record.playlist_id, "PL123");
    EXPECT_EQ(record.filepath, "/library/abc123.webm");
    EXPECT_EQ(record.downloaded_at.size(), 19u);
}

TEST(DownloadLedgerTest, DuplicateInsertFails) {
    TempDir dir;
    std::string db_path = dir.file("db.sqlite");
    DownloadLedger ledger(db_path);
    ASSERT_TRUE(ledger.open());

    ASSERT_TRUE(DownloadLedger::insertRecord(db_path, makeRecord("abc123")));
    EXPECT_FALSE(DownloadLedger::insertRecord(db_path, makeRecord("abc123")));
    EXPECT_EQ(ledger.count(), 1u);
}

TEST(DownloadLedgerTest, RecordsSurviveReopen) {
    TempDir dir;
    std::string db_path = dir.file("db.sqlite");
    {
        DownloadLedger ledger(db_path);
        ASSERT_TRUE(ledger.open());
        ASSERT_TRUE(DownloadLedger::insertRecord(db_path, makeRecord("abc123")));
    }
    DownloadLedger reopened(db_path);
    ASSERT_TRUE(reopened.open());
    EXPECT_TRUE(reopened.contains("abc123"));
}

TEST(DownloadLedgerTest, ConcurrentInsertsAllLand) {
    TempDir dir;
    std::string db_path = dir.file("db.sqlite");
    DownloadLedger ledger(db_path);
    ASSERT_TRUE(ledger.open());

    const int kThreads = 8;
    std::vector<std::thread> threads;
    std::vector<int> results(kThreads, 0);
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i]() {
            results[i] = DownloadLedger::insertRecord(db_path, makeRecord("video" + std::to_string(i))) ? 1 : 0;
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (int i = 0; i < kThreads; ++i) {
        EXPECT_EQ(results[i], 1) << "insert " << i;
    }
    EXPECT_EQ(ledger.count(), static_cast<size_t>(kThreads));
}

TEST(DownloadLedgerTest, TimestampFormat) {
    std::string ts = DownloadLedger::currentTimestamp();
    ASSERT_EQ(ts.size(), 19u);
    EXPECT_EQ(ts[4], '-');
    EXPECT_EQ(ts[7], '-');
    EXPECT_EQ(ts[10], ' ');
    EXPECT_EQ(ts[13], ':');
    EXPECT_EQ(ts[16], ':');
}

} // namespace
