#include <gtest/gtest.h>
#include <thread>
#include "test_helpers.hpp"
#include "tools/BackupJournal.hpp"

using namespace autopatch;
using autopatch::testing::read_text;
using autopatch::testing::write_text;

class BackupJournalTest : public autopatch::testing::SandboxTest {
protected:
    std::unique_ptr<BackupJournal> make_journal(RetentionPolicy policy = {}) {
        return std::make_unique<BackupJournal>(backup_dir_, resolver_, roots_, policy);
    }
};

TEST_F(BackupJournalTest, SnapshotThenRestoreIsByteIdentical) {
    std::string original("line one\n\0binary\xff tail", 22);
    write_text(source("pkg/module.py"), original);
    auto journal = make_journal();

    auto rec = journal->snapshot(roots_.source, "pkg/module.py");
    EXPECT_TRUE(rec.existed);
    EXPECT_EQ(rec.size, original.size());
    EXPECT_EQ(rec.relative_path, "pkg/module.py");
    EXPECT_EQ(rec.checksum.size(), 64u);
    EXPECT_TRUE(fs::exists(rec.backup_path));

    write_text(source("pkg/module.py"), "clobbered");
    auto result = journal->restore(rec);
    EXPECT_TRUE(result.success) << result.message;
    EXPECT_EQ(read_text(source("pkg/module.py")), original);
}

TEST_F(BackupJournalTest, EmptyFileRoundTrips) {
    write_text(source("empty.txt"), "");
    auto journal = make_journal();
    auto rec = journal->snapshot(roots_.source, "empty.txt");
    write_text(source("empty.txt"), "not empty any more");
    ASSERT_TRUE(journal->restore(rec).success);
    EXPECT_TRUE(fs::exists(source("empty.txt")));
    EXPECT_EQ(fs::file_size(source("empty.txt")), 0u);
}

TEST_F(BackupJournalTest, MissingFileYieldsCreateRecordThatDeletes) {
    auto journal = make_journal();
    auto rec = journal->snapshot(roots_.workspace, "fresh/new.txt");
    EXPECT_FALSE(rec.existed);
    EXPECT_TRUE(rec.backup_path.empty());

    write_text(workspace("fresh/new.txt"), "created later");
    ASSERT_TRUE(journal->restore(rec).success);
    EXPECT_FALSE(fs::exists(workspace("fresh/new.txt")));
}

TEST_F(BackupJournalTest, RestoreIsIdempotent) {
    write_text(source("a.txt"), "v1");
    auto journal = make_journal();
    auto rec = journal->snapshot(roots_.source, "a.txt");
    write_text(source("a.txt"), "v2");

    ASSERT_TRUE(journal->restore(rec).success);
    std::string once = read_text(source("a.txt"));
    ASSERT_TRUE(journal->restore(rec.id).success);
    EXPECT_EQ(read_text(source("a.txt")), once);
    EXPECT_EQ(once, "v1");

    auto create = journal->snapshot(roots_.source, "b.txt");
    EXPECT_TRUE(journal->restore(create).success);
    EXPECT_TRUE(journal->restore(create).success);
    EXPECT_FALSE(fs::exists(source("b.txt")));
}

TEST_F(BackupJournalTest, BackupsLiveOutsideTheSourceTree) {
    write_text(source("a.txt"), "v1");
    auto journal = make_journal();
    journal->snapshot(roots_.source, "a.txt");
    for (const auto& entry : fs::recursive_directory_iterator(roots_.source.path)) {
        EXPECT_NE(entry.path().extension(), ".bak") << entry.path();
    }
    EXPECT_TRUE(fs::exists(backup_dir_ / "index.json"));
}

TEST_F(BackupJournalTest, DirectoryTargetIsBackupIOError) {
    fs::create_directories(source("dir"));
    auto journal = make_journal();
    try {
        journal->snapshot(roots_.source, "dir");
        FAIL() << "expected BackupIOError";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::BACKUP_IO_ERROR);
    }
    EXPECT_EQ(journal->size(), 0u);
}

TEST_F(BackupJournalTest, UnwritableStoreIsBackupIOError) {
    write_text(source("a.txt"), "v1");
    auto journal = make_journal();
    fs::remove_all(backup_dir_ / "objects");
    write_text(backup_dir_ / "objects", "not a directory");

    try {
        journal->snapshot(roots_.source, "a.txt");
        FAIL() << "expected BackupIOError";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::BACKUP_IO_ERROR);
    }
    EXPECT_EQ(journal->size(), 0u);
    EXPECT_EQ(read_text(source("a.txt")), "v1");
}

TEST_F(BackupJournalTest, EscapingPathIsOutOfBounds) {
    auto journal = make_journal();
    try {
        journal->snapshot(roots_.source, "../../etc/passwd");
        FAIL() << "expected OutOfBoundsPath";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::OUT_OF_BOUNDS_PATH);
    }
}

TEST_F(BackupJournalTest, CorruptObjectIsNotRestored) {
    write_text(source("a.txt"), "v1");
    auto journal = make_journal();
    auto rec = journal->snapshot(roots_.source, "a.txt");
    write_text(rec.backup_path, "tampered");
    write_text(source("a.txt"), "v2");

    auto result = journal->restore(rec);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(read_text(source("a.txt")), "v2");
}

TEST_F(BackupJournalTest, ListIsNewestFirstAndFiltered) {
    write_text(source("a.txt"), "1");
    write_text(source("b.txt"), "1");
    auto journal = make_journal();
    auto first = journal->snapshot(roots_.source, "a.txt");
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    auto second = journal->snapshot(roots_.source, "b.txt");
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    auto third = journal->snapshot(roots_.source, "a.txt");
    journal->snapshot(roots_.workspace, "w.txt");

    auto all = journal->list(RootKind::SOURCE);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id, third.id);
    EXPECT_EQ(all[1].id, second.id);
    EXPECT_EQ(all[2].id, first.id);

    auto only_a = journal->list(RootKind::SOURCE, "./a.txt");
    ASSERT_EQ(only_a.size(), 2u);
    EXPECT_EQ(only_a[0].id, third.id);
    EXPECT_EQ(journal->list(RootKind::WORKSPACE).size(), 1u);
}

TEST_F(BackupJournalTest, IndexSurvivesReload) {
    write_text(source("a.txt"), "persist me");
    std::string id;
    {
        auto journal = make_journal();
        id = journal->snapshot(roots_.source, "a.txt").id;
    }
    auto reloaded = make_journal();
    ASSERT_TRUE(reloaded->find(id).has_value());
    write_text(source("a.txt"), "changed");
    EXPECT_TRUE(reloaded->restore(id).success);
    EXPECT_EQ(read_text(source("a.txt")), "persist me");
}

TEST_F(BackupJournalTest, EvictionDropsOldestAndSkipsPinned) {
    RetentionPolicy policy;
    policy.max_records = 2;
    auto journal = make_journal(policy);

    std::vector<BackupRecord> recs;
    for (int i = 0; i < 4; ++i) {
        write_text(source("f.txt"), "v" + std::to_string(i));
        recs.push_back(journal->snapshot(roots_.source, "f.txt"));
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }

    BackupPin pin(journal.get(), recs[0].id);
    EXPECT_TRUE(journal->is_pinned(recs[0].id));

    EXPECT_EQ(journal->evict(), 2u);
    EXPECT_TRUE(journal->find(recs[0].id).has_value());
    EXPECT_FALSE(journal->find(recs[1].id).has_value());
    EXPECT_FALSE(journal->find(recs[2].id).has_value());
    EXPECT_TRUE(journal->find(recs[3].id).has_value());
    EXPECT_FALSE(fs::exists(recs[1].backup_path));

    pin.release();
    EXPECT_FALSE(journal->is_pinned(recs[0].id));
    EXPECT_EQ(journal->evict(), 0u);
}

TEST_F(BackupJournalTest, AgeBasedEviction) {
    RetentionPolicy policy;
    policy.max_records = 0;
    policy.max_age_seconds = 1;
    auto journal = make_journal(policy);
    write_text(source("f.txt"), "old");
    journal->snapshot(roots_.source, "f.txt");
    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    write_text(source("f.txt"), "new");
    auto fresh = journal->snapshot(roots_.source, "f.txt");

    EXPECT_EQ(journal->evict(), 1u);
    ASSERT_EQ(journal->size(), 1u);
    EXPECT_TRUE(journal->find(fresh.id).has_value());
}

TEST_F(BackupJournalTest, CorruptIndexIsSetAsideAndRebuilt) {
    write_text(source("a.txt"), "original a");
    std::string id_a;
    std::string id_new;
    {
        auto journal = make_journal();
        id_a = journal->snapshot(roots_.source, "a.txt").id;
        id_new = journal->snapshot(roots_.source, "new.txt").id;
    }
    write_text(backup_dir_ / "index.json", "{\"records\": [ truncated");

    auto reloaded = make_journal();
    EXPECT_EQ(reloaded->size(), 2u);
    ASSERT_TRUE(reloaded->find(id_new).has_value());
    EXPECT_FALSE(reloaded->find(id_new)->existed);

    size_t set_aside = 0;
    for (const auto& e : fs::directory_iterator(backup_dir_)) {
        if (e.path().filename().string().rfind("index.json.corrupt-", 0) == 0) set_aside++;
    }
    EXPECT_EQ(set_aside, 1u);

    write_text(source("a.txt"), "broken a");
    EXPECT_TRUE(reloaded->restore(id_a).success);
    EXPECT_EQ(read_text(source("a.txt")), "original a");

    reloaded->snapshot(roots_.source, "a.txt");
    reloaded.reset();
    EXPECT_EQ(make_journal()->size(), 3u);
}

TEST_F(BackupJournalTest, MissingIndexIsRebuiltFromRecords) {
    write_text(source("a.txt"), "v1");
    {
        auto journal = make_journal();
        journal->snapshot(roots_.source, "a.txt");
    }
    fs::remove(backup_dir_ / "index.json");

    EXPECT_EQ(make_journal()->size(), 1u);
    EXPECT_TRUE(fs::exists(backup_dir_ / "index.json"));
}

TEST_F(BackupJournalTest, EvictionRemovesRecordFiles) {
    RetentionPolicy policy;
    policy.max_records = 1;
    auto journal = make_journal(policy);
    write_text(source("f.txt"), "v0");
    auto old = journal->snapshot(roots_.source, "f.txt");
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    journal->snapshot(roots_.source, "f.txt");

    EXPECT_EQ(journal->evict(), 1u);
    EXPECT_FALSE(fs::exists(backup_dir_ / "objects" / (old.id + ".json")));
    journal.reset();
    fs::remove(backup_dir_ / "index.json");
    EXPECT_EQ(make_journal(policy)->size(), 1u);
}
