#include "storage/local_storage.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>
#include <fstream>
#include <set>

using FileCache::Storage::Bytes;
using FileCache::Storage::LocalStorage;
using FileCache::Storage::StorageErrc;
using FileCache::Testing::TempDirectory;
using FileCache::Testing::ToBytes;
using FileCache::Testing::ToString;

class LocalStorageTest : public ::testing::Test
{
    protected:
    void SetUp() override
    {
        storage_ = std::make_unique<LocalStorage>(dir_.Path() / "root");
        ASSERT_TRUE(storage_->Initialize().has_value());
    }

    TempDirectory dir_;
    std::unique_ptr<LocalStorage> storage_;
};

TEST_F(LocalStorageTest, WriteAtomicThenReadAll)
{
    ASSERT_TRUE(storage_->WriteAtomic("a/b/file.cache", ToBytes("hello")).has_value());
    auto read = storage_->ReadAll("a/b/file.cache");
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(ToString(*read), "hello");

    ASSERT_TRUE(storage_->WriteAtomic("a/b/file.cache", ToBytes("bye")).has_value());
    EXPECT_EQ(ToString(*storage_->ReadAll("a/b/file.cache")), "bye");
}

TEST_F(LocalStorageTest, WriteLeavesNoTemporaryFiles)
{
    ASSERT_TRUE(storage_->WriteAtomic("x.cache", ToBytes("v")).has_value());
    std::size_t files = 0;
    for (const auto& entry : std::filesystem::directory_iterator(storage_->GetPath())) {
        (void)entry;
        ++files;
    }
    EXPECT_EQ(files, 1u);
}

TEST_F(LocalStorageTest, MissingFileIsFileNotFound)
{
    auto read = storage_->ReadAll("nope.cache");
    ASSERT_FALSE(read.has_value());
    EXPECT_EQ(read.error(), StorageErrc::FileNotFound);
}

TEST_F(LocalStorageTest, RemoveIsIdempotent)
{
    ASSERT_TRUE(storage_->WriteAtomic("k.cache", ToBytes("v")).has_value());
    EXPECT_TRUE(storage_->Remove("k.cache").has_value());
    EXPECT_TRUE(storage_->Remove("k.cache").has_value());
    EXPECT_FALSE(*storage_->CheckIfFileExists("k.cache"));
}

TEST_F(LocalStorageTest, RejectsPathsOutsideRoot)
{
    EXPECT_EQ(storage_->WriteAtomic("../escape", ToBytes("x")).error(), StorageErrc::InvalidPath);
    EXPECT_EQ(storage_->WriteAtomic("/etc/escape", ToBytes("x")).error(), StorageErrc::InvalidPath);
    EXPECT_EQ(storage_->ReadAll("a/../../escape").error(), StorageErrc::InvalidPath);
    EXPECT_FALSE(std::filesystem::exists(dir_.Path() / "escape"));
}

TEST_F(LocalStorageTest, CreateExclusiveFailsWhenPresent)
{
    ASSERT_TRUE(storage_->CreateExclusive("locks/m.lock", ToBytes("1")).has_value());
    auto again = storage_->CreateExclusive("locks/m.lock", ToBytes("2"));
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error(), StorageErrc::AlreadyExists);
    EXPECT_EQ(ToString(*storage_->ReadAll("locks/m.lock")), "1");
}

TEST_F(LocalStorageTest, ListSkipsHiddenAndForeignFiles)
{
    ASSERT_TRUE(storage_->WriteAtomic("s/one.cache", ToBytes("1")).has_value());
    ASSERT_TRUE(storage_->WriteAtomic("s/two.cache", ToBytes("2")).has_value());
    ASSERT_TRUE(storage_->WriteAtomic("s/notes.txt", ToBytes("x")).has_value());
    ASSERT_TRUE(storage_->WriteAtomic("s/.one.cache.tmp.1.2", ToBytes("x")).has_value());
    ASSERT_TRUE(storage_->CreateDirectory("s/nested.cache").has_value());

    auto listing = storage_->List("s", ".cache");
    ASSERT_TRUE(listing.has_value());

    std::set<std::string> names;
    while (true) {
        auto next = (*listing)->Next();
        ASSERT_TRUE(next.has_value());
        if (!next->has_value())
            break;
        names.insert(next->value().relative_path.filename().string());
    }
    EXPECT_EQ(names, (std::set<std::string>{"one.cache", "two.cache"}));

    // Restartable
    ASSERT_TRUE((*listing)->Restart().has_value());
    auto first = (*listing)->Next();
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(first->has_value());
}

TEST_F(LocalStorageTest, ListToleratesConcurrentDeletion)
{
    for (int i = 0; i < 20; ++i) {
        ASSERT_TRUE(
            storage_->WriteAtomic("d/" + std::to_string(i) + ".cache", ToBytes("v")).has_value()
        );
    }
    auto listing = storage_->List("d", ".cache");
    ASSERT_TRUE(listing.has_value());

    std::size_t seen = 0;
    bool deleted     = false;
    while (true) {
        auto next = (*listing)->Next();
        ASSERT_TRUE(next.has_value());
        if (!next->has_value())
            break;
        ++seen;
        if (!deleted) {
            for (int i = 0; i < 20; ++i)
                ASSERT_TRUE(storage_->Remove("d/" + std::to_string(i) + ".cache").has_value());
            deleted = true;
        }
    }
    EXPECT_GE(seen, 1u);
    EXPECT_LE(seen, 20u);
}

TEST_F(LocalStorageTest, ListOfMissingDirectoryIsEmpty)
{
    auto listing = storage_->List("never/written", ".cache");
    ASSERT_TRUE(listing.has_value());
    auto next = (*listing)->Next();
    ASSERT_TRUE(next.has_value());
    EXPECT_FALSE(next->has_value());
}

TEST_F(LocalStorageTest, UpdateLockedReadsModifiesAndRemoves)
{
    auto append = [](const std::optional<Bytes>& current) -> FileCache::Storage::StorageResult<Bytes> {
        std::string text = current ? ToString(*current) : "";
        return ToBytes(text + "x");
    };
    ASSERT_TRUE(storage_->UpdateLocked("doc.json", append).has_value());
    ASSERT_TRUE(storage_->UpdateLocked("doc.json", append).has_value());
    EXPECT_EQ(ToString(*storage_->ReadAll("doc.json")), "xx");

    auto clear = [](const std::optional<Bytes>&) -> FileCache::Storage::StorageResult<Bytes> {
        return Bytes{};
    };
    ASSERT_TRUE(storage_->UpdateLocked("doc.json", clear).has_value());
    EXPECT_FALSE(*storage_->CheckIfFileExists("doc.json"));
}

TEST_F(LocalStorageTest, WriteAtomicSetsModificationTime)
{
    const auto when = FileCache::Cache::FromEpochMillis(1'600'000'000'000);
    ASSERT_TRUE(storage_->WriteAtomic("t.cache", ToBytes("v"), when).has_value());
    auto attr = storage_->GetAttributes("t.cache");
    ASSERT_TRUE(attr.has_value());
    EXPECT_EQ(attr->st_mtim.tv_sec, 1'600'000'000);

    const auto later = FileCache::Cache::FromEpochMillis(1'600'000'100'000);
    ASSERT_TRUE(storage_->Touch("t.cache", later).has_value());
    EXPECT_EQ(storage_->GetAttributes("t.cache")->st_mtim.tv_sec, 1'600'000'100);
}
