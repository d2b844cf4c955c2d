#include <gtest/gtest.h>
#include "errors.hpp"
#include "file_store.hpp"
#include "test_support.hpp"

using storage::AtomicFile;
using storage::FileStore;
using storage::InvalidName;
using testing_support::read_text;
using testing_support::TempDir;
using testing_support::to_bytes;
using testing_support::write_text;

namespace fs = std::filesystem;

TEST(FileStoreTest, CreatesMissingRoot) {
    TempDir dir;
    fs::path root = dir.path() / "nested" / "data";
    FileStore store(root);
    EXPECT_TRUE(fs::is_directory(root));
    EXPECT_TRUE(store.list().empty());
}

TEST(FileStoreTest, ListsRegularFilesOnly) {
    TempDir dir;
    FileStore store(dir.path());
    write_text(dir.path() / "b.txt", "b");
    write_text(dir.path() / "a.txt", "a");
    fs::create_directory(dir.path() / "subdir");
    write_text(dir.path() / ("c.txt.1234" + std::string(storage::kPartSuffix)), "partial");

    EXPECT_EQ(store.list(), (std::vector<std::string>{"a.txt", "b.txt"}));
}

TEST(FileStoreTest, StatAndReadExistingFile) {
    TempDir dir;
    FileStore store(dir.path());
    write_text(dir.path() / "hello.txt", "hello");

    auto record = store.stat("hello.txt");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->name, "hello.txt");
    EXPECT_EQ(record->size, 5u);

    auto content = store.read("hello.txt");
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, to_bytes("hello"));
}

TEST(FileStoreTest, MissingFileIsNotFound) {
    TempDir dir;
    FileStore store(dir.path());
    EXPECT_FALSE(store.stat("missing.txt").has_value());
    EXPECT_FALSE(store.read("missing.txt").has_value());
    EXPECT_FALSE(store.open("missing.txt").has_value());
}

TEST(FileStoreTest, DirectoryIsNotAFile) {
    TempDir dir;
    FileStore store(dir.path());
    fs::create_directory(dir.path() / "subdir");
    EXPECT_FALSE(store.stat("subdir").has_value());
}

TEST(FileStoreTest, EscapingNamesAreRejectedWithoutIo) {
    TempDir dir;
    fs::path root = dir.path() / "root";
    FileStore store(root);
    write_text(dir.path() / "outside.txt", "secret");

    EXPECT_THROW(store.read("../../etc/passwd"), InvalidName);
    EXPECT_THROW(store.write("../evil", to_bytes("x")), InvalidName);
    EXPECT_THROW(store.stat("../outside.txt"), InvalidName);
    EXPECT_THROW(store.read("/etc/passwd"), InvalidName);
    EXPECT_THROW(store.read(".."), InvalidName);
    EXPECT_THROW(store.read("."), InvalidName);
    EXPECT_THROW(store.read(""), InvalidName);
    EXPECT_THROW(store.read("a\\b"), InvalidName);
    EXPECT_THROW(store.read(std::string("a\0b", 3)), InvalidName);

    EXPECT_FALSE(fs::exists(dir.path() / "evil"));
    EXPECT_TRUE(store.list().empty());
}

TEST(FileStoreTest, SymlinkOutOfRootIsRejected) {
    TempDir dir;
    fs::path root = dir.path() / "root";
    FileStore store(root);
    write_text(dir.path() / "outside.txt", "secret");
    fs::create_symlink(dir.path() / "outside.txt", root / "link.txt");

    EXPECT_THROW(store.read("link.txt"), InvalidName);
}

TEST(FileStoreTest, WriteReplacesAtomically) {
    TempDir dir;
    FileStore store(dir.path());
    store.write("data.bin", to_bytes("first"));
    store.write("data.bin", to_bytes("second"));
    EXPECT_EQ(read_text(dir.path() / "data.bin"), "second");
    EXPECT_EQ(store.list(), std::vector<std::string>{"data.bin"});
}

TEST(FileStoreTest, InterruptedWriteLeavesNothingVisible) {
    TempDir dir;
    FileStore store(dir.path());
    fs::path temp;
    {
        AtomicFile file = store.create("new.bin");
        file.write(to_bytes("partial bytes"));
        temp = file.temp_path();
        EXPECT_TRUE(fs::exists(temp));
        // destroyed without commit, as if the upload failed here
    }
    EXPECT_FALSE(fs::exists(dir.path() / "new.bin"));
    EXPECT_FALSE(fs::exists(temp));
    EXPECT_TRUE(store.list().empty());
}

TEST(FileStoreTest, InterruptedWriteKeepsPriorFile) {
    TempDir dir;
    FileStore store(dir.path());
    store.write("keep.txt", to_bytes("original"));
    {
        AtomicFile file = store.create("keep.txt");
        file.write(to_bytes("replacement that never lands"));
        file.abort();
    }
    EXPECT_EQ(read_text(dir.path() / "keep.txt"), "original");
}

TEST(FileStoreTest, ReservedPartSuffixIsInvalid) {
    TempDir dir;
    FileStore store(dir.path());
    EXPECT_THROW(store.create(std::string("x") + storage::kPartSuffix), InvalidName);
}

TEST(FileStoreTest, NonUtf8NamesAreNotServed) {
    TempDir dir;
    FileStore store(dir.path());
    const std::string latin1 = "caf\xe9.txt";
    write_text(dir.path() / "plain.txt", "plain");
    write_text(dir.path() / latin1, "latin-1");

    EXPECT_EQ(store.list(), (std::vector<std::string>{"plain.txt"}));
    EXPECT_THROW(store.stat(latin1), InvalidName);
    EXPECT_THROW(store.write(latin1, to_bytes("x")), InvalidName);
    EXPECT_NO_THROW(FileStore::validate_name("caf\xc3\xa9.txt"));
}

TEST(FileStoreTest, ChunkReaderYieldsBoundedSlices) {
    TempDir dir;
    FileStore store(dir.path());
    write_text(dir.path() / "ten.bin", "0123456789");

    auto reader = store.open("ten.bin");
    ASSERT_TRUE(reader.has_value());
    EXPECT_EQ(reader->size(), 10u);

    std::vector<size_t> sizes;
    protocol::Bytes buffer;
    while (reader->next(buffer, 4)) sizes.push_back(buffer.size());
    EXPECT_EQ(sizes, (std::vector<size_t>{4, 4, 2}));
}
