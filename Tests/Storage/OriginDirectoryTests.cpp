#include <gtest/gtest.h>

#include <cctype>
#include <future>
#include <thread>

#include "Storage/OriginDirectory.h"
#include "TestHelpers/StorageTestHelpers.h"

using namespace OriginVault::Core::IO;
using originvault::test_helpers::bytesOf;
using originvault::test_helpers::ScopedTempDir;

TEST(OriginDirectory, NormalizePathCollapsesSegments) {
    EXPECT_EQ(OriginDirectory::normalizePath(""), "/");
    EXPECT_EQ(OriginDirectory::normalizePath("foo.db"), "/foo.db");
    EXPECT_EQ(OriginDirectory::normalizePath("//a/./b//c"), "/a/b/c");
    EXPECT_EQ(OriginDirectory::normalizePath("/a/b/../c"), "/a/c");
}

TEST(OriginDirectory, NormalizePathRejectsEscapes) {
    try {
        OriginDirectory::normalizePath("/a/../../etc/passwd");
        FAIL() << "expected Misuse";
    } catch (const StorageException& e) {
        EXPECT_EQ(e.code(), StorageError::Misuse);
    }
}

TEST(OriginDirectory, MkdirIsRecursiveAndIdempotent) {
    ScopedTempDir tmp;
    OriginDirectory dir(tmp.path());
    EXPECT_TRUE(dir.mkdir("/a/b/c"));
    EXPECT_TRUE(dir.mkdir("/a/b/c"));
    EXPECT_TRUE(dir.entryExists("/a/b"));
    EXPECT_TRUE(std::filesystem::is_directory(tmp.path() / "a" / "b" / "c"));
}

TEST(OriginDirectory, OpenCreatesParentDirectories) {
    ScopedTempDir tmp;
    OriginDirectory dir(tmp.path());
    OpenOptions opts;
    opts.create = true;
    auto h = dir.open("/nested/dir/file.db", opts);
    h->write(bytesOf("1234"), 0);
    EXPECT_TRUE(dir.entryExists("/nested/dir/file.db"));
}

TEST(OriginDirectory, OpenRootIsCantOpen) {
    ScopedTempDir tmp;
    OriginDirectory dir(tmp.path());
    try {
        dir.open("/", OpenOptions{true, false, true});
        FAIL() << "expected CantOpen";
    } catch (const StorageException& e) {
        EXPECT_EQ(e.code(), StorageError::CantOpen);
    }
}

TEST(OriginDirectory, UnlinkNonEmptyRequiresRecursive) {
    ScopedTempDir tmp;
    OriginDirectory dir(tmp.path());
    ASSERT_TRUE(dir.mkdir("/tree/leaf"));

    EXPECT_FALSE(dir.unlink("/tree"));
    EXPECT_TRUE(dir.entryExists("/tree"));
    EXPECT_TRUE(dir.unlink("/tree", true));
    EXPECT_FALSE(dir.entryExists("/tree"));
    EXPECT_FALSE(dir.unlink("/tree", true)) << "nothing left to delete";
    EXPECT_FALSE(dir.unlink("/")) << "the root is never deleted";
}

TEST(OriginDirectory, ListEntriesIsSortedWithKinds) {
    ScopedTempDir tmp;
    OriginDirectory dir(tmp.path());
    dir.mkdir("/sub");
    OpenOptions opts;
    opts.create = true;
    dir.open("/b.db", opts)->write(bytesOf("xyz"), 0);
    dir.open("/a.db", opts)->close();

    auto entries = dir.listEntries("/");
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].name, "a.db");
    EXPECT_EQ(entries[1].path, "/b.db");
    EXPECT_EQ(entries[1].size, 3u);
    EXPECT_EQ(entries[2].kind, EntryKind::Directory);

    try {
        dir.listEntries("/missing");
        FAIL() << "expected NotFound";
    } catch (const StorageException& e) {
        EXPECT_EQ(e.code(), StorageError::NotFound);
    }
}

TEST(OriginDirectory, TraverseReportsDepthAndStopsOnFalse) {
    ScopedTempDir tmp;
    OriginDirectory dir(tmp.path());
    dir.mkdir("/a/b/c");
    dir.mkdir("/z");

    std::vector<std::pair<std::string, size_t>> seen;
    TraverseOptions opts;
    opts.visitor = [&seen](const DirectoryEntry& e, size_t depth) {
        seen.emplace_back(e.path, depth);
        return true;
    };
    dir.traverse(opts);
    ASSERT_EQ(seen.size(), 4u);
    EXPECT_EQ(seen[0], std::make_pair(std::string("/a"), size_t{1}));
    EXPECT_EQ(seen[2], std::make_pair(std::string("/a/b/c"), size_t{3}));
    EXPECT_EQ(seen[3].first, "/z");

    size_t visits = 0;
    opts.visitor = [&visits](const DirectoryEntry&, size_t) {
        ++visits;
        return false;
    };
    dir.traverse(opts);
    EXPECT_EQ(visits, 1u);

    seen.clear();
    opts.recursive = false;
    opts.visitor = [&seen](const DirectoryEntry& e, size_t depth) {
        seen.emplace_back(e.path, depth);
        return true;
    };
    dir.traverse(opts);
    EXPECT_EQ(seen.size(), 2u);
}

TEST(OriginDirectory, GetDirForFilenameSplitsAndCreates) {
    ScopedTempDir tmp;
    OriginDirectory dir(tmp.path());
    auto [hostDir, file] = dir.getDirForFilename("/x/y/db.sqlite", true);
    EXPECT_EQ(file, "db.sqlite");
    EXPECT_TRUE(std::filesystem::is_directory(hostDir));
    EXPECT_EQ(hostDir, dir.resolve("/x/y"));
}

TEST(OriginDirectory, RandomFilenameUsesAlphanumerics) {
    auto a = OriginDirectory::randomFilename(24);
    auto b = OriginDirectory::randomFilename(24);
    EXPECT_EQ(a.size(), 24u);
    EXPECT_NE(a, b);
    for (char c : a) EXPECT_TRUE(std::isalnum(static_cast<unsigned char>(c)));
}

TEST(OriginDirectory, BoundAffinityRejectsOtherThreads) {
    ScopedTempDir tmp;
    OriginDirectory dir(tmp.path());
    dir.affinity().bindToCurrentThread();
    EXPECT_TRUE(dir.mkdir("/mine"));

    auto fromOther = std::async(std::launch::async, [&dir]() -> StorageError {
        try {
            dir.entryExists("/mine");
        } catch (const StorageException& e) {
            return e.code();
        }
        return StorageError::None;
    });
    EXPECT_EQ(fromOther.get(), StorageError::WrongContext);

    dir.affinity().unbind();
    auto unbound = std::async(std::launch::async, [&dir] { return dir.entryExists("/mine"); });
    EXPECT_TRUE(unbound.get());
}
