#include <gtest/gtest.h>

#include <fstream>

#include "Pool/HandlePool.h"
#include "TestHelpers/StorageTestHelpers.h"

using namespace OriginVault::Core;
using namespace OriginVault::Core::IO;
using namespace OriginVault::Core::Pool;
using originvault::test_helpers::bytesOf;
using originvault::test_helpers::makeDatabaseImage;
using originvault::test_helpers::ScopedLogCapture;
using originvault::test_helpers::ScopedTempDir;

namespace {

HandlePool::Config poolConfig(const ScopedTempDir& tmp, const std::string& name = "test-pool") {
    HandlePool::Config cfg;
    cfg.name = name;
    cfg.root = tmp.path();
    return cfg;
}

std::vector<std::filesystem::path> slotFiles(const HandlePool& pool) {
    std::vector<std::filesystem::path> files;
    for (const auto& e : std::filesystem::directory_iterator(pool.directory() / ".opaque")) {
        files.push_back(e.path());
    }
    return files;
}

StorageError codeOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const StorageException& e) {
        return e.code();
    }
    return StorageError::None;
}

}

TEST(HandlePool, InitialCapacityCreatesSlotFiles) {
    ScopedTempDir tmp;
    HandlePool pool(poolConfig(tmp));
    EXPECT_EQ(pool.getCapacity(), 6u);
    EXPECT_EQ(pool.getFileCount(), 0u);
    EXPECT_EQ(pool.directory(), tmp.path() / ".test-pool");

    auto files = slotFiles(pool);
    ASSERT_EQ(files.size(), 6u);
    for (const auto& f : files) {
        EXPECT_EQ(std::filesystem::file_size(f), HandlePool::kHeaderSize);
    }
}

TEST(HandlePool, AcquireAssociatesAtMostOneSlotPerName) {
    ScopedTempDir tmp;
    auto cfg = poolConfig(tmp);
    cfg.initialCapacity = 3;
    HandlePool pool(cfg);

    auto a = pool.acquireSlotFor("/a.db", true);
    auto again = pool.acquireSlotFor("a.db", true);
    EXPECT_EQ(a, again) << "names are normalized before lookup";
    EXPECT_EQ(pool.getFileCount(), 1u);

    EXPECT_EQ(codeOf([&] { pool.acquireSlotFor("/missing.db", false); }), StorageError::NotFound);

    pool.acquireSlotFor("/b.db", true);
    pool.acquireSlotFor("/c.db", true);
    EXPECT_EQ(codeOf([&] { pool.acquireSlotFor("/d.db", true); }), StorageError::CapacityExceeded);
    EXPECT_EQ(pool.getFileCount(), 3u);

    pool.release("/b.db");
    pool.release("/never-associated.db");
    EXPECT_EQ(pool.getFileCount(), 2u);
    EXPECT_NO_THROW(pool.acquireSlotFor("/d.db", true));
    EXPECT_LE(pool.getFileCount(), pool.getCapacity());

    auto names = pool.getFileNames();
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], "/a.db");
    EXPECT_EQ(names[2], "/d.db");
}

TEST(HandlePool, OverlongNameIsMisuse) {
    ScopedTempDir tmp;
    HandlePool pool(poolConfig(tmp));
    const std::string name = "/" + std::string(HandlePool::kNameCapacity, 'x');
    EXPECT_EQ(codeOf([&] { pool.acquireSlotFor(name, true); }), StorageError::Misuse);
    EXPECT_EQ(pool.getFileCount(), 0u);
}

TEST(HandlePool, CapacityChanges) {
    ScopedTempDir tmp;
    HandlePool pool(poolConfig(tmp));
    EXPECT_EQ(pool.addCapacity(2), 8u);
    EXPECT_EQ(slotFiles(pool).size(), 8u);

    for (int i = 0; i < 5; ++i) pool.acquireSlotFor("/f" + std::to_string(i), true);
    EXPECT_EQ(codeOf([&] { pool.reduceCapacity(4); }), StorageError::Busy);
    EXPECT_EQ(pool.getCapacity(), 8u);

    EXPECT_EQ(pool.reduceCapacity(3), 3u);
    EXPECT_EQ(pool.getCapacity(), 5u);
    EXPECT_EQ(slotFiles(pool).size(), 5u);
    EXPECT_EQ(pool.getFileCount(), 5u);

    EXPECT_EQ(pool.addCapacity(1), 6u);
    EXPECT_NO_THROW(pool.acquireSlotFor("/f5", true));
}

TEST(HandlePool, ExportThenImportReproducesBytes) {
    ScopedTempDir tmp;
    HandlePool pool(poolConfig(tmp));
    auto image = makeDatabaseImage(3);
    ASSERT_GE(image.size(), 4096u);

    EXPECT_EQ(pool.importDb("/orig.db", image), image.size());
    auto exported = pool.exportFile("/orig.db");
    EXPECT_EQ(pool.importDb("/copy.db", exported), exported.size());
    EXPECT_EQ(pool.getFileCount(), 2u);
    EXPECT_EQ(pool.exportFile("/copy.db"), exported);
    EXPECT_EQ(exported[18], std::byte{1});
    EXPECT_EQ(exported[19], std::byte{1});
}

TEST(HandlePool, ImportForcesRollbackJournalMode) {
    ScopedTempDir tmp;
    HandlePool pool(poolConfig(tmp));
    auto image = makeDatabaseImage(1);
    image[18] = std::byte{2};
    image[19] = std::byte{2};
    pool.importDb("/wal.db", image);
    auto exported = pool.exportFile("/wal.db");
    EXPECT_EQ(exported[18], std::byte{1});
    EXPECT_EQ(exported[19], std::byte{1});
}

TEST(HandlePool, ChunkedImportMatchesWholeBufferImport) {
    ScopedTempDir tmp;
    HandlePool pool(poolConfig(tmp));
    auto image = makeDatabaseImage(10);

    pool.importDb("/whole.db", image);
    VectorChunkSource source(image, 1000);
    EXPECT_EQ(pool.importDb("/chunked.db", source), image.size());
    EXPECT_EQ(pool.exportFile("/chunked.db"), pool.exportFile("/whole.db"));

    // Restartable: the same source feeds a second import
    source.rewind();
    EXPECT_EQ(pool.importDb("/again.db", source), image.size());

    // A one-byte-at-a-time producer still passes header validation
    size_t pos = 0;
    CallbackChunkSource trickle([&]() -> Chunk {
        if (pos >= image.size()) return Chunk::end();
        Chunk c;
        const size_t n = pos < 32 ? 1 : image.size() - pos;
        c.bytes.assign(image.begin() + pos, image.begin() + pos + n);
        pos += n;
        c.endOfData = pos >= image.size();
        return c;
    });
    EXPECT_EQ(pool.importDb("/trickle.db", trickle), image.size());
    EXPECT_EQ(pool.exportFile("/trickle.db"), pool.exportFile("/whole.db"));
}

TEST(HandlePool, ImportRejectsNonDatabases) {
    ScopedTempDir tmp;
    HandlePool pool(poolConfig(tmp));

    auto junk = bytesOf(std::string(4096, 'j'));
    EXPECT_EQ(codeOf([&] { pool.importDb("/junk.db", junk); }), StorageError::NotADatabase);

    auto image = makeDatabaseImage(1);
    image.resize(image.size() + 100);
    EXPECT_EQ(codeOf([&] { pool.importDb("/ragged.db", image); }), StorageError::NotADatabase);

    EXPECT_EQ(codeOf([&] { pool.importDb("/empty.db", std::span<const std::byte>{}); }), StorageError::NotADatabase);
    EXPECT_EQ(pool.getFileCount(), 0u) << "failed imports release their slot";
}

TEST(HandlePool, ImportChecksDeclaredLength) {
    class LyingSource : public ChunkSource {
    public:
        explicit LyingSource(std::vector<std::byte> data) : _inner(std::move(data)) {}
        Chunk next() override { return _inner.next(); }
        std::optional<size_t> totalSize() const override { return *_inner.totalSize() + 512; }

    private:
        VectorChunkSource _inner;
    };

    ScopedTempDir tmp;
    HandlePool pool(poolConfig(tmp));
    LyingSource source(makeDatabaseImage(1));
    EXPECT_EQ(codeOf([&] { pool.importDb("/short.db", source); }), StorageError::IOError);
    EXPECT_FALSE(pool.hasFile("/short.db"));
}

TEST(HandlePool, ImportOverOpenFileIsBusy) {
    ScopedTempDir tmp;
    HandlePool pool(poolConfig(tmp));
    auto h = pool.openFile("/open.db", true, PersistentFlags::MainDb);
    EXPECT_EQ(codeOf([&] { pool.importDb("/open.db", makeDatabaseImage(1)); }), StorageError::Busy);
    EXPECT_EQ(codeOf([&] { pool.release("/open.db"); }), StorageError::Busy);
    pool.closeFile(h, false);
    EXPECT_NO_THROW(pool.importDb("/open.db", makeDatabaseImage(1)));
}

TEST(HandlePool, SlotIoIsOffsetPastHeader) {
    ScopedTempDir tmp;
    HandlePool pool(poolConfig(tmp));
    auto h = pool.openFile("/io.db", true, PersistentFlags::MainDb);
    pool.writeAt(h, bytesOf("payload"), 0);
    EXPECT_EQ(pool.dataSize(h), 7u);

    std::vector<std::byte> out(16);
    EXPECT_EQ(pool.readAt(h, out, 0), 7u);
    pool.truncateAt(h, 3);
    EXPECT_EQ(pool.dataSize(h), 3u);
    pool.flushSlot(h);
    EXPECT_EQ(pool.getOpenFileCount(), 1u);

    pool.closeFile(h, true);
    EXPECT_FALSE(pool.hasFile("/io.db")) << "delete-on-close releases the slot";
    EXPECT_EQ(codeOf([&] { pool.dataSize(h); }), StorageError::Misuse) << "stale handle";
}

TEST(HandlePool, PauseRefusedWhileFilesAreOpen) {
    ScopedTempDir tmp;
    HandlePool pool(poolConfig(tmp, "pause-pool"));
    auto h = pool.openFile("/busy.db", true, PersistentFlags::MainDb);
    try {
        pool.pauseVfs();
        FAIL() << "expected Misuse";
    } catch (const StorageException& e) {
        EXPECT_EQ(e.code(), StorageError::Misuse);
        EXPECT_EQ(e.info().message, "Cannot pause VFS pause-pool because it has opened files.");
    }
    pool.closeFile(h, false);

    EXPECT_NE(sqlite3_vfs_find("pause-pool"), nullptr);
    pool.pauseVfs();
    EXPECT_TRUE(pool.isPaused());
    EXPECT_EQ(sqlite3_vfs_find("pause-pool"), nullptr);
    EXPECT_EQ(codeOf([&] { pool.openFile("/busy.db", false, 0); }), StorageError::Misuse);

    pool.unpauseVfs();
    pool.unpauseVfs();
    EXPECT_FALSE(pool.isPaused());
    EXPECT_NE(sqlite3_vfs_find("pause-pool"), nullptr);
}

TEST(HandlePool, AssociationsSurviveReopen) {
    ScopedTempDir tmp;
    {
        HandlePool pool(poolConfig(tmp));
        auto h = pool.openFile("/keep.db", true, PersistentFlags::MainDb);
        pool.writeAt(h, bytesOf("persisted"), 0);
        pool.closeFile(h, false);
    }
    HandlePool pool(poolConfig(tmp));
    ASSERT_EQ(pool.getFileNames(), std::vector<std::string>{"/keep.db"});
    EXPECT_EQ(pool.getCapacity(), 6u);
    auto h = pool.openFile("/keep.db", false, 0);
    EXPECT_EQ(pool.dataSize(h), 9u);
    pool.closeFile(h, false);
}

TEST(HandlePool, DigestMismatchFreesSlot) {
    ScopedTempDir tmp;
    {
        HandlePool pool(poolConfig(tmp));
        pool.acquireSlotFor("/good.db", true);
        pool.acquireSlotFor("/bad.db", true);
    }

    // Damage the name bytes of the slot holding /bad.db without fixing its digest
    bool damaged = false;
    for (const auto& e : std::filesystem::directory_iterator(tmp.path() / ".test-pool" / ".opaque")) {
        std::fstream f(e.path(), std::ios::in | std::ios::out | std::ios::binary);
        char head[8] = {};
        f.read(head, sizeof(head));
        if (std::string(head, 7) == "/bad.db") {
            f.seekp(1);
            f.put('X');
            damaged = true;
        }
    }
    ASSERT_TRUE(damaged);

    ScopedLogCapture capture(Logging::LogLevel::Warning);
    HandlePool pool(poolConfig(tmp));
    EXPECT_EQ(pool.getFileNames(), std::vector<std::string>{"/good.db"});
    EXPECT_EQ(pool.getCapacity(), 6u);
    EXPECT_TRUE(capture.sink().contains("digest mismatch"));
}

TEST(HandlePool, ClearOnInitDropsAssociations) {
    ScopedTempDir tmp;
    {
        HandlePool pool(poolConfig(tmp));
        pool.acquireSlotFor("/gone.db", true);
    }
    auto cfg = poolConfig(tmp);
    cfg.clearOnInit = true;
    HandlePool pool(cfg);
    EXPECT_EQ(pool.getFileCount(), 0u);
    EXPECT_EQ(pool.getCapacity(), 6u);
}

TEST(HandlePool, SecondPoolOnSameDirectoryIsBusy) {
    ScopedTempDir tmp;
    HandlePool first(poolConfig(tmp, "owner-a"));
    auto cfg = poolConfig(tmp, "owner-b");
    cfg.directory = ".owner-a";
    EXPECT_EQ(codeOf([&] { HandlePool second(cfg); }), StorageError::Busy);
}

TEST(HandlePool, UnlinkAndWipe) {
    ScopedTempDir tmp;
    HandlePool pool(poolConfig(tmp));
    pool.acquireSlotFor("/x.db", true);
    pool.acquireSlotFor("/y.db", true);
    EXPECT_TRUE(pool.unlink("/x.db"));
    EXPECT_FALSE(pool.unlink("/x.db"));

    auto h = pool.openFile("/y.db", false, 0);
    EXPECT_EQ(codeOf([&] { pool.wipeFiles(); }), StorageError::Misuse);
    pool.closeFile(h, false);
    pool.wipeFiles();
    EXPECT_EQ(pool.getFileCount(), 0u);
}

TEST(HandlePool, RemoveVfsDeletesEverythingOnce) {
    ScopedTempDir tmp;
    HandlePool pool(poolConfig(tmp, "remove-pool"));
    pool.acquireSlotFor("/data.db", true);

    std::string removedName;
    pool.setRemovalCallback([&](const std::string& name) { removedName = name; });
    EXPECT_TRUE(pool.removeVfs());
    EXPECT_FALSE(pool.removeVfs());
    EXPECT_EQ(removedName, "remove-pool");
    EXPECT_TRUE(pool.isRemoved());
    EXPECT_FALSE(std::filesystem::exists(tmp.path() / ".remove-pool"));
    EXPECT_EQ(sqlite3_vfs_find("remove-pool"), nullptr);
    EXPECT_EQ(codeOf([&] { pool.acquireSlotFor("/data.db", true); }), StorageError::Misuse);
}

TEST(HandlePool, NormalizeNameAndDigest) {
    EXPECT_EQ(HandlePool::normalizeName("a.db"), "/a.db");
    EXPECT_EQ(HandlePool::normalizeName("//dir//a.db"), "/dir/a.db");
    EXPECT_EQ(HandlePool::normalizeName("/x/../dir/./a.db"), "/dir/a.db");
    EXPECT_EQ(codeOf([] { HandlePool::normalizeName("/../a.db"); }), StorageError::Misuse);

    auto bytes = bytesOf("/a.db");
    auto d1 = HandlePool::computeDigest(bytes);
    bytes[1] = std::byte{'b'};
    EXPECT_NE(d1, HandlePool::computeDigest(bytes));
}

TEST(HandlePool, DotSegmentsResolveToTheSameSlot) {
    ScopedTempDir tmp;
    HandlePool pool(poolConfig(tmp));
    pool.importDb("/x/../foo.db", makeDatabaseImage(2));
    EXPECT_EQ(pool.getFileNames(), std::vector<std::string>{"/foo.db"});
    EXPECT_TRUE(pool.hasFile("/./foo.db"));
    EXPECT_EQ(codeOf([&] { pool.acquireSlotFor("/../escape.db", true); }), StorageError::Misuse);
    EXPECT_EQ(pool.getFileCount(), 1u);
}

TEST(HandlePool, FailedCapacityGrowthLeavesPoolUsable) {
    ScopedTempDir tmp;
    auto cfg = poolConfig(tmp);
    cfg.initialCapacity = 1;
    HandlePool pool(cfg);
    pool.acquireSlotFor("/a.db", true);

    // Slot handles stay open; only new slot files become impossible to create
    const auto slotDir = pool.directory() / ".opaque";
    std::filesystem::remove_all(slotDir);
    { std::ofstream(slotDir) << "not a directory"; }

    EXPECT_THROW(pool.addCapacity(1), StorageException);
    EXPECT_EQ(pool.getCapacity(), 1u);
    EXPECT_EQ(codeOf([&] { pool.acquireSlotFor("/b.db", true); }), StorageError::CapacityExceeded);
    EXPECT_EQ(pool.getFileCount(), 1u);
}
