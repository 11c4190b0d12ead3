#include <gtest/gtest.h>

#include "Concurrency/CommandMessage.h"
#include "TestHelpers/StorageTestHelpers.h"

using namespace OriginVault::Core::Concurrency;
using namespace OriginVault::Core::IO;
using originvault::test_helpers::bytesOf;
using originvault::test_helpers::stringOf;

TEST(CommandMessage, EncodedWriteCarriesPathAndPayload) {
    CommandMessage msg;
    msg.opcode = Opcode::Write;
    msg.requestId = 0x1122334455ull;
    msg.fd = 7;
    msg.slot = 3;
    msg.flags = OpenFlags::Create;
    msg.offset = 8192;
    msg.path = "/db/main.db";
    msg.payload = bytesOf("page bytes");

    auto encoded = encodeCommand(msg);
    EXPECT_EQ(encoded.size(), kCommandHeaderSize + msg.path.size() + msg.payload.size());

    auto decoded = decodeCommand(encoded);
    EXPECT_EQ(decoded.opcode, Opcode::Write);
    EXPECT_EQ(decoded.requestId, msg.requestId);
    EXPECT_EQ(decoded.fd, 7);
    EXPECT_EQ(decoded.slot, 3u);
    EXPECT_EQ(decoded.flags, OpenFlags::Create);
    EXPECT_EQ(decoded.offset, 8192u);
    EXPECT_EQ(decoded.path, "/db/main.db");
    EXPECT_EQ(stringOf(decoded.payload), "page bytes");
}

TEST(CommandMessage, TruncatedHeaderIsMisuse) {
    CommandMessage msg;
    msg.opcode = Opcode::Sync;
    auto encoded = encodeCommand(msg);
    encoded.resize(kCommandHeaderSize - 1);
    try {
        decodeCommand(encoded);
        FAIL() << "expected Misuse";
    } catch (const StorageException& e) {
        EXPECT_EQ(e.code(), StorageError::Misuse);
    }
}

TEST(CommandMessage, LengthsPastEndAreMisuse) {
    CommandMessage msg;
    msg.opcode = Opcode::Exists;
    msg.path = "/some/path";
    auto encoded = encodeCommand(msg);
    encoded.resize(encoded.size() - 3);
    EXPECT_THROW(decodeCommand(encoded), StorageException);
}

TEST(CommandMessage, UnknownOpcodeIsMisuse) {
    CommandMessage msg;
    msg.opcode = Opcode::Sync;
    auto encoded = encodeCommand(msg);
    encoded[0] = std::byte{0xEE};
    try {
        decodeCommand(encoded);
        FAIL() << "expected Misuse";
    } catch (const StorageException& e) {
        EXPECT_EQ(e.code(), StorageError::Misuse);
    }
}

TEST(CommandMessage, DescriptorOpsAreClassified) {
    EXPECT_TRUE(isDescriptorOp(Opcode::Open));
    EXPECT_TRUE(isDescriptorOp(Opcode::FileSize));
    EXPECT_FALSE(isDescriptorOp(Opcode::Delete));
    EXPECT_FALSE(isDescriptorOp(Opcode::List));
    EXPECT_EQ(toString(Opcode::Truncate), "Truncate");
}

TEST(CommandMessage, DirectoryPageStopsAtCapacity) {
    std::vector<std::byte> page;
    DirectoryEntry file{"a.db", "/x/a.db", EntryKind::File, 4096};
    DirectoryEntry dir{"sub", "/x/sub", EntryKind::Directory, 0};

    ASSERT_TRUE(appendDirectoryEntry(page, file, 64));
    ASSERT_TRUE(appendDirectoryEntry(page, dir, 64));
    const size_t used = page.size();
    EXPECT_FALSE(appendDirectoryEntry(page, file, used + 4));
    EXPECT_EQ(page.size(), used);

    auto entries = decodeDirectoryEntries(page, "/x");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].path, "/x/a.db");
    EXPECT_EQ(entries[0].size, 4096u);
    EXPECT_EQ(entries[1].kind, EntryKind::Directory);
    EXPECT_EQ(entries[1].name, "sub");
}
