#include <gtest/gtest.h>

#include <future>
#include <thread>

#include "Concurrency/AsyncProxy.h"
#include "Concurrency/ProxyClient.h"
#include "TestHelpers/StorageTestHelpers.h"

using namespace OriginVault::Core::Concurrency;
using namespace OriginVault::Core::IO;
using namespace std::chrono_literals;
using originvault::test_helpers::bytesOf;
using originvault::test_helpers::ScopedEnvVar;
using originvault::test_helpers::ScopedProxyEnv;
using originvault::test_helpers::stringOf;

TEST(AsyncProxy, OpenWriteReadCloseRoundTrip) {
    ScopedProxyEnv env;
    ProxyClient client(env.proxy(), 5000ms);
    const int32_t fd = client.allocateDescriptor();

    auto opened = client.open(fd, "/data/a.db", OpenFlags::Create);
    ASSERT_TRUE(opened.ok()) << opened.error.message;
    EXPECT_EQ(opened.value, 0);

    auto data = bytesOf("0123456789");
    auto written = client.write(fd, data, 0);
    ASSERT_TRUE(written.ok()) << written.error.message;
    EXPECT_EQ(written.value, 10);

    std::vector<std::byte> out(4);
    auto read = client.read(fd, out, 3);
    ASSERT_TRUE(read.ok());
    EXPECT_EQ(read.value, 4);
    EXPECT_EQ(stringOf(out), "3456");

    ASSERT_TRUE(client.truncate(fd, 5).ok());
    EXPECT_EQ(client.fileSize(fd).value, 5);
    EXPECT_TRUE(client.sync(fd).ok());
    EXPECT_TRUE(client.close(fd).ok());

    EXPECT_TRUE(std::filesystem::exists(env.tmp().path() / "origin" / "data" / "a.db"));
}

TEST(AsyncProxy, LargeTransfersAreSplitAcrossSlots) {
    AsyncProxy::Config cfg;
    cfg.slotPayloadBytes = 1024;
    ScopedProxyEnv env(cfg);
    ProxyClient client(env.proxy(), 5000ms);
    const int32_t fd = client.allocateDescriptor();
    ASSERT_TRUE(client.open(fd, "/big.bin", OpenFlags::Create).ok());

    std::vector<std::byte> data(10000);
    for (size_t i = 0; i < data.size(); ++i) data[i] = static_cast<std::byte>(i % 251);
    auto w = client.write(fd, data, 0);
    ASSERT_TRUE(w.ok());
    EXPECT_EQ(w.value, 10000);

    std::vector<std::byte> out(12000);
    auto r = client.read(fd, out, 0);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value, 10000) << "short only at end of file";
    EXPECT_TRUE(std::equal(data.begin(), data.end(), out.begin()));
    EXPECT_TRUE(client.close(fd).ok());
}

TEST(AsyncProxy, UnknownDescriptorIsMisuse) {
    ScopedProxyEnv env;
    ProxyClient client(env.proxy(), 5000ms);
    std::vector<std::byte> out(8);
    EXPECT_EQ(client.read(12345, out, 0).code(), StorageError::Misuse);
    EXPECT_EQ(client.close(12345).code(), StorageError::Misuse);
}

TEST(AsyncProxy, OpenMissingWithoutCreateFails) {
    ScopedProxyEnv env;
    ProxyClient client(env.proxy(), 5000ms);
    const int32_t fd = client.allocateDescriptor();
    EXPECT_EQ(client.open(fd, "/nope.db", 0).code(), StorageError::NotFound);
    // The failed open leaves the descriptor closed, so it can be reused
    EXPECT_TRUE(client.open(fd, "/nope.db", OpenFlags::Create).ok());
    EXPECT_TRUE(client.close(fd).ok());
}

TEST(AsyncProxy, ReadOnlyDescriptorRejectsWrites) {
    ScopedProxyEnv env;
    ProxyClient client(env.proxy(), 5000ms);
    const int32_t a = client.allocateDescriptor();
    ASSERT_TRUE(client.open(a, "/ro.db", OpenFlags::Create).ok());
    ASSERT_TRUE(client.close(a).ok());

    const int32_t b = client.allocateDescriptor();
    ASSERT_TRUE(client.open(b, "/ro.db", OpenFlags::ReadOnly).ok());
    EXPECT_EQ(client.write(b, bytesOf("x"), 0).code(), StorageError::ReadOnly);
    EXPECT_TRUE(client.close(b).ok());
}

TEST(AsyncProxy, DescriptorsOnSamePathShareOneHandle) {
    ScopedProxyEnv env;
    ProxyClient client(env.proxy(), 5000ms);
    const int32_t a = client.allocateDescriptor();
    const int32_t b = client.allocateDescriptor();
    ASSERT_TRUE(client.open(a, "/shared.db", OpenFlags::Create).ok());
    ASSERT_TRUE(client.open(b, "/shared.db", OpenFlags::Create).ok());

    ASSERT_TRUE(client.write(a, bytesOf("from-a"), 0).ok());
    std::vector<std::byte> out(6);
    ASSERT_TRUE(client.read(b, out, 0).ok());
    EXPECT_EQ(stringOf(out), "from-a");

    EXPECT_EQ(client.remove("/shared.db").code(), StorageError::Busy);
    ASSERT_TRUE(client.close(a).ok());
    EXPECT_EQ(client.fileSize(b).value, 6) << "the other descriptor keeps the handle alive";
    ASSERT_TRUE(client.close(b).ok());

    auto removed = client.remove("/shared.db");
    ASSERT_TRUE(removed.ok());
    EXPECT_EQ(removed.value, 1);
    EXPECT_EQ(client.remove("/shared.db").value, 0);
}

TEST(AsyncProxy, DeleteOnCloseRemovesFileWithLastDescriptor) {
    ScopedProxyEnv env;
    ProxyClient client(env.proxy(), 5000ms);
    const int32_t fd = client.allocateDescriptor();
    ASSERT_TRUE(client.open(fd, "/scratch.tmp", OpenFlags::Create | OpenFlags::DeleteOnClose).ok());
    ASSERT_TRUE(client.write(fd, bytesOf("tmp"), 0).ok());
    ASSERT_TRUE(client.close(fd).ok());
    EXPECT_FALSE(std::filesystem::exists(env.tmp().path() / "origin" / "scratch.tmp"));
}

TEST(AsyncProxy, DeleteBeforeOpenStartsEmpty) {
    ScopedProxyEnv env;
    ProxyClient client(env.proxy(), 5000ms);
    const int32_t a = client.allocateDescriptor();
    ASSERT_TRUE(client.open(a, "/fresh.db", OpenFlags::Create).ok());
    ASSERT_TRUE(client.write(a, bytesOf("old contents"), 0).ok());
    ASSERT_TRUE(client.close(a).ok());

    const int32_t b = client.allocateDescriptor();
    auto opened = client.open(b, "/fresh.db", OpenFlags::Create | OpenFlags::DeleteBeforeOpen);
    ASSERT_TRUE(opened.ok());
    EXPECT_EQ(opened.value, 0);
    ASSERT_TRUE(client.close(b).ok());
}

TEST(AsyncProxy, TimeoutLeavesDescriptorUsable) {
    ScopedEnvVar delay("ORIGINVAULT_TEST_PROXY_DELAY_MS", "150");
    ScopedProxyEnv env;
    ProxyClient client(env.proxy(), 5000ms);
    const int32_t fd = client.allocateDescriptor();
    ASSERT_TRUE(client.open(fd, "/slow.db", OpenFlags::Create).ok());

    client.setTimeout(20ms);
    auto timedOut = client.write(fd, bytesOf("late"), 0);
    EXPECT_EQ(timedOut.code(), StorageError::IOTimeout);

    client.setTimeout(5000ms);
    std::vector<std::byte> out(4);
    auto read = client.read(fd, out, 0);
    ASSERT_TRUE(read.ok()) << read.error.message;
    // ApplyLate: the abandoned write still landed before the read ran
    EXPECT_EQ(stringOf(out), "late");
    EXPECT_TRUE(client.close(fd).ok());
    EXPECT_GE(env.proxy().stats().lateResults, 1u);
}

TEST(AsyncProxy, SuppressIfAbandonedSkipsQueuedCommands) {
    ScopedEnvVar delay("ORIGINVAULT_TEST_PROXY_DELAY_MS", "150");
    AsyncProxy::Config cfg;
    cfg.lateResultPolicy = AsyncProxy::Config::LateResultPolicy::SuppressIfAbandoned;
    ScopedProxyEnv env(cfg);
    ProxyClient client(env.proxy(), 5000ms);
    const int32_t fd = client.allocateDescriptor();
    ASSERT_TRUE(client.open(fd, "/suppress.db", OpenFlags::Create).ok());

    client.setTimeout(20ms);
    // The first write is already executing when it times out; the second is still queued
    EXPECT_EQ(client.write(fd, bytesOf("AAAA"), 0).code(), StorageError::IOTimeout);
    EXPECT_EQ(client.write(fd, bytesOf("BBBB"), 4).code(), StorageError::IOTimeout);

    client.setTimeout(5000ms);
    std::vector<std::byte> out(8);
    auto read = client.read(fd, out, 0);
    ASSERT_TRUE(read.ok());
    EXPECT_EQ(read.value, 4);
    EXPECT_EQ(stringOf(std::span<const std::byte>(out.data(), 4)), "AAAA");
    EXPECT_GE(env.proxy().stats().suppressed, 1u);
    EXPECT_TRUE(client.close(fd).ok());
}

TEST(AsyncProxy, RejectBackpressureAnswersBusy) {
    ScopedEnvVar delay("ORIGINVAULT_TEST_PROXY_DELAY_MS", "150");
    AsyncProxy::Config cfg;
    cfg.backpressure = AsyncProxy::Config::Backpressure::Reject;
    ScopedProxyEnv env(cfg);
    ProxyClient client(env.proxy(), 5000ms);
    const int32_t fd = client.allocateDescriptor();
    ASSERT_TRUE(client.open(fd, "/reject.db", OpenFlags::Create).ok());

    auto slowWrite = std::async(std::launch::async, [&] { return client.write(fd, bytesOf("x"), 0); });
    std::this_thread::sleep_for(40ms);
    auto rejected = client.sync(fd);
    EXPECT_EQ(rejected.code(), StorageError::Busy);

    EXPECT_TRUE(slowWrite.get().ok());
    EXPECT_GE(env.proxy().stats().rejected, 1u);
    EXPECT_TRUE(client.sync(fd).ok()) << "an idle descriptor accepts commands again";
    EXPECT_TRUE(client.close(fd).ok());
}

TEST(AsyncProxy, TimedOutOpenIsClosedUnderRejectBackpressure) {
    ScopedEnvVar delay("ORIGINVAULT_TEST_PROXY_DELAY_MS", "150");
    AsyncProxy::Config cfg;
    cfg.backpressure = AsyncProxy::Config::Backpressure::Reject;
    ScopedProxyEnv env(cfg);
    ProxyClient hasty(env.proxy(), 20ms);
    const int32_t fd = hasty.allocateDescriptor();
    EXPECT_EQ(hasty.open(fd, "/abandoned.db", OpenFlags::Create).code(), StorageError::IOTimeout);

    // Open and the follow-up close both run; the handle must not outlive them
    std::this_thread::sleep_for(600ms);
    ProxyClient client(env.proxy(), 5000ms);
    EXPECT_EQ(client.fileSize(fd).code(), StorageError::Misuse);
    auto removed = client.remove("/abandoned.db");
    ASSERT_TRUE(removed.ok()) << removed.error.message;
    EXPECT_EQ(removed.value, 1);
}

TEST(AsyncProxy, QueueBackpressurePreservesOrder) {
    ScopedEnvVar delay("ORIGINVAULT_TEST_PROXY_DELAY_MS", "50");
    ScopedProxyEnv env;
    ProxyClient client(env.proxy(), 5000ms);
    const int32_t fd = client.allocateDescriptor();
    ASSERT_TRUE(client.open(fd, "/ordered.db", OpenFlags::Create).ok());

    auto first = std::async(std::launch::async, [&] { return client.write(fd, bytesOf("1111"), 0); });
    std::this_thread::sleep_for(15ms);
    auto second = std::async(std::launch::async, [&] { return client.write(fd, bytesOf("22"), 0); });
    ASSERT_TRUE(first.get().ok());
    ASSERT_TRUE(second.get().ok());

    std::vector<std::byte> out(4);
    ASSERT_TRUE(client.read(fd, out, 0).ok());
    EXPECT_EQ(stringOf(out), "2211");
    EXPECT_TRUE(client.close(fd).ok());
}

TEST(AsyncProxy, ShutdownDrainsAndRestartResumesDescriptors) {
    ScopedProxyEnv env;
    ProxyClient client(env.proxy(), 5000ms);
    const int32_t fd = client.allocateDescriptor();
    ASSERT_TRUE(client.open(fd, "/restart.db", OpenFlags::Create).ok());
    ASSERT_TRUE(client.write(fd, bytesOf("kept"), 0).ok());

    env.proxy().asyncShutdown();
    EXPECT_FALSE(env.proxy().isRunning());
    std::vector<std::byte> out(4);
    EXPECT_EQ(client.read(fd, out, 0).code(), StorageError::IOError);
    EXPECT_FALSE(env.proxy().post(encodeCommand(CommandMessage{})));

    env.proxy().asyncRestart();
    EXPECT_TRUE(env.proxy().isRunning());
    auto read = client.read(fd, out, 0);
    ASSERT_TRUE(read.ok()) << read.error.message;
    EXPECT_EQ(stringOf(out), "kept");
    EXPECT_TRUE(client.close(fd).ok());
}

TEST(AsyncProxy, DirectoryIsBoundToIoThread) {
    ScopedProxyEnv env;
    try {
        env.proxy().directory().entryExists("/");
        FAIL() << "driving thread must not touch the storage root";
    } catch (const StorageException& e) {
        EXPECT_EQ(e.code(), StorageError::WrongContext);
    }
}
