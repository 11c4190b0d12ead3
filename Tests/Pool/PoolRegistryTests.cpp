#include <gtest/gtest.h>

#include <fstream>
#include <thread>

#include "Pool/PoolRegistry.h"
#include "TestHelpers/StorageTestHelpers.h"

using namespace OriginVault::Core;
using namespace OriginVault::Core::IO;
using namespace OriginVault::Core::Pool;
using originvault::test_helpers::ScopedTempDir;

namespace {

HandlePool::Config registryConfig(const std::filesystem::path& root, const std::string& name) {
    HandlePool::Config cfg;
    cfg.name = name;
    cfg.root = root;
    cfg.initialCapacity = 2;
    return cfg;
}

}

TEST(PoolRegistry, ConcurrentInstallsShareOneInstance) {
    ScopedTempDir tmp;
    auto cfg = registryConfig(tmp.path(), "registry-shared");

    std::shared_ptr<HandlePool> a;
    std::shared_ptr<HandlePool> b;
    std::thread t1([&] { a = PoolRegistry::global().install(cfg); });
    std::thread t2([&] { b = PoolRegistry::global().install(cfg); });
    t1.join();
    t2.join();

    ASSERT_TRUE(a);
    EXPECT_EQ(a.get(), b.get());
    EXPECT_EQ(PoolRegistry::global().find("registry-shared"), a);

    a->addCapacity(3);
    EXPECT_EQ(b->getCapacity(), 5u);

    EXPECT_TRUE(a->removeVfs());
    EXPECT_EQ(PoolRegistry::global().find("registry-shared"), nullptr);
}

TEST(PoolRegistry, FailedInstallIsCachedUntilForced) {
    ScopedTempDir tmp;
    const auto root = tmp.join("not-a-directory");
    { std::ofstream(root) << "occupied"; }

    auto cfg = registryConfig(root, "registry-failing");
    const StorageException* first = nullptr;
    try {
        PoolRegistry::global().install(cfg);
        FAIL() << "expected CantOpen";
    } catch (const StorageException& e) {
        EXPECT_EQ(e.code(), StorageError::CantOpen);
        first = &e;
    }

    try {
        PoolRegistry::global().install(cfg);
        FAIL() << "expected the cached failure";
    } catch (const StorageException& e) {
        EXPECT_EQ(e.code(), StorageError::CantOpen);
        EXPECT_EQ(&e, first) << "the same exception object is rethrown";
    }
    EXPECT_EQ(PoolRegistry::global().find("registry-failing"), nullptr);

    // Fixing the root alone is not enough without forcing a retry
    std::filesystem::remove(root);
    EXPECT_THROW(PoolRegistry::global().install(cfg), StorageException);

    cfg.forceReinitIfPreviouslyFailed = true;
    auto pool = PoolRegistry::global().install(cfg);
    ASSERT_TRUE(pool);
    EXPECT_EQ(pool->getCapacity(), 2u);
    EXPECT_EQ(PoolRegistry::global().find("registry-failing"), pool);
    pool->removeVfs();
}

TEST(PoolRegistry, ForgetDropsEntryWithoutTouchingPool) {
    ScopedTempDir tmp;
    auto cfg = registryConfig(tmp.path(), "registry-forget");
    auto pool = PoolRegistry::global().install(cfg);
    PoolRegistry::global().forget("registry-forget");
    EXPECT_EQ(PoolRegistry::global().find("registry-forget"), nullptr);
    EXPECT_FALSE(pool->isRemoved());
    pool->removeVfs();
}
