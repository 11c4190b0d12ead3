#include <gtest/gtest.h>

#include <thread>

#include "Concurrency/SharedResultBuffer.h"
#include "TestHelpers/StorageTestHelpers.h"

using namespace OriginVault::Core::Concurrency;
using namespace OriginVault::Core::IO;
using namespace std::chrono_literals;
using originvault::test_helpers::bytesOf;
using originvault::test_helpers::stringOf;

namespace {
auto in(std::chrono::milliseconds ms) {
    return std::chrono::steady_clock::now() + ms;
}
}

TEST(SharedResultBuffer, PublishWakesWaiter) {
    SharedResultBuffer buffer(2, 64);
    auto slot = buffer.claim(42, in(100ms));
    ASSERT_TRUE(slot.has_value());
    EXPECT_EQ(buffer.freeCount(), 1u);

    std::thread producer([&] {
        std::this_thread::sleep_for(10ms);
        CommandResult r;
        r.value = 5;
        r.payload = bytesOf("hello");
        EXPECT_TRUE(buffer.publish(*slot, 42, r));
    });
    auto result = buffer.wait(*slot, 42, in(2000ms));
    producer.join();

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value, 5);
    EXPECT_EQ(stringOf(result.payload), "hello");
    EXPECT_EQ(buffer.freeCount(), 2u);
}

TEST(SharedResultBuffer, ErrorCodeAndMessageSurvive) {
    SharedResultBuffer buffer(1, 16);
    auto slot = buffer.claim(1, in(100ms));
    ASSERT_TRUE(slot);
    EXPECT_TRUE(buffer.publish(*slot, 1, CommandResult::failure(StorageError::Busy, "locked")));
    auto result = buffer.wait(*slot, 1, in(100ms));
    EXPECT_EQ(result.code(), StorageError::Busy);
    EXPECT_EQ(result.error.message, "locked");
}

TEST(SharedResultBuffer, OversizedPayloadIsTruncated) {
    SharedResultBuffer buffer(1, 4);
    auto slot = buffer.claim(9, in(100ms));
    ASSERT_TRUE(slot);
    CommandResult r;
    r.payload = bytesOf("abcdefgh");
    buffer.publish(*slot, 9, r);
    EXPECT_EQ(stringOf(buffer.wait(*slot, 9, in(100ms)).payload), "abcd");
}

TEST(SharedResultBuffer, TimeoutAbandonsSlotUntilLatePublish) {
    SharedResultBuffer buffer(1, 16);
    auto slot = buffer.claim(7, in(100ms));
    ASSERT_TRUE(slot);

    auto result = buffer.wait(*slot, 7, in(10ms));
    EXPECT_EQ(result.code(), StorageError::IOTimeout);
    EXPECT_TRUE(buffer.isAbandoned(*slot, 7));
    EXPECT_EQ(buffer.freeCount(), 0u);

    // The late result is dropped and the slot becomes reusable
    EXPECT_FALSE(buffer.publish(*slot, 7, CommandResult{}));
    EXPECT_EQ(buffer.freeCount(), 1u);
    EXPECT_FALSE(buffer.isAbandoned(*slot, 7));
}

TEST(SharedResultBuffer, DiscardFreesOnlyAbandonedSlots) {
    SharedResultBuffer buffer(1, 16);
    auto slot = buffer.claim(3, in(100ms));
    ASSERT_TRUE(slot);
    EXPECT_FALSE(buffer.discard(*slot, 3)) << "a live waiter is not discarded";
    (void)buffer.wait(*slot, 3, in(1ms));
    EXPECT_TRUE(buffer.discard(*slot, 3));
    EXPECT_EQ(buffer.freeCount(), 1u);
}

TEST(SharedResultBuffer, ClaimTimesOutWhenAllSlotsBusy) {
    SharedResultBuffer buffer(1, 16);
    auto first = buffer.claim(1, in(100ms));
    ASSERT_TRUE(first);
    EXPECT_FALSE(buffer.claim(2, in(20ms)).has_value());
    buffer.cancel(*first, 1);
    EXPECT_TRUE(buffer.claim(2, in(20ms)).has_value());
}

TEST(SharedResultBuffer, WrongRequestIdIsRejected) {
    SharedResultBuffer buffer(1, 16);
    auto slot = buffer.claim(10, in(100ms));
    ASSERT_TRUE(slot);
    EXPECT_FALSE(buffer.publish(*slot, 11, CommandResult{}));
    EXPECT_EQ(buffer.wait(*slot, 11, in(5ms)).code(), StorageError::Misuse);
}
