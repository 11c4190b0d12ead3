#include <gtest/gtest.h>

#include "Logging/Logger.h"
#include "TestHelpers/StorageTestHelpers.h"

using namespace OriginVault::Core::Logging;
using originvault::test_helpers::CapturingSink;

TEST(Logger, ParseLogLevel_AcceptsNamesCaseInsensitively) {
    EXPECT_EQ(parseLogLevel("TRACE"), LogLevel::Trace);
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("Warn"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("fatal"), LogLevel::Fatal);
    EXPECT_FALSE(parseLogLevel("loud").has_value());
}

TEST(Logger, MinLevelFiltersBeforeSinks) {
    Logger logger;
    auto sink = std::make_shared<CapturingSink>();
    logger.addSink(sink);
    logger.setMinLevel(LogLevel::Warning);

    logger.info("Test", "dropped");
    logger.warning("Test", "kept");
    logger.error("Test", "also kept");

    auto entries = sink->entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].message, "kept");
    EXPECT_EQ(entries[0].category, "Test");
    EXPECT_EQ(entries[1].level, LogLevel::Error);
}

TEST(Logger, PerSinkLevelAppliesAfterGlobalLevel) {
    Logger logger;
    logger.setMinLevel(LogLevel::Trace);
    auto verbose = std::make_shared<CapturingSink>();
    auto quiet = std::make_shared<CapturingSink>();
    quiet->setMinLevel(LogLevel::Error);
    logger.addSink(verbose);
    logger.addSink(quiet);

    logger.debug("Test", "detail");
    logger.error("Test", "failure");

    EXPECT_EQ(verbose->entries().size(), 2u);
    ASSERT_EQ(quiet->entries().size(), 1u);
    EXPECT_EQ(quiet->entries()[0].message, "failure");
}

TEST(Logger, RemovedSinkStopsReceiving) {
    Logger logger;
    auto sink = std::make_shared<CapturingSink>();
    logger.addSink(sink);
    logger.info("Test", "one");
    EXPECT_TRUE(logger.removeSink(sink));
    EXPECT_FALSE(logger.removeSink(sink));
    logger.info("Test", "two");
    EXPECT_EQ(sink->entries().size(), 1u);
}
