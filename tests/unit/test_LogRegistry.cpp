#include <gtest/gtest.h>
#include "log/Registry.hpp"
#include "config/Config.hpp"
#include "concurrency/TaskQueue.hpp"
#include "storage/SessionStore.hpp"
#include "support/Fakes.hpp"

#include <atomic>
#include <fstream>

using namespace rh;
using namespace rh::log;

// Runs library code with the registry torn down, the way a host that never
// calls Registry::init() would.
class UninitializedRegistryTest : public ::testing::Test {
protected:
    void SetUp() override { Registry::shutdown(); }

    void TearDown() override {
        config::LoggingConfig logging;
        logging.console_log_level = spdlog::level::warn;
        Registry::init(logging);
    }
};

TEST_F(UninitializedRegistryTest, GetFallsBackToDefaultLogger) {
    ASSERT_FALSE(Registry::isInitialized());
    const auto logger = Registry::store();
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger, spdlog::default_logger());
    EXPECT_NO_THROW(logger->warn("[UninitializedRegistryTest] logging without init"));
}

TEST_F(UninitializedRegistryTest, FailingTaskIsContained) {
    std::atomic<bool> ranAfter{false};
    {
        concurrency::TaskQueue q("uninitialized-registry");
        q.enqueue([] { throw std::runtime_error("boom"); }, "failing");
        q.enqueue([&] { ranAfter = true; }, "after");
        q.waitIdle();
    }
    EXPECT_TRUE(ranAfter.load());
}

TEST_F(UninitializedRegistryTest, StoreFailsClosed) {
    test::TempDir tmp;
    config::StoreConfig cfg;
    cfg.directory = tmp.path();
    storage::SessionStore store(cfg);
    const types::SessionIdentity id{types::SessionKind::User, "qa@example.com", ""};

    EXPECT_FALSE(store.isValid(id));

    store.save(id, "snapshot");
    std::ofstream(store.record(id).metadataPath, std::ios::trunc) << "{ broken";
    EXPECT_FALSE(store.isValid(id));
    EXPECT_NO_THROW(store.cleanup(id));
    EXPECT_FALSE(std::filesystem::exists(store.record(id).snapshotPath));
}

TEST_F(UninitializedRegistryTest, InitAfterShutdownRestoresSubsystemLoggers) {
    config::LoggingConfig logging;
    logging.console_log_level = spdlog::level::warn;
    Registry::init(logging);

    EXPECT_TRUE(Registry::isInitialized());
    EXPECT_EQ(Registry::monitor()->name(), "monitor");

    Registry::shutdown();
}
