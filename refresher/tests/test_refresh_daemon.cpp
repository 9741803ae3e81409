#include <gtest/gtest.h>
#include <QTemporaryDir>

#include "collectorRegistry.hpp"
#include "databaseManager.hpp"
#include "fakes.hpp"
#include "refreshDaemon.hpp"
#include "refreshOrchestrator.hpp"
#include "sourceManager.hpp"

using namespace testing_fakes;

namespace {

class RefreshDaemonTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(dir.isValid());
    config.db_path = dir.filePath("daemon.db");
    config.lazy_time = 0;
    config.status_check_interval = 0;
    config.default_sources = {makeSource("alpha"), makeSource("beta"), makeSource("gamma")};
    config.default_sources[2].type = "unknown";
  }

  QTemporaryDir dir;
  Config config;
  std::shared_ptr<FakeCollector> fake = std::make_shared<FakeCollector>();
};

}  // namespace

TEST_F(RefreshDaemonTest, StartRefreshesAndStoresArticles) {
  fake->itemsFor["alpha"] = 4;
  fake->itemsFor["beta"] = 2;

  RefreshDaemon daemon(config, registryWith(fake));
  bool completed = false;
  QObject::connect(&daemon.orchestrator(), &RefreshOrchestrator::refreshCompleted, &daemon,
                   [&](bool, const QString&) { completed = true; });

  ASSERT_TRUE(daemon.start());
  EXPECT_EQ(daemon.sourceManager().sources().size(), 3);

  ASSERT_TRUE(daemon.orchestrator().waitForRefresh(5000));
  ASSERT_TRUE(waitUntil([&] { return completed; }));

  EXPECT_EQ(daemon.database().articleCount(), 6);
}

TEST_F(RefreshDaemonTest, StatusCheckUpdatesCacheAndDatabase) {
  RefreshDaemon daemon(config, registryWith(fake));
  ASSERT_TRUE(daemon.start());
  ASSERT_TRUE(daemon.orchestrator().waitForRefresh(5000));

  int finished = 0;
  QObject::connect(&daemon.orchestrator(), &RefreshOrchestrator::statusCheckFinished, &daemon,
                   [&] { ++finished; });

  ASSERT_TRUE(daemon.orchestrator().checkAllStatuses());
  ASSERT_TRUE(daemon.orchestrator().waitForStatusCheck(5000));
  ASSERT_TRUE(waitUntil([&] { return finished == 1; }));

  EXPECT_EQ(daemon.sourceManager().sourceByName("alpha")->status, SourceStatus::Ok);
  EXPECT_EQ(daemon.sourceManager().sourceByName("gamma")->status, SourceStatus::Error);
  EXPECT_EQ(daemon.sourceManager().sourceByName("gamma")->consecutiveErrorCount, 1);

  EXPECT_EQ(daemon.database().getSourceByName("alpha")->status, SourceStatus::Ok);
  EXPECT_EQ(daemon.database().getSourceByName("gamma")->status, SourceStatus::Error);
}

TEST_F(RefreshDaemonTest, StopCancelsRunningRound) {
  fake->spinUntilCancelled = true;

  RefreshDaemon daemon(config, registryWith(fake));
  ASSERT_TRUE(daemon.start());
  ASSERT_TRUE(fake->started.tryAcquire(1, 5000));

  daemon.stop();
  EXPECT_FALSE(daemon.orchestrator().isRefreshing());
  EXPECT_TRUE(fake->sawCancel.load());
}

TEST_F(RefreshDaemonTest, DefaultRegistryServesRss) {
  auto registry = RefreshDaemon::defaultRegistry(config);
  EXPECT_TRUE(registry->contains("rss"));
  auto collector = registry->resolve("RSS");
  ASSERT_NE(collector, nullptr);
  EXPECT_EQ(collector->type(), "rss");
}
