#include <gtest/gtest.h>
#include <QThreadPool>

#include "fakes.hpp"
#include "refreshOrchestrator.hpp"

using namespace testing_fakes;

namespace {

class RefreshOrchestratorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    pool.setMaxThreadCount(4);
    orch = std::make_unique<RefreshOrchestrator>(provider, registryWith(fake), stores, &pool);
    QObject::connect(orch.get(), &RefreshOrchestrator::refreshStarted, orch.get(),
                     [this] { refreshStarted.fetch_add(1); }, Qt::DirectConnection);
    QObject::connect(orch.get(), &RefreshOrchestrator::refreshBusy, orch.get(),
                     [this] { refreshBusy.fetch_add(1); }, Qt::DirectConnection);
    QObject::connect(orch.get(), &RefreshOrchestrator::statusCheckStarted, orch.get(),
                     [this] { statusStarted.fetch_add(1); }, Qt::DirectConnection);
    QObject::connect(orch.get(), &RefreshOrchestrator::statusCheckBusy, orch.get(),
                     [this] { statusBusy.fetch_add(1); }, Qt::DirectConnection);
    rec.attach(orch.get());
    status.attach(orch.get());
  }

  void TearDown() override {
    if (gate) gate->release(100);
    orch.reset();
    pool.waitForDone();
  }

  QThreadPool pool;
  ListProvider provider;
  std::shared_ptr<FakeCollector> fake = std::make_shared<FakeCollector>();
  std::shared_ptr<FakeHealthStoreFactory> stores = std::make_shared<FakeHealthStoreFactory>();
  std::unique_ptr<RefreshOrchestrator> orch;
  std::unique_ptr<QSemaphore> gate;

  std::atomic_int refreshStarted{0};
  std::atomic_int refreshBusy{0};
  std::atomic_int statusStarted{0};
  std::atomic_int statusBusy{0};
  RefreshRecorder rec;
  StatusRecorder status;
};

}  // namespace

TEST_F(RefreshOrchestratorTest, SecondRefreshWhileRunningIsBusy) {
  gate = std::make_unique<QSemaphore>();
  fake->gate = gate.get();
  provider.list = makeSources(3);

  EXPECT_TRUE(orch->refreshAll());
  EXPECT_TRUE(orch->isRefreshing());
  EXPECT_FALSE(orch->refreshAll());
  EXPECT_FALSE(orch->refreshSources(makeSources(1)));

  EXPECT_EQ(refreshStarted.load(), 1);
  EXPECT_EQ(refreshBusy.load(), 2);

  gate->release(3);
  ASSERT_TRUE(orch->waitForRefresh(5000));
  EXPECT_FALSE(orch->isRefreshing());
  EXPECT_EQ(rec.completedCount(), 1);
  EXPECT_TRUE(rec.success);

  // после завершения можно запускать снова
  EXPECT_TRUE(orch->refreshAll());
  gate->release(3);
  ASSERT_TRUE(orch->waitForRefresh(5000));
  EXPECT_EQ(refreshStarted.load(), 2);
}

TEST_F(RefreshOrchestratorTest, StatusCheckRunsAlongsideRefresh) {
  gate = std::make_unique<QSemaphore>();
  fake->gate = gate.get();
  provider.list = makeSources(2);

  ASSERT_TRUE(orch->refreshAll());
  EXPECT_TRUE(orch->checkAllStatuses());
  EXPECT_FALSE(orch->checkAllStatuses());
  EXPECT_EQ(statusBusy.load(), 1);

  // проверка статусов не ждёт застрявшего обновления
  ASSERT_TRUE(orch->waitForStatusCheck(5000));
  EXPECT_TRUE(orch->isRefreshing());
  EXPECT_EQ(status.finished, 1);
  EXPECT_EQ(status.all.size(), 2);

  gate->release(2);
  ASSERT_TRUE(orch->waitForRefresh(5000));
  EXPECT_EQ(statusStarted.load(), 1);
}

TEST_F(RefreshOrchestratorTest, NoEnabledSourcesCompletesImmediately) {
  provider.list = makeSources(2);
  provider.list[0].enabled = false;
  provider.list[1].enabled = false;

  EXPECT_TRUE(orch->refreshAll());
  EXPECT_FALSE(orch->isRefreshing());
  EXPECT_EQ(refreshStarted.load(), 1);
  EXPECT_EQ(rec.completedCount(), 1);
  EXPECT_TRUE(rec.success);
  EXPECT_EQ(rec.message, "No enabled sources to refresh.");
  EXPECT_EQ(fake->collectCalls.load(), 0);
  EXPECT_EQ(pool.activeThreadCount(), 0);
}

TEST_F(RefreshOrchestratorTest, EmptyStatusCheckFinishesImmediately) {
  EXPECT_TRUE(orch->checkAllStatuses());
  EXPECT_FALSE(orch->isCheckingStatus());
  EXPECT_EQ(status.allCount, 1);
  EXPECT_TRUE(status.all.isEmpty());
  EXPECT_EQ(status.finished, 1);
  EXPECT_EQ(stores->opens.load(), 0);
}

TEST_F(RefreshOrchestratorTest, ExplicitListDropsDisabledSources) {
  QList<NewsSource> sources = makeSources(3);
  sources[1].enabled = false;

  ASSERT_TRUE(orch->refreshSources(sources));
  ASSERT_TRUE(orch->waitForRefresh(5000));

  EXPECT_EQ(rec.refreshed.size(), 2);
  EXPECT_FALSE(rec.refreshed.contains("src1"));
  EXPECT_EQ(rec.lastTotal, 2);
}

TEST_F(RefreshOrchestratorTest, CancelWhileIdleIsIgnored) {
  provider.list = makeSources(2);
  orch->cancelRefresh();
  orch->cancelStatusCheck();

  ASSERT_TRUE(orch->refreshAll());
  ASSERT_TRUE(orch->waitForRefresh(5000));
  EXPECT_TRUE(rec.success);
  EXPECT_EQ(fake->collectCalls.load(), 2);
}

TEST_F(RefreshOrchestratorTest, CancelRefreshReportsCancellation) {
  fake->spinUntilCancelled = true;
  provider.list = makeSources(3);

  ASSERT_TRUE(orch->refreshAll());
  ASSERT_TRUE(fake->started.tryAcquire(1, 5000));
  orch->cancelRefresh();
  ASSERT_TRUE(orch->waitForRefresh(5000));

  EXPECT_TRUE(fake->sawCancel.load());
  EXPECT_EQ(rec.refreshed.size() + rec.errors.size(), 3);
  EXPECT_FALSE(rec.success);
  EXPECT_TRUE(rec.message.contains("cancelled by user"));

  // следующий раунд начинается с чистым флагом
  fake->spinUntilCancelled = false;
  rec.refreshed.clear();
  ASSERT_TRUE(orch->refreshAll());
  ASSERT_TRUE(orch->waitForRefresh(5000));
  EXPECT_TRUE(rec.success);
}

TEST_F(RefreshOrchestratorTest, MaxWorkersIsClamped) {
  orch->setMaxWorkers(100);
  EXPECT_EQ(orch->maxWorkers(), kMaxRoundWorkers);
  orch->setMaxWorkers(0);
  EXPECT_EQ(orch->maxWorkers(), 1);
  orch->setMaxWorkers(3);
  EXPECT_EQ(orch->maxWorkers(), 3);
}

TEST_F(RefreshOrchestratorTest, DestructorCancelsAndWaits) {
  fake->spinUntilCancelled = true;
  provider.list = makeSources(2);

  ASSERT_TRUE(orch->refreshAll());
  ASSERT_TRUE(fake->started.tryAcquire(1, 5000));
  orch.reset();

  EXPECT_TRUE(fake->sawCancel.load());
  EXPECT_EQ(rec.completedCount(), 1);
}

TEST(RefreshOrchestratorInstances, GuardsAreIndependentPerInstance) {
  QSemaphore gate;
  auto fake = std::make_shared<FakeCollector>();
  fake->gate = &gate;
  auto stores = std::make_shared<FakeHealthStoreFactory>();
  ListProvider provider;
  provider.list = makeSources(1);

  QThreadPool pool;
  RefreshOrchestrator a(provider, registryWith(fake), stores, &pool);
  RefreshOrchestrator b(provider, registryWith(fake), stores, &pool);

  EXPECT_TRUE(a.refreshAll());
  EXPECT_TRUE(b.refreshAll());

  gate.release(2);
  EXPECT_TRUE(a.waitForRefresh(5000));
  EXPECT_TRUE(b.waitForRefresh(5000));
}

TEST(RefreshOrchestratorInstances, DefaultPoolChecksStatusBesideBlockedRefresh) {
  // одноядерная машина: глобальный пул из одного потока
  QThreadPool* global = QThreadPool::globalInstance();
  const int prevMax = global->maxThreadCount();
  global->setMaxThreadCount(1);

  QSemaphore gate;
  auto fake = std::make_shared<FakeCollector>();
  fake->gate = &gate;
  auto stores = std::make_shared<FakeHealthStoreFactory>();
  ListProvider provider;
  provider.list = makeSources(2);

  {
    RefreshOrchestrator orch(provider, registryWith(fake), stores);
    StatusRecorder status;
    status.attach(&orch);

    EXPECT_TRUE(orch.refreshAll());
    EXPECT_TRUE(fake->started.tryAcquire(1, 5000));
    EXPECT_TRUE(orch.checkAllStatuses());

    EXPECT_TRUE(orch.waitForStatusCheck(5000));
    EXPECT_TRUE(orch.isRefreshing());
    EXPECT_EQ(status.finished, 1);
    EXPECT_EQ(status.all.size(), 2);

    gate.release(2);
    EXPECT_TRUE(orch.waitForRefresh(5000));
  }

  global->setMaxThreadCount(prevMax);
}
