#include <gtest/gtest.h>
#include <QTemporaryDir>
#include <thread>

#include "databaseManager.hpp"
#include "fakes.hpp"

using namespace testing_fakes;

namespace {

class DBManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(dir.isValid());
    path = dir.filePath("db/news.db");
    db = std::make_unique<DBManager>("test_main", path);
    ASSERT_TRUE(db->open());
  }

  void TearDown() override { db.reset(); }

  QTemporaryDir dir;
  QString path;
  std::unique_ptr<DBManager> db;
};

RawArticle article(const QString& link, const QString& title = "t") {
  return QVariantMap{{"link", link}, {"title", title}, {"source_name", "s"},
                     {"publish_time", QDateTime::currentDateTimeUtc()}};
}

}  // namespace

TEST_F(DBManagerTest, AddedSourceReadsBack) {
  NewsSource s = makeSource("Lenta", "rss");
  s.category = "russia";
  s.customConfig = QVariantMap{{"max_items", 20}};

  const auto id = db->addSource(s);
  ASSERT_TRUE(id.has_value());

  const auto loaded = db->getSourceByName("Lenta");
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->id, id);
  EXPECT_EQ(loaded->type, "rss");
  EXPECT_EQ(loaded->url, s.url);
  EXPECT_EQ(loaded->category, "russia");
  EXPECT_TRUE(loaded->enabled);
  EXPECT_EQ(loaded->customConfig.value("max_items").toInt(), 20);
  EXPECT_EQ(loaded->status, SourceStatus::Unchecked);
  EXPECT_EQ(loaded->consecutiveErrorCount, 0);

  EXPECT_TRUE(db->getSourceById(*id).has_value());
  EXPECT_FALSE(db->getSourceById(*id + 100).has_value());
}

TEST_F(DBManagerTest, DuplicateNameIsRejected) {
  ASSERT_TRUE(db->addSource(makeSource("dup")).has_value());
  EXPECT_FALSE(db->addSource(makeSource("dup")).has_value());
  EXPECT_EQ(db->listSources().size(), 1);
}

TEST_F(DBManagerTest, ListIsOrderedByTypeThenName) {
  db->addSource(makeSource("b", "rss"));
  db->addSource(makeSource("a", "scrape"));
  db->addSource(makeSource("a", "rss"));  // дубликат имени: не вставится
  db->addSource(makeSource("c", "atom"));

  const auto list = db->listSources();
  ASSERT_EQ(list.size(), 3);
  EXPECT_EQ(list[0].name, "c");
  EXPECT_EQ(list[1].name, "b");
  EXPECT_EQ(list[2].name, "a");
}

TEST_F(DBManagerTest, HealthUpdateIsPersisted) {
  const auto id = db->addSource(makeSource("feed"));
  ASSERT_TRUE(id.has_value());

  const QDateTime checked = QDateTime::currentDateTimeUtc();
  ASSERT_TRUE(db->updateSourceHealth(*id, SourceStatus::Error, "timeout", checked, 3));

  const auto s = db->getSourceById(*id);
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->status, SourceStatus::Error);
  EXPECT_EQ(s->lastError, "timeout");
  EXPECT_EQ(s->consecutiveErrorCount, 3);
  EXPECT_EQ(s->lastCheckedTime.toMSecsSinceEpoch(), checked.toMSecsSinceEpoch());

  ASSERT_TRUE(db->updateSourceHealth(*id, SourceStatus::Ok, QString(), checked, 0));
  EXPECT_TRUE(db->getSourceById(*id)->lastError.isEmpty());
}

TEST_F(DBManagerTest, HealthUpdateOfUnknownSourceFails) {
  EXPECT_FALSE(db->updateSourceHealth(999, SourceStatus::Ok, QString(),
                                      QDateTime::currentDateTimeUtc(), 0));
}

TEST_F(DBManagerTest, UpdateAndRemoveSource) {
  NewsSource s = makeSource("feed");
  s.id = db->addSource(s);
  ASSERT_TRUE(s.id.has_value());

  s.enabled = false;
  s.url = "https://example.test/other";
  EXPECT_TRUE(db->updateSource(s));
  EXPECT_FALSE(db->getSourceById(*s.id)->enabled);
  EXPECT_EQ(db->getSourceById(*s.id)->url, "https://example.test/other");

  EXPECT_TRUE(db->removeSource(*s.id));
  EXPECT_FALSE(db->removeSource(*s.id));
  EXPECT_TRUE(db->listSources().isEmpty());
}

TEST_F(DBManagerTest, ArticlesAreDeduplicatedByLink) {
  RawArticleList rows{article("https://a/1"), article("https://a/2"), article("https://a/1"),
                      QVariantMap{{"title", "no link"}}};
  EXPECT_EQ(db->insertArticles(rows), 2);
  EXPECT_EQ(db->insertArticles({article("https://a/2"), article("https://a/3")}), 1);
  EXPECT_EQ(db->articleCount(), 3);
  EXPECT_EQ(db->insertArticles({}), 0);
}

TEST_F(DBManagerTest, ClosedConnectionReportsFailure) {
  db->close();
  EXPECT_FALSE(db->isOpen());
  EXPECT_EQ(db->insertArticles({article("https://a/1")}), -1);
  EXPECT_FALSE(db->addSource(makeSource("x")).has_value());
}

TEST_F(DBManagerTest, FactoryStoreWritesFromAnotherThread) {
  const auto id = db->addSource(makeSource("feed"));
  ASSERT_TRUE(id.has_value());

  SqlHealthStoreFactory factory(path);
  bool written = false;
  std::thread worker([&] {
    std::unique_ptr<HealthStore> store = factory.open("test_worker_conn");
    ASSERT_NE(store, nullptr);
    written = store->updateSourceHealth(*id, SourceStatus::Ok, QString(),
                                        QDateTime::currentDateTimeUtc(), 0);
    store->close();
  });
  worker.join();

  EXPECT_TRUE(written);
  EXPECT_EQ(db->getSourceById(*id)->status, SourceStatus::Ok);
}

TEST(SqlHealthStoreFactoryTest, UnopenablePathYieldsNull) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  // путь к БД указывает на каталог
  SqlHealthStoreFactory factory(dir.path());
  EXPECT_EQ(factory.open("test_bad_conn"), nullptr);
}
