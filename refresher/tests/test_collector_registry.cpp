#include <gtest/gtest.h>

#include "collectorRegistry.hpp"
#include "fakes.hpp"

using namespace testing_fakes;

TEST(CollectorRegistryTest, ResolvesRegisteredTypeCaseInsensitively) {
  CollectorRegistry registry;
  auto fake = std::make_shared<FakeCollector>("rss");
  registry.registerCollector("RSS", [fake] { return fake; });

  EXPECT_TRUE(registry.contains("rss"));
  EXPECT_TRUE(registry.contains("Rss"));
  EXPECT_EQ(registry.resolve("rss"), fake);
  EXPECT_EQ(registry.resolve("RsS"), fake);
}

TEST(CollectorRegistryTest, UnknownTypeResolvesToNull) {
  CollectorRegistry registry;
  EXPECT_FALSE(registry.contains("scrape"));
  EXPECT_EQ(registry.resolve("scrape"), nullptr);
}

TEST(CollectorRegistryTest, ThrowingFactoryResolvesToNull) {
  CollectorRegistry registry;
  registry.registerCollector("broken", []() -> std::shared_ptr<Collector> {
    throw std::runtime_error("cannot start browser");
  });
  EXPECT_TRUE(registry.contains("broken"));
  EXPECT_EQ(registry.resolve("broken"), nullptr);
}

TEST(CollectorRegistryTest, LaterRegistrationOverrides) {
  CollectorRegistry registry;
  auto first = std::make_shared<FakeCollector>("rss");
  auto second = std::make_shared<FakeCollector>("rss");
  registry.registerCollector("rss", [first] { return first; });
  registry.registerCollector("rss", [second] { return second; });

  EXPECT_EQ(registry.resolve("rss"), second);
  EXPECT_EQ(registry.types(), QStringList{"rss"});
}
