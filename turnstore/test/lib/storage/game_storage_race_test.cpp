#include <gtest/gtest.h>

#include <chrono>

#include "game_storage.hpp"
#include "memory_store.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
using namespace turnstore;
using namespace turnstore::testing;

namespace {
GameState withStateId(std::int64_t stateId) {
  return GameState{{kStateIdField, stateId}};
}
} // namespace

// Операции запускаются на одном io_context и чередуются на задержках
// DelayedStore, как если бы хранилище отвечало медленно.
class GameStorageRaceTest : public ::testing::Test {
protected:
  void SetUp() override {
    memory_ = std::make_shared<MemoryStore>();
    delayed_ = std::make_shared<DelayedStore>(memory_);
    storage_ = std::make_unique<GameStorage>(delayed_);
    runSync(ioc_, storage_->connect());
  }

  asio::io_context ioc_;
  std::shared_ptr<MemoryStore> memory_;
  std::shared_ptr<DelayedStore> delayed_;
  std::unique_ptr<GameStorage> storage_;
};

TEST_F(GameStorageRaceTest, SlowReadDoesNotRegressCache) {
  runSync(ioc_, storage_->set("gameID", withStateId(0)));
  storage_->cache().reset();
  delayed_->findDelay = 50ms;

  // get() читает _stateID 0 и засыпает, тем временем set() пишет 1
  auto read = asio::co_spawn(ioc_, storage_->get("gameID"), asio::use_future);
  auto write = asio::co_spawn(ioc_, storage_->set("gameID", withStateId(1)),
                              asio::use_future);
  ioc_.restart();
  ioc_.run();
  write.get();

  auto fetched = read.get();
  ASSERT_TRUE(fetched.has_value());
  EXPECT_EQ(stateIdOf(*fetched), 0);
  EXPECT_EQ(storage_->cache().get("gameID"), withStateId(1));
}

TEST_F(GameStorageRaceTest, MissedReadDoesNotEvictConcurrentSet) {
  delayed_->findDelay = 50ms;

  // get() не находит игру и засыпает, тем временем set() создаёт её
  auto read = asio::co_spawn(ioc_, storage_->get("new"), asio::use_future);
  auto write = asio::co_spawn(ioc_, storage_->set("new", withStateId(0)),
                              asio::use_future);
  ioc_.restart();
  ioc_.run();
  write.get();

  EXPECT_EQ(read.get(), std::nullopt);
  EXPECT_EQ(storage_->cache().get("new"), withStateId(0));
  EXPECT_EQ(memory_->versions("new"), 1);
}

TEST_F(GameStorageRaceTest, SlowReadFillsCacheWhenNothingNewer) {
  runSync(ioc_, storage_->set("gameID", withStateId(4)));
  storage_->cache().reset();
  delayed_->findDelay = 20ms;

  auto first = asio::co_spawn(ioc_, storage_->get("gameID"), asio::use_future);
  auto second = asio::co_spawn(ioc_, storage_->get("gameID"), asio::use_future);
  ioc_.restart();
  ioc_.run();

  EXPECT_EQ(first.get(), second.get());
  ASSERT_TRUE(storage_->cache().has("gameID"));
  EXPECT_EQ(stateIdOf(*storage_->cache().get("gameID")), 4);
}

TEST_F(GameStorageRaceTest, InterleavedSetsKeepNewestState) {
  delayed_->upsertDelay = 30ms;

  auto newer = asio::co_spawn(ioc_, storage_->set("gameID", withStateId(2)),
                              asio::use_future);
  auto older = asio::co_spawn(ioc_, storage_->set("gameID", withStateId(1)),
                              asio::use_future);
  ioc_.restart();
  ioc_.run();
  newer.get();
  older.get();

  EXPECT_EQ(memory_->versions("gameID"), 1);
  EXPECT_EQ(storage_->cache().get("gameID"), withStateId(2));

  storage_->cache().reset();
  auto stored = runSync(ioc_, storage_->get("gameID"));
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stateIdOf(*stored), 2);
}

TEST_F(GameStorageRaceTest, CacheKeepsNewestWhileWritesAreInFlight) {
  delayed_->upsertDelay = 30ms;

  auto first = asio::co_spawn(ioc_, storage_->set("gameID", withStateId(1)),
                              asio::use_future);
  auto second = asio::co_spawn(ioc_, storage_->set("gameID", withStateId(2)),
                               asio::use_future);
  // Пока обе записи висят, чтение обслуживается кэшем
  auto read = asio::co_spawn(ioc_, storage_->get("gameID"), asio::use_future);
  ioc_.restart();
  ioc_.run();
  first.get();
  second.get();

  EXPECT_EQ(read.get(), withStateId(2));
  EXPECT_EQ(memory_->versions("gameID"), 2);
}
