#include "game_storage.hpp"
#include "errors.hpp"

#include <boost/log/trivial.hpp>

#include <stdexcept>

namespace turnstore {
GameStorage::GameStorage(std::shared_ptr<AbstractStore> store, Options options)
    : GameStorage(std::move(store), GameCache(options.cacheSize),
                  options.strictConnect) {}

GameStorage::GameStorage(std::shared_ptr<AbstractStore> store, GameCache cache,
                         bool strictConnect)
    : store_(std::move(store)), cache_(std::move(cache)),
      strictConnect_(strictConnect) {
  if (!store_) {
    throw std::invalid_argument("Store cannot be null");
  }
}

asio::awaitable<void> GameStorage::connect() {
  if (connected_) {
    throw std::logic_error("GameStorage is already connected");
  }
  try {
    co_await store_->connect();
  } catch (const ConnectionError &e) {
    BOOST_LOG_TRIVIAL(error)
        << "[Хранилище] Ошибка подключения: " << e.what();
    if (strictConnect_) {
      throw;
    }
    co_return;
  }
  connected_ = true;
  BOOST_LOG_TRIVIAL(info) << "[Хранилище] Подключено, размер кэша: "
                          << cache_.capacity();
}

asio::awaitable<void> GameStorage::set(GameId gameId, GameState state) {
  // Повторная или запоздавшая доставка хода не должна откатить кэш.
  auto stateId = stateIdOf(state);
  if (auto cached = cache_.get(gameId);
      cached && stateIdOf(*cached) >= stateId) {
    BOOST_LOG_TRIVIAL(debug)
        << "[Хранилище] Отброшена устаревшая запись игры " << gameId
        << ": _stateID " << stateId << " <= " << stateIdOf(*cached);
    co_return;
  }

  stripIdentity(state);
  cache_.set(gameId, state);

  // После успешного connect() любая ошибка записи доходит до вызывающего.
  // Молча пропускается только отказ хранилища, к которому так и не
  // удалось подключиться.
  try {
    co_await store_->upsert(gameId, std::move(state));
  } catch (const ConnectionError &e) {
    BOOST_LOG_TRIVIAL(error) << "[Хранилище] Игра " << gameId
                             << " не сохранена, нет соединения: " << e.what();
    if (connected_ || strictConnect_) {
      throw;
    }
  }
}

asio::awaitable<std::optional<GameState>> GameStorage::get(GameId gameId) {
  if (auto cached = cache_.get(gameId)) {
    co_return cached;
  }

  auto doc = co_await store_->findOne(gameId);

  // Пока ждали хранилище, параллельный set() мог обновить кэш.
  // Отсутствие в кэше считается номером 0, отсутствие в хранилище - -1,
  // поэтому ненайденный документ никогда не затирает кэш.
  std::int64_t oldStateId = 0;
  if (auto cached = cache_.get(gameId)) {
    oldStateId = stateIdOf(*cached);
  }
  std::int64_t newStateId = -1;
  if (doc) {
    try {
      newStateId = stateIdOf(*doc);
    } catch (const std::invalid_argument &e) {
      throw StoreError("Повреждённый документ игры " + gameId + ": " +
                       e.what());
    }
  }

  if (doc && newStateId >= oldStateId) {
    cache_.set(gameId, *doc);
  } else if (doc) {
    BOOST_LOG_TRIVIAL(debug)
        << "[Кэш] Игра " << gameId << ": кэш свежее хранилища ("
        << oldStateId << " > " << newStateId << ")";
  }
  co_return doc;
}

asio::awaitable<bool> GameStorage::has(GameId gameId) {
  if (cache_.has(gameId)) {
    co_return true;
  }
  co_return co_await store_->exists(gameId);
}
} // namespace turnstore
