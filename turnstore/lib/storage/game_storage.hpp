#pragma once

#include <memory>
#include <optional>

#include "game_state.hpp"
#include "store_iface.hpp"

namespace turnstore {
/**
 * @brief Хранилище игр со сквозным LRU-кэшем перед долговременным
 * хранилищем.
 *
 * Кэш никогда не откатывается к состоянию с меньшим _stateID, даже если
 * get() и set() одной игры чередуются на точках приостановки. Для этого
 * каждое решение о записи в кэш принимается по содержимому кэша в момент
 * записи, а не в момент запроса к хранилищу.
 */
struct GameStorage {
  struct Options {
    std::size_t cacheSize = kDefaultCacheSize;
    // Пробрасывать ConnectionError вместо записи в журнал.
    bool strictConnect = false;
  };

  GameStorage(std::shared_ptr<AbstractStore> store, Options options);
  GameStorage(std::shared_ptr<AbstractStore> store, GameCache cache,
              bool strictConnect = false);
  explicit GameStorage(std::shared_ptr<AbstractStore> store)
      : GameStorage(std::move(store), Options{}) {}

  /**
   * @brief Подключает хранилище, вызывается один раз до остальных операций
   *
   * Ошибка соединения пишется в журнал; в строгом режиме она пробрасывается.
   *
   * @throws std::logic_error при повторном вызове после успешного
   * подключения
   */
  asio::awaitable<void> connect();

  /**
   * @brief Состояние игры или std::nullopt, если игры нет
   *
   * При промахе кэша возвращает документ хранилища (с полем _id), а в кэш
   * кладёт его, только если он не старее того, что кэш успел получить за
   * время чтения.
   */
  asio::awaitable<std::optional<GameState>> get(GameId gameId);

  /**
   * @brief Сохраняет состояние игры
   *
   * Запись с _stateID не больше закэшированного отбрасывается. Если
   * connect() не удался, ConnectionError записи только пишется в журнал
   * (кроме строгого режима).
   *
   * @throws StoreError
   */
  asio::awaitable<void> set(GameId gameId, GameState state);

  asio::awaitable<bool> has(GameId gameId);

  bool connected() const { return connected_; }
  GameCache &cache() { return cache_; }

private:
  std::shared_ptr<AbstractStore> store_;
  GameCache cache_;
  bool strictConnect_;
  bool connected_ = false;
};
} // namespace turnstore
