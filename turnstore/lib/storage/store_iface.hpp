#pragma once

#include <boost/asio.hpp>

#include <optional>

#include "game_state.hpp"

namespace turnstore {
namespace asio = boost::asio;

/**
 * @brief Интерфейс долговременного хранилища состояний игр.
 *
 * Все операции - корутины: пока хранилище ждёт ввода-вывода, на том же
 * io_context могут выполняться другие операции.
 */
struct AbstractStore {
  virtual ~AbstractStore() = default;

  /**
   * @brief Устанавливает соединение
   *
   * @throws ConnectionError
   */
  virtual asio::awaitable<void> connect() = 0;

  /**
   * @brief Самый свежий документ игры или std::nullopt
   *
   * Документ несёт поле _id, назначенное хранилищем.
   */
  virtual asio::awaitable<std::optional<GameState>>
  findOne(GameId gameId) = 0;

  /**
   * @brief Создаёт или заменяет документ игры
   *
   * @throws StoreError
   */
  virtual asio::awaitable<void> upsert(GameId gameId, GameState state) = 0;

  virtual asio::awaitable<bool> exists(GameId gameId) = 0;
};
} // namespace turnstore
