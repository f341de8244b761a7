#pragma once

#include <cstdint>
#include <unordered_map>
#include <vector>

#include "store_iface.hpp"

namespace turnstore {
/**
 * @brief Документное хранилище в памяти процесса.
 *
 * Каждая запись добавляет новую версию документа с возрастающим _id,
 * findOne отдаёт версию с наибольшим _id. Используется по умолчанию и в
 * тестах.
 */
struct MemoryStore final : AbstractStore {
  asio::awaitable<void> connect() final;
  asio::awaitable<std::optional<GameState>> findOne(GameId gameId) final;
  asio::awaitable<void> upsert(GameId gameId, GameState state) final;
  asio::awaitable<bool> exists(GameId gameId) final;

  // Количество сохранённых версий игры.
  std::size_t versions(const GameId &gameId) const;

private:
  void ensureConnected() const;

  bool connected_ = false;
  std::int64_t nextId_ = 1;
  std::unordered_map<GameId, std::vector<GameState>> games_;
};
} // namespace turnstore
