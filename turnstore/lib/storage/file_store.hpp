#pragma once

#include <filesystem>

#include "store_iface.hpp"

namespace turnstore {
/**
 * @brief Хранилище ключ-значение на файловой системе.
 *
 * Одна игра - один файл <dataDir>/<id>.json вида
 * {"revision": n, "state": {...}}. Запись идёт во временный файл, который
 * затем переименовывается поверх старого.
 */
struct FileStore final : AbstractStore {
  explicit FileStore(std::filesystem::path dataDir);

  asio::awaitable<void> connect() final;
  asio::awaitable<std::optional<GameState>> findOne(GameId gameId) final;
  asio::awaitable<void> upsert(GameId gameId, GameState state) final;
  asio::awaitable<bool> exists(GameId gameId) final;

  std::filesystem::path pathFor(const GameId &gameId) const;

private:
  void ensureConnected() const;
  std::optional<json::object> readRecord(const std::filesystem::path &path);

  std::filesystem::path dataDir_;
  bool connected_ = false;
};
} // namespace turnstore
