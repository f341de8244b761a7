#include "memory_store.hpp"
#include "errors.hpp"

#include <boost/log/trivial.hpp>

namespace turnstore {
asio::awaitable<void> MemoryStore::connect() {
  connected_ = true;
  BOOST_LOG_TRIVIAL(debug) << "[Память] Хранилище готово";
  co_return;
}

void MemoryStore::ensureConnected() const {
  if (!connected_) {
    throw ConnectionError("Хранилище в памяти не подключено");
  }
}

asio::awaitable<std::optional<GameState>>
MemoryStore::findOne(GameId gameId) {
  ensureConnected();
  auto it = games_.find(gameId);
  if (it == games_.end() || it->second.empty()) {
    co_return std::nullopt;
  }
  co_return it->second.back();
}

asio::awaitable<void> MemoryStore::upsert(GameId gameId, GameState state) {
  ensureConnected();
  state[kIdentityField] = nextId_++;
  games_[gameId].push_back(std::move(state));
  co_return;
}

asio::awaitable<bool> MemoryStore::exists(GameId gameId) {
  ensureConnected();
  co_return games_.contains(gameId);
}

std::size_t MemoryStore::versions(const GameId &gameId) const {
  auto it = games_.find(gameId);
  return it == games_.end() ? 0 : it->second.size();
}
} // namespace turnstore
