#pragma once

#include <memory>
#include <string>

#include <boost/hana.hpp>

#include "database_iface.hpp"
#include "store_iface.hpp"

namespace turnstore {
/**
 * @brief Строка таблицы игр.
 */
struct GameRow {
  BOOST_HANA_DEFINE_STRUCT(GameRow, (std::string, game_id),
                           (std::string, state), (int64_t, revision));
};

/**
 * @brief Реляционное хранилище: одна строка на игру, состояние в JSONB.
 *
 * Поле _id в прочитанных документах - номер ревизии строки, он растёт
 * с каждой перезаписью.
 */
struct SqlStore final : AbstractStore {
  SqlStore(std::shared_ptr<database::AbstractDatabase> db,
           std::string table = "games");

  asio::awaitable<void> connect() final;
  asio::awaitable<std::optional<GameState>> findOne(GameId gameId) final;
  asio::awaitable<void> upsert(GameId gameId, GameState state) final;
  asio::awaitable<bool> exists(GameId gameId) final;

private:
  std::shared_ptr<database::AbstractDatabase> db_;
  std::string table_;
};
} // namespace turnstore
