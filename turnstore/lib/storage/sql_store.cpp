#include "sql_store.hpp"
#include "errors.hpp"

#include <boost/log/trivial.hpp>

#include <algorithm>
#include <cctype>
#include <format>
#include <stdexcept>

namespace turnstore {
namespace {
bool isIdentifier(std::string_view name) {
  if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front()))) {
    return false;
  }
  return std::all_of(name.begin(), name.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
  });
}
} // namespace

SqlStore::SqlStore(std::shared_ptr<database::AbstractDatabase> db,
                   std::string table)
    : db_(std::move(db)), table_(std::move(table)) {
  if (!db_) {
    throw std::invalid_argument("Database cannot be null");
  }
  if (!isIdentifier(table_)) {
    throw std::invalid_argument("Invalid table name: " + table_);
  }
}

asio::awaitable<void> SqlStore::connect() {
  db_->connect();
  database::Query query;
  query.sql = std::format(R"sql(
    CREATE TABLE IF NOT EXISTS {} (
      game_id TEXT PRIMARY KEY,
      state JSONB NOT NULL,
      revision BIGINT NOT NULL DEFAULT 1
    )
  )sql",
                          table_);
  db_->executeCommand(std::move(query));
  BOOST_LOG_TRIVIAL(info) << "[БД] Таблица " << table_ << " готова";
  co_return;
}

asio::awaitable<std::optional<GameState>> SqlStore::findOne(GameId gameId) {
  auto query = database::QueryBuilder().generic(
      std::format(R"sql(
        SELECT game_id, state::text AS state, revision
        FROM {} WHERE game_id = $1
      )sql",
                  table_),
      {gameId});
  auto fields = db_->fetchSingle(std::move(query));
  if (fields.empty()) {
    co_return std::nullopt;
  }
  auto row = database::unpack<GameRow>(std::move(fields));
  json::value parsed;
  try {
    parsed = json::parse(row.state);
  } catch (const std::exception &e) {
    throw StoreError("Повреждённое состояние игры " + gameId + ": " +
                     e.what());
  }
  if (!parsed.is_object()) {
    throw StoreError("Состояние игры " + gameId + " не является объектом");
  }
  GameState state = std::move(parsed.as_object());
  state[kIdentityField] = row.revision;
  co_return state;
}

asio::awaitable<void> SqlStore::upsert(GameId gameId, GameState state) {
  auto query = database::QueryBuilder().generic(
      std::format(R"sql(
        INSERT INTO {0} (game_id, state) VALUES ($1, $2)
        ON CONFLICT (game_id) DO UPDATE
        SET state = EXCLUDED.state, revision = {0}.revision + 1
      )sql",
                  table_),
      {gameId, json::serialize(state)});
  auto affected = db_->executeCommand(std::move(query));
  BOOST_LOG_TRIVIAL(debug) << "[БД] Сохранена игра " << gameId
                           << ", строк: " << affected;
  co_return;
}

asio::awaitable<bool> SqlStore::exists(GameId gameId) {
  auto query = database::QueryBuilder().generic(
      std::format("SELECT game_id FROM {} WHERE game_id = $1", table_),
      {gameId});
  co_return !db_->fetchSingle(std::move(query)).empty();
}
} // namespace turnstore
