#include "file_store.hpp"
#include "errors.hpp"

#include <boost/log/trivial.hpp>

#include <fstream>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace turnstore {
namespace {
constexpr std::string_view kRevisionKey = "revision";
constexpr std::string_view kStateKey = "state";

bool isSafe(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         (c >= '0' && c <= '9') || c == '-' || c == '_';
}
} // namespace

FileStore::FileStore(fs::path dataDir) : dataDir_(std::move(dataDir)) {}

asio::awaitable<void> FileStore::connect() {
  std::error_code ec;
  fs::create_directories(dataDir_, ec);
  if (ec || !fs::is_directory(dataDir_)) {
    throw ConnectionError("Каталог данных недоступен: " + dataDir_.string() +
                          (ec ? " (" + ec.message() + ")" : ""));
  }
  connected_ = true;
  BOOST_LOG_TRIVIAL(info) << "[Файлы] Каталог данных: " << dataDir_;
  co_return;
}

void FileStore::ensureConnected() const {
  if (!connected_) {
    throw ConnectionError("Файловое хранилище не подключено");
  }
}

fs::path FileStore::pathFor(const GameId &gameId) const {
  std::ostringstream name;
  name << std::hex << std::uppercase << std::setfill('0');
  for (char c : gameId) {
    if (isSafe(c)) {
      name << c;
    } else {
      name << '%' << std::setw(2)
           << static_cast<int>(static_cast<unsigned char>(c));
    }
  }
  name << ".json";
  return dataDir_ / name.str();
}

std::optional<json::object> FileStore::readRecord(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    if (!fs::exists(path)) {
      return std::nullopt;
    }
    throw StoreError("Не удалось открыть " + path.string());
  }
  std::stringstream content;
  content << in.rdbuf();
  json::value record;
  try {
    record = json::parse(content.str());
  } catch (const std::exception &e) {
    throw StoreError("Повреждённый файл " + path.string() + ": " + e.what());
  }
  const auto *object = record.if_object();
  if (!object || !object->contains(kStateKey) ||
      !object->at(kStateKey).is_object() || !object->contains(kRevisionKey) ||
      !object->at(kRevisionKey).is_int64()) {
    throw StoreError("Неверный формат файла " + path.string());
  }
  return *object;
}

asio::awaitable<std::optional<GameState>> FileStore::findOne(GameId gameId) {
  ensureConnected();
  auto record = readRecord(pathFor(gameId));
  if (!record) {
    co_return std::nullopt;
  }
  GameState state = record->at(kStateKey).as_object();
  state[kIdentityField] = record->at(kRevisionKey).as_int64();
  co_return state;
}

asio::awaitable<void> FileStore::upsert(GameId gameId, GameState state) {
  ensureConnected();
  auto path = pathFor(gameId);
  std::int64_t revision = 1;
  if (auto previous = readRecord(path)) {
    revision = previous->at(kRevisionKey).as_int64() + 1;
  }
  json::object record;
  record[kRevisionKey] = revision;
  record[kStateKey] = std::move(state);

  auto tmpPath = path;
  tmpPath += ".tmp";
  {
    std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
    out << json::serialize(record);
    out.flush();
    if (!out) {
      throw StoreError("Не удалось записать " + tmpPath.string());
    }
  }
  std::error_code ec;
  fs::rename(tmpPath, path, ec);
  if (ec) {
    throw StoreError("Не удалось заменить " + path.string() + ": " +
                     ec.message());
  }
  BOOST_LOG_TRIVIAL(debug) << "[Файлы] Сохранена игра " << gameId
                           << ", ревизия " << revision;
  co_return;
}

asio::awaitable<bool> FileStore::exists(GameId gameId) {
  ensureConnected();
  std::error_code ec;
  bool found = fs::exists(pathFor(gameId), ec);
  if (ec) {
    throw StoreError("Не удалось проверить " + gameId + ": " + ec.message());
  }
  co_return found;
}
} // namespace turnstore
