#pragma once

#include <boost/program_options.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "game_storage.hpp"
#include "store_iface.hpp"

namespace turnstore::config {
namespace po = boost::program_options;

// Префикс переменных окружения: TURNSTORE_CACHE_SIZE -> cache-size.
constexpr std::string_view kEnvPrefix = "TURNSTORE_";

struct StorageConfig {
  std::string backend = "memory";
  // Знаковый тип: отрицательное значение из командной строки не должно
  // превратиться в огромный размер.
  std::int64_t cacheSize = kDefaultCacheSize;
  bool strictConnect = false;

  std::string dbName = "turnstore";
  std::string dbUser = "postgres";
  std::string dbPassword;
  std::string dbHost = "127.0.0.1";
  uint dbPort = 5432;
  std::string dbTable = "games";

  std::string dataDir = "turnstore-data";

  std::string logLevel = "info";
};

/**
 * @brief Описание опций хранилища, значения пишутся прямо в config
 *
 * Текущие значения полей config становятся значениями по умолчанию.
 */
po::options_description describeOptions(StorageConfig &config);

/**
 * @brief Отображение имён переменных окружения на имена опций
 *
 * Переменные без префикса и неизвестные опции пропускаются.
 */
std::function<std::string(std::string)>
environmentMapper(const po::options_description &desc);

/**
 * @brief Проверяет согласованность настроек
 *
 * @throws std::invalid_argument
 */
void validate(const StorageConfig &config);

/**
 * @brief Создаёт адаптер выбранного хранилища
 *
 * @throws std::invalid_argument для неизвестного backend
 */
std::shared_ptr<AbstractStore> makeStore(const StorageConfig &config);

std::unique_ptr<GameStorage> makeStorage(const StorageConfig &config);

/**
 * @brief Устанавливает фильтр журнала по уровню (trace .. fatal)
 *
 * @throws std::invalid_argument для неизвестного уровня
 */
void setupLogging(std::string_view level);
} // namespace turnstore::config
