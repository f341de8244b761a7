#include "config.hpp"
#include "database.hpp"
#include "file_store.hpp"
#include "memory_store.hpp"
#include "sql_store.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace turnstore::config {
po::options_description describeOptions(StorageConfig &config) {
  po::options_description desc("Storage options");
  desc.add_options()(
      "backend", po::value(&config.backend)->default_value(config.backend),
      "Storage backend: memory (lost on exit), postgres or file")(
      "cache-size",
      po::value(&config.cacheSize)->default_value(config.cacheSize),
      "Number of games kept in the LRU cache")(
      "strict-connect",
      po::bool_switch(&config.strictConnect)->default_value(false),
      "Fail on connection errors instead of logging them")(
      "db-name", po::value(&config.dbName)->default_value(config.dbName),
      "PostgreSQL database name")(
      "db-user", po::value(&config.dbUser)->default_value(config.dbUser),
      "PostgreSQL user")(
      "db-password",
      po::value(&config.dbPassword)->default_value(config.dbPassword),
      "PostgreSQL password")(
      "db-host", po::value(&config.dbHost)->default_value(config.dbHost),
      "PostgreSQL host")(
      "db-port", po::value(&config.dbPort)->default_value(config.dbPort),
      "PostgreSQL port")(
      "db-table", po::value(&config.dbTable)->default_value(config.dbTable),
      "Table holding game states")(
      "data-dir", po::value(&config.dataDir)->default_value(config.dataDir),
      "Directory of the file backend")(
      "log-level", po::value(&config.logLevel)->default_value(config.logLevel),
      "Log level: trace, debug, info, warning, error, fatal");
  return desc;
}

std::function<std::string(std::string)>
environmentMapper(const po::options_description &desc) {
  return [&desc](std::string variable) -> std::string {
    if (!variable.starts_with(kEnvPrefix)) {
      return {};
    }
    std::string option = variable.substr(kEnvPrefix.size());
    std::transform(option.begin(), option.end(), option.begin(),
                   [](unsigned char c) -> char {
                     return c == '_' ? '-' : static_cast<char>(std::tolower(c));
                   });
    if (!desc.find_nothrow(option, false)) {
      return {};
    }
    return option;
  };
}

void validate(const StorageConfig &config) {
  if (config.cacheSize < 1) {
    throw std::invalid_argument("cache-size must be positive");
  }
  if (config.backend != "memory" && config.backend != "postgres" &&
      config.backend != "file") {
    throw std::invalid_argument("Unknown backend: " + config.backend);
  }
}

std::shared_ptr<AbstractStore> makeStore(const StorageConfig &config) {
  validate(config);
  BOOST_LOG_TRIVIAL(info) << "[Настройки] Хранилище: " << config.backend;
  if (config.backend == "postgres") {
    auto db = std::make_shared<database::Database>(
        config.dbName, config.dbUser, config.dbPassword, config.dbHost,
        config.dbPort);
    return std::make_shared<SqlStore>(std::move(db), config.dbTable);
  }
  if (config.backend == "file") {
    return std::make_shared<FileStore>(config.dataDir);
  }
  return std::make_shared<MemoryStore>();
}

std::unique_ptr<GameStorage> makeStorage(const StorageConfig &config) {
  auto store = makeStore(config);
  GameStorage::Options options{
      .cacheSize = static_cast<std::size_t>(config.cacheSize),
      .strictConnect = config.strictConnect};
  return std::make_unique<GameStorage>(std::move(store), options);
}

void setupLogging(std::string_view level) {
  namespace logging = boost::log;
  logging::trivial::severity_level severity;
  if (!logging::trivial::from_string(level.data(), level.size(), severity)) {
    throw std::invalid_argument("Unknown log level: " + std::string(level));
  }
  logging::core::get()->set_filter(logging::trivial::severity >= severity);
}
} // namespace turnstore::config
