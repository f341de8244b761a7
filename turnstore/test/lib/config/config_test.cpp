#include <gtest/gtest.h>

#include <stdexcept>

#include "config.hpp"
#include "file_store.hpp"
#include "memory_store.hpp"
#include "sql_store.hpp"

using namespace turnstore;
using namespace turnstore::config;

namespace {
StorageConfig parse(std::vector<const char *> args) {
  StorageConfig config;
  auto desc = describeOptions(config);
  args.insert(args.begin(), "turnstore-cli");
  po::variables_map vm;
  po::store(po::parse_command_line(static_cast<int>(args.size()), args.data(),
                                   desc),
            vm);
  po::notify(vm);
  return config;
}
} // namespace

TEST(ConfigTest, Defaults) {
  auto config = parse({});
  EXPECT_EQ(config.backend, "memory");
  EXPECT_EQ(config.cacheSize, 1000);
  EXPECT_FALSE(config.strictConnect);
  EXPECT_EQ(config.dbPort, 5432);
  EXPECT_EQ(config.dbTable, "games");
  EXPECT_EQ(config.logLevel, "info");
}

TEST(ConfigTest, CommandLineOverrides) {
  auto config = parse({"--backend", "file", "--cache-size", "16",
                       "--strict-connect", "--data-dir", "/tmp/games"});
  EXPECT_EQ(config.backend, "file");
  EXPECT_EQ(config.cacheSize, 16);
  EXPECT_TRUE(config.strictConnect);
  EXPECT_EQ(config.dataDir, "/tmp/games");
}

TEST(ConfigTest, NegativeCacheSizeIsRejected) {
  auto config = parse({"--cache-size=-1"});
  EXPECT_EQ(config.cacheSize, -1);
  EXPECT_THROW(validate(config), std::invalid_argument);
  EXPECT_THROW(makeStorage(config), std::invalid_argument);
}

TEST(ConfigTest, PresetFieldsBecomeDefaults) {
  StorageConfig config;
  config.backend = "file";
  auto desc = describeOptions(config);
  po::variables_map vm;
  const char *argv[] = {"turnstore-cli"};
  po::store(po::parse_command_line(1, argv, desc), vm);
  po::notify(vm);
  EXPECT_EQ(config.backend, "file");
  EXPECT_TRUE(vm["backend"].defaulted());
}

TEST(ConfigTest, EnvironmentMapper) {
  StorageConfig config;
  auto desc = describeOptions(config);
  auto mapper = environmentMapper(desc);
  EXPECT_EQ(mapper("TURNSTORE_CACHE_SIZE"), "cache-size");
  EXPECT_EQ(mapper("TURNSTORE_DB_HOST"), "db-host");
  EXPECT_EQ(mapper("TURNSTORE_UNKNOWN"), "");
  EXPECT_EQ(mapper("PATH"), "");
}

TEST(ConfigTest, ValidateRejectsBadValues) {
  StorageConfig config;
  config.cacheSize = 0;
  EXPECT_THROW(validate(config), std::invalid_argument);

  config.cacheSize = 1;
  config.backend = "mongo";
  EXPECT_THROW(validate(config), std::invalid_argument);
  EXPECT_THROW(makeStore(config), std::invalid_argument);
}

TEST(ConfigTest, MakeStoreSelectsBackend) {
  StorageConfig config;
  EXPECT_NE(std::dynamic_pointer_cast<MemoryStore>(makeStore(config)),
            nullptr);

  config.backend = "file";
  EXPECT_NE(std::dynamic_pointer_cast<FileStore>(makeStore(config)), nullptr);

  // Соединение открывается только в connect()
  config.backend = "postgres";
  EXPECT_NE(std::dynamic_pointer_cast<SqlStore>(makeStore(config)), nullptr);
}

TEST(ConfigTest, MakeStorageUsesCacheSize) {
  StorageConfig config;
  config.cacheSize = 7;
  auto storage = makeStorage(config);
  EXPECT_EQ(storage->cache().capacity(), 7);
  EXPECT_FALSE(storage->connected());
}

TEST(ConfigTest, SetupLoggingValidatesLevel) {
  EXPECT_NO_THROW(setupLogging("debug"));
  EXPECT_THROW(setupLogging("verbose"), std::invalid_argument);
  setupLogging("info");
}
