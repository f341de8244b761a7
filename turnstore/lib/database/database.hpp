#pragma once

#include <pqxx/pqxx>

#include <memory>
#include <string>

#include "database_iface.hpp"
#include "serializer.hpp"

namespace turnstore::database {
struct Database final : AbstractDatabase {
  Database(std::string databaseName, std::string userName,
           std::string dbPassword, std::string host, uint port);

  /**
   * @brief Открывает соединение с PostgreSQL
   *
   * @throws ConnectionError если сервер недоступен или отверг авторизацию
   */
  void connect() final;

  size_t executeCommand(Query query) final;

  RowFields fetchSingle(Query query) final;

private:
  pqxx::connection &connection();

  std::string connectionString_;
  std::unique_ptr<pqxx::connection> dbConnection_;
};
} // namespace turnstore::database
