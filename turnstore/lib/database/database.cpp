#include "database.hpp"
#include "errors.hpp"
#include "serializer.hpp"

#include <boost/log/trivial.hpp>

#include <sstream>
#include <variant>

namespace turnstore::database {

Database::Database(std::string databaseName, std::string userName,
                   std::string dbPassword, std::string host, uint port) {
  std::stringstream connBuilder;
  connBuilder << "user=" << userName << " password=" << dbPassword
              << " host=" << host << " port=" << port
              << " dbname=" << databaseName;
  connectionString_ = connBuilder.str();
}

void Database::connect() {
  try {
    dbConnection_ = std::make_unique<pqxx::connection>(connectionString_);
  } catch (const pqxx::broken_connection &e) {
    throw ConnectionError(e.what());
  }
  BOOST_LOG_TRIVIAL(info) << "[БД] Соединение установлено: "
                          << dbConnection_->dbname();
}

pqxx::connection &Database::connection() {
  if (!dbConnection_ || !dbConnection_->is_open()) {
    throw ConnectionError("Нет соединения с базой данных");
  }
  return *dbConnection_;
}

size_t Database::executeCommand(Query query) {
  try {
    pqxx::work worker(connection());
    BOOST_LOG_TRIVIAL(debug) << "[БД] Выполняю команду: " << query.sql;
    auto result = worker.exec(query.sql, query.params).affected_rows();
    BOOST_LOG_TRIVIAL(debug) << "[БД] Затронуто строк: " << result;
    worker.commit();
    return result;
  } catch (const pqxx::broken_connection &e) {
    throw ConnectionError(e.what());
  } catch (const pqxx::failure &e) {
    throw StoreError(e.what());
  }
}

namespace {
constexpr uint kInt8 = 20;
constexpr uint kInt4 = 23;
constexpr uint kText = 25;
constexpr uint kVarCharType = 1043;
constexpr uint kJsonb = 3802;
Field fromOid(const pqxx::field &field) {
  BOOST_LOG_TRIVIAL(trace) << "[БД] Type OId: " << field.type();
  switch (field.type()) {
  case kText:
  case kVarCharType:
  case kJsonb:
    return Field(field.as<std::string>());
  case kInt4:
    return Field(field.as<int32_t>());
  case kInt8:
    return Field(field.as<int64_t>());
  default:
    return std::monostate();
  }
}
} // namespace

RowFields Database::fetchSingle(Query query) {
  pqxx::result rows;
  try {
    pqxx::work worker(connection());
    BOOST_LOG_TRIVIAL(debug) << "[БД] Выполняю запрос одного элемента: "
                             << query.sql;
    rows = worker.exec(query.sql, query.params);
    worker.commit();
  } catch (const pqxx::broken_connection &e) {
    throw ConnectionError(e.what());
  } catch (const pqxx::failure &e) {
    throw StoreError(e.what());
  }
  BOOST_LOG_TRIVIAL(debug) << "[БД] Получено строк: " << rows.size();
  if (rows.size() > 1) {
    throw StoreError("Ожидалась не более чем одна строка, получено " +
                     std::to_string(rows.size()));
  }
  if (rows.empty()) {
    return {};
  }
  const pqxx::row &row = rows.front();
  RowFields fields;
  for (const pqxx::field &col : row) {
    const char *name = col.name();
    if (col.is_null()) {
      fields[name] = std::monostate();
      continue;
    }
    fields[name] = fromOid(col);
  }
  return fields;
}
} // namespace turnstore::database
