#pragma once

#include "query_builder.hpp"
#include "serializer.hpp"

namespace turnstore::database {
/**
 * @brief Интерфейс реляционной базы данных.
 */
struct AbstractDatabase {
  virtual ~AbstractDatabase() = default;
  virtual void connect() = 0;
  virtual size_t executeCommand(Query query) = 0;
  virtual RowFields fetchSingle(Query query) = 0;
};
} // namespace turnstore::database
