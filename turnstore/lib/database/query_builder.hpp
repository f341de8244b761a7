#pragma once

#include <pqxx/pqxx>

#include <string>
#include <string_view>
#include <vector>

#include "serializer.hpp"

namespace turnstore::database {
struct Query {
  std::string sql;
  pqxx::params params;
  void append(const Field &field);
};
struct QueryBuilder {
  Query generic(std::string_view query, std::vector<Field> params);
};
} // namespace turnstore::database
