#include "query_builder.hpp"

#include <stdexcept>

namespace turnstore::database {
void Query::append(const Field &field) {
  auto visitor = Overload{
      [](std::monostate) {
        throw std::logic_error("Unexpected monostate");
      },
      [this](const std::string &s) { params.append(s); },
      [this](int32_t x) { params.append(x); },
      [this](int64_t x) { params.append(x); },
  };
  std::visit(visitor, field);
}

Query QueryBuilder::generic(std::string_view query, std::vector<Field> params) {
  Query res;
  res.sql = query;
  for (auto &param : params) {
    res.append(param);
  }
  return res;
}
} // namespace turnstore::database
