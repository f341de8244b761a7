#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>

#include <boost/hana.hpp>

namespace {
template <typename... Ts> struct Overload : Ts... {
  using Ts::operator()...;
};
template <class... Ts> Overload(Ts...) -> Overload<Ts...>;
} // namespace

namespace turnstore::database {
namespace hana = boost::hana;

// Типы колонок, которые встречаются в таблице игр (TEXT, JSONB, INT, BIGINT).
using Field = std::variant<std::monostate, std::string, int32_t, int64_t>;
using RowFields = std::unordered_map<std::string, Field>;

/**
 * @brief Собирает структуру из полей строки по именам членов
 *
 * @throws std::out_of_range если набор полей не совпадает с членами
 * @throws std::bad_variant_access если тип поля не совпадает с типом члена
 */
template <typename T> T unpack(RowFields fields) {
  T object{};
  constexpr auto accessors = hana::accessors<T>();
  if (hana::length(accessors) != fields.size()) {
    throw std::out_of_range("Field count mismatch");
  }
  hana::for_each(accessors, [&](auto &&member) {
    auto memberName = hana::first(member).c_str();
    auto memberAccessor = hana::second(member);
    auto &fieldValue = fields.at(memberName);
    using MemberType = std::remove_cvref_t<decltype(memberAccessor(object))>;
    memberAccessor(object) = std::move(std::get<MemberType>(fieldValue));
  });
  return object;
}

} // namespace turnstore::database
