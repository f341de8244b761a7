#pragma once

#include <stdexcept>

namespace turnstore {
/**
 * @brief Ошибка доступа к долговременному хранилищу.
 *
 * Пробрасывается вызывающему коду без изменений, повторов не делаем.
 */
struct StoreError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

/**
 * @brief Не удалось установить (или удержать) соединение с хранилищем.
 */
struct ConnectionError : StoreError {
  using StoreError::StoreError;
};
} // namespace turnstore
