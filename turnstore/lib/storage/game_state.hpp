#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>

#include "lru_cache.hpp"

namespace turnstore {
namespace json = boost::json;

/**
 * @brief Состояние одной игры. Слой хранения читает только поле _stateID.
 */
using GameState = json::object;
using GameId = std::string;
using GameCache = cache::LruCache<GameId, GameState>;

// Порядковый номер состояния, его назначает вызывающий код.
constexpr std::string_view kStateIdField = "_stateID";
// Идентичность документа, назначенная хранилищем.
constexpr std::string_view kIdentityField = "_id";

constexpr std::size_t kDefaultCacheSize = 1000;

/**
 * @brief Номер состояния; отсутствующее поле считается нулём
 *
 * @throws std::invalid_argument если _stateID не целое число
 */
std::int64_t stateIdOf(const GameState &state);

void stripIdentity(GameState &state);
} // namespace turnstore
