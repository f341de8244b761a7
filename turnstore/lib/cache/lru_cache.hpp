#pragma once

#include <cstddef>
#include <list>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace turnstore::cache {
/**
 * @brief Кэш фиксированной ёмкости с вытеснением LRU
 *
 * Ключи хранятся в списке в порядке использования: front() - самый свежий,
 * back() - кандидат на вытеснение. Словарь хранит значение и позицию ключа
 * в списке, поэтому все операции выполняются за O(1).
 *
 * Синхронизации нет: кэш рассчитан на доступ из одного io_context.
 */
template <typename K, typename V> struct LruCache {
  explicit LruCache(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
      throw std::invalid_argument("Cache capacity must be greater than 0");
    }
  }

  // Словарь хранит итераторы списка, поэтому копирование запрещено.
  LruCache(const LruCache &) = delete;
  LruCache &operator=(const LruCache &) = delete;
  LruCache(LruCache &&) = default;
  LruCache &operator=(LruCache &&) = default;

  /**
   * @brief Возвращает значение и делает ключ самым свежим
   */
  std::optional<V> get(const K &key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
      return std::nullopt;
    }
    order_.splice(order_.begin(), order_, it->second.position);
    return it->second.value;
  }

  /**
   * @brief Вставляет или заменяет значение, при переполнении вытесняет
   * самый давно использованный ключ
   */
  void set(const K &key, V value) {
    auto it = entries_.find(key);
    if (it != entries_.end()) {
      it->second.value = std::move(value);
      order_.splice(order_.begin(), order_, it->second.position);
      return;
    }
    if (entries_.size() >= capacity_) {
      entries_.erase(order_.back());
      order_.pop_back();
    }
    order_.push_front(key);
    entries_.emplace(key, Entry{std::move(value), order_.begin()});
  }

  // Порядок использования не меняется.
  bool has(const K &key) const { return entries_.contains(key); }

  void reset() {
    entries_.clear();
    order_.clear();
  }

  std::size_t size() const { return entries_.size(); }
  std::size_t capacity() const { return capacity_; }

private:
  struct Entry {
    V value;
    typename std::list<K>::iterator position;
  };

  std::size_t capacity_;
  std::list<K> order_;
  std::unordered_map<K, Entry> entries_;
};
} // namespace turnstore::cache
