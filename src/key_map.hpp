#pragma once
/*
 * KeyMap
 *
 * Purpose: map physical key codes to a caller-defined logical choice.
 * Design: key → value table; read_choice() looks keys up, callers own meaning.
 */
#include <initializer_list>
#include <unordered_map>
#include <utility>

template <typename T>
class KeyMap {
public:
  KeyMap() = default;
  KeyMap(std::initializer_list<std::pair<const int, T>> init) : map_(init) {}

  void bind(int key, T value) { map_[key] = std::move(value); }
  const T* find(int key) const {
    auto it = map_.find(key);
    return it == map_.end() ? nullptr : &it->second;
  }
  bool contains(int key) const { return map_.count(key) != 0; }
  size_t size() const { return map_.size(); }

private:
  std::unordered_map<int, T> map_;
};
