#pragma once

#include <cstddef>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace golink {
namespace store {

class LruCache {
public:

  // ---- CONSTRUCTOR ----
  // Throws std::invalid_argument when max_size is zero
  explicit LruCache(std::size_t max_size);


  // ---- CORE OPERATIONS ----
  // True if key is resident; does not change recency
  bool contains(const std::string& key) const;
  // Returns value and marks key most recently used, throws NotFoundError if absent
  std::string get(const std::string& key);
  // Same as get without throwing on a miss
  bool try_get(const std::string& key, std::string& value);
  // Inserts or overwrites and marks key most recently used. Evicts the
  // least recently used entry once size goes past max_size
  void put(const std::string& key, const std::string& value);


  // ---- QUERY OPERATIONS ----
  std::size_t size() const;
  std::size_t capacity() const { return max_size_; }

private:
  // ---- PARAMETERS ----
  // Front is most recently used, back is next to be evicted
  using EntryList = std::list<std::pair<std::string, std::string>>;

  const std::size_t max_size_;
  EntryList entries_;
  std::unordered_map<std::string, EntryList::iterator> index_;
  mutable std::mutex mutex_;


  // ---- RECENCY SUPPORT ----
  // Caller must hold mutex_
  void touch(EntryList::iterator it);
  void evict_oldest();
};

} // namespace store
} // namespace golink
