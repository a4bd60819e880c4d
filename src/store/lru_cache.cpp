#include "store/lru_cache.hpp"
#include "store/store_error.hpp"
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace golink {
namespace store {

//==============================================
// CONSTRUCTOR
//==============================================

LruCache::LruCache(std::size_t max_size) : max_size_(max_size) {
  if (max_size_ == 0) {
    throw std::invalid_argument("LRU cache: capacity must be at least 1");
  }
  BOOST_LOG_TRIVIAL(debug) << "LRU cache: Created with capacity " << max_size_;
}


//==============================================
// CORE OPERATIONS
//==============================================

bool LruCache::contains(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return index_.find(key) != index_.end();
}

std::string LruCache::get(const std::string& key) {
  std::string value;
  if (!try_get(key, value)) {
    throw NotFoundError(key);
  }
  return value;
}

bool LruCache::try_get(const std::string& key, std::string& value) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = index_.find(key);
  if (it == index_.end()) {
    return false;
  }

  touch(it->second);
  value = it->second->second;
  return true;
}

void LruCache::put(const std::string& key, const std::string& value) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = index_.find(key);
  if (it != index_.end()) {
    it->second->second = value;
    touch(it->second);
    return;
  }

  entries_.emplace_front(key, value);
  index_[key] = entries_.begin();

  if (entries_.size() > max_size_) {
    evict_oldest();
  }
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::size_t LruCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}


//==============================================
// RECENCY SUPPORT
//==============================================

void LruCache::touch(EntryList::iterator it) {
  // splice keeps every iterator in index_ valid
  entries_.splice(entries_.begin(), entries_, it);
}

void LruCache::evict_oldest() {
  if (entries_.empty()) {
    return;
  }
  BOOST_LOG_TRIVIAL(trace) << "LRU cache: Evicting " << entries_.back().first;
  index_.erase(entries_.back().first);
  entries_.pop_back();
}

} // namespace store
} // namespace golink
