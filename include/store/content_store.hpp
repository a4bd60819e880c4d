#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <openssl/evp.h>
#include "store/lru_cache.hpp"
#include "store/path_scheme.hpp"
#include "store/store_error.hpp"

namespace golink {
namespace store {

// Content-addressed store for submitted URLs. The filesystem under state_dir
// is authoritative; the LRU cache in front of it only saves disk reads.
class ContentStore {
public:

  // ---- CONSTRUCTOR ----
  // Throws UnsupportedAlgorithmError for digest names OpenSSL does not know and
  // std::invalid_argument when hash_length does not fit the digest
  ContentStore(const std::filesystem::path& state_dir,
               const std::string& hash_algorithm = "sha256",
               std::size_t hash_length = 5,
               std::size_t cache_size = 100);


  // ---- CORE STORAGE OPERATIONS ----
  // Lowercase hex digest of content truncated to hash_length
  std::string hash(const std::string& content) const;
  // Stores content under its digest and returns the digest. Identical content
  // always lands on the same file; colliding content overwrites it
  std::string save(const std::string& content);
  // Cache first, then disk with cache backfill. Throws NotFoundError
  std::string load(const std::string& identifier);


  // ---- GETTERS ----
  const std::filesystem::path& state_dir() const { return state_dir_; }
  const std::string& hash_algorithm() const { return hash_algorithm_; }
  std::size_t hash_length() const { return hash_length_; }
  LruCache& cache() { return cache_; }

private:
  // ---- PARAMETERS ----
  const std::filesystem::path state_dir_;
  const std::string hash_algorithm_;
  const std::size_t hash_length_;
  const EVP_MD* digest_;
  LruCache cache_;


  // ---- CAS STORAGE SUPPORT ----
  // Absolute location of an identifier below state_dir_
  std::filesystem::path resolve_path(const std::string& identifier) const;
  // Only hash_length lowercase hex characters can name a stored entry
  bool is_valid_identifier(const std::string& identifier) const;
  // Writes to a sibling temp file and renames it over file_path
  void write_file(const std::filesystem::path& file_path, const std::string& content) const;
  // Returns false when nothing exists at file_path
  bool read_file(const std::filesystem::path& file_path, std::string& content) const;
};

} // namespace store
} // namespace golink
