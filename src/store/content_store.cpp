#include "store/content_store.hpp"
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <unistd.h>
#include <boost/log/trivial.hpp>

namespace golink {
namespace store {

namespace {

// hashlib names that OpenSSL only knows by their sized spelling
const std::unordered_map<std::string, std::string>& digest_aliases() {
  static const std::unordered_map<std::string, std::string> aliases = {
    {"blake2b", "BLAKE2b512"},
    {"blake2s", "BLAKE2s256"}
  };
  return aliases;
}

// Resolves a digest name the way hashlib spells it as well ("sha3_256", "blake2b")
const EVP_MD* lookup_digest(const std::string& algorithm) {
  auto alias = digest_aliases().find(algorithm);
  if (alias != digest_aliases().end()) {
    return EVP_get_digestbyname(alias->second.c_str());
  }

  const EVP_MD* md = EVP_get_digestbyname(algorithm.c_str());
  if (!md) {
    std::string dashed = algorithm;
    std::replace(dashed.begin(), dashed.end(), '_', '-');
    md = EVP_get_digestbyname(dashed.c_str());
  }
  return md;
}

std::atomic<std::uint64_t> temp_counter{0};

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

ContentStore::ContentStore(const std::filesystem::path& state_dir,
                           const std::string& hash_algorithm,
                           std::size_t hash_length,
                           std::size_t cache_size)
  : state_dir_(state_dir)
  , hash_algorithm_(hash_algorithm)
  , hash_length_(hash_length)
  , digest_(lookup_digest(hash_algorithm))
  , cache_(cache_size) {
  BOOST_LOG_TRIVIAL(info) << "Content store: Initializing with state dir " << state_dir_.string()
                          << ", algorithm " << hash_algorithm_ << ", length " << hash_length_;

  if (!digest_) {
    BOOST_LOG_TRIVIAL(error) << "Content store: Unknown hash algorithm: " << hash_algorithm_;
    throw UnsupportedAlgorithmError(hash_algorithm_);
  }

  const std::size_t max_length = static_cast<std::size_t>(EVP_MD_size(digest_)) * 2;
  if (hash_length_ == 0 || hash_length_ > max_length) {
    BOOST_LOG_TRIVIAL(error) << "Content store: Hash length " << hash_length_
                             << " outside 1.." << max_length << " for " << hash_algorithm_;
    throw std::invalid_argument("Content store: Hash length must be between 1 and " +
                                std::to_string(max_length) + " for " + hash_algorithm_);
  }

  std::error_code ec;
  std::filesystem::create_directories(state_dir_, ec);
  if (ec) {
    throw StoreError("Content store: Failed to create state dir " + state_dir_.string() +
                     ": " + ec.message());
  }
  BOOST_LOG_TRIVIAL(debug) << "Content store: State dir created/verified at: " << state_dir_.string();
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

std::string ContentStore::hash(const std::string& content) const {
  unsigned char md_value[EVP_MAX_MD_SIZE];
  unsigned int md_len;

  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw StoreError("Content store: Failed to create hash context");
  }

  if (!EVP_DigestInit_ex(ctx, digest_, nullptr)) {
    EVP_MD_CTX_free(ctx);
    throw StoreError("Content store: Failed to initialize hash context");
  }

  if (!EVP_DigestUpdate(ctx, content.data(), content.size())) {
    EVP_MD_CTX_free(ctx);
    throw StoreError("Content store: Failed to update hash");
  }

  if (!EVP_DigestFinal_ex(ctx, md_value, &md_len)) {
    EVP_MD_CTX_free(ctx);
    throw StoreError("Content store: Failed to finalize hash");
  }

  EVP_MD_CTX_free(ctx);

  std::stringstream ss;
  for (unsigned int i = 0; i < md_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(md_value[i]);
  }

  return ss.str().substr(0, hash_length_);
}

std::string ContentStore::save(const std::string& content) {
  const std::string digest = hash(content);
  BOOST_LOG_TRIVIAL(info) << "Content store: Saving " << content.size() << " bytes as " << digest;

  std::filesystem::path file_path = resolve_path(digest);
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Content store: Failed to create " << file_path.parent_path().string()
                             << ": " << ec.message();
    throw StoreError("Content store: Failed to create directory: " + ec.message());
  }

  write_file(file_path, content);
  BOOST_LOG_TRIVIAL(debug) << "Content store: Wrote " << file_path.string();

  // Only cache what made it to disk
  cache_.put(digest, content);
  return digest;
}

std::string ContentStore::load(const std::string& identifier) {
  std::string content;
  if (cache_.try_get(identifier, content)) {
    BOOST_LOG_TRIVIAL(debug) << "Content store: Cache hit for " << identifier;
    return content;
  }

  if (!is_valid_identifier(identifier)) {
    BOOST_LOG_TRIVIAL(debug) << "Content store: Rejecting malformed identifier: " << identifier;
    throw NotFoundError(identifier);
  }

  BOOST_LOG_TRIVIAL(debug) << "Content store: Cache miss for " << identifier << ", reading disk";
  if (!read_file(resolve_path(identifier), content)) {
    BOOST_LOG_TRIVIAL(info) << "Content store: No entry for " << identifier;
    throw NotFoundError(identifier);
  }

  cache_.put(identifier, content);
  return content;
}


//==============================================
// CAS STORAGE SUPPORT
//==============================================

std::filesystem::path ContentStore::resolve_path(const std::string& identifier) const {
  return state_dir_ / file_location(hash_algorithm_, hash_length_, identifier);
}

bool ContentStore::is_valid_identifier(const std::string& identifier) const {
  if (identifier.size() != hash_length_) {
    return false;
  }
  return std::all_of(identifier.begin(), identifier.end(), [](char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
  });
}

void ContentStore::write_file(const std::filesystem::path& file_path, const std::string& content) const {
  std::filesystem::path temp_path = file_path;
  temp_path += ".tmp." + std::to_string(::getpid()) + "." + std::to_string(temp_counter++);

  {
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw StoreError("Content store: Failed to create file: " + temp_path.string());
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.flush();
    if (!file) {
      file.close();
      std::error_code ignored;
      std::filesystem::remove(temp_path, ignored);
      throw StoreError("Content store: Failed to write file: " + temp_path.string());
    }
  }

  // rename is atomic within a directory, so readers see old or new content
  std::error_code ec;
  std::filesystem::rename(temp_path, file_path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    BOOST_LOG_TRIVIAL(error) << "Content store: Failed to move " << temp_path.string()
                             << " into place: " << ec.message();
    throw StoreError("Content store: Failed to move file into place: " + ec.message());
  }
}

bool ContentStore::read_file(const std::filesystem::path& file_path, std::string& content) const {
  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    // Tell a missing entry apart from an unreadable one only after the open failed
    std::error_code ec;
    auto status = std::filesystem::status(file_path, ec);
    if (!std::filesystem::exists(status)) {
      return false;
    }
    throw StoreError("Content store: Failed to open file: " + file_path.string());
  }

  std::ostringstream output;
  char buffer[4096];

  while (file.read(buffer, sizeof(buffer))) {
    output.write(buffer, file.gcount());
  }

  // Handle final partial chunk if present
  if (file.gcount() > 0) {
    output.write(buffer, file.gcount());
  }

  if (file.bad()) {
    throw StoreError("Content store: Failed to read file: " + file_path.string());
  }

  content = output.str();
  return true;
}

} // namespace store
} // namespace golink
