#ifndef GOLINK_STORE_ERROR_HPP
#define GOLINK_STORE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace golink::store {

class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message)
        : std::runtime_error(message) {}
};

// Identifier is neither cached nor on disk
class NotFoundError : public StoreError {
public:
    explicit NotFoundError(const std::string& key)
        : StoreError("Not found: " + key), key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

// Digest name not known to OpenSSL; raised at construction time
class UnsupportedAlgorithmError : public StoreError {
public:
    explicit UnsupportedAlgorithmError(const std::string& algorithm)
        : StoreError("Unsupported hash algorithm: " + algorithm) {}
};

} // namespace golink::store

#endif // GOLINK_STORE_ERROR_HPP
