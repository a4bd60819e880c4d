#include "store/path_scheme.hpp"

namespace golink {
namespace store {

std::filesystem::path file_location(const std::string& algorithm, std::size_t length,
                                    const std::string& digest) {
  std::filesystem::path path = std::filesystem::path(algorithm) / ("l" + std::to_string(length));

  for (std::size_t i = 0; i + 2 < length; i += 2) {
    // Short digests simply run out of shard material
    if (i >= digest.size()) {
      break;
    }
    path /= digest.substr(i, 2);
  }

  path /= digest;
  return path;
}

} // namespace store
} // namespace golink
