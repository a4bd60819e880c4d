#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace golink {
namespace store {

// Maps a digest to its sharded location relative to the state directory:
// {algorithm}/l{length}/{digest[0:2]}/{digest[2:4]}/.../{digest}
// A shard segment is emitted for every even index below length - 2, so each
// directory level holds at most 256 children. Never touches the filesystem.
std::filesystem::path file_location(const std::string& algorithm, std::size_t length,
                                    const std::string& digest);

} // namespace store
} // namespace golink
