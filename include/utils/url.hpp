#ifndef GOLINK_UTILS_URL_HPP
#define GOLINK_UTILS_URL_HPP

#include <optional>
#include <string>

namespace golink::utils {

// Components of a URI reference as split by the RFC 3986 appendix B grammar.
// Absent components are nullopt; present-but-empty ones are empty strings.
struct UrlParts {
  std::string scheme;
  std::optional<std::string> authority;
  std::string path;
  std::optional<std::string> query;
  std::optional<std::string> fragment;
};

UrlParts parse_url(const std::string& url);

// Recomposes parts. Scheme is lowercased, empty query and fragment are dropped
std::string to_string(const UrlParts& parts);

// Parse-and-reserialize check for submitted URLs. Strips surrounding
// whitespace and C0 controls and drops embedded tabs. Returns an empty string
// for input that is empty afterwards or that carries CR, LF or NUL, which
// could never travel back out in a Location header.
std::string normalize_url(const std::string& url);

} // namespace golink::utils

#endif // GOLINK_UTILS_URL_HPP
