#include "utils/url.hpp"
#include <algorithm>
#include <cctype>
#include <regex>

namespace golink::utils {

namespace {

const std::regex& uri_regex() {
  static const std::regex re(R"(^(([^:/?#]+):)?(//([^/?#]*))?([^?#]*)(\?([^#]*))?(#(.*))?)",
                             std::regex::ECMAScript);
  return re;
}

bool is_strippable(char c) {
  return static_cast<unsigned char>(c) <= 0x20;
}

} // namespace

UrlParts parse_url(const std::string& url) {
  UrlParts parts;
  std::smatch match;

  // The grammar matches every string, so a failed search means nothing useful
  if (!std::regex_search(url, match, uri_regex())) {
    parts.path = url;
    return parts;
  }

  if (match[1].matched) {
    parts.scheme = match[2].str();
  }
  if (match[3].matched) {
    parts.authority = match[4].str();
  }
  parts.path = match[5].str();
  if (match[6].matched) {
    parts.query = match[7].str();
  }
  if (match[8].matched) {
    parts.fragment = match[9].str();
  }
  return parts;
}

std::string to_string(const UrlParts& parts) {
  std::string url;

  if (!parts.scheme.empty()) {
    std::string scheme = parts.scheme;
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    url += scheme + ":";
  }
  if (parts.authority) {
    url += "//" + *parts.authority;
  }
  url += parts.path;
  if (parts.query && !parts.query->empty()) {
    url += "?" + *parts.query;
  }
  if (parts.fragment && !parts.fragment->empty()) {
    url += "#" + *parts.fragment;
  }
  return url;
}

std::string normalize_url(const std::string& url) {
  if (url.find_first_of(std::string("\r\n\0", 3)) != std::string::npos) {
    return "";
  }

  auto first = std::find_if_not(url.begin(), url.end(), is_strippable);
  auto last = std::find_if_not(url.rbegin(), url.rend(), is_strippable).base();
  if (first >= last) {
    return "";
  }

  std::string cleaned(first, last);
  cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), '\t'), cleaned.end());

  return to_string(parse_url(cleaned));
}

} // namespace golink::utils
