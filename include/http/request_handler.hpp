#pragma once

#include <string>
#include <boost/beast/http.hpp>
#include "store/content_store.hpp"
#include "utils/url.hpp"

namespace golink {
namespace http {

namespace beast_http = boost::beast::http;

using Request = beast_http::request<beast_http::string_body>;
using Response = beast_http::response<beast_http::string_body>;

// Translates shortener requests into ContentStore calls:
//   GET  /<id>  -> 302 with Location, or 404
//   POST <url>  -> 200 with http://<Host>/<id>, or 400 "Invalid URL"
// Storage failures become 500 and never escape handle().
class RequestHandler {
public:
  // ---- CONSTRUCTOR ----
  explicit RequestHandler(store::ContentStore& store);


  // ---- REQUEST PROCESSING ----
  Response handle(const Request& request);

  // Final path segment of a request target, ignoring query and fragment
  static std::string extract_identifier(const std::string& target);

private:
  // ---- PARAMETERS ----
  store::ContentStore& store_;


  // ---- METHOD HANDLERS ----
  Response handle_get(const Request& request);
  Response handle_post(const Request& request);


  // ---- RESPONSE BUILDERS ----
  static Response make_response(const Request& request, beast_http::status status);
  static Response make_text_response(const Request& request, beast_http::status status,
                                     const std::string& body);
};

} // namespace http
} // namespace golink
