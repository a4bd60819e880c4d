#include "http/request_handler.hpp"
#include "config/config.hpp"
#include <boost/log/trivial.hpp>

namespace golink {
namespace http {

//==============================================
// CONSTRUCTOR
//==============================================

RequestHandler::RequestHandler(store::ContentStore& store) : store_(store) {
  BOOST_LOG_TRIVIAL(debug) << "Request handler: Initialized";
}


//==============================================
// REQUEST PROCESSING
//==============================================

Response RequestHandler::handle(const Request& request) {
  BOOST_LOG_TRIVIAL(info) << "Request handler: " << request.method_string() << " " << request.target();

  try {
    switch (request.method()) {
      case beast_http::verb::get:
        return handle_get(request);
      case beast_http::verb::post:
        return handle_post(request);
      default:
        BOOST_LOG_TRIVIAL(warning) << "Request handler: Unsupported method " << request.method_string();
        return make_text_response(request, beast_http::status::not_implemented, "Not Implemented");
    }
  } catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Request handler: Storage failure: " << e.what();
    return make_text_response(request, beast_http::status::internal_server_error, "Internal Server Error");
  }
}

std::string RequestHandler::extract_identifier(const std::string& target) {
  std::string path = target.substr(0, target.find_first_of("?#"));
  const auto slash = path.rfind('/');
  if (slash == std::string::npos) {
    return path;
  }
  return path.substr(slash + 1);
}


//==============================================
// METHOD HANDLERS
//==============================================

Response RequestHandler::handle_get(const Request& request) {
  const std::string identifier = extract_identifier(std::string(request.target()));

  std::string content;
  try {
    content = store_.load(identifier);
  } catch (const store::NotFoundError&) {
    BOOST_LOG_TRIVIAL(info) << "Request handler: Unknown identifier '" << identifier << "'";
    return make_response(request, beast_http::status::not_found);
  }

  BOOST_LOG_TRIVIAL(info) << "Request handler: Redirecting " << identifier << " to " << content;
  Response response = make_response(request, beast_http::status::found);
  response.set(beast_http::field::location, content);
  return response;
}

Response RequestHandler::handle_post(const Request& request) {
  BOOST_LOG_TRIVIAL(debug) << "Request handler: POST headers: " << request.base();

  const std::string& submitted = request.body();
  if (utils::normalize_url(submitted).empty()) {
    BOOST_LOG_TRIVIAL(info) << "Request handler: Rejecting invalid URL of " << submitted.size() << " bytes";
    return make_text_response(request, beast_http::status::bad_request, "Invalid URL");
  }

  const std::string digest = store_.save(submitted);

  std::string host;
  auto host_it = request.find(beast_http::field::host);
  if (host_it != request.end()) {
    host = std::string(host_it->value());
  }

  return make_text_response(request, beast_http::status::ok, "http://" + host + "/" + digest);
}


//==============================================
// RESPONSE BUILDERS
//==============================================

Response RequestHandler::make_response(const Request& request, beast_http::status status) {
  Response response{status, request.version()};
  response.set(beast_http::field::server, std::string("golink/") + config::version);
  response.keep_alive(false);
  response.prepare_payload();
  return response;
}

Response RequestHandler::make_text_response(const Request& request, beast_http::status status,
                                            const std::string& body) {
  Response response{status, request.version()};
  response.set(beast_http::field::server, std::string("golink/") + config::version);
  response.set(beast_http::field::content_type, "text/plain");
  response.keep_alive(false);
  response.body() = body;
  response.prepare_payload();
  return response;
}

} // namespace http
} // namespace golink
