#pragma once
#include <memory>
#include <string>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

namespace beast = boost::beast;
namespace http = beast::http;

namespace common {

class RestApiHandlerBase {
public:
  virtual ~RestApiHandlerBase() = default;

  // Never throws: handler failures become a 500 JSON answer
  http::response<http::string_body> handleRequest(http::request<http::string_body>&& req) {
    const auto version = req.version();
    const bool keep_alive = req.keep_alive();
    try {
      auto response = doHandleRequest(std::move(req));
      response.version(version);
      response.keep_alive(keep_alive);
      return response;
    } catch (const std::exception& e) {
      auto response = createErrorResponse(http::status::internal_server_error,
                                          "Internal server error: " + std::string(e.what()));
      response.version(version);
      response.keep_alive(keep_alive);
      return response;
    }
  }

protected:
  virtual http::response<http::string_body> doHandleRequest(http::request<http::string_body>&& req) = 0;

  http::response<http::string_body> createJsonResponse(
    http::status status, const nlohmann::json& json);

  http::response<http::string_body> createTextResponse(
    http::status status, const std::string& text);

  http::response<http::string_body> createErrorResponse(
    http::status status, const std::string& message);
};

}
