/**
 * @file rest_types.hpp
 * @brief Common types and utilities for the REST API
 *
 * HTTP status codes, JSON helpers, and the mapping from boxlink error codes
 * to HTTP responses.
 */

#pragma once

#include <boxlink/core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace boxlink::web {

/**
 * @enum http_status
 * @brief HTTP status codes used by the endpoints
 */
enum class http_status : std::uint16_t {
  // Success
  ok = 200,
  created = 201,
  no_content = 204,

  // Client errors
  bad_request = 400,
  not_found = 404,
  conflict = 409,

  // Server errors
  internal_server_error = 500,
  service_unavailable = 503
};

/**
 * @brief Escape a string for JSON
 * @param s Input string
 * @return JSON-escaped string
 */
[[nodiscard]] inline std::string json_escape(std::string_view s) {
  std::string result;
  result.reserve(s.size() + 10);
  for (char c : s) {
    switch (c) {
    case '"':
      result += "\\\"";
      break;
    case '\\':
      result += "\\\\";
      break;
    case '\b':
      result += "\\b";
      break;
    case '\f':
      result += "\\f";
      break;
    case '\n':
      result += "\\n";
      break;
    case '\r':
      result += "\\r";
      break;
    case '\t':
      result += "\\t";
      break;
    default:
      result += c;
      break;
    }
  }
  return result;
}

/**
 * @brief Create JSON error response body
 * @param code Machine-readable error code
 * @param message Human-readable message
 * @return JSON string
 */
[[nodiscard]] inline std::string make_error_json(std::string_view code,
                                                 std::string_view message) {
  return std::string(R"({"error":{"code":")") + std::string(code) +
         R"(","message":")" + json_escape(message) + R"("}})";
}

/**
 * @brief HTTP status for a failed operation
 *
 * Lookup failures map to 404, rejected input to 400, everything else to
 * 500.
 */
[[nodiscard]] inline http_status to_http_status(const error_info &error) {
  switch (error.code) {
  case error_codes::box_not_found:
  case error_codes::unknown_token:
  case error_codes::outbox_entry_not_found:
  case error_codes::inbox_entry_not_found:
    return http_status::not_found;
  case error_codes::malformed_base_url:
  case error_codes::invalid_box_name:
  case error_codes::wrong_send_method:
  case error_codes::empty_transfer:
  case error_codes::dataset_not_found:
  case error_codes::invalid_transfer_parameters:
  case error_codes::decompression_error:
  case error_codes::wire_format_error:
    return http_status::bad_request;
  case error_codes::duplicate_box:
    return http_status::conflict;
  default:
    return http_status::internal_server_error;
  }
}

/**
 * @brief Short error code string for a failed operation
 */
[[nodiscard]] inline const char *to_error_code(http_status status) {
  switch (status) {
  case http_status::not_found:
    return "NOT_FOUND";
  case http_status::bad_request:
    return "BAD_REQUEST";
  case http_status::conflict:
    return "CONFLICT";
  case http_status::service_unavailable:
    return "SERVICE_UNAVAILABLE";
  default:
    return "INTERNAL_ERROR";
  }
}

} // namespace boxlink::web
