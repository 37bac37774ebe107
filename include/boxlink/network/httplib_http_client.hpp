/**
 * @file httplib_http_client.hpp
 * @brief cpp-httplib implementation of http_client
 */

#pragma once

#include <boxlink/network/http_client.hpp>

#include <chrono>
#include <string>

namespace boxlink::network {

/**
 * @brief Client settings
 */
struct http_client_config {
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds read_timeout{60000};
    std::chrono::milliseconds write_timeout{60000};
};

/**
 * @brief Parsed form of an absolute http(s) URL
 */
struct parsed_url {
    std::string scheme_host_port;   ///< "http://host:port"
    std::string path_and_query;     ///< "/path?query", at least "/"
};

/**
 * @brief Split an absolute URL into origin and path
 *
 * @return error_codes::invalid_argument when the URL has no http(s) scheme
 *         or no host
 */
[[nodiscard]] auto parse_url(const std::string& url) -> Result<parsed_url>;

/**
 * @brief http_client backed by httplib::Client
 *
 * A new connection is opened per request, so one instance may be shared by
 * every delivery worker.
 */
class httplib_http_client final : public http_client {
public:
    explicit httplib_http_client(http_client_config config = {});

    [[nodiscard]] auto post(const std::string& url,
                            const client::byte_buffer& body,
                            const std::string& content_type)
        -> Result<http_response> override;

    [[nodiscard]] auto get(const std::string& url) -> Result<http_response> override;

    [[nodiscard]] auto del(const std::string& url) -> Result<http_response> override;

private:
    http_client_config config_;
};

}  // namespace boxlink::network
