/**
 * @file http_client.hpp
 * @brief Minimal HTTP client abstraction used to talk to peer boxes
 */

#pragma once

#include <boxlink/client/box_types.hpp>
#include <boxlink/core/result.hpp>

#include <chrono>
#include <string>

namespace boxlink::network {

/**
 * @brief Response of a completed HTTP exchange
 *
 * Any status code is a successful exchange; only transport failures are
 * reported as errors by http_client.
 */
struct http_response {
    int status_code{0};
    client::byte_buffer body;

    [[nodiscard]] bool is_success() const noexcept {
        return status_code >= 200 && status_code < 300;
    }

    [[nodiscard]] std::string body_text() const {
        return std::string(body.begin(), body.end());
    }
};

/**
 * @brief HTTP client interface for peer communication
 *
 * All URLs are absolute ("http://host:port/path?query").
 */
class http_client {
public:
    virtual ~http_client() = default;

    [[nodiscard]] virtual auto post(const std::string& url,
                                    const client::byte_buffer& body,
                                    const std::string& content_type)
        -> Result<http_response> = 0;

    [[nodiscard]] virtual auto get(const std::string& url) -> Result<http_response> = 0;

    [[nodiscard]] virtual auto del(const std::string& url) -> Result<http_response> = 0;
};

}  // namespace boxlink::network
