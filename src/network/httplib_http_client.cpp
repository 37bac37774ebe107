/**
 * @file httplib_http_client.cpp
 * @brief Implementation of the cpp-httplib peer client
 */

#include <boxlink/network/httplib_http_client.hpp>

#include <boxlink/compat/format.hpp>
#include <boxlink/integration/logger_adapter.hpp>

#include <httplib.h>

namespace boxlink::network {

namespace {

constexpr const char* module_name = "http_client";

[[nodiscard]] httplib::Client make_client(const std::string& origin,
                                          const http_client_config& config) {
    httplib::Client cli(origin);
    cli.set_connection_timeout(config.connect_timeout);
    cli.set_read_timeout(config.read_timeout);
    cli.set_write_timeout(config.write_timeout);
    return cli;
}

[[nodiscard]] Result<http_response> to_response(const httplib::Result& res,
                                                const char* method,
                                                const std::string& url) {
    if (!res) {
        return make_error<http_response>(
            error_codes::http_transport_error,
            boxlink::compat::format("{} {} failed: {}", method, url,
                                    httplib::to_string(res.error())),
            module_name);
    }

    http_response response;
    response.status_code = res->status;
    response.body.assign(res->body.begin(), res->body.end());
    return ok(std::move(response));
}

}  // namespace

Result<parsed_url> parse_url(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return make_error<parsed_url>(error_codes::invalid_argument,
                                      "URL has no scheme: " + url, module_name);
    }

    auto scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") {
        return make_error<parsed_url>(error_codes::invalid_argument,
                                      "Unsupported URL scheme: " + scheme, module_name);
    }

    auto host_start = scheme_end + 3;
    auto path_start = url.find('/', host_start);
    if (path_start == host_start) {
        return make_error<parsed_url>(error_codes::invalid_argument,
                                      "URL has no host: " + url, module_name);
    }

    parsed_url parsed;
    if (path_start == std::string::npos) {
        if (host_start >= url.size()) {
            return make_error<parsed_url>(error_codes::invalid_argument,
                                          "URL has no host: " + url, module_name);
        }
        parsed.scheme_host_port = url;
        parsed.path_and_query = "/";
    } else {
        parsed.scheme_host_port = url.substr(0, path_start);
        parsed.path_and_query = url.substr(path_start);
    }
    return ok(std::move(parsed));
}

httplib_http_client::httplib_http_client(http_client_config config)
    : config_(config) {}

Result<http_response> httplib_http_client::post(const std::string& url,
                                                const client::byte_buffer& body,
                                                const std::string& content_type) {
    auto parsed_result = parse_url(url);
    if (parsed_result.is_err()) {
        return Result<http_response>(parsed_result.error());
    }
    const auto& parsed = parsed_result.value();

    integration::logger_adapter::debug("POST {} ({} bytes)", url, body.size());

    auto cli = make_client(parsed.scheme_host_port, config_);
    auto res = cli.Post(parsed.path_and_query,
                        reinterpret_cast<const char*>(body.data()), body.size(),
                        content_type);
    return to_response(res, "POST", url);
}

Result<http_response> httplib_http_client::get(const std::string& url) {
    auto parsed_result = parse_url(url);
    if (parsed_result.is_err()) {
        return Result<http_response>(parsed_result.error());
    }
    const auto& parsed = parsed_result.value();

    integration::logger_adapter::debug("GET {}", url);

    auto cli = make_client(parsed.scheme_host_port, config_);
    auto res = cli.Get(parsed.path_and_query);
    return to_response(res, "GET", url);
}

Result<http_response> httplib_http_client::del(const std::string& url) {
    auto parsed_result = parse_url(url);
    if (parsed_result.is_err()) {
        return Result<http_response>(parsed_result.error());
    }
    const auto& parsed = parsed_result.value();

    integration::logger_adapter::debug("DELETE {}", url);

    auto cli = make_client(parsed.scheme_host_port, config_);
    auto res = cli.Delete(parsed.path_and_query);
    return to_response(res, "DELETE", url);
}

}  // namespace boxlink::network
