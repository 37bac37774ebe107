/**
 * @file logger_adapter.hpp
 * @brief Adapter routing boxlink logging to logger_system
 *
 * Provides leveled logging through kcenon::logger and a JSON audit
 * trail for transfer milestones (send completed, receive completed,
 * send failures, peer registration).
 *
 * @see logger_system/include/kcenon/logger/core/logger.h
 */

#pragma once

#include <boxlink/compat/format.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace boxlink::integration {

/**
 * @brief Log severity levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

/**
 * @brief Parse a log level name ("trace" ... "fatal", "off")
 * @return Parsed level, or info for unknown names
 */
[[nodiscard]] log_level log_level_from_string(std::string_view name) noexcept;

/**
 * @brief Configuration for the logger adapter
 */
struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"logs"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    /// Enable console output
    bool enable_console{true};

    /// Enable file output
    bool enable_file{true};

    /// Enable the JSON transfer audit file
    bool enable_audit_log{true};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{100};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{10};

    /// Use asynchronous logging
    bool async_mode{true};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};
};

/**
 * @brief Static logging facade over logger_system
 *
 * Thread Safety: all methods are thread-safe. Calls made before
 * initialize() are dropped.
 */
class logger_adapter {
public:
    /// Extra key/value pairs of one audit record, written in order
    using audit_fields = std::vector<std::pair<std::string, std::string>>;

    // ─────────────────────────────────────────────────────
    // Initialization
    // ─────────────────────────────────────────────────────

    static void initialize(const logger_config& config);

    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Standard Logging
    // ─────────────────────────────────────────────────────

    template <typename... Args>
    static void debug(boxlink::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::debug, boxlink::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void info(boxlink::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, boxlink::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(boxlink::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, boxlink::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(boxlink::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, boxlink::compat::format(fmt, std::forward<Args>(args)...));
    }

    /**
     * @brief Log a preformatted message
     */
    static void log(log_level level, const std::string& message);

    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    // ─────────────────────────────────────────────────────
    // Transfer Audit Logging
    // ─────────────────────────────────────────────────────

    /**
     * @brief Record that every image of an outgoing transaction was delivered
     */
    static void log_transfer_completed(const std::string& box_name,
                                       std::int64_t transaction_id,
                                       std::int64_t image_count);

    /**
     * @brief Record that every image of an incoming transaction arrived
     */
    static void log_receive_completed(const std::string& box_name,
                                      std::int64_t transaction_id,
                                      std::int64_t image_count);

    /**
     * @brief Record a permanent send failure
     */
    static void log_send_failed(const std::string& box_name,
                                std::int64_t transaction_id,
                                int status_code,
                                const std::string& message);

    /**
     * @brief Record creation or removal of a peer relationship
     */
    static void log_box_registration(const std::string& box_name,
                                     const std::string& send_method,
                                     bool added);

    // ─────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> const logger_config&;

private:
    static void write_audit_log(std::string_view event_type,
                                std::string_view outcome,
                                const audit_fields& fields);

    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace boxlink::integration
