/**
 * @file logger_adapter.cpp
 * @brief logger_system backend and the transfer audit trail
 */

#include <boxlink/integration/logger_adapter.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <mutex>

namespace boxlink::integration {

namespace {

constexpr std::array<kcenon::logger::log_level, 7> backend_levels{
    kcenon::logger::log_level::trace,
    kcenon::logger::log_level::debug,
    kcenon::logger::log_level::info,
    kcenon::logger::log_level::warn,
    kcenon::logger::log_level::error,
    kcenon::logger::log_level::fatal,
    kcenon::logger::log_level::off,
};

kcenon::logger::log_level to_backend(log_level level) {
    const auto index = static_cast<std::size_t>(level);
    return index < backend_levels.size() ? backend_levels[index]
                                         : kcenon::logger::log_level::off;
}

void append_json_string(std::string& out, std::string_view value) {
    out += '"';
    for (char c : value) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

std::string utc_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto secs = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()).count() % 1000;

    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &secs);
#else
    gmtime_r(&secs, &utc);
#endif

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);
    char stamp[48];
    std::snprintf(stamp, sizeof(stamp), "%s.%03dZ", date, static_cast<int>(millis));
    return stamp;
}

/**
 * @brief Append-only JSON-lines file of transfer milestones
 *
 * One object per line, numbered from 1 for each process lifetime.
 * Every record is flushed before append() returns.
 */
class transfer_audit_log {
public:
    bool open(const std::filesystem::path& path) {
        std::lock_guard lock(mutex_);
        out_.open(path, std::ios::out | std::ios::app);
        next_seq_ = 1;
        return out_.is_open();
    }

    void close() {
        std::lock_guard lock(mutex_);
        if (out_.is_open()) {
            out_.close();
        }
    }

    void append(std::string_view event_type,
                std::string_view outcome,
                const logger_adapter::audit_fields& fields) {
        std::string line;
        line.reserve(160);
        line += "{\"timestamp\":";
        append_json_string(line, utc_timestamp());
        line += ",\"event_type\":";
        append_json_string(line, event_type);
        line += ",\"outcome\":";
        append_json_string(line, outcome);
        for (const auto& [key, value] : fields) {
            line += ',';
            append_json_string(line, key);
            line += ':';
            append_json_string(line, value);
        }

        std::lock_guard lock(mutex_);
        if (!out_.is_open()) {
            return;
        }
        line += ",\"seq\":" + std::to_string(next_seq_++) + "}\n";
        out_ << line;
        out_.flush();
    }

private:
    std::mutex mutex_;
    std::ofstream out_;
    std::uint64_t next_seq_{1};
};

}  // namespace

log_level log_level_from_string(std::string_view name) noexcept {
    if (name == "trace") return log_level::trace;
    if (name == "debug") return log_level::debug;
    if (name == "info") return log_level::info;
    if (name == "warn" || name == "warning") return log_level::warn;
    if (name == "error") return log_level::error;
    if (name == "fatal" || name == "critical") return log_level::fatal;
    if (name == "off") return log_level::off;
    return log_level::info;
}

// =============================================================================
// Backend state
// =============================================================================

class logger_adapter::impl {
public:
    ~impl() { shutdown(); }

    void initialize(const logger_config& config) {
        std::lock_guard lock(mutex_);
        if (initialized_) {
            return;
        }

        config_ = config;
        min_level_.store(config.min_level);

        if (config.enable_file || config.enable_audit_log) {
            std::filesystem::create_directories(config.log_directory);
        }

        backend_ = std::make_unique<kcenon::logger::logger>(config.async_mode,
                                                            config.buffer_size);
        backend_->set_min_level(to_backend(config.min_level));
        if (config.enable_console) {
            backend_->add_writer(std::make_unique<kcenon::logger::console_writer>());
        }
        if (config.enable_file) {
            backend_->add_writer(std::make_unique<kcenon::logger::rotating_file_writer>(
                (config.log_directory / "boxlink.log").string(),
                config.max_file_size_mb * 1024 * 1024,
                config.max_files));
        }
        backend_->start();

        audit_enabled_ = config.enable_audit_log &&
                         audit_.open(config.log_directory / "transfer_audit.json");
        if (config.enable_audit_log && !audit_enabled_) {
            backend_->log(kcenon::logger::log_level::warn,
                          "Cannot open transfer audit log in " +
                              config.log_directory.string());
        }

        initialized_ = true;
    }

    void shutdown() {
        std::lock_guard lock(mutex_);
        if (!initialized_) {
            return;
        }
        audit_.close();
        audit_enabled_ = false;
        if (backend_) {
            backend_->flush();
            backend_->stop();
            backend_.reset();
        }
        initialized_ = false;
    }

    [[nodiscard]] bool is_initialized() const noexcept { return initialized_.load(); }

    void log(log_level level, const std::string& message) {
        if (!initialized_ || !backend_ || !is_level_enabled(level)) {
            return;
        }
        backend_->log(to_backend(level), message);
    }

    [[nodiscard]] bool is_level_enabled(log_level level) const noexcept {
        return level != log_level::off && level >= min_level_.load();
    }

    void flush() {
        if (backend_) {
            backend_->flush();
        }
    }

    void set_min_level(log_level level) {
        min_level_.store(level);
        if (backend_) {
            backend_->set_min_level(to_backend(level));
        }
    }

    [[nodiscard]] log_level min_level() const noexcept { return min_level_.load(); }

    [[nodiscard]] const logger_config& config() const { return config_; }

    void audit(std::string_view event_type, std::string_view outcome,
               const audit_fields& fields) {
        if (initialized_ && audit_enabled_) {
            audit_.append(event_type, outcome, fields);
        }
    }

private:
    std::mutex mutex_;
    std::atomic<bool> initialized_{false};
    std::atomic<bool> audit_enabled_{false};
    std::atomic<log_level> min_level_{log_level::info};
    logger_config config_;
    std::unique_ptr<kcenon::logger::logger> backend_;
    transfer_audit_log audit_;
};

std::unique_ptr<logger_adapter::impl> logger_adapter::pimpl_ =
    std::make_unique<logger_adapter::impl>();

// =============================================================================
// Facade
// =============================================================================

void logger_adapter::initialize(const logger_config& config) { pimpl_->initialize(config); }

void logger_adapter::shutdown() { pimpl_->shutdown(); }

auto logger_adapter::is_initialized() noexcept -> bool { return pimpl_->is_initialized(); }

void logger_adapter::log(log_level level, const std::string& message) {
    pimpl_->log(level, message);
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    return pimpl_->is_level_enabled(level);
}

void logger_adapter::flush() { pimpl_->flush(); }

void logger_adapter::set_min_level(log_level level) { pimpl_->set_min_level(level); }

auto logger_adapter::get_min_level() noexcept -> log_level { return pimpl_->min_level(); }

auto logger_adapter::get_config() -> const logger_config& { return pimpl_->config(); }

// =============================================================================
// Transfer audit trail
// =============================================================================

void logger_adapter::log_transfer_completed(const std::string& box_name,
                                            std::int64_t transaction_id,
                                            std::int64_t image_count) {
    write_audit_log("TRANSFER_COMPLETED", "success",
                    {{"box", box_name},
                     {"transaction_id", std::to_string(transaction_id)},
                     {"image_count", std::to_string(image_count)}});
}

void logger_adapter::log_receive_completed(const std::string& box_name,
                                           std::int64_t transaction_id,
                                           std::int64_t image_count) {
    write_audit_log("RECEIVE_COMPLETED", "success",
                    {{"box", box_name},
                     {"transaction_id", std::to_string(transaction_id)},
                     {"image_count", std::to_string(image_count)}});
}

void logger_adapter::log_send_failed(const std::string& box_name,
                                     std::int64_t transaction_id,
                                     int status_code,
                                     const std::string& message) {
    write_audit_log("SEND_FAILED", "failure",
                    {{"box", box_name},
                     {"transaction_id", std::to_string(transaction_id)},
                     {"status_code", std::to_string(status_code)},
                     {"message", message}});
}

void logger_adapter::log_box_registration(const std::string& box_name,
                                          const std::string& send_method,
                                          bool added) {
    write_audit_log(added ? "BOX_ADDED" : "BOX_REMOVED", "success",
                    {{"box", box_name}, {"send_method", send_method}});
}

void logger_adapter::write_audit_log(std::string_view event_type,
                                     std::string_view outcome,
                                     const audit_fields& fields) {
    pimpl_->audit(event_type, outcome, fields);
}

}  // namespace boxlink::integration
