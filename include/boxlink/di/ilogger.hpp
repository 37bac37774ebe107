/**
 * @file ilogger.hpp
 * @brief Injectable logger interface for boxlink components
 *
 * Every component that logs takes a std::shared_ptr<ILogger>. Production
 * wiring passes a LoggerService (which forwards to logger_adapter); tests
 * pass a recording logger and inspect what was written.
 *
 * @code
 * auto logger = std::make_shared<di::LoggerService>("push");
 * box_push_engine engine(peer, outbox, builder, http, pool, {}, logger);
 * @endcode
 */

#pragma once

#include <boxlink/integration/logger_adapter.hpp>
#include <boxlink/compat/format.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace boxlink::di {

/**
 * @brief Sink for component log output
 *
 * Implementations provide write() and is_enabled(); the level helpers and
 * the *_fmt variants are built on top of them. Formatting is skipped when
 * the level is disabled.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    /// Emit one message at @p level
    virtual void write(integration::log_level level, std::string_view message) = 0;

    [[nodiscard]] virtual bool is_enabled(integration::log_level level) const noexcept = 0;

    void debug(std::string_view message) { write(integration::log_level::debug, message); }
    void info(std::string_view message) { write(integration::log_level::info, message); }
    void warn(std::string_view message) { write(integration::log_level::warn, message); }
    void error(std::string_view message) { write(integration::log_level::error, message); }

    template <typename... Args>
    void debug_fmt(boxlink::compat::format_string<Args...> fmt, Args&&... args) {
        write_fmt(integration::log_level::debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info_fmt(boxlink::compat::format_string<Args...> fmt, Args&&... args) {
        write_fmt(integration::log_level::info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn_fmt(boxlink::compat::format_string<Args...> fmt, Args&&... args) {
        write_fmt(integration::log_level::warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error_fmt(boxlink::compat::format_string<Args...> fmt, Args&&... args) {
        write_fmt(integration::log_level::error, fmt, std::forward<Args>(args)...);
    }

protected:
    ILogger() = default;
    ILogger(const ILogger&) = default;
    ILogger& operator=(const ILogger&) = default;

private:
    template <typename... Args>
    void write_fmt(integration::log_level level,
                   boxlink::compat::format_string<Args...> fmt,
                   Args&&... args) {
        if (is_enabled(level)) {
            write(level, boxlink::compat::format(fmt, std::forward<Args>(args)...));
        }
    }
};

/// Logger that drops everything; the default when none is injected
class NullLogger final : public ILogger {
public:
    void write(integration::log_level /*level*/, std::string_view /*message*/) override {}

    [[nodiscard]] bool is_enabled(integration::log_level /*level*/) const noexcept override {
        return false;
    }
};

/**
 * @brief Logger forwarding to the process-wide logger_adapter
 *
 * When constructed with a component name, messages are prefixed with
 * "[component] " so the server log shows which worker wrote them.
 */
class LoggerService final : public ILogger {
public:
    LoggerService() = default;

    explicit LoggerService(std::string component)
        : prefix_(component.empty() ? std::string{} : "[" + component + "] ") {}

    void write(integration::log_level level, std::string_view message) override {
        if (prefix_.empty()) {
            integration::logger_adapter::log(level, std::string{message});
        } else {
            integration::logger_adapter::log(level, prefix_ + std::string{message});
        }
    }

    [[nodiscard]] bool is_enabled(integration::log_level level) const noexcept override {
        return integration::logger_adapter::is_level_enabled(level);
    }

private:
    std::string prefix_;
};

[[nodiscard]] inline std::shared_ptr<ILogger> null_logger() {
    static auto instance = std::make_shared<NullLogger>();
    return instance;
}

}  // namespace boxlink::di
