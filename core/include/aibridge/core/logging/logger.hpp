#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "aibridge/core/logging/config.hpp"

namespace aibridge::core {

namespace config {
class Configuration;
}

namespace logging {

class Logger {
public:
    explicit Logger(std::string name);
    Logger(std::string name, const LogConfig* config);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = default;
    Logger& operator=(Logger&&) = default;

    void set_level(Level level) noexcept;
    [[nodiscard]] Level level() const noexcept;
    [[nodiscard]] const std::string& name() const noexcept;

    void log(Level level, const std::string& message);
    void flush();

    [[nodiscard]] static const char* level_to_string(Level level) noexcept;

    // Messages use {} placeholders.
    template <typename... Args>
    void log(Level level, std::string_view format, Args&&... args) {
        if (level < this->level()) {
            return;
        }

        if constexpr (sizeof...(Args) == 0) {
            log(level, std::string{format});
        } else {
            log(level, fmt::format(fmt::runtime(format), std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void trace(std::string_view format, Args&&... args) {
        log(Level::trace, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(std::string_view format, Args&&... args) {
        log(Level::debug, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(std::string_view format, Args&&... args) {
        log(Level::info, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(std::string_view format, Args&&... args) {
        log(Level::warn, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(std::string_view format, Args&&... args) {
        log(Level::error, format, std::forward<Args>(args)...);
    }

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

std::shared_ptr<Logger> create_logger(const std::string& name);
std::shared_ptr<Logger> create_logger(const std::string& name, const LogConfig& config);

void initialize_logging(const LogConfig& config);
void initialize_logging(const config::Configuration& config);

// Flushes and drops every registered logger.
void shutdown_logging();

Level level_from_string(const std::string& str);
std::string level_to_string(Level level);

}  // namespace logging
}  // namespace aibridge::core
