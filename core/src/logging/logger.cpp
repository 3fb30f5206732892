#include "aibridge/core/logging/logger.hpp"
#include "aibridge/core/config/configuration.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <vector>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace aibridge::core::logging {
namespace {

spdlog::level::level_enum to_spdlog_level(Level level) {
    switch (level) {
        case Level::trace:    return spdlog::level::trace;
        case Level::debug:    return spdlog::level::debug;
        case Level::info:     return spdlog::level::info;
        case Level::warn:     return spdlog::level::warn;
        case Level::error:    return spdlog::level::err;
        case Level::critical: return spdlog::level::critical;
        default:              return spdlog::level::info;
    }
}

Level from_spdlog_level(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace:    return Level::trace;
        case spdlog::level::debug:    return Level::debug;
        case spdlog::level::info:     return Level::info;
        case spdlog::level::warn:     return Level::warn;
        case spdlog::level::err:      return Level::error;
        case spdlog::level::critical: return Level::critical;
        default:                      return Level::info;
    }
}

// Interactive hosts write to stdout; diagnostics go to stderr so they never mix with it.
std::shared_ptr<spdlog::sinks::sink> create_spdlog_sink(const SinkConfig& config) {
    if (!config.enabled) {
        return nullptr;
    }

    std::shared_ptr<spdlog::sinks::sink> sink;
    switch (config.type) {
        case SinkType::Console:
            sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            break;
        case SinkType::File:
            sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.path.string(), false);
            break;
        case SinkType::RotatingFile:
            sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.path.string(), config.max_size, config.max_files);
            break;
        default:
            throw std::runtime_error("Unknown sink type");
    }

    sink->set_level(to_spdlog_level(config.level));
    if (!config.pattern.empty()) {
        sink->set_pattern(config.pattern);
    }
    return sink;
}

std::vector<std::shared_ptr<spdlog::sinks::sink>> create_sinks(const LogConfig& config) {
    std::vector<std::shared_ptr<spdlog::sinks::sink>> sinks;
    for (const auto& sink_config : config.sinks) {
        if (auto sink = create_spdlog_sink(sink_config)) {
            sinks.push_back(std::move(sink));
        }
    }
    return sinks;
}

std::once_flag g_thread_pool_once;
std::mutex g_logging_mutex;
bool g_logging_initialized = false;

std::shared_ptr<spdlog::logger> make_spdlog_logger(const std::string& name, const LogConfig& config) {
    auto sinks = create_sinks(config);
    std::shared_ptr<spdlog::logger> logger;
    if (config.async) {
        std::call_once(g_thread_pool_once, [&config] { spdlog::init_thread_pool(config.queue_size, 1); });
        logger = std::make_shared<spdlog::async_logger>(
            name, sinks.begin(), sinks.end(), spdlog::thread_pool(), spdlog::async_overflow_policy::block);
    } else {
        logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    }
    logger->set_pattern(config.pattern);
    logger->flush_on(spdlog::level::warn);
    logger->set_level(to_spdlog_level(config.level));
    return logger;
}

}  // namespace

class Logger::Impl {
public:
    explicit Impl(const std::string& name, const LogConfig* config = nullptr) : name_(name) {
        if (config) {
            spdlog_logger_ = make_spdlog_logger(name, *config);
        } else {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_pattern("%Y-%m-%d %H:%M:%S.%e [%n] [%l] %v");
            spdlog_logger_ = std::make_shared<spdlog::logger>(name, std::move(console_sink));
            spdlog_logger_->set_level(spdlog::level::info);
        }
    }

    void set_level(Level level) { spdlog_logger_->set_level(to_spdlog_level(level)); }
    Level level() const { return from_spdlog_level(spdlog_logger_->level()); }
    const std::string& name() const { return name_; }
    void log(Level level, const std::string& message) { spdlog_logger_->log(to_spdlog_level(level), message); }
    void flush() { spdlog_logger_->flush(); }

private:
    std::string name_;
    std::shared_ptr<spdlog::logger> spdlog_logger_;
};

Logger::Logger(std::string name) : impl_(std::make_unique<Impl>(name)) {}

Logger::Logger(std::string name, const LogConfig* config) : impl_(std::make_unique<Impl>(name, config)) {}

Logger::~Logger() = default;

void Logger::set_level(Level level) noexcept {
    impl_->set_level(level);
}

Level Logger::level() const noexcept {
    return impl_->level();
}

const std::string& Logger::name() const noexcept {
    return impl_->name();
}

void Logger::log(Level level, const std::string& message) {
    impl_->log(level, message);
}

void Logger::flush() {
    impl_->flush();
}

const char* Logger::level_to_string(Level level) noexcept {
    switch (level) {
        case Level::trace:    return "TRACE";
        case Level::debug:    return "DEBUG";
        case Level::info:     return "INFO";
        case Level::warn:     return "WARN";
        case Level::error:    return "ERROR";
        case Level::critical: return "CRITICAL";
        default:              return "UNKNOWN";
    }
}

std::shared_ptr<Logger> create_logger(const std::string& name) {
    return std::make_shared<Logger>(name);
}

std::shared_ptr<Logger> create_logger(const std::string& name, const LogConfig& config) {
    return std::make_shared<Logger>(name, &config);
}

void initialize_logging(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_logging_mutex);
    if (g_logging_initialized) {
        return;
    }

    if (!config.validate()) {
        throw std::runtime_error("Invalid logging configuration");
    }

    auto default_logger = make_spdlog_logger("aibridge", config);
    spdlog::set_default_logger(default_logger);
    if (config.async) {
        spdlog::flush_every(config.flush_interval);
    }
    g_logging_initialized = true;
}

void initialize_logging(const config::Configuration& config) {
    initialize_logging(LogConfig::from_toml(config));
}

void shutdown_logging() {
    std::lock_guard<std::mutex> lock(g_logging_mutex);
    spdlog::shutdown();
    g_logging_initialized = false;
}

Level level_from_string(const std::string& str) {
    std::string lower;
    lower.reserve(str.size());
    std::transform(str.begin(), str.end(), std::back_inserter(lower),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace") return Level::trace;
    if (lower == "debug") return Level::debug;
    if (lower == "info") return Level::info;
    if (lower == "warn") return Level::warn;
    if (lower == "error") return Level::error;
    if (lower == "critical") return Level::critical;
    return Level::info;
}

std::string level_to_string(Level level) {
    return Logger::level_to_string(level);
}

}  // namespace aibridge::core::logging
