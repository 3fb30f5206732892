#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace aibridge::core {
namespace config {
class Configuration;
}
}

namespace aibridge::core::logging {

// Log levels
enum class Level {
    trace = 0,
    debug,
    info,
    warn,
    error,
    critical
};

// Sink types
enum class SinkType {
    Console,
    File,
    RotatingFile
};

// Sink configuration
struct SinkConfig {
    SinkType type{SinkType::Console};
    bool enabled{true};
    Level level{Level::info};

    // File-specific options
    std::filesystem::path path;
    std::size_t max_size{10 * 1024 * 1024};  // 10MB
    std::size_t max_files{5};

    std::string pattern;
};

// Main logging configuration
struct LogConfig {
    Level level{Level::info};
    std::string pattern{"%Y-%m-%d %H:%M:%S.%e [%n] [%l] %v"};

    // Both processes are interactive; synchronous logging keeps the console ordered.
    bool async{false};
    std::size_t queue_size{8192};
    std::chrono::seconds flush_interval{3};

    std::vector<SinkConfig> sinks;

    static LogConfig default_config();
    static LogConfig from_toml(const config::Configuration& config);

    bool validate() const;

private:
    void add_default_sinks();
};

}  // namespace aibridge::core::logging
