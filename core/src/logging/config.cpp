#include "aibridge/core/logging/config.hpp"
#include "aibridge/core/logging/logger.hpp"
#include "aibridge/core/config/configuration.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string>

namespace aibridge::core::logging {

namespace {

std::string to_lower(const std::string& str) {
    std::string lower;
    lower.reserve(str.size());
    std::transform(str.begin(), str.end(), std::back_inserter(lower),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

SinkType sink_type_from_string(const std::string& str) {
    const auto lower = to_lower(str);
    if (lower == "file") return SinkType::File;
    if (lower == "rotating_file" || lower == "rotating") return SinkType::RotatingFile;
    return SinkType::Console;
}

// Accepts plain byte counts and KB/MB/GB suffixes ("10MB", "512kb").
std::size_t parse_size_string(const std::string& str) {
    std::size_t pos = 0;
    while (pos < str.size() && std::isdigit(static_cast<unsigned char>(str[pos]))) {
        ++pos;
    }
    if (pos == 0) {
        return 0;
    }

    std::size_t value = std::stoull(str.substr(0, pos));
    const auto unit = to_lower(str.substr(pos));
    if (unit.find("kb") != std::string::npos) return value * 1024;
    if (unit.find("mb") != std::string::npos) return value * 1024 * 1024;
    if (unit.find("gb") != std::string::npos) return value * 1024 * 1024 * 1024;
    return value;
}

}  // namespace

LogConfig LogConfig::default_config() {
    LogConfig config;
    config.add_default_sinks();
    return config;
}

LogConfig LogConfig::from_toml(const config::Configuration& config) {
    LogConfig log_config;

    if (config.contains("logging.level")) {
        log_config.level = level_from_string(config.get_string("logging.level"));
    }
    if (config.contains("logging.pattern")) {
        log_config.pattern = config.get_string("logging.pattern");
    }
    log_config.async = config.get_bool("logging.async", log_config.async);
    if (config.contains("logging.queue_size")) {
        log_config.queue_size = static_cast<std::size_t>(config.get_int("logging.queue_size", 8192));
    }
    if (config.contains("logging.flush_interval")) {
        log_config.flush_interval = std::chrono::seconds(config.get_int("logging.flush_interval", 3));
    }

    // [[logging.sinks]] tables are flattened to logging.sinks[N].key by the configuration parser.
    for (int i = 0;; ++i) {
        const std::string prefix = "logging.sinks[" + std::to_string(i) + "]";
        if (!config.contains(prefix + ".type")) {
            break;
        }

        SinkConfig sink;
        sink.type = sink_type_from_string(config.get_string(prefix + ".type"));
        sink.enabled = config.get_bool(prefix + ".enabled", true);
        sink.level = config.contains(prefix + ".level")
            ? level_from_string(config.get_string(prefix + ".level"))
            : log_config.level;
        if (config.contains(prefix + ".path")) {
            sink.path = config.get_string(prefix + ".path");
        }
        if (config.contains(prefix + ".max_size")) {
            sink.max_size = parse_size_string(config.get_string(prefix + ".max_size"));
        }
        if (config.contains(prefix + ".max_files")) {
            sink.max_files = static_cast<std::size_t>(config.get_int(prefix + ".max_files", 5));
        }
        sink.pattern = config.get_string(prefix + ".pattern");

        log_config.sinks.push_back(std::move(sink));
    }

    if (log_config.sinks.empty()) {
        log_config.add_default_sinks();
    }

    return log_config;
}

bool LogConfig::validate() const {
    if (level < Level::trace || level > Level::critical) {
        return false;
    }
    if (async && queue_size == 0) {
        return false;
    }

    for (const auto& sink : sinks) {
        if (!sink.enabled) {
            continue;
        }
        if (sink.level < Level::trace || sink.level > Level::critical) {
            return false;
        }
        if (sink.type != SinkType::Console && sink.path.empty()) {
            return false;
        }
        if (sink.type == SinkType::RotatingFile && (sink.max_size == 0 || sink.max_files == 0)) {
            return false;
        }
    }

    return true;
}

void LogConfig::add_default_sinks() {
    SinkConfig console_sink;
    console_sink.type = SinkType::Console;
    console_sink.level = level;
    sinks.push_back(console_sink);
}

}  // namespace aibridge::core::logging
