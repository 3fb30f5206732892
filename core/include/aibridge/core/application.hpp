#pragma once

#include <asio.hpp>

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>

#include "aibridge/core/config/configuration.hpp"
#include "aibridge/core/logging/logger.hpp"

#ifndef AIBRIDGE_SOURCE_DIR
#define AIBRIDGE_SOURCE_DIR "."
#endif

namespace aibridge::core {

inline std::filesystem::path default_config_path() {
    return std::filesystem::path{AIBRIDGE_SOURCE_DIR} / "config" / "aibridge.init.toml";
}

struct ApplicationOptions {
    std::string identity{"aibridge"};
    std::string role{"shell"};
    std::filesystem::path config_path{default_config_path()};
    logging::Level log_level{logging::Level::info};
};

// Process scaffolding shared by both hosts: configuration, logging and the I/O thread
// that drives every pipe operation.
class Application {
public:
    explicit Application(ApplicationOptions options = {});
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    void initialize();
    void start();
    void shutdown();

    [[nodiscard]] const ApplicationOptions& options() const noexcept { return options_; }
    [[nodiscard]] bool running() const noexcept { return running_.load(); }
    [[nodiscard]] const config::Configuration& configuration() const noexcept { return configuration_; }
    [[nodiscard]] std::shared_ptr<logging::Logger> logger() const noexcept { return logger_; }
    [[nodiscard]] asio::io_context& io_context() noexcept { return io_context_; }

private:
    void load_configuration();
    void initialize_logging();
    void log_lifecycle(const std::string& stage) const;

    asio::io_context io_context_;
    std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> io_work_;
    std::thread io_thread_;

    ApplicationOptions options_{};
    config::Configuration configuration_{};
    std::shared_ptr<logging::Logger> logger_;
    std::atomic<bool> initialized_{false};
    std::atomic<bool> running_{false};
};

}  // namespace aibridge::core
