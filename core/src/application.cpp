#include "aibridge/core/application.hpp"
#include "aibridge/core/logging/config.hpp"

#include <utility>

namespace aibridge::core {

Application::Application(ApplicationOptions options)
    : io_work_(std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(io_context_.get_executor())),
      options_(std::move(options)),
      logger_(std::make_shared<logging::Logger>(options_.identity)) {
    logger_->set_level(options_.log_level);
}

Application::~Application() {
    shutdown();
}

void Application::initialize() {
    bool expected = false;
    if (!initialized_.compare_exchange_strong(expected, true)) {
        return;
    }

    load_configuration();
    initialize_logging();
    log_lifecycle("initialized");
}

void Application::start() {
    if (!initialized_) {
        initialize();
    }

    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }

    io_thread_ = std::thread([this]() {
        io_context_.run();
    });
    log_lifecycle("I/O thread started");
}

void Application::shutdown() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return;
    }

    log_lifecycle("shutting down");
    io_work_.reset();
    io_context_.stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
    logger_->flush();
}

void Application::log_lifecycle(const std::string& stage) const {
    logger_->info("[{}|{}] {}", options_.role, options_.identity, stage);
}

void Application::load_configuration() {
    // A missing file means built-in defaults; a malformed one is an error.
    configuration_ = config::Configuration::load_or_default(options_.config_path);
    if (configuration_.source_path().empty()) {
        logger_->debug("No configuration at {}, using defaults", options_.config_path.string());
    } else {
        logger_->info("Loaded configuration from {}", options_.config_path.string());
    }
}

void Application::initialize_logging() {
    if (!configuration_.contains("logging.level") && !configuration_.contains("logging.sinks[0].type")) {
        logger_->set_level(options_.log_level);
        return;
    }

    logging::initialize_logging(configuration_);
    auto log_config = logging::LogConfig::from_toml(configuration_);
    logger_ = logging::create_logger(options_.identity, log_config);
}

}  // namespace aibridge::core
