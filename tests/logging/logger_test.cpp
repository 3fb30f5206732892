#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "aibridge/core/logging/logger.hpp"
#include "aibridge/core/logging/config.hpp"
#include "aibridge/core/config/configuration.hpp"

TEST_CASE("Logger API", "[logging]") {
    auto logger = std::make_shared<aibridge::core::logging::Logger>("test-logger");

    SECTION("Level setting and getting") {
        REQUIRE(logger->level() == aibridge::core::logging::Level::info);

        logger->set_level(aibridge::core::logging::Level::debug);
        REQUIRE(logger->level() == aibridge::core::logging::Level::debug);

        logger->set_level(aibridge::core::logging::Level::warn);
        REQUIRE(logger->level() == aibridge::core::logging::Level::warn);
    }

    SECTION("Logger name") {
        REQUIRE(logger->name() == "test-logger");
    }

    SECTION("Level string conversion") {
        using Level = aibridge::core::logging::Level;

        REQUIRE(aibridge::core::logging::level_to_string(Level::trace) == "TRACE");
        REQUIRE(aibridge::core::logging::level_to_string(Level::debug) == "DEBUG");
        REQUIRE(aibridge::core::logging::level_to_string(Level::info) == "INFO");
        REQUIRE(aibridge::core::logging::level_to_string(Level::warn) == "WARN");
        REQUIRE(aibridge::core::logging::level_to_string(Level::error) == "ERROR");
        REQUIRE(aibridge::core::logging::level_to_string(Level::critical) == "CRITICAL");

        REQUIRE(aibridge::core::logging::level_from_string("trace") == Level::trace);
        REQUIRE(aibridge::core::logging::level_from_string("DEBUG") == Level::debug);
        REQUIRE(aibridge::core::logging::level_from_string("info") == Level::info);
        REQUIRE(aibridge::core::logging::level_from_string("Warn") == Level::warn);
        REQUIRE(aibridge::core::logging::level_from_string("error") == Level::error);
        REQUIRE(aibridge::core::logging::level_from_string("critical") == Level::critical);
        REQUIRE(aibridge::core::logging::level_from_string("unknown") == Level::info);
    }

    SECTION("Log methods accept placeholders") {
        logger->set_level(aibridge::core::logging::Level::trace);

        logger->trace("trace message");
        logger->debug("debug message");
        logger->info("[pipe] '{}' connected", "aibridge_sh.1.test");
        logger->warn("[channel] ignoring unexpected '{}' message", "PostResult");
        logger->error("[command] {} failed with {}", "cmd-1", 127);
        logger->flush();
    }
}

TEST_CASE("LogConfig defaults", "[logging]") {
    using namespace aibridge::core::logging;

    SECTION("Default config") {
        auto config = LogConfig::default_config();
        REQUIRE(config.level == Level::info);
        REQUIRE(config.async == false);
        REQUIRE(config.queue_size == 8192);
        REQUIRE(config.flush_interval == std::chrono::seconds(3));
        REQUIRE(config.sinks.size() == 1);
        REQUIRE(config.sinks[0].type == SinkType::Console);
    }

    SECTION("Config validation") {
        auto config = LogConfig::default_config();
        REQUIRE(config.validate() == true);

        config.async = true;
        config.queue_size = 0;
        REQUIRE(config.validate() == false);

        config.queue_size = 1024;
        REQUIRE(config.validate() == true);

        SinkConfig file_sink;
        file_sink.type = SinkType::File;
        config.sinks.push_back(file_sink);
        REQUIRE(config.validate() == false);

        config.sinks.back().enabled = false;
        REQUIRE(config.validate() == true);
    }
}

TEST_CASE("Logger factory functions", "[logging]") {
    SECTION("Create logger with default config") {
        auto logger = aibridge::core::logging::create_logger("factory-test");
        REQUIRE(logger != nullptr);
        REQUIRE(logger->name() == "factory-test");
        REQUIRE(logger->level() == aibridge::core::logging::Level::info);
    }

    SECTION("Create logger with custom config") {
        auto config = aibridge::core::logging::LogConfig::default_config();
        config.level = aibridge::core::logging::Level::debug;

        auto logger = aibridge::core::logging::create_logger("custom-test", config);
        REQUIRE(logger != nullptr);
        REQUIRE(logger->name() == "custom-test");
        REQUIRE(logger->level() == aibridge::core::logging::Level::debug);
    }
}

TEST_CASE("File sink", "[logging]") {
    namespace fs = std::filesystem;
    using namespace aibridge::core::logging;

    const auto path = fs::temp_directory_path() / "aibridge_logger_test.log";
    fs::remove(path);

    {
        LogConfig config;
        SinkConfig sink;
        sink.type = SinkType::File;
        sink.path = path;
        sink.level = Level::debug;
        config.level = Level::debug;
        config.sinks.push_back(sink);

        auto logger = create_logger("file-test", config);
        logger->debug("[pipe] payload of {} bytes", 42);
        logger->flush();
    }

    std::ifstream input{path};
    REQUIRE(input.good());
    std::stringstream contents;
    contents << input.rdbuf();
    REQUIRE(contents.str().find("[pipe] payload of 42 bytes") != std::string::npos);
    REQUIRE(contents.str().find("[file-test]") != std::string::npos);

    input.close();
    fs::remove(path);
}

TEST_CASE("Logging initialization", "[logging]") {
    SECTION("Initialize with default config") {
        auto config = aibridge::core::logging::LogConfig::default_config();

        REQUIRE_NOTHROW(aibridge::core::logging::initialize_logging(config));
        REQUIRE_NOTHROW(aibridge::core::logging::initialize_logging(config));
    }

    SECTION("Invalid config is rejected") {
        auto config = aibridge::core::logging::LogConfig::default_config();
        config.async = true;
        config.queue_size = 0;

        aibridge::core::logging::shutdown_logging();
        REQUIRE_THROWS_AS(aibridge::core::logging::initialize_logging(config), std::runtime_error);
    }
}
