#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "aibridge/shell/context_provider.hpp"

using aibridge::core::ipc::AskContextMessage;
using aibridge::core::ipc::ContextType;
using aibridge::shell::ContextProvider;
using aibridge::shell::Location;
using json = nlohmann::json;

TEST_CASE("Context provider", "[shell][context]") {
    SECTION("Current location comes from the host") {
        ContextProvider provider([] { return Location{"FileSystem", "/home/dev/project"}; });
        const auto reply = provider.provide(AskContextMessage{ContextType::CurrentLocation, std::nullopt});

        REQUIRE(reply.context_info.has_value());
        const auto location = json::parse(*reply.context_info);
        REQUIRE(location["Provider"] == "FileSystem");
        REQUIRE(location["Path"] == "/home/dev/project");
    }

    SECTION("Default location is the working directory") {
        ContextProvider provider;
        const auto location = json::parse(provider.current_location());
        REQUIRE(location["Path"] == std::filesystem::current_path().string());
    }

    SECTION("History keeps the most recent commands") {
        ContextProvider provider;
        REQUIRE(json::parse(provider.command_history()).empty());

        for (int i = 1; i <= 7; ++i) {
            provider.record_command("echo " + std::to_string(i));
        }

        const auto history = json::parse(*provider.provide(AskContextMessage{ContextType::CommandHistory, std::nullopt})
                                              .context_info);
        REQUIRE(history.size() == ContextProvider::kHistoryLimit);
        REQUIRE(history.front()["Id"] == 3);
        REQUIRE(history.front()["CommandLine"] == "echo 3");
        REQUIRE(history.back()["Id"] == 7);
        REQUIRE(history.back()["CommandLine"] == "echo 7");
    }

    SECTION("Terminal content needs a screen capture") {
        ContextProvider without_capture;
        REQUIRE_FALSE(without_capture.provide(AskContextMessage{ContextType::TerminalContent, std::nullopt})
                          .context_info.has_value());

        ContextProvider with_capture({}, [] { return std::optional<std::string>{"$ make\nok\n"}; });
        REQUIRE(with_capture.provide(AskContextMessage{ContextType::TerminalContent, std::nullopt}).context_info ==
                std::string{"$ make\nok\n"});
    }

    SECTION("Named environment variables") {
        ::setenv("AIBRIDGE_TEST_PLAIN", "visible", 1);
        ::setenv("AIBRIDGE_TEST_API_KEY", "hunter2", 1);
        ::unsetenv("AIBRIDGE_TEST_MISSING");

        ContextProvider provider;
        const auto reply = provider.provide(AskContextMessage{
            ContextType::EnvironmentVariables,
            std::vector<std::string>{"AIBRIDGE_TEST_PLAIN", "AIBRIDGE_TEST_API_KEY", "AIBRIDGE_TEST_MISSING", ""}});

        const auto variables = json::parse(*reply.context_info);
        REQUIRE(variables.size() == 3);
        REQUIRE(variables["AIBRIDGE_TEST_PLAIN"] == "visible");
        REQUIRE(variables["AIBRIDGE_TEST_API_KEY"] == std::string{ContextProvider::kRedactedValue});
        REQUIRE(variables["AIBRIDGE_TEST_MISSING"] == "[env variable 'AIBRIDGE_TEST_MISSING' is undefined]");

        ::unsetenv("AIBRIDGE_TEST_PLAIN");
        ::unsetenv("AIBRIDGE_TEST_API_KEY");
    }

    SECTION("Only empty names") {
        ContextProvider provider;
        REQUIRE(provider.environment_variables(std::vector<std::string>{"", ""}) ==
                "The specified environment variable names are invalid");
    }

    SECTION("All environment variables, sensitive ones redacted") {
        ::setenv("AIBRIDGE_TEST_TOKEN", "abc", 1);
        ::setenv("AIBRIDGE_TEST_COLOR", "blue", 1);

        ContextProvider provider;
        const auto variables = json::parse(provider.environment_variables(std::nullopt));
        REQUIRE(variables["AIBRIDGE_TEST_COLOR"] == "blue");
        REQUIRE(variables["AIBRIDGE_TEST_TOKEN"] == std::string{ContextProvider::kRedactedValue});

        ::unsetenv("AIBRIDGE_TEST_TOKEN");
        ::unsetenv("AIBRIDGE_TEST_COLOR");
    }

    SECTION("Sensitive names") {
        REQUIRE(ContextProvider::may_be_sensitive("GITHUB_TOKEN"));
        REQUIRE(ContextProvider::may_be_sensitive("db_password"));
        REQUIRE(ContextProvider::may_be_sensitive("AWS_SECRET_ACCESS_KEY"));
        REQUIRE(ContextProvider::may_be_sensitive("ApiKey"));
        REQUIRE_FALSE(ContextProvider::may_be_sensitive("PATH"));
        REQUIRE_FALSE(ContextProvider::may_be_sensitive("HOME"));
    }

    SECTION("Unknown context type") {
        ContextProvider provider;
        REQUIRE_THROWS_AS(provider.provide(AskContextMessage{static_cast<ContextType>(9), std::nullopt}),
                          std::invalid_argument);
    }

    SECTION("Invalid UTF-8 is replaced") {
        ContextProvider provider([] { return Location{"FileSystem", "/tmp/caf\xe9"}; });
        provider.record_command("echo \xff\xfe");

        const auto location = json::parse(provider.current_location());
        REQUIRE(location["Path"] == "/tmp/caf\xef\xbf\xbd");

        const auto history = json::parse(provider.command_history());
        REQUIRE(history.size() == 1);
        REQUIRE(history[0]["CommandLine"] == "echo \xef\xbf\xbd\xef\xbf\xbd");
    }
}
