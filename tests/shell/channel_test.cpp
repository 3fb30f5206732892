#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "aibridge/core/ipc/errors.hpp"
#include "aibridge/core/ipc/pipe.hpp"
#include "aibridge/shell/channel.hpp"
#include "../support/test_io.hpp"

using namespace aibridge::core::ipc;
using aibridge::shell::ChannelHandlers;
using aibridge::shell::ShellChannel;
using aibridge::test::IoThread;
using aibridge::test::eventually;
using aibridge::test::quiet_logger;
using aibridge::test::unique_pipe_name;

namespace {

// The assistant side of the handshake, driven by hand.
struct FakeAssistant {
    std::shared_ptr<ClientPipe> to_shell;
    std::shared_ptr<ServerPipe> from_shell;

    static FakeAssistant attach(asio::io_context& io, const std::string& shell_pipe) {
        auto logger = quiet_logger("fake-assistant");
        FakeAssistant fake;
        fake.from_shell = std::make_shared<ServerPipe>(io, logger, unique_pipe_name("as"));
        REQUIRE_FALSE(fake.from_shell->listen());

        fake.to_shell = std::make_shared<ClientPipe>(io, logger, shell_pipe);
        REQUIRE_FALSE(fake.to_shell->connect(std::chrono::seconds(2)));
        REQUIRE_FALSE(fake.to_shell->send(AskConnectionMessage{fake.from_shell->name()}));
        REQUIRE_FALSE(fake.from_shell->wait_for_connection(std::chrono::seconds(2)));
        return fake;
    }

    Message request(const Message& message) {
        REQUIRE_FALSE(to_shell->send(message));
        auto reply = to_shell->receive();
        REQUIRE(reply.has_value());
        return *reply;
    }

    void close() {
        to_shell->close();
        from_shell->close();
    }
};

ChannelOptions options_with(std::chrono::milliseconds timeout) {
    ChannelOptions options;
    options.pipe_name = unique_pipe_name("sh");
    options.connection_timeout = timeout;
    return options;
}

template <typename Error>
void require_cause(const NotConnectedError& error) {
    REQUIRE(error.cause() != nullptr);
    REQUIRE_THROWS_AS(std::rethrow_exception(error.cause()), Error);
}

}  // namespace

TEST_CASE("Shell channel handshake", "[shell][channel]") {
    IoThread runner;
    auto logger = quiet_logger("shell-channel");

    SECTION("Assistant connects and queries flow to it") {
        ShellChannel channel(runner.io, logger, {}, options_with(std::chrono::seconds(2)));
        REQUIRE(channel.status() == ConnectionStatus::NotStarted);

        const auto name = channel.start_setup();
        REQUIRE(name == channel.pipe_name());

        auto fake = FakeAssistant::attach(runner.io, name);
        REQUIRE(channel.connected());
        REQUIRE(channel.status() == ConnectionStatus::Connected);

        const PostQueryMessage query{"how do I list files?", std::nullopt, std::nullopt};
        channel.post_query(query);
        REQUIRE(fake.from_shell->receive() == Message{query});
    }

    SECTION("Posting before setup") {
        ShellChannel channel(runner.io, logger, {}, options_with(std::chrono::seconds(2)));
        REQUIRE_THROWS_WITH(channel.post_query(PostQueryMessage{"q", std::nullopt, std::nullopt}),
                            Catch::Matchers::StartsWith("Channel has not been setup yet."));
    }

    SECTION("Setting up over a live channel is refused") {
        ShellChannel channel(runner.io, logger, {}, options_with(std::chrono::seconds(2)));
        auto fake = FakeAssistant::attach(runner.io, channel.start_setup());
        REQUIRE(channel.connected());
        REQUIRE_THROWS_AS(channel.start_setup(), std::logic_error);
    }

    SECTION("Timeout fails setup quickly") {
        ShellChannel channel(runner.io, logger, {}, options_with(std::chrono::milliseconds(50)));
        const auto start = std::chrono::steady_clock::now();
        channel.start_setup();

        bool setup_in_progress = false;
        REQUIRE_FALSE(channel.check_connection(true, setup_in_progress));
        REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(500));
        REQUIRE(channel.status() == ConnectionStatus::SetupFailed);

        try {
            channel.post_query(PostQueryMessage{"q", std::nullopt, std::nullopt});
            FAIL("post_query should have thrown");
        } catch (const NotConnectedError& e) {
            REQUIRE_THAT(e.what(), Catch::Matchers::ContainsSubstring("could not be established"));
            require_cause<TimeoutError>(e);
        }

        REQUIRE_NOTHROW(channel.start_setup());
        REQUIRE_FALSE(channel.connected());
        REQUIRE(channel.status() == ConnectionStatus::SetupFailed);
    }

    SECTION("Reset and set up again") {
        ShellChannel channel(runner.io, logger, {}, options_with(std::chrono::seconds(2)));
        auto first = FakeAssistant::attach(runner.io, channel.start_setup());
        REQUIRE(channel.connected());

        channel.reset();
        REQUIRE(channel.status() == ConnectionStatus::NotStarted);
        REQUIRE_FALSE(first.from_shell->receive().has_value());

        auto second = FakeAssistant::attach(runner.io, channel.start_setup());
        REQUIRE(channel.connected());
        channel.post_query(PostQueryMessage{"again", std::nullopt, std::nullopt});
        REQUIRE(second.from_shell->receive() == Message{PostQueryMessage{"again", std::nullopt, std::nullopt}});
    }

    SECTION("Wrong first message is a protocol violation") {
        ShellChannel channel(runner.io, logger, {}, options_with(std::chrono::seconds(2)));
        const auto name = channel.start_setup();

        auto client = std::make_shared<ClientPipe>(runner.io, logger, name);
        REQUIRE_FALSE(client->connect(std::chrono::seconds(2)));
        REQUIRE_FALSE(client->send(PostCodeMessage{{"ls"}}));

        REQUIRE_FALSE(channel.connected());
        REQUIRE(channel.status() == ConnectionStatus::SetupFailed);
        try {
            channel.post_query(PostQueryMessage{"q", std::nullopt, std::nullopt});
            FAIL("post_query should have thrown");
        } catch (const NotConnectedError& e) {
            REQUIRE_THAT(e.what(), Catch::Matchers::ContainsSubstring("'AskConnection'"));
            REQUIRE_THAT(e.what(), Catch::Matchers::ContainsSubstring("'PostCode'"));
            require_cause<ProtocolViolationError>(e);
        }
    }

    SECTION("Non-blocking check reports a running setup") {
        ShellChannel channel(runner.io, logger, {}, options_with(std::chrono::seconds(2)));
        channel.start_setup();

        bool setup_in_progress = false;
        REQUIRE_FALSE(channel.check_connection(false, setup_in_progress));
        REQUIRE(setup_in_progress);
        REQUIRE(channel.status() == ConnectionStatus::SettingUp);

        channel.reset();
        REQUIRE(channel.status() == ConnectionStatus::NotStarted);
    }

    SECTION("Assistant going away is noticed") {
        ShellChannel channel(runner.io, logger, {}, options_with(std::chrono::seconds(2)));
        auto fake = FakeAssistant::attach(runner.io, channel.start_setup());
        REQUIRE(channel.connected());

        fake.close();
        REQUIRE(eventually([&channel] { return channel.status() == ConnectionStatus::Disconnected; }));
        REQUIRE_THROWS_WITH(channel.post_query(PostQueryMessage{"q", std::nullopt, std::nullopt}),
                            Catch::Matchers::ContainsSubstring("Pipe connection status"));
    }
}

TEST_CASE("Shell channel dispatch", "[shell][channel]") {
    IoThread runner;
    auto logger = quiet_logger("shell-channel");

    SECTION("Requests reach their handlers") {
        std::atomic<int> run_calls{0};
        std::atomic<int> code_calls{0};
        std::vector<std::string> posted;

        ChannelHandlers handlers;
        handlers.on_ask_context = [](const AskContextMessage& request) {
            if (request.context_type != ContextType::CurrentLocation) {
                return PostContextMessage::none();
            }
            return PostContextMessage{std::string{R"({"Provider":"FileSystem","Path":"/tmp"})"}};
        };
        handlers.on_run_command = [&run_calls](const RunCommandMessage& request) {
            ++run_calls;
            return PostResultMessage{"ran " + request.command, false, false, std::nullopt};
        };
        handlers.on_ask_command_output = [](const AskCommandOutputMessage& request) {
            return PostResultMessage{"output of " + request.command_id, false, false, std::nullopt};
        };
        handlers.on_post_code = [&code_calls, &posted](const PostCodeMessage& message) {
            posted = message.code_blocks;
            ++code_calls;
        };

        ShellChannel channel(runner.io, logger, std::move(handlers), options_with(std::chrono::seconds(2)));
        auto fake = FakeAssistant::attach(runner.io, channel.start_setup());
        REQUIRE(channel.connected());

        auto context = fake.request(AskContextMessage{ContextType::CurrentLocation, std::nullopt});
        REQUIRE(std::get<PostContextMessage>(context).context_info ==
                std::string{R"({"Provider":"FileSystem","Path":"/tmp"})"});

        auto result = fake.request(RunCommandMessage{"ls", true});
        REQUIRE(std::get<PostResultMessage>(result).output == "ran ls");
        REQUIRE(run_calls == 1);

        result = fake.request(AskCommandOutputMessage{"cmd-7"});
        REQUIRE(std::get<PostResultMessage>(result).output == "output of cmd-7");

        REQUIRE_FALSE(fake.to_shell->send(PostCodeMessage{{"cd /tmp", "ls"}}));
        REQUIRE(eventually([&code_calls] { return code_calls == 1; }));
        REQUIRE(posted == std::vector<std::string>{"cd /tmp", "ls"});
    }

    SECTION("Missing handlers get neutral replies") {
        ShellChannel channel(runner.io, logger, {}, options_with(std::chrono::seconds(2)));
        auto fake = FakeAssistant::attach(runner.io, channel.start_setup());
        REQUIRE(channel.connected());

        auto context = fake.request(AskContextMessage{ContextType::CommandHistory, std::nullopt});
        REQUIRE_FALSE(std::get<PostContextMessage>(context).context_info.has_value());

        auto result = std::get<PostResultMessage>(fake.request(RunCommandMessage{"ls", false}));
        REQUIRE(result.output == "Command execution is not supported.");
        REQUIRE(result.had_error);

        result = std::get<PostResultMessage>(fake.request(AskCommandOutputMessage{"cmd-1"}));
        REQUIRE(result.output == "Retrieving command output is not supported.");
        REQUIRE(result.had_error);

        REQUIRE_FALSE(fake.to_shell->send(PostCodeMessage{{"ls"}}));
        REQUIRE(channel.connected());
    }

    SECTION("Throwing handlers do not stop the loop") {
        std::atomic<int> run_calls{0};
        ChannelHandlers handlers;
        handlers.on_ask_context = [](const AskContextMessage&) -> PostContextMessage {
            throw std::runtime_error("no terminal");
        };
        handlers.on_run_command = [&run_calls](const RunCommandMessage&) -> PostResultMessage {
            ++run_calls;
            throw std::runtime_error("boom");
        };
        handlers.on_ask_command_output = [](const AskCommandOutputMessage&) -> PostResultMessage {
            throw std::runtime_error("lost");
        };
        handlers.on_post_code = [](const PostCodeMessage&) { throw std::runtime_error("editor gone"); };

        ShellChannel channel(runner.io, logger, std::move(handlers), options_with(std::chrono::seconds(2)));
        auto fake = FakeAssistant::attach(runner.io, channel.start_setup());
        REQUIRE(channel.connected());

        auto result = std::get<PostResultMessage>(fake.request(RunCommandMessage{"ls", true}));
        REQUIRE(result.output == "Failed to execute the command due to an internal error.");
        REQUIRE(result.had_error);
        REQUIRE(result.exception == std::string{"boom"});

        REQUIRE_FALSE(fake.to_shell->send(PostCodeMessage{{"ls"}}));

        auto context = fake.request(AskContextMessage{ContextType::TerminalContent, std::nullopt});
        REQUIRE_FALSE(std::get<PostContextMessage>(context).context_info.has_value());

        result = std::get<PostResultMessage>(fake.request(AskCommandOutputMessage{"cmd-2"}));
        REQUIRE(result.output == "Failed to retrieve the command output due to an internal error.");
        REQUIRE(result.exception == std::string{"lost"});

        result = std::get<PostResultMessage>(fake.request(RunCommandMessage{"pwd", true}));
        REQUIRE(result.had_error);
        REQUIRE(run_calls == 2);
        REQUIRE(channel.status() == ConnectionStatus::Connected);
    }

    SECTION("Unexpected message kinds are ignored") {
        ShellChannel channel(runner.io, logger, {}, options_with(std::chrono::seconds(2)));
        auto fake = FakeAssistant::attach(runner.io, channel.start_setup());
        REQUIRE(channel.connected());

        REQUIRE_FALSE(fake.to_shell->send(PostResultMessage{"stray", false, false, std::nullopt}));
        auto result = std::get<PostResultMessage>(fake.request(RunCommandMessage{"ls", true}));
        REQUIRE(result.output == "Command execution is not supported.");
    }

    SECTION("Replies too large to send are replaced") {
        ChannelHandlers handlers;
        handlers.on_ask_context = [](const AskContextMessage&) {
            return PostContextMessage{std::string(kMaxPayloadSize + 1, 'x')};
        };
        handlers.on_run_command = [](const RunCommandMessage& request) {
            if (request.blocking) {
                return PostResultMessage{std::string(kMaxPayloadSize + 1, 'a'), false, false, std::nullopt};
            }
            return PostResultMessage{"small", false, false, std::nullopt};
        };

        ShellChannel channel(runner.io, logger, std::move(handlers), options_with(std::chrono::seconds(2)));
        auto fake = FakeAssistant::attach(runner.io, channel.start_setup());
        REQUIRE(channel.connected());

        auto result = std::get<PostResultMessage>(fake.request(RunCommandMessage{"yes", true}));
        REQUIRE(result.had_error);
        REQUIRE(result.output == "The result is too large to be sent.");

        auto context = fake.request(AskContextMessage{ContextType::EnvironmentVariables, std::nullopt});
        REQUIRE_FALSE(std::get<PostContextMessage>(context).context_info.has_value());

        result = std::get<PostResultMessage>(fake.request(RunCommandMessage{"true", false}));
        REQUIRE(result.output == "small");
        REQUIRE(channel.status() == ConnectionStatus::Connected);
    }
}
