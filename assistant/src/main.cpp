#include "aibridge/assistant/channel.hpp"
#include "aibridge/core/application.hpp"
#include "aibridge/core/ipc/errors.hpp"
#include "aibridge/core/utils/terminal.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace aibridge::core::utils;
using namespace aibridge;
using namespace aibridge::core::ipc;

namespace {

void print_usage() {
    Terminal::println("AIBRIDGE ASSISTANT", Color::BrightCyan);
    Terminal::println("Usage: aibridge-assistant --channel <name> [options]");
    Terminal::println("\nOptions:");
    Terminal::println("  --channel <name>     Pipe name printed by aibridge-shell");
    Terminal::println("  -c, --config <path>  Path to configuration file");
    Terminal::println("  -h, --help           Show this help");
    Terminal::println("\nCommands:");
    Terminal::print("  /context <location|history|terminal|env> [names...]  ", Color::Green);
    Terminal::println("Ask the shell for context");
    Terminal::print("  /run <command>                                      ", Color::Yellow);
    Terminal::println("Run a command in the shell and wait");
    Terminal::print("  /run-async <command>                                ", Color::Yellow);
    Terminal::println("Start a command in the shell");
    Terminal::print("  /output <id>                                        ", Color::Yellow);
    Terminal::println("Get the output of a started command");
    Terminal::print("  /code <block> [;; <block>...]                       ", Color::Magenta);
    Terminal::println("Post code to the shell's input line");
    Terminal::print("  /status                                             ", Color::Cyan);
    Terminal::println("Show the channel status");
    Terminal::print("  /exit                                               ", Color::Red);
    Terminal::println("Quit");
}

std::filesystem::path parse_config_path(int argc, char** argv, std::filesystem::path default_path) {
    std::filesystem::path path = std::move(default_path);
    if (const char* env = std::getenv("AIBRIDGE_CONFIG_PATH")) {
        path = env;
    }
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            path = argv[++i];
        }
    }
    return path;
}

std::optional<std::string> find_option(int argc, char** argv, std::string_view name) {
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string_view{argv[i]} == name) {
            return std::string{argv[i + 1]};
        }
    }
    return std::nullopt;
}

bool has_flag(int argc, char** argv, std::string_view name, std::string_view alias) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == name || arg == alias) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream stream{text};
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

std::vector<std::string> split_blocks(const std::string& text) {
    std::vector<std::string> blocks;
    std::size_t start = 0;
    while (true) {
        const auto pos = text.find(";;", start);
        auto block = core::config::Configuration::trim(text.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
        if (!block.empty()) {
            blocks.push_back(std::move(block));
        }
        if (pos == std::string::npos) {
            break;
        }
        start = pos + 2;
    }
    return blocks;
}

std::optional<ContextType> parse_context_type(std::string_view name) {
    if (name == "location") return ContextType::CurrentLocation;
    if (name == "history") return ContextType::CommandHistory;
    if (name == "terminal") return ContextType::TerminalContent;
    if (name == "env") return ContextType::EnvironmentVariables;
    return std::nullopt;
}

void print_result(const PostResultMessage& result) {
    Terminal::println(result.output, result.had_error ? Color::Red : Color::Default);
    if (result.exception) {
        Terminal::println("exception: " + *result.exception, Color::Red);
    }
}

void handle_command(assistant::AssistantChannel& channel, const std::string& line) {
    const auto space = line.find(' ');
    const std::string command = line.substr(0, space);
    const std::string rest = space == std::string::npos ? std::string{} : line.substr(space + 1);

    if (command == "/status") {
        Terminal::print("Channel: ");
        Terminal::println(std::string(to_string(channel.status())), Color::Cyan);
    } else if (command == "/context") {
        auto words = split_words(rest);
        const auto type = words.empty() ? std::nullopt : parse_context_type(words.front());
        if (!type) {
            Terminal::println("Usage: /context <location|history|terminal|env> [names...]", Color::Yellow);
            return;
        }
        AskContextMessage request{*type, std::nullopt};
        if (words.size() > 1) {
            request.arguments = std::vector<std::string>(words.begin() + 1, words.end());
        }
        const auto reply = channel.ask_context(request);
        Terminal::println(reply.context_info.value_or("<no context>"), Color::Cyan);
    } else if (command == "/run" || command == "/run-async") {
        if (rest.empty()) {
            Terminal::println("Usage: " + command + " <command>", Color::Yellow);
            return;
        }
        print_result(channel.run_command(RunCommandMessage{rest, command == "/run"}));
    } else if (command == "/output") {
        if (rest.empty()) {
            Terminal::println("Usage: /output <id>", Color::Yellow);
            return;
        }
        print_result(channel.ask_command_output(AskCommandOutputMessage{rest}));
    } else if (command == "/code") {
        channel.post_code(PostCodeMessage{split_blocks(rest)});
        Terminal::println("Code posted.", Color::Gray);
    } else {
        Terminal::println("Unknown command: " + command, Color::Yellow);
    }
}

}  // namespace

int main(int argc, char** argv) {
    if (has_flag(argc, argv, "--help", "-h")) {
        print_usage();
        return 0;
    }

    const auto shell_pipe = find_option(argc, argv, "--channel");
    if (!shell_pipe) {
        print_usage();
        return 2;
    }

    core::ApplicationOptions options;
    options.identity = "aibridge-assistant";
    options.role = "assistant";
    options.config_path = parse_config_path(argc, argv, core::default_config_path());

    core::Application app(options);
    try {
        app.initialize();
    } catch (const std::exception& e) {
        Terminal::println(std::string("Failed to initialize: ") + e.what(), Color::Red);
        return 1;
    }
    app.start();

    int exit_code = 0;
    try {
        assistant::AssistantChannel channel(
            app.io_context(), app.logger(),
            [](const PostQueryMessage& query) {
                Terminal::println("");
                Terminal::print("[query] ", Color::BrightGreen);
                Terminal::println(query.query);
                Terminal::prompt("assistant> ");
            },
            ChannelOptions::from_config(app.configuration(), core::ipc::ChannelSide::Assistant));

        channel.connect(*shell_pipe);
        Terminal::println("Connected to " + *shell_pipe, Color::BrightGreen);

        std::string line;
        while (true) {
            Terminal::prompt("assistant> ");
            if (!std::getline(std::cin, line) || line == "/exit") {
                break;
            }
            if (line.empty()) {
                continue;
            }
            try {
                handle_command(channel, line);
            } catch (const IpcError& e) {
                Terminal::println(e.what(), Color::Red);
            } catch (const std::invalid_argument& e) {
                Terminal::println(e.what(), Color::Red);
            }
        }
    } catch (const std::exception& e) {
        Terminal::println(std::string("Error: ") + e.what(), Color::Red);
        exit_code = 1;
    }

    app.shutdown();
    return exit_code;
}
