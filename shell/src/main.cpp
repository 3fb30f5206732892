#include "aibridge/core/application.hpp"
#include "aibridge/core/ipc/errors.hpp"
#include "aibridge/core/utils/terminal.hpp"
#include "aibridge/shell/channel.hpp"
#include "aibridge/shell/code_poster.hpp"
#include "aibridge/shell/command_runner.hpp"
#include "aibridge/shell/context_provider.hpp"
#include "aibridge/shell/host.hpp"

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

using namespace aibridge::core::utils;
using namespace aibridge;

namespace {

void print_usage() {
    Terminal::println("AIBRIDGE SHELL", Color::BrightCyan);
    Terminal::println("Usage: aibridge-shell [options]");
    Terminal::println("\nOptions:");
    Terminal::println("  -c, --config <path>  Path to configuration file");
    Terminal::println("  -h, --help           Show this help");
    Terminal::println("\nInput:");
    Terminal::print("  <text>      ", Color::Green);
    Terminal::println("Send a query to the assistant");
    Terminal::print("  <empty>     ", Color::Green);
    Terminal::println("Run the code the assistant inserted");
    Terminal::print("  /status     ", Color::Yellow);
    Terminal::println("Show the channel status");
    Terminal::print("  /setup      ", Color::Magenta);
    Terminal::println("Set up the channel again");
    Terminal::print("  /exit       ", Color::Red);
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

bool wants_help(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "--help" || arg == "-h") {
            return true;
        }
    }
    return false;
}

// Line editor of the demo host: posted code is shown and kept until the next empty line.
class ConsoleEditor : public shell::InputEditor {
public:
    bool is_input_ready() const override { return ready_.load(); }

    void set_ready(bool ready) { ready_ = ready; }

    void insert_text(std::string_view text) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            buffer_ = std::string{text};
        }
        Terminal::println("");
        Terminal::println("[code from assistant, press Enter to run]", Color::Gray);
        Terminal::println(text, Color::Cyan);
        Terminal::prompt("aibridge> ");
    }

    void revert_pending_input() override {
        std::lock_guard<std::mutex> lock(mutex_);
        buffer_.reset();
    }

    std::optional<std::string> take() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto code = std::move(buffer_);
        buffer_.reset();
        return code;
    }

private:
    std::atomic<bool> ready_{false};
    std::mutex mutex_;
    std::optional<std::string> buffer_;
};

void print_status(shell::ShellChannel& channel) {
    const auto status = channel.status();
    Terminal::print("Channel: ", Color::Default);
    const auto color = status == core::ipc::ConnectionStatus::Connected ? Color::BrightGreen
                     : status == core::ipc::ConnectionStatus::SettingUp ? Color::Yellow
                                                                         : Color::Red;
    Terminal::println(std::string(core::ipc::to_string(status)), color);
    Terminal::print("Pipe:    ", Color::Default);
    Terminal::println(channel.pipe_name(), Color::Cyan);
}

void run_inserted_code(shell::ContextProvider& context, const std::string& code) {
    try {
        const auto result = shell::run_accepted_code(context, code);
        Terminal::print(result.output, result.had_error ? Color::Red : Color::Default);
    } catch (const std::system_error& e) {
        Terminal::println(e.what(), Color::Red);
    }
}

}  // namespace

int main(int argc, char** argv) {
    if (wants_help(argc, argv)) {
        print_usage();
        return 0;
    }

    core::ApplicationOptions options;
    options.identity = "aibridge-shell";
    options.role = "shell";
    options.config_path = parse_config_path(argc, argv, core::default_config_path());

    core::Application app(options);
    try {
        app.initialize();
    } catch (const std::exception& e) {
        Terminal::println(std::string("Failed to initialize: ") + e.what(), Color::Red);
        return 1;
    }
    app.start();

    auto logger = app.logger();
    ConsoleEditor editor;
    shell::ContextProvider context;
    shell::CommandRunner runner(logger);
    shell::CodePoster poster(editor, nullptr, logger);

    auto handlers = shell::make_handlers(context, runner, poster);

    int exit_code = 0;
    try {
        shell::ShellChannel channel(app.io_context(), logger, std::move(handlers),
                                    core::ipc::ChannelOptions::from_config(app.configuration(), core::ipc::ChannelSide::Shell));

        const auto name = channel.start_setup();
        Terminal::print("Start the assistant with: ", Color::Default);
        Terminal::println("aibridge-assistant --channel " + name, Color::BrightCyan);

        std::string line;
        while (true) {
            editor.set_ready(true);
            Terminal::prompt("aibridge> ");
            if (!std::getline(std::cin, line)) {
                break;
            }
            editor.set_ready(false);

            if (line == "/exit") {
                break;
            }
            if (line == "/status") {
                print_status(channel);
            } else if (line == "/setup") {
                try {
                    Terminal::println("Waiting for the assistant on " + channel.start_setup(), Color::Yellow);
                } catch (const std::exception& e) {
                    Terminal::println(e.what(), Color::Red);
                }
            } else if (line.empty()) {
                if (auto code = editor.take()) {
                    run_inserted_code(context, *code);
                }
            } else {
                try {
                    channel.post_query(core::ipc::PostQueryMessage{line, std::nullopt, std::nullopt});
                } catch (const core::ipc::IpcError& e) {
                    Terminal::println(e.what(), Color::Red);
                }
            }

            poster.on_idle();
        }
    } catch (const std::exception& e) {
        Terminal::println(std::string("Error: ") + e.what(), Color::Red);
        exit_code = 1;
    }

    app.shutdown();
    return exit_code;
}
