#include "aibridge/shell/context_provider.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

extern char** environ;

namespace aibridge::shell {

using json = nlohmann::json;

namespace {

bool contains_ignore_case(std::string_view haystack, std::string_view needle) {
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    return it != haystack.end();
}

Location working_directory() {
    std::error_code ec;
    auto path = std::filesystem::current_path(ec);
    return Location{"FileSystem", ec ? std::string{} : path.string()};
}

}  // namespace

ContextProvider::ContextProvider(LocationSource location, ScreenCapture capture)
    : location_(location ? std::move(location) : LocationSource{working_directory}),
      capture_(std::move(capture)) {
}

void ContextProvider::record_command(std::string command_line) {
    std::lock_guard<std::mutex> lock(history_mutex_);
    history_.push_back(HistoryEntry{next_history_id_++, std::move(command_line)});
    while (history_.size() > kHistoryLimit) {
        history_.pop_front();
    }
}

std::vector<HistoryEntry> ContextProvider::history() const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    return {history_.begin(), history_.end()};
}

core::ipc::PostContextMessage ContextProvider::provide(const core::ipc::AskContextMessage& request) const {
    using core::ipc::ContextType;

    switch (request.context_type) {
        case ContextType::CurrentLocation:
            return {current_location()};
        case ContextType::CommandHistory:
            return {command_history()};
        case ContextType::TerminalContent:
            return {terminal_content()};
        case ContextType::EnvironmentVariables:
            return {environment_variables(request.arguments)};
        default:
            throw std::invalid_argument("Unknown context type '" +
                                        std::to_string(static_cast<int>(request.context_type)) + "'");
    }
}

std::string ContextProvider::current_location() const {
    const auto location = location_();
    return json{{"Provider", location.provider}, {"Path", location.path}}.dump(-1, ' ', false,
                                                                               json::error_handler_t::replace);
}

std::string ContextProvider::command_history() const {
    auto entries = json::array();
    for (const auto& entry : history()) {
        entries.push_back(json{{"Id", entry.id}, {"CommandLine", entry.command_line}});
    }
    return entries.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::optional<std::string> ContextProvider::terminal_content() const {
    if (!capture_) {
        return std::nullopt;
    }
    return capture_();
}

std::string ContextProvider::environment_variables(const std::optional<std::vector<std::string>>& names) const {
    auto variables = json::object();

    if (names && !names->empty()) {
        for (const auto& name : *names) {
            if (name.empty()) {
                continue;
            }
            const char* value = std::getenv(name.c_str());
            if (value == nullptr) {
                variables[name] = "[env variable '" + name + "' is undefined]";
            } else {
                variables[name] = may_be_sensitive(name) ? std::string{kRedactedValue} : std::string{value};
            }
        }
        if (variables.empty()) {
            return "The specified environment variable names are invalid";
        }
        return variables.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string_view text{*entry};
        const auto eq = text.find('=');
        if (eq == std::string_view::npos || eq == 0) {
            continue;
        }
        const std::string name{text.substr(0, eq)};
        variables[name] = may_be_sensitive(name) ? std::string{kRedactedValue} : std::string{text.substr(eq + 1)};
    }
    return variables.dump(-1, ' ', false, json::error_handler_t::replace);
}

bool ContextProvider::may_be_sensitive(std::string_view name) {
    return contains_ignore_case(name, "key") || contains_ignore_case(name, "token") ||
           contains_ignore_case(name, "pass") || contains_ignore_case(name, "secret");
}

}  // namespace aibridge::shell
