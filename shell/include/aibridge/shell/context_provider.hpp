#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "aibridge/core/ipc/protocol.hpp"

namespace aibridge::shell {

struct Location {
    std::string provider{"FileSystem"};
    std::string path;
};

struct HistoryEntry {
    std::int64_t id{0};
    std::string command_line;
};

/**
 * @brief Answers AskContext requests from the shell's own state.
 *
 * Location and screen capture come from host callbacks; command history is
 * recorded by the host and only the most recent entries are kept.
 */
class ContextProvider {
public:
    using LocationSource = std::function<Location()>;
    using ScreenCapture = std::function<std::optional<std::string>()>;

    static constexpr std::size_t kHistoryLimit = 5;
    static constexpr std::string_view kRedactedValue = "***<sensitive data redacted>***";

    // Defaults: the process working directory, and no screen capture.
    explicit ContextProvider(LocationSource location = {}, ScreenCapture capture = {});

    void record_command(std::string command_line);
    [[nodiscard]] std::vector<HistoryEntry> history() const;

    /**
     * @throws std::invalid_argument for an unknown context type
     */
    [[nodiscard]] core::ipc::PostContextMessage provide(const core::ipc::AskContextMessage& request) const;

    [[nodiscard]] std::string current_location() const;
    [[nodiscard]] std::string command_history() const;
    [[nodiscard]] std::optional<std::string> terminal_content() const;
    [[nodiscard]] std::string environment_variables(const std::optional<std::vector<std::string>>& names) const;

    // Case-insensitive match on "key", "token", "pass" or "secret".
    [[nodiscard]] static bool may_be_sensitive(std::string_view name);

private:
    LocationSource location_;
    ScreenCapture capture_;

    mutable std::mutex history_mutex_;
    std::deque<HistoryEntry> history_;
    std::int64_t next_history_id_{1};
};

}  // namespace aibridge::shell
