#pragma once

#include <cstddef>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <sys/types.h>

#include "aibridge/core/ipc/protocol.hpp"
#include "aibridge/core/logging/logger.hpp"

namespace aibridge::shell {

// Output beyond this is dropped and replaced by kTruncatedNotice.
inline constexpr std::size_t kMaxCommandOutput = 8u * 1024u * 1024u;
inline constexpr std::string_view kTruncatedNotice = "\n[output truncated]\n";

// Finished background results kept for AskCommandOutput; older ones are dropped.
inline constexpr std::size_t kMaxRetainedResults = 32;

/**
 * @brief Executes RunCommand requests through /bin/sh, capturing stdout and stderr together.
 *
 * Non-blocking runs reply with a command id; the result is handed out once
 * through AskCommandOutput and then forgotten. Each command runs in its own
 * process group, and destroying the runner terminates the ones still running.
 */
class CommandRunner {
public:
    explicit CommandRunner(std::shared_ptr<core::logging::Logger> logger = nullptr);
    ~CommandRunner();

    CommandRunner(const CommandRunner&) = delete;
    CommandRunner& operator=(const CommandRunner&) = delete;

    core::ipc::PostResultMessage run(const core::ipc::RunCommandMessage& request);
    core::ipc::PostResultMessage output(const core::ipc::AskCommandOutputMessage& request);

    // Background commands currently tracked, running or finished.
    [[nodiscard]] std::size_t tracked() const;

    /**
     * @brief Runs a command to completion.
     * @throws std::system_error if the shell cannot be started
     */
    static core::ipc::PostResultMessage execute(const std::string& command);

private:
    struct Background {
        pid_t pid{-1};
        std::future<core::ipc::PostResultMessage> result;
    };

    void prune_finished();

    std::shared_ptr<core::logging::Logger> logger_;

    mutable std::mutex mutex_;
    std::uint64_t next_id_{1};
    std::map<std::uint64_t, Background> commands_;
};

}  // namespace aibridge::shell
