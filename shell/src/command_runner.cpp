#include "aibridge/shell/command_runner.hpp"

#include <array>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <csignal>
#include <optional>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace aibridge::shell {
namespace {

constexpr std::string_view kIdPrefix = "cmd-";

struct Child {
    pid_t pid{-1};
    int output_fd{-1};
};

// Starts "/bin/sh -c <command>" as the leader of a new process group, with
// stdout and stderr on one pipe.
Child spawn_shell(const std::string& command) {
    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), "failed to create the output pipe");
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int error = errno;
        static_cast<void>(::close(fds[0]));
        static_cast<void>(::close(fds[1]));
        throw std::system_error(error, std::generic_category(), "failed to start /bin/sh");
    }

    if (pid == 0) {
        static_cast<void>(::setpgid(0, 0));
        static_cast<void>(::dup2(fds[1], STDOUT_FILENO));
        static_cast<void>(::dup2(fds[1], STDERR_FILENO));
        ::execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        ::_exit(127);
    }

    // Also set from the parent so the group exists before anyone signals it.
    static_cast<void>(::setpgid(pid, pid));
    static_cast<void>(::close(fds[1]));
    return Child{pid, fds[0]};
}

core::ipc::PostResultMessage collect(Child child) {
    core::ipc::PostResultMessage result;
    bool truncated = false;

    std::array<char, 4096> buffer{};
    while (true) {
        const ssize_t count = ::read(child.output_fd, buffer.data(), buffer.size());
        if (count == 0) {
            break;
        }
        if (count < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }

        const auto room = kMaxCommandOutput - result.output.size();
        const auto size = static_cast<std::size_t>(count);
        if (size > room) {
            result.output.append(buffer.data(), room);
            truncated = true;
        } else {
            result.output.append(buffer.data(), size);
        }
    }
    static_cast<void>(::close(child.output_fd));

    int status = 0;
    while (::waitpid(child.pid, &status, 0) == -1) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "failed to wait for /bin/sh");
        }
    }

    if (truncated) {
        result.output.append(kTruncatedNotice);
    }
    result.had_error = !(WIFEXITED(status) && WEXITSTATUS(status) == 0);
    return result;
}

std::optional<std::uint64_t> parse_id(std::string_view id) {
    if (id.substr(0, kIdPrefix.size()) != kIdPrefix) {
        return std::nullopt;
    }
    id.remove_prefix(kIdPrefix.size());

    std::uint64_t value = 0;
    const auto [end, ec] = std::from_chars(id.data(), id.data() + id.size(), value);
    if (ec != std::errc{} || end != id.data() + id.size()) {
        return std::nullopt;
    }
    return value;
}

bool is_ready(const std::future<core::ipc::PostResultMessage>& result) {
    return result.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

}  // namespace

CommandRunner::CommandRunner(std::shared_ptr<core::logging::Logger> logger) : logger_(std::move(logger)) {}

CommandRunner::~CommandRunner() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, command] : commands_) {
        if (is_ready(command.result)) {
            continue;
        }
        if (logger_) {
            logger_->info("[command] terminating background command {}{}", kIdPrefix, id);
        }
        static_cast<void>(::kill(-command.pid, SIGTERM));
    }
    // The collecting threads finish once the process groups are gone.
    commands_.clear();
}

core::ipc::PostResultMessage CommandRunner::execute(const std::string& command) {
    return collect(spawn_shell(command));
}

core::ipc::PostResultMessage CommandRunner::run(const core::ipc::RunCommandMessage& request) {
    if (request.blocking) {
        if (logger_) {
            logger_->info("[command] running '{}'", request.command);
        }
        return execute(request.command);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    prune_finished();

    const auto child = spawn_shell(request.command);
    const auto number = next_id_++;
    commands_.emplace(number, Background{child.pid, std::async(std::launch::async, collect, child)});

    const std::string id = std::string{kIdPrefix} + std::to_string(number);
    if (logger_) {
        logger_->info("[command] started '{}' in the background as {}", request.command, id);
    }
    return core::ipc::PostResultMessage{id, false, false, std::nullopt};
}

core::ipc::PostResultMessage CommandRunner::output(const core::ipc::AskCommandOutputMessage& request) {
    std::future<core::ipc::PostResultMessage> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto number = parse_id(request.command_id);
        auto it = number ? commands_.find(*number) : commands_.end();
        if (it == commands_.end()) {
            return core::ipc::PostResultMessage{"No command with id '" + request.command_id + "' was found.", true,
                                                false, std::nullopt};
        }
        if (!is_ready(it->second.result)) {
            return core::ipc::PostResultMessage{"Command is still running.", false, false, std::nullopt};
        }
        finished = std::move(it->second.result);
        commands_.erase(it);
    }
    return finished.get();
}

std::size_t CommandRunner::tracked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return commands_.size();
}

void CommandRunner::prune_finished() {
    std::size_t finished = 0;
    for (const auto& [id, command] : commands_) {
        finished += is_ready(command.result) ? 1 : 0;
    }

    // Oldest ids first.
    for (auto it = commands_.begin(); it != commands_.end() && finished > kMaxRetainedResults;) {
        if (is_ready(it->second.result)) {
            if (logger_) {
                logger_->debug("[command] dropping unclaimed result of {}{}", kIdPrefix, it->first);
            }
            it = commands_.erase(it);
            --finished;
        } else {
            ++it;
        }
    }
}

}  // namespace aibridge::shell
