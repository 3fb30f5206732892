#pragma once

#include <asio.hpp>

#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>

#include "aibridge/core/ipc/channel_options.hpp"
#include "aibridge/core/ipc/pipe.hpp"
#include "aibridge/core/ipc/protocol.hpp"
#include "aibridge/core/logging/logger.hpp"

namespace aibridge::shell {

using core::ipc::ChannelOptions;
using core::ipc::ConnectionStatus;

/**
 * @brief Local handlers for the requests the assistant sends to the shell.
 *
 * A missing handler, or one that throws, is answered with a neutral reply
 * and never stops the dispatch loop.
 */
struct ChannelHandlers {
    std::function<core::ipc::PostContextMessage(const core::ipc::AskContextMessage&)> on_ask_context;
    std::function<void(const core::ipc::PostCodeMessage&)> on_post_code;
    std::function<core::ipc::PostResultMessage(const core::ipc::RunCommandMessage&)> on_run_command;
    std::function<core::ipc::PostResultMessage(const core::ipc::AskCommandOutputMessage&)> on_ask_command_output;
};

/**
 * @brief Shell end of the bi-directional channel.
 *
 * Owns the listening pipe the assistant connects to, and the client pipe it
 * opens back toward the assistant once the handshake names it. Setup and the
 * receive loop run on one background thread per setup attempt.
 */
class ShellChannel {
public:
    ShellChannel(asio::io_context& io_context,
                 std::shared_ptr<core::logging::Logger> logger,
                 ChannelHandlers handlers,
                 ChannelOptions options = {});
    ~ShellChannel();

    ShellChannel(const ShellChannel&) = delete;
    ShellChannel& operator=(const ShellChannel&) = delete;

    [[nodiscard]] const std::string& pipe_name() const noexcept { return pipe_name_; }
    [[nodiscard]] const ChannelOptions& options() const noexcept { return options_; }

    /**
     * @brief Binds the listening pipe and starts the handshake in the background.
     * @return the pipe name the assistant has to connect to
     * @throws std::logic_error if a connected channel already exists
     * @throws core::ipc::ConnectionError if the pipe cannot be bound
     */
    std::string start_setup();

    /**
     * @brief Three-way check: setup finished successfully and both pipes are live.
     *
     * Non-blocking calls return false with @p setup_in_progress set while the
     * handshake is still running. Blocking calls wait for it to finish.
     */
    bool check_connection(bool blocking, bool& setup_in_progress);

    // Blocking form of check_connection.
    bool connected();

    [[nodiscard]] ConnectionStatus status() const;

    /**
     * @brief Sends a query to the assistant. Waits for a running setup first.
     * @throws core::ipc::NotConnectedError when there is no live channel
     * @throws core::ipc::IoError when the write fails
     */
    void post_query(const core::ipc::PostQueryMessage& message);

    // Tears down both pipes and the background thread. The channel can be set up again.
    void reset();

private:
    struct SetupState {
        std::shared_ptr<core::ipc::ServerPipe> server;
        std::shared_ptr<core::ipc::ClientPipe> client;
        std::promise<void> completion;
        std::shared_future<void> done;

        // Written by the worker before `completion` is set.
        bool success{false};
        std::exception_ptr failure;

        std::jthread worker;
    };

    [[nodiscard]] std::shared_ptr<SetupState> snapshot() const;

    void run(SetupState& state, std::stop_token token);
    void handshake(SetupState& state, std::stop_token token);
    void dispatch_loop(SetupState& state, std::stop_token token);
    void dispatch(core::ipc::ServerPipe& server, const core::ipc::Message& message);
    void reply(core::ipc::ServerPipe& server, const core::ipc::Message& message);

    core::ipc::PostContextMessage handle_ask_context(const core::ipc::AskContextMessage& message);
    void handle_post_code(const core::ipc::PostCodeMessage& message);
    core::ipc::PostResultMessage handle_run_command(const core::ipc::RunCommandMessage& message);
    core::ipc::PostResultMessage handle_ask_command_output(const core::ipc::AskCommandOutputMessage& message);

    asio::io_context& io_context_;
    std::shared_ptr<core::logging::Logger> logger_;
    ChannelHandlers handlers_;
    ChannelOptions options_;
    std::string pipe_name_;

    mutable std::mutex mutex_;
    std::shared_ptr<SetupState> state_;
};

}  // namespace aibridge::shell
