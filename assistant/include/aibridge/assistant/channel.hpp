#pragma once

#include <asio.hpp>

#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

#include "aibridge/core/ipc/channel_options.hpp"
#include "aibridge/core/ipc/pipe.hpp"
#include "aibridge/core/ipc/protocol.hpp"
#include "aibridge/core/logging/logger.hpp"

namespace aibridge::assistant {

using core::ipc::ChannelOptions;
using core::ipc::ConnectionStatus;

/**
 * @brief Assistant end of the bi-directional channel.
 *
 * Requests go out on the pipe connected to the shell and their responses come
 * back on it. Queries pushed by the shell arrive on the assistant's own
 * listening pipe and are handed to the query handler on a background thread.
 */
class AssistantChannel {
public:
    using QueryHandler = std::function<void(const core::ipc::PostQueryMessage&)>;

    AssistantChannel(asio::io_context& io_context,
                     std::shared_ptr<core::logging::Logger> logger,
                     QueryHandler on_post_query,
                     ChannelOptions options = {});
    ~AssistantChannel();

    AssistantChannel(const AssistantChannel&) = delete;
    AssistantChannel& operator=(const AssistantChannel&) = delete;

    [[nodiscard]] const std::string& pipe_name() const noexcept { return pipe_name_; }

    /**
     * @brief Connects to the shell, announces the assistant pipe and waits in
     * the background for the shell to connect back.
     * @throws std::logic_error if a connected channel already exists
     * @throws std::invalid_argument if @p shell_pipe_name is the assistant's own pipe
     * @throws core::ipc::TimeoutError / core::ipc::ConnectionError when the shell is unreachable
     * @throws core::ipc::OperationCancelledError when @p token is stopped first
     */
    void connect(const std::string& shell_pipe_name, std::stop_token token = {});

    bool check_connection(bool blocking, bool& setup_in_progress);
    bool connected();
    [[nodiscard]] ConnectionStatus status() const;

    /**
     * @brief Request/response calls, one outstanding at a time.
     * @throws core::ipc::NotConnectedError without a live channel
     * @throws core::ipc::ProtocolViolationError when the reply has the wrong type (the link is closed)
     * @throws core::ipc::IoError when the link closes before the reply arrives
     * @throws core::ipc::OperationCancelledError when @p token is stopped first; a
     * stop while the reply is pending closes the link
     */
    core::ipc::PostContextMessage ask_context(const core::ipc::AskContextMessage& message,
                                              std::stop_token token = {});
    core::ipc::PostResultMessage run_command(const core::ipc::RunCommandMessage& message,
                                             std::stop_token token = {});
    core::ipc::PostResultMessage ask_command_output(const core::ipc::AskCommandOutputMessage& message,
                                                    std::stop_token token = {});

    // One-way.
    void post_code(const core::ipc::PostCodeMessage& message);

    void reset();

private:
    struct SetupState {
        std::shared_ptr<core::ipc::ClientPipe> client;  // to the shell's listening pipe
        std::shared_ptr<core::ipc::ServerPipe> server;  // the shell connects back here
        std::promise<void> completion;
        std::shared_future<void> done;

        bool success{false};
        std::exception_ptr failure;

        std::jthread worker;
    };

    [[nodiscard]] std::shared_ptr<SetupState> snapshot() const;
    [[nodiscard]] std::shared_ptr<SetupState> require_connected();

    void run(SetupState& state, std::stop_token token);
    void dispatch_loop(SetupState& state, std::stop_token token);
    void fail_setup(SetupState& state, std::exception_ptr failure);

    // Waits for the request slot, giving up when the token is stopped.
    [[nodiscard]] std::unique_lock<std::timed_mutex> acquire_request_slot(const std::stop_token& token);

    template <typename Response>
    Response request(const core::ipc::Message& message, std::stop_token token);

    asio::io_context& io_context_;
    std::shared_ptr<core::logging::Logger> logger_;
    QueryHandler on_post_query_;
    ChannelOptions options_;
    std::string pipe_name_;

    mutable std::mutex mutex_;
    std::shared_ptr<SetupState> state_;

    std::timed_mutex request_mutex_;
};

}  // namespace aibridge::assistant
