#include "aibridge/assistant/channel.hpp"

#include "aibridge/core/ipc/errors.hpp"

#include <chrono>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace aibridge::assistant {

using namespace aibridge::core::ipc;

namespace {

constexpr auto kRequestSlotPoll = std::chrono::milliseconds(20);

template <typename T, std::size_t Index = 0>
constexpr MessageType message_type_of() {
    if constexpr (std::is_same_v<T, std::variant_alternative_t<Index, Message>>) {
        return static_cast<MessageType>(Index);
    } else {
        return message_type_of<T, Index + 1>();
    }
}

std::string describe(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    }
}

}  // namespace

AssistantChannel::AssistantChannel(asio::io_context& io_context,
                                   std::shared_ptr<core::logging::Logger> logger,
                                   QueryHandler on_post_query,
                                   ChannelOptions options)
    : io_context_(io_context),
      logger_(std::move(logger)),
      on_post_query_(std::move(on_post_query)),
      options_(std::move(options)) {
    validate_timeout(options_.connection_timeout);
    pipe_name_ = options_.pipe_name.empty() ? default_pipe_name(kAssistantPipePrefix) : options_.pipe_name;
}

AssistantChannel::~AssistantChannel() {
    reset();
}

std::shared_ptr<AssistantChannel::SetupState> AssistantChannel::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void AssistantChannel::connect(const std::string& shell_pipe_name, std::stop_token token) {
    if (resolve_pipe_path(shell_pipe_name) == resolve_pipe_path(pipe_name_)) {
        throw std::invalid_argument("The shell pipe '" + shell_pipe_name + "' is the assistant's own pipe name.");
    }

    bool setup_in_progress = false;
    if (check_connection(false, setup_in_progress)) {
        throw std::logic_error("A connected channel already exists.");
    }
    reset();

    auto state = std::make_shared<SetupState>();
    state->done = state->completion.get_future().share();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = state;
    }

    try {
        state->client = std::make_shared<ClientPipe>(io_context_, logger_, shell_pipe_name);
        auto ec = state->client->connect(options_.connection_timeout, token);
        if (ec == errc::timed_out) {
            throw TimeoutError("Could not connect to the shell pipe '" + shell_pipe_name +
                               "' within the specified timeout period.");
        }
        if (ec) {
            throw_ipc_error(ec, "Failed to connect to the shell pipe '" + shell_pipe_name + "'");
        }

        state->server = std::make_shared<ServerPipe>(io_context_, logger_, pipe_name_);
        if (auto listen_ec = state->server->listen()) {
            throw_ipc_error(listen_ec, "Failed to create the assistant pipe '" + pipe_name_ + "'");
        }

        if (auto send_ec = state->client->send(AskConnectionMessage{pipe_name_})) {
            throw IoError("Failed to send 'AskConnection' message: " + send_ec.message());
        }
    } catch (const std::exception& e) {
        logger_->error("[channel] connecting to '{}' failed: {}", shell_pipe_name, e.what());
        fail_setup(*state, std::current_exception());
        throw;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    state->worker = std::jthread([this, raw = state.get()](std::stop_token token) { run(*raw, token); });
    logger_->info("[channel] connected to '{}', waiting for the shell on '{}'", shell_pipe_name, pipe_name_);
}

void AssistantChannel::fail_setup(SetupState& state, std::exception_ptr failure) {
    state.failure = std::move(failure);
    if (state.server) {
        state.server->close();
    }
    if (state.client) {
        state.client->close();
    }
    state.completion.set_value();
}

void AssistantChannel::run(SetupState& state, std::stop_token token) {
    try {
        auto ec = state.server->wait_for_connection(options_.connection_timeout, token);
        if (ec == errc::timed_out) {
            throw TimeoutError("The shell did not connect back to '" + pipe_name_ +
                               "' within the specified timeout period.");
        }
        if (ec) {
            throw_ipc_error(ec, "Failed to accept the shell connection on '" + pipe_name_ + "'");
        }
    } catch (const std::exception& e) {
        logger_->error("[channel] setup failed: {}", e.what());
        fail_setup(state, std::current_exception());
        return;
    }

    state.success = true;
    state.completion.set_value();
    logger_->info("[channel] the shell connected back on '{}'", pipe_name_);
    dispatch_loop(state, token);
}

void AssistantChannel::dispatch_loop(SetupState& state, std::stop_token token) {
    while (!token.stop_requested()) {
        std::optional<Message> message;
        try {
            message = state.server->receive(token);
        } catch (const IpcError& e) {
            logger_->error("[channel] receive failed: {}", e.what());
            break;
        }
        if (!message) {
            break;
        }

        const auto* query = std::get_if<PostQueryMessage>(&*message);
        if (query == nullptr) {
            logger_->warn("[channel] ignoring unexpected '{}' message", to_string(type_of(*message)));
            continue;
        }
        if (!on_post_query_) {
            logger_->warn("[channel] no handler for 'PostQuery', dropping query");
            continue;
        }
        try {
            on_post_query_(*query);
        } catch (const std::exception& e) {
            logger_->error("[channel] query handler failed: {}", e.what());
        }
    }
    logger_->info("[channel] connection to the shell ended");
}

bool AssistantChannel::check_connection(bool blocking, bool& setup_in_progress) {
    setup_in_progress = false;
    auto state = snapshot();
    if (!state) {
        return false;
    }

    if (!blocking && state->done.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        setup_in_progress = true;
        return false;
    }

    state->done.wait();
    return state->success && state->server->is_connected() && state->client->is_connected();
}

bool AssistantChannel::connected() {
    bool setup_in_progress = false;
    return check_connection(true, setup_in_progress);
}

ConnectionStatus AssistantChannel::status() const {
    auto state = snapshot();
    if (!state) {
        return ConnectionStatus::NotStarted;
    }
    if (state->done.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        return ConnectionStatus::SettingUp;
    }
    if (!state->success) {
        return ConnectionStatus::SetupFailed;
    }
    return state->server->is_connected() && state->client->is_connected() ? ConnectionStatus::Connected
                                                                          : ConnectionStatus::Disconnected;
}

std::shared_ptr<AssistantChannel::SetupState> AssistantChannel::require_connected() {
    auto state = snapshot();
    if (!state) {
        throw NotConnectedError("Channel has not been setup yet.");
    }

    state->done.wait();
    if (!state->success) {
        throw NotConnectedError("Bi-directional channel could not be established: " + describe(state->failure),
                                state->failure);
    }

    const bool client_live = state->client->is_connected();
    const bool server_live = state->server->is_connected();
    if (!client_live || !server_live) {
        throw NotConnectedError(std::string("Both the client and server pipes may have been closed. ") +
                                "Pipe connection status: client(" + (client_live ? "true" : "false") +
                                "), server(" + (server_live ? "true" : "false") + ").");
    }
    return state;
}

std::unique_lock<std::timed_mutex> AssistantChannel::acquire_request_slot(const std::stop_token& token) {
    std::unique_lock<std::timed_mutex> lock(request_mutex_, std::defer_lock);
    while (!lock.try_lock_for(kRequestSlotPoll)) {
        if (token.stop_requested()) {
            throw OperationCancelledError("Cancelled while waiting for another request to finish.");
        }
    }
    return lock;
}

template <typename Response>
Response AssistantChannel::request(const Message& message, std::stop_token token) {
    constexpr auto expected = message_type_of<Response>();
    const std::string sent_type{to_string(type_of(message))};
    auto state = require_connected();

    auto lock = acquire_request_slot(token);
    if (token.stop_requested()) {
        throw OperationCancelledError("The '" + sent_type + "' request was cancelled before it was sent.");
    }
    if (auto ec = state->client->send(message)) {
        throw IoError("Failed to send '" + sent_type + "' message: " + ec.message());
    }

    std::error_code ec;
    auto response = state->client->receive(token, ec);
    if (ec == errc::cancelled) {
        state->client->close();
        logger_->info("[channel] '{}' request cancelled, closed the link to the shell", sent_type);
        throw OperationCancelledError("Cancelled while waiting for the '" + std::string(to_string(expected)) +
                                      "' response.");
    }
    if (ec) {
        const auto what = "Failed to receive the '" + std::string(to_string(expected)) + "' response";
        if (ec.category() == ipc_category()) {
            throw_ipc_error(ec, what);
        }
        throw IoError(what + ": " + ec.message());
    }
    if (!response) {
        throw IoError("The shell closed the pipe while a '" + std::string(to_string(expected)) +
                      "' response was pending.");
    }

    auto* typed = std::get_if<Response>(&*response);
    if (typed == nullptr) {
        state->client->close();
        throw ProtocolViolationError("Expecting '" + std::string(to_string(expected)) + "' response, but received '" +
                                     std::string(to_string(type_of(*response))) + "' message.");
    }
    return std::move(*typed);
}

PostContextMessage AssistantChannel::ask_context(const AskContextMessage& message, std::stop_token token) {
    return request<PostContextMessage>(message, std::move(token));
}

PostResultMessage AssistantChannel::run_command(const RunCommandMessage& message, std::stop_token token) {
    return request<PostResultMessage>(message, std::move(token));
}

PostResultMessage AssistantChannel::ask_command_output(const AskCommandOutputMessage& message,
                                                       std::stop_token token) {
    return request<PostResultMessage>(message, std::move(token));
}

void AssistantChannel::post_code(const PostCodeMessage& message) {
    auto state = require_connected();
    std::lock_guard<std::timed_mutex> lock(request_mutex_);
    if (auto ec = state->client->send(message)) {
        throw IoError("Failed to send 'PostCode' message: " + ec.message());
    }
}

void AssistantChannel::reset() {
    std::shared_ptr<SetupState> state;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state = std::move(state_);
    }
    if (!state) {
        return;
    }

    state->worker.request_stop();
    if (state->server) {
        state->server->close();
    }
    if (state->worker.joinable()) {
        state->worker.join();
    }
    if (state->client) {
        state->client->close();
    }
    logger_->debug("[channel] reset '{}'", pipe_name_);
}

}  // namespace aibridge::assistant
