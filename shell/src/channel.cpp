#include "aibridge/shell/channel.hpp"

#include "aibridge/core/ipc/errors.hpp"

#include <stdexcept>
#include <utility>

namespace aibridge::shell {

using namespace aibridge::core::ipc;

namespace {

std::string describe(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    }
}

const char* to_flag(bool value) {
    return value ? "true" : "false";
}

// Neutral reply of the same kind, for a reply that cannot be encoded.
Message substitute_reply(const Message& message) {
    if (std::holds_alternative<PostContextMessage>(message)) {
        return PostContextMessage::none();
    }
    return PostResultMessage{"The result is too large to be sent.", true, false, std::nullopt};
}

}  // namespace

ShellChannel::ShellChannel(asio::io_context& io_context,
                           std::shared_ptr<core::logging::Logger> logger,
                           ChannelHandlers handlers,
                           ChannelOptions options)
    : io_context_(io_context),
      logger_(std::move(logger)),
      handlers_(std::move(handlers)),
      options_(std::move(options)) {
    validate_timeout(options_.connection_timeout);
    pipe_name_ = options_.pipe_name.empty() ? default_pipe_name(kShellPipePrefix) : options_.pipe_name;
}

ShellChannel::~ShellChannel() {
    reset();
}

std::shared_ptr<ShellChannel::SetupState> ShellChannel::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string ShellChannel::start_setup() {
    bool setup_in_progress = false;
    if (check_connection(false, setup_in_progress)) {
        throw std::logic_error("A connected channel already exists.");
    }
    reset();

    auto state = std::make_shared<SetupState>();
    state->server = std::make_shared<ServerPipe>(io_context_, logger_, pipe_name_);
    if (auto ec = state->server->listen()) {
        state->server->close();
        throw_ipc_error(ec, "Failed to create the channel pipe '" + pipe_name_ + "'");
    }
    state->done = state->completion.get_future().share();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = state;
        state->worker = std::jthread([this, raw = state.get()](std::stop_token token) { run(*raw, token); });
    }

    logger_->info("[channel] waiting for the assistant on '{}'", pipe_name_);
    return pipe_name_;
}

void ShellChannel::run(SetupState& state, std::stop_token token) {
    try {
        handshake(state, token);
        state.success = true;
    } catch (const std::exception& e) {
        logger_->error("[channel] setup failed: {}", e.what());
        state.failure = std::current_exception();
        state.server->close();
        if (state.client) {
            state.client->close();
        }
    }
    state.completion.set_value();

    if (state.success) {
        logger_->info("[channel] connected to the assistant on '{}'", state.client->name());
        dispatch_loop(state, token);
    }
}

void ShellChannel::handshake(SetupState& state, std::stop_token token) {
    auto ec = state.server->wait_for_connection(options_.connection_timeout, token);
    if (ec == errc::timed_out) {
        throw TimeoutError("Could not receive connection from the assistant within the specified timeout period.");
    }
    if (ec) {
        throw_ipc_error(ec, "Failed to accept the assistant connection on '" + pipe_name_ + "'");
    }

    auto first = state.server->receive(token);
    if (!first) {
        throw ProtocolViolationError("The assistant closed the pipe before sending 'AskConnection'.");
    }

    const auto* ask = std::get_if<AskConnectionMessage>(&*first);
    if (ask == nullptr) {
        throw ProtocolViolationError("Expect the first message to be 'AskConnection', but it was '" +
                                     std::string(to_string(type_of(*first))) + "'.");
    }

    state.client = std::make_shared<ClientPipe>(io_context_, logger_, ask->pipe_name);
    ec = state.client->connect(options_.connection_timeout, token);
    if (ec == errc::timed_out) {
        throw TimeoutError("Could not connect to the assistant pipe '" + ask->pipe_name +
                           "' within the specified timeout period.");
    }
    if (ec) {
        throw_ipc_error(ec, "Failed to connect to the assistant pipe '" + ask->pipe_name + "'");
    }

    // Nothing is ever read from the outbound pipe; watch it so a hang-up shows in the liveness check.
    state.client->watch_peer_close();
}

void ShellChannel::dispatch_loop(SetupState& state, std::stop_token token) {
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
        try {
            dispatch(*state.server, *message);
        } catch (const std::exception& e) {
            logger_->error("[channel] failed to handle '{}': {}", to_string(type_of(*message)), e.what());
        }
    }
    logger_->info("[channel] connection to the assistant ended");
}

void ShellChannel::dispatch(ServerPipe& server, const Message& message) {
    switch (type_of(message)) {
        case MessageType::AskContext:
            reply(server, handle_ask_context(std::get<AskContextMessage>(message)));
            break;
        case MessageType::PostCode:
            handle_post_code(std::get<PostCodeMessage>(message));
            break;
        case MessageType::RunCommand:
            reply(server, handle_run_command(std::get<RunCommandMessage>(message)));
            break;
        case MessageType::AskCommandOutput:
            reply(server, handle_ask_command_output(std::get<AskCommandOutputMessage>(message)));
            break;
        default:
            logger_->warn("[channel] ignoring unexpected '{}' message", to_string(type_of(message)));
            break;
    }
}

void ShellChannel::reply(ServerPipe& server, const Message& message) {
    std::error_code ec;
    try {
        ec = server.send(message);
    } catch (const std::invalid_argument& e) {
        logger_->error("[channel] cannot encode '{}' reply: {}", to_string(type_of(message)), e.what());
        ec = server.send(substitute_reply(message));
    }
    if (ec) {
        logger_->error("[channel] failed to send '{}' reply: {}", to_string(type_of(message)), ec.message());
    }
}

PostContextMessage ShellChannel::handle_ask_context(const AskContextMessage& message) {
    if (!handlers_.on_ask_context) {
        logger_->warn("[channel] no handler for 'AskContext' ({})", to_string(message.context_type));
        return PostContextMessage::none();
    }
    try {
        return handlers_.on_ask_context(message);
    } catch (const std::exception& e) {
        logger_->error("[channel] failed to collect {} context: {}", to_string(message.context_type), e.what());
        return PostContextMessage::none();
    }
}

void ShellChannel::handle_post_code(const PostCodeMessage& message) {
    if (!handlers_.on_post_code) {
        logger_->warn("[channel] no handler for 'PostCode', dropping {} block(s)", message.code_blocks.size());
        return;
    }
    try {
        handlers_.on_post_code(message);
    } catch (const std::exception& e) {
        logger_->error("[channel] failed to post code: {}", e.what());
    }
}

PostResultMessage ShellChannel::handle_run_command(const RunCommandMessage& message) {
    if (!handlers_.on_run_command) {
        return PostResultMessage{"Command execution is not supported.", true, false, std::nullopt};
    }
    try {
        return handlers_.on_run_command(message);
    } catch (const std::exception& e) {
        logger_->error("[channel] failed to run '{}': {}", message.command, e.what());
        return PostResultMessage{"Failed to execute the command due to an internal error.", true, false, e.what()};
    }
}

PostResultMessage ShellChannel::handle_ask_command_output(const AskCommandOutputMessage& message) {
    if (!handlers_.on_ask_command_output) {
        return PostResultMessage{"Retrieving command output is not supported.", true, false, std::nullopt};
    }
    try {
        return handlers_.on_ask_command_output(message);
    } catch (const std::exception& e) {
        logger_->error("[channel] failed to get output of command '{}': {}", message.command_id, e.what());
        return PostResultMessage{"Failed to retrieve the command output due to an internal error.", true, false,
                                 e.what()};
    }
}

bool ShellChannel::check_connection(bool blocking, bool& setup_in_progress) {
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

bool ShellChannel::connected() {
    bool setup_in_progress = false;
    return check_connection(true, setup_in_progress);
}

ConnectionStatus ShellChannel::status() const {
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

void ShellChannel::post_query(const PostQueryMessage& message) {
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
        throw NotConnectedError(
            std::string("Both the client and server pipes may have been closed. Pipe connection status: client(") +
            to_flag(client_live) + "), server(" + to_flag(server_live) + ").");
    }

    if (auto ec = state->client->send(message)) {
        throw IoError("Failed to send 'PostQuery' message: " + ec.message());
    }
}

void ShellChannel::reset() {
    std::shared_ptr<SetupState> state;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state = std::move(state_);
    }
    if (!state) {
        return;
    }

    state->worker.request_stop();
    state->server->close();
    if (state->worker.joinable()) {
        state->worker.join();
    }
    if (state->client) {
        state->client->close();
    }
    logger_->debug("[channel] reset '{}'", pipe_name_);
}

}  // namespace aibridge::shell
