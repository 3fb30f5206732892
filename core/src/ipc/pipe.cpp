#include "aibridge/core/ipc/pipe.hpp"
#include "aibridge/core/ipc/errors.hpp"

#include <stdexcept>
#include <utility>

#include <sys/un.h>
#include <unistd.h>

namespace aibridge::core::ipc {
namespace {

constexpr std::string_view kPipeFilePrefix = "AIBridgePipe_";
constexpr std::size_t kMaxSocketPath = sizeof(sockaddr_un::sun_path) - 1;
constexpr auto kPollInterval = std::chrono::milliseconds(50);
constexpr auto kConnectRetryInterval = std::chrono::milliseconds(20);

std::error_code check_path_length(const std::filesystem::path& path) {
    if (path.string().size() > kMaxSocketPath) {
        return std::make_error_code(std::errc::filename_too_long);
    }
    return {};
}

// The peer going away mid-read is a normal end of stream.
bool is_end_of_stream(const std::error_code& ec) {
    return ec == asio::error::eof || ec == asio::error::connection_reset || ec == asio::error::broken_pipe ||
           ec == asio::error::operation_aborted || ec == asio::error::bad_descriptor;
}

}  // namespace

void validate_timeout(std::chrono::milliseconds timeout) {
    if (timeout != kInfiniteTimeout && timeout.count() <= 0) {
        throw std::invalid_argument("timeout must be positive or -1 for infinite, got " +
                                    std::to_string(timeout.count()));
    }
}

std::filesystem::path resolve_pipe_path(std::string_view name) {
    if (!name.empty() && name.front() == '/') {
        return std::filesystem::path{name};
    }
    return std::filesystem::temp_directory_path() / (std::string{kPipeFilePrefix} + std::string{name});
}

std::string default_pipe_name(std::string_view prefix) {
    std::string exe_name = "aibridge";
    std::error_code ec;
    const auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec && !exe_path.filename().empty()) {
        exe_name = exe_path.filename().string();
    }

    std::string name = std::string{prefix} + "." + std::to_string(::getpid()) + "." + exe_name;
    const auto dir_length = resolve_pipe_path("").string().size();
    const auto budget = kMaxSocketPath > dir_length ? kMaxSocketPath - dir_length : 0;
    if (name.size() > budget) {
        name.resize(budget);
    }
    return name;
}

// --- PipeStream ---

PipeStream::PipeStream(asio::io_context& io_context, std::shared_ptr<logging::Logger> logger, std::string name)
    : io_context_(io_context),
      logger_(std::move(logger)),
      strand_(asio::make_strand(io_context)),
      socket_(io_context),
      name_(std::move(name)),
      path_(resolve_pipe_path(name_)) {
}

PipeStream::~PipeStream() {
    std::error_code ec;
    socket_.close(ec);
}

template <typename Result>
std::optional<Result> PipeStream::await(std::future<Result>& future, std::stop_token token) {
    std::stop_callback on_stop(token, [this] { close(); });
    while (future.wait_for(kPollInterval) != std::future_status::ready) {
        if (io_context_.stopped()) {
            close();
            return std::nullopt;
        }
    }
    return future.get();
}

std::error_code PipeStream::send(const Message& message) {
    auto frame = std::make_shared<std::vector<std::uint8_t>>(encode_frame(message));

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!is_connected()) {
        return make_error_code(errc::pipe_closed);
    }

    auto promise = std::make_shared<std::promise<std::error_code>>();
    auto future = promise->get_future();
    asio::post(strand_, [this, self = shared_from_this(), frame, promise]() {
        if (closed_) {
            promise->set_value(make_error_code(errc::pipe_closed));
            return;
        }
        asio::async_write(socket_, asio::buffer(*frame),
            asio::bind_executor(strand_, [frame, promise](std::error_code ec, std::size_t) {
                promise->set_value(ec);
            }));
    });

    auto result = await(future, {});
    if (!result) {
        return make_error_code(errc::cancelled);
    }
    if (*result) {
        connected_ = false;
        if (logger_) {
            logger_->error("[pipe] send on '{}' failed: {}", name_, result->message());
        }
        return *result;
    }

    if (logger_) {
        logger_->trace("[pipe] sent {} ({} bytes) on '{}'", to_string(type_of(message)), frame->size(), name_);
    }
    return {};
}

void PipeStream::async_receive(ReceiveHandler handler) {
    asio::dispatch(strand_, [this, self = shared_from_this(), handler = std::move(handler)]() mutable {
        if (closed_) {
            handler({}, std::nullopt);
            return;
        }
        read_header(std::move(handler));
    });
}

void PipeStream::read_header(ReceiveHandler handler) {
    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(&type_byte_, kTypeFieldSize),
        asio::bind_executor(strand_, [this, self, handler = std::move(handler)](std::error_code ec, std::size_t) mutable {
            if (ec) {
                finish_read(handler, ec);
                return;
            }
            auto type = message_type_from_byte(type_byte_);
            if (!type) {
                fail_corrupt(handler, "unknown message type " + std::to_string(type_byte_));
                return;
            }
            read_length(std::move(handler), *type);
        }));
}

void PipeStream::read_length(ReceiveHandler handler, MessageType type) {
    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(length_bytes_),
        asio::bind_executor(strand_, [this, self, type, handler = std::move(handler)](std::error_code ec, std::size_t) mutable {
            if (ec) {
                finish_read(handler, ec);
                return;
            }
            const auto length = decode_length(length_bytes_);
            if (length > kMaxPayloadSize) {
                fail_corrupt(handler, "payload length " + std::to_string(length) + " exceeds the limit");
                return;
            }
            read_payload(std::move(handler), type, length);
        }));
}

void PipeStream::read_payload(ReceiveHandler handler, MessageType type, std::uint32_t length) {
    payload_buffer_.resize(length);
    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(payload_buffer_),
        asio::bind_executor(strand_, [this, self, type, handler = std::move(handler)](std::error_code ec, std::size_t) {
            if (ec) {
                finish_read(handler, ec);
                return;
            }

            std::optional<Message> message;
            try {
                message = decode_frame_payload(type, payload_buffer_.data(), payload_buffer_.size());
            } catch (const CorruptFrameError& e) {
                fail_corrupt(handler, e.what());
                return;
            }

            if (logger_) {
                logger_->trace("[pipe] received {} ({} bytes) on '{}'", to_string(type), payload_buffer_.size(), name_);
            }
            handler({}, std::move(message));
        }));
}

void PipeStream::finish_read(const ReceiveHandler& handler, std::error_code ec) {
    connected_ = false;
    if (closed_ || is_end_of_stream(ec)) {
        if (logger_) {
            logger_->debug("[pipe] stream '{}' ended: {}", name_, ec.message());
        }
        handler({}, std::nullopt);
        return;
    }

    if (logger_) {
        logger_->error("[pipe] read on '{}' failed: {}", name_, ec.message());
    }
    handler(ec, std::nullopt);
}

void PipeStream::fail_corrupt(const ReceiveHandler& handler, const std::string& reason) {
    if (logger_) {
        logger_->error("[pipe] corrupt frame on '{}': {}", name_, reason);
    }
    close();
    handler(make_error_code(errc::corrupt_frame), std::nullopt);
}

std::optional<Message> PipeStream::receive(std::stop_token token, std::error_code& ec) {
    using Result = std::pair<std::error_code, std::optional<Message>>;
    auto promise = std::make_shared<std::promise<Result>>();
    auto future = promise->get_future();
    async_receive([promise](std::error_code error, std::optional<Message> message) {
        promise->set_value({error, std::move(message)});
    });

    auto result = await(future, token);
    if (!result) {
        ec = make_error_code(errc::cancelled);
        return std::nullopt;
    }
    ec = result->first;
    if (!ec && !result->second && token.stop_requested()) {
        ec = make_error_code(errc::cancelled);
    }
    return std::move(result->second);
}

std::optional<Message> PipeStream::receive(std::stop_token token) {
    std::error_code ec;
    auto message = receive(std::move(token), ec);
    if (ec == errc::cancelled) {
        return std::nullopt;
    }
    if (ec) {
        if (ec.category() == ipc_category()) {
            throw_ipc_error(ec, "Failed to receive a message on '" + name_ + "'");
        }
        throw IoError("Failed to receive a message on '" + name_ + "': " + ec.message());
    }
    return message;
}

void PipeStream::watch_peer_close() {
    asio::dispatch(strand_, [this, self = shared_from_this()]() {
        if (closed_ || !socket_.is_open()) {
            return;
        }
        socket_.async_wait(asio::socket_base::wait_read,
            asio::bind_executor(strand_, [this, self](std::error_code ec) {
                if (ec) {
                    return;
                }
                std::error_code available_ec;
                const auto available = socket_.available(available_ec);
                if (available_ec || available == 0) {
                    connected_ = false;
                    if (logger_) {
                        logger_->info("[pipe] peer of '{}' hung up", name_);
                    }
                } else if (logger_) {
                    logger_->warn("[pipe] unexpected data on write-only pipe '{}'", name_);
                }
            }));
    });
}

bool PipeStream::is_connected() const noexcept {
    return connected_.load() && !closed_.load();
}

void PipeStream::close() {
    if (closed_.exchange(true)) {
        return;
    }
    connected_ = false;

    asio::post(strand_, [this, self = shared_from_this()]() {
        std::error_code ec;
        socket_.shutdown(asio::socket_base::shutdown_both, ec);
        socket_.close(ec);
        on_close();
        if (logger_) {
            logger_->debug("[pipe] closed '{}'", name_);
        }
    });
}

// --- ServerPipe ---

ServerPipe::ServerPipe(asio::io_context& io_context, std::shared_ptr<logging::Logger> logger, std::string name)
    : PipeStream(io_context, std::move(logger), std::move(name)), acceptor_(io_context), timer_(io_context) {
}

ServerPipe::~ServerPipe() {
    std::error_code ec;
    acceptor_.close(ec);
    remove_socket_file();
}

std::error_code ServerPipe::listen() {
    if (auto ec = check_path_length(path_)) {
        return ec;
    }

    const asio::local::stream_protocol::endpoint endpoint(path_.string());
    std::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        return ec;
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
        std::error_code ignored;
        acceptor_.close(ignored);
        if (ec == asio::error::address_in_use) {
            if (logger_) {
                logger_->error("[pipe] name '{}' is already in use", name_);
            }
            return make_error_code(errc::address_in_use);
        }
        return ec;
    }
    bound_ = true;

    acceptor_.listen(1, ec);
    if (ec) {
        return ec;
    }

    if (logger_) {
        logger_->info("[pipe] listening on {}", path_.string());
    }
    return {};
}

void ServerPipe::async_wait_for_connection(std::chrono::milliseconds timeout, ConnectHandler handler) {
    validate_timeout(timeout);
    auto self = shared_from_this();
    asio::dispatch(strand_, [this, self, timeout, handler = std::move(handler)]() mutable {
        if (is_closed()) {
            handler(make_error_code(errc::cancelled));
            return;
        }
        if (!acceptor_.is_open()) {
            handler(make_error_code(errc::not_connected));
            return;
        }

        timed_out_ = false;
        if (timeout != kInfiniteTimeout) {
            timer_.expires_after(timeout);
            timer_.async_wait(asio::bind_executor(strand_, [this, self](std::error_code ec) {
                if (!ec) {
                    timed_out_ = true;
                    std::error_code ignored;
                    acceptor_.cancel(ignored);
                }
            }));
        }

        acceptor_.async_accept(socket_,
            asio::bind_executor(strand_, [this, self, handler = std::move(handler)](std::error_code ec) {
                timer_.cancel();
                if (!ec && !is_closed()) {
                    mark_connected();
                    // Single instance: no further peers can reach this name.
                    std::error_code ignored;
                    acceptor_.close(ignored);
                    remove_socket_file();
                    if (logger_) {
                        logger_->info("[pipe] peer connected on '{}'", name_);
                    }
                    handler({});
                } else if (is_closed()) {
                    handler(make_error_code(errc::cancelled));
                } else if (timed_out_) {
                    handler(make_error_code(errc::timed_out));
                } else {
                    handler(ec);
                }
            }));
    });
}

std::error_code ServerPipe::wait_for_connection(std::chrono::milliseconds timeout, std::stop_token token) {
    auto promise = std::make_shared<std::promise<std::error_code>>();
    auto future = promise->get_future();
    async_wait_for_connection(timeout, [promise](std::error_code ec) { promise->set_value(ec); });

    auto result = await(future, std::move(token));
    return result ? *result : make_error_code(errc::cancelled);
}

void ServerPipe::close() {
    remove_socket_file();
    PipeStream::close();
}

void ServerPipe::on_close() {
    timer_.cancel();
    std::error_code ec;
    acceptor_.close(ec);
    remove_socket_file();
}

void ServerPipe::remove_socket_file() noexcept {
    if (!bound_.exchange(false)) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove(path_, ec);
}

// --- ClientPipe ---

ClientPipe::ClientPipe(asio::io_context& io_context, std::shared_ptr<logging::Logger> logger, std::string name)
    : PipeStream(io_context, std::move(logger), std::move(name)), timer_(io_context) {
}

void ClientPipe::async_connect(std::chrono::milliseconds timeout, ConnectHandler handler) {
    validate_timeout(timeout);
    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (timeout != kInfiniteTimeout) {
        deadline = std::chrono::steady_clock::now() + timeout;
    }

    if (auto ec = check_path_length(path_)) {
        asio::post(strand_, [handler = std::move(handler), ec]() { handler(ec); });
        return;
    }

    asio::dispatch(strand_, [this, self = shared_from_this(), deadline, handler = std::move(handler)]() mutable {
        try_connect(deadline, std::move(handler));
    });
}

void ClientPipe::try_connect(std::optional<std::chrono::steady_clock::time_point> deadline, ConnectHandler handler) {
    if (is_closed()) {
        handler(make_error_code(errc::cancelled));
        return;
    }

    std::error_code ignored;
    if (socket_.is_open()) {
        socket_.close(ignored);
    }

    auto self = shared_from_this();
    const asio::local::stream_protocol::endpoint endpoint(path_.string());
    socket_.async_connect(endpoint,
        asio::bind_executor(strand_, [this, self, deadline, handler = std::move(handler)](std::error_code ec) mutable {
            if (is_closed()) {
                handler(make_error_code(errc::cancelled));
                return;
            }
            if (!ec) {
                mark_connected();
                if (logger_) {
                    logger_->info("[pipe] connected to '{}'", name_);
                }
                handler({});
                return;
            }

            // The listener has not bound its name yet.
            const bool retryable = ec == std::errc::no_such_file_or_directory ||
                                   ec == std::errc::resource_unavailable_try_again;
            if (!retryable) {
                if (logger_) {
                    logger_->error("[pipe] failed to connect to '{}': {}", name_, ec.message());
                }
                handler(ec);
                return;
            }

            const auto now = std::chrono::steady_clock::now();
            if (deadline && now >= *deadline) {
                handler(make_error_code(errc::timed_out));
                return;
            }

            auto next_attempt = now + kConnectRetryInterval;
            if (deadline && *deadline < next_attempt) {
                next_attempt = *deadline;
            }
            timer_.expires_at(next_attempt);
            timer_.async_wait(asio::bind_executor(strand_,
                [this, self, deadline, handler = std::move(handler)](std::error_code timer_ec) mutable {
                    if (timer_ec || is_closed()) {
                        handler(make_error_code(errc::cancelled));
                        return;
                    }
                    try_connect(deadline, std::move(handler));
                }));
        }));
}

std::error_code ClientPipe::connect(std::chrono::milliseconds timeout, std::stop_token token) {
    auto promise = std::make_shared<std::promise<std::error_code>>();
    auto future = promise->get_future();
    async_connect(timeout, [promise](std::error_code ec) { promise->set_value(ec); });

    auto result = await(future, std::move(token));
    return result ? *result : make_error_code(errc::cancelled);
}

void ClientPipe::on_close() {
    timer_.cancel();
}

}  // namespace aibridge::core::ipc
