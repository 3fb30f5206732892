#pragma once

#include <asio.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "aibridge/core/ipc/frame_codec.hpp"
#include "aibridge/core/ipc/protocol.hpp"
#include "aibridge/core/logging/logger.hpp"

namespace aibridge::core::ipc {

inline constexpr std::chrono::milliseconds kInfiniteTimeout{-1};
inline constexpr std::chrono::milliseconds kDefaultConnectionTimeout{7000};

inline constexpr std::string_view kShellPipePrefix = "aibridge_sh";
inline constexpr std::string_view kAssistantPipePrefix = "aibridge_as";

/**
 * @brief Rejects zero and negative timeouts other than kInfiniteTimeout.
 * @throws std::invalid_argument
 */
void validate_timeout(std::chrono::milliseconds timeout);

/**
 * @brief Socket path for a pipe name. Absolute names are used as-is, anything
 * else lives under the temp directory as "AIBridgePipe_<name>".
 */
[[nodiscard]] std::filesystem::path resolve_pipe_path(std::string_view name);

/**
 * @brief "<prefix>.<pid>.<executable base name>", truncated so that the
 * resolved socket path fits in sockaddr_un::sun_path.
 */
[[nodiscard]] std::string default_pipe_name(std::string_view prefix);

/**
 * @brief One end of a framed, full-duplex Unix-domain stream.
 *
 * Every socket operation runs on a strand of the shared io_context. The
 * blocking wrappers wait for that strand and therefore must not be called
 * from the I/O thread itself.
 */
class PipeStream : public std::enable_shared_from_this<PipeStream> {
public:
    using ReceiveHandler = std::function<void(std::error_code, std::optional<Message>)>;

    PipeStream(asio::io_context& io_context, std::shared_ptr<logging::Logger> logger, std::string name);
    virtual ~PipeStream();

    PipeStream(const PipeStream&) = delete;
    PipeStream& operator=(const PipeStream&) = delete;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /**
     * @brief Writes one complete frame. Concurrent senders are serialized.
     * @return errc::pipe_closed when the pipe is not connected
     * @throws std::invalid_argument if the message cannot be encoded into a frame
     */
    std::error_code send(const Message& message);

    /**
     * @brief Reads the next frame. The handler gets nullopt with no error when
     * the stream ends or the pipe is closed, errc::corrupt_frame after
     * closing the pipe on an unknown type tag or a malformed payload.
     */
    void async_receive(ReceiveHandler handler);

    // Blocking form of async_receive. A stop request closes the pipe and sets errc::cancelled.
    std::optional<Message> receive(std::stop_token token, std::error_code& ec);

    // Throwing form: CorruptFrameError / IoError, nullopt on clean close.
    std::optional<Message> receive(std::stop_token token = {});

    /**
     * @brief Arms a one-shot readiness watch that marks the pipe disconnected
     * when the peer hangs up. Only for links this end never reads from.
     */
    void watch_peer_close();

    [[nodiscard]] bool is_connected() const noexcept;
    [[nodiscard]] bool is_closed() const noexcept { return closed_.load(); }

    // Idempotent and callable from any thread. Unblocks pending operations.
    virtual void close();

protected:
    using Socket = asio::local::stream_protocol::socket;
    using Strand = asio::strand<asio::io_context::executor_type>;

    // Waits for a result produced on the strand. nullopt when the io_context stopped.
    template <typename Result>
    std::optional<Result> await(std::future<Result>& future, std::stop_token token);

    virtual void on_close() {}

    void mark_connected() noexcept { connected_ = true; }

    asio::io_context& io_context_;
    std::shared_ptr<logging::Logger> logger_;
    Strand strand_;
    Socket socket_;
    std::string name_;
    std::filesystem::path path_;

private:
    void read_header(ReceiveHandler handler);
    void read_length(ReceiveHandler handler, MessageType type);
    void read_payload(ReceiveHandler handler, MessageType type, std::uint32_t length);
    void finish_read(const ReceiveHandler& handler, std::error_code ec);
    void fail_corrupt(const ReceiveHandler& handler, const std::string& reason);

    std::atomic<bool> connected_{false};
    std::atomic<bool> closed_{false};
    std::mutex write_mutex_;

    // Reused across reads; only touched on the strand.
    std::uint8_t type_byte_{0};
    std::array<std::uint8_t, kLengthFieldSize> length_bytes_{};
    std::vector<std::uint8_t> payload_buffer_;
};

/**
 * @brief Listening end: binds the pipe name and accepts exactly one peer.
 */
class ServerPipe : public PipeStream {
public:
    using ConnectHandler = std::function<void(std::error_code)>;

    ServerPipe(asio::io_context& io_context, std::shared_ptr<logging::Logger> logger, std::string name);
    ~ServerPipe() override;

    /**
     * @brief Binds and listens on the socket path.
     * @return errc::address_in_use if the name is taken, or the system error
     */
    std::error_code listen();

    // errc::timed_out when no peer arrives in time, errc::cancelled when closed.
    void async_wait_for_connection(std::chrono::milliseconds timeout, ConnectHandler handler);
    std::error_code wait_for_connection(std::chrono::milliseconds timeout, std::stop_token token = {});

    // Also unlinks the socket file before returning, so the name can be bound again at once.
    void close() override;

protected:
    void on_close() override;

private:
    void remove_socket_file() noexcept;

    asio::local::stream_protocol::acceptor acceptor_;
    asio::steady_timer timer_;
    std::atomic<bool> bound_{false};
    bool timed_out_{false};
};

/**
 * @brief Connecting end. Retries while the socket file does not exist yet.
 */
class ClientPipe : public PipeStream {
public:
    using ConnectHandler = std::function<void(std::error_code)>;

    ClientPipe(asio::io_context& io_context, std::shared_ptr<logging::Logger> logger, std::string name);

    // errc::timed_out when the deadline passes, the system error on refusal.
    void async_connect(std::chrono::milliseconds timeout, ConnectHandler handler);
    std::error_code connect(std::chrono::milliseconds timeout, std::stop_token token = {});

protected:
    void on_close() override;

private:
    void try_connect(std::optional<std::chrono::steady_clock::time_point> deadline, ConnectHandler handler);

    asio::steady_timer timer_;
};

}  // namespace aibridge::core::ipc
