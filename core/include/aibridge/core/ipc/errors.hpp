#pragma once

#include <exception>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace aibridge::core::ipc {

enum class errc {
    timed_out = 1,
    connection_failed,
    protocol_violation,
    corrupt_frame,
    not_connected,
    pipe_closed,
    address_in_use,
    cancelled
};

[[nodiscard]] const std::error_category& ipc_category() noexcept;
[[nodiscard]] std::error_code make_error_code(errc value) noexcept;

/**
 * @brief Base class of every exception thrown by the channel layer.
 */
class IpcError : public std::system_error {
public:
    IpcError(std::error_code code, const std::string& what) : std::system_error(code, what) {}
};

class TimeoutError : public IpcError {
public:
    explicit TimeoutError(const std::string& what) : IpcError(make_error_code(errc::timed_out), what) {}
};

class ConnectionError : public IpcError {
public:
    explicit ConnectionError(const std::string& what) : IpcError(make_error_code(errc::connection_failed), what) {}
};

class ProtocolViolationError : public IpcError {
public:
    explicit ProtocolViolationError(const std::string& what)
        : IpcError(make_error_code(errc::protocol_violation), what) {}
};

class CorruptFrameError : public IpcError {
public:
    explicit CorruptFrameError(const std::string& what) : IpcError(make_error_code(errc::corrupt_frame), what) {}
};

class IoError : public IpcError {
public:
    explicit IoError(const std::string& what) : IpcError(make_error_code(errc::pipe_closed), what) {}
};

// A stop was requested while the operation was waiting. The link it waited on is closed.
class OperationCancelledError : public IpcError {
public:
    explicit OperationCancelledError(const std::string& what) : IpcError(make_error_code(errc::cancelled), what) {}
};

/**
 * @brief Thrown when an operation requires a live channel.
 *
 * When the handshake failed, cause() holds the original failure.
 */
class NotConnectedError : public IpcError {
public:
    explicit NotConnectedError(const std::string& what, std::exception_ptr cause = nullptr)
        : IpcError(make_error_code(errc::not_connected), what), cause_(std::move(cause)) {}

    [[nodiscard]] const std::exception_ptr& cause() const noexcept { return cause_; }

private:
    std::exception_ptr cause_;
};

// Maps an error code from the transport layer onto the matching exception type.
[[noreturn]] void throw_ipc_error(std::error_code code, const std::string& what);
[[nodiscard]] std::exception_ptr make_ipc_exception(std::error_code code, const std::string& what);

}  // namespace aibridge::core::ipc

namespace std {
template <>
struct is_error_code_enum<aibridge::core::ipc::errc> : true_type {};
}  // namespace std
