#include "aibridge/core/ipc/errors.hpp"

namespace aibridge::core::ipc {
namespace {

class IpcCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "aibridge.ipc"; }

    std::string message(int value) const override {
        switch (static_cast<errc>(value)) {
            case errc::timed_out:          return "timed out waiting for the peer";
            case errc::connection_failed:  return "connection to the peer failed";
            case errc::protocol_violation: return "protocol violation";
            case errc::corrupt_frame:      return "corrupt frame received";
            case errc::not_connected:      return "pipe is not connected";
            case errc::pipe_closed:        return "pipe is not connected or has been closed";
            case errc::address_in_use:     return "pipe name is already in use";
            case errc::cancelled:          return "operation cancelled";
            default:                       return "unknown ipc error";
        }
    }
};

}  // namespace

const std::error_category& ipc_category() noexcept {
    static const IpcCategory category;
    return category;
}

std::error_code make_error_code(errc value) noexcept {
    return {static_cast<int>(value), ipc_category()};
}

std::exception_ptr make_ipc_exception(std::error_code code, const std::string& what) {
    if (code.category() != ipc_category()) {
        return std::make_exception_ptr(ConnectionError(what + ": " + code.message()));
    }

    switch (static_cast<errc>(code.value())) {
        case errc::timed_out:          return std::make_exception_ptr(TimeoutError(what));
        case errc::protocol_violation: return std::make_exception_ptr(ProtocolViolationError(what));
        case errc::corrupt_frame:      return std::make_exception_ptr(CorruptFrameError(what));
        case errc::not_connected:      return std::make_exception_ptr(NotConnectedError(what));
        case errc::pipe_closed:        return std::make_exception_ptr(IoError(what));
        case errc::cancelled:          return std::make_exception_ptr(OperationCancelledError(what));
        case errc::connection_failed:
        case errc::address_in_use:     return std::make_exception_ptr(ConnectionError(what));
        default:                       return std::make_exception_ptr(IpcError(code, what));
    }
}

void throw_ipc_error(std::error_code code, const std::string& what) {
    std::rethrow_exception(make_ipc_exception(code, what));
}

}  // namespace aibridge::core::ipc
