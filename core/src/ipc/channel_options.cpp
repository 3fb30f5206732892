#include "aibridge/core/ipc/channel_options.hpp"

#include <stdexcept>

namespace aibridge::core::ipc {

std::string_view to_string(ConnectionStatus status) noexcept {
    switch (status) {
        case ConnectionStatus::NotStarted:   return "not started";
        case ConnectionStatus::SettingUp:    return "setting up";
        case ConnectionStatus::Connected:    return "connected";
        case ConnectionStatus::SetupFailed:  return "setup failed";
        case ConnectionStatus::Disconnected: return "disconnected";
        default:                             return "unknown";
    }
}

ChannelOptions ChannelOptions::from_config(const config::Configuration& config, ChannelSide side) {
    const auto shell_pipe = config.get_string("channel.shell_pipe_name");
    const auto assistant_pipe = config.get_string("channel.assistant_pipe_name");
    if (!shell_pipe.empty() && shell_pipe == assistant_pipe) {
        throw std::invalid_argument("channel.shell_pipe_name and channel.assistant_pipe_name must differ, both are '" +
                                    shell_pipe + "'");
    }

    ChannelOptions options;
    options.pipe_name = side == ChannelSide::Shell ? shell_pipe : assistant_pipe;
    if (auto timeout = config.get_milliseconds("channel.connection_timeout_ms")) {
        options.connection_timeout = *timeout;
    }
    validate_timeout(options.connection_timeout);
    return options;
}

}  // namespace aibridge::core::ipc
