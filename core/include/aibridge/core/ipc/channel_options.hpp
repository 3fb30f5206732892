#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "aibridge/core/config/configuration.hpp"
#include "aibridge/core/ipc/pipe.hpp"

namespace aibridge::core::ipc {

// Observable lifecycle of either end of a channel.
enum class ConnectionStatus {
    NotStarted,
    SettingUp,
    Connected,
    SetupFailed,
    Disconnected  // set up once, but a pipe has since gone away
};

[[nodiscard]] std::string_view to_string(ConnectionStatus status) noexcept;

// Which end of the channel the options are for.
enum class ChannelSide {
    Shell,
    Assistant
};

struct ChannelOptions {
    // Empty means "<prefix>.<pid>.<exe>".
    std::string pipe_name;
    std::chrono::milliseconds connection_timeout{kDefaultConnectionTimeout};

    /**
     * @brief Reads channel.connection_timeout_ms and the side's own pipe name,
     * channel.shell_pipe_name or channel.assistant_pipe_name.
     * @throws std::invalid_argument for an invalid timeout, or when both sides
     * are configured with the same pipe name
     */
    static ChannelOptions from_config(const config::Configuration& config, ChannelSide side);
};

}  // namespace aibridge::core::ipc
