#pragma once

#include <string>

#include "aibridge/core/ipc/protocol.hpp"
#include "aibridge/shell/channel.hpp"
#include "aibridge/shell/code_poster.hpp"
#include "aibridge/shell/command_runner.hpp"
#include "aibridge/shell/context_provider.hpp"

namespace aibridge::shell {

/**
 * @brief Connects the shell-side components to the channel.
 *
 * Only commands that are actually executed end up in the command history:
 * RunCommand requests and code run from the input line. Queries are not
 * recorded.
 */
ChannelHandlers make_handlers(ContextProvider& context, CommandRunner& runner, CodePoster& poster);

/**
 * @brief Executes code accepted on the input line and records it in the history.
 * @throws std::system_error if the shell cannot be started
 */
core::ipc::PostResultMessage run_accepted_code(ContextProvider& context, const std::string& code);

}  // namespace aibridge::shell
