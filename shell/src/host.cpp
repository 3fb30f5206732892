#include "aibridge/shell/host.hpp"

namespace aibridge::shell {

ChannelHandlers make_handlers(ContextProvider& context, CommandRunner& runner, CodePoster& poster) {
    ChannelHandlers handlers;
    handlers.on_ask_context = [&context](const core::ipc::AskContextMessage& request) {
        return context.provide(request);
    };
    handlers.on_post_code = [&poster](const core::ipc::PostCodeMessage& message) { poster.post(message); };
    handlers.on_run_command = [&runner, &context](const core::ipc::RunCommandMessage& request) {
        context.record_command(request.command);
        return runner.run(request);
    };
    handlers.on_ask_command_output = [&runner](const core::ipc::AskCommandOutputMessage& request) {
        return runner.output(request);
    };
    return handlers;
}

core::ipc::PostResultMessage run_accepted_code(ContextProvider& context, const std::string& code) {
    context.record_command(code);
    return CommandRunner::execute(code);
}

}  // namespace aibridge::shell
