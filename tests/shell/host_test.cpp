#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

#include "aibridge/shell/host.hpp"

using namespace aibridge::core::ipc;
using aibridge::shell::CodePoster;
using aibridge::shell::CommandRunner;
using aibridge::shell::ContextProvider;
using aibridge::shell::InputEditor;
using json = nlohmann::json;

namespace {

class NullEditor : public InputEditor {
public:
    std::string inserted;

    bool is_input_ready() const override { return true; }
    void insert_text(std::string_view text) override { inserted = std::string{text}; }
    void revert_pending_input() override {}
};

std::vector<std::string> recorded(const ContextProvider& context) {
    std::vector<std::string> lines;
    for (const auto& entry : json::parse(context.command_history())) {
        lines.push_back(entry["CommandLine"].get<std::string>());
    }
    return lines;
}

}  // namespace

TEST_CASE("Shell host wiring", "[shell][host]") {
    NullEditor editor;
    ContextProvider context;
    CommandRunner runner;
    CodePoster poster(editor);
    auto handlers = aibridge::shell::make_handlers(context, runner, poster);

    SECTION("Executed commands are recorded, posted code is not") {
        const auto result = handlers.on_run_command(RunCommandMessage{"echo ran", true});
        REQUIRE(result.output == "ran\n");

        handlers.on_post_code(PostCodeMessage{{"echo posted"}});
        REQUIRE(editor.inserted == "echo posted");
        REQUIRE(recorded(context) == std::vector<std::string>{"echo ran"});

        const auto accepted = aibridge::shell::run_accepted_code(context, editor.inserted);
        REQUIRE(accepted.output == "posted\n");
        REQUIRE(recorded(context) == std::vector<std::string>{"echo ran", "echo posted"});
    }

    SECTION("History context reflects the recorded commands") {
        handlers.on_run_command(RunCommandMessage{"true", true});
        const auto reply = handlers.on_ask_context(AskContextMessage{ContextType::CommandHistory, std::nullopt});
        REQUIRE(reply.context_info.has_value());
        REQUIRE(json::parse(*reply.context_info)[0]["CommandLine"] == "true");
    }

    SECTION("Background commands are reachable by id") {
        const auto started = handlers.on_run_command(RunCommandMessage{"true", false});
        REQUIRE(started.output == "cmd-1");
        const auto unknown = handlers.on_ask_command_output(AskCommandOutputMessage{"cmd-9"});
        REQUIRE(unknown.had_error);
    }
}
