#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <string>
#include <vector>

#include "aibridge/core/ipc/errors.hpp"
#include "aibridge/core/ipc/frame_codec.hpp"

using namespace aibridge::core::ipc;

namespace {

Message decode(const std::vector<std::uint8_t>& frame) {
    REQUIRE(frame.size() >= kFrameHeaderSize);
    const auto type = message_type_from_byte(frame[0]);
    REQUIRE(type.has_value());

    std::array<std::uint8_t, kLengthFieldSize> length{};
    std::copy(frame.begin() + 1, frame.begin() + kFrameHeaderSize, length.begin());
    REQUIRE(decode_length(length) == frame.size() - kFrameHeaderSize);
    return decode_frame_payload(*type, frame.data() + kFrameHeaderSize, frame.size() - kFrameHeaderSize);
}

Message decode_text(MessageType type, const std::string& payload) {
    return decode_frame_payload(type, reinterpret_cast<const std::uint8_t*>(payload.data()), payload.size());
}

}  // namespace

TEST_CASE("Frame layout", "[ipc][codec]") {
    SECTION("Type byte, little-endian length, JSON payload") {
        const auto frame = encode_frame(AskConnectionMessage{"aibridge_as.42.assistant"});

        REQUIRE(frame[0] == static_cast<std::uint8_t>(MessageType::AskConnection));
        const std::uint32_t length = frame[1] | (frame[2] << 8) | (frame[3] << 16) | (frame[4] << 24);
        REQUIRE(length == frame.size() - kFrameHeaderSize);

        const auto payload = nlohmann::json::parse(frame.begin() + kFrameHeaderSize, frame.end());
        REQUIRE(payload["PipeName"] == "aibridge_as.42.assistant");
        REQUIRE(payload["Type"] == 1);
    }

    SECTION("Length encoding") {
        const auto bytes = encode_length(0x01020304u);
        REQUIRE(bytes[0] == 0x04);
        REQUIRE(bytes[1] == 0x03);
        REQUIRE(bytes[2] == 0x02);
        REQUIRE(bytes[3] == 0x01);
        REQUIRE(decode_length(bytes) == 0x01020304u);
    }

    SECTION("Type tags") {
        REQUIRE(message_type_from_byte(0) == MessageType::PostQuery);
        REQUIRE(message_type_from_byte(7) == MessageType::PostResult);
        REQUIRE_FALSE(message_type_from_byte(8).has_value());
        REQUIRE_FALSE(message_type_from_byte(0xFF).has_value());
    }
}

TEST_CASE("Messages survive encoding", "[ipc][codec]") {
    const std::vector<Message> messages = {
        PostQueryMessage{"list files", std::string{"{\"cwd\":\"/tmp\"}"}, std::string{"pwsh"}},
        PostQueryMessage{"hello", std::nullopt, std::nullopt},
        AskConnectionMessage{"aibridge_as.1.x"},
        AskContextMessage{ContextType::EnvironmentVariables, std::vector<std::string>{"PATH", "HOME"}},
        AskContextMessage{ContextType::CommandHistory, std::nullopt},
        AskContextMessage{ContextType::TerminalContent, std::vector<std::string>{}},
        PostContextMessage{std::string{"[]"}},
        PostContextMessage::none(),
        PostCodeMessage{{"ls -la", "echo \"done\"\n"}},
        PostCodeMessage{{}},
        RunCommandMessage{"make -j8", true},
        AskCommandOutputMessage{"cmd-3"},
        PostResultMessage{"out\nput", true, false, std::string{"boom"}},
        PostResultMessage{"", false, true, std::nullopt},
    };

    for (const auto& message : messages) {
        CAPTURE(to_string(type_of(message)));
        REQUIRE(decode(encode_frame(message)) == message);
    }
}

TEST_CASE("Payload decoding", "[ipc][codec]") {
    SECTION("Unknown keys are ignored") {
        const auto message = decode_text(MessageType::RunCommand,
                                         R"({"Command":"ls","Blocking":true,"Type":5,"Extra":{"a":1}})");
        REQUIRE(message == Message{RunCommandMessage{"ls", true}});
    }

    SECTION("Missing optional fields take defaults") {
        const auto message = decode_text(MessageType::PostResult, R"({"Output":"x"})");
        REQUIRE(message == Message{PostResultMessage{"x", false, false, std::nullopt}});
    }

    SECTION("Malformed payloads are corrupt frames") {
        REQUIRE_THROWS_AS(decode_text(MessageType::PostQuery, "not json"), CorruptFrameError);
        REQUIRE_THROWS_AS(decode_text(MessageType::PostQuery, "[1,2]"), CorruptFrameError);
        REQUIRE_THROWS_AS(decode_text(MessageType::PostQuery, R"({"Query":42})"), CorruptFrameError);
        REQUIRE_THROWS_AS(decode_text(MessageType::PostCode, R"({"CodeBlocks":"ls"})"), CorruptFrameError);
        REQUIRE_THROWS_AS(decode_text(MessageType::AskConnection, "{}"), CorruptFrameError);
        REQUIRE_THROWS_WITH(decode_text(MessageType::RunCommand, R"({"Command":""})"),
                            Catch::Matchers::ContainsSubstring("'RunCommand'"));
    }

    SECTION("Unknown type is a corrupt frame") {
        REQUIRE_THROWS_AS(decode_text(static_cast<MessageType>(8), "{}"), CorruptFrameError);
    }
}

TEST_CASE("Required fields are checked before sending", "[ipc][codec]") {
    REQUIRE_THROWS_AS(encode_frame(PostQueryMessage{"", std::nullopt, std::nullopt}), std::invalid_argument);
    REQUIRE_THROWS_AS(encode_frame(AskConnectionMessage{""}), std::invalid_argument);
    REQUIRE_THROWS_AS(encode_frame(RunCommandMessage{"", false}), std::invalid_argument);
    REQUIRE_THROWS_AS(encode_frame(AskCommandOutputMessage{""}), std::invalid_argument);
    REQUIRE_NOTHROW(encode_frame(PostCodeMessage{{}}));
}

TEST_CASE("Invalid UTF-8 in command output is replaced", "[ipc][codec]") {
    const auto frame = encode_frame(PostResultMessage{std::string{"ok \xff\xfe end"}, false, false, std::nullopt});
    const auto message = std::get<PostResultMessage>(decode(frame));
    REQUIRE(message.output.rfind("ok ", 0) == 0);
    REQUIRE(message.output.find(" end") != std::string::npos);
}
