#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace aibridge::core::ipc {

/**
 * @brief Message kinds exchanged over a channel.
 *
 * The numeric values are part of the wire format: new kinds are appended,
 * existing values are never reused or reordered.
 */
enum class MessageType : std::uint8_t {
    PostQuery = 0,         // shell -> assistant: a user query
    AskConnection = 1,     // assistant -> shell: first message, names the pipe to connect back to
    AskContext = 2,        // assistant -> shell
    PostContext = 3,       // shell -> assistant: reply to AskContext
    PostCode = 4,          // assistant -> shell: code blocks to insert
    RunCommand = 5,        // assistant -> shell
    AskCommandOutput = 6,  // assistant -> shell: output of a non-blocking RunCommand
    PostResult = 7         // shell -> assistant: reply to RunCommand / AskCommandOutput
};

inline constexpr MessageType kLastMessageType = MessageType::PostResult;

enum class ContextType : int {
    CurrentLocation = 0,
    CommandHistory = 1,
    TerminalContent = 2,
    EnvironmentVariables = 3
};

inline constexpr ContextType kLastContextType = ContextType::EnvironmentVariables;

struct PostQueryMessage {
    std::string query;
    std::optional<std::string> context;
    std::optional<std::string> agent;

    bool operator==(const PostQueryMessage&) const = default;
};

struct AskConnectionMessage {
    std::string pipe_name;

    bool operator==(const AskConnectionMessage&) const = default;
};

struct AskContextMessage {
    ContextType context_type{ContextType::CurrentLocation};
    std::optional<std::vector<std::string>> arguments;

    bool operator==(const AskContextMessage&) const = default;
};

struct PostContextMessage {
    // Null when the shell has no context to return.
    std::optional<std::string> context_info;

    static PostContextMessage none() { return {}; }

    bool operator==(const PostContextMessage&) const = default;
};

struct PostCodeMessage {
    std::vector<std::string> code_blocks;

    bool operator==(const PostCodeMessage&) const = default;
};

struct RunCommandMessage {
    std::string command;
    bool blocking{false};

    bool operator==(const RunCommandMessage&) const = default;
};

struct AskCommandOutputMessage {
    std::string command_id;

    bool operator==(const AskCommandOutputMessage&) const = default;
};

struct PostResultMessage {
    // Command output, or the command id for a non-blocking run.
    std::string output;
    bool had_error{false};
    bool user_cancelled{false};
    std::optional<std::string> exception;

    bool operator==(const PostResultMessage&) const = default;
};

// Alternative index == MessageType value.
using Message = std::variant<PostQueryMessage,
                             AskConnectionMessage,
                             AskContextMessage,
                             PostContextMessage,
                             PostCodeMessage,
                             RunCommandMessage,
                             AskCommandOutputMessage,
                             PostResultMessage>;

static_assert(std::variant_size_v<Message> == static_cast<std::size_t>(kLastMessageType) + 1,
              "every MessageType needs exactly one Message alternative");

[[nodiscard]] MessageType type_of(const Message& message) noexcept;
[[nodiscard]] std::optional<MessageType> message_type_from_byte(std::uint8_t value) noexcept;
[[nodiscard]] std::string_view to_string(MessageType type) noexcept;
[[nodiscard]] std::string_view to_string(ContextType type) noexcept;

/**
 * @brief Checks the required-field constraints of a message.
 * @throws std::invalid_argument naming the offending field
 */
void validate(const Message& message);

/**
 * @brief Serializes the message fields to a UTF-8 JSON object.
 */
[[nodiscard]] std::string to_payload(const Message& message);

/**
 * @brief Parses a JSON payload into the variant selected by @p type.
 * @throws CorruptFrameError when the payload is not valid for that type
 */
[[nodiscard]] Message from_payload(MessageType type, std::string_view payload);

}  // namespace aibridge::core::ipc
