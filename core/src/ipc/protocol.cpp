#include "aibridge/core/ipc/protocol.hpp"
#include "aibridge/core/ipc/errors.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <type_traits>
#include <utility>

namespace aibridge::core::ipc {

using json = nlohmann::json;

namespace {

std::optional<std::string> optional_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

json optional_to_json(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

std::string required_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        throw std::invalid_argument(std::string("missing required field '") + key + "'");
    }
    return it->get<std::string>();
}

template <typename T>
T value_or(const json& j, const char* key, T default_value) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return default_value;
    }
    return it->get<T>();
}

void require_non_empty(const std::string& value, const char* field) {
    if (value.empty()) {
        throw std::invalid_argument(std::string("'") + field + "' must not be empty");
    }
}

}  // namespace

// ADL hooks for nlohmann::json. Keys follow the wire format field names.

void to_json(json& j, const PostQueryMessage& m) {
    j = json{{"Query", m.query}, {"Context", optional_to_json(m.context)}, {"Agent", optional_to_json(m.agent)}};
}

void from_json(const json& j, PostQueryMessage& m) {
    m.query = required_string(j, "Query");
    m.context = optional_string(j, "Context");
    m.agent = optional_string(j, "Agent");
}

void to_json(json& j, const AskConnectionMessage& m) {
    j = json{{"PipeName", m.pipe_name}};
}

void from_json(const json& j, AskConnectionMessage& m) {
    m.pipe_name = required_string(j, "PipeName");
}

void to_json(json& j, const AskContextMessage& m) {
    j = json{{"ContextType", static_cast<int>(m.context_type)}};
    j["Arguments"] = m.arguments ? json(*m.arguments) : json(nullptr);
}

void from_json(const json& j, AskContextMessage& m) {
    m.context_type = static_cast<ContextType>(value_or<int>(j, "ContextType", 0));
    auto it = j.find("Arguments");
    if (it == j.end() || it->is_null()) {
        m.arguments.reset();
    } else {
        m.arguments = it->get<std::vector<std::string>>();
    }
}

void to_json(json& j, const PostContextMessage& m) {
    j = json{{"ContextInfo", optional_to_json(m.context_info)}};
}

void from_json(const json& j, PostContextMessage& m) {
    m.context_info = optional_string(j, "ContextInfo");
}

void to_json(json& j, const PostCodeMessage& m) {
    j = json{{"CodeBlocks", m.code_blocks}};
}

void from_json(const json& j, PostCodeMessage& m) {
    auto it = j.find("CodeBlocks");
    if (it == j.end() || it->is_null()) {
        throw std::invalid_argument("missing required field 'CodeBlocks'");
    }
    m.code_blocks = it->get<std::vector<std::string>>();
}

void to_json(json& j, const RunCommandMessage& m) {
    j = json{{"Command", m.command}, {"Blocking", m.blocking}};
}

void from_json(const json& j, RunCommandMessage& m) {
    m.command = required_string(j, "Command");
    m.blocking = value_or<bool>(j, "Blocking", false);
}

void to_json(json& j, const AskCommandOutputMessage& m) {
    j = json{{"CommandId", m.command_id}};
}

void from_json(const json& j, AskCommandOutputMessage& m) {
    m.command_id = required_string(j, "CommandId");
}

void to_json(json& j, const PostResultMessage& m) {
    j = json{{"Output", m.output},
             {"HadError", m.had_error},
             {"UserCancelled", m.user_cancelled},
             {"Exception", optional_to_json(m.exception)}};
}

void from_json(const json& j, PostResultMessage& m) {
    m.output = optional_string(j, "Output").value_or(std::string{});
    m.had_error = value_or<bool>(j, "HadError", false);
    m.user_cancelled = value_or<bool>(j, "UserCancelled", false);
    m.exception = optional_string(j, "Exception");
}

MessageType type_of(const Message& message) noexcept {
    return static_cast<MessageType>(message.index());
}

std::optional<MessageType> message_type_from_byte(std::uint8_t value) noexcept {
    if (value > static_cast<std::uint8_t>(kLastMessageType)) {
        return std::nullopt;
    }
    return static_cast<MessageType>(value);
}

std::string_view to_string(MessageType type) noexcept {
    switch (type) {
        case MessageType::PostQuery:        return "PostQuery";
        case MessageType::AskConnection:    return "AskConnection";
        case MessageType::AskContext:       return "AskContext";
        case MessageType::PostContext:      return "PostContext";
        case MessageType::PostCode:         return "PostCode";
        case MessageType::RunCommand:       return "RunCommand";
        case MessageType::AskCommandOutput: return "AskCommandOutput";
        case MessageType::PostResult:       return "PostResult";
        default:                            return "Unknown";
    }
}

std::string_view to_string(ContextType type) noexcept {
    switch (type) {
        case ContextType::CurrentLocation:      return "CurrentLocation";
        case ContextType::CommandHistory:       return "CommandHistory";
        case ContextType::TerminalContent:      return "TerminalContent";
        case ContextType::EnvironmentVariables: return "EnvironmentVariables";
        default:                                return "Unknown";
    }
}

void validate(const Message& message) {
    std::visit(
        [](const auto& m) {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, PostQueryMessage>) {
                require_non_empty(m.query, "Query");
            } else if constexpr (std::is_same_v<T, AskConnectionMessage>) {
                require_non_empty(m.pipe_name, "PipeName");
            } else if constexpr (std::is_same_v<T, RunCommandMessage>) {
                require_non_empty(m.command, "Command");
            } else if constexpr (std::is_same_v<T, AskCommandOutputMessage>) {
                require_non_empty(m.command_id, "CommandId");
            }
        },
        message);
}

std::string to_payload(const Message& message) {
    json j;
    std::visit([&j](const auto& m) { j = m; }, message);
    j["Type"] = static_cast<int>(type_of(message));
    // Command output is not guaranteed to be valid UTF-8.
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

namespace {

template <std::size_t Index>
Message parse_alternative(const json& j) {
    return Message{std::in_place_index<Index>, j.get<std::variant_alternative_t<Index, Message>>()};
}

template <std::size_t... Indices>
Message parse_by_index(std::size_t index, const json& j, std::index_sequence<Indices...>) {
    using Parser = Message (*)(const json&);
    static constexpr Parser parsers[] = {&parse_alternative<Indices>...};
    return parsers[index](j);
}

}  // namespace

Message from_payload(MessageType type, std::string_view payload) {
    const auto index = static_cast<std::size_t>(type);
    if (index >= std::variant_size_v<Message>) {
        throw CorruptFrameError("Unknown message type: " + std::to_string(index));
    }

    try {
        auto j = json::parse(payload.begin(), payload.end());
        if (!j.is_object()) {
            throw std::invalid_argument("payload is not a JSON object");
        }
        auto message = parse_by_index(index, j, std::make_index_sequence<std::variant_size_v<Message>>{});
        validate(message);
        return message;
    } catch (const json::exception& e) {
        throw CorruptFrameError("Malformed '" + std::string(to_string(type)) + "' payload: " + e.what());
    } catch (const std::invalid_argument& e) {
        throw CorruptFrameError("Malformed '" + std::string(to_string(type)) + "' payload: " + e.what());
    }
}

}  // namespace aibridge::core::ipc
