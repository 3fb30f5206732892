#include "aibridge/core/ipc/frame_codec.hpp"
#include "aibridge/core/ipc/errors.hpp"

#include <stdexcept>
#include <string>
#include <string_view>

namespace aibridge::core::ipc {

std::vector<std::uint8_t> encode_frame(const Message& message) {
    validate(message);

    const std::string payload = to_payload(message);
    if (payload.size() > kMaxPayloadSize) {
        throw std::invalid_argument("message payload exceeds the maximum frame size");
    }

    std::vector<std::uint8_t> frame;
    frame.reserve(kFrameHeaderSize + payload.size());
    frame.push_back(static_cast<std::uint8_t>(type_of(message)));

    const auto length = encode_length(static_cast<std::uint32_t>(payload.size()));
    frame.insert(frame.end(), length.begin(), length.end());
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

std::array<std::uint8_t, kLengthFieldSize> encode_length(std::uint32_t length) noexcept {
    return {static_cast<std::uint8_t>(length & 0xFF),
            static_cast<std::uint8_t>((length >> 8) & 0xFF),
            static_cast<std::uint8_t>((length >> 16) & 0xFF),
            static_cast<std::uint8_t>((length >> 24) & 0xFF)};
}

std::uint32_t decode_length(const std::array<std::uint8_t, kLengthFieldSize>& bytes) noexcept {
    return static_cast<std::uint32_t>(bytes[0]) |
           (static_cast<std::uint32_t>(bytes[1]) << 8) |
           (static_cast<std::uint32_t>(bytes[2]) << 16) |
           (static_cast<std::uint32_t>(bytes[3]) << 24);
}

Message decode_frame_payload(MessageType type, const std::uint8_t* data, std::size_t size) {
    if (size > kMaxPayloadSize) {
        throw CorruptFrameError("Frame payload of " + std::to_string(size) + " bytes exceeds the limit");
    }
    std::string_view payload{reinterpret_cast<const char*>(data), size};
    return from_payload(type, payload);
}

}  // namespace aibridge::core::ipc
