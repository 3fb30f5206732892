#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "aibridge/core/ipc/protocol.hpp"

namespace aibridge::core::ipc {

/**
 * @brief Frame layout: [1-byte type][4-byte little-endian length][payload]
 */
inline constexpr std::size_t kTypeFieldSize = 1;
inline constexpr std::size_t kLengthFieldSize = 4;
inline constexpr std::size_t kFrameHeaderSize = kTypeFieldSize + kLengthFieldSize;

// Larger payloads are treated as corruption.
inline constexpr std::uint32_t kMaxPayloadSize = 16u * 1024u * 1024u;

/**
 * @brief Encodes a message into a complete frame.
 * @throws std::invalid_argument if the message violates a required-field constraint
 */
[[nodiscard]] std::vector<std::uint8_t> encode_frame(const Message& message);

[[nodiscard]] std::array<std::uint8_t, kLengthFieldSize> encode_length(std::uint32_t length) noexcept;
[[nodiscard]] std::uint32_t decode_length(const std::array<std::uint8_t, kLengthFieldSize>& bytes) noexcept;

/**
 * @brief Decodes the payload of a frame whose header has already been read.
 * @throws CorruptFrameError on malformed payload bytes
 */
[[nodiscard]] Message decode_frame_payload(MessageType type, const std::uint8_t* data, std::size_t size);

}  // namespace aibridge::core::ipc
