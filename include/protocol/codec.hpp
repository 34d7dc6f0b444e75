#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include "protocol/request.hpp"

namespace protocol {

// Upper bound for a single control frame (request, result or text).
// File bodies are not framed and are not subject to it.
constexpr uint32_t MAX_FRAME_SIZE = 1024 * 1024;

// Raw little-endian u32, sent without a length prefix (counts and file lengths).
std::array<uint8_t, 4> serialize_u32(uint32_t value);
uint32_t deserialize_u32(const std::array<uint8_t, 4>& buffer);

// Frame = u32 LE payload length + payload.
std::vector<uint8_t> encode_frame(const std::vector<uint8_t>& payload);

// Reads a frame's length prefix. Throws ProtocolError above MAX_FRAME_SIZE.
// The socket receive path and decode_frame both go through it.
uint32_t decode_frame_length(const std::array<uint8_t, 4>& prefix);

// Decodes the frame at the start of an in-memory buffer. Throws ProtocolError
// if the buffer holds fewer bytes than the frame declares, or the length is
// above the cap. `consumed` receives the frame size.
std::vector<uint8_t> decode_frame(const std::vector<uint8_t>& buffer, size_t& consumed);

// Tagged-union payloads: u32 LE tag, then the variant fields in order.
// DOWNLOAD_FILE_BY_INDEX carries a u64 LE, DOWNLOAD_FILE_BY_NAME a u64 LE length
// followed by UTF-8 bytes.
std::vector<uint8_t> encode_request(const Request& request);
Request decode_request(const std::vector<uint8_t>& payload);

std::vector<uint8_t> encode_request_result(RequestResult result);
RequestResult decode_request_result(const std::vector<uint8_t>& payload);

std::vector<uint8_t> encode_text(std::string_view text);
std::string decode_text(const std::vector<uint8_t>& payload);

bool is_valid_utf8(std::string_view text);

// Replaces every byte that does not start a well-formed sequence with U+FFFD.
std::string to_valid_utf8(std::string_view text);

} // namespace protocol
