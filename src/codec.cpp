#include "protocol/codec.hpp"
#include "protocol/errors.hpp"
#include <utility>

namespace protocol {

namespace {

void append_u32(std::vector<uint8_t>& buffer, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        buffer.push_back(static_cast<uint8_t>(value >> (i * 8)));
    }
}

void append_u64(std::vector<uint8_t>& buffer, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        buffer.push_back(static_cast<uint8_t>(value >> (i * 8)));
    }
}

// Bounds-checked little-endian reader over a payload.
class PayloadReader {
public:
    explicit PayloadReader(const std::vector<uint8_t>& payload) : payload_(payload) {}

    uint32_t u32() {
        require(4);
        uint32_t value = 0;
        for (int i = 3; i >= 0; --i) {
            value = (value << 8) | payload_[offset_ + i];
        }
        offset_ += 4;
        return value;
    }

    uint64_t u64() {
        require(8);
        uint64_t value = 0;
        for (int i = 7; i >= 0; --i) {
            value = (value << 8) | payload_[offset_ + i];
        }
        offset_ += 8;
        return value;
    }

    std::string bytes(uint64_t count) {
        require(count);
        std::string out(reinterpret_cast<const char*>(payload_.data() + offset_),
                        static_cast<size_t>(count));
        offset_ += static_cast<size_t>(count);
        return out;
    }

    void finish() const {
        if (offset_ != payload_.size()) {
            throw ProtocolError("Trailing bytes in payload: " +
                                std::to_string(payload_.size() - offset_));
        }
    }

private:
    void require(uint64_t count) const {
        if (count > payload_.size() - offset_) {
            throw ProtocolError("Truncated payload: needed " + std::to_string(count) +
                                " byte(s), " + std::to_string(payload_.size() - offset_) +
                                " left");
        }
    }

    const std::vector<uint8_t>& payload_;
    size_t offset_ = 0;
};

// Length of the well-formed UTF-8 sequence starting at `i`, or 0 if there is
// none. Overlong forms, surrogates and code points above U+10FFFF are not
// well-formed.
size_t utf8_sequence_length(std::string_view text, size_t i) {
    uint8_t lead = static_cast<uint8_t>(text[i]);
    if (lead < 0x80) {
        return 1;
    }

    size_t extra;
    uint32_t code_point;
    if ((lead & 0xE0) == 0xC0) {
        extra = 1;
        code_point = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        extra = 2;
        code_point = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        extra = 3;
        code_point = lead & 0x07;
    } else {
        return 0;
    }

    if (extra >= text.size() - i) return 0;
    for (size_t k = 1; k <= extra; ++k) {
        uint8_t cont = static_cast<uint8_t>(text[i + k]);
        if ((cont & 0xC0) != 0x80) return 0;
        code_point = (code_point << 6) | (cont & 0x3F);
    }

    static const uint32_t min_for_length[] = {0, 0x80, 0x800, 0x10000};
    if (code_point < min_for_length[extra]) return 0;
    if (code_point >= 0xD800 && code_point <= 0xDFFF) return 0;
    if (code_point > 0x10FFFF) return 0;
    return extra + 1;
}

} // namespace

std::array<uint8_t, 4> serialize_u32(uint32_t value) {
    std::array<uint8_t, 4> buffer;
    for (size_t i = 0; i < buffer.size(); ++i) {
        buffer[i] = static_cast<uint8_t>(value >> (i * 8));
    }
    return buffer;
}

uint32_t deserialize_u32(const std::array<uint8_t, 4>& buffer) {
    return static_cast<uint32_t>(buffer[0]) |
           (static_cast<uint32_t>(buffer[1]) << 8) |
           (static_cast<uint32_t>(buffer[2]) << 16) |
           (static_cast<uint32_t>(buffer[3]) << 24);
}

std::vector<uint8_t> encode_frame(const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> frame;
    frame.reserve(4 + payload.size());
    append_u32(frame, static_cast<uint32_t>(payload.size()));
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

uint32_t decode_frame_length(const std::array<uint8_t, 4>& prefix) {
    uint32_t length = deserialize_u32(prefix);
    if (length > MAX_FRAME_SIZE) {
        throw ProtocolError("Frame too large: " + std::to_string(length) + " bytes");
    }
    return length;
}

std::vector<uint8_t> decode_frame(const std::vector<uint8_t>& buffer, size_t& consumed) {
    if (buffer.size() < 4) {
        throw ProtocolError("Incomplete frame length");
    }
    std::array<uint8_t, 4> prefix{buffer[0], buffer[1], buffer[2], buffer[3]};
    uint32_t length = decode_frame_length(prefix);
    if (length > buffer.size() - 4) {
        throw ProtocolError("Incomplete frame: declared " + std::to_string(length) +
                            " byte(s), " + std::to_string(buffer.size() - 4) + " available");
    }
    consumed = 4 + static_cast<size_t>(length);
    return std::vector<uint8_t>(buffer.begin() + 4, buffer.begin() + consumed);
}

std::vector<uint8_t> encode_request(const Request& request) {
    std::vector<uint8_t> payload;
    append_u32(payload, static_cast<uint32_t>(request.tag));
    switch (request.tag) {
        case RequestTag::DOWNLOAD_FILE_BY_INDEX:
            append_u64(payload, request.index);
            break;
        case RequestTag::DOWNLOAD_FILE_BY_NAME:
            append_u64(payload, request.name.size());
            payload.insert(payload.end(), request.name.begin(), request.name.end());
            break;
        default:
            break;
    }
    return payload;
}

Request decode_request(const std::vector<uint8_t>& payload) {
    PayloadReader reader(payload);
    uint32_t tag = reader.u32();

    Request request;
    switch (tag) {
        case static_cast<uint32_t>(RequestTag::DISCONNECT):
            request = Request::disconnect();
            break;
        case static_cast<uint32_t>(RequestTag::GET_FILE_COUNT):
            request = Request::get_file_count();
            break;
        case static_cast<uint32_t>(RequestTag::DOWNLOAD_FILE_BY_INDEX):
            request = Request::download_file_by_index(reader.u64());
            break;
        case static_cast<uint32_t>(RequestTag::DOWNLOAD_FILE_BY_NAME): {
            uint64_t length = reader.u64();
            std::string name = reader.bytes(length);
            if (!is_valid_utf8(name)) {
                throw ProtocolError("Request name is not valid UTF-8");
            }
            request = Request::download_file_by_name(std::move(name));
            break;
        }
        case static_cast<uint32_t>(RequestTag::DOWNLOAD_ALL_FILES):
            request = Request::download_all_files();
            break;
        default:
            throw ProtocolError("Unknown request tag: " + std::to_string(tag));
    }
    reader.finish();
    return request;
}

std::vector<uint8_t> encode_request_result(RequestResult result) {
    std::vector<uint8_t> payload;
    append_u32(payload, static_cast<uint32_t>(result));
    return payload;
}

RequestResult decode_request_result(const std::vector<uint8_t>& payload) {
    PayloadReader reader(payload);
    uint32_t tag = reader.u32();
    reader.finish();
    switch (tag) {
        case static_cast<uint32_t>(RequestResult::OK):
        case static_cast<uint32_t>(RequestResult::UNAUTHORIZED_ACCESS):
        case static_cast<uint32_t>(RequestResult::INDEX_OUT_OF_BOUNDS):
            return static_cast<RequestResult>(tag);
        default:
            throw ProtocolError("Unknown request result tag: " + std::to_string(tag));
    }
}

std::vector<uint8_t> encode_text(std::string_view text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

std::string decode_text(const std::vector<uint8_t>& payload) {
    std::string text(payload.begin(), payload.end());
    if (!is_valid_utf8(text)) {
        throw ProtocolError("Text payload is not valid UTF-8");
    }
    return text;
}

bool is_valid_utf8(std::string_view text) {
    size_t i = 0;
    while (i < text.size()) {
        size_t length = utf8_sequence_length(text, i);
        if (length == 0) return false;
        i += length;
    }
    return true;
}

std::string to_valid_utf8(std::string_view text) {
    static const char replacement[] = "\xEF\xBF\xBD";   // U+FFFD

    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        size_t length = utf8_sequence_length(text, i);
        if (length == 0) {
            out += replacement;
            ++i;
        } else {
            out.append(text.substr(i, length));
            i += length;
        }
    }
    return out;
}

} // namespace protocol
