#include "transfer.hpp"
#include "protocol/codec.hpp"
#include "protocol/errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <array>
#include <chrono>
#include <fstream>
#include <utility>

namespace transfer {

namespace {

void write_all(boost::asio::ip::tcp::socket& socket, const void* data, size_t size) {
    boost::system::error_code ec;
    boost::asio::write(socket, boost::asio::buffer(data, size), ec);
    if (ec) {
        throw protocol::IoError("Socket write failed: " + ec.message());
    }
}

// Control messages: a peer hanging up mid-message is a protocol violation.
void read_exact(boost::asio::ip::tcp::socket& socket, void* data, size_t size, const char* what) {
    boost::system::error_code ec;
    boost::asio::read(socket, boost::asio::buffer(data, size), ec);
    if (ec == boost::asio::error::eof) {
        throw protocol::ProtocolError(std::string("Connection closed while reading ") + what);
    }
    if (ec) {
        throw protocol::IoError(std::string("Socket read failed (") + what + "): " + ec.message());
    }
}

// Reports at most every 300ms, plus once when the transfer completes.
class ProgressMeter {
public:
    ProgressMeter(TransferProgressCallback cb, std::string name, uint64_t total)
        : cb_(std::move(cb)), name_(std::move(name)), total_(total),
          start_time_(std::chrono::steady_clock::now()), last_cb_time_(start_time_) {}

    void update(uint64_t done) {
        if (!cb_) return;
        auto now = std::chrono::steady_clock::now();
        auto elapsed_since_cb = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_cb_time_).count();
        if (elapsed_since_cb >= 300 || done == total_) {
            double elapsed = std::chrono::duration<double>(now - start_time_).count();
            double speed = (elapsed > 0) ? (done / elapsed / (1024.0 * 1024.0)) : 0;
            cb_(name_, done, total_, speed);
            last_cb_time_ = now;
        }
    }

private:
    TransferProgressCallback cb_;
    std::string name_;
    uint64_t total_;
    std::chrono::steady_clock::time_point start_time_;
    std::chrono::steady_clock::time_point last_cb_time_;
};

} // namespace

// ─── MessageSender ──────────────────────────────────────────────────────────

void MessageSender::send_u32(boost::asio::ip::tcp::socket& socket, uint32_t value) {
    auto buf = protocol::serialize_u32(value);
    write_all(socket, buf.data(), buf.size());
}

void MessageSender::send_text(boost::asio::ip::tcp::socket& socket, const std::string& text) {
    auto frame = protocol::encode_frame(protocol::encode_text(text));
    write_all(socket, frame.data(), frame.size());
}

void MessageSender::send_request(boost::asio::ip::tcp::socket& socket, const protocol::Request& request) {
    auto frame = protocol::encode_frame(protocol::encode_request(request));
    write_all(socket, frame.data(), frame.size());
}

void MessageSender::send_request_result(boost::asio::ip::tcp::socket& socket, protocol::RequestResult result) {
    auto frame = protocol::encode_frame(protocol::encode_request_result(result));
    write_all(socket, frame.data(), frame.size());
}

void MessageSender::send_file(boost::asio::ip::tcp::socket& socket, const parity::Entry& entry,
                              TransferProgressCallback progress_cb) {
    std::ifstream file(entry.path, std::ios::binary);
    if (!file.is_open()) {
        throw protocol::IoError("Could not open file for reading: " + entry.path.string());
    }

    logging::debug("Sending " + entry.name + " (" + std::to_string(entry.length) + " bytes)");
    send_u32(socket, entry.length);

    ProgressMeter meter(std::move(progress_cb), entry.name, entry.length);
    std::vector<char> buffer(CHUNK_SIZE);
    uint64_t total_sent = 0;
    while (total_sent < entry.length) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(buffer.size(), entry.length - total_sent));
        file.read(buffer.data(), static_cast<std::streamsize>(want));
        std::streamsize bytes_read = file.gcount();
        if (bytes_read <= 0) {
            throw protocol::IoError("File ended after " + std::to_string(total_sent) + " of " +
                                    std::to_string(entry.length) + " bytes: " + entry.path.string());
        }
        write_all(socket, buffer.data(), static_cast<size_t>(bytes_read));
        total_sent += static_cast<uint64_t>(bytes_read);
        meter.update(total_sent);
    }
    if (entry.length == 0) {
        meter.update(0);
    }
}

// ─── MessageReceiver ────────────────────────────────────────────────────────

std::vector<uint8_t> MessageReceiver::receive_frame(boost::asio::ip::tcp::socket& socket) {
    std::array<uint8_t, 4> prefix;
    read_exact(socket, prefix.data(), prefix.size(), "frame length");
    uint32_t length = protocol::decode_frame_length(prefix);
    std::vector<uint8_t> payload(length);
    if (length > 0) {
        read_exact(socket, payload.data(), payload.size(), "frame payload");
    }
    return payload;
}

uint32_t MessageReceiver::receive_u32(boost::asio::ip::tcp::socket& socket) {
    std::array<uint8_t, 4> buf;
    read_exact(socket, buf.data(), buf.size(), "u32");
    return protocol::deserialize_u32(buf);
}

std::string MessageReceiver::receive_text(boost::asio::ip::tcp::socket& socket) {
    return protocol::decode_text(receive_frame(socket));
}

protocol::Request MessageReceiver::receive_request(boost::asio::ip::tcp::socket& socket) {
    return protocol::decode_request(receive_frame(socket));
}

protocol::RequestResult MessageReceiver::receive_request_result(boost::asio::ip::tcp::socket& socket) {
    return protocol::decode_request_result(receive_frame(socket));
}

uint32_t MessageReceiver::receive_file(boost::asio::ip::tcp::socket& socket,
                                       const std::filesystem::path& filepath,
                                       TransferProgressCallback progress_cb) {
    uint32_t length = receive_u32(socket);
    logging::debug("Receiving " + filepath.string() + " (" + std::to_string(length) + " bytes)");
    receive_file_body(socket, filepath, length, std::move(progress_cb));
    return length;
}

void MessageReceiver::receive_file_body(boost::asio::ip::tcp::socket& socket,
                                        const std::filesystem::path& filepath, uint32_t expected_size,
                                        TransferProgressCallback progress_cb) {
    std::ofstream file(filepath, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw protocol::IoError("Could not open file for writing: " + filepath.string());
    }

    ProgressMeter meter(std::move(progress_cb), filepath.filename().string(), expected_size);
    std::vector<char> buffer(CHUNK_SIZE);
    uint64_t total_received = 0;
    while (total_received < expected_size) {
        // Never read past the body: the next message may already be in flight.
        size_t want = static_cast<size_t>(std::min<uint64_t>(buffer.size(), expected_size - total_received));
        boost::system::error_code ec;
        size_t n = socket.read_some(boost::asio::buffer(buffer.data(), want), ec);
        if (ec == boost::asio::error::eof) {
            throw protocol::IoError("Connection closed after " + std::to_string(total_received) + " of " +
                                    std::to_string(expected_size) + " bytes");
        }
        if (ec) {
            throw protocol::IoError("Socket read failed: " + ec.message());
        }

        file.write(buffer.data(), static_cast<std::streamsize>(n));
        if (!file) {
            throw protocol::IoError("Write failed: " + filepath.string());
        }
        total_received += n;
        meter.update(total_received);
    }
    if (expected_size == 0) {
        meter.update(0);
    }

    file.close();
    if (!file) {
        throw protocol::IoError("Could not finish writing " + filepath.string());
    }
}

} // namespace transfer
