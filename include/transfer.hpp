#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include "protocol/request.hpp"
#include "parity.hpp"

namespace transfer {

// Progress callback: filename, bytes_transferred, bytes_total, speed_mbps
using TransferProgressCallback = std::function<void(const std::string&, uint64_t, uint64_t, double)>;

constexpr size_t CHUNK_SIZE = 64 * 1024;

// Every write either completes or throws protocol::IoError.
class MessageSender {
public:
    static void send_u32(boost::asio::ip::tcp::socket& socket, uint32_t value);
    static void send_text(boost::asio::ip::tcp::socket& socket, const std::string& text);
    static void send_request(boost::asio::ip::tcp::socket& socket, const protocol::Request& request);
    static void send_request_result(boost::asio::ip::tcp::socket& socket, protocol::RequestResult result);

    // Raw u32 length, then exactly entry.length bytes of the file, unframed.
    static void send_file(boost::asio::ip::tcp::socket& socket, const parity::Entry& entry,
                          TransferProgressCallback progress_cb = nullptr);
};

// Reads block until satisfied. A stream closed mid-frame throws
// protocol::ProtocolError, any other socket or disk failure protocol::IoError.
class MessageReceiver {
public:
    static uint32_t receive_u32(boost::asio::ip::tcp::socket& socket);
    static std::string receive_text(boost::asio::ip::tcp::socket& socket);
    static protocol::Request receive_request(boost::asio::ip::tcp::socket& socket);
    static protocol::RequestResult receive_request_result(boost::asio::ip::tcp::socket& socket);

    // Reads the raw u32 length and then the file body into `filepath`.
    // Returns the number of bytes written.
    static uint32_t receive_file(boost::asio::ip::tcp::socket& socket,
                                 const std::filesystem::path& filepath,
                                 TransferProgressCallback progress_cb = nullptr);

    // Body only: reads exactly `expected_size` bytes into a new file at `filepath`.
    static void receive_file_body(boost::asio::ip::tcp::socket& socket,
                                  const std::filesystem::path& filepath, uint32_t expected_size,
                                  TransferProgressCallback progress_cb = nullptr);

private:
    static std::vector<uint8_t> receive_frame(boost::asio::ip::tcp::socket& socket);
};

} // namespace transfer
