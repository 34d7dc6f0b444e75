#include "test_helpers.hpp"
#include <array>
#include <atomic>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;
using boost::asio::ip::tcp;

namespace testing_support {

namespace {
std::atomic<int> next_id{0};
}

TempDir::TempDir(const std::string& prefix) {
    path_ = fs::temp_directory_path() /
            (prefix + "_" + std::to_string(::getpid()) + "_" + std::to_string(next_id++));
    fs::remove_all(path_);
    fs::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

void write_file(const fs::path& path, const std::string& contents) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("cannot create " + path.string());
    }
    file << contents;
}

std::string read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open " + path.string());
    }
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

SocketPair::SocketPair() : client(io_context), server(io_context) {
    tcp::acceptor acceptor(io_context, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
    client.connect(acceptor.local_endpoint());
    acceptor.accept(server);
}

void write_bytes(tcp::socket& socket, const std::vector<uint8_t>& bytes) {
    boost::asio::write(socket, boost::asio::buffer(bytes));
}

std::vector<uint8_t> read_bytes(tcp::socket& socket, size_t count) {
    std::vector<uint8_t> bytes(count);
    boost::asio::read(socket, boost::asio::buffer(bytes));
    return bytes;
}

std::vector<uint8_t> read_to_end(tcp::socket& socket) {
    std::vector<uint8_t> bytes;
    std::array<uint8_t, 4096> chunk;
    for (;;) {
        boost::system::error_code ec;
        size_t n = socket.read_some(boost::asio::buffer(chunk), ec);
        bytes.insert(bytes.end(), chunk.begin(), chunk.begin() + n);
        if (ec == boost::asio::error::eof) break;
        if (ec) throw boost::system::system_error(ec);
    }
    return bytes;
}

} // namespace testing_support
