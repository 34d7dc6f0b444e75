#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include "protocol/request.hpp"
#include "transfer.hpp"

namespace networking {

enum class ErrorKind {
    NONE,
    PROTOCOL,   // protocol::ProtocolError
    IO,         // protocol::IoError
    REJECTED    // protocol::ProtocolRejection
};

const char* to_string(ErrorKind kind);

// Outcome of one server-side connection.
struct DispatchReport {
    std::optional<protocol::Request> request;   // empty if decoding failed
    uint32_t files_sent = 0;
    ErrorKind error = ErrorKind::NONE;
    std::string message;

    bool ok() const { return error == ErrorKind::NONE; }
};

// Outcome of one client-side request.
struct ClientReport {
    protocol::Request request;
    std::optional<uint32_t> file_count;          // GetFileCount / DownloadAllFiles
    std::vector<std::filesystem::path> files;    // written, in arrival order
    ErrorKind error = ErrorKind::NONE;
    std::string message;

    bool ok() const { return error == ErrorKind::NONE; }
};

using StatusCallback = std::function<void(const std::string&)>;

struct ClientCallbacks {
    StatusCallback on_status;
    transfer::TransferProgressCallback on_progress;
};

// Reads one request from `connection`, answers it from `parity_root` and closes
// the connection. Never throws for protocol, socket or filesystem failures.
DispatchReport run_request(boost::asio::ip::tcp::socket connection,
                           const std::filesystem::path& parity_root);

// Sends `request` and consumes the reply sequence, writing any received files
// into `download_dir`. Closes the connection before returning.
ClientReport issue_request(boost::asio::ip::tcp::socket connection,
                           const protocol::Request& request,
                           const std::filesystem::path& download_dir,
                           const ClientCallbacks& callbacks = {});

// Resolves `host` and connects. Throws protocol::IoError on failure.
boost::asio::ip::tcp::socket connect(boost::asio::io_context& io_context,
                                     const std::string& host, uint16_t port);

std::string format_size(uint64_t bytes);

// Blocking accept loop. One connection is served to completion before the next
// is accepted.
class Server {
public:
    Server(std::string host, uint16_t port, std::filesystem::path parity_root);

    // Opens the listening socket. Returns the bound port (useful with port 0).
    uint16_t bind();

    // Serves until stop() is called. Per-connection failures are logged only.
    void run();

    // Safe to call from another thread.
    void stop();

    uint16_t port() const { return port_; }
    uint64_t connections_served() const { return connections_served_; }

private:
    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::string host_;
    uint16_t port_;
    std::filesystem::path parity_root_;
    boost::asio::ip::tcp::endpoint wake_endpoint_;
    std::atomic<bool> stop_requested_{false};
    std::atomic<uint64_t> connections_served_{0};
};

} // namespace networking
