#include "networking.hpp"
#include "protocol/errors.hpp"
#include "logger.hpp"
#include <cstdio>
#include <exception>
#include <utility>

using boost::asio::ip::tcp;

namespace networking {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:     return "none";
        case ErrorKind::PROTOCOL: return "protocol error";
        case ErrorKind::IO:       return "I/O error";
        case ErrorKind::REJECTED: return "rejected";
    }
    return "unknown";
}

std::string format_size(uint64_t bytes) {
    double size = bytes;
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int i = 0;
    while (size >= 1024 && i < 4) {
        size /= 1024;
        i++;
    }
    char buf[32];
    snprintf(buf, sizeof(buf), "%.1f%s", size, units[i]);
    return std::string(buf);
}

tcp::socket connect(boost::asio::io_context& io_context, const std::string& host, uint16_t port) {
    tcp::socket socket(io_context);
    tcp::resolver resolver(io_context);

    boost::system::error_code ec;
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        throw protocol::IoError("Could not resolve " + host + ": " + ec.message());
    }
    boost::asio::connect(socket, endpoints, ec);
    if (ec) {
        throw protocol::IoError("Could not connect to " + host + ":" + std::to_string(port) + ": " + ec.message());
    }
    return socket;
}

// ─── Server ─────────────────────────────────────────────────────────────────

Server::Server(std::string host, uint16_t port, std::filesystem::path parity_root)
    : acceptor_(io_context_), host_(std::move(host)), port_(port), parity_root_(std::move(parity_root)) {}

uint16_t Server::bind() {
    boost::system::error_code ec;
    tcp::resolver resolver(io_context_);
    auto endpoints = resolver.resolve(host_, std::to_string(port_), tcp::resolver::passive, ec);
    if (ec || endpoints.empty()) {
        throw protocol::IoError("Could not resolve bind address " + host_ + ": " + ec.message());
    }
    tcp::endpoint endpoint = endpoints.begin()->endpoint();

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
        boost::system::error_code close_ec;
        acceptor_.close(close_ec);
        throw protocol::IoError("Could not listen on " + host_ + ":" + std::to_string(port_) + ": " + ec.message());
    }

    tcp::endpoint local = acceptor_.local_endpoint(ec);
    if (ec) {
        throw protocol::IoError("Could not read listening address: " + ec.message());
    }
    port_ = local.port();

    wake_endpoint_ = local;
    if (local.address().is_unspecified()) {
        wake_endpoint_.address(local.address().is_v6()
                                   ? boost::asio::ip::address(boost::asio::ip::address_v6::loopback())
                                   : boost::asio::ip::address(boost::asio::ip::address_v4::loopback()));
    }
    return port_;
}

void Server::run() {
    if (!acceptor_.is_open()) {
        bind();
    }

    logging::info("Listening for connections on " + host_ + ":" + std::to_string(port_));
    logging::info("Parity root: " + parity_root_.string());

    while (!stop_requested_) {
        tcp::socket socket(io_context_);
        boost::system::error_code ec;
        acceptor_.accept(socket, ec);
        if (stop_requested_) {
            break;
        }
        if (ec) {
            logging::error("Connection error: " + ec.message());
            continue;
        }

        tcp::endpoint peer = socket.remote_endpoint(ec);
        std::string peer_name = ec ? std::string("unknown peer")
                                   : peer.address().to_string() + ":" + std::to_string(peer.port());
        logging::info("Connection established: " + peer_name);

        DispatchReport report;
        try {
            report = run_request(std::move(socket), parity_root_);
        } catch (const std::exception& e) {
            report.error = ErrorKind::IO;
            report.message = e.what();
        }
        ++connections_served_;

        if (report.ok()) {
            logging::info("Connection terminated (OK): " + peer_name + ", " +
                          std::to_string(report.files_sent) + " file(s) sent");
        } else {
            logging::error("Connection terminated (ERROR): " + peer_name + ": " +
                           to_string(report.error) + ": " + report.message);
        }
    }

    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        logging::debug("Acceptor close failed: " + ec.message());
    }
    logging::info("Server terminated");
}

void Server::stop() {
    stop_requested_ = true;

    // Wake the blocking accept with a throwaway connection.
    boost::asio::io_context io_context;
    tcp::socket waker(io_context);
    boost::system::error_code ec;
    waker.connect(wake_endpoint_, ec);
    if (ec) {
        logging::debug("Could not wake the acceptor: " + ec.message());
    }
}

} // namespace networking
