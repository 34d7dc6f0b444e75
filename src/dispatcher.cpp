#include "networking.hpp"
#include "parity.hpp"
#include "protocol/errors.hpp"
#include "logger.hpp"

using boost::asio::ip::tcp;
namespace fs = std::filesystem;

namespace networking {

namespace {

using protocol::RequestResult;
using protocol::RequestTag;
using transfer::MessageReceiver;
using transfer::MessageSender;

void reject(tcp::socket& socket, RequestResult result, DispatchReport& report) {
    MessageSender::send_request_result(socket, result);
    report.error = ErrorKind::REJECTED;
    report.message = protocol::ProtocolRejection(result).what();
}

void dispatch(tcp::socket& socket, const protocol::Request& request,
              const fs::path& parity_root, DispatchReport& report) {
    switch (request.tag) {
        case RequestTag::DISCONNECT: {
            boost::system::error_code ec;
            socket.shutdown(tcp::socket::shutdown_both, ec);
            if (ec && ec != boost::asio::error::not_connected) {
                throw protocol::IoError("Shutdown failed: " + ec.message());
            }
            return;
        }

        case RequestTag::GET_FILE_COUNT: {
            std::vector<parity::Entry> entries = parity::scan(parity_root);
            MessageSender::send_request_result(socket, RequestResult::OK);
            MessageSender::send_u32(socket, static_cast<uint32_t>(entries.size()));
            return;
        }

        case RequestTag::DOWNLOAD_FILE_BY_INDEX: {
            std::optional<parity::Entry> entry = parity::resolve_by_index(parity_root, request.index);
            if (!entry) {
                reject(socket, RequestResult::INDEX_OUT_OF_BOUNDS, report);
                return;
            }
            MessageSender::send_request_result(socket, RequestResult::OK);
            MessageSender::send_text(socket, entry->name);
            MessageSender::send_file(socket, *entry);
            report.files_sent = 1;
            return;
        }

        case RequestTag::DOWNLOAD_FILE_BY_NAME: {
            std::optional<parity::Entry> entry = parity::resolve_by_name(parity_root, request.name);
            if (!entry) {
                reject(socket, RequestResult::UNAUTHORIZED_ACCESS, report);
                return;
            }
            // The client already knows the name.
            MessageSender::send_request_result(socket, RequestResult::OK);
            MessageSender::send_file(socket, *entry);
            report.files_sent = 1;
            return;
        }

        case RequestTag::DOWNLOAD_ALL_FILES: {
            std::vector<parity::Entry> entries = parity::scan(parity_root);
            MessageSender::send_request_result(socket, RequestResult::OK);
            MessageSender::send_u32(socket, static_cast<uint32_t>(entries.size()));

            for (const parity::Entry& entry : entries) {
                MessageSender::send_text(socket, entry.name);
                MessageSender::send_file(socket, entry);
                ++report.files_sent;

                // Pacing: nothing more is sent until the client has stored this file.
                RequestResult ack = MessageReceiver::receive_request_result(socket);
                if (ack != RequestResult::OK) {
                    logging::warn(std::string("Client acknowledged ") + entry.name + " with " + protocol::to_string(ack));
                }
            }
            return;
        }
    }
    throw protocol::ProtocolError("Unhandled request tag");
}

} // namespace

DispatchReport run_request(tcp::socket connection, const fs::path& parity_root) {
    DispatchReport report;
    try {
        protocol::Request request = MessageReceiver::receive_request(connection);
        report.request = request;
        logging::info("Request: " + protocol::describe(request));
        dispatch(connection, request, parity_root, report);
    } catch (const protocol::ProtocolError& e) {
        report.error = ErrorKind::PROTOCOL;
        report.message = e.what();
    } catch (const protocol::IoError& e) {
        report.error = ErrorKind::IO;
        report.message = e.what();
    }

    boost::system::error_code ec;
    connection.close(ec);
    if (ec) {
        logging::debug("Close failed: " + ec.message());
    }
    return report;
}

} // namespace networking
