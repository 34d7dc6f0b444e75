#include "networking.hpp"
#include "protocol/errors.hpp"
#include "logger.hpp"
#include <system_error>

using boost::asio::ip::tcp;
namespace fs = std::filesystem;

namespace networking {

namespace {

using protocol::RequestResult;
using protocol::RequestTag;
using transfer::MessageReceiver;
using transfer::MessageSender;

// Only the final component of a name is used, so a reply cannot steer writes
// outside the download directory.
fs::path destination_for(const fs::path& download_dir, const std::string& name) {
    fs::path filename = fs::u8path(name).filename();
    if (filename.empty() || filename == "." || filename == "..") {
        throw protocol::ProtocolError("Unusable file name: \"" + name + "\"");
    }
    return download_dir / filename;
}

void expect_ok(tcp::socket& socket) {
    RequestResult result = MessageReceiver::receive_request_result(socket);
    if (result != RequestResult::OK) {
        throw protocol::ProtocolRejection(result);
    }
}

bool writes_files(RequestTag tag) {
    return tag == RequestTag::DOWNLOAD_FILE_BY_INDEX ||
           tag == RequestTag::DOWNLOAD_FILE_BY_NAME ||
           tag == RequestTag::DOWNLOAD_ALL_FILES;
}

void notify(const ClientCallbacks& callbacks, const std::string& message) {
    if (callbacks.on_status) callbacks.on_status(message);
}

void consume_reply(tcp::socket& socket, const protocol::Request& request,
                   const fs::path& download_dir, const ClientCallbacks& callbacks,
                   ClientReport& report) {
    switch (request.tag) {
        case RequestTag::DISCONNECT:
            return;

        case RequestTag::GET_FILE_COUNT:
            expect_ok(socket);
            report.file_count = MessageReceiver::receive_u32(socket);
            return;

        case RequestTag::DOWNLOAD_FILE_BY_INDEX: {
            expect_ok(socket);
            std::string name = MessageReceiver::receive_text(socket);
            fs::path output = destination_for(download_dir, name);
            notify(callbacks, "Destination file: " + output.string());
            MessageReceiver::receive_file(socket, output, callbacks.on_progress);
            report.files.push_back(output);
            return;
        }

        case RequestTag::DOWNLOAD_FILE_BY_NAME: {
            expect_ok(socket);
            fs::path output = destination_for(download_dir, request.name);
            notify(callbacks, "Destination file: " + output.string());
            MessageReceiver::receive_file(socket, output, callbacks.on_progress);
            report.files.push_back(output);
            return;
        }

        case RequestTag::DOWNLOAD_ALL_FILES: {
            expect_ok(socket);
            uint32_t count = MessageReceiver::receive_u32(socket);
            report.file_count = count;
            for (uint32_t i = 0; i < count; ++i) {
                std::string name = MessageReceiver::receive_text(socket);
                fs::path output = destination_for(download_dir, name);
                notify(callbacks, "(" + std::to_string(i + 1) + "/" + std::to_string(count) +
                                  ") Destination file: " + output.string());
                MessageReceiver::receive_file(socket, output, callbacks.on_progress);
                report.files.push_back(output);
                // Lets the server move on to the next file.
                MessageSender::send_request_result(socket, RequestResult::OK);
            }
            return;
        }
    }
    throw protocol::ProtocolError("Unhandled request tag");
}

} // namespace

ClientReport issue_request(tcp::socket connection, const protocol::Request& request,
                           const fs::path& download_dir, const ClientCallbacks& callbacks) {
    ClientReport report;
    report.request = request;
    try {
        if (writes_files(request.tag)) {
            std::error_code ec;
            fs::create_directories(download_dir, ec);
            if (ec) {
                throw protocol::IoError("Could not create " + download_dir.string() + ": " + ec.message());
            }
        }

        logging::debug("Sending request: " + protocol::describe(request));
        MessageSender::send_request(connection, request);
        consume_reply(connection, request, download_dir, callbacks, report);
    } catch (const protocol::ProtocolRejection& e) {
        report.error = ErrorKind::REJECTED;
        report.message = e.what();
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
