#include "networking.hpp"
#include "protocol/codec.hpp"
#include "protocol/errors.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <map>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace networking::test {

using protocol::Request;
using protocol::RequestResult;
using testing_support::SocketPair;
using testing_support::TempDir;
using testing_support::read_file;
using testing_support::read_to_end;
using testing_support::write_bytes;
using testing_support::write_file;
using transfer::MessageReceiver;
using transfer::MessageSender;

// Drives run_request on the server half of a loopback pair while the test
// plays the client by hand.
class DispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = dir_.path() / "root";
        fs::create_directories(root_);
        out_ = dir_.path() / "out";
        fs::create_directories(out_);
    }

    void TearDown() override {
        // Unblocks a server still waiting on us after a failed assertion.
        boost::system::error_code ec;
        sockets_.client.close(ec);
        if (server_.valid()) {
            server_.wait();
        }
    }

    void start() {
        server_ = std::async(std::launch::async, [this] {
            return run_request(std::move(sockets_.server), root_);
        });
    }

    DispatchReport finish() { return server_.get(); }

    boost::asio::ip::tcp::socket& client() { return sockets_.client; }

    TempDir dir_;
    fs::path root_;
    fs::path out_;
    SocketPair sockets_;
    std::future<DispatchReport> server_;
};

TEST_F(DispatcherTest, GetFileCount) {
    write_file(root_ / "a", "1");
    write_file(root_ / "b", "2");
    fs::create_directories(root_ / "dir");
    start();

    MessageSender::send_request(client(), Request::get_file_count());
    EXPECT_EQ(MessageReceiver::receive_request_result(client()), RequestResult::OK);
    EXPECT_EQ(MessageReceiver::receive_u32(client()), 2u);

    auto report = finish();
    EXPECT_TRUE(report.ok()) << report.message;
    ASSERT_TRUE(report.request.has_value());
    EXPECT_EQ(*report.request, Request::get_file_count());
    EXPECT_EQ(report.files_sent, 0u);
}

TEST_F(DispatcherTest, GetFileCountOfEmptyRoot) {
    start();
    MessageSender::send_request(client(), Request::get_file_count());
    EXPECT_EQ(MessageReceiver::receive_request_result(client()), RequestResult::OK);
    EXPECT_EQ(MessageReceiver::receive_u32(client()), 0u);
    EXPECT_TRUE(finish().ok());
}

TEST_F(DispatcherTest, DownloadByIndex) {
    write_file(root_ / "only.txt", "payload");
    start();

    MessageSender::send_request(client(), Request::download_file_by_index(0));
    EXPECT_EQ(MessageReceiver::receive_request_result(client()), RequestResult::OK);
    EXPECT_EQ(MessageReceiver::receive_text(client()), "only.txt");
    EXPECT_EQ(MessageReceiver::receive_file(client(), out_ / "only.txt"), 7u);
    EXPECT_EQ(read_file(out_ / "only.txt"), "payload");

    auto report = finish();
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.files_sent, 1u);
}

TEST_F(DispatcherTest, DownloadByIndexOutOfBoundsSendsNothingElse) {
    write_file(root_ / "a", "1");
    write_file(root_ / "b", "2");
    start();

    MessageSender::send_request(client(), Request::download_file_by_index(2));
    EXPECT_EQ(MessageReceiver::receive_request_result(client()), RequestResult::INDEX_OUT_OF_BOUNDS);
    EXPECT_TRUE(read_to_end(client()).empty());

    auto report = finish();
    EXPECT_EQ(report.error, ErrorKind::REJECTED);
    EXPECT_EQ(report.files_sent, 0u);
}

TEST_F(DispatcherTest, DownloadByNameIsByteExact) {
    std::string contents;
    for (int i = 0; i < 200000; ++i) {
        contents.push_back(static_cast<char>(i % 256));
    }
    write_file(root_ / "data.bin", contents);
    start();

    MessageSender::send_request(client(), Request::download_file_by_name("data.bin"));
    EXPECT_EQ(MessageReceiver::receive_request_result(client()), RequestResult::OK);
    // No name frame: the client already knows it.
    MessageReceiver::receive_file(client(), out_ / "data.bin");
    EXPECT_EQ(read_file(out_ / "data.bin"), contents);
    EXPECT_TRUE(read_to_end(client()).empty());

    EXPECT_TRUE(finish().ok());
}

TEST_F(DispatcherTest, DownloadByNameOutsideRootIsUnauthorized) {
    write_file(dir_.path() / "secret", "keep out");
    start();

    MessageSender::send_request(client(), Request::download_file_by_name("../secret"));
    EXPECT_EQ(MessageReceiver::receive_request_result(client()), RequestResult::UNAUTHORIZED_ACCESS);
    EXPECT_TRUE(read_to_end(client()).empty());

    auto report = finish();
    EXPECT_EQ(report.error, ErrorKind::REJECTED);
    EXPECT_EQ(report.files_sent, 0u);
}

TEST_F(DispatcherTest, DownloadByNameOfMissingFileClosesWithoutReply) {
    start();

    MessageSender::send_request(client(), Request::download_file_by_name("nothing.txt"));
    EXPECT_TRUE(read_to_end(client()).empty());

    auto report = finish();
    EXPECT_EQ(report.error, ErrorKind::IO);
}

TEST_F(DispatcherTest, DownloadAllFiles) {
    std::map<std::string, std::string> files{{"a", "xyz"}, {"b", "12345"}};
    for (const auto& [name, contents] : files) {
        write_file(root_ / name, contents);
    }
    start();

    MessageSender::send_request(client(), Request::download_all_files());
    EXPECT_EQ(MessageReceiver::receive_request_result(client()), RequestResult::OK);
    uint32_t count = MessageReceiver::receive_u32(client());
    ASSERT_EQ(count, 2u);

    uint64_t total = 0;
    std::map<std::string, std::string> received;
    for (uint32_t i = 0; i < count; ++i) {
        std::string name = MessageReceiver::receive_text(client());
        total += MessageReceiver::receive_file(client(), out_ / name);
        received[name] = read_file(out_ / name);
        MessageSender::send_request_result(client(), RequestResult::OK);
    }
    EXPECT_EQ(total, 8u);
    EXPECT_EQ(received, files);

    auto report = finish();
    EXPECT_TRUE(report.ok()) << report.message;
    EXPECT_EQ(report.files_sent, 2u);
}

TEST_F(DispatcherTest, DownloadAllFilesWaitsForAcknowledgement) {
    write_file(root_ / "first", "1111");
    write_file(root_ / "second", "2222");
    start();

    MessageSender::send_request(client(), Request::download_all_files());
    EXPECT_EQ(MessageReceiver::receive_request_result(client()), RequestResult::OK);
    ASSERT_EQ(MessageReceiver::receive_u32(client()), 2u);

    std::string name = MessageReceiver::receive_text(client());
    MessageReceiver::receive_file(client(), out_ / name);

    // Without an ack the server must stay silent and keep waiting.
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_EQ(client().available(), 0u);
    EXPECT_EQ(server_.wait_for(std::chrono::milliseconds(0)), std::future_status::timeout);

    MessageSender::send_request_result(client(), RequestResult::OK);
    std::string second = MessageReceiver::receive_text(client());
    EXPECT_NE(second, name);
    MessageReceiver::receive_file(client(), out_ / second);
    MessageSender::send_request_result(client(), RequestResult::OK);

    EXPECT_TRUE(finish().ok());
}

TEST_F(DispatcherTest, ClientVanishingBeforeAckIsProtocolError) {
    write_file(root_ / "a", "1");
    write_file(root_ / "b", "2");
    start();

    MessageSender::send_request(client(), Request::download_all_files());
    MessageReceiver::receive_request_result(client());
    MessageReceiver::receive_u32(client());
    std::string name = MessageReceiver::receive_text(client());
    MessageReceiver::receive_file(client(), out_ / name);
    client().shutdown(boost::asio::ip::tcp::socket::shutdown_send);

    auto report = finish();
    EXPECT_EQ(report.error, ErrorKind::PROTOCOL);
    EXPECT_EQ(report.files_sent, 1u);
}

TEST_F(DispatcherTest, Disconnect) {
    start();
    MessageSender::send_request(client(), Request::disconnect());
    EXPECT_TRUE(read_to_end(client()).empty());

    auto report = finish();
    EXPECT_TRUE(report.ok()) << report.message;
    EXPECT_EQ(*report.request, Request::disconnect());
}

TEST_F(DispatcherTest, GarbageRequestIsProtocolError) {
    start();
    write_bytes(client(), {4, 0, 0, 0, 9, 9, 9, 9});
    EXPECT_TRUE(read_to_end(client()).empty());

    auto report = finish();
    EXPECT_EQ(report.error, ErrorKind::PROTOCOL);
    EXPECT_FALSE(report.request.has_value());
}

TEST_F(DispatcherTest, MissingRootIsIoError) {
    fs::remove_all(root_);
    start();
    MessageSender::send_request(client(), Request::get_file_count());
    EXPECT_TRUE(read_to_end(client()).empty());
    EXPECT_EQ(finish().error, ErrorKind::IO);
}

} // namespace networking::test
