#pragma once

#include <cstdint>
#include <string>

namespace protocol {

// Wire tags are pinned explicitly. Never renumber; append new variants only.
enum class RequestTag : uint32_t {
    DISCONNECT = 0,
    GET_FILE_COUNT = 1,
    DOWNLOAD_FILE_BY_INDEX = 2,
    DOWNLOAD_FILE_BY_NAME = 3,
    DOWNLOAD_ALL_FILES = 4
    // 5 reserved for an upload request
};

enum class RequestResult : uint32_t {
    OK = 0,
    UNAUTHORIZED_ACCESS = 1,
    INDEX_OUT_OF_BOUNDS = 2
};

// One request per connection. Only the payload field matching `tag` is meaningful.
struct Request {
    RequestTag tag = RequestTag::DISCONNECT;
    uint64_t index = 0;   // DOWNLOAD_FILE_BY_INDEX
    std::string name;     // DOWNLOAD_FILE_BY_NAME

    static Request disconnect();
    static Request get_file_count();
    static Request download_file_by_index(uint64_t index);
    static Request download_file_by_name(std::string name);
    static Request download_all_files();
};

bool operator==(const Request& lhs, const Request& rhs);
bool operator!=(const Request& lhs, const Request& rhs);

const char* to_string(RequestTag tag);
const char* to_string(RequestResult result);

// Human readable form for logs, e.g. "DownloadFileByName(\"a.txt\")".
std::string describe(const Request& request);

} // namespace protocol
