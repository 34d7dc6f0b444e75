#include "protocol/request.hpp"
#include <utility>

namespace protocol {

Request Request::disconnect() {
    return Request{RequestTag::DISCONNECT, 0, {}};
}

Request Request::get_file_count() {
    return Request{RequestTag::GET_FILE_COUNT, 0, {}};
}

Request Request::download_file_by_index(uint64_t index) {
    return Request{RequestTag::DOWNLOAD_FILE_BY_INDEX, index, {}};
}

Request Request::download_file_by_name(std::string name) {
    return Request{RequestTag::DOWNLOAD_FILE_BY_NAME, 0, std::move(name)};
}

Request Request::download_all_files() {
    return Request{RequestTag::DOWNLOAD_ALL_FILES, 0, {}};
}

bool operator==(const Request& lhs, const Request& rhs) {
    if (lhs.tag != rhs.tag) return false;
    switch (lhs.tag) {
        case RequestTag::DOWNLOAD_FILE_BY_INDEX: return lhs.index == rhs.index;
        case RequestTag::DOWNLOAD_FILE_BY_NAME:  return lhs.name == rhs.name;
        default: return true;
    }
}

bool operator!=(const Request& lhs, const Request& rhs) {
    return !(lhs == rhs);
}

const char* to_string(RequestTag tag) {
    switch (tag) {
        case RequestTag::DISCONNECT:             return "Disconnect";
        case RequestTag::GET_FILE_COUNT:         return "GetFileCount";
        case RequestTag::DOWNLOAD_FILE_BY_INDEX: return "DownloadFileByIndex";
        case RequestTag::DOWNLOAD_FILE_BY_NAME:  return "DownloadFileByName";
        case RequestTag::DOWNLOAD_ALL_FILES:     return "DownloadAllFiles";
    }
    return "Unknown";
}

const char* to_string(RequestResult result) {
    switch (result) {
        case RequestResult::OK:                  return "Ok";
        case RequestResult::UNAUTHORIZED_ACCESS: return "UnauthorizedAccess";
        case RequestResult::INDEX_OUT_OF_BOUNDS: return "IndexOutOfBounds";
    }
    return "Unknown";
}

std::string describe(const Request& request) {
    std::string out = to_string(request.tag);
    if (request.tag == RequestTag::DOWNLOAD_FILE_BY_INDEX) {
        out += "(" + std::to_string(request.index) + ")";
    } else if (request.tag == RequestTag::DOWNLOAD_FILE_BY_NAME) {
        out += "(\"" + request.name + "\")";
    }
    return out;
}

} // namespace protocol
