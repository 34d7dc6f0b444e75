#pragma once

#include <stdexcept>
#include <string>
#include "protocol/request.hpp"

namespace protocol {

// Malformed frame, unknown tag, invalid UTF-8 or a stream closed mid-message.
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& what) : std::runtime_error(what) {}
};

// Filesystem or socket failure.
class IoError : public std::runtime_error {
public:
    explicit IoError(const std::string& what) : std::runtime_error(what) {}
};

// The server answered with something other than RequestResult::OK.
class ProtocolRejection : public std::runtime_error {
public:
    explicit ProtocolRejection(RequestResult result)
        : std::runtime_error(message_for(result)), result_(result) {}

    RequestResult result() const { return result_; }

private:
    static std::string message_for(RequestResult result) {
        switch (result) {
            case RequestResult::UNAUTHORIZED_ACCESS: return "Unauthorized access";
            case RequestResult::INDEX_OUT_OF_BOUNDS: return "Index out of bounds";
            default: return std::string("Unexpected result: ") + to_string(result);
        }
    }

    RequestResult result_;
};

} // namespace protocol
