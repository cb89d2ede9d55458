#pragma once

#include <stdexcept>
#include <string>

namespace chathub {

// Base for failures that are reported back to the requesting client only.
class ClientError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Unparseable envelope, missing fields or unknown `type`.
class ProtocolError : public ClientError {
public:
    using ClientError::ClientError;
};

// Length, charset or emptiness violations.
class ValidationError : public ClientError {
public:
    using ClientError::ClientError;
};

class RateLimitError : public ClientError {
public:
    RateLimitError(const std::string& message, long long wait_seconds)
        : ClientError(message), wait_seconds_(wait_seconds) {}

    long long wait_seconds() const { return wait_seconds_; }

private:
    long long wait_seconds_;
};

}
