#pragma once
#include <optional>
#include <stdexcept>
#include <string>

// Root of everything the control client reports.
class ObsError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Socket failure or closure. Pending requests fail with this; not retried here.
class TransportError : public ObsError {
public:
    using ObsError::ObsError;
};

// Handshake rejected, or a password is required and none was configured.
class AuthenticationError : public ObsError {
public:
    using ObsError::ObsError;
};

// No matching response (or no handshake completion) within the deadline.
class RequestTimeoutError : public ObsError {
public:
    using ObsError::ObsError;
};

// Malformed or unexpected frame.
class ProtocolError : public ObsError {
public:
    using ObsError::ObsError;
};

// obs answered, but requestStatus.result was false.
class RequestFailedError : public ObsError {
public:
    RequestFailedError(const std::string& requestType, int code, std::optional<std::string> comment = std::nullopt)
        : ObsError(requestType + " failed: " + std::to_string(code) + (comment ? " (" + *comment + ")" : std::string{}))
        , m_code(code)
        , m_comment(std::move(comment))
    {}

    [[nodiscard]] int code() const noexcept { return m_code; }
    [[nodiscard]] const std::optional<std::string>& comment() const noexcept { return m_comment; }

private:
    int                        m_code;
    std::optional<std::string> m_comment;
};
