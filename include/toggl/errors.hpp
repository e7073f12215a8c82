#ifndef TOGGL_ERRORS_HPP
#define TOGGL_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace toggl {

/**
 * Base exception for all Toggl SDK errors.
 */
class TogglError : public std::runtime_error {
public:
    TogglError(const std::string& message, int status_code, const std::string& code = "")
        : std::runtime_error(message)
        , status_code_(status_code)
        , code_(code)
    {}

    /** HTTP status code (0 for network/local errors). */
    int status_code() const { return status_code_; }

    /** SDK error code (e.g., "UNKNOWN_RESOURCE", "API_ERROR"). */
    const std::string& code() const { return code_; }

private:
    int status_code_;
    std::string code_;
};

/**
 * Thrown when a resource name is registered twice.
 */
class DuplicateResourceError : public TogglError {
public:
    explicit DuplicateResourceError(const std::string& name)
        : TogglError(name + " is already used.", 0, "DUPLICATE_RESOURCE")
        , name_(name)
    {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

/**
 * Thrown when a resource name was never registered.
 */
class UnknownResourceError : public TogglError {
public:
    explicit UnknownResourceError(const std::string& name)
        : TogglError(name + " is not registered as a resource.", 0, "UNKNOWN_RESOURCE")
        , name_(name)
    {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

/**
 * Thrown when a request cannot be constructed (malformed URL, bad method).
 */
class InvalidRequestError : public TogglError {
public:
    explicit InvalidRequestError(const std::string& message = "Invalid request")
        : TogglError(message, 0, "INVALID_REQUEST")
    {}
};

/**
 * Thrown on network/connection errors.
 */
class NetworkError : public TogglError {
public:
    explicit NetworkError(const std::string& message = "Network error")
        : TogglError(message, 0, "NETWORK_ERROR")
    {}

protected:
    NetworkError(const std::string& message, int status_code, const std::string& code)
        : TogglError(message, status_code, code)
    {}
};

/**
 * Thrown on request timeout. A timeout is a transport failure.
 */
class TimeoutError : public NetworkError {
public:
    explicit TimeoutError(const std::string& message = "Request timed out")
        : NetworkError(message, 408, "TIMEOUT")
    {}
};

/**
 * Thrown when a 200 response body is not valid JSON.
 */
class DecodeError : public TogglError {
public:
    explicit DecodeError(const std::string& message, int status_code = 200)
        : TogglError(message, status_code, "PARSE_ERROR")
    {}
};

/**
 * The service's own failure report, or one synthesized from the raw HTTP
 * status when the body carried no error envelope.
 */
class ApiError : public TogglError {
public:
    ApiError(int api_code, const std::string& api_message)
        : TogglError(api_message, api_code, "API_ERROR")
        , api_code_(api_code)
        , api_message_(api_message)
    {}

    /** The "code" field of the error envelope, or the HTTP status. */
    int api_code() const { return api_code_; }

    /** The "message" field of the error envelope, or the HTTP status line. */
    const std::string& api_message() const { return api_message_; }

private:
    int api_code_;
    std::string api_message_;
};

} // namespace toggl

#endif // TOGGL_ERRORS_HPP
