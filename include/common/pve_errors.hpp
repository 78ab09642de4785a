#pragma once

#include <string>
#include <stdexcept>

// Base class for everything the client throws
class PveError : public std::runtime_error {
public:
    explicit PveError(const std::string& message) : std::runtime_error(message) {}
};

// The connection probe failed: unreachable host, bad token or non-2xx
class AuthError : public PveError {
public:
    AuthError(const std::string& host, const std::string& cause)
        : PveError("Authentication against " + host + " failed: " + cause)
        , host_(host), cause_(cause) {}

    const std::string& host() const { return host_; }
    const std::string& cause() const { return cause_; }

private:
    std::string host_;
    std::string cause_;
};

// Transport failure, non-2xx status or malformed response envelope.
// httpStatus is 0 when no HTTP response was received.
class RequestError : public PveError {
public:
    RequestError(const std::string& host, const std::string& endpoint,
                 const std::string& cause, long httpStatus = 0)
        : PveError("Request " + endpoint + " to " + host + " failed: " + cause)
        , host_(host), endpoint_(endpoint), cause_(cause), httpStatus_(httpStatus) {}

    const std::string& host() const { return host_; }
    const std::string& endpoint() const { return endpoint_; }
    const std::string& cause() const { return cause_; }
    long httpStatus() const { return httpStatus_; }

private:
    std::string host_;
    std::string endpoint_;
    std::string cause_;
    long httpStatus_;
};

// A named lookup (node, storage, content, VM) matched nothing
class NotFoundError : public PveError {
public:
    NotFoundError(const std::string& host, const std::string& resource, const std::string& value)
        : PveError(resource + " '" + value + "' not found on " + host)
        , host_(host), resource_(resource), value_(value) {}

    const std::string& host() const { return host_; }
    const std::string& resource() const { return resource_; }
    const std::string& value() const { return value_; }

private:
    std::string host_;
    std::string resource_;
    std::string value_;
};

// A parameter was rejected before any request was sent
class ValidationError : public PveError {
public:
    ValidationError(const std::string& parameter, const std::string& value, const std::string& reason)
        : PveError("Invalid " + parameter + " '" + value + "': " + reason)
        , parameter_(parameter), value_(value) {}

    const std::string& parameter() const { return parameter_; }
    const std::string& value() const { return value_; }

private:
    std::string parameter_;
    std::string value_;
};
