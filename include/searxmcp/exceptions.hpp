#pragma once
#include <stdexcept>
#include <string>

namespace searxmcp
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct NotFoundError : public Error
{
    using Error::Error;
};

struct ValidationError : public Error
{
    using Error::Error;
};

struct TransportError : public Error
{
    using Error::Error;
};

/// Raised when an outbound HTTP call exceeds the configured request timeout.
struct TimeoutError : public TransportError
{
    using TransportError::TransportError;
};

/// Raised when an upstream answered with a status other than 200.
struct HttpStatusError : public TransportError
{
    HttpStatusError(int status, std::string body)
        : TransportError("unexpected HTTP status " + std::to_string(status)), status_(status),
          body_(std::move(body))
    {
    }

    int status() const
    {
        return status_;
    }
    const std::string& body() const
    {
        return body_;
    }

  private:
    int status_;
    std::string body_;
};

} // namespace searxmcp
