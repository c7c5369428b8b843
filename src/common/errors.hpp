#pragma once

#include <stdexcept>
#include <string>

namespace worklog {

// Base of every error the core raises. kind() is the stable name the CLI prints.
class WorklogError : public std::runtime_error {
public:
    explicit WorklogError(const std::string &message)
        : std::runtime_error(message)
    {
    }

    virtual const char *kind() const noexcept
    {
        return "WorklogError";
    }
};

class FrameAlreadyStarted : public WorklogError {
public:
    using WorklogError::WorklogError;
    const char *kind() const noexcept override { return "FrameAlreadyStarted"; }
};

class NoFrameStarted : public WorklogError {
public:
    using WorklogError::WorklogError;
    const char *kind() const noexcept override { return "NoFrameStarted"; }
};

class InvalidTime : public WorklogError {
public:
    using WorklogError::WorklogError;
    const char *kind() const noexcept override { return "InvalidTime"; }
};

class InvalidOperation : public WorklogError {
public:
    using WorklogError::WorklogError;
    const char *kind() const noexcept override { return "InvalidOperation"; }
};

class NotFound : public WorklogError {
public:
    using WorklogError::WorklogError;
    const char *kind() const noexcept override { return "NotFound"; }
};

// httpStatus is 0 for transport failures and timeouts.
class RemoteUnavailable : public WorklogError {
public:
    explicit RemoteUnavailable(const std::string &message, int httpStatus = 0)
        : WorklogError(message)
        , m_httpStatus(httpStatus)
    {
    }

    const char *kind() const noexcept override { return "RemoteUnavailable"; }

    int httpStatus() const noexcept
    {
        return m_httpStatus;
    }

private:
    int m_httpStatus = 0;
};

} // namespace worklog
