#pragma once

#include <stdexcept>
#include <string>

namespace errors
{
    // Base of every failure the transfer core reports.
    class TransferError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // Source file missing. Raised before any network activity.
    class NotFoundError : public TransferError
    {
    public:
        using TransferError::TransferError;
    };

    // Bad or missing bearer credential. Never retried.
    class AuthError : public TransferError
    {
    public:
        using TransferError::TransferError;
    };

    // Connection failure, timeout or non-2xx response other than 401.
    // status is 0 when no HTTP response was received.
    class TransportError : public TransferError
    {
    public:
        explicit TransportError(const std::string &msg, int status = 0)
            : TransferError(msg), status_(status) {}

        int status() const { return status_; }

    private:
        int status_;
    };

    // Retry budget spent; carries the error of the final attempt.
    class TransferExhausted : public TransferError
    {
    public:
        TransferExhausted(const TransportError &last, int attempts)
            : TransferError("All " + std::to_string(attempts) + " attempts failed: " + last.what()),
              last_(last), attempts_(attempts) {}

        const TransportError &lastError() const { return last_; }
        int attempts() const { return attempts_; }

    private:
        TransportError last_;
        int attempts_;
    };

    // Local durable store could not be read or written.
    class StorageError : public TransferError
    {
    public:
        using TransferError::TransferError;
    };
}
