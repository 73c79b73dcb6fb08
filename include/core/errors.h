/**
 * @file errors.h
 * @brief Error taxonomy shared by signing, transport, venue adapters and the coordinator.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace tradegate {

enum class ErrorKind {
    Input,              ///< malformed intent fields or credentials; raised before any network call
    Signing,            ///< key material or payload could not be signed
    Resolution,         ///< symbol / market not found at the venue
    VenueRejection,     ///< transport succeeded, venue logic refused the request
    Transport,          ///< network failure, timeout, 5xx/429
    SettlementUnknown,  ///< broadcast accepted but confirmation did not arrive in time
    Internal            ///< unexpected failure inside the engine
};

std::string_view to_string(ErrorKind kind) noexcept;

/**
 * @class ExecutionError
 * @brief Base for every failure an adapter or signer reports to the coordinator.
 */
class ExecutionError : public std::runtime_error {
public:
    ExecutionError(ErrorKind kind,
                   const std::string& message,
                   std::string venue_code = {},
                   std::string raw_response = {})
        : std::runtime_error(message),
          kind_(kind),
          venue_code_(std::move(venue_code)),
          raw_response_(std::move(raw_response)) {}

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& venue_code() const noexcept { return venue_code_; }
    const std::string& raw_response() const noexcept { return raw_response_; }

    // Only transport faults and unknown settlement may succeed on a fresh attempt.
    bool retryable() const noexcept {
        return kind_ == ErrorKind::Transport || kind_ == ErrorKind::SettlementUnknown;
    }

private:
    ErrorKind kind_;
    std::string venue_code_;
    std::string raw_response_;
};

class InputError : public ExecutionError {
public:
    explicit InputError(const std::string& message)
        : ExecutionError(ErrorKind::Input, message) {}
};

class SigningError : public ExecutionError {
public:
    explicit SigningError(const std::string& message)
        : ExecutionError(ErrorKind::Signing, message) {}
};

class ResolutionError : public ExecutionError {
public:
    explicit ResolutionError(const std::string& message, std::string raw_response = {})
        : ExecutionError(ErrorKind::Resolution, message, {}, std::move(raw_response)) {}
};

class VenueRejection : public ExecutionError {
public:
    VenueRejection(const std::string& message, std::string venue_code = {}, std::string raw_response = {})
        : ExecutionError(ErrorKind::VenueRejection, message, std::move(venue_code), std::move(raw_response)) {}
};

class TransportError : public ExecutionError {
public:
    explicit TransportError(const std::string& message)
        : ExecutionError(ErrorKind::Transport, message) {}
};

class SettlementTimeout : public ExecutionError {
public:
    explicit SettlementTimeout(const std::string& message)
        : ExecutionError(ErrorKind::SettlementUnknown, message) {}
};

/**
 * @class HttpStatusError
 * @brief HTTP status >= 400. 429 and 5xx count as transport faults, the rest as venue rejections.
 */
class HttpStatusError : public ExecutionError {
public:
    HttpStatusError(long status, const std::string& body)
        : ExecutionError(classify(status),
                         "HTTP status " + std::to_string(status) + ": " + body,
                         std::to_string(status),
                         body),
          status_(status) {}

    long status() const noexcept { return status_; }
    const std::string& body() const noexcept { return raw_response(); }

private:
    static ErrorKind classify(long status) noexcept {
        return (status == 429 || status >= 500) ? ErrorKind::Transport : ErrorKind::VenueRejection;
    }

    long status_;
};

} // namespace tradegate
