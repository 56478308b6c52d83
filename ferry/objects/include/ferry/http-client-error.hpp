#pragma once

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace ferry {

enum class ErrorKind : uint8_t {
  Build,         // the request cannot be formatted (invalid header, unsupported scheme or method...)
  Connect,       // the connector failed to establish the transport
  Timeout,       // a connect or request timeout elapsed
  Request,       // I/O failure while writing the request head or reading the response head
  Protocol,      // malformed status line / headers / chunk grammar, or connection closed mid-head
  BodyTransfer,  // I/O failure while streaming a request or response body
  BodyDecode,    // the response content coding could not be decoded
  UserAborted,   // the request body producer aborted the transfer
  Redirect,      // redirect hop limit exceeded, redirect loop or malformed Location
  Other          // any other failure, for instance raised by an interceptor
};

// Step of the exchange during which an error occurred.
enum class ErrorPhase : uint8_t { None, Connect, Send, Receive };

std::string_view ErrorKindToStr(ErrorKind kind) noexcept;

std::string_view ErrorPhaseToStr(ErrorPhase phase) noexcept;

// Single exception type raised by the client for all failures of a request.
// It carries its kind, the phase of the exchange where it happened and an optional lower-level cause
// (typically a std::system_error).
class HttpClientError : public std::runtime_error {
 public:
  HttpClientError(ErrorKind kind, ErrorPhase phase, std::string_view message, std::exception_ptr cause = nullptr);

  HttpClientError(ErrorKind kind, std::string_view message, std::exception_ptr cause = nullptr)
      : HttpClientError(kind, ErrorPhase::None, message, std::move(cause)) {}

  [[nodiscard]] ErrorKind kind() const noexcept { return _kind; }

  [[nodiscard]] ErrorPhase phase() const noexcept { return _phase; }

  // The message without the kind / phase prefix.
  [[nodiscard]] std::string_view message() const noexcept { return _message; }

  [[nodiscard]] const std::exception_ptr &cause() const noexcept { return _cause; }

  // Error code of the cause if it is a std::system_error, empty error code otherwise.
  [[nodiscard]] std::error_code ioErrorCode() const;

  // Exchange-level failures that a fresh attempt may overcome.
  [[nodiscard]] bool isRetryable() const noexcept;

  // Returns a copy of this error tagged with 'phase', if it did not have any yet.
  [[nodiscard]] HttpClientError withPhase(ErrorPhase phase) const;

 private:
  std::string _message;
  std::exception_ptr _cause;
  ErrorKind _kind;
  ErrorPhase _phase;
};

}  // namespace ferry
