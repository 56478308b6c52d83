#include "ferry/http-client-error.hpp"

#include <spdlog/fmt/fmt.h>

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace ferry {

namespace {

std::string FormatWhat(ErrorKind kind, ErrorPhase phase, std::string_view message) {
  if (phase == ErrorPhase::None) {
    return fmt::format("{} error: {}", ErrorKindToStr(kind), message);
  }
  return fmt::format("{} error during {}: {}", ErrorKindToStr(kind), ErrorPhaseToStr(phase), message);
}

}  // namespace

std::string_view ErrorKindToStr(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::Build:
      return "Build";
    case ErrorKind::Connect:
      return "Connect";
    case ErrorKind::Timeout:
      return "Timeout";
    case ErrorKind::Request:
      return "Request";
    case ErrorKind::Protocol:
      return "Protocol";
    case ErrorKind::BodyTransfer:
      return "BodyTransfer";
    case ErrorKind::BodyDecode:
      return "BodyDecode";
    case ErrorKind::UserAborted:
      return "UserAborted";
    case ErrorKind::Redirect:
      return "Redirect";
    default:
      return "Other";
  }
}

std::string_view ErrorPhaseToStr(ErrorPhase phase) noexcept {
  switch (phase) {
    case ErrorPhase::Connect:
      return "connect";
    case ErrorPhase::Send:
      return "send";
    case ErrorPhase::Receive:
      return "receive";
    default:
      return "none";
  }
}

HttpClientError::HttpClientError(ErrorKind kind, ErrorPhase phase, std::string_view message,
                                 std::exception_ptr cause)
    : std::runtime_error(FormatWhat(kind, phase, message)),
      _message(message),
      _cause(std::move(cause)),
      _kind(kind),
      _phase(phase) {}

std::error_code HttpClientError::ioErrorCode() const {
  if (!_cause) {
    return {};
  }
  try {
    std::rethrow_exception(_cause);
  } catch (const std::system_error &ex) {
    return ex.code();
  } catch (const std::exception &) {
    return {};
  }
}

bool HttpClientError::isRetryable() const noexcept {
  switch (_kind) {
    case ErrorKind::Connect:
    case ErrorKind::Timeout:
    case ErrorKind::Request:
    case ErrorKind::Protocol:
    case ErrorKind::BodyTransfer:
      return true;
    default:
      return false;
  }
}

HttpClientError HttpClientError::withPhase(ErrorPhase phase) const {
  if (_phase != ErrorPhase::None) {
    return *this;
  }
  return {_kind, phase, _message, _cause};
}

}  // namespace ferry
