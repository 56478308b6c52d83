#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "ferry/http-method.hpp"
#include "ferry/request.hpp"

namespace ferry {

// Form of the request-target in the request line (RFC 9112 §3.2).
enum class TargetForm : uint8_t {
  Origin,     // "/path?query", the usual form
  Absolute,   // "http://host:port/path?query", for plain HTTP requests sent to a proxy
  Authority   // "host:port", for CONNECT requests
};

// Chooses the request-target form for 'method', given whether the connection goes to a proxy without a tunnel.
TargetForm SelectTargetForm(http::Method method, bool plainProxy) noexcept;

// Resumable serializer of a request head (request line and header fields, in insertion order).
// The request must outlive the encoder and not be modified while encoding.
class RequestEncoder {
 public:
  RequestEncoder(const Request &request, TargetForm targetForm);

  // Writes as many bytes of the head as fit into 'out'.
  // Returns the number of bytes written, 0 once the whole head has been written.
  std::size_t encode(std::span<char> out);

  [[nodiscard]] bool done() const noexcept { return _step == Step::Done; }

 private:
  enum class Step : uint8_t { RequestLine, HeaderLine, HeaderCRLF, FinalCRLF, Done };

  [[nodiscard]] std::string_view currentPiece() const noexcept;

  void nextPiece() noexcept;

  const Request &_request;
  std::string _requestLine;
  std::size_t _headerPos{0};
  std::size_t _pieceOffset{0};
  Step _step{Step::RequestLine};
};

}  // namespace ferry
