#include "ferry/body-encoder.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string_view>

#include "ferry/char-hexadecimal-converter.hpp"
#include "ferry/http-client-error.hpp"
#include "ferry/http-constants.hpp"
#include "ferry/request-body.hpp"

namespace ferry {

namespace {

constexpr std::string_view kLastChunk = "0\r\n\r\n";

}  // namespace

std::size_t FixedBodyEncoder::encode(RequestBody &body, std::span<char> out) {
  if (_done) {
    return 0;
  }
  if (_declaredLength) {
    out = out.first(static_cast<std::size_t>(std::min<uint64_t>(out.size(), *_declaredLength - _written)));
    if (out.empty()) {
      // declared length reached: the body should not produce anything more
      char probe;
      if (body.read(std::span<char>(&probe, 1)) != 0) {
        throw HttpClientError(ErrorKind::BodyTransfer, ErrorPhase::Send,
                              "request body is longer than its declared Content-Length");
      }
      _done = true;
      return 0;
    }
  }
  const std::size_t nbBytes = body.read(out);
  if (nbBytes == 0) {
    if (_declaredLength && _written != *_declaredLength) {
      throw HttpClientError(ErrorKind::BodyTransfer, ErrorPhase::Send,
                            "request body is shorter than its declared Content-Length");
    }
    _done = true;
  }
  _written += nbBytes;
  return nbBytes;
}

std::size_t ChunkedBodyEncoder::encode(RequestBody &body, std::span<char> out) {
  if (_done) {
    return 0;
  }
  // Reserve room for the largest possible size line, the data is moved right after the actual one.
  const std::size_t sizeLineSpace = nhexdigits(out.size()) + http::CRLF.size();
  const std::size_t dataCapacity = out.size() - sizeLineSpace - http::CRLF.size();
  const std::size_t nbBytes = body.read(out.subspan(sizeLineSpace, dataCapacity));
  if (nbBytes == 0) {
    std::memcpy(out.data(), kLastChunk.data(), kLastChunk.size());
    _done = true;
    return kLastChunk.size();
  }

  char *pos = to_lower_hex(nbBytes, out.data());
  std::memcpy(pos, http::CRLF.data(), http::CRLF.size());
  pos += http::CRLF.size();
  std::memmove(pos, out.data() + sizeLineSpace, nbBytes);
  pos += nbBytes;
  std::memcpy(pos, http::CRLF.data(), http::CRLF.size());
  pos += http::CRLF.size();
  return static_cast<std::size_t>(pos - out.data());
}

}  // namespace ferry
