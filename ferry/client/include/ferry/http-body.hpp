#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "ferry/body-length.hpp"
#include "ferry/chunked-decoder.hpp"
#include "ferry/conn.hpp"
#include "ferry/deadline.hpp"
#include "ferry/decoder.hpp"
#include "ferry/decompression-config.hpp"
#include "ferry/headers.hpp"
#include "ferry/interceptor.hpp"
#include "ferry/raw-chars.hpp"

namespace ferry {

// Lazily read body of a response, bound to the connection it arrives on.
// Bytes already received with the response head are served first, the next ones are read on demand
// according to the body framing. Once the body is fully read the connection is released
// (back to its pool unless it was shut down).
// Dropping a body that was not fully read closes its connection.
class HttpBody {
 public:
  // An empty body, already finished.
  HttpBody() noexcept = default;

  HttpBody(Conn conn, BodyLength length, RawChars leftover, Deadline deadline,
           std::shared_ptr<Interceptor> interceptor, std::size_t bufferSize);

  HttpBody(const HttpBody &) = delete;
  HttpBody(HttpBody &&) noexcept = default;
  HttpBody &operator=(const HttpBody &) = delete;
  HttpBody &operator=(HttpBody &&) noexcept = default;

  ~HttpBody();

  // Transparently decodes the content coding of the body with 'decoder'.
  void setDecoder(std::unique_ptr<DecoderContext> decoder, const DecompressionConfig &config);

  // Reads up to 'len' bytes of the body into 'buf'. Returns 0 at the end of the body.
  // Throws HttpClientError:
  //  - BodyTransfer if the connection fails or is closed before the end of the body
  //  - Protocol if the chunked coding is malformed
  //  - BodyDecode if the content coding cannot be decoded
  //  - Timeout if the request deadline elapses.
  // After an error the connection is closed and the body cannot be read anymore.
  std::size_t read(char *buf, std::size_t len);

  // Reads the whole remaining body.
  std::string readAll();

  // Tells whether the whole body has been read.
  [[nodiscard]] bool finished() const noexcept { return _finished && _outPos == _out.size(); }

  [[nodiscard]] BodyLength length() const noexcept { return _length; }

  // Trailer fields of a chunked body, available once finished.
  [[nodiscard]] const http::Headers &trailers() const noexcept { return _chunked.trailers(); }

 private:
  void pump();

  // Appends the next framed body bytes to 'dst'. Returns true once the end of the body framing has been reached.
  bool pullFramed(RawChars &dst);

  std::size_t readMore();

  void discardStrayBytes();

  void complete();

  void fail(std::string_view reason) noexcept;

  Conn _conn;
  Deadline _deadline;
  std::shared_ptr<Interceptor> _interceptor;
  std::unique_ptr<DecoderContext> _decoder;
  RawChars _raw;
  RawChars _framed;
  RawChars _out;
  ChunkedDecoder _chunked;
  std::size_t _outPos{0};
  std::size_t _bufferSize{0};
  std::size_t _maxDecodedBytes{0};
  std::size_t _decoderChunkSize{0};
  uint64_t _decodedBytes{0};
  uint64_t _remaining{0};
  BodyLength _length{BodyLength::Zero()};
  bool _finished{true};
  bool _failed{false};
};

}  // namespace ferry
