#include "ferry/chunked-decoder.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string_view>

#include "ferry/char-hexadecimal-converter.hpp"
#include "ferry/header-line-parse.hpp"
#include "ferry/http-client-error.hpp"
#include "ferry/http-header.hpp"
#include "ferry/raw-chars.hpp"
#include "ferry/string-trim.hpp"

namespace ferry {

namespace {

[[noreturn]] void ThrowChunkError(std::string_view msg) {
  throw HttpClientError(ErrorKind::Protocol, ErrorPhase::Receive, msg);
}

}  // namespace

std::size_t ChunkedDecoder::accumulateLine(std::string_view in, bool &complete) {
  const auto lfPos = in.find('\n');
  const std::size_t consumed = lfPos == std::string_view::npos ? in.size() : lfPos + 1;
  _line.append(in.data(), consumed);
  if (_line.size() > kMaxLineBytes) {
    ThrowChunkError("chunk line too long");
  }
  complete = lfPos != std::string_view::npos;
  if (complete) {
    // strict CRLF line ending
    if (_line.size() < 2 || _line[_line.size() - 2] != '\r') {
      ThrowChunkError("chunk line not terminated by CRLF");
    }
    _line.resize(_line.size() - 2);
  }
  return consumed;
}

void ChunkedDecoder::parseSizeLine() {
  // chunk-size [ chunk-ext ] CRLF, extensions are ignored
  std::string_view sizeStr(_line);
  sizeStr = TrimOws(sizeStr.substr(0, sizeStr.find(';')));
  if (sizeStr.empty()) {
    ThrowChunkError("missing chunk size");
  }
  if (sizeStr.size() > 16U) {
    ThrowChunkError("chunk size too large");
  }
  uint64_t chunkSize = 0;
  for (char ch : sizeStr) {
    const int digit = from_hex_digit(ch);
    if (digit < 0) {
      ThrowChunkError("invalid chunk size");
    }
    chunkSize = (chunkSize << 4U) | static_cast<uint64_t>(digit);
  }
  _line.clear();
  _remaining = chunkSize;
  _state = chunkSize == 0 ? State::TrailerLine : State::Data;
}

void ChunkedDecoder::parseTrailerLine() {
  if (_line.empty()) {
    _state = State::Done;
    return;
  }
  _trailerBytes += _line.size();
  if (_trailerBytes > kMaxTrailerBytes) {
    ThrowChunkError("trailer section too large");
  }
  const auto [name, value] = http::ParseHeaderLine(_line);
  if (!http::IsValidHeaderName(name)) {
    ThrowChunkError("invalid trailer field");
  }
  try {
    _trailers.append(name, value);
  } catch (const std::invalid_argument &) {
    ThrowChunkError("invalid trailer field value");
  }
  _line.clear();
}

std::size_t ChunkedDecoder::decode(std::string_view in, RawChars &out) {
  std::size_t pos = 0;
  while (pos < in.size() && _state != State::Done) {
    const std::string_view rest = in.substr(pos);
    switch (_state) {
      case State::SizeLine: {
        bool complete = false;
        pos += accumulateLine(rest, complete);
        if (complete) {
          parseSizeLine();
        }
        break;
      }
      case State::Data: {
        const auto nbBytes = static_cast<std::size_t>(std::min<uint64_t>(_remaining, rest.size()));
        out.append(rest.data(), nbBytes);
        pos += nbBytes;
        _remaining -= nbBytes;
        if (_remaining == 0) {
          _state = State::DataCR;
        }
        break;
      }
      case State::DataCR:
        if (rest.front() != '\r') {
          ThrowChunkError("chunk data not followed by CRLF");
        }
        ++pos;
        _state = State::DataLF;
        break;
      case State::DataLF:
        if (rest.front() != '\n') {
          ThrowChunkError("chunk data not followed by CRLF");
        }
        ++pos;
        _state = State::SizeLine;
        break;
      case State::TrailerLine: {
        bool complete = false;
        pos += accumulateLine(rest, complete);
        if (complete) {
          parseTrailerLine();
        }
        break;
      }
      default:
        break;
    }
  }
  return pos;
}

}  // namespace ferry
