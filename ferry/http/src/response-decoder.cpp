#include "ferry/response-decoder.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "ferry/header-line-parse.hpp"
#include "ferry/http-client-error.hpp"
#include "ferry/http-constants.hpp"
#include "ferry/http-header.hpp"
#include "ferry/http-version.hpp"
#include "ferry/log.hpp"
#include "ferry/raw-chars.hpp"
#include "ferry/response-head.hpp"

namespace ferry {

namespace {

[[noreturn]] void ThrowProtocolError(std::string_view msg) {
  throw HttpClientError(ErrorKind::Protocol, ErrorPhase::Receive, msg);
}

// status-line = HTTP-version SP status-code SP [ reason-phrase ]
void ParseStatusLine(std::string_view line, ResponseHead &head) {
  const auto versionEnd = line.find(' ');
  if (versionEnd == std::string_view::npos || !http::ParseHttpVersion(line.substr(0, versionEnd), head.version)) {
    ThrowProtocolError("invalid status line");
  }
  if (head.version.major != 1) {
    ThrowProtocolError("unsupported HTTP version in status line");
  }
  line.remove_prefix(versionEnd + 1);
  if (line.size() < 3 || !std::all_of(line.begin(), line.begin() + 3, [](char ch) { return ch >= '0' && ch <= '9'; })) {
    ThrowProtocolError("invalid status code");
  }
  const int statusCode = ((line[0] - '0') * 100) + ((line[1] - '0') * 10) + (line[2] - '0');
  if (statusCode < 100) {
    ThrowProtocolError("invalid status code");
  }
  head.statusCode = static_cast<http::StatusCode>(statusCode);
  line.remove_prefix(3);
  if (!line.empty()) {
    // Some servers omit the reason phrase but keep the separator.
    if (line.front() != ' ') {
      ThrowProtocolError("invalid status code");
    }
    line.remove_prefix(1);
    if (!http::IsValidHeaderValue(line)) {
      ThrowProtocolError("invalid reason phrase");
    }
    head.reason = line;
  }
}

void ParseHeaderFields(std::string_view fields, ResponseHead &head) {
  while (!fields.empty()) {
    const auto lineEnd = fields.find(http::CRLF);
    const std::string_view line = fields.substr(0, lineEnd);
    fields.remove_prefix(lineEnd == std::string_view::npos ? fields.size() : lineEnd + http::CRLF.size());

    if (line.empty() || http::IsHeaderWhitespace(line.front())) {
      // obs-fold (RFC 9112 §5.2) is not supported
      ThrowProtocolError("obsolete line folding in header field");
    }
    const auto [name, value] = http::ParseHeaderLine(line);
    if (!http::IsValidHeaderName(name)) {
      ThrowProtocolError("invalid header field name");
    }
    try {
      head.headers.append(name, value);
    } catch (const std::invalid_argument &) {
      ThrowProtocolError("invalid header field value");
    }
  }
}

}  // namespace

std::optional<ResponseHead> ResponseDecoder::decode(std::string_view chunk) {
  if (_headComplete) {
    // already decoded: new bytes belong to the body
    _buf.append(chunk);
    return std::nullopt;
  }
  _buf.append(chunk);

  const std::string_view data(_buf);
  // the terminator may straddle the previous chunk
  const std::size_t searchFrom = _scanPos < http::DoubleCRLF.size() ? 0 : _scanPos - (http::DoubleCRLF.size() - 1U);
  const auto headLen = data.find(http::DoubleCRLF, searchFrom);
  if (headLen == std::string_view::npos) {
    if (data.size() > _maxHeadBytes) {
      ThrowProtocolError("response head too large");
    }
    _scanPos = data.size();
    return std::nullopt;
  }
  if (headLen + http::DoubleCRLF.size() > _maxHeadBytes) {
    ThrowProtocolError("response head too large");
  }

  const std::string_view headData = data.substr(0, headLen);
  const auto statusLineEnd = headData.find(http::CRLF);

  ResponseHead head;
  ParseStatusLine(headData.substr(0, statusLineEnd), head);
  if (statusLineEnd != std::string_view::npos) {
    ParseHeaderFields(headData.substr(statusLineEnd + http::CRLF.size()), head);
  }

  _headEnd = headLen + http::DoubleCRLF.size();
  _headComplete = true;
  log::trace("Decoded response head '{} {}' with {} header(s), {} leftover byte(s)", head.statusCode, head.reason,
             head.headers.size(), data.size() - _headEnd);
  return head;
}

void ResponseDecoder::eof() const {
  if (_buf.empty()) {
    ThrowProtocolError("connection closed before receiving any response");
  }
  ThrowProtocolError("connection closed before the end of the response head");
}

std::string_view ResponseDecoder::leftover() const noexcept {
  if (!_headComplete) {
    return {};
  }
  return std::string_view(_buf).substr(_headEnd);
}

RawChars ResponseDecoder::takeLeftover() {
  RawChars ret(leftover());
  _buf.clear();
  _scanPos = 0;
  _headEnd = 0;
  _headComplete = false;
  return ret;
}

void ResponseDecoder::restart() {
  _buf.erase_front(_headEnd);
  _scanPos = 0;
  _headEnd = 0;
  _headComplete = false;
}

}  // namespace ferry
