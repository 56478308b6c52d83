#include "ferry/http-body.hpp"

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "ferry/body-length.hpp"
#include "ferry/conn.hpp"
#include "ferry/decoder.hpp"
#include "ferry/decompression-config.hpp"
#include "ferry/http-client-error.hpp"
#include "ferry/interceptor.hpp"
#include "ferry/log.hpp"
#include "ferry/raw-chars.hpp"

namespace ferry {

HttpBody::HttpBody(Conn conn, BodyLength length, RawChars leftover, Deadline deadline,
                   std::shared_ptr<Interceptor> interceptor, std::size_t bufferSize)
    : _conn(std::move(conn)),
      _deadline(deadline),
      _interceptor(std::move(interceptor)),
      _raw(std::move(leftover)),
      _bufferSize(bufferSize),
      _remaining(length.kind == BodyLength::Kind::Fixed ? length.length : 0),
      _length(length),
      _finished(false) {
  if (length.kind == BodyLength::Kind::Zero || (length.kind == BodyLength::Kind::Fixed && length.length == 0)) {
    discardStrayBytes();
    complete();
  }
}

HttpBody::~HttpBody() {
  if (_conn.valid()) {
    _conn.shutdown("response body dropped before its end");
    _conn.close();
  }
}

void HttpBody::setDecoder(std::unique_ptr<DecoderContext> decoder, const DecompressionConfig &config) {
  _decoder = std::move(decoder);
  _maxDecodedBytes = config.maxDecompressedBytes;
  _decoderChunkSize = config.decoderChunkSize;
}

std::size_t HttpBody::read(char *buf, std::size_t len) {
  if (_failed) {
    throw HttpClientError(ErrorKind::BodyTransfer, ErrorPhase::Receive, "response body unusable after an error");
  }
  while (_outPos == _out.size()) {
    if (_finished || len == 0) {
      return 0;
    }
    _out.clear();
    _outPos = 0;
    pump();
  }
  const auto nb = std::min(len, _out.size() - _outPos);
  std::memcpy(buf, _out.data() + _outPos, nb);
  _outPos += nb;
  return nb;
}

std::string HttpBody::readAll() {
  std::string ret;
  const std::size_t chunkSize = std::max<std::size_t>(_bufferSize, 1024);
  while (true) {
    const auto oldSize = ret.size();
    ret.resize(oldSize + chunkSize);
    const auto nb = read(ret.data() + oldSize, chunkSize);
    ret.resize(oldSize + nb);
    if (nb == 0) {
      return ret;
    }
  }
}

void HttpBody::pump() {
  try {
    _framed.clear();
    const bool wireEnd = pullFramed(_framed);
    if (_decoder) {
      if (_maxDecodedBytes != 0 && _decodedBytes >= _maxDecodedBytes && !_framed.empty()) {
        throw HttpClientError(ErrorKind::BodyDecode, "decoded response body exceeds the maximum size");
      }
      const auto remainingCap = _maxDecodedBytes == 0 ? 0 : _maxDecodedBytes - _decodedBytes;
      const auto sizeBefore = _out.size();
      if (!_decoder->decompressChunk(_framed, wireEnd, remainingCap, _decoderChunkSize, _out)) {
        throw HttpClientError(ErrorKind::BodyDecode, "unable to decode the response content coding");
      }
      _decodedBytes += _out.size() - sizeBefore;
    } else {
      _out.append(_framed);
    }
    if (wireEnd) {
      complete();
    }
  } catch (const HttpClientError &err) {
    fail(err.message());
    throw err.withPhase(ErrorPhase::Receive);
  } catch (const std::system_error &ex) {
    fail(ex.what());
    throw HttpClientError(ErrorKind::BodyTransfer, ErrorPhase::Receive,
                          std::string("I/O error while reading the response body: ") + ex.what(),
                          std::current_exception());
  }
}

bool HttpBody::pullFramed(RawChars &dst) {
  if (_length.kind == BodyLength::Kind::Fixed && _remaining == 0) {
    return true;
  }
  if (_raw.empty() && readMore() == 0) {
    if (_length.kind == BodyLength::Kind::UntilClose) {
      return true;
    }
    throw HttpClientError(ErrorKind::BodyTransfer, "connection closed before the end of the response body");
  }
  switch (_length.kind) {
    case BodyLength::Kind::Fixed: {
      const auto nb = static_cast<std::size_t>(std::min<uint64_t>(_raw.size(), _remaining));
      dst.append(_raw.data(), nb);
      _raw.erase_front(nb);
      _remaining -= nb;
      if (_remaining != 0) {
        return false;
      }
      discardStrayBytes();
      return true;
    }
    case BodyLength::Kind::Chunked: {
      const auto consumed = _chunked.decode(_raw, dst);
      _raw.erase_front(consumed);
      if (!_chunked.done()) {
        return false;
      }
      discardStrayBytes();
      return true;
    }
    default:
      dst.append(_raw);
      _raw.clear();
      return false;
  }
}

std::size_t HttpBody::readMore() {
  _raw.ensureAvailableCapacityExponential(_bufferSize);
  const auto nb = _conn.read(_raw.data() + _raw.size(), _bufferSize, _deadline);
  if (nb != 0 && _interceptor) {
    RunInterceptorHook(ErrorPhase::Receive,
                       [&] { _interceptor->onInboundBytes(std::string_view(_raw.data() + _raw.size(), nb)); });
  }
  _raw.addSize(nb);
  return nb;
}

void HttpBody::discardStrayBytes() {
  if (!_raw.empty()) {
    log::warn("Discarding {} unexpected bytes after the response body", _raw.size());
    _conn.shutdown("unexpected bytes after the response body");
    _raw.clear();
  }
}

void HttpBody::complete() {
  _finished = true;
  _conn.release();
}

void HttpBody::fail(std::string_view reason) noexcept {
  _failed = true;
  _finished = true;
  _conn.shutdown(reason);
  _conn.close();
}

}  // namespace ferry
