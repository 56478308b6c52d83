#include "ferry/http1-exchange.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "ferry/body-encoder.hpp"
#include "ferry/body-length.hpp"
#include "ferry/conn.hpp"
#include "ferry/decoder.hpp"
#include "ferry/http-body.hpp"
#include "ferry/http-client-error.hpp"
#include "ferry/http-constants.hpp"
#include "ferry/http-method.hpp"
#include "ferry/http-status-code.hpp"
#include "ferry/http-version.hpp"
#include "ferry/interceptor.hpp"
#include "ferry/log.hpp"
#include "ferry/raw-chars.hpp"
#include "ferry/request-body.hpp"
#include "ferry/request-encoder.hpp"
#include "ferry/request.hpp"
#include "ferry/response-decoder.hpp"
#include "ferry/response-head.hpp"
#include "ferry/response.hpp"
#include "ferry/string-equal-ignore-case.hpp"
#include "ferry/string-trim.hpp"

namespace ferry {

namespace {

std::unique_ptr<BodyEncoder> MakeBodyEncoder(const Request &request) {
  const auto &headers = request.headers();
  if (headers.containsToken(http::TransferEncoding, http::chunked)) {
    return std::make_unique<ChunkedBodyEncoder>();
  }
  std::optional<uint64_t> declaredLength;
  if (auto contentLength = headers.get(http::ContentLength)) {
    declaredLength = ParseContentLength(*contentLength);
  }
  return std::make_unique<FixedBodyEncoder>(declaredLength);
}

std::size_t EncodeBody(BodyEncoder &encoder, RequestBody &body, std::span<char> out) {
  try {
    return encoder.encode(body, out);
  } catch (const HttpClientError &) {
    throw;
  } catch (const std::system_error &ex) {
    throw HttpClientError(ErrorKind::UserAborted, ErrorPhase::Send,
                          std::string("request body aborted: ") + ex.what(), std::current_exception());
  } catch (const std::exception &ex) {
    throw HttpClientError(ErrorKind::BodyTransfer, ErrorPhase::Send,
                          std::string("request body failed: ") + ex.what(), std::current_exception());
  }
}

std::optional<std::string_view> ShutdownReason(const Request &request, const ResponseHead &head) {
  if (!head.keepAlive()) {
    return head.version == http::HTTP_1_0 ? "HTTP/1.0 response without keep-alive" : "server asked to close";
  }
  const auto &requestHeaders = request.headers();
  if (requestHeaders.containsToken(http::Connection, http::close)) {
    return "request asked to close";
  }
  if (request.version() == http::HTTP_1_0 && !requestHeaders.containsToken(http::Connection, http::keepalive)) {
    return "HTTP/1.0 request without keep-alive";
  }
  if (head.statusCode == http::StatusCodeSwitchingProtocols) {
    return "protocol switched";
  }
  if (request.method() == http::Method::CONNECT && http::IsSuccess(head.statusCode)) {
    return "tunnel established";
  }
  return std::nullopt;
}

std::unique_ptr<DecoderContext> SetupDecoding(ResponseHead &head, BodyLength length,
                                              const DecompressionConfig &config) {
  if (!config.enable || length.kind == BodyLength::Kind::Zero) {
    return nullptr;
  }
  const auto contentEncoding = head.headers.get(http::ContentEncoding);
  if (!contentEncoding) {
    return nullptr;
  }
  const auto coding = TrimOws(*contentEncoding);
  if (coding.empty() || CaseInsensitiveEqual(coding, http::identity)) {
    return nullptr;
  }
  auto decoder = MakeDecoderContext(coding);
  if (!decoder) {
    log::debug("Content-Encoding '{}' is not supported, response body delivered as is", coding);
    return nullptr;
  }
  head.headers.erase(http::ContentEncoding);
  head.headers.erase(http::ContentLength);
  return decoder;
}

class Exchange {
 public:
  Exchange(Conn &conn, Request &request, const ExchangeOptions &options)
      : _conn(conn), _request(request), _options(options), _buf(options.bufferSize) {}

  void send();

  ResponseHead receiveHead(ResponseDecoder &decoder);

  [[nodiscard]] ErrorPhase phase() const noexcept { return _phase; }

  [[nodiscard]] ErrorKind ioErrorKind() const noexcept { return _ioErrorKind; }

 private:
  void flush();

  [[nodiscard]] std::span<char> freeSpace() noexcept { return {_buf.data() + _buf.size(), _buf.availableCapacity()}; }

  Conn &_conn;
  Request &_request;
  const ExchangeOptions &_options;
  RawChars _buf;
  ErrorPhase _phase{ErrorPhase::Send};
  ErrorKind _ioErrorKind{ErrorKind::Request};
  bool _headComplete{false};
};

void Exchange::flush() {
  if (_buf.empty()) {
    return;
  }
  if (_options.interceptor) {
    RunInterceptorHook(ErrorPhase::Send, [this] { _options.interceptor->onOutboundBytes(_buf); });
  }
  _conn.writeAll(_buf, _options.deadline);
  log::trace("{} request bytes written", _buf.size());
  _buf.clear();
  if (_headComplete) {
    // the head is on the wire, next write failures concern the body
    _ioErrorKind = ErrorKind::BodyTransfer;
  }
}

void Exchange::send() {
  const auto targetForm = SelectTargetForm(_request.method(), _conn.detail().isProxy);
  _request.timeGroup().setTransferStart();

  RequestEncoder headEncoder(_request, targetForm);
  while (true) {
    if (_buf.availableCapacity() == 0) {
      flush();
    }
    const auto nb = headEncoder.encode(freeSpace());
    if (nb == 0) {
      break;
    }
    _buf.addSize(nb);
  }
  _headComplete = true;

  auto bodyEncoder = MakeBodyEncoder(_request);
  while (true) {
    if (_buf.availableCapacity() < BodyEncoder::kMinEncodeSpace) {
      flush();
    }
    const auto nb = EncodeBody(*bodyEncoder, _request.body(), freeSpace());
    if (nb == 0) {
      break;
    }
    _buf.addSize(nb);
  }
  flush();
  _ioErrorKind = ErrorKind::Request;
}

ResponseHead Exchange::receiveHead(ResponseDecoder &decoder) {
  _phase = ErrorPhase::Receive;
  bool firstByte = true;
  while (true) {
    _buf.clear();
    const auto nb = _conn.read(_buf.data(), _buf.capacity(), _options.deadline);
    if (nb == 0) {
      decoder.eof();
    }
    if (firstByte) {
      _request.timeGroup().setTransferEnd();
      firstByte = false;
    }
    const std::string_view chunk(_buf.data(), nb);
    if (_options.interceptor) {
      RunInterceptorHook(ErrorPhase::Receive, [this, chunk] { _options.interceptor->onInboundBytes(chunk); });
    }
    auto head = decoder.decode(chunk);
    while (head && http::IsInformational(head->statusCode) &&
           head->statusCode != http::StatusCodeSwitchingProtocols) {
      log::debug("Skipping interim {} response", head->statusCode);
      decoder.restart();
      head = decoder.decode({});
    }
    if (head) {
      return std::move(*head);
    }
  }
}

}  // namespace

Response SendRequest(Conn conn, Request &request, const ExchangeOptions &options) {
  Exchange exchange(conn, request, options);
  try {
    if (options.interceptor) {
      RunInterceptorHook(ErrorPhase::Send, [&] { options.interceptor->onRequest(request); });
    }
    exchange.send();

    ResponseDecoder decoder(options.maxHeadBytes);
    auto head = exchange.receiveHead(decoder);
    log::debug("{} {} -> {} {}", http::MethodToStr(request.method()), request.uri().str(), head.statusCode,
               head.reason);

    if (auto reason = ShutdownReason(request, head)) {
      conn.shutdown(*reason);
    }
    const auto length = ResolveBodyLength(request.method(), head.statusCode, head.headers);
    if (length.kind == BodyLength::Kind::UntilClose) {
      conn.shutdown("response body delimited by connection close");
    }
    auto contentDecoder = SetupDecoding(head, length, options.decompression);

    HttpBody body(std::move(conn), length, decoder.takeLeftover(), options.deadline, options.interceptor,
                  options.bufferSize);
    if (contentDecoder) {
      body.setDecoder(std::move(contentDecoder), options.decompression);
    }
    Response response(std::move(head), std::move(body), request.uri(), request.timeGroup());
    if (options.interceptor) {
      RunInterceptorHook(ErrorPhase::Receive, [&] { options.interceptor->onResponse(response); });
    }
    return response;
  } catch (const HttpClientError &err) {
    conn.shutdown(err.message());
    conn.close();
    throw err.withPhase(exchange.phase());
  } catch (const std::system_error &ex) {
    conn.shutdown(ex.what());
    conn.close();
    const bool sending = exchange.phase() == ErrorPhase::Send;
    throw HttpClientError(exchange.ioErrorKind(), exchange.phase(),
                          std::string(sending ? "I/O error while sending the request: "
                                              : "I/O error while receiving the response head: ") +
                              ex.what(),
                          std::current_exception());
  } catch (const std::exception &ex) {
    conn.shutdown(ex.what());
    conn.close();
    throw;
  }
}

}  // namespace ferry
