#include "ferry/http-connector.hpp"

#include <array>
#include <cerrno>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "ferry/base-fd.hpp"
#include "ferry/deadline.hpp"
#include "ferry/http-client-error.hpp"
#include "ferry/http-constants.hpp"
#include "ferry/http-method.hpp"
#include "ferry/http-status-code.hpp"
#include "ferry/log.hpp"
#include "ferry/request-encoder.hpp"
#include "ferry/request.hpp"
#include "ferry/response-decoder.hpp"
#include "ferry/response-head.hpp"
#include "ferry/tcp-connector.hpp"
#include "ferry/tls-client-context.hpp"
#include "ferry/tls-transport.hpp"
#include "ferry/transport-stream.hpp"
#include "ferry/transport.hpp"

namespace ferry {

namespace {

constexpr std::size_t kTunnelBufferSize = 4096;

HttpClientError ConnectError(std::string_view message, std::exception_ptr cause = nullptr) {
  return {ErrorKind::Connect, ErrorPhase::Connect, message, std::move(cause)};
}

}  // namespace

HttpConnector::HttpConnector(ConnectorConfig config) : _config(std::move(config)) {
  _config.validate();
  _tlsContext = std::make_unique<TlsClientContext>(_config.tls);
}

std::unique_ptr<TransportStream> HttpConnector::connectTcp(std::string_view host, uint16_t port, ConnDetail detail,
                                                           const Deadline &deadline) const {
  const auto portStr = std::to_string(port);
  auto res = ConnectTCP(host, portStr, deadline);
  if (res.timedOut) {
    throw HttpClientError(ErrorKind::Timeout, ErrorPhase::Connect, "timed out connecting to " + std::string(host));
  }
  if (res.failure || !res.fd) {
    const int err = res.err == 0 ? ECONNREFUSED : res.err;
    auto cause = std::make_exception_ptr(std::system_error(err, std::generic_category()));
    throw ConnectError("unable to connect to " + std::string(host) + ':' + portStr, std::move(cause));
  }
  const int fd = res.fd.fd();
  return std::make_unique<TransportStream>(std::move(res.fd), std::make_unique<PlainTransport>(fd), std::move(detail));
}

void HttpConnector::openTunnel(TransportStream &stream, const Uri &uri, const Deadline &deadline) const {
  Request connectRequest(http::Method::CONNECT, uri);
  const auto authority = uri.hostAndPort();
  connectRequest.headers().append(http::Host, authority);

  std::array<char, kTunnelBufferSize> buf;
  try {
    RequestEncoder encoder(connectRequest, TargetForm::Authority);
    for (auto nb = encoder.encode(buf); nb != 0; nb = encoder.encode(buf)) {
      stream.writeAll(std::string_view(buf.data(), nb), deadline);
    }

    ResponseDecoder decoder;
    std::optional<ResponseHead> head;
    while (!head) {
      const auto nbRead = stream.read(buf.data(), buf.size(), deadline);
      if (nbRead == 0) {
        decoder.eof();
      }
      head = decoder.decode(std::string_view(buf.data(), nbRead));
    }
    if (!http::IsSuccess(head->statusCode)) {
      throw ConnectError("proxy refused CONNECT to " + authority + " with status " +
                         std::to_string(head->statusCode));
    }
    if (!decoder.leftover().empty()) {
      throw ConnectError("proxy sent unexpected bytes after CONNECT response");
    }
  } catch (const HttpClientError &err) {
    if (err.kind() == ErrorKind::Timeout || err.kind() == ErrorKind::Connect) {
      throw err.withPhase(ErrorPhase::Connect);
    }
    throw ConnectError("CONNECT tunnel to " + authority + " failed: " + std::string(err.message()),
                       std::current_exception());
  } catch (const std::system_error &) {
    throw ConnectError("CONNECT tunnel to " + authority + " failed", std::current_exception());
  }
  log::debug("CONNECT tunnel to {} established", authority);
}

std::unique_ptr<Stream> HttpConnector::connect(const Uri &uri, const Deadline &deadline) {
  ConnDetail detail;
  detail.isTls = uri.isHttps();
  detail.host = std::string(uri.host());
  detail.port = uri.port();

  const bool viaProxy = _config.proxy && !_config.proxy->bypass(uri.host());
  if (!viaProxy) {
    auto stream = connectTcp(uri.host(), uri.port(), detail, deadline);
    if (!detail.isTls) {
      log::debug("Connected to {}:{} on fd # {}", detail.host, detail.port, stream->fd());
      return stream;
    }
    auto fd = stream->detachFd();
    const int rawFd = fd.fd();
    auto tlsStream = std::make_unique<TransportStream>(
        std::move(fd), std::make_unique<TlsTransport>(_tlsContext->newSsl(rawFd, uri.host())), std::move(detail));
    tlsStream->completeHandshake(deadline);
    log::debug("TLS connection to {}:{} established on fd # {}", uri.host(), uri.port(), rawFd);
    return tlsStream;
  }

  const auto &proxy = *_config.proxy;
  if (!detail.isTls) {
    detail.isProxy = true;
    auto stream = connectTcp(proxy.host, proxy.port, std::move(detail), deadline);
    log::debug("Connected to proxy {}:{} for {} on fd # {}", proxy.host, proxy.port, uri.host(), stream->fd());
    return stream;
  }

  auto tunnel = connectTcp(proxy.host, proxy.port, detail, deadline);
  openTunnel(*tunnel, uri, deadline);
  auto fd = tunnel->detachFd();
  const int rawFd = fd.fd();
  auto tlsStream = std::make_unique<TransportStream>(
      std::move(fd), std::make_unique<TlsTransport>(_tlsContext->newSsl(rawFd, uri.host())), std::move(detail));
  tlsStream->completeHandshake(deadline);
  log::debug("TLS connection to {}:{} through proxy {}:{} established on fd # {}", uri.host(), uri.port(),
             proxy.host, proxy.port, rawFd);
  return tlsStream;
}

}  // namespace ferry
