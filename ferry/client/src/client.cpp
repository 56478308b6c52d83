#include "ferry/client.hpp"

#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <utility>

#include "ferry/client-config.hpp"
#include "ferry/conn.hpp"
#include "ferry/connector.hpp"
#include "ferry/deadline.hpp"
#include "ferry/decoder.hpp"
#include "ferry/http-client-error.hpp"
#include "ferry/http-connector.hpp"
#include "ferry/http-constants.hpp"
#include "ferry/http-method.hpp"
#include "ferry/http1-exchange.hpp"
#include "ferry/interceptor.hpp"
#include "ferry/log.hpp"
#include "ferry/redirect.hpp"
#include "ferry/request-body.hpp"
#include "ferry/request-formatter.hpp"
#include "ferry/request.hpp"
#include "ferry/response.hpp"
#include "ferry/uri.hpp"

namespace ferry {

namespace {

ClientConfig Validated(ClientConfig config) {
  config.validate();
  return config;
}

}  // namespace

Client::Client(ClientConfig config) : Client(config, std::make_shared<HttpConnector>(config.connector)) {}

Client::Client(ClientConfig config, std::shared_ptr<Connector> connector)
    : _config(Validated(std::move(config))), _pool(_config.pool, std::move(connector)) {}

Response Client::send(Request &request) {
  for (uint32_t attempt = 0;; ++attempt) {
    try {
      return sendFollowingRedirects(request);
    } catch (const HttpClientError &err) {
      if (!err.isRetryable() || attempt >= _config.retryTimes) {
        throw;
      }
      // only bodies which can be produced again from their start can be retried
      if (!request.body().reuse()) {
        log::debug("Not retrying {} {}: request body is a stream", http::MethodToStr(request.method()),
                   request.uri().str());
        throw;
      }
      log::warn("Attempt {}/{} of {} {} failed: {}. Retrying", attempt + 1, _config.retryTimes + 1,
                http::MethodToStr(request.method()), request.uri().str(), err.what());
    }
  }
}

Response Client::sendFollowingRedirects(Request &request) {
  Response response = sendOnce(request);
  RedirectInfo info;
  while (_config.redirect->redirect(request, response, info) == RedirectTrigger::NextLink) {
    if (!request.body().reuse()) {
      request.setBody(RequestBody::Empty());
      request.headers().erase(http::ContentLength);
      request.headers().erase(http::TransferEncoding);
    }
    response = sendOnce(request);
  }
  return response;
}

Response Client::sendOnce(Request &request) {
  request.timeGroup().reset();

  FormatOptions formatOptions;
  formatOptions.userAgent = _config.userAgent;
  if (_config.decompression.enable) {
    formatOptions.acceptEncoding = SupportedAcceptEncoding();
  }
  FormatRequest(request, formatOptions);

  request.timeGroup().setConnectStart();
  Conn conn = connect(request.uri());
  request.timeGroup().setConnectEnd();

  if (_config.interceptor && !conn.reused()) {
    try {
      RunInterceptorHook(ErrorPhase::Connect, [&] { _config.interceptor->onConnection(conn.detail()); });
    } catch (const HttpClientError &err) {
      conn.shutdown(err.message());
      throw;
    }
  }

  ExchangeOptions options;
  options.deadline = Deadline::In(_config.requestTimeout);
  options.maxHeadBytes = _config.maxHeaderBytes;
  options.bufferSize = _config.transferBufferSize;
  options.interceptor = _config.interceptor;
  options.decompression = _config.decompression;
  return SendRequest(std::move(conn), request, options);
}

Conn Client::connect(const Uri &uri) {
  const auto deadline = Deadline::In(_config.connectTimeout);
  const auto timeoutError = [&] {
    return HttpClientError(ErrorKind::Timeout, ErrorPhase::Connect,
                           "connect timeout of " + std::to_string(_config.connectTimeout.count()) +
                               " ms elapsed for " + uri.authority());
  };
  Conn conn;
  try {
    conn = _pool.connectTo(uri, deadline);
  } catch (const HttpClientError &err) {
    if (err.kind() == ErrorKind::Timeout || (!deadline.isNever() && deadline.expired())) {
      throw timeoutError();
    }
    if (err.kind() == ErrorKind::Connect) {
      throw err.withPhase(ErrorPhase::Connect);
    }
    throw HttpClientError(ErrorKind::Connect, ErrorPhase::Connect, err.message(), std::current_exception());
  } catch (const std::exception &ex) {
    if (!deadline.isNever() && deadline.expired()) {
      throw timeoutError();
    }
    throw HttpClientError(ErrorKind::Connect, ErrorPhase::Connect, std::string("connector failed: ") + ex.what(),
                          std::current_exception());
  }
  if (!deadline.isNever() && deadline.expired()) {
    // the connector returned too late: the stream cannot be trusted with this request
    conn.shutdown("connect timeout elapsed");
    throw timeoutError();
  }
  return conn;
}

}  // namespace ferry
