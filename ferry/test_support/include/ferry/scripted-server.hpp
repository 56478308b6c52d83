#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "ferry/base-fd.hpp"
#include "ferry/tls-raii.hpp"

namespace ferry::test {

// A request as received by the ScriptedServer.
struct RecordedRequest {
  // Value of the first header named 'name' (case-insensitive), if any.
  [[nodiscard]] std::optional<std::string> header(std::string_view name) const;

  std::string method;
  std::string target;
  std::string version;
  std::vector<std::pair<std::string, std::string>> headers;  // in received order
  std::string body;                                          // de-chunked
  std::size_t connectionId{0};                               // index of the connection it arrived on
};

// What the server answers to a request.
struct Reply {
  // Reply with a complete response: Content-Length is computed from 'body'.
  static Reply Ok(std::string_view body, std::string_view extraHeaders = "");

  // Bytes written verbatim (may be empty, for instance to close without answering).
  std::string raw;
  // Close the connection once 'raw' has been written.
  bool closeAfter{false};
  // Wait before writing anything.
  std::chrono::milliseconds delay{0};
  // When not 0, 'raw' is written in pieces of this size with a short pause between them.
  std::size_t pieceSize{0};
};

// Loopback HTTP/1.x server answering each request with the Reply computed by a handler.
// Each connection is served by its own thread, requests of a connection in sequence (keep-alive).
// Requests are parsed just enough for the tests: head, Content-Length or chunked body.
// Stops and joins its threads on destruction.
class ScriptedServer {
 public:
  using Handler = std::function<Reply(const RecordedRequest &)>;

  struct TlsOptions {
    std::string certPem;
    std::string keyPem;
  };

  explicit ScriptedServer(Handler handler, std::optional<TlsOptions> tls = std::nullopt);

  ScriptedServer(const ScriptedServer &) = delete;
  ScriptedServer &operator=(const ScriptedServer &) = delete;

  ~ScriptedServer();

  [[nodiscard]] uint16_t port() const noexcept { return _port; }

  // "http://127.0.0.1:<port><path>", or https with TLS.
  [[nodiscard]] std::string url(std::string_view path = "/") const;

  // Same with "localhost" as host.
  [[nodiscard]] std::string localhostUrl(std::string_view path = "/") const;

  [[nodiscard]] std::vector<RecordedRequest> requests() const;

  [[nodiscard]] std::size_t connectionCount() const;

  // Stops accepting and serving. Idempotent.
  void stop();

 private:
  class Channel;

  void acceptLoop(const std::stop_token &stopToken);

  void serve(const std::stop_token &stopToken, BaseFd fd, std::size_t connectionId);

  Handler _handler;
  BaseFd _listenFd;
  SslCtxPtr _sslCtx{nullptr, ::SSL_CTX_free};
  uint16_t _port{0};
  mutable std::mutex _mutex;
  std::vector<RecordedRequest> _requests;
  std::vector<std::jthread> _connectionThreads;
  std::size_t _nbConnections{0};
  std::jthread _acceptThread;
};

}  // namespace ferry::test
