#include "ferry/scripted-server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "ferry/base-fd.hpp"
#include "ferry/errno-throw.hpp"
#include "ferry/log.hpp"
#include "ferry/string-equal-ignore-case.hpp"
#include "ferry/string-trim.hpp"
#include "ferry/tls-raii.hpp"

namespace ferry::test {

namespace {

constexpr int kPollPeriodMs = 20;

void SetSocketTimeouts(int fd) {
  timeval tv{};
  tv.tv_sec = 2;
  ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
  static constexpr int kEnable = 1;
  ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &kEnable, sizeof(kEnable));
}

bool SleepUnlessStopped(const std::stop_token &stopToken, std::chrono::milliseconds duration) {
  const auto end = std::chrono::steady_clock::now() + duration;
  while (std::chrono::steady_clock::now() < end) {
    if (stopToken.stop_requested()) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds{5});
  }
  return !stopToken.stop_requested();
}

}  // namespace

// Plain or TLS server side of one accepted connection, with blocking I/O.
class ScriptedServer::Channel {
 public:
  Channel(BaseFd fd, SSL_CTX *sslCtx) : _fd(std::move(fd)) {
    if (sslCtx != nullptr) {
      _ssl.reset(::SSL_new(sslCtx));
      if (!_ssl || ::SSL_set_fd(_ssl.get(), _fd.fd()) != 1 || ::SSL_accept(_ssl.get()) != 1) {
        log::debug("ScriptedServer: TLS handshake failed");
        ::ERR_clear_error();
        _ssl.reset();
        _fd.close();
      }
    }
  }

  Channel(const Channel &) = delete;
  Channel &operator=(const Channel &) = delete;

  ~Channel() {
    if (_ssl) {
      ::SSL_shutdown(_ssl.get());
    }
  }

  [[nodiscard]] bool usable() const noexcept { return static_cast<bool>(_fd); }

  // Waits for input. Returns false if the server is stopping.
  bool waitReadable(const std::stop_token &stopToken) const {
    if (_ssl && ::SSL_pending(_ssl.get()) > 0) {
      return true;
    }
    pollfd pfd{};
    pfd.fd = _fd.fd();
    pfd.events = POLLIN;
    while (!stopToken.stop_requested()) {
      const int ret = ::poll(&pfd, 1, kPollPeriodMs);
      if (ret > 0) {
        return true;
      }
      if (ret < 0 && errno != EINTR) {
        return false;
      }
    }
    return false;
  }

  // Appends received bytes to 'buf'. Returns false on close, error or stop.
  bool fill(std::string &buf, const std::stop_token &stopToken) {
    if (!waitReadable(stopToken)) {
      return false;
    }
    char chunk[4096];
    long nb;
    if (_ssl) {
      std::size_t nbRead = 0;
      nb = ::SSL_read_ex(_ssl.get(), chunk, sizeof(chunk), &nbRead) == 1 ? static_cast<long>(nbRead) : -1;
    } else {
      nb = ::recv(_fd.fd(), chunk, sizeof(chunk), 0);
    }
    if (nb <= 0) {
      return false;
    }
    buf.append(chunk, static_cast<std::size_t>(nb));
    return true;
  }

  bool sendAll(std::string_view data) {
    while (!data.empty()) {
      long nb;
      if (_ssl) {
        std::size_t nbWritten = 0;
        nb = ::SSL_write_ex(_ssl.get(), data.data(), data.size(), &nbWritten) == 1 ? static_cast<long>(nbWritten)
                                                                                     : -1;
      } else {
        nb = ::send(_fd.fd(), data.data(), data.size(), MSG_NOSIGNAL);
      }
      if (nb <= 0) {
        return false;
      }
      data.remove_prefix(static_cast<std::size_t>(nb));
    }
    return true;
  }

 private:
  BaseFd _fd;
  SslPtr _ssl{nullptr, ::SSL_free};
};

std::optional<std::string> RecordedRequest::header(std::string_view name) const {
  for (const auto &[headerName, value] : headers) {
    if (CaseInsensitiveEqual(headerName, name)) {
      return value;
    }
  }
  return std::nullopt;
}

Reply Reply::Ok(std::string_view body, std::string_view extraHeaders) {
  Reply reply;
  reply.raw.append("HTTP/1.1 200 OK\r\nContent-Length: ");
  reply.raw.append(std::to_string(body.size()));
  reply.raw.append("\r\n");
  reply.raw.append(extraHeaders);
  reply.raw.append("\r\n");
  reply.raw.append(body);
  return reply;
}

ScriptedServer::ScriptedServer(Handler handler, std::optional<TlsOptions> tls)
    : _handler(std::move(handler)), _listenFd(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0)) {
  if (!_listenFd) {
    throw_errno("ScriptedServer: socket() failed");
  }
  static constexpr int kEnable = 1;
  ::setsockopt(_listenFd.fd(), SOL_SOCKET, SO_REUSEADDR, &kEnable, sizeof(kEnable));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;
  if (::bind(_listenFd.fd(), reinterpret_cast<const sockaddr *>(&addr), sizeof(addr)) != 0) {
    throw_errno("ScriptedServer: bind() failed");
  }
  if (::listen(_listenFd.fd(), 64) != 0) {
    throw_errno("ScriptedServer: listen() failed");
  }
  socklen_t len = sizeof(addr);
  if (::getsockname(_listenFd.fd(), reinterpret_cast<sockaddr *>(&addr), &len) != 0) {
    throw_errno("ScriptedServer: getsockname() failed");
  }
  _port = ntohs(addr.sin_port);

  if (tls) {
    _sslCtx.reset(::SSL_CTX_new(::TLS_server_method()));
    if (!_sslCtx) {
      throw std::runtime_error("ScriptedServer: SSL_CTX_new failed");
    }
    auto certBio = MakeMemBio(tls->certPem.data(), static_cast<int>(tls->certPem.size()));
    X509Ptr cert(::PEM_read_bio_X509(certBio.get(), nullptr, nullptr, nullptr), ::X509_free);
    auto keyBio = MakeMemBio(tls->keyPem.data(), static_cast<int>(tls->keyPem.size()));
    std::unique_ptr<EVP_PKEY, decltype(&::EVP_PKEY_free)> key(
        ::PEM_read_bio_PrivateKey(keyBio.get(), nullptr, nullptr, nullptr), ::EVP_PKEY_free);
    if (!cert || !key || ::SSL_CTX_use_certificate(_sslCtx.get(), cert.get()) != 1 ||
        ::SSL_CTX_use_PrivateKey(_sslCtx.get(), key.get()) != 1) {
      throw std::runtime_error("ScriptedServer: invalid certificate or key");
    }
  }

  _acceptThread = std::jthread([this](const std::stop_token &stopToken) { acceptLoop(stopToken); });
}

ScriptedServer::~ScriptedServer() { stop(); }

void ScriptedServer::stop() {
  if (_acceptThread.joinable()) {
    _acceptThread.request_stop();
    _acceptThread.join();
  }
  std::vector<std::jthread> threads;
  {
    std::scoped_lock lock(_mutex);
    threads.swap(_connectionThreads);
  }
  for (auto &thread : threads) {
    thread.request_stop();
  }
  threads.clear();
  _listenFd.close();
}

std::string ScriptedServer::url(std::string_view path) const {
  return std::string(_sslCtx ? "https" : "http") + "://127.0.0.1:" + std::to_string(_port) + std::string(path);
}

std::string ScriptedServer::localhostUrl(std::string_view path) const {
  return std::string(_sslCtx ? "https" : "http") + "://localhost:" + std::to_string(_port) + std::string(path);
}

std::vector<RecordedRequest> ScriptedServer::requests() const {
  std::scoped_lock lock(_mutex);
  return _requests;
}

std::size_t ScriptedServer::connectionCount() const {
  std::scoped_lock lock(_mutex);
  return _nbConnections;
}

void ScriptedServer::acceptLoop(const std::stop_token &stopToken) {
  pollfd pfd{};
  pfd.fd = _listenFd.fd();
  pfd.events = POLLIN;
  while (!stopToken.stop_requested()) {
    if (::poll(&pfd, 1, kPollPeriodMs) <= 0) {
      continue;
    }
    BaseFd fd(::accept4(_listenFd.fd(), nullptr, nullptr, SOCK_CLOEXEC));
    if (!fd) {
      continue;
    }
    SetSocketTimeouts(fd.fd());
    std::scoped_lock lock(_mutex);
    const std::size_t connectionId = _nbConnections++;
    _connectionThreads.emplace_back([this, fd = std::move(fd), connectionId](const std::stop_token &token) mutable {
      serve(token, std::move(fd), connectionId);
    });
  }
}

void ScriptedServer::serve(const std::stop_token &stopToken, BaseFd fd, std::size_t connectionId) {
  Channel channel(std::move(fd), _sslCtx.get());
  if (!channel.usable()) {
    return;
  }
  std::string buf;
  while (!stopToken.stop_requested()) {
    std::size_t headEnd;
    while ((headEnd = buf.find("\r\n\r\n")) == std::string::npos) {
      if (!channel.fill(buf, stopToken)) {
        return;
      }
    }

    RecordedRequest request;
    request.connectionId = connectionId;
    std::string_view head(buf.data(), headEnd + 2);
    const auto requestLineEnd = head.find("\r\n");
    const std::string_view requestLine = head.substr(0, requestLineEnd);
    const auto firstSp = requestLine.find(' ');
    const auto lastSp = requestLine.rfind(' ');
    request.method = std::string(requestLine.substr(0, firstSp));
    request.target = std::string(requestLine.substr(firstSp + 1, lastSp - firstSp - 1));
    request.version = std::string(requestLine.substr(lastSp + 1));
    head.remove_prefix(requestLineEnd + 2);
    while (!head.empty()) {
      const auto lineEnd = head.find("\r\n");
      const auto line = head.substr(0, lineEnd);
      const auto colon = line.find(':');
      if (colon != std::string_view::npos) {
        request.headers.emplace_back(std::string(line.substr(0, colon)), std::string(TrimOws(line.substr(colon + 1))));
      }
      head.remove_prefix(lineEnd + 2);
    }
    buf.erase(0, headEnd + 4);

    const auto transferEncoding = request.header("Transfer-Encoding");
    if (transferEncoding && CaseInsensitiveListContains(*transferEncoding, "chunked")) {
      while (true) {
        std::size_t lineEnd;
        while ((lineEnd = buf.find("\r\n")) == std::string::npos) {
          if (!channel.fill(buf, stopToken)) {
            return;
          }
        }
        std::size_t chunkSize = 0;
        std::from_chars(buf.data(), buf.data() + lineEnd, chunkSize, 16);
        buf.erase(0, lineEnd + 2);
        if (chunkSize == 0) {
          // trailer section up to the empty line
          while (true) {
            while ((lineEnd = buf.find("\r\n")) == std::string::npos) {
              if (!channel.fill(buf, stopToken)) {
                return;
              }
            }
            buf.erase(0, lineEnd + 2);
            if (lineEnd == 0) {
              break;
            }
          }
          break;
        }
        while (buf.size() < chunkSize + 2) {
          if (!channel.fill(buf, stopToken)) {
            return;
          }
        }
        request.body.append(buf, 0, chunkSize);
        buf.erase(0, chunkSize + 2);
      }
    } else if (const auto contentLength = request.header("Content-Length")) {
      std::size_t length = 0;
      std::from_chars(contentLength->data(), contentLength->data() + contentLength->size(), length);
      while (buf.size() < length) {
        if (!channel.fill(buf, stopToken)) {
          return;
        }
      }
      request.body.assign(buf, 0, length);
      buf.erase(0, length);
    }

    const Reply reply = _handler(request);
    {
      std::scoped_lock lock(_mutex);
      _requests.push_back(std::move(request));
    }

    if (reply.delay.count() > 0 && !SleepUnlessStopped(stopToken, reply.delay)) {
      return;
    }
    if (reply.pieceSize == 0) {
      if (!channel.sendAll(reply.raw)) {
        return;
      }
    } else {
      std::string_view remaining(reply.raw);
      while (!remaining.empty()) {
        const auto nb = std::min(reply.pieceSize, remaining.size());
        if (!channel.sendAll(remaining.substr(0, nb)) || !SleepUnlessStopped(stopToken, std::chrono::milliseconds{2})) {
          return;
        }
        remaining.remove_prefix(nb);
      }
    }
    if (reply.closeAfter) {
      return;
    }
  }
}

}  // namespace ferry::test
