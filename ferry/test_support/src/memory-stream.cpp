#include "ferry/memory-stream.hpp"

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include "ferry/deadline.hpp"
#include "ferry/errno-throw.hpp"
#include "ferry/http-client-error.hpp"
#include "ferry/stream.hpp"
#include "ferry/uri.hpp"

namespace ferry::test {

MemoryStream::MemoryStream(std::vector<std::string> inbound, AtEnd atEnd, ConnDetail detail)
    : Stream(std::move(detail)),
      _inbound(std::make_move_iterator(inbound.begin()), std::make_move_iterator(inbound.end())),
      _probe(std::make_shared<Probe>()),
      _atEnd(atEnd) {}

std::size_t MemoryStream::read(char *buf, std::size_t len, const Deadline &deadline) {
  ++_probe->nbReads;
  if (_probe->closed) {
    throw_error_code(EBADF, "read on closed MemoryStream");
  }
  if (_inbound.empty()) {
    switch (_atEnd) {
      case AtEnd::Eof:
        return 0;
      case AtEnd::Stall:
        if (deadline.isNever()) {
          throw_error_code(ETIMEDOUT, "MemoryStream stalled without deadline");
        }
        std::this_thread::sleep_until(deadline.at());
        throw HttpClientError(ErrorKind::Timeout, "timed out waiting for response bytes");
      default:
        throw_error_code(ECONNRESET, "MemoryStream reset");
    }
  }
  auto &front = _inbound.front();
  const auto nb = std::min(len, front.size());
  std::memcpy(buf, front.data(), nb);
  front.erase(0, nb);
  if (front.empty()) {
    _inbound.pop_front();
  }
  return nb;
}

void MemoryStream::writeAll(std::string_view data, [[maybe_unused]] const Deadline &deadline) {
  if (_probe->closed) {
    throw_error_code(EBADF, "write on closed MemoryStream");
  }
  if (_failWritesAfter) {
    const auto room = *_failWritesAfter - std::min(*_failWritesAfter, _probe->outbound.size());
    const auto accepted = std::min(data.size(), room);
    _probe->outbound.append(data.substr(0, accepted));
    if (accepted < data.size()) {
      throw_error_code(EPIPE, "MemoryStream write failure");
    }
    return;
  }
  _probe->outbound.append(data);
}

void MemoryConnector::push(std::unique_ptr<MemoryStream> stream) {
  std::scoped_lock lock(_mutex);
  _script.emplace_back(std::move(stream));
}

void MemoryConnector::pushError(std::exception_ptr error) {
  std::scoped_lock lock(_mutex);
  _script.emplace_back(std::move(error));
}

std::unique_ptr<Stream> MemoryConnector::connect(const Uri &uri, [[maybe_unused]] const Deadline &deadline) {
  std::variant<std::unique_ptr<MemoryStream>, std::exception_ptr> next;
  std::chrono::milliseconds delay;
  {
    std::scoped_lock lock(_mutex);
    _targets.push_back(uri.hostAndPort());
    if (_script.empty()) {
      throw HttpClientError(ErrorKind::Connect, "no more scripted connections");
    }
    next = std::move(_script.front());
    _script.pop_front();
    delay = _connectDelay;
  }
  if (delay.count() > 0) {
    std::this_thread::sleep_for(delay);
  }
  if (auto *error = std::get_if<std::exception_ptr>(&next)) {
    std::rethrow_exception(*error);
  }
  return std::move(std::get<std::unique_ptr<MemoryStream>>(next));
}

std::size_t MemoryConnector::nbConnects() const {
  std::scoped_lock lock(_mutex);
  return _targets.size();
}

std::vector<std::string> MemoryConnector::targets() const {
  std::scoped_lock lock(_mutex);
  return _targets;
}

}  // namespace ferry::test
