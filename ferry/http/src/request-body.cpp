#include "ferry/request-body.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>

namespace ferry {

RequestBody RequestBody::FromString(std::string data) {
  RequestBody body;
  body._body = Slice{std::move(data), 0};
  return body;
}

RequestBody RequestBody::FromReader(std::unique_ptr<BodyReader> reader) {
  if (!reader) {
    throw std::invalid_argument("RequestBody::FromReader expects a non null reader");
  }
  RequestBody body;
  body._body = std::move(reader);
  return body;
}

std::size_t RequestBody::read(std::span<char> dst) {
  if (auto *slice = std::get_if<Slice>(&_body)) {
    const std::size_t nbBytes = std::min(dst.size(), slice->data.size() - slice->pos);
    std::memcpy(dst.data(), slice->data.data() + slice->pos, nbBytes);
    slice->pos += nbBytes;
    return nbBytes;
  }
  if (auto *stream = std::get_if<Stream>(&_body)) {
    return (*stream)->read(dst);
  }
  return 0;
}

bool RequestBody::reuse() noexcept {
  if (auto *slice = std::get_if<Slice>(&_body)) {
    slice->pos = 0;
  }
  return reusable();
}

std::optional<uint64_t> RequestBody::knownSize() const {
  if (const auto *slice = std::get_if<Slice>(&_body)) {
    return slice->data.size();
  }
  if (const auto *stream = std::get_if<Stream>(&_body)) {
    return (*stream)->size();
  }
  return uint64_t{0};
}

}  // namespace ferry
