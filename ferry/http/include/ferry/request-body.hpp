#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <variant>

namespace ferry {

// Producer of a streamed request body.
class BodyReader {
 public:
  virtual ~BodyReader() = default;

  // Reads up to 'dst.size()' bytes into 'dst'. Returns the number of bytes read, 0 at the end of the body.
  // A producer aborts the upload by throwing: a std::system_error is reported as a user abort,
  // any other exception as a body transfer failure.
  virtual std::size_t read(std::span<char> dst) = 0;

  // Total size of the body if known in advance.
  [[nodiscard]] virtual std::optional<uint64_t> size() const { return std::nullopt; }
};

// Body of a request: empty, an owned byte string, or a stream produced by a BodyReader.
// Only empty and owned bodies are reusable, ie. they can be sent again from the start on a retry or a redirect.
class RequestBody {
 public:
  RequestBody() noexcept = default;

  static RequestBody Empty() noexcept { return {}; }

  static RequestBody FromString(std::string data);

  static RequestBody FromReader(std::unique_ptr<BodyReader> reader);

  // Reads the next bytes of the body. Returns 0 at the end.
  std::size_t read(std::span<char> dst);

  // Rewinds the body to its start if it is reusable.
  // Returns true if the body can be sent again, false if it is a stream.
  bool reuse() noexcept;

  [[nodiscard]] bool reusable() const noexcept { return !std::holds_alternative<Stream>(_body); }

  [[nodiscard]] bool isStream() const noexcept { return std::holds_alternative<Stream>(_body); }

  // Size of the whole body, if known.
  [[nodiscard]] std::optional<uint64_t> knownSize() const;

 private:
  struct Slice {
    std::string data;
    std::size_t pos{0};
  };

  using Stream = std::unique_ptr<BodyReader>;

  std::variant<std::monostate, Slice, Stream> _body;
};

}  // namespace ferry
