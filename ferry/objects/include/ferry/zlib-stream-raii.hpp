#pragma once

#include <zlib.h>

#include <cstdint>

namespace ferry {

// z_stream initialized for inflation, released on destruction.
struct ZStreamRAII {
  enum class Variant : int8_t { gzip, deflate };

  // Throws std::runtime_error on failure.
  explicit ZStreamRAII(Variant variant);

  ZStreamRAII(const ZStreamRAII&) = delete;
  ZStreamRAII(ZStreamRAII&&) noexcept = delete;
  ZStreamRAII& operator=(const ZStreamRAII&) = delete;
  ZStreamRAII& operator=(ZStreamRAII&&) noexcept = delete;

  ~ZStreamRAII();

  z_stream stream{};
};

}  // namespace ferry
