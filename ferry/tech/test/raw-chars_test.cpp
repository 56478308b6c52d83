#include "ferry/raw-chars.hpp"

#include <gtest/gtest.h>

#include <cstring>
#include <string_view>
#include <utility>

namespace ferry {

TEST(RawChars, DefaultConstructor) {
  RawChars buf;
  EXPECT_EQ(buf.size(), 0);
  EXPECT_TRUE(buf.empty());
  EXPECT_EQ(buf.data(), nullptr);
  EXPECT_EQ(buf.begin(), buf.end());
}

TEST(RawChars, CapacityConstructorDoesNotSetSize) {
  RawChars buf(64);
  EXPECT_TRUE(buf.empty());
  EXPECT_EQ(buf.capacity(), 64);
  EXPECT_EQ(buf.availableCapacity(), 64);
}

TEST(RawChars, AppendGrowsExponentially) {
  RawChars buf;
  buf.append("hello");
  EXPECT_EQ(std::string_view(buf), "hello");
  const auto capacityAfterFirst = buf.capacity();
  buf.push_back(' ');
  buf.append(std::string_view("world"));
  EXPECT_EQ(std::string_view(buf), "hello world");
  EXPECT_GE(buf.capacity(), capacityAfterFirst);
}

TEST(RawChars, EraseFrontKeepsTail) {
  RawChars buf(std::string_view("HTTP/1.1 200 OK\r\n\r\nbody"));
  buf.erase_front(19);
  EXPECT_EQ(std::string_view(buf), "body");
  buf.erase_front(0);
  EXPECT_EQ(std::string_view(buf), "body");
  buf.erase_front(4);
  EXPECT_TRUE(buf.empty());
}

TEST(RawChars, WriteIntoAvailableCapacity) {
  RawChars buf(8);
  buf.append("ab");
  std::memcpy(buf.data() + buf.size(), "cdef", 4);
  buf.addSize(4);
  EXPECT_EQ(std::string_view(buf), "abcdef");
  buf.setSize(1);
  EXPECT_EQ(std::string_view(buf), "a");
}

TEST(RawChars, CopyAndMove) {
  RawChars buf(std::string_view("payload"));
  RawChars copy(buf);
  EXPECT_EQ(copy, buf);

  const char *oldPtr = buf.data();
  RawChars moved(std::move(buf));
  EXPECT_EQ(moved.data(), oldPtr);
  EXPECT_EQ(std::string_view(moved), "payload");

  RawChars other;
  other = copy;
  EXPECT_EQ(std::string_view(other), "payload");
  other = std::move(moved);
  EXPECT_EQ(std::string_view(other), "payload");
}

TEST(RawChars, EnsureAvailableCapacity) {
  RawChars buf;
  buf.ensureAvailableCapacityExponential(100);
  EXPECT_GE(buf.availableCapacity(), 100);
  buf.assign("xyz");
  EXPECT_EQ(std::string_view(buf), "xyz");
  buf.clear();
  EXPECT_TRUE(buf.empty());
}

}  // namespace ferry
