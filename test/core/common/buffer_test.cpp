/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/buffer.hpp"

#include <gtest/gtest.h>

using namespace merklechain::common;
using namespace merklechain::common::literals;
using namespace std::string_literals;

/**
 * @given empty buffer
 * @when put different stuff in this buffer
 * @then result matches expectation
 */
TEST(Common, BufferPut) {
  Buffer b;
  ASSERT_EQ(b.size(), 0);
  ASSERT_EQ(b.toHex(), ""s);

  b.put("hello"s);
  ASSERT_EQ(b.size(), 5);

  b.putUint8(1);
  ASSERT_EQ(b.size(), 6);

  b.put(Buffer{1, 2, 3, 4, 5});
  ASSERT_EQ(b.size(), 11);

  ASSERT_EQ(b.toHex(), "68656c6c6f010102030405");
}

/**
 * @given buffer containing bytes {1,2,3}
 * @when put is applied with another buffer {4,5,6} as parameter
 * @then content of current buffer changes to {1,2,3,4,5,6}
 */
TEST(Common, BufferPutChaining) {
  Buffer current_buffer = {1, 2, 3};
  Buffer another_buffer = {4, 5, 6};
  auto &buffer = current_buffer.put(another_buffer);
  ASSERT_EQ(&buffer, &current_buffer);  // line to the same buffer is returned
  Buffer result = {1, 2, 3, 4, 5, 6};
  ASSERT_EQ(buffer, result);
}

/**
 * @given string with arbitrary characters
 * @when converted to buffer and back
 * @then the same string is returned
 */
TEST(Common, BufferString) {
  auto s = "ibc/clients\x01"s;
  auto b = Buffer::fromString(s);
  ASSERT_EQ(b.size(), s.size());
  ASSERT_EQ(b.asString(), s);
  ASSERT_EQ(b, "ibc/clients\x01"_buf);
}

/**
 * @given hex string
 * @when buffer created from it
 * @then bytes match and invalid hex is rejected
 */
TEST(Common, BufferFromHex) {
  auto b = Buffer::fromHex("0102ff").value();
  ASSERT_EQ(b, (Buffer{1, 2, 0xff}));
  ASSERT_EQ(b, "0102ff"_hex2buf);
  ASSERT_FALSE(Buffer::fromHex("01020"));
}

/**
 * @given buffers with a common beginning
 * @when checked with startsWith
 * @then only a real prefix matches
 */
TEST(Common, BufferViewStartsWith) {
  Buffer data{0, 1, 2, 3};
  ASSERT_TRUE(startsWith(data, Buffer{0, 1}));
  ASSERT_TRUE(startsWith(data, Buffer{}));
  ASSERT_FALSE(startsWith(data, Buffer{1}));
  ASSERT_FALSE(startsWith(Buffer{0}, data));
}

/**
 * @given byte sequences
 * @when compared as views
 * @then order is lexicographic with unsigned bytes
 */
TEST(Common, BufferViewCompare) {
  Buffer a{0x01, 0xff};
  Buffer b{0x02};
  Buffer c{0x01, 0xff, 0x00};
  ASSERT_LT(BufferView{a}, BufferView{b});
  ASSERT_LT(BufferView{a}, BufferView{c});
  ASSERT_EQ(BufferView{a}, BufferView{Buffer{0x01, 0xff}});
}

/**
 * @given empty and non-empty buffers
 * @when formatted for logs
 * @then the whole content is printed as 0x-prefixed hex
 */
TEST(Common, BufferFormat) {
  ASSERT_EQ(fmt::format("{}", Buffer{}), "<empty>");
  ASSERT_EQ(fmt::format("{}", "0102030405a0ff"_hex2buf), "0x0102030405a0ff");
  ASSERT_EQ(fmt::format("key {}", BufferView{"ab"_buf}), "key 0x6162");
}
