/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <gtest/gtest.h>
#include "common/buffer.hpp"
#include "testutil/outcome.hpp"

using namespace merklechain::common;
using namespace merklechain::common::literals;
using namespace std::string_literals;

/**
 * @given Array of bytes
 * @when hex it
 * @then hex matches expected encoding
 */
TEST(Common, Hexutil_Hex) {
  Buffer bin{0x00, 0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0xff};
  ASSERT_EQ(hex_upper(bin), "00010204081020FF"s);
  ASSERT_EQ(hex_lower(bin), "00010204081020ff"s);
}

/**
 * @given Hexencoded string of even length
 * @when unhex
 * @then no exception, result matches expected value
 */
TEST(Common, Hexutil_UnhexEven) {
  EXPECT_OUTCOME_TRUE(actual, unhex("00010204081020ff"));
  std::vector<uint8_t> expected{0x00, 0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0xff};
  ASSERT_EQ(actual, expected);
}

/**
 * @given Hexencoded string of odd length
 * @when unhex
 * @then unhex result contains error
 */
TEST(Common, Hexutil_UnhexOdd) {
  EXPECT_EC(unhex("0"), UnhexError::NOT_ENOUGH_INPUT);
}

/**
 * @given Hexencoded string with non-hex letter
 * @when unhex
 * @then unhex result contains error
 */
TEST(Common, Hexutil_UnhexInvalid) {
  EXPECT_EC(unhex("keks"), UnhexError::NON_HEX_INPUT);
}

/**
 * @given Hexencoded string with and without 0x prefix
 * @when unhexWith0x
 * @then only the prefixed one is decoded
 */
TEST(Common, Hexutil_UnhexWith0x) {
  EXPECT_OUTCOME_TRUE(actual, unhexWith0x("0x0a0B"));
  ASSERT_EQ(Buffer{actual}, "0a0b"_hex2buf);
  EXPECT_EC(unhexWith0x("0a0b"), UnhexError::MISSING_0X_PREFIX);
}
