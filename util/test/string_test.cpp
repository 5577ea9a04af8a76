// Concord
//
// Copyright (c) 2026 VMware, Inc. All Rights Reserved.
//
// This product is licensed to you under the Apache 2.0 license (the "License").
// You may not use this product except in compliance with the Apache 2.0
// License.
//
// This product may include a number of subcomponents with separate copyright
// notices and license terms. Your use of these subcomponents is subject to the
// terms and conditions of the subcomponent's license, as noted in the LICENSE
// file.

#include "gtest/gtest.h"

#include "string.hpp"

#include <string>

namespace {

using namespace masking::util;

TEST(string, is_digits) {
  ASSERT_TRUE(isDigits("0123456789"));
  ASSERT_FALSE(isDigits(""));
  ASSERT_FALSE(isDigits("12a4"));
  ASSERT_FALSE(isDigits(" 1234"));
}

TEST(string, to_upper) {
  ASSERT_EQ("ES91", toUpper("es91"));
  ASSERT_EQ("X1234567L", toUpper("x1234567l"));
}

TEST(string, compact_strips_spaces_and_upper_cases) {
  ASSERT_EQ("ES9121000418450200051332", compact("es91 2100 0418 4502 0005 1332"));
  ASSERT_EQ("12345678Z", compact(" 12345678z\t"));
  ASSERT_TRUE(compact("   ").empty());
  ASSERT_EQ("X1234567L", compact("\tx123 4567l\n"));
}

TEST(string, zero_pad) {
  ASSERT_EQ("0000000001", zeroPad(1, 10));
  ASSERT_EQ("9999999999", zeroPad(9999999999ULL, 10));
  ASSERT_EQ("00000000", zeroPad(0, 8));
  ASSERT_EQ("123", zeroPad(123, 2));
}

}  // namespace
