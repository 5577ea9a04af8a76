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

#include "masking/checksum.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace masking;

const std::vector<std::uint32_t> kBranchWeights = {4, 8, 5, 10, 9, 7, 3, 6};
const std::vector<std::uint32_t> kAccountWeights = {1, 2, 4, 8, 5, 10, 9, 7, 3, 6};

TEST(checksum, weighted_modulus_of_values) {
  // 1*4 + 4*8 + 6*5 + 5*10 = 116, 116 mod 11 = 6
  ASSERT_EQ(6u, weightedModulus(std::vector<std::uint32_t>{1, 4, 6, 5, 0, 0, 0, 0}, kBranchWeights));
}

TEST(checksum, weighted_modulus_of_string) {
  ASSERT_EQ(6u, weightedModulus("14650000", kBranchWeights));
  ASSERT_EQ(0u, weightedModulus("0000000000", kAccountWeights));
  // 2 * 6 = 12
  ASSERT_EQ(1u, weightedModulus("0000000002", kAccountWeights));
}

TEST(checksum, weighted_modulus_empty) { ASSERT_EQ(0u, weightedModulus(std::vector<std::uint32_t>{}, {})); }

TEST(checksum, weighted_modulus_length_mismatch) {
  ASSERT_THROW(weightedModulus("1465000", kBranchWeights), std::invalid_argument);
  ASSERT_THROW(weightedModulus(std::vector<std::uint32_t>{1, 2, 3}, {1, 2}), std::invalid_argument);
}

TEST(checksum, weighted_modulus_non_digit) {
  ASSERT_THROW(weightedModulus("1465000A", kBranchWeights), std::invalid_argument);
}

TEST(checksum, eleven_complement_regular_values) {
  ASSERT_EQ('9', elevenComplement(2));
  ASSERT_EQ('5', elevenComplement(6));
  ASSERT_EQ('1', elevenComplement(10));
}

TEST(checksum, eleven_complement_remainder_zero_is_zero) { ASSERT_EQ('0', elevenComplement(0)); }

TEST(checksum, eleven_complement_remainder_one_is_one) { ASSERT_EQ('1', elevenComplement(1)); }

TEST(checksum, eleven_complement_out_of_range) { ASSERT_THROW(elevenComplement(11), std::invalid_argument); }

TEST(checksum, mod97_small_numbers) {
  ASSERT_EQ(0u, mod97("0"));
  ASSERT_EQ(96u, mod97("96"));
  ASSERT_EQ(0u, mod97("97"));
  ASSERT_EQ(1u, mod97("98"));
  ASSERT_EQ(1u, mod97("0000098"));
}

TEST(checksum, mod97_beyond_64_bits) {
  // ES9121000418450200051332 rearranged: BBAN + "ES" (1428) + "91"
  ASSERT_EQ(1u, mod97("21000418450200051332142891"));
  // with "00" in place of the check digits the remainder is 98 - 91
  ASSERT_EQ(7u, mod97("21000418450200051332142800"));
}

TEST(checksum, mod97_invalid_input) {
  ASSERT_THROW(mod97(""), std::invalid_argument);
  ASSERT_THROW(mod97("12a4"), std::invalid_argument);
}

}  // namespace
