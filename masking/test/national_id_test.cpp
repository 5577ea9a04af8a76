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

#include "masking/es/national_id.hpp"
#include "masking/random.hpp"

#include <string>

namespace {

using namespace masking;
using namespace masking::es;

constexpr const char* kLetters = "TRWAGMYFPDXBNJZSQVHLCKE";

TEST(national_id, check_letter_table) {
  ASSERT_EQ('T', NationalId::computeCheckLetter(0));
  ASSERT_EQ('E', NationalId::computeCheckLetter(22));
  ASSERT_EQ('T', NationalId::computeCheckLetter(23));
  ASSERT_EQ('Z', NationalId::computeCheckLetter(12345678));
}

TEST(national_id, validate_known_codes) {
  ASSERT_TRUE(NationalId::validate("12345678Z"));
  ASSERT_TRUE(NationalId::validate("00000000T"));
  ASSERT_TRUE(NationalId::validate("X1234567L"));
  ASSERT_TRUE(NationalId::validate("Y1234567X"));
  ASSERT_TRUE(NationalId::validate("Z0000000M"));
}

TEST(national_id, validate_length) {
  ASSERT_FALSE(NationalId::validate(""));
  ASSERT_FALSE(NationalId::validate("1234567Z"));
  ASSERT_FALSE(NationalId::validate("123456789Z"));
  ASSERT_FALSE(NationalId::validate("X123456L"));
}

TEST(national_id, validate_wrong_letter) {
  ASSERT_FALSE(NationalId::validate("12345678A"));
  ASSERT_FALSE(NationalId::validate("12345678z"));
  ASSERT_FALSE(NationalId::validate("X1234567M"));
}

TEST(national_id, validate_malformed) {
  ASSERT_FALSE(NationalId::validate("x1234567L"));
  ASSERT_FALSE(NationalId::validate("A1234567L"));
  ASSERT_FALSE(NationalId::validate("1234 678Z"));
  ASSERT_FALSE(NationalId::validate("XX234567L"));
}

TEST(national_id, parse_national) {
  const auto id = NationalId::parse("12345678Z");
  ASSERT_TRUE(id.has_value());
  ASSERT_EQ(NationalId::Kind::National, id->kind());
  ASSERT_FALSE(id->prefix().has_value());
  ASSERT_EQ("12345678", id->number());
  ASSERT_EQ('Z', id->checkLetter());
  ASSERT_EQ("12345678Z", id->toString());
}

TEST(national_id, parse_foreign) {
  const auto id = NationalId::parse("Y1234567X");
  ASSERT_TRUE(id.has_value());
  ASSERT_EQ(NationalId::Kind::Foreign, id->kind());
  ASSERT_EQ('Y', *id->prefix());
  ASSERT_EQ("1234567", id->number());
  ASSERT_EQ('X', id->checkLetter());
  ASSERT_EQ("Y1234567X", id->toString());
}

TEST(national_id, parse_is_idempotent) { ASSERT_EQ(NationalId::parse("X1234567L"), NationalId::parse("X1234567L")); }

TEST(national_id, prefix_x_weighs_as_zero) {
  // X stands for a leading 0, so the NIE and the DNI share the check letter
  ASSERT_TRUE(NationalId::validate("X1234567L"));
  ASSERT_TRUE(NationalId::validate("01234567L"));
}

TEST(national_id, generate_national) {
  seedThreadLocalPrng(1);
  for (auto i = 0; i < 1000; ++i) {
    const auto id = NationalId::generate(NationalId::Kind::National);
    ASSERT_EQ(NationalId::Kind::National, id.kind());
    ASSERT_EQ(8u, id.number().size());
    ASSERT_EQ(NationalId::kLength, id.toString().size());
    ASSERT_TRUE(NationalId::validate(id.toString())) << id;
  }
}

TEST(national_id, generate_foreign) {
  seedThreadLocalPrng(2);
  for (auto i = 0; i < 1000; ++i) {
    const auto id = NationalId::generate(NationalId::Kind::Foreign);
    ASSERT_EQ(NationalId::Kind::Foreign, id.kind());
    ASSERT_TRUE(id.prefix().has_value());
    ASSERT_NE(std::string::npos, std::string{"XYZ"}.find(*id.prefix()));
    ASSERT_EQ(7u, id.number().size());
    ASSERT_TRUE(NationalId::validate(id.toString())) << id;
  }
}

TEST(national_id, generate_mixes_both_kinds) {
  seedThreadLocalPrng(12345);
  auto nationals = 0;
  const auto total = 10000;
  for (auto i = 0; i < total; ++i) {
    const auto id = NationalId::generate();
    ASSERT_TRUE(NationalId::validate(id.toString())) << id;
    if (id.kind() == NationalId::Kind::National) ++nationals;
  }
  // expected 5000, standard deviation 50
  ASSERT_GT(nationals, 4500);
  ASSERT_LT(nationals, 5500);
}

TEST(national_id, generate_is_reproducible_with_seed) {
  seedThreadLocalPrng(99);
  const auto first = NationalId::generate();
  seedThreadLocalPrng(99);
  const auto second = NationalId::generate();
  ASSERT_EQ(first, second);
}

TEST(national_id, single_character_mutations_fail) {
  seedThreadLocalPrng(31337);
  const std::string digits = "0123456789";
  for (auto i = 0; i < 1000; ++i) {
    const auto code = NationalId::generate().toString();
    // numeric body
    for (auto pos = (code[0] >= '0' && code[0] <= '9') ? 0u : 1u; pos < 8u; ++pos) {
      for (const auto d : digits) {
        if (d == code[pos]) continue;
        auto mutated = code;
        mutated[pos] = d;
        ASSERT_FALSE(NationalId::validate(mutated)) << code << " -> " << mutated;
      }
    }
    // foreign prefix
    if (code[0] == 'X' || code[0] == 'Y' || code[0] == 'Z') {
      for (const auto p : std::string{"XYZ"}) {
        if (p == code[0]) continue;
        auto mutated = code;
        mutated[0] = p;
        ASSERT_FALSE(NationalId::validate(mutated)) << code << " -> " << mutated;
      }
    }
    // check letter
    for (const auto* l = kLetters; *l != '\0'; ++l) {
      if (*l == code[8]) continue;
      auto mutated = code;
      mutated[8] = *l;
      ASSERT_FALSE(NationalId::validate(mutated)) << code << " -> " << mutated;
    }
  }
}

}  // namespace
