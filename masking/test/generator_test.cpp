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

#include "masking/generator.hpp"
#include "masking/random.hpp"

#include <stdexcept>
#include <string>

namespace {

using namespace masking;

TEST(generator, known_types) {
  const auto& types = generatorTypes();
  ASSERT_EQ(5u, types.size());
  for (const auto& type : types) {
    auto generator = makeGenerator(type);
    ASSERT_EQ(type, generator->name());
  }
}

TEST(generator, unknown_type) {
  ASSERT_THROW(makeGenerator("ssn"), std::invalid_argument);
  ASSERT_THROW(makeGenerator(""), std::invalid_argument);
}

TEST(generator, generated_codes_are_valid) {
  seedThreadLocalPrng(5);
  for (const auto& type : generatorTypes()) {
    auto generator = makeGenerator(type);
    for (auto i = 0; i < 100; ++i) {
      const auto code = generator->generate();
      ASSERT_TRUE(generator->isValid(code)) << type << ": " << code;
      ASSERT_FALSE(generator->check(code).has_value());
    }
  }
}

TEST(generator, bank_account_options) {
  GeneratorOptions options;
  options.bank_code = "2100";
  options.branch_code = "0418";
  options.account_number = "0200051332";
  ASSERT_EQ("21000418450200051332", makeGenerator("bban", options)->generate());
  ASSERT_EQ("ES9121000418450200051332", makeGenerator("iban", options)->generate());
}

TEST(generator, default_bank_is_ing) {
  seedThreadLocalPrng(6);
  const auto code = makeGenerator("iban")->generate();
  ASSERT_EQ("14650000", code.substr(4, 8));
}

TEST(generator, check_reports_the_failure) {
  auto iban = makeGenerator("iban");
  const auto reason = iban->check("ES9221000418450200051332");
  ASSERT_TRUE(reason.has_value());
  ASSERT_EQ(0u, reason->find("check digit: "));

  auto bban = makeGenerator("bban");
  const auto length = bban->check("123");
  ASSERT_TRUE(length.has_value());
  ASSERT_EQ(0u, length->find("length: "));
}

TEST(generator, national_id_kinds) {
  auto dni = makeGenerator("dni");
  auto nie = makeGenerator("nie");
  auto any = makeGenerator("national-id");

  ASSERT_TRUE(dni->isValid("12345678Z"));
  ASSERT_FALSE(dni->isValid("X1234567L"));
  ASSERT_TRUE(nie->isValid("X1234567L"));
  ASSERT_FALSE(nie->isValid("12345678Z"));
  ASSERT_TRUE(any->isValid("12345678Z"));
  ASSERT_TRUE(any->isValid("X1234567L"));
  ASSERT_FALSE(any->isValid("12345678A"));

  seedThreadLocalPrng(8);
  for (auto i = 0; i < 100; ++i) {
    const auto national = dni->generate();
    ASSERT_TRUE(national[0] >= '0' && national[0] <= '9') << national;
    const auto foreign = nie->generate();
    ASSERT_TRUE(foreign[0] == 'X' || foreign[0] == 'Y' || foreign[0] == 'Z') << foreign;
  }
}

TEST(generator, invalid_options_fail_on_generate) {
  GeneratorOptions options;
  options.bank_code = "9999";
  auto bban = makeGenerator("bban", options);
  ASSERT_ANY_THROW(bban->generate());
}

}  // namespace
