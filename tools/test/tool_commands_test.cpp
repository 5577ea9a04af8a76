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

#include "ToolCommands.hpp"
#include "masking/es/bank_registry.hpp"
#include "masking/es/iban.hpp"
#include "masking/es/national_id.hpp"
#include "masking/random.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using masking::GeneratorOptions;
using masking::es::Iban;
using masking::es::NationalId;
using masking::tools::generateCodes;
using masking::tools::listBanks;
using masking::tools::ToolConfig;
using masking::tools::validateCodes;

std::vector<std::string> lines(const std::string& text) {
  std::vector<std::string> result;
  std::istringstream in(text);
  for (std::string line; std::getline(in, line);) result.push_back(line);
  return result;
}

TEST(tool_commands_test, validate_mixed_codes) {
  std::ostringstream out;
  const auto status =
      validateCodes(out, "iban", {"ES9121000418450200051332", "ES9221000418450200051332", "ES91"});
  ASSERT_EQ(1, status);
  const auto printed = lines(out.str());
  ASSERT_EQ(3u, printed.size());
  ASSERT_EQ("ES9121000418450200051332: OK", printed[0]);
  ASSERT_EQ("ES9221000418450200051332: check digit: The check digit is incorrect: 92 (expected: 91)", printed[1]);
  ASSERT_EQ(0u, printed[2].find("ES91: length: "));
}

TEST(tool_commands_test, validate_all_valid) {
  std::ostringstream out;
  ASSERT_EQ(0, validateCodes(out, "bban", {"21000418450200051332", "14650000550000000001"}));
  ASSERT_EQ("21000418450200051332: OK\n14650000550000000001: OK\n", out.str());
}

TEST(tool_commands_test, validate_compacts_input) {
  std::ostringstream out;
  ASSERT_EQ(0, validateCodes(out, "iban", {"es91 2100 0418 4502 0005 1332", " ES81 1465 0000 5500 0000 0001\t"}));
  const auto printed = lines(out.str());
  ASSERT_EQ(2u, printed.size());
  // the code is echoed as it was given
  ASSERT_EQ("es91 2100 0418 4502 0005 1332: OK", printed[0]);
  ASSERT_EQ(" ES81 1465 0000 5500 0000 0001\t: OK", printed[1]);

  std::ostringstream ids;
  ASSERT_EQ(0, validateCodes(ids, "national-id", {"12345678z", "x1234567l"}));
  ASSERT_EQ("12345678z: OK\nx1234567l: OK\n", ids.str());
}

TEST(tool_commands_test, validate_national_id_kind) {
  std::ostringstream out;
  ASSERT_EQ(1, validateCodes(out, "dni", {"12345678Z", "X1234567L", "12345678A"}));
  const auto printed = lines(out.str());
  ASSERT_EQ(3u, printed.size());
  ASSERT_EQ("12345678Z: OK", printed[0]);
  ASSERT_EQ("X1234567L: not a national identity number", printed[1]);
  ASSERT_EQ("12345678A: invalid national identity number", printed[2]);
}

TEST(tool_commands_test, unknown_type) {
  std::ostringstream out;
  ASSERT_THROW(validateCodes(out, "ssn", {"123"}), std::invalid_argument);
  ASSERT_THROW(generateCodes(out, ToolConfig{}, GeneratorOptions{}, "ssn"), std::invalid_argument);
  ASSERT_TRUE(out.str().empty());
}

TEST(tool_commands_test, generate_prints_count_codes) {
  masking::seedThreadLocalPrng(2024);
  ToolConfig config;
  config.count = 7;
  std::ostringstream out;
  ASSERT_EQ(0, generateCodes(out, config, GeneratorOptions{}, "iban"));
  const auto printed = lines(out.str());
  ASSERT_EQ(7u, printed.size());
  for (const auto& code : printed) {
    ASSERT_TRUE(Iban::isValid(code)) << code;
    ASSERT_EQ(0u, code.find("ES")) << code;
    ASSERT_EQ("14650000", code.substr(4, 8)) << code;
  }
}

TEST(tool_commands_test, generate_with_fixed_account) {
  ToolConfig config;
  config.count = 2;
  GeneratorOptions options;
  options.account_number = "0000000001";
  std::ostringstream out;
  ASSERT_EQ(0, generateCodes(out, config, options, "bban"));
  ASSERT_EQ("14650000550000000001\n14650000550000000001\n", out.str());
}

TEST(tool_commands_test, generate_national_id_follows_configured_kind) {
  ToolConfig config;
  config.count = 50;
  config.national_id_kind = "foreign";
  std::ostringstream out;
  ASSERT_EQ(0, generateCodes(out, config, GeneratorOptions{}, "national-id"));
  const auto printed = lines(out.str());
  ASSERT_EQ(50u, printed.size());
  for (const auto& code : printed) {
    ASSERT_TRUE(NationalId::validate(code)) << code;
    ASSERT_NE(std::string::npos, std::string{"XYZ"}.find(code[0])) << code;
  }
}

TEST(tool_commands_test, list_banks) {
  std::ostringstream out;
  ASSERT_EQ(0, listBanks(out));
  const auto printed = lines(out.str());
  ASSERT_EQ(masking::es::BankRegistry::instance().size(), printed.size());
  ASSERT_EQ("0003 BDEPESM1XXX BANCO-DEPOSITOS", printed.front());
  ASSERT_EQ("9000 ESPBESMMXXX BANCO-DE-ESPANA", printed.back());
}

}  // namespace
