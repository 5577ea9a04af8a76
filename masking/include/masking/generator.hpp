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

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace masking {

struct GeneratorOptions {
  std::string bank_code = "1465";
  std::string branch_code = "0000";
  std::optional<std::string> account_number;
};

// Produces synthetic, checksum-correct codes of one type and checks externally supplied ones.
class IdentifierGenerator {
 public:
  virtual ~IdentifierGenerator() = default;

  virtual std::string name() const = 0;
  virtual std::string generate() = 0;

  // Returns why `code` is not a valid code of this type, or std::nullopt if it is.
  virtual std::optional<std::string> check(const std::string& code) const = 0;

  bool isValid(const std::string& code) const { return !check(code).has_value(); }
};

// bban, iban, dni, nie, national-id
const std::vector<std::string>& generatorTypes();

// Throws std::invalid_argument for a type not listed by generatorTypes().
std::unique_ptr<IdentifierGenerator> makeGenerator(const std::string& type, const GeneratorOptions& options = {});

}  // namespace masking
