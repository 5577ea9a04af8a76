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

#include <cstddef>
#include <map>
#include <string>

namespace masking::es {

struct BankEntry {
  std::string code;  // 4 digits, zero padded
  std::string name;
  std::string bic;  // ISO 9362, may be empty
};

// Spanish banks by their 4-digit entity code. Built once, read-only afterwards, safe to share between threads.
class BankRegistry {
 public:
  static const BankRegistry& instance();

  // Returns a pointer to the entry of `code` if registered and nullptr otherwise.
  const BankEntry* find(const std::string& code) const;
  bool contains(const std::string& code) const;

  std::size_t size() const;
  const std::map<std::string, BankEntry>& entries() const;

  // Uniformly random registered bank.
  const BankEntry& randomBank() const;

 private:
  BankRegistry();

  std::map<std::string, BankEntry> banks_;
};

}  // namespace masking::es
