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
#include <optional>
#include <ostream>
#include <string>

#include "masking/es/bank_registry.hpp"

namespace masking::es {

/**
 * Spanish Basic Bank Account Number (CCC): 20 digits laid out as
 *
 *   bank(4) branch(4) check digits(2) account(10)
 *   2100    0418      45              0200051332
 *
 * The first check digit covers bank and branch, the second one the account number. Both are modulus 11 digits
 * and always derived from the other fields. A Bban is immutable and only obtained through generate() or validate(),
 * so every instance is a valid account number of a registered bank.
 */
class Bban {
 public:
  static constexpr std::size_t kLength = 20;
  static constexpr std::size_t kBankCodeLength = 4;
  static constexpr std::size_t kBranchCodeLength = 4;
  static constexpr std::size_t kAccountNumberLength = 10;

  /**
   * Builds the account number of `bankCode` and `branchCode`. A uniformly random account number in
   * [0, 9999999999] is drawn when `accountNumber` is not given.
   *
   * @throws std::invalid_argument if bank or branch is not 4 digits or the account number is not 10 digits.
   * @throws UnknownBankError if `bankCode` is not registered.
   */
  static Bban generate(const std::string& bankCode,
                       const std::string& branchCode,
                       const std::optional<std::string>& accountNumber = std::nullopt);

  /**
   * Parses and checks a 20 character code. Checks are applied in order: length, bank code, numeric fields,
   * bank/branch check digit, account check digit. The first failing check determines the error.
   *
   * @throws LengthError, UnknownBankError, FormatError, BranchCheckDigitError, AccountCheckDigitError
   */
  static Bban validate(const std::string& code);

  // validate() without the exception.
  static bool isValid(const std::string& code);

  // Modulus 11 digit over bank and branch, weights 4, 8, 5, 10, 9, 7, 3, 6.
  static char computeBranchCheckDigit(const std::string& bankCode, const std::string& branchCode);
  // Modulus 11 digit over the account number, weights 1, 2, 4, 8, 5, 10, 9, 7, 3, 6.
  static char computeAccountCheckDigit(const std::string& accountNumber);

  const std::string& bankCode() const { return bank_code_; }
  const std::string& branchCode() const { return branch_code_; }
  char branchCheckDigit() const { return branch_check_digit_; }
  char accountCheckDigit() const { return account_check_digit_; }
  const std::string& accountNumber() const { return account_number_; }
  const BankEntry& bank() const;

  // The 20 digits.
  std::string toString() const;
  // "2100 0418 45 0200051332"
  std::string formatted() const;

  bool operator==(const Bban& other) const;
  bool operator!=(const Bban& other) const { return !(*this == other); }

 private:
  Bban(std::string bankCode, std::string branchCode, std::string accountNumber);

  std::string bank_code_;
  std::string branch_code_;
  char branch_check_digit_;
  char account_check_digit_;
  std::string account_number_;
};

std::ostream& operator<<(std::ostream& os, const Bban& bban);

}  // namespace masking::es
