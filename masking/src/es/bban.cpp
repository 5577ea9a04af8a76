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

#include "masking/es/bban.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

#include "Logger.hpp"
#include "assertUtils.hpp"
#include "masking/checksum.hpp"
#include "masking/errors.hpp"
#include "masking/random.hpp"
#include "string.hpp"

namespace masking::es {

static auto logger = logging::getLogger("masking.es.bban");

namespace {

const std::vector<std::uint32_t> kBranchWeights = {4, 8, 5, 10, 9, 7, 3, 6};
const std::vector<std::uint32_t> kAccountWeights = {1, 2, 4, 8, 5, 10, 9, 7, 3, 6};

void checkArgument(const std::string& value, std::size_t length, const char* field) {
  if (value.size() != length || !util::isDigits(value)) {
    throw std::invalid_argument{std::string{field} + " must be " + std::to_string(length) + " digits: " + value};
  }
}

}  // namespace

Bban::Bban(std::string bankCode, std::string branchCode, std::string accountNumber)
    : bank_code_{std::move(bankCode)}, branch_code_{std::move(branchCode)}, account_number_{std::move(accountNumber)} {
  branch_check_digit_ = computeBranchCheckDigit(bank_code_, branch_code_);
  account_check_digit_ = computeAccountCheckDigit(account_number_);
}

Bban Bban::generate(const std::string& bankCode,
                    const std::string& branchCode,
                    const std::optional<std::string>& accountNumber) {
  checkArgument(bankCode, kBankCodeLength, "bank code");
  checkArgument(branchCode, kBranchCodeLength, "branch code");
  if (accountNumber) checkArgument(*accountNumber, kAccountNumberLength, "account number");
  if (!BankRegistry::instance().contains(bankCode)) {
    throw UnknownBankError{"Unknown bank code: " + bankCode};
  }

  auto bban = Bban{bankCode, branchCode, accountNumber ? *accountNumber : randomNumericString(kAccountNumberLength)};
  LOG_TRACE(logger, "generated: " << bban);
  return bban;
}

Bban Bban::validate(const std::string& code) {
  if (code.size() != kLength) {
    const auto msg = "Spanish BBAN always contains exactly " + std::to_string(kLength) +
                     " chars, current: " + std::to_string(code.size()) + " (" + code + ")";
    LOG_DEBUG(logger, msg);
    throw LengthError{msg};
  }

  auto bank = code.substr(0, kBankCodeLength);
  auto branch = code.substr(4, kBranchCodeLength);
  const auto branchCheckDigit = code[8];
  const auto accountCheckDigit = code[9];
  auto account = code.substr(10, kAccountNumberLength);

  if (!BankRegistry::instance().contains(bank)) {
    LOG_DEBUG(logger, "unknown bank code: " << bank);
    throw UnknownBankError{"Unknown bank code: " + bank};
  }

  if (!util::isDigits(code)) {
    LOG_DEBUG(logger, "non-numeric BBAN: " << code);
    throw FormatError{"A Spanish BBAN only contains digits: " + code};
  }

  const auto expectedBranchCheckDigit = computeBranchCheckDigit(bank, branch);
  if (branchCheckDigit != expectedBranchCheckDigit) {
    const auto msg = std::string{"The bank/branch check digit is incorrect: "} + branchCheckDigit +
                     " (expected: " + expectedBranchCheckDigit + ")";
    LOG_DEBUG(logger, msg);
    throw BranchCheckDigitError{msg};
  }

  const auto expectedAccountCheckDigit = computeAccountCheckDigit(account);
  if (accountCheckDigit != expectedAccountCheckDigit) {
    const auto msg = std::string{"The account check digit is incorrect: "} + accountCheckDigit +
                     " (expected: " + expectedAccountCheckDigit + ")";
    LOG_DEBUG(logger, msg);
    throw AccountCheckDigitError{msg};
  }

  auto bban = Bban{std::move(bank), std::move(branch), std::move(account)};
  MaskingAssertEQ(bban.toString(), code);
  return bban;
}

bool Bban::isValid(const std::string& code) {
  try {
    validate(code);
  } catch (const ValidationError&) {
    return false;
  }
  return true;
}

char Bban::computeBranchCheckDigit(const std::string& bankCode, const std::string& branchCode) {
  return elevenComplement(weightedModulus(bankCode + branchCode, kBranchWeights));
}

char Bban::computeAccountCheckDigit(const std::string& accountNumber) {
  return elevenComplement(weightedModulus(accountNumber, kAccountWeights));
}

const BankEntry& Bban::bank() const {
  const auto* entry = BankRegistry::instance().find(bank_code_);
  MaskingAssert(entry != nullptr);
  return *entry;
}

std::string Bban::toString() const {
  return bank_code_ + branch_code_ + branch_check_digit_ + account_check_digit_ + account_number_;
}

std::string Bban::formatted() const {
  return bank_code_ + ' ' + branch_code_ + ' ' + branch_check_digit_ + account_check_digit_ + ' ' + account_number_;
}

bool Bban::operator==(const Bban& other) const {
  return bank_code_ == other.bank_code_ && branch_code_ == other.branch_code_ &&
         branch_check_digit_ == other.branch_check_digit_ && account_check_digit_ == other.account_check_digit_ &&
         account_number_ == other.account_number_;
}

std::ostream& operator<<(std::ostream& os, const Bban& bban) { return os << bban.formatted(); }

}  // namespace masking::es
