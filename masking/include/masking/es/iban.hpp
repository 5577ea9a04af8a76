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

#include "masking/es/bban.hpp"

namespace masking::es {

// Spanish International Bank Account Number: "ES" + 2 check digits (ISO 13616, modulus 97) + the 20 digit BBAN.
class Iban {
 public:
  static constexpr std::size_t kLength = 24;
  static constexpr const char* kCountryCode = "ES";

  /**
   * Generates the inner BBAN (see Bban::generate) and prefixes it with the country code and its check digits.
   *
   * @throws std::invalid_argument, UnknownBankError as Bban::generate.
   */
  static Iban generate(const std::string& bankCode,
                       const std::string& branchCode,
                       const std::optional<std::string>& accountNumber = std::nullopt);

  /**
   * Checks length, country and international check digits, then validates the trailing 20 characters as a BBAN.
   *
   * @throws LengthError, CountryError, FormatError, CheckDigitError and whatever Bban::validate throws.
   */
  static Iban validate(const std::string& code);

  static bool isValid(const std::string& code);

  /**
   * Check digits of `code`, a country code, two placeholder characters (ignored) and the BBAN:
   * the country code and "00" move to the end, letters become numbers (A = 10 ... Z = 35) and the result is
   * 98 - (number mod 97), zero padded to two digits.
   *
   * @throws FormatError if `code` is shorter than 5 characters or has a non alphanumeric character.
   */
  static std::string computeCheckDigits(const std::string& code);

  const std::string& countryCode() const { return country_code_; }
  const std::string& checkDigits() const { return check_digits_; }
  const Bban& bban() const { return bban_; }
  const std::string& bic() const { return bban_.bank().bic; }

  // The 24 characters.
  std::string toString() const;
  // "ES91 2100 0418 4502 0005 1332"
  std::string formatted() const;

  bool operator==(const Iban& other) const;
  bool operator!=(const Iban& other) const { return !(*this == other); }

 private:
  explicit Iban(Bban bban);

  std::string country_code_;
  std::string check_digits_;
  Bban bban_;
};

std::ostream& operator<<(std::ostream& os, const Iban& iban);

}  // namespace masking::es
