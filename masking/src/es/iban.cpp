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

#include "masking/es/iban.hpp"

#include <utility>

#include "Logger.hpp"
#include "assertUtils.hpp"
#include "masking/checksum.hpp"
#include "masking/errors.hpp"
#include "string.hpp"

namespace masking::es {

static auto logger = logging::getLogger("masking.es.iban");

namespace {

// Letters become their position in the alphabet plus 10, so "ES" turns into "1428".
std::string toNumericString(const std::string& rearranged) {
  std::string numeric;
  numeric.reserve(rearranged.size() * 2);
  for (const auto c : rearranged) {
    if (c >= '0' && c <= '9') {
      numeric += c;
    } else if (c >= 'A' && c <= 'Z') {
      numeric += std::to_string(c - 'A' + 10);
    } else {
      throw FormatError{std::string{"IBAN characters must be digits or upper case letters, found: '"} + c + "'"};
    }
  }
  return numeric;
}

}  // namespace

Iban::Iban(Bban bban) : country_code_{kCountryCode}, bban_{std::move(bban)} {
  check_digits_ = computeCheckDigits(country_code_ + "00" + bban_.toString());
}

Iban Iban::generate(const std::string& bankCode,
                    const std::string& branchCode,
                    const std::optional<std::string>& accountNumber) {
  auto iban = Iban{Bban::generate(bankCode, branchCode, accountNumber)};
  LOG_TRACE(logger, "generated: " << iban);
  return iban;
}

Iban Iban::validate(const std::string& code) {
  if (code.size() != kLength) {
    const auto msg = "Spanish IBAN always contains exactly " + std::to_string(kLength) +
                     " chars, current: " + std::to_string(code.size());
    LOG_DEBUG(logger, msg);
    throw LengthError{msg};
  }

  const auto country = code.substr(0, 2);
  const auto checkDigits = code.substr(2, 2);
  if (country != kCountryCode) {
    LOG_DEBUG(logger, "wrong country: " << country);
    throw CountryError{"This IBAN should be only for ES (Spain) accounts, found: " + country};
  }
  const auto expectedCheckDigits = computeCheckDigits(code);
  if (checkDigits != expectedCheckDigits) {
    const auto msg = "The check digit is incorrect: " + checkDigits + " (expected: " + expectedCheckDigits + ")";
    LOG_DEBUG(logger, msg);
    throw CheckDigitError{msg};
  }

  auto iban = Iban{Bban::validate(code.substr(4))};
  MaskingAssertEQ(iban.toString(), code);
  return iban;
}

bool Iban::isValid(const std::string& code) {
  try {
    validate(code);
  } catch (const ValidationError&) {
    return false;
  }
  return true;
}

std::string Iban::computeCheckDigits(const std::string& code) {
  if (code.size() < 5) {
    throw FormatError{"IBAN too short to compute its check digits: " + code};
  }
  const auto rearranged = code.substr(4) + code.substr(0, 2) + "00";
  const auto remainder = mod97(toNumericString(rearranged));
  return util::zeroPad(98 - remainder, 2);
}

std::string Iban::toString() const { return country_code_ + check_digits_ + bban_.toString(); }

std::string Iban::formatted() const {
  const auto compact = toString();
  std::string result;
  result.reserve(compact.size() + compact.size() / 4);
  for (std::size_t i = 0; i < compact.size(); ++i) {
    if (i > 0 && i % 4 == 0) result += ' ';
    result += compact[i];
  }
  return result;
}

bool Iban::operator==(const Iban& other) const {
  return country_code_ == other.country_code_ && check_digits_ == other.check_digits_ && bban_ == other.bban_;
}

std::ostream& operator<<(std::ostream& os, const Iban& iban) { return os << iban.formatted(); }

}  // namespace masking::es
