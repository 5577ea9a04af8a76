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

#include "masking/es/national_id.hpp"

#include <utility>

#include "Logger.hpp"
#include "assertUtils.hpp"
#include "masking/random.hpp"
#include "string.hpp"

namespace masking::es {

namespace {

constexpr const char* kCheckLetters = "TRWAGMYFPDXBNJZSQVHLCKE";
constexpr const char* kForeignPrefixes = "XYZ";
constexpr std::size_t kNationalDigits = 8;
constexpr std::size_t kForeignDigits = 7;
constexpr std::uint32_t kPrefixWeight = 10000000;

// X -> 0, Y -> 1, Z -> 2
std::optional<std::uint32_t> prefixIndex(char c) {
  for (std::uint32_t i = 0; kForeignPrefixes[i] != '\0'; ++i) {
    if (kForeignPrefixes[i] == c) return i;
  }
  return std::nullopt;
}

std::uint32_t numericValue(const std::optional<char>& prefix, const std::string& number) {
  const auto body = static_cast<std::uint32_t>(std::stoul(number));
  return prefix ? *prefixIndex(*prefix) * kPrefixWeight + body : body;
}

}  // namespace

NationalId::NationalId(Kind kind, std::optional<char> prefix, std::string number)
    : kind_{kind}, prefix_{prefix}, number_{std::move(number)} {
  check_letter_ = computeCheckLetter(numericValue(prefix_, number_));
}

NationalId NationalId::generate(std::optional<Kind> kind) {
  if (!kind) {
    kind = randomNumber(0, 1) == 0 ? Kind::National : Kind::Foreign;
  }

  auto id = (*kind == Kind::National)
                ? NationalId{Kind::National, std::nullopt, randomNumericString(kNationalDigits)}
                : NationalId{Kind::Foreign, kForeignPrefixes[randomNumber(0, 2)], randomNumericString(kForeignDigits)};

  const auto code = id.toString();
  LOG_TRACE(NATIONAL_ID_LOG, "generated: " << code << " kind: " << *kind);
  MaskingAssert(validate(code));
  return id;
}

bool NationalId::validate(const std::string& code) { return parse(code).has_value(); }

std::optional<NationalId> NationalId::parse(const std::string& code) {
  if (code.size() != kLength) {
    LOG_DEBUG(NATIONAL_ID_LOG, "must be " << kLength << " characters long: " << code);
    return std::nullopt;
  }

  const auto foreign = prefixIndex(code[0]).has_value();
  const auto number = foreign ? code.substr(1, kForeignDigits) : code.substr(0, kNationalDigits);
  if (!util::isDigits(number)) {
    LOG_DEBUG(NATIONAL_ID_LOG, "malformed number: " << code);
    return std::nullopt;
  }

  auto id = foreign ? NationalId{Kind::Foreign, code[0], number} : NationalId{Kind::National, std::nullopt, number};
  if (id.check_letter_ != code[kLength - 1]) {
    LOG_DEBUG(NATIONAL_ID_LOG,
              "wrong check letter: " << code[kLength - 1] << " (expected: " << id.check_letter_ << ") in " << code);
    return std::nullopt;
  }
  return id;
}

char NationalId::computeCheckLetter(std::uint32_t number) { return kCheckLetters[number % 23]; }

std::string NationalId::toString() const {
  std::string code;
  code.reserve(kLength);
  if (prefix_) code += *prefix_;
  code += number_;
  code += check_letter_;
  return code;
}

bool NationalId::operator==(const NationalId& other) const {
  return kind_ == other.kind_ && prefix_ == other.prefix_ && number_ == other.number_ &&
         check_letter_ == other.check_letter_;
}

const char* toString(NationalId::Kind kind) {
  switch (kind) {
    case NationalId::Kind::National:
      return "national";
    case NationalId::Kind::Foreign:
      return "foreign";
  }
  return "unknown";
}

std::ostream& operator<<(std::ostream& os, NationalId::Kind kind) { return os << toString(kind); }

std::ostream& operator<<(std::ostream& os, const NationalId& id) { return os << id.toString(); }

}  // namespace masking::es
