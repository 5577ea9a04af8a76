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
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace masking::es {

/**
 * Spanish personal identity numbers.
 *
 * DNI (residents):          8 digits + check letter               12345678Z
 * NIE (foreign residents):  X, Y or Z + 7 digits + check letter   X1234567L
 *
 * The check letter is "TRWAGMYFPDXBNJZSQVHLCKE"[n % 23], where n is the numeric body. For a NIE the prefix letter
 * counts as the leading digit of an 8 digit number (X = 0, Y = 1, Z = 2).
 */
class NationalId {
 public:
  enum class Kind { National, Foreign };

  static constexpr std::size_t kLength = 9;

  // Picks National or Foreign with equal probability when `kind` is not given. The result always passes validate().
  static NationalId generate(std::optional<Kind> kind = std::nullopt);

  // False unless `code` is 9 characters long, well formed and its check letter matches.
  static bool validate(const std::string& code);

  static std::optional<NationalId> parse(const std::string& code);

  // Check letter of the numeric value `number` (prefix already substituted).
  static char computeCheckLetter(std::uint32_t number);

  Kind kind() const { return kind_; }
  // X, Y or Z for a NIE.
  std::optional<char> prefix() const { return prefix_; }
  // 8 digits for a DNI, 7 for a NIE.
  const std::string& number() const { return number_; }
  char checkLetter() const { return check_letter_; }

  std::string toString() const;

  bool operator==(const NationalId& other) const;
  bool operator!=(const NationalId& other) const { return !(*this == other); }

 private:
  NationalId(Kind kind, std::optional<char> prefix, std::string number);

  Kind kind_;
  std::optional<char> prefix_;
  std::string number_;
  char check_letter_;
};

const char* toString(NationalId::Kind kind);
std::ostream& operator<<(std::ostream& os, NationalId::Kind kind);
std::ostream& operator<<(std::ostream& os, const NationalId& id);

}  // namespace masking::es
