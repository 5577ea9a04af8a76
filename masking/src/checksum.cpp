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

#include "masking/checksum.hpp"

#include <stdexcept>

namespace masking {

std::uint32_t weightedModulus(const std::vector<std::uint32_t>& digits, const std::vector<std::uint32_t>& weights) {
  if (digits.size() != weights.size()) {
    throw std::invalid_argument{"weightedModulus: " + std::to_string(digits.size()) + " digits for " +
                                std::to_string(weights.size()) + " weights"};
  }
  std::uint32_t sum = 0;
  for (std::size_t i = 0; i < digits.size(); ++i) {
    sum += digits[i] * weights[i];
  }
  return sum % 11;
}

std::uint32_t weightedModulus(const std::string& digits, const std::vector<std::uint32_t>& weights) {
  std::vector<std::uint32_t> values;
  values.reserve(digits.size());
  for (const auto c : digits) {
    if (c < '0' || c > '9') throw std::invalid_argument{"weightedModulus: not a decimal string: " + digits};
    values.push_back(static_cast<std::uint32_t>(c - '0'));
  }
  return weightedModulus(values, weights);
}

char elevenComplement(std::uint32_t remainder) {
  if (remainder > 10) throw std::invalid_argument{"elevenComplement: invalid remainder " + std::to_string(remainder)};
  const auto digit = 11 - remainder;
  if (digit == 11) return '0';
  if (digit == 10) return '1';
  return static_cast<char>('0' + digit);
}

std::uint32_t mod97(const std::string& digits) {
  if (digits.empty()) throw std::invalid_argument{"mod97: empty input"};
  std::uint32_t remainder = 0;
  for (const auto c : digits) {
    if (c < '0' || c > '9') throw std::invalid_argument{"mod97: not a decimal string: " + digits};
    remainder = (remainder * 10 + static_cast<std::uint32_t>(c - '0')) % 97;
  }
  return remainder;
}

}  // namespace masking
