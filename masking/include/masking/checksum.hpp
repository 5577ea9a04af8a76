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
//
// Check digit primitives shared by the bank account codes.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace masking {

// Returns sum(digits[i] * weights[i]) mod 11.
// Throws std::invalid_argument if the sequences differ in length.
std::uint32_t weightedModulus(const std::vector<std::uint32_t>& digits, const std::vector<std::uint32_t>& weights);

// Same as above over the decimal characters of `digits`. Throws std::invalid_argument on a non-digit character.
std::uint32_t weightedModulus(const std::string& digits, const std::vector<std::uint32_t>& weights);

// Maps a modulus 11 remainder (0..10) to its check digit: 11 - remainder, where 10 becomes '1' and 11 becomes '0'.
// Throws std::invalid_argument if `remainder` is greater than 10.
char elevenComplement(std::uint32_t remainder);

// Remainder of the division by 97 of an arbitrarily long decimal string, computed digit by digit so that no
// intermediate value exceeds 96 * 10 + 9. Throws std::invalid_argument on an empty or non-decimal input.
std::uint32_t mod97(const std::string& digits);

}  // namespace masking
