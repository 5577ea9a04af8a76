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
#include <random>
#include <string>

namespace masking {

// Every thread owns its engine, seeded from std::random_device on first use.
std::mt19937_64& threadLocalPrng();

// Reseeds the calling thread's engine. Other threads are not affected.
void seedThreadLocalPrng(std::uint64_t seed);

// Uniformly distributed in [min, max].
std::uint64_t randomNumber(std::uint64_t min, std::uint64_t max);

// A uniformly distributed number in [0, 10^length - 1], zero-padded to `length` digits.
// Throws std::invalid_argument if `length` exceeds 19.
std::string randomNumericString(std::size_t length);

}  // namespace masking
