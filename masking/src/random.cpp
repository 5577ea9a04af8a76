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

#include "masking/random.hpp"

#include <stdexcept>

#include "string.hpp"

namespace masking {

std::mt19937_64& threadLocalPrng() {
  static thread_local std::mt19937_64 instance{std::random_device{}()};
  return instance;
}

void seedThreadLocalPrng(std::uint64_t seed) { threadLocalPrng().seed(seed); }

std::uint64_t randomNumber(std::uint64_t min, std::uint64_t max) {
  std::uniform_int_distribution<std::uint64_t> dist(min, max);
  return dist(threadLocalPrng());
}

std::string randomNumericString(std::size_t length) {
  if (length == 0U) return {};
  if (length > 19U) throw std::invalid_argument{"randomNumericString: too many digits " + std::to_string(length)};

  std::uint64_t upper = 1;
  for (std::size_t i = 0; i < length; ++i) upper *= 10U;
  return util::zeroPad(randomNumber(0, upper - 1), length);
}

}  // namespace masking
