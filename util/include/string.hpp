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

#include <string>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iterator>
#include <utility>

namespace masking {
namespace util {

inline bool isDigits(const std::string& str) {
  return !str.empty() && str.find_first_not_of("0123456789") == std::string::npos;
}

inline std::string toUpper(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return std::toupper(c); });
  return str;
}

// Drops every whitespace character and upper-cases the rest: "es91 2100 0418" -> "ES9121000418".
inline std::string compact(const std::string& str) {
  std::string result;
  result.reserve(str.size());
  std::copy_if(str.begin(), str.end(), std::back_inserter(result), [](unsigned char c) { return !std::isspace(c); });
  return toUpper(std::move(result));
}

// Zero-pads `value` on the left up to `width` characters.
inline std::string zeroPad(std::uint64_t value, std::size_t width) {
  std::string digits = std::to_string(value);
  if (digits.size() >= width) return digits;
  return std::string(width - digits.size(), '0') + digits;
}

}  // namespace util
}  // namespace masking
