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

#include "masking/errors.hpp"

namespace masking {

const char* toString(ErrorCode code) {
  switch (code) {
    case ErrorCode::Length:
      return "length";
    case ErrorCode::Format:
      return "format";
    case ErrorCode::UnknownBank:
      return "unknown bank";
    case ErrorCode::BranchCheckDigit:
      return "bank/branch check digit";
    case ErrorCode::AccountCheckDigit:
      return "account check digit";
    case ErrorCode::Country:
      return "country";
    case ErrorCode::CheckDigit:
      return "check digit";
  }
  return "unknown";
}

}  // namespace masking
