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

#include <stdexcept>
#include <string>

namespace masking {

enum class ErrorCode { Length, Format, UnknownBank, BranchCheckDigit, AccountCheckDigit, Country, CheckDigit };

const char* toString(ErrorCode code);

// Base of every failure reported while validating a code. Validation is deterministic, a failure on a given input is
// always reproducible.
class ValidationError : public std::runtime_error {
 public:
  ValidationError(ErrorCode code, const std::string& what) : std::runtime_error(what), code_(code) {}
  ErrorCode code() const { return code_; }

 private:
  ErrorCode code_;
};

// The input does not have the fixed width of its format (20 for a BBAN, 24 for an IBAN).
class LengthError : public ValidationError {
 public:
  explicit LengthError(const std::string& what) : ValidationError(ErrorCode::Length, what) {}
};

// A field that must be numeric contains something else.
class FormatError : public ValidationError {
 public:
  explicit FormatError(const std::string& what) : ValidationError(ErrorCode::Format, what) {}
};

class UnknownBankError : public ValidationError {
 public:
  explicit UnknownBankError(const std::string& what) : ValidationError(ErrorCode::UnknownBank, what) {}
};

class BranchCheckDigitError : public ValidationError {
 public:
  explicit BranchCheckDigitError(const std::string& what) : ValidationError(ErrorCode::BranchCheckDigit, what) {}
};

class AccountCheckDigitError : public ValidationError {
 public:
  explicit AccountCheckDigitError(const std::string& what) : ValidationError(ErrorCode::AccountCheckDigit, what) {}
};

class CountryError : public ValidationError {
 public:
  explicit CountryError(const std::string& what) : ValidationError(ErrorCode::Country, what) {}
};

class CheckDigitError : public ValidationError {
 public:
  explicit CheckDigitError(const std::string& what) : ValidationError(ErrorCode::CheckDigit, what) {}
};

}  // namespace masking
