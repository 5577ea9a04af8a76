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

#include "masking/generator.hpp"

#include <stdexcept>
#include <utility>

#include "masking/errors.hpp"
#include "masking/es/bban.hpp"
#include "masking/es/iban.hpp"
#include "masking/es/national_id.hpp"

namespace masking {

using es::Bban;
using es::Iban;
using es::NationalId;

namespace {

template <typename Code>
class BankAccountGenerator : public IdentifierGenerator {
 public:
  BankAccountGenerator(std::string name, GeneratorOptions options)
      : name_{std::move(name)}, options_{std::move(options)} {}

  std::string name() const override { return name_; }

  std::string generate() override {
    return Code::generate(options_.bank_code, options_.branch_code, options_.account_number).toString();
  }

  std::optional<std::string> check(const std::string& code) const override {
    try {
      Code::validate(code);
    } catch (const ValidationError& e) {
      return std::string{toString(e.code())} + ": " + e.what();
    }
    return std::nullopt;
  }

 private:
  const std::string name_;
  const GeneratorOptions options_;
};

class NationalIdGenerator : public IdentifierGenerator {
 public:
  NationalIdGenerator(std::string name, std::optional<NationalId::Kind> kind)
      : name_{std::move(name)}, kind_{kind} {}

  std::string name() const override { return name_; }

  std::string generate() override { return NationalId::generate(kind_).toString(); }

  std::optional<std::string> check(const std::string& code) const override {
    const auto id = NationalId::parse(code);
    if (!id) return "invalid national identity number";
    if (kind_ && id->kind() != *kind_) return std::string{"not a "} + toString(*kind_) + " identity number";
    return std::nullopt;
  }

 private:
  const std::string name_;
  const std::optional<NationalId::Kind> kind_;
};

}  // namespace

const std::vector<std::string>& generatorTypes() {
  static const std::vector<std::string> types = {"bban", "iban", "dni", "nie", "national-id"};
  return types;
}

std::unique_ptr<IdentifierGenerator> makeGenerator(const std::string& type, const GeneratorOptions& options) {
  if (type == "bban") return std::make_unique<BankAccountGenerator<Bban>>(type, options);
  if (type == "iban") return std::make_unique<BankAccountGenerator<Iban>>(type, options);
  if (type == "dni") return std::make_unique<NationalIdGenerator>(type, NationalId::Kind::National);
  if (type == "nie") return std::make_unique<NationalIdGenerator>(type, NationalId::Kind::Foreign);
  if (type == "national-id") return std::make_unique<NationalIdGenerator>(type, std::nullopt);
  throw std::invalid_argument{"unknown identifier type: " + type};
}

}  // namespace masking
