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

#include "ToolCommands.hpp"

#include "Logger.hpp"
#include "string.hpp"
#include "masking/es/bank_registry.hpp"

static auto logger = logging::getLogger("masking.tools.commands");

namespace masking::tools {

int generateCodes(std::ostream& out,
                  const ToolConfig& config,
                  const GeneratorOptions& options,
                  const std::string& type) {
  auto generator = makeGenerator(type == "national-id" ? nationalIdGeneratorType(config) : type, options);
  for (std::uint32_t i = 0; i < config.count; ++i) {
    out << generator->generate() << std::endl;
  }
  LOG_DEBUG(logger, "generated " << config.count << " codes of type " << generator->name());
  return 0;
}

int validateCodes(std::ostream& out, const std::string& type, const std::vector<std::string>& codes) {
  auto generator = makeGenerator(type);
  int status = 0;
  for (const auto& code : codes) {
    auto reason = generator->check(util::compact(code));
    if (reason) {
      out << code << ": " << *reason << std::endl;
      status = 1;
    } else {
      out << code << ": OK" << std::endl;
    }
  }
  return status;
}

int listBanks(std::ostream& out) {
  for (const auto& [code, bank] : es::BankRegistry::instance().entries()) {
    out << code << " " << bank.bic << " " << bank.name << std::endl;
  }
  return 0;
}

}  // namespace masking::tools
