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

#include <ostream>
#include <string>
#include <vector>

#include "ToolConfiguration.hpp"
#include "masking/generator.hpp"

namespace masking::tools {

// Prints `config.count` codes of `type`, one per line. "national-id" follows `config.national_id_kind`.
// Throws std::invalid_argument for an unknown type or malformed options.
int generateCodes(std::ostream& out,
                  const ToolConfig& config,
                  const GeneratorOptions& options,
                  const std::string& type);

// Prints "CODE: OK" or "CODE: <reason>" for every code, after stripping whitespace and upper-casing it.
// Returns 1 if any code is invalid, 0 otherwise.
int validateCodes(std::ostream& out, const std::string& type, const std::vector<std::string>& codes);

// One line per registered bank: "<code> <bic> <name>".
int listBanks(std::ostream& out);

}  // namespace masking::tools
