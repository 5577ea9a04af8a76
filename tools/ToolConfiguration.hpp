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

#include <cstdint>
#include <optional>
#include <string>

#include <yaml-cpp/yaml.h>

namespace masking::tools {

struct ToolConfig {
  std::string bank_code = "1465";
  std::string branch_code = "0000";
  std::uint32_t count = 1;
  std::optional<std::uint64_t> seed;
  // national, foreign or any
  std::string national_id_kind = "any";
  std::string log_config = "logging.properties";
};

// Reads the keys present in `yaml` into `config`, absent keys keep their current value.
// Throws std::runtime_error on a value that cannot be converted or is out of range.
void parseConfigFile(ToolConfig& config, const YAML::Node& yaml);

// Rejects a zero `count` and an unknown `national_id_kind`. Applied again after command-line overrides.
void checkConfig(const ToolConfig& config);

// Generator type used for "national-id" according to `national_id_kind`.
std::string nationalIdGeneratorType(const ToolConfig& config);

}  // namespace masking::tools
