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

#include "ToolConfiguration.hpp"

#include <sstream>
#include <stdexcept>

#include "Logger.hpp"

static auto logger = logging::getLogger("masking.tools.configuration");

namespace masking::tools {

// Copy a value from the YAML node to `out`.
// Throws an exception if no value could be read but the value is required.
template <typename T>
static void readYamlField(const YAML::Node& yaml, const std::string& index, T& out, bool value_required = false) {
  if (!yaml[index]) {
    if (value_required) {
      std::ostringstream msg;
      msg << "Failed to read \"" << index << "\"";
      throw std::runtime_error(msg.str());
    }
    LOG_INFO(logger, "No value found for \"" << index << "\"");
    return;
  }
  try {
    out = yaml[index].as<T>();
  } catch (const YAML::Exception& e) {
    // We ignore the YAML exceptions because they aren't useful
    std::ostringstream msg;
    msg << "Failed to read \"" << index << "\"";
    throw std::runtime_error(msg.str());
  }
}

static void readYamlField(const YAML::Node& yaml, const std::string& index, std::optional<std::uint64_t>& out) {
  std::uint64_t value = 0;
  if (!yaml[index]) {
    LOG_INFO(logger, "No value found for \"" << index << "\"");
    return;
  }
  readYamlField(yaml, index, value, true);
  out = value;
}

void parseConfigFile(ToolConfig& config, const YAML::Node& yaml) {
  if (!yaml.IsMap()) throw std::runtime_error("configuration must be a YAML map");

  readYamlField(yaml, "bank_code", config.bank_code);
  readYamlField(yaml, "branch_code", config.branch_code);
  readYamlField(yaml, "count", config.count);
  readYamlField(yaml, "seed", config.seed);
  readYamlField(yaml, "national_id_kind", config.national_id_kind);
  readYamlField(yaml, "log_config", config.log_config);

  checkConfig(config);
}

void checkConfig(const ToolConfig& config) {
  if (config.count == 0) throw std::runtime_error("\"count\" must be greater than 0");
  // validates the value
  (void)nationalIdGeneratorType(config);
}

std::string nationalIdGeneratorType(const ToolConfig& config) {
  if (config.national_id_kind == "any") return "national-id";
  if (config.national_id_kind == "national") return "dni";
  if (config.national_id_kind == "foreign") return "nie";
  throw std::runtime_error("\"national_id_kind\" must be national, foreign or any: " + config.national_id_kind);
}

}  // namespace masking::tools
