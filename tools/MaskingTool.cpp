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

#include "Logger.hpp"
#include <iostream>
#include <boost/program_options.hpp>

#include "ToolCommands.hpp"
#include "ToolConfiguration.hpp"
#include "masking/random.hpp"

namespace po = boost::program_options;
using masking::GeneratorOptions;
using masking::tools::ToolConfig;

// clang-format off
int main(int argc, char** argv) {
  po::options_description global{"masking_tool [OPTIONS] <generate|validate|banks> ARGS"};
  global.add_options()
  ("help", "produce a help message")
  ("config", po::value<std::string>(), "YAML configuration file path")
  ("log-config", po::value<std::string>(), "logging properties file path")
  ("seed", po::value<std::uint64_t>(), "seed of the random source, for reproducible output")
  ("count", po::value<std::uint32_t>(), "number of codes to generate")
  ("bank", po::value<std::string>(), "4-digit bank code of generated bank accounts")
  ("branch", po::value<std::string>(), "4-digit branch code of generated bank accounts")
  ("account", po::value<std::string>(), "10-digit account number of generated bank accounts");

  po::options_description command{"Command"};
  command.add_options()("command", po::value<std::string>(), "command to execute")
                       ("args", po::value<std::vector<std::string> >(), "command arguments");
  po::positional_options_description positional;
  positional.add("command", 1).add("args", -1);

  auto usage = [&global]() {
    std::cout << "Usage: " << global << std::endl
              << "Commands:" << std::endl
              << "  generate <bban|iban|dni|nie|national-id>  print COUNT synthetic codes" << std::endl
              << "  validate <type> CODE...                   check each code, exit status 1 if any is invalid"
              << std::endl
              << "  banks                                     list the registered banks" << std::endl;
  };

  po::options_description all;
  all.add(global).add(command);
  try {
    po::variables_map var_map;
    po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), var_map);
    po::notify(var_map);
    if (var_map.count("help") || !var_map.count("command")) {
      usage();
      return var_map.count("help") ? 0 : 1;
    }

    ToolConfig config;
    if (var_map.count("config")) {
      masking::tools::parseConfigFile(config, YAML::LoadFile(var_map["config"].as<std::string>()));
    }
    if (var_map.count("log-config")) config.log_config = var_map["log-config"].as<std::string>();
    logging::initLogger(config.log_config);

    if (var_map.count("seed")) config.seed = var_map["seed"].as<std::uint64_t>();
    if (var_map.count("count")) config.count = var_map["count"].as<std::uint32_t>();
    if (var_map.count("bank")) config.bank_code = var_map["bank"].as<std::string>();
    if (var_map.count("branch")) config.branch_code = var_map["branch"].as<std::string>();
    masking::tools::checkConfig(config);
    LOG_INFO(GL, "bank_code: " << config.bank_code << ", branch_code: " << config.branch_code
                               << ", count: " << config.count << ", national_id_kind: " << config.national_id_kind);
    if (config.seed) masking::seedThreadLocalPrng(*config.seed);

    GeneratorOptions options;
    options.bank_code = config.bank_code;
    options.branch_code = config.branch_code;
    if (var_map.count("account")) options.account_number = var_map["account"].as<std::string>();

    const std::string cmd = var_map["command"].as<std::string>();
    std::vector<std::string> args;
    if (var_map.count("args")) args = var_map["args"].as<std::vector<std::string> >();

    if (cmd == "generate" && args.size() == 1) {
      return masking::tools::generateCodes(std::cout, config, options, args[0]);
    } else if (cmd == "validate" && args.size() >= 2) {
      return masking::tools::validateCodes(std::cout, args[0], std::vector<std::string>(args.begin() + 1, args.end()));
    } else if (cmd == "banks" && args.empty()) {
      return masking::tools::listBanks(std::cout);
    }
    usage();
    return 1;
  } catch (const std::exception& e) {
    LOG_ERROR(GL, e.what());
    std::cerr << e.what() << std::endl;
    return 1;
  }
}
// clang-format on
