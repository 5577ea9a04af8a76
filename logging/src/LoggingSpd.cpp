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
#include <fstream>
#include <iostream>
#include <mutex>

#include "spdlog/spdlog.h"
#include "spdlog/async.h"  // support for async logging.
#include "spdlog/sinks/stdout_sinks.h"

namespace logging {

static const char* logPattern = "%Y-%m-%dT%H:%M:%S.%e|%-5l|%n|%t|%v";

bool defaultInit() {
  spdlog::init_thread_pool(65536, 1);
  spdlog::set_pattern(logPattern);
  return true;
}

Logger getLogger(const std::string& name) {
  static bool __logging_init__ = defaultInit();  // one time initialization
  (void)__logging_init__;
  static std::mutex mux;
  std::lock_guard g(mux);
  Logger theLogger = spdlog::get(name);
  if (theLogger == nullptr) {
    // stdout carries the tool's output, so log lines go to stderr
    theLogger = spdlog::stderr_logger_mt<spdlog::async_factory>(name);
  }
  return theLogger;
}

/**
 * simple configuration, one entry per line
 * log.<logger_name>:<LEVEL>
 */
void initLogger(const std::string& configFileName) {
  std::ifstream infile(configFileName);
  if (!infile.is_open()) {
    std::cerr << __PRETTY_FUNCTION__ << ": can't open " << configFileName << " using default configuration."
              << std::endl;
    return;
  }
  std::string line;
  while (std::getline(infile, line)) {
    if (line.empty() || line[0] == '#') continue;  // comment
    if (line.compare(0, 4, "log.")) continue;      // not my configuration
    line.erase(0, 4);
    if (size_t pos = line.find(':'); pos != line.npos) {
      std::string logger = line.substr(0, pos);
      std::string levelStr = line.substr(pos + 1);
      spdlog::level::level_enum level;
      if (!levelStr.compare("TRACE"))
        level = spdlog::level::trace;
      else if (!levelStr.compare("DEBUG"))
        level = spdlog::level::debug;
      else if (!levelStr.compare("INFO"))
        level = spdlog::level::info;
      else if (!levelStr.compare("WARN"))
        level = spdlog::level::warn;
      else if (!levelStr.compare("ERROR"))
        level = spdlog::level::err;
      else if (!levelStr.compare("FATAL"))
        level = spdlog::level::critical;
      else {
        std::cerr << __PRETTY_FUNCTION__ << ": ignoring invalid log level " << levelStr << std::endl;
        continue;
      }
      getLogger(logger)->set_level(level);
    }
  }
}

}  // namespace logging
