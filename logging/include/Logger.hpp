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

#ifdef USE_LOG4CPP
#include "Logging4cplus.hpp"
#else
#include "LoggingSpd.hpp"
#endif

extern logging::Logger GL;
extern logging::Logger BANK_LOG;
extern logging::Logger NATIONAL_ID_LOG;

namespace logging {

Logger getLogger(const std::string& name);

// Applies the logging configuration file. A missing file keeps the default configuration.
void initLogger(const std::string& configFileName);

}  // namespace logging
