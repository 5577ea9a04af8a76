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

#ifdef USE_LOG4CPP

#include <string>
#include <log4cplus/loggingmacros.h>
#include <log4cplus/configurator.h>

namespace logging {

typedef log4cplus::Logger Logger;

}  // namespace logging

#define LOG_FUNC(s) __func__ << "|" << s

#define LOG_TRACE(l, s) LOG4CPLUS_TRACE(l, LOG_FUNC(s))
#define LOG_DEBUG(l, s) LOG4CPLUS_DEBUG(l, LOG_FUNC(s))
#define LOG_INFO(l, s) LOG4CPLUS_INFO(l, LOG_FUNC(s))
#define LOG_WARN(l, s) LOG4CPLUS_WARN(l, LOG_FUNC(s))
#define LOG_ERROR(l, s) LOG4CPLUS_ERROR(l, LOG_FUNC(s))
#define LOG_FATAL(l, s) LOG4CPLUS_FATAL(l, LOG_FUNC(s))

#endif
