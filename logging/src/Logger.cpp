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

// globally defined loggers
logging::Logger GL = logging::getLogger("masking");
logging::Logger BANK_LOG = logging::getLogger("masking.es.bank");
logging::Logger NATIONAL_ID_LOG = logging::getLogger("masking.es.national-id");
