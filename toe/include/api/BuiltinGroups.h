// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-TOE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of TOE (Test Orchestration Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Commercial License:
//   Individual: $100 cumulative
//   Enterprise: $500 cumulative
//   Contact: https://github.com/newmassrael

#pragma once

#include "api/SessionSetup.h"
#include "http/IHttpClient.h"
#include "scheduling/TestRegistry.h"

#include <memory>

namespace TOE {

/**
 * @brief Register the standard groups run against the target API
 *
 * health, auth, projects (-> auth), collections (-> auth, projects),
 * documents (-> auth, projects, collections) and cors (-> auth), in that
 * order. credentials are the ones the auth group logs in with.
 */
void registerBuiltinGroups(TestRegistry &registry, std::shared_ptr<IHttpClient> http, const Credentials &credentials);

}  // namespace TOE
