//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Implements version helpers from the build-provided version components.
//==========================================================================================================
#include "mcphost/version.h"

#include <fmt/format.h>

#ifndef MCPHOST_VERSION_MAJOR
#define MCPHOST_VERSION_MAJOR 0
#endif
#ifndef MCPHOST_VERSION_MINOR
#define MCPHOST_VERSION_MINOR 1
#endif
#ifndef MCPHOST_VERSION_PATCH
#define MCPHOST_VERSION_PATCH 0
#endif

namespace mcphost {

VersionInfo GetVersion() {
    return VersionInfo{MCPHOST_VERSION_MAJOR, MCPHOST_VERSION_MINOR, MCPHOST_VERSION_PATCH};
}

std::string GetVersionString() {
    const auto v = GetVersion();
    return fmt::format("{}.{}.{}", v.major, v.minor, v.patch);
}

} // namespace mcphost
