//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for the tool host library.
//==========================================================================================================
#pragma once

#include <string>

namespace mcphost {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

// Library version as set by the build (project VERSION in CMake).
VersionInfo GetVersion();

//==========================================================================================================
// GetVersionString
// Purpose: Returns "MAJOR.MINOR.PATCH"; this is also the clientInfo.version sent in initialize.
//==========================================================================================================
std::string GetVersionString();

} // namespace mcphost
