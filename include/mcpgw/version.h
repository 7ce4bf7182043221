//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for the MCP gateway (semantic version helpers).
//==========================================================================================================
#pragma once

#include <string>

namespace mcpgw {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
// Fields:
//   major, minor, patch: Version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

// Returns the gateway semantic version components.
VersionInfo getVersion();

// Returns the semantic version formatted as "MAJOR.MINOR.PATCH".
std::string getVersionString();

} // namespace mcpgw
