//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for the MCP session client library (semantic version helpers).
//==========================================================================================================
#pragma once

#include <string>

namespace mcpsession {

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

// Library version components.
VersionInfo getVersion();

//==========================================================================================================
// getVersionString
// Purpose: Returns the semantic version string, also sent as clientInfo.version during the handshake.
// Returns:
//   std::string formatted as "MAJOR.MINOR.PATCH"
//==========================================================================================================
std::string getVersionString();

} // namespace mcpsession
