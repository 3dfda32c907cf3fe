//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for the mcpgw library and the client identity sent in the handshake.
//==========================================================================================================
#pragma once

#include <string>

namespace mcpgw {

// Client name advertised as clientInfo.name unless configured otherwise
constexpr const char* CLIENT_NAME = "mcpgw";

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

VersionInfo getVersion();

//==========================================================================================================
// getVersionString
// Purpose: Returns the semantic version string.
// Returns:
//   std::string formatted as "MAJOR.MINOR.PATCH"; also the default clientInfo.version.
//==========================================================================================================
std::string getVersionString();

} // namespace mcpgw
