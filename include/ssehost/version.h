//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Build version of ssehost, advertised as serverInfo.version during the handshake
//==========================================================================================================
#pragma once

#include <string>

namespace ssehost {

struct VersionInfo {
    int major;
    int minor;
    int patch;
};

// Components come from the project() version in CMakeLists.txt.
VersionInfo getVersion();

// "MAJOR.MINOR.PATCH"
std::string getVersionString();

} // namespace ssehost
