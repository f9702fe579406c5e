//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Version components injected by the build
//==========================================================================================================
#include "ssehost/version.h"

#include <format>

#if !defined(SSEHOST_VERSION_MAJOR) || !defined(SSEHOST_VERSION_MINOR) || !defined(SSEHOST_VERSION_PATCH)
#error "SSEHOST_VERSION_MAJOR/MINOR/PATCH must be defined by the build"
#endif

namespace ssehost {

VersionInfo getVersion() {
    return VersionInfo{SSEHOST_VERSION_MAJOR, SSEHOST_VERSION_MINOR, SSEHOST_VERSION_PATCH};
}

std::string getVersionString() {
    const VersionInfo v = getVersion();
    return std::format("{}.{}.{}", v.major, v.minor, v.patch);
}

} // namespace ssehost
