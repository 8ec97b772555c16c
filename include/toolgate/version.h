//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for the toolgate gateway (semantic version helpers).
//==========================================================================================================
#pragma once

#include <string>

namespace toolgate {

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

// "MAJOR.MINOR.PATCH"
std::string getVersionString();

// Service name reported by the HTTP status endpoint and the Server header.
const char* getServiceName();

} // namespace toolgate
