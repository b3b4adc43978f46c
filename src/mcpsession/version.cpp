//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Implements version helpers returning the library semantic version.
//==========================================================================================================
#include "mcpsession/version.h"

#include <format>

namespace mcpsession {

VersionInfo getVersion() {
    return VersionInfo{0, 3, 1};
}

std::string getVersionString() {
    const auto v = getVersion();
    return std::format("{}.{}.{}", v.major, v.minor, v.patch);
}

} // namespace mcpsession
