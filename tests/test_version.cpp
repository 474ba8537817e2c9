//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_version.cpp
// Purpose: Version API consistency
//==========================================================================================================

#include <gtest/gtest.h>
#include "stun/version.h"
#include <string>

using namespace stun;

TEST(Version, StringMatchesComponents) {
    const auto v = getVersion();
    EXPECT_EQ(getVersionString(),
              std::to_string(v.major) + "." + std::to_string(v.minor) + "." + std::to_string(v.patch));
}
