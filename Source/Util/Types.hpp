/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <cstdint>
#include <string>

using RMsec = int64_t;           // milliseconds since the unix epoch
using RSeconds = double;         // durations
using RSignalStrength = int32_t; // same scale as the poller reports (0-100 on most routers)
using RMacAddress = std::string; // normalised AA:BB:CC:DD:EE:FF
using RRouterId = std::string;

static constexpr RMsec kMsecPerSecond = 1000;
static constexpr RMsec kMsecPerHour = 3600 * kMsecPerSecond;
static constexpr RMsec kMsecPerDay = 24 * kMsecPerHour;
