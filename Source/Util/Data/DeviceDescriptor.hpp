/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <map>
#include <string>
#include <vector>

#include "Types.hpp"

enum EConnectionMedium
{
	CM_Wifi,
	CM_Ethernet,
	CM_Guest,
};

char const*       ConnectionMediumToString(EConnectionMedium Medium);
EConnectionMedium ConnectionMediumFromString(std::string const& Str);

// One device as reported by a router during a poll cycle
struct RDeviceDescriptor
{
	RMacAddress       MacAddress{};
	std::string       Hostname{};
	std::string       IpAddress{};
	RSignalStrength   SignalStrength{ 0 };
	EConnectionMedium Medium{ CM_Wifi };

	[[nodiscard]] bool IsValid() const { return !MacAddress.empty(); }
};

// router id -> devices currently associated with it
using RSnapshot = std::map<RRouterId, std::vector<RDeviceDescriptor>>;

// Upper-cases and turns '-' separators into ':'. Returns an empty string
// for input that is blank after trimming.
RMacAddress NormalizeMac(std::string const& Mac);
