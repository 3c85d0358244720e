/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "DeviceDescriptor.hpp"

#include <algorithm>
#include <cctype>

char const* ConnectionMediumToString(EConnectionMedium Medium)
{
	switch (Medium)
	{
		case CM_Wifi:
			return "wifi";
		case CM_Ethernet:
			return "ethernet";
		case CM_Guest:
			return "guest";
	}
	return "wifi";
}

EConnectionMedium ConnectionMediumFromString(std::string const& Str)
{
	std::string Lower = Str;
	std::ranges::transform(Lower, Lower.begin(), [](unsigned char C) { return std::tolower(C); });

	if (Lower == "ethernet" || Lower == "lan")
	{
		return CM_Ethernet;
	}
	if (Lower == "guest" || Lower.starts_with("guest"))
	{
		return CM_Guest;
	}
	// routers report 802.11, wlan, 2.4ghz, 5ghz, ... for wireless clients
	return CM_Wifi;
}

RMacAddress NormalizeMac(std::string const& Mac)
{
	auto const First = Mac.find_first_not_of(" \t\r\n");
	if (First == std::string::npos)
	{
		return {};
	}
	auto const  Last = Mac.find_last_not_of(" \t\r\n");
	RMacAddress Result = Mac.substr(First, Last - First + 1);

	std::ranges::transform(Result, Result.begin(), [](unsigned char C) {
		if (C == '-')
		{
			return ':';
		}
		return static_cast<char>(std::toupper(C));
	});
	return Result;
}
