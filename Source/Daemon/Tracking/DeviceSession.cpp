/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "DeviceSession.hpp"

#include <utility>
#include <spdlog/spdlog.h>

RDeviceSession::RDeviceSession(
	RDeviceDescriptor const& Device, RRouterId Router_, RMsec Timestamp, bool bOpenedByRoam_)
	: MacAddress(Device.MacAddress)
	, Hostname(Device.Hostname)
	, IpAddress(Device.IpAddress)
	, Router(std::move(Router_))
	, Medium(Device.Medium)
	, StartTime(Timestamp)
	, bOpenedByRoam(bOpenedByRoam_)
{
	Signal.Record(Device.SignalStrength, Timestamp);
}

void RDeviceSession::RecordSignal(RSignalStrength Strength, RMsec Timestamp)
{
	if (!IsOpen())
	{
		spdlog::warn("Ignoring signal sample for closed session of {} on {}", MacAddress, Router);
		return;
	}
	Signal.Record(Strength, Timestamp);
}

bool RDeviceSession::Close(RMsec Timestamp)
{
	if (!IsOpen())
	{
		spdlog::warn("Session of {} on {} closed twice, keeping the first close", MacAddress, Router);
		return false;
	}

	EndTime = Timestamp;
	auto const ElapsedMs = Timestamp - StartTime;
	if (ElapsedMs < 0)
	{
		spdlog::warn("Session of {} on {} ends {} ms before it started, clamping duration to 0", MacAddress, Router,
			-ElapsedMs);
		Duration = 0.0;
	}
	else
	{
		Duration = static_cast<RSeconds>(ElapsedMs) / static_cast<RSeconds>(kMsecPerSecond);
	}
	return true;
}

void RDeviceSession::RefreshIdentity(RDeviceDescriptor const& Device)
{
	if (!Device.Hostname.empty())
	{
		Hostname = Device.Hostname;
	}
	if (!Device.IpAddress.empty())
	{
		IpAddress = Device.IpAddress;
	}
}

RSeconds RDeviceSession::GetAge(RMsec Now) const
{
	auto const End = EndTime.value_or(Now);
	if (End < StartTime)
	{
		return 0.0;
	}
	return static_cast<RSeconds>(End - StartTime) / static_cast<RSeconds>(kMsecPerSecond);
}
