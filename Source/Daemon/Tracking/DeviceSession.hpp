/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <string>

#include "SignalBuffer.hpp"
#include "Types.hpp"
#include "Data/DeviceDescriptor.hpp"

// One continuous association of a device with a single router.
// A closed session is never reopened, the next association gets a new one.
class RDeviceSession
{
	RMacAddress       MacAddress{};
	std::string       Hostname{};
	std::string       IpAddress{};
	RRouterId         Router{};
	EConnectionMedium Medium{ CM_Wifi };

	RMsec                   StartTime{ 0 };
	std::optional<RMsec>    EndTime{};
	std::optional<RSeconds> Duration{};

	// Set when the session was created by a roam-in, used to debounce ping-pong handovers
	bool bOpenedByRoam{ false };

	RSignalBuffer Signal{};

public:
	RDeviceSession(RDeviceDescriptor const& Device, RRouterId Router_, RMsec Timestamp, bool bOpenedByRoam_ = false);

	void RecordSignal(RSignalStrength Strength, RMsec Timestamp);

	// Returns false if the session was already closed, the first close wins
	bool Close(RMsec Timestamp);

	// Hostname and ip may change during a session (dhcp renew, mdns)
	void RefreshIdentity(RDeviceDescriptor const& Device);

	[[nodiscard]] bool IsOpen() const { return !EndTime.has_value(); }

	[[nodiscard]] RMacAddress const&       GetMacAddress() const { return MacAddress; }
	[[nodiscard]] std::string const&       GetHostname() const { return Hostname; }
	[[nodiscard]] std::string const&       GetIpAddress() const { return IpAddress; }
	[[nodiscard]] RRouterId const&         GetRouter() const { return Router; }
	[[nodiscard]] EConnectionMedium        GetMedium() const { return Medium; }
	[[nodiscard]] RMsec                    GetStartTime() const { return StartTime; }
	[[nodiscard]] std::optional<RMsec>     GetEndTime() const { return EndTime; }
	[[nodiscard]] std::optional<RSeconds>  GetDuration() const { return Duration; }
	[[nodiscard]] bool                     WasOpenedByRoam() const { return bOpenedByRoam; }
	[[nodiscard]] RSignalBuffer const&     GetSignal() const { return Signal; }

	// Seconds since the session started, for open sessions
	[[nodiscard]] RSeconds GetAge(RMsec Now) const;
};
