/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "RoamingEvent.hpp"

char const* RoamingEventTypeToString(ERoamingEventType Type)
{
	switch (Type)
	{
		case ET_Connect:
			return "connect";
		case ET_Disconnect:
			return "disconnect";
		case ET_Roam:
			return "roam";
	}
	return "connect";
}

std::optional<ERoamingEventType> RoamingEventTypeFromString(std::string const& Str)
{
	if (Str == "connect")
	{
		return ET_Connect;
	}
	if (Str == "disconnect")
	{
		return ET_Disconnect;
	}
	if (Str == "roam")
	{
		return ET_Roam;
	}
	return std::nullopt;
}

char const* RoamTriggerToString(ERoamTrigger Trigger)
{
	switch (Trigger)
	{
		case RT_None:
			return "";
		case RT_WeakSignal:
			return "weak_signal";
		case RT_SignalDegrading:
			return "signal_degrading";
		case RT_BetterSignal:
			return "better_signal";
		case RT_QuickHandover:
			return "quick_handover";
		case RT_Unknown:
			return "unknown";
	}
	return "";
}

ERoamTrigger RoamTriggerFromString(std::string const& Str)
{
	if (Str.empty())
	{
		return RT_None;
	}
	if (Str == "weak_signal")
	{
		return RT_WeakSignal;
	}
	if (Str == "signal_degrading")
	{
		return RT_SignalDegrading;
	}
	if (Str == "better_signal")
	{
		return RT_BetterSignal;
	}
	if (Str == "quick_handover")
	{
		return RT_QuickHandover;
	}
	return RT_Unknown;
}

bool RRoamingEvent::IsConsistent() const
{
	switch (EventType)
	{
		case ET_Connect:
			return FromRouter.empty() && !ToRouter.empty();
		case ET_Disconnect:
			return !FromRouter.empty() && ToRouter.empty();
		case ET_Roam:
			return !FromRouter.empty() && !ToRouter.empty() && FromRouter != ToRouter;
	}
	return false;
}
