/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <string>
#include <cereal/cereal.hpp>
#include <cereal/types/optional.hpp>
#include <cereal/types/string.hpp>

#include "DeviceDescriptor.hpp"
#include "Time.hpp"
#include "Types.hpp"

enum ERoamingEventType
{
	ET_Connect,
	ET_Disconnect,
	ET_Roam,
};

// Heuristic explanation attached to roam events, checked in declaration order
enum ERoamTrigger
{
	RT_None, // connect/disconnect
	RT_WeakSignal,
	RT_SignalDegrading,
	RT_BetterSignal,
	RT_QuickHandover,
	RT_Unknown,
};

char const*                      RoamingEventTypeToString(ERoamingEventType Type);
std::optional<ERoamingEventType> RoamingEventTypeFromString(std::string const& Str);

char const*  RoamTriggerToString(ERoamTrigger Trigger);
ERoamTrigger RoamTriggerFromString(std::string const& Str);

struct RRoamingEvent
{
	RMsec             Timestamp{ 0 };
	RMacAddress       MacAddress{};
	std::string       Hostname{};
	std::string       IpAddress{};
	RRouterId         FromRouter{}; // empty for connect
	RRouterId         ToRouter{};   // empty for disconnect
	ERoamingEventType EventType{ ET_Connect };
	RSignalStrength   SignalBefore{ 0 };
	RSignalStrength   SignalAfter{ 0 };
	EConnectionMedium Medium{ CM_Wifi };

	// Duration of the session that just ended, not set for connects
	std::optional<RSeconds> SessionDuration{};
	ERoamTrigger            TriggerReason{ RT_None };

	// roam: both routers set and different, connect: no source, disconnect: no target
	[[nodiscard]] bool IsConsistent() const;

	bool operator==(RRoamingEvent const&) const = default;

	template <class Archive>
	void save(Archive& archive) const
	{
		std::string const TimestampStr = RTime::ToIso8601(Timestamp);
		std::string const TypeStr = RoamingEventTypeToString(EventType);
		std::string const MediumStr = ConnectionMediumToString(Medium);
		std::string const TriggerStr = RoamTriggerToString(TriggerReason);
		archive(cereal::make_nvp("timestamp", TimestampStr), cereal::make_nvp("mac_address", MacAddress),
			cereal::make_nvp("hostname", Hostname), cereal::make_nvp("ip_address", IpAddress),
			cereal::make_nvp("from_router", FromRouter), cereal::make_nvp("to_router", ToRouter),
			cereal::make_nvp("event_type", TypeStr), cereal::make_nvp("signal_before", SignalBefore),
			cereal::make_nvp("signal_after", SignalAfter), cereal::make_nvp("connection_type", MediumStr),
			cereal::make_nvp("session_duration", SessionDuration), cereal::make_nvp("trigger_reason", TriggerStr));
	}

	template <class Archive>
	void load(Archive& archive)
	{
		std::string TimestampStr, TypeStr, MediumStr, TriggerStr;
		archive(cereal::make_nvp("timestamp", TimestampStr), cereal::make_nvp("mac_address", MacAddress),
			cereal::make_nvp("hostname", Hostname), cereal::make_nvp("ip_address", IpAddress),
			cereal::make_nvp("from_router", FromRouter), cereal::make_nvp("to_router", ToRouter),
			cereal::make_nvp("event_type", TypeStr), cereal::make_nvp("signal_before", SignalBefore),
			cereal::make_nvp("signal_after", SignalAfter), cereal::make_nvp("connection_type", MediumStr),
			cereal::make_nvp("session_duration", SessionDuration), cereal::make_nvp("trigger_reason", TriggerStr));

		auto const ParsedTime = RTime::FromIso8601(TimestampStr);
		if (!ParsedTime)
		{
			throw cereal::Exception("invalid event timestamp '" + TimestampStr + "'");
		}
		auto const ParsedType = RoamingEventTypeFromString(TypeStr);
		if (!ParsedType)
		{
			throw cereal::Exception("invalid event type '" + TypeStr + "'");
		}
		Timestamp = *ParsedTime;
		EventType = *ParsedType;
		Medium = ConnectionMediumFromString(MediumStr);
		TriggerReason = RoamTriggerFromString(TriggerStr);
	}
};
