/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <set>
#include <string>
#include <cereal/cereal.hpp>
#include <cereal/types/set.hpp>
#include <cereal/types/string.hpp>

#include "Time.hpp"
#include "Types.hpp"

enum EMobilityPattern
{
	MP_Static,
	MP_Mobile,
	MP_HighlyMobile,
};

static constexpr double kMobileRoamsPerHour = 0.5;
static constexpr double kHighlyMobileRoamsPerHour = 2.0;

char const*      MobilityPatternToString(EMobilityPattern Pattern);
EMobilityPattern MobilityPatternFromString(std::string const& Str);

// Thresholds are exclusive: exactly 0.5 roams/h is still static
EMobilityPattern ClassifyMobility(double RoamsPerHour);

struct RDeviceProfile
{
	RMacAddress           MacAddress{};
	std::string           Hostname{};
	EMobilityPattern      DeviceType{ MP_Static };
	std::set<RRouterId>   RoutersSeen{};
	double                RoamingFrequency{ 0.0 }; // roams per hour, trailing 24h
	RSeconds              AvgSessionDuration{ 0.0 };
	RMsec                 FirstSeen{ 0 };
	RMsec                 LastSeen{ 0 };
	RRouterId             LastRouter{};
	uint64_t              TotalRoams{ 0 };
	uint64_t              TotalSessions{ 0 };

	bool operator==(RDeviceProfile const&) const = default;

	template <class Archive>
	void save(Archive& archive) const
	{
		std::string const TypeStr = MobilityPatternToString(DeviceType);
		std::string const FirstSeenStr = RTime::ToIso8601(FirstSeen);
		std::string const LastSeenStr = RTime::ToIso8601(LastSeen);
		archive(cereal::make_nvp("mac_address", MacAddress), cereal::make_nvp("hostname", Hostname),
			cereal::make_nvp("device_type", TypeStr), cereal::make_nvp("routers_seen", RoutersSeen),
			cereal::make_nvp("roaming_frequency", RoamingFrequency),
			cereal::make_nvp("avg_session_duration", AvgSessionDuration), cereal::make_nvp("first_seen", FirstSeenStr),
			cereal::make_nvp("last_seen", LastSeenStr), cereal::make_nvp("last_router", LastRouter),
			cereal::make_nvp("total_roams", TotalRoams), cereal::make_nvp("total_sessions", TotalSessions));
	}

	template <class Archive>
	void load(Archive& archive)
	{
		std::string TypeStr, FirstSeenStr, LastSeenStr;
		archive(cereal::make_nvp("mac_address", MacAddress), cereal::make_nvp("hostname", Hostname),
			cereal::make_nvp("device_type", TypeStr), cereal::make_nvp("routers_seen", RoutersSeen),
			cereal::make_nvp("roaming_frequency", RoamingFrequency),
			cereal::make_nvp("avg_session_duration", AvgSessionDuration), cereal::make_nvp("first_seen", FirstSeenStr),
			cereal::make_nvp("last_seen", LastSeenStr), cereal::make_nvp("last_router", LastRouter),
			cereal::make_nvp("total_roams", TotalRoams), cereal::make_nvp("total_sessions", TotalSessions));

		auto const First = RTime::FromIso8601(FirstSeenStr);
		auto const Last = RTime::FromIso8601(LastSeenStr);
		if (!First || !Last)
		{
			throw cereal::Exception("invalid profile timestamps for " + MacAddress);
		}
		DeviceType = MobilityPatternFromString(TypeStr);
		FirstSeen = *First;
		LastSeen = *Last;
	}
};
