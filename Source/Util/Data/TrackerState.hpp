/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <vector>
#include <cereal/cereal.hpp>

#include "DeviceProfile.hpp"
#include "RoamingEvent.hpp"
#include "Time.hpp"

struct RTrackerStatistics
{
	uint64_t TotalRoams{ 0 }; // lifetime, survives event pruning
	uint64_t TotalDevices{ 0 };
	uint64_t ActiveDevices{ 0 };
	uint64_t RoamingDevices{ 0 };
	uint64_t TotalEvents{ 0 };
	RMsec    LastUpdate{ 0 };

	bool operator==(RTrackerStatistics const&) const = default;

	template <class Archive>
	void save(Archive& archive) const
	{
		std::string const LastUpdateStr = RTime::ToIso8601(LastUpdate);
		archive(cereal::make_nvp("total_roams", TotalRoams), cereal::make_nvp("total_devices", TotalDevices),
			cereal::make_nvp("active_devices", ActiveDevices), cereal::make_nvp("roaming_devices", RoamingDevices),
			cereal::make_nvp("total_events", TotalEvents), cereal::make_nvp("last_update", LastUpdateStr));
	}

	template <class Archive>
	void load(Archive& archive)
	{
		std::string LastUpdateStr;
		archive(cereal::make_nvp("total_roams", TotalRoams), cereal::make_nvp("total_devices", TotalDevices),
			cereal::make_nvp("active_devices", ActiveDevices), cereal::make_nvp("roaming_devices", RoamingDevices),
			cereal::make_nvp("total_events", TotalEvents), cereal::make_nvp("last_update", LastUpdateStr));
		LastUpdate = RTime::FromIso8601(LastUpdateStr).value_or(0);
	}
};

// Everything that outlives the process. Active sessions are not part of it,
// devices still online after a restart show up as fresh connects.
struct RTrackerState
{
	std::vector<RRoamingEvent>  Events{};
	std::vector<RDeviceProfile> Profiles{};
	RTrackerStatistics          Statistics{};
	RMsec                       LastUpdated{ 0 };
};
