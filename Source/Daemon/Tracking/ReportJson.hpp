/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <map>
#include <vector>

#include "Json.hpp"
#include "RoamingTracker.hpp"

// JSON renderings of the tracker queries for whatever presentation layer consumes them
namespace RReportJson
{
	void ToJson(RRoamingEvent const& Event, RJson::object& Json);
	void ToJson(RDeviceSession const& Session, RJson::object& Json);
	void ToJson(RDeviceProfile const& Profile, RJson::object& Json);
	void ToJson(RRouterStatistics const& Stats, RJson::object& Json);
	void ToJson(RTrackerStatistics const& Stats, RJson::object& Json);

	RJson EventsToJson(std::vector<RRoamingEvent> const& Events);
	RJson SessionsToJson(std::vector<RDeviceSession> const& Sessions);
	RJson RouterStatisticsToJson(std::map<RRouterId, RRouterStatistics> const& Stats);
	RJson MobilityReportToJson(RMobilityReport const& Report);
} // namespace RReportJson
