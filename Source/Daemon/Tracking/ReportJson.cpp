/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "ReportJson.hpp"

#include <array>

#include "Time.hpp"

namespace RReportJson
{
	// json11 only knows int and double
	static RJson Count(uint64_t Value)
	{
		return static_cast<double>(Value);
	}

	void ToJson(RRoamingEvent const& Event, RJson::object& Json)
	{
		Json[JSON_KEY_TIMESTAMP] = RTime::ToIso8601(Event.Timestamp);
		Json[JSON_KEY_MAC] = Event.MacAddress;
		Json[JSON_KEY_HOSTNAME] = Event.Hostname;
		Json[JSON_KEY_IP] = Event.IpAddress;
		Json[JSON_KEY_FROM_ROUTER] = Event.FromRouter;
		Json[JSON_KEY_TO_ROUTER] = Event.ToRouter;
		Json[JSON_KEY_EVENT_TYPE] = RoamingEventTypeToString(Event.EventType);
		Json[JSON_KEY_SIGNAL_BEFORE] = Event.SignalBefore;
		Json[JSON_KEY_SIGNAL_AFTER] = Event.SignalAfter;
		Json[JSON_KEY_CONNECTION_TYPE] = ConnectionMediumToString(Event.Medium);
		Json[JSON_KEY_SESSION_DURATION] = Event.SessionDuration ? RJson(*Event.SessionDuration) : RJson(nullptr);
		Json[JSON_KEY_TRIGGER_REASON] = RoamTriggerToString(Event.TriggerReason);
	}

	void ToJson(RDeviceSession const& Session, RJson::object& Json)
	{
		Json[JSON_KEY_MAC] = Session.GetMacAddress();
		Json[JSON_KEY_HOSTNAME] = Session.GetHostname();
		Json[JSON_KEY_IP] = Session.GetIpAddress();
		Json[JSON_KEY_ROUTER] = Session.GetRouter();
		Json[JSON_KEY_CONNECTION_TYPE] = ConnectionMediumToString(Session.GetMedium());
		Json[JSON_KEY_START_TIME] = RTime::ToIso8601(Session.GetStartTime());
		Json[JSON_KEY_END_TIME] = Session.GetEndTime() ? RJson(RTime::ToIso8601(*Session.GetEndTime())) : RJson(nullptr);
		Json[JSON_KEY_DURATION] = Session.GetDuration() ? RJson(*Session.GetDuration()) : RJson(nullptr);
		Json[JSON_KEY_SIGNAL] = Session.GetSignal().Latest();
		Json[JSON_KEY_AVERAGE_SIGNAL] = Session.GetSignal().Average();
		Json[JSON_KEY_SIGNAL_TREND] = SignalTrendToString(Session.GetSignal().Trend());
		Json[JSON_KEY_SAMPLE_COUNT] = static_cast<int>(Session.GetSignal().Size());
	}

	void ToJson(RDeviceProfile const& Profile, RJson::object& Json)
	{
		Json[JSON_KEY_MAC] = Profile.MacAddress;
		Json[JSON_KEY_HOSTNAME] = Profile.Hostname;
		Json[JSON_KEY_DEVICE_TYPE] = MobilityPatternToString(Profile.DeviceType);

		RJson::array Routers;
		for (auto const& Router : Profile.RoutersSeen)
		{
			Routers.emplace_back(Router);
		}
		Json[JSON_KEY_ROUTERS_SEEN] = Routers;
		Json[JSON_KEY_ROAMING_FREQUENCY] = Profile.RoamingFrequency;
		Json[JSON_KEY_AVG_SESSION_DURATION] = Profile.AvgSessionDuration;
		Json[JSON_KEY_FIRST_SEEN] = RTime::ToIso8601(Profile.FirstSeen);
		Json[JSON_KEY_LAST_SEEN] = RTime::ToIso8601(Profile.LastSeen);
		Json[JSON_KEY_LAST_ROUTER] = Profile.LastRouter;
		Json[JSON_KEY_TOTAL_ROAMS] = Count(Profile.TotalRoams);
		Json[JSON_KEY_TOTAL_SESSIONS] = Count(Profile.TotalSessions);
	}

	void ToJson(RRouterStatistics const& Stats, RJson::object& Json)
	{
		Json[JSON_KEY_ROUTER] = Stats.Router;
		Json[JSON_KEY_TOTAL_CONNECTIONS] = Count(Stats.TotalConnections);
		Json[JSON_KEY_ACTIVE_CONNECTIONS] = Count(Stats.ActiveConnections);
		Json[JSON_KEY_ROAMS_IN] = Count(Stats.RoamsIn);
		Json[JSON_KEY_ROAMS_OUT] = Count(Stats.RoamsOut);
		Json[JSON_KEY_DISCONNECTS] = Count(Stats.Disconnects);
		Json[JSON_KEY_AVERAGE_SIGNAL] = Stats.AverageSignal;
	}

	void ToJson(RTrackerStatistics const& Stats, RJson::object& Json)
	{
		Json[JSON_KEY_TOTAL_ROAMS] = Count(Stats.TotalRoams);
		Json[JSON_KEY_TOTAL_DEVICES] = Count(Stats.TotalDevices);
		Json[JSON_KEY_ACTIVE_DEVICES] = Count(Stats.ActiveDevices);
		Json[JSON_KEY_ROAMING_DEVICES] = Count(Stats.RoamingDevices);
		Json[JSON_KEY_TOTAL_EVENTS] = Count(Stats.TotalEvents);
		Json[JSON_KEY_LAST_UPDATE] = RTime::ToIso8601(Stats.LastUpdate);
	}

	RJson EventsToJson(std::vector<RRoamingEvent> const& Events)
	{
		RJson::array Array;
		for (auto const& Event : Events)
		{
			RJson::object EventJson;
			ToJson(Event, EventJson);
			Array.emplace_back(EventJson);
		}
		return Array;
	}

	RJson SessionsToJson(std::vector<RDeviceSession> const& Sessions)
	{
		RJson::array Array;
		for (auto const& Session : Sessions)
		{
			RJson::object SessionJson;
			ToJson(Session, SessionJson);
			Array.emplace_back(SessionJson);
		}
		return Array;
	}

	RJson RouterStatisticsToJson(std::map<RRouterId, RRouterStatistics> const& Stats)
	{
		RJson::object Object;
		for (auto const& [Router, RouterStats] : Stats)
		{
			RJson::object RouterJson;
			ToJson(RouterStats, RouterJson);
			Object[Router] = RouterJson;
		}
		return Object;
	}

	RJson MobilityReportToJson(RMobilityReport const& Report)
	{
		RJson::object Json;
		Json[JSON_KEY_GENERATED_AT] = RTime::ToIso8601(Report.GeneratedAt);

		RJson::object StatsJson;
		ToJson(Report.Statistics, StatsJson);
		Json[JSON_KEY_STATISTICS] = StatsJson;

		RJson::array       ProfilesJson;
		std::array<int, 3> Patterns{};
		for (auto const& Profile : Report.Profiles)
		{
			RJson::object ProfileJson;
			ToJson(Profile, ProfileJson);
			ProfilesJson.emplace_back(ProfileJson);
			++Patterns[Profile.DeviceType];
		}
		Json[JSON_KEY_DEVICE_PROFILES] = ProfilesJson;
		Json[JSON_KEY_MOBILITY_PATTERNS] = RJson::object{
			{ MobilityPatternToString(MP_Static), Patterns[MP_Static] },
			{ MobilityPatternToString(MP_Mobile), Patterns[MP_Mobile] },
			{ MobilityPatternToString(MP_HighlyMobile), Patterns[MP_HighlyMobile] },
		};

		Json[JSON_KEY_ACTIVE_SESSIONS] = SessionsToJson(Report.ActiveSessions);
		Json[JSON_KEY_ROUTER_STATISTICS] = RouterStatisticsToJson(Report.RouterStatistics);
		Json[JSON_KEY_RECENT_EVENTS] = EventsToJson(Report.RecentEvents);
		return Json;
	}
} // namespace RReportJson
