/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "RoamingTracker.hpp"

#include <algorithm>
#include <mutex>
#include <ranges>
#include <unordered_set>
#include <utility>
#include <spdlog/spdlog.h>

static constexpr RMsec    kProfileRetention = 7 * kMsecPerDay;
static constexpr RMsec    kFrequencyWindow = 24 * kMsecPerHour;
static constexpr double   kFrequencyWindowHours = 24.0;
static constexpr double   kBetterSignalMargin = 10.0;
static constexpr RSeconds kQuickHandoverSeconds = 60.0;

ERoamTrigger ClassifyRoamTrigger(RRoamContext const& Context, double WeakSignalThreshold)
{
	if (Context.PriorAverageSignal < WeakSignalThreshold)
	{
		return RT_WeakSignal;
	}
	if (Context.PriorTrend == ST_Degrading)
	{
		return RT_SignalDegrading;
	}
	if (Context.NewSignal > Context.PriorAverageSignal + kBetterSignalMargin)
	{
		return RT_BetterSignal;
	}
	if (Context.PriorDuration < kQuickHandoverSeconds)
	{
		return RT_QuickHandover;
	}
	return RT_Unknown;
}

RRoamingTracker::RRoamingTracker(RTrackerConfig const& Config_, std::shared_ptr<IStateStore> Store_, RClock Clock_)
	: Config(Config_), Store(std::move(Store_)), Clock(Clock_ ? std::move(Clock_) : RClock(&RTime::GetEpochMs))
{
}

bool RRoamingTracker::Load()
{
	if (!Store)
	{
		spdlog::warn("No state store configured, roaming history is kept in memory only");
		return false;
	}

	RTrackerState State{};
	bool          bLoaded{ false };
	try
	{
		bLoaded = Store->Load(State);
	}
	catch (std::exception const& e)
	{
		spdlog::warn("Loading roaming history failed: {}", e.what());
		State = RTrackerState{};
	}

	std::unique_lock Lock(Mutex);
	Events.clear();
	Events.reserve(State.Events.size());
	for (auto& Event : State.Events)
	{
		Event.MacAddress = NormalizeMac(Event.MacAddress);
		if (Event.MacAddress.empty() || !Event.IsConsistent())
		{
			spdlog::warn("Dropping inconsistent {} event from history ({} -> {})",
				RoamingEventTypeToString(Event.EventType), Event.FromRouter, Event.ToRouter);
			continue;
		}
		Events.push_back(std::move(Event));
	}
	// hand-edited files may not be in order, everything else relies on it
	std::ranges::stable_sort(Events, {}, &RRoamingEvent::Timestamp);

	Profiles.clear();
	for (auto& Profile : State.Profiles)
	{
		Profile.MacAddress = NormalizeMac(Profile.MacAddress);
		if (Profile.MacAddress.empty())
		{
			spdlog::warn("Dropping device profile without mac address");
			continue;
		}
		auto const Mac = Profile.MacAddress;
		Profiles[Mac] = std::move(Profile);
	}

	ActiveSessions.clear();
	Statistics = RTrackerStatistics{};
	Statistics.TotalRoams = State.Statistics.TotalRoams;
	RecomputeStatisticsLocked(State.Statistics.LastUpdate);
	return bLoaded;
}

bool RRoamingTracker::Save()
{
	if (!Store)
	{
		return false;
	}

	std::lock_guard SaveLock(SaveMutex);

	RTrackerState State{};
	{
		std::shared_lock Lock(Mutex);
		State = CopyStateLocked();
	}
	State.LastUpdated = Clock();

	try
	{
		return Store->Save(State);
	}
	catch (std::exception const& e)
	{
		spdlog::error("Saving roaming history failed: {}", e.what());
		return false;
	}
}

void RRoamingTracker::UpdateDeviceLocations(RSnapshot const& Snapshot, RMsec Now)
{
	std::vector<RRoamingEvent> Emitted;
	std::size_t                ActiveCount{ 0 };
	{
		std::unique_lock Lock(Mutex);

		// Flatten in snapshot order, the first router reporting a mac wins
		std::vector<std::pair<RRouterId, RDeviceDescriptor>> Current;
		std::unordered_map<RMacAddress, std::size_t>         CurrentIndex;
		for (auto const& [Router, Devices] : Snapshot)
		{
			if (Router.empty())
			{
				spdlog::warn("Skipping {} devices reported without a router id", Devices.size());
				continue;
			}

			for (auto const& Device : Devices)
			{
				RDeviceDescriptor Normalized = Device;
				Normalized.MacAddress = NormalizeMac(Device.MacAddress);
				if (!Normalized.IsValid())
				{
					spdlog::warn("Skipping device '{}' ({}) on {}: no mac address", Device.Hostname, Device.IpAddress,
						Router);
					continue;
				}

				if (auto const It = CurrentIndex.find(Normalized.MacAddress); It != CurrentIndex.end())
				{
					spdlog::warn("{} reported by both {} and {}, keeping {}", Normalized.MacAddress,
						Current[It->second].first, Router, Current[It->second].first);
					continue;
				}

				CurrentIndex.emplace(Normalized.MacAddress, Current.size());
				Current.emplace_back(Router, std::move(Normalized));
			}
		}

		for (auto const& [Router, Device] : Current)
		{
			auto const It = ActiveSessions.find(Device.MacAddress);
			if (It == ActiveSessions.end())
			{
				HandleConnect(Device, Router, Now, Emitted);
				continue;
			}

			auto& Session = It->second;
			if (Session.GetRouter() == Router)
			{
				Session.RecordSignal(Device.SignalStrength, Now);
				Session.RefreshIdentity(Device);
				continue;
			}

			HandleRoam(Session, Device, Router, Now, Emitted);
		}

		for (auto It = ActiveSessions.begin(); It != ActiveSessions.end();)
		{
			if (CurrentIndex.contains(It->first))
			{
				++It;
				continue;
			}
			HandleDisconnect(It->second, Now, Emitted);
			It = ActiveSessions.erase(It);
		}

		RecomputeStatisticsLocked(Now);
		ActiveCount = ActiveSessions.size();
	}

	if (!Emitted.empty())
	{
		spdlog::debug("Poll cycle produced {} events, {} devices active", Emitted.size(), ActiveCount);
	}

	for (auto const& Event : Emitted)
	{
		OnRoamingEvent(Event);
	}
}

void RRoamingTracker::HandleConnect(
	RDeviceDescriptor const& Device, RRouterId const& Router, RMsec Now, std::vector<RRoamingEvent>& OutEmitted)
{
	ActiveSessions.try_emplace(Device.MacAddress, Device, Router, Now);

	RRoamingEvent Event{};
	Event.Timestamp = Now;
	Event.MacAddress = Device.MacAddress;
	Event.Hostname = Device.Hostname;
	Event.IpAddress = Device.IpAddress;
	Event.ToRouter = Router;
	Event.EventType = ET_Connect;
	Event.SignalAfter = Device.SignalStrength;
	Event.Medium = Device.Medium;

	spdlog::info("Device {} ({}) connected to {}", Device.Hostname, Device.MacAddress, Router);
	PushEventLocked(std::move(Event), OutEmitted);
}

void RRoamingTracker::HandleRoam(RDeviceSession& Prior, RDeviceDescriptor const& Device, RRouterId const& Router,
	RMsec Now, std::vector<RRoamingEvent>& OutEmitted)
{
	if (Prior.WasOpenedByRoam() && Prior.GetAge(Now) < Config.RoamingThresholdSeconds)
	{
		// Not trusted yet, the roam is committed on a later cycle if the device stays on Router
		spdlog::debug("Holding back roam of {} from {} to {}, last roam was {:.1f}s ago", Device.MacAddress,
			Prior.GetRouter(), Router, Prior.GetAge(Now));
		return;
	}

	RRoamContext Context{};
	Context.PriorAverageSignal = Prior.GetSignal().Average();
	Context.PriorTrend = Prior.GetSignal().Trend();
	Context.NewSignal = Device.SignalStrength;

	Prior.Close(Now);
	Context.PriorDuration = Prior.GetDuration().value_or(0.0);

	RRoamingEvent Event{};
	Event.Timestamp = Now;
	Event.MacAddress = Device.MacAddress;
	Event.Hostname = Device.Hostname.empty() ? Prior.GetHostname() : Device.Hostname;
	Event.IpAddress = Device.IpAddress.empty() ? Prior.GetIpAddress() : Device.IpAddress;
	Event.FromRouter = Prior.GetRouter();
	Event.ToRouter = Router;
	Event.EventType = ET_Roam;
	Event.SignalBefore = Prior.GetSignal().Latest();
	Event.SignalAfter = Device.SignalStrength;
	Event.Medium = Device.Medium;
	Event.SessionDuration = Prior.GetDuration();
	Event.TriggerReason = ClassifyRoamTrigger(Context, Config.WeakSignalThreshold);

	spdlog::info("Device {} ({}) roamed from {} to {} ({}, signal {} -> {})", Event.Hostname, Event.MacAddress,
		Event.FromRouter, Event.ToRouter, RoamTriggerToString(Event.TriggerReason), Event.SignalBefore,
		Event.SignalAfter);

	Prior = RDeviceSession(Device, Router, Now, true);
	PushEventLocked(std::move(Event), OutEmitted);
}

void RRoamingTracker::HandleDisconnect(RDeviceSession& Session, RMsec Now, std::vector<RRoamingEvent>& OutEmitted)
{
	Session.Close(Now);

	RRoamingEvent Event{};
	Event.Timestamp = Now;
	Event.MacAddress = Session.GetMacAddress();
	Event.Hostname = Session.GetHostname();
	Event.IpAddress = Session.GetIpAddress();
	Event.FromRouter = Session.GetRouter();
	Event.EventType = ET_Disconnect;
	Event.SignalBefore = Session.GetSignal().Latest();
	Event.Medium = Session.GetMedium();
	Event.SessionDuration = Session.GetDuration();

	spdlog::info("Device {} ({}) disconnected from {} after {}", Event.Hostname, Event.MacAddress, Event.FromRouter,
		RTime::FormatDuration(Event.SessionDuration.value_or(0.0)));
	PushEventLocked(std::move(Event), OutEmitted);
}

void RRoamingTracker::PushEventLocked(RRoamingEvent Event, std::vector<RRoamingEvent>& OutEmitted)
{
#if RDEBUG
	if (!Event.IsConsistent())
	{
		spdlog::error("Emitting inconsistent {} event for {} ({} -> {})", RoamingEventTypeToString(Event.EventType),
			Event.MacAddress, Event.FromRouter, Event.ToRouter);
	}
#endif
	if (Event.EventType == ET_Roam)
	{
		++Statistics.TotalRoams;
	}
	Events.push_back(std::move(Event));
	UpdateProfileLocked(Events.back());
	OutEmitted.push_back(Events.back());
}

void RRoamingTracker::UpdateProfileLocked(RRoamingEvent const& Event)
{
	auto [It, bCreated] = Profiles.try_emplace(Event.MacAddress);
	auto& Profile = It->second;
	if (bCreated)
	{
		Profile.MacAddress = Event.MacAddress;
		Profile.FirstSeen = Event.Timestamp;
		spdlog::debug("New device profile for {}", Event.MacAddress);
	}

	if (!Event.Hostname.empty())
	{
		Profile.Hostname = Event.Hostname;
	}
	Profile.LastSeen = std::max(Profile.LastSeen, Event.Timestamp);

	if (!Event.ToRouter.empty())
	{
		Profile.RoutersSeen.insert(Event.ToRouter);
		Profile.LastRouter = Event.ToRouter;
		++Profile.TotalSessions;
	}
	if (Event.EventType == ET_Roam)
	{
		++Profile.TotalRoams;
	}

	// Connects are not roams and never count towards the frequency
	RMsec const WindowStart = Event.Timestamp - kFrequencyWindow;
	uint64_t    RecentRoams{ 0 };
	RSeconds    DurationSum{ 0.0 };
	uint64_t    DurationCount{ 0 };
	for (auto const& Past : Events)
	{
		if (Past.MacAddress != Event.MacAddress)
		{
			continue;
		}
		if (Past.EventType == ET_Roam && Past.Timestamp > WindowStart)
		{
			++RecentRoams;
		}
		if (Past.SessionDuration)
		{
			DurationSum += *Past.SessionDuration;
			++DurationCount;
		}
	}

	Profile.RoamingFrequency = static_cast<double>(RecentRoams) / kFrequencyWindowHours;
	Profile.DeviceType = ClassifyMobility(Profile.RoamingFrequency);
	Profile.AvgSessionDuration = DurationCount > 0 ? DurationSum / static_cast<RSeconds>(DurationCount) : 0.0;
}

void RRoamingTracker::RecomputeStatisticsLocked(RMsec Now)
{
	Statistics.TotalDevices = Profiles.size();
	Statistics.ActiveDevices = ActiveSessions.size();
	Statistics.RoamingDevices = static_cast<uint64_t>(
		std::ranges::count_if(Profiles, [](auto const& Entry) { return Entry.second.TotalRoams > 0; }));
	Statistics.TotalEvents = Events.size();
	Statistics.LastUpdate = Now;
}

void RRoamingTracker::CleanupOldData(RMsec Now)
{
	{
		std::unique_lock Lock(Mutex);

		RMsec const EventCutoff = Now - static_cast<RMsec>(Config.MaxHistoryDays) * kMsecPerDay;
		auto const  PrunedEvents =
			std::erase_if(Events, [EventCutoff](RRoamingEvent const& Event) { return Event.Timestamp < EventCutoff; });

		RMsec const                     ProfileCutoff = Now - kProfileRetention;
		std::unordered_set<RMacAddress> RecentlySeen;
		for (auto const& Event : Events)
		{
			if (Event.Timestamp >= ProfileCutoff)
			{
				RecentlySeen.insert(Event.MacAddress);
			}
		}

		auto const PrunedProfiles = std::erase_if(Profiles, [&](auto const& Entry) {
			return !ActiveSessions.contains(Entry.first) && !RecentlySeen.contains(Entry.first);
		});

		RecomputeStatisticsLocked(Statistics.LastUpdate);
		spdlog::info("Cleanup removed {} events older than {} days and {} stale device profiles", PrunedEvents,
			Config.MaxHistoryDays, PrunedProfiles);
	}

	Save();
}

RTrackerState RRoamingTracker::CopyStateLocked() const
{
	RTrackerState State{};
	State.Events = Events;
	State.Profiles.reserve(Profiles.size());
	for (auto const& Profile : Profiles | std::views::values)
	{
		State.Profiles.push_back(Profile);
	}
	std::ranges::sort(State.Profiles, {}, &RDeviceProfile::MacAddress);
	State.Statistics = Statistics;
	State.LastUpdated = Statistics.LastUpdate;
	return State;
}

std::vector<RRoamingEvent> RRoamingTracker::GetRoamingEventsLocked(
	double Hours, std::optional<RMacAddress> const& MacAddress, RMsec Now) const
{
	RMsec const Cutoff = Now - static_cast<RMsec>(Hours * static_cast<double>(kMsecPerHour));
	std::optional<RMacAddress> Filter{};
	if (MacAddress)
	{
		Filter = NormalizeMac(*MacAddress);
	}

	std::vector<RRoamingEvent> Result;
	for (auto const& Event : Events)
	{
		if (Event.Timestamp < Cutoff)
		{
			continue;
		}
		if (Filter && Event.MacAddress != *Filter)
		{
			continue;
		}
		Result.push_back(Event);
	}
	return Result;
}

std::map<RRouterId, RRouterStatistics> RRoamingTracker::GetRouterStatisticsLocked() const
{
	std::map<RRouterId, RRouterStatistics> Result;
	auto Get = [&Result](RRouterId const& Router) -> RRouterStatistics& {
		auto& Stats = Result[Router];
		Stats.Router = Router;
		return Stats;
	};

	for (auto const& Event : Events)
	{
		switch (Event.EventType)
		{
			case ET_Connect:
				++Get(Event.ToRouter).TotalConnections;
				break;
			case ET_Roam:
			{
				auto& To = Get(Event.ToRouter);
				++To.TotalConnections;
				++To.RoamsIn;
				++Get(Event.FromRouter).RoamsOut;
				break;
			}
			case ET_Disconnect:
				++Get(Event.FromRouter).Disconnects;
				break;
		}
	}

	std::map<RRouterId, double> SignalSums;
	for (auto const& Session : ActiveSessions | std::views::values)
	{
		++Get(Session.GetRouter()).ActiveConnections;
		SignalSums[Session.GetRouter()] += Session.GetSignal().Average();
	}
	for (auto& [Router, Stats] : Result)
	{
		if (Stats.ActiveConnections > 0)
		{
			Stats.AverageSignal = SignalSums[Router] / static_cast<double>(Stats.ActiveConnections);
		}
	}
	return Result;
}

std::vector<RRoamingEvent> RRoamingTracker::GetRoamingEvents(
	double Hours, std::optional<RMacAddress> const& MacAddress) const
{
	std::shared_lock Lock(Mutex);
	return GetRoamingEventsLocked(Hours, MacAddress, Clock());
}

std::optional<RDeviceProfile> RRoamingTracker::GetDeviceProfile(RMacAddress const& MacAddress) const
{
	std::shared_lock Lock(Mutex);
	if (auto const It = Profiles.find(NormalizeMac(MacAddress)); It != Profiles.end())
	{
		return It->second;
	}
	return std::nullopt;
}

std::vector<RDeviceSession> RRoamingTracker::GetActiveSessions() const
{
	std::shared_lock            Lock(Mutex);
	std::vector<RDeviceSession> Result;
	Result.reserve(ActiveSessions.size());
	for (auto const& Session : ActiveSessions | std::views::values)
	{
		Result.push_back(Session);
	}
	return Result;
}

std::map<RRouterId, RRouterStatistics> RRoamingTracker::GetRouterStatistics() const
{
	std::shared_lock Lock(Mutex);
	return GetRouterStatisticsLocked();
}

RMobilityReport RRoamingTracker::GetMobilityReport() const
{
	std::shared_lock Lock(Mutex);
	RMobilityReport  Report{};
	Report.GeneratedAt = Clock();
	Report.Statistics = Statistics;

	Report.Profiles.reserve(Profiles.size());
	for (auto const& Profile : Profiles | std::views::values)
	{
		Report.Profiles.push_back(Profile);
	}
	std::ranges::sort(Report.Profiles, {}, &RDeviceProfile::MacAddress);

	Report.ActiveSessions.reserve(ActiveSessions.size());
	for (auto const& Session : ActiveSessions | std::views::values)
	{
		Report.ActiveSessions.push_back(Session);
	}

	Report.RouterStatistics = GetRouterStatisticsLocked();
	Report.RecentEvents = GetRoamingEventsLocked(24, std::nullopt, Report.GeneratedAt);
	return Report;
}

std::optional<RRouterId> RRoamingTracker::GetDeviceCurrentRouter(RMacAddress const& MacAddress) const
{
	std::shared_lock Lock(Mutex);
	if (auto const It = ActiveSessions.find(NormalizeMac(MacAddress)); It != ActiveSessions.end())
	{
		return It->second.GetRouter();
	}
	return std::nullopt;
}

RTrackerStatistics RRoamingTracker::GetStatistics() const
{
	std::shared_lock Lock(Mutex);
	return Statistics;
}
