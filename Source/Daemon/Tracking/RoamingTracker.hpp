/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>
#include <sigslot/signal.hpp>

#include "DeviceSession.hpp"
#include "StateStore.hpp"
#include "Time.hpp"
#include "Types.hpp"
#include "Data/DeviceDescriptor.hpp"
#include "Data/DeviceProfile.hpp"
#include "Data/RoamingEvent.hpp"
#include "Data/TrackerState.hpp"

struct RTrackerConfig
{
	int    MaxHistoryDays{ 30 };
	double RoamingThresholdSeconds{ 5.0 };
	double WeakSignalThreshold{ 30.0 };
};

struct RRouterStatistics
{
	RRouterId Router{};
	uint64_t  TotalConnections{ 0 }; // connects + roam-ins in the event log
	uint64_t  ActiveConnections{ 0 };
	uint64_t  RoamsIn{ 0 };
	uint64_t  RoamsOut{ 0 };
	uint64_t  Disconnects{ 0 };
	double    AverageSignal{ 0.0 }; // over active sessions
};

struct RMobilityReport
{
	RMsec                                  GeneratedAt{ 0 };
	RTrackerStatistics                     Statistics{};
	std::vector<RDeviceProfile>            Profiles{};
	std::vector<RDeviceSession>            ActiveSessions{};
	std::map<RRouterId, RRouterStatistics> RouterStatistics{};
	std::vector<RRoamingEvent>             RecentEvents{};
};

// Prior-session facts the roam trigger heuristic looks at
struct RRoamContext
{
	double       PriorAverageSignal{ 0.0 };
	ESignalTrend PriorTrend{ ST_Stable };
	RSeconds     PriorDuration{ 0.0 };
	double       NewSignal{ 0.0 };
};

// First matching rule wins: weak signal, degrading trend, better signal, quick handover
ERoamTrigger ClassifyRoamTrigger(RRoamContext const& Context, double WeakSignalThreshold);

// Keeps track of which router each device is on, turns poll snapshots into
// connect/roam/disconnect events and maintains per-device mobility profiles.
class RRoamingTracker
{
	// Guards everything below. Updates and cleanup take it exclusively, queries shared.
	mutable std::shared_mutex Mutex;

	// Serializes store writes, taken before Mutex
	std::mutex SaveMutex;

	RTrackerConfig               Config;
	std::shared_ptr<IStateStore> Store;
	RClock                       Clock;

	// ordered by mac so disconnects of one cycle come out in a stable order
	std::map<RMacAddress, RDeviceSession>           ActiveSessions;
	std::vector<RRoamingEvent>                      Events;
	std::unordered_map<RMacAddress, RDeviceProfile> Profiles;
	RTrackerStatistics                              Statistics;

	// Everything private below expects Mutex to be held by the caller
	void HandleConnect(RDeviceDescriptor const& Device, RRouterId const& Router, RMsec Now,
		std::vector<RRoamingEvent>& OutEmitted);
	void HandleRoam(RDeviceSession& Prior, RDeviceDescriptor const& Device, RRouterId const& Router, RMsec Now,
		std::vector<RRoamingEvent>& OutEmitted);
	void HandleDisconnect(RDeviceSession& Session, RMsec Now, std::vector<RRoamingEvent>& OutEmitted);

	void PushEventLocked(RRoamingEvent Event, std::vector<RRoamingEvent>& OutEmitted);
	void UpdateProfileLocked(RRoamingEvent const& Event);
	void RecomputeStatisticsLocked(RMsec Now);

	[[nodiscard]] RTrackerState CopyStateLocked() const;
	[[nodiscard]] std::vector<RRoamingEvent> GetRoamingEventsLocked(
		double Hours, std::optional<RMacAddress> const& MacAddress, RMsec Now) const;
	[[nodiscard]] std::map<RRouterId, RRouterStatistics> GetRouterStatisticsLocked() const;

public:
	explicit RRoamingTracker(
		RTrackerConfig const& Config_, std::shared_ptr<IStateStore> Store_ = nullptr, RClock Clock_ = nullptr);

	// Fired once per emitted event after the update released its lock
	sigslot::signal<RRoamingEvent const&> OnRoamingEvent;

	// Replaces events, profiles and statistics with what the store holds
	bool Load();
	bool Save();

	// The single mutating entry point, called once per poll cycle. Every
	// event and session boundary of the cycle is stamped with Now.
	void UpdateDeviceLocations(RSnapshot const& Snapshot, RMsec Now);
	void UpdateDeviceLocations(RSnapshot const& Snapshot) { UpdateDeviceLocations(Snapshot, Clock()); }

	// Prunes old events and stale profiles, then saves
	void CleanupOldData(RMsec Now);
	void CleanupOldData() { CleanupOldData(Clock()); }

	[[nodiscard]] std::vector<RRoamingEvent> GetRoamingEvents(
		double Hours = 24, std::optional<RMacAddress> const& MacAddress = std::nullopt) const;
	[[nodiscard]] std::optional<RDeviceProfile>          GetDeviceProfile(RMacAddress const& MacAddress) const;
	[[nodiscard]] std::vector<RDeviceSession>            GetActiveSessions() const;
	[[nodiscard]] std::map<RRouterId, RRouterStatistics> GetRouterStatistics() const;
	[[nodiscard]] RMobilityReport                        GetMobilityReport() const;
	[[nodiscard]] std::optional<RRouterId>               GetDeviceCurrentRouter(RMacAddress const& MacAddress) const;
	[[nodiscard]] RTrackerStatistics                     GetStatistics() const;

	[[nodiscard]] RTrackerConfig const& GetConfig() const { return Config; }
};
