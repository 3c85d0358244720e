/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "Daemon.hpp"

#include <chrono>
#include <thread>
#include <spdlog/spdlog.h>

#include "DaemonConfig.hpp"
#include "Filesystem.hpp"
#include "SignalHandler.hpp"
#include "Time.hpp"
#include "Tracking/JsonStateStore.hpp"
#include "Tracking/ReportJson.hpp"

bool RDaemon::Init()
{
	auto const& Config = RDaemonConfig::GetInstance();

	if (Config.SnapshotPath.empty())
	{
		spdlog::critical("No snapshot path configured, nothing to track");
		return false;
	}

	if (!RFilesystem::EnsureParentDirectory(Config.StatePath))
	{
		spdlog::warn("State directory for '{}' is not available, history will not survive a restart",
			Config.StatePath);
	}

	auto Store = std::make_shared<RJsonStateStore>(Config.StatePath);
	Tracker = std::make_unique<RRoamingTracker>(Config.Tracker, Store);
	SnapshotReader = std::make_unique<RSnapshotReader>(Config.SnapshotPath);

	Tracker->Load();
	auto const Stats = Tracker->GetStatistics();
	spdlog::info("Tracking {} known devices, {} events in history", Stats.TotalDevices, Stats.TotalEvents);
	return true;
}

void RDaemon::RegisterSignalHandlers()
{
	// touching the handler installs it
	RSignalHandler::GetInstance();

	Tracker->OnRoamingEvent.connect([this](RRoamingEvent const& Event) {
		++EventsSinceReport;
		if (Event.EventType == ET_Roam && Event.TriggerReason == RT_WeakSignal)
		{
			spdlog::warn("{} left {} because of weak signal (avg below {})", Event.MacAddress, Event.FromRouter,
				Tracker->GetConfig().WeakSignalThreshold);
		}
	});
}

void RDaemon::PollSnapshot()
{
	auto Parsed = SnapshotReader->ReadIfChanged();
	if (!Parsed)
	{
		return;
	}

	if (Parsed->SkippedDevices > 0)
	{
		spdlog::warn("Snapshot contained {} malformed device entries", Parsed->SkippedDevices);
	}

	try
	{
		Tracker->UpdateDeviceLocations(Parsed->Snapshot, Parsed->Timestamp.value_or(RTime::GetEpochMs()));
	}
	catch (std::exception const& e)
	{
		// the next snapshot is applied in full, nothing to roll back
		spdlog::error("Failed to apply snapshot: {}", e.what());
	}
}

void RDaemon::Persist()
{
	if (!Tracker->Save())
	{
		spdlog::warn("Saving history failed, keeping state in memory until the next attempt");
	}
	WriteReport();
}

void RDaemon::Cleanup()
{
	Tracker->CleanupOldData();
}

void RDaemon::WriteReport() const
{
	auto const& Path = RDaemonConfig::GetInstance().ReportPath;
	if (Path.empty())
	{
		return;
	}

	auto const Report = RReportJson::MobilityReportToJson(Tracker->GetMobilityReport());
	if (!RFilesystem::WriteFileAtomic(Path, Report.dump()))
	{
		spdlog::warn("Failed to write mobility report to '{}'", Path);
	}
}

void RDaemon::RunLoop()
{
	auto const&     Config = RDaemonConfig::GetInstance();
	RSignalHandler& SignalHandler = RSignalHandler::GetInstance();
	RTimerManager&  Timers = RTimerManager::GetInstance();

	Timers.AddTimer(Config.PollIntervalSeconds, [this] { PollSnapshot(); });
	Timers.AddTimer(Config.PersistIntervalSeconds, [this] { Persist(); });
	Timers.AddTimer(Config.CleanupIntervalSeconds, [this] { Cleanup(); });
	Timers.Start(RTime::GetMonotonicSeconds());

	PollSnapshot();

	auto LastPrint = std::chrono::steady_clock::now();
	while (!SignalHandler.bStop)
	{
		Timers.UpdateTimers(RTime::GetMonotonicSeconds());

		if (SignalHandler.bFlushRequested.exchange(false))
		{
			spdlog::info("Flush requested");
			Persist();
		}

		auto const Now = std::chrono::steady_clock::now();
		if (Now - LastPrint >= std::chrono::minutes(10))
		{
			auto const Stats = Tracker->GetStatistics();
			spdlog::info("{} devices active, {} known, {} roams total, {} events since last summary",
				Stats.ActiveDevices, Stats.TotalDevices, Stats.TotalRoams, EventsSinceReport);
			EventsSinceReport = 0;
			LastPrint = Now;
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(100));
	}
	Timers.Clear();
}

void RDaemon::Shutdown()
{
	if (!Tracker)
	{
		return;
	}
	spdlog::info("Saving history before exit");
	Persist();
}
