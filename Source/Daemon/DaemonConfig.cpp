/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "DaemonConfig.hpp"

#include <INIReader.h>
#include <spdlog/spdlog.h>

#include "Filesystem.hpp"

RDaemonConfig::RDaemonConfig()
{
	SetDefaults();
	if (RFilesystem::Exists("./roamwatchd.ini"))
	{
		Load("./roamwatchd.ini");
	}
	else if (RFilesystem::Exists("/etc/roamwatch/roamwatchd.ini"))
	{
		Load("/etc/roamwatch/roamwatchd.ini");
	}
	else
	{
		spdlog::info("no configuration file found, using defaults");
	}
}

void RDaemonConfig::LogConfig() const
{
	spdlog::info("snapshot path={}", SnapshotPath);
	spdlog::info("state path={}", StatePath);
	spdlog::info("report path={}", ReportPath);
	spdlog::info("poll interval={}s, persist interval={}s, cleanup interval={}s", PollIntervalSeconds,
		PersistIntervalSeconds, CleanupIntervalSeconds);
	spdlog::info("max history={} days, roaming threshold={}s, weak signal threshold={}", Tracker.MaxHistoryDays,
		Tracker.RoamingThresholdSeconds, Tracker.WeakSignalThreshold);
}

bool RDaemonConfig::Load(std::string const& Path)
{
	INIReader Reader(Path);

	if (Reader.ParseError() < 0)
	{
		spdlog::error("can't load '{}': {}", Path, Reader.ParseErrorMessage());
		return false;
	}
	if (Reader.ParseError() > 0)
	{
		spdlog::error("can't load '{}': syntax error on line {}", Path, Reader.ParseError());
		return false;
	}

	auto SafeGet = [&](std::string const& Section, std::string const& Name, std::string& OutVal) {
		if (Reader.HasValue(Section, Name))
		{
			OutVal = Reader.Get(Section, Name, OutVal);
		}
	};

	// Keeps the old value for anything that is not a positive number
	auto SafeGetPositive = [&](std::string const& Section, std::string const& Name, double& OutVal) {
		if (!Reader.HasValue(Section, Name))
		{
			return;
		}
		auto const Value = Reader.GetReal(Section, Name, -1.0);
		if (Value <= 0)
		{
			spdlog::warn("ignoring {}.{}='{}', expected a positive number", Section, Name, Reader.Get(Section, Name, ""));
			return;
		}
		OutVal = Value;
	};

	auto const HistoryDays = Reader.GetInteger("tracker", "max_history_days", Tracker.MaxHistoryDays);
	if (HistoryDays > 0)
	{
		Tracker.MaxHistoryDays = static_cast<int>(HistoryDays);
	}
	else
	{
		spdlog::warn("ignoring tracker.max_history_days={}, expected at least one day", HistoryDays);
	}

	// 0 disables the roam debounce
	auto const Threshold = Reader.GetReal("tracker", "roaming_threshold_seconds", Tracker.RoamingThresholdSeconds);
	Tracker.RoamingThresholdSeconds = Threshold < 0 ? 0.0 : Threshold;
	Tracker.WeakSignalThreshold = Reader.GetReal("tracker", "weak_signal_threshold", Tracker.WeakSignalThreshold);

	SafeGet("daemon", "snapshot_path", SnapshotPath);
	SafeGet("daemon", "state_path", StatePath);
	SafeGet("daemon", "report_path", ReportPath);
	SafeGet("daemon", "log_level", LogLevel);
	SafeGetPositive("daemon", "poll_interval_seconds", PollIntervalSeconds);
	SafeGetPositive("daemon", "persist_interval_seconds", PersistIntervalSeconds);
	SafeGetPositive("daemon", "cleanup_interval_seconds", CleanupIntervalSeconds);

	spdlog::info("loaded configuration from '{}'", Path);
	return true;
}

void RDaemonConfig::SetDefaults()
{
	Tracker = RTrackerConfig{};
	SnapshotPath = "/var/lib/roamwatch/snapshot.json";
	StatePath = "/var/lib/roamwatch/history.json";
	ReportPath = "/var/lib/roamwatch/report.json";
	LogLevel = "info";
	PollIntervalSeconds = 30.0;
	PersistIntervalSeconds = 300.0;
	CleanupIntervalSeconds = 3600.0;
}
