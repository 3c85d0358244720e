/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>

#include "Singleton.hpp"
#include "Tracking/RoamingTracker.hpp"

struct RDaemonConfig final : TSingleton<RDaemonConfig>
{
	RTrackerConfig Tracker{};

	std::string SnapshotPath{ "/var/lib/roamwatch/snapshot.json" };
	std::string StatePath{ "/var/lib/roamwatch/history.json" };
	std::string ReportPath{ "/var/lib/roamwatch/report.json" };
	std::string LogLevel{ "info" };

	double PollIntervalSeconds{ 30.0 };
	double PersistIntervalSeconds{ 300.0 };
	double CleanupIntervalSeconds{ 3600.0 };

	RDaemonConfig();

	void LogConfig() const;

	// Overrides the current values with whatever the file sets, returns false if it can't be parsed
	bool Load(std::string const& Path);

	// Restores every value to its built-in default
	void SetDefaults();
};
