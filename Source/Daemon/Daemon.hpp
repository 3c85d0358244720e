/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <memory>

#include "Singleton.hpp"
#include "Tracking/RoamingTracker.hpp"
#include "Tracking/SnapshotReader.hpp"

class RDaemon : public TSingleton<RDaemon>
{
	std::unique_ptr<RRoamingTracker> Tracker{};
	std::unique_ptr<RSnapshotReader> SnapshotReader{};

	uint64_t EventsSinceReport{ 0 };

	void PollSnapshot();
	void Persist();
	void Cleanup();
	void WriteReport() const;

public:
	bool Init();
	void RegisterSignalHandlers();
	void RunLoop();
	void Shutdown();
};
