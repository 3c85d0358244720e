/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "Daemon.hpp"
#include "DaemonConfig.hpp"

#include <cstdlib>
#include <spdlog/spdlog.h>

int main(int argc, char** argv)
{
	if (std::getenv("INVOCATION_ID") != nullptr)
	{
		// Running under systemd so we don't need the timestamp from spdlog
		spdlog::set_pattern("[%^%l%$] %v");
	}

	auto& Config = RDaemonConfig::GetInstance();
	if (argc > 1 && !Config.Load(argv[1]))
	{
		spdlog::critical("Can't use configuration '{}'", argv[1]);
		return -1;
	}
	spdlog::set_level(spdlog::level::from_str(Config.LogLevel));

	spdlog::info("Roamwatch daemon starting");
	Config.LogConfig();

	auto& Daemon = RDaemon::GetInstance();
	if (!Daemon.Init())
	{
		spdlog::error("Failed to initialize roaming tracker");
		return -1;
	}
	Daemon.RegisterSignalHandlers();

	Daemon.RunLoop();
	Daemon.Shutdown();
	spdlog::info("Roamwatch daemon stopped");
	return 0;
}
