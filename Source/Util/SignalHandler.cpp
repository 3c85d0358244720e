/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "SignalHandler.hpp"

#include <csignal>
#include <spdlog/spdlog.h>

#include "ErrnoUtil.hpp"

static void OnStopSignal(int)
{
	RSignalHandler::GetInstance().bStop = true;
}

static void OnFlushSignal(int)
{
	RSignalHandler::GetInstance().bFlushRequested = true;
}

static void Install(int Signal, void (*Handler)(int))
{
	if (signal(Signal, Handler) == SIG_ERR)
	{
		spdlog::error("Failed to install handler for signal {}: {}", Signal, RErrnoUtil::StrError());
	}
}

RSignalHandler::RSignalHandler()
{
	Install(SIGINT, OnStopSignal);
	Install(SIGTERM, OnStopSignal);
	Install(SIGHUP, OnFlushSignal);
}
