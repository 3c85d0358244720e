/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

#include <atomic>

#include "Singleton.hpp"

class RSignalHandler : public TSingleton<RSignalHandler>
{
public:
	RSignalHandler();

	std::atomic<bool> bStop{ false };

	// SIGHUP asks the daemon to write state and report right away
	std::atomic<bool> bFlushRequested{ false };
};
