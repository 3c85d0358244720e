/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

#include "Data/TrackerState.hpp"

// Durable home of the tracker's events and profiles.
// Implementations never throw, failures are reported through the return value.
class IStateStore
{
public:
	IStateStore() = default;
	virtual ~IStateStore() = default;

	// Fills OutState. Returns false and leaves OutState empty when nothing usable was stored.
	virtual bool Load(RTrackerState& OutState) = 0;
	virtual bool Save(RTrackerState const& State) = 0;
};
