/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>

#include "Filesystem.hpp"
#include "StateStore.hpp"

// Stores the tracker state as a single JSON document:
// { "events": [...], "device_profiles": [...], "statistics": {...}, "last_updated": "..." }
class RJsonStateStore final : public IStateStore
{
	stdfs::path Path;

public:
	explicit RJsonStateStore(stdfs::path Path_);

	bool Load(RTrackerState& OutState) override;
	bool Save(RTrackerState const& State) override;

	[[nodiscard]] stdfs::path const& GetPath() const { return Path; }
};
