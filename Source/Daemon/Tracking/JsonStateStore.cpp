/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "JsonStateStore.hpp"

#include <sstream>
#include <utility>
#include <cereal/archives/json.hpp>
#include <cereal/types/vector.hpp>
#include <spdlog/spdlog.h>

RJsonStateStore::RJsonStateStore(stdfs::path Path_) : Path(std::move(Path_)) {}

bool RJsonStateStore::Load(RTrackerState& OutState)
{
	OutState = RTrackerState{};

	if (!RFilesystem::Exists(Path))
	{
		spdlog::warn("State file '{}' not found; starting with empty history", Path.string());
		return false;
	}

	auto const Content = RFilesystem::ReadFile(Path);
	if (!Content)
	{
		spdlog::warn("Can't read state file '{}'; starting with empty history", Path.string());
		return false;
	}

	RTrackerState Loaded{};
	try
	{
		std::istringstream       iss(*Content);
		cereal::JSONInputArchive ar(iss);
		std::string              LastUpdatedStr;
		ar(cereal::make_nvp("events", Loaded.Events), cereal::make_nvp("device_profiles", Loaded.Profiles),
			cereal::make_nvp("statistics", Loaded.Statistics), cereal::make_nvp("last_updated", LastUpdatedStr));
		Loaded.LastUpdated = RTime::FromIso8601(LastUpdatedStr).value_or(0);
	}
	catch (std::exception const& e)
	{
		spdlog::warn("State file '{}' is corrupt ({}); starting with empty history", Path.string(), e.what());
		return false;
	}

	OutState = std::move(Loaded);
	spdlog::info("Loaded {} events and {} device profiles from '{}'", OutState.Events.size(),
		OutState.Profiles.size(), Path.string());
	return true;
}

bool RJsonStateStore::Save(RTrackerState const& State)
{
	std::ostringstream oss;
	try
	{
		// the archive only finishes the document when it goes out of scope
		cereal::JSONOutputArchive ar(oss);
		std::string const         LastUpdatedStr = RTime::ToIso8601(State.LastUpdated);
		ar(cereal::make_nvp("events", State.Events), cereal::make_nvp("device_profiles", State.Profiles),
			cereal::make_nvp("statistics", State.Statistics), cereal::make_nvp("last_updated", LastUpdatedStr));
	}
	catch (std::exception const& e)
	{
		spdlog::error("Failed to serialize tracker state: {}", e.what());
		return false;
	}

	if (!RFilesystem::WriteFileAtomic(Path, oss.str()))
	{
		spdlog::error("Failed to save tracker state to '{}'", Path.string());
		return false;
	}

	spdlog::debug("Saved {} events and {} device profiles to '{}'", State.Events.size(), State.Profiles.size(),
		Path.string());
	return true;
}
