/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "SnapshotReader.hpp"

#include <cmath>
#include <limits>
#include <utility>
#include <spdlog/spdlog.h>

#include "Time.hpp"

RSnapshotReader::RSnapshotReader(stdfs::path Path_) : Path(std::move(Path_)) {}

static std::optional<RSignalStrength> ParseSignal(RJson const& Value)
{
	if (Value.is_number())
	{
		double const Number = Value.number_value();
		if (!std::isfinite(Number) || Number < std::numeric_limits<RSignalStrength>::min()
			|| Number > std::numeric_limits<RSignalStrength>::max())
		{
			return std::nullopt;
		}
		return static_cast<RSignalStrength>(std::lround(Number));
	}
	if (Value.is_string())
	{
		try
		{
			// stoi throws out_of_range past int, RSignalStrength is int32_t
			return static_cast<RSignalStrength>(std::stoi(Value.string_value()));
		}
		catch (std::exception const&)
		{
			return std::nullopt;
		}
	}
	return std::nullopt;
}

std::optional<RDeviceDescriptor> RSnapshotReader::ParseDevice(RJson const& Json)
{
	if (!Json.is_object())
	{
		return std::nullopt;
	}

	RDeviceDescriptor Device{};
	Device.MacAddress = NormalizeMac(Json[JSON_KEY_MAC].string_value());
	if (!Device.IsValid())
	{
		return std::nullopt;
	}

	Device.Hostname = Json[JSON_KEY_HOSTNAME].string_value();
	Device.IpAddress = Json[JSON_KEY_IP].string_value();
	Device.Medium = ConnectionMediumFromString(Json[JSON_KEY_CONNECTION_TYPE].string_value());

	if (auto const Signal = ParseSignal(Json[JSON_KEY_SIGNAL]))
	{
		Device.SignalStrength = *Signal;
	}
	else if (!Json[JSON_KEY_SIGNAL].is_null())
	{
		spdlog::warn("Invalid signal strength for {}, using 0", Device.MacAddress);
	}
	return Device;
}

std::optional<RParsedSnapshot> RSnapshotReader::Parse(std::string const& Document)
{
	std::string Err;
	auto const  Json = RJson::parse(Document, Err);
	if (!Err.empty() || !Json.is_object())
	{
		spdlog::error("Failed to parse snapshot: {}", Err.empty() ? "not a json object" : Err);
		return std::nullopt;
	}

	RParsedSnapshot Result{};
	auto const&     Routers = Json[JSON_KEY_ROUTERS].is_object() ? Json[JSON_KEY_ROUTERS] : Json;

	if (auto const& Timestamp = Json[JSON_KEY_TIMESTAMP]; Timestamp.is_string())
	{
		Result.Timestamp = RTime::FromIso8601(Timestamp.string_value());
		if (!Result.Timestamp)
		{
			spdlog::warn("Ignoring invalid snapshot timestamp '{}'", Timestamp.string_value());
		}
	}

	for (auto const& [Router, Devices] : Routers.object_items())
	{
		if (Router == JSON_KEY_TIMESTAMP && !Devices.is_array())
		{
			continue;
		}
		if (!Devices.is_array())
		{
			spdlog::warn("Skipping router {}: device list is not an array", Router);
			continue;
		}

		auto& Entries = Result.Snapshot[Router];
		for (auto const& DeviceJson : Devices.array_items())
		{
			if (auto Device = ParseDevice(DeviceJson))
			{
				Entries.push_back(std::move(*Device));
			}
			else
			{
				spdlog::warn("Skipping malformed device entry on {}: {}", Router, DeviceJson.dump());
				++Result.SkippedDevices;
			}
		}
	}
	return Result;
}

std::optional<RParsedSnapshot> RSnapshotReader::ReadIfChanged()
{
	auto const WriteTime = RFilesystem::GetLastWriteTime(Path);
	if (!WriteTime)
	{
		spdlog::debug("No snapshot at '{}' yet", Path.string());
		return std::nullopt;
	}
	if (LastWriteTime && *LastWriteTime == *WriteTime)
	{
		spdlog::debug("Snapshot '{}' unchanged since last cycle", Path.string());
		return std::nullopt;
	}

	auto const Content = RFilesystem::ReadFile(Path);
	if (!Content)
	{
		spdlog::error("Can't read snapshot '{}'", Path.string());
		return std::nullopt;
	}

	// remember the write time even for a broken file, the poller rewrites it next cycle anyway
	LastWriteTime = WriteTime;
	return Parse(*Content);
}
