/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <string>

#include "Filesystem.hpp"
#include "Json.hpp"
#include "Types.hpp"
#include "Data/DeviceDescriptor.hpp"

struct RParsedSnapshot
{
	RSnapshot            Snapshot{};
	std::optional<RMsec> Timestamp{}; // poll time if the poller wrote one
	std::size_t          SkippedDevices{ 0 };
};

// Reads the snapshot document the router poller drops once per cycle.
// Accepts { "<router>": [devices] } or { "routers": { ... }, "timestamp": "..." }.
class RSnapshotReader
{
	stdfs::path            Path;
	std::optional<int64_t> LastWriteTime{};

public:
	explicit RSnapshotReader(stdfs::path Path_);

	static std::optional<RParsedSnapshot> Parse(std::string const& Document);
	static std::optional<RDeviceDescriptor> ParseDevice(RJson const& Json);

	// Returns nullopt if the file is missing, unchanged since the last read or unparseable
	std::optional<RParsedSnapshot> ReadIfChanged();

	[[nodiscard]] stdfs::path const& GetPath() const { return Path; }
};
