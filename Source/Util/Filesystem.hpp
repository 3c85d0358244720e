/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <spdlog/spdlog.h>

namespace stdfs = std::filesystem;

class RFilesystem
{
public:
	static bool Exists(stdfs::path const& p)
	{
		std::error_code ec;
		return stdfs::exists(p, ec);
	}

	static std::optional<std::string> ReadFile(stdfs::path const& Path)
	{
		std::ifstream FileStream(Path, std::ios::in | std::ios::binary);
		if (!FileStream)
		{
			return std::nullopt;
		}

		std::ostringstream ss;
		ss << FileStream.rdbuf();
		return ss.str();
	}

	// Returns the modification time in nanoseconds since the filesystem epoch, or nullopt if the file is gone
	static std::optional<int64_t> GetLastWriteTime(stdfs::path const& Path)
	{
		std::error_code ec;
		auto const      Time = stdfs::last_write_time(Path, ec);
		if (ec)
		{
			return std::nullopt;
		}
		return static_cast<int64_t>(Time.time_since_epoch().count());
	}

	static bool EnsureParentDirectory(stdfs::path const& Path)
	{
		auto const Parent = Path.parent_path();
		if (Parent.empty() || Exists(Parent))
		{
			return true;
		}

		std::error_code ec;
		if (!stdfs::create_directories(Parent, ec))
		{
			spdlog::error("Failed to create directory {}: {}", Parent.string(), ec.message());
			return false;
		}
		return true;
	}

	// Writes into a sibling temporary file and renames it over the target,
	// so readers only ever see the old or the new content.
	static bool WriteFileAtomic(stdfs::path const& Path, std::string const& Content)
	{
		if (!EnsureParentDirectory(Path))
		{
			return false;
		}

		stdfs::path TempPath = Path;
		TempPath += ".tmp";

		{
			std::ofstream ofs(TempPath, std::ios::out | std::ios::binary | std::ios::trunc);
			if (!ofs.is_open())
			{
				spdlog::error("Failed to open '{}' for writing", TempPath.string());
				return false;
			}
			ofs << Content;
			ofs.flush();
			if (!ofs.good())
			{
				spdlog::error("Failed to write '{}'", TempPath.string());
				ofs.close();
				RemoveQuietly(TempPath);
				return false;
			}
		}

		std::error_code ec;
		stdfs::rename(TempPath, Path, ec);
		if (ec)
		{
			spdlog::error("Failed to move '{}' to '{}': {}", TempPath.string(), Path.string(), ec.message());
			RemoveQuietly(TempPath);
			return false;
		}
		return true;
	}

private:
	static void RemoveQuietly(stdfs::path const& Path)
	{
		std::error_code ec;
		if (!stdfs::remove(Path, ec) && ec)
		{
			spdlog::debug("Failed to remove '{}': {}", Path.string(), ec.message());
		}
	}
};
