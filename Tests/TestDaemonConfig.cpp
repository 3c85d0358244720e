/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <fstream>
#include <gtest/gtest.h>

#include "DaemonConfig.hpp"
#include "Filesystem.hpp"

class DaemonConfigTest : public ::testing::Test
{
protected:
	stdfs::path Path;

	void SetUp() override
	{
		RDaemonConfig::GetInstance().SetDefaults();
		auto const* Info = ::testing::UnitTest::GetInstance()->current_test_info();
		Path = stdfs::temp_directory_path() / (std::string("roamwatchd-") + Info->name() + ".ini");
	}

	void TearDown() override
	{
		std::error_code ec;
		stdfs::remove(Path, ec);
		RDaemonConfig::GetInstance().SetDefaults();
	}

	void WriteIni(std::string const& Content) const
	{
		std::ofstream ofs(Path);
		ofs << Content;
	}
};

TEST_F(DaemonConfigTest, Defaults)
{
	auto const& Config = RDaemonConfig::GetInstance();
	EXPECT_EQ(Config.Tracker.MaxHistoryDays, 30);
	EXPECT_DOUBLE_EQ(Config.Tracker.RoamingThresholdSeconds, 5.0);
	EXPECT_DOUBLE_EQ(Config.Tracker.WeakSignalThreshold, 30.0);
	EXPECT_DOUBLE_EQ(Config.PollIntervalSeconds, 30.0);
	EXPECT_EQ(Config.LogLevel, "info");
}

TEST_F(DaemonConfigTest, LoadsBothSections)
{
	WriteIni("[tracker]\n"
			 "max_history_days = 14\n"
			 "roaming_threshold_seconds = 2.5\n"
			 "weak_signal_threshold = 25\n"
			 "[daemon]\n"
			 "snapshot_path = /tmp/snap.json\n"
			 "state_path = /tmp/state.json\n"
			 "poll_interval_seconds = 10\n"
			 "log_level = debug\n");

	auto& Config = RDaemonConfig::GetInstance();
	ASSERT_TRUE(Config.Load(Path.string()));
	EXPECT_EQ(Config.Tracker.MaxHistoryDays, 14);
	EXPECT_DOUBLE_EQ(Config.Tracker.RoamingThresholdSeconds, 2.5);
	EXPECT_DOUBLE_EQ(Config.Tracker.WeakSignalThreshold, 25.0);
	EXPECT_EQ(Config.SnapshotPath, "/tmp/snap.json");
	EXPECT_EQ(Config.StatePath, "/tmp/state.json");
	EXPECT_EQ(Config.ReportPath, "/var/lib/roamwatch/report.json");
	EXPECT_DOUBLE_EQ(Config.PollIntervalSeconds, 10.0);
	EXPECT_DOUBLE_EQ(Config.PersistIntervalSeconds, 300.0);
	EXPECT_EQ(Config.LogLevel, "debug");
}

TEST_F(DaemonConfigTest, IgnoresOutOfRangeValues)
{
	WriteIni("[tracker]\n"
			 "max_history_days = 0\n"
			 "roaming_threshold_seconds = -3\n"
			 "[daemon]\n"
			 "poll_interval_seconds = soon\n"
			 "cleanup_interval_seconds = -1\n");

	auto& Config = RDaemonConfig::GetInstance();
	ASSERT_TRUE(Config.Load(Path.string()));
	EXPECT_EQ(Config.Tracker.MaxHistoryDays, 30);
	EXPECT_DOUBLE_EQ(Config.Tracker.RoamingThresholdSeconds, 0.0);
	EXPECT_DOUBLE_EQ(Config.PollIntervalSeconds, 30.0);
	EXPECT_DOUBLE_EQ(Config.CleanupIntervalSeconds, 3600.0);
}

TEST_F(DaemonConfigTest, MissingFileKeepsValues)
{
	auto& Config = RDaemonConfig::GetInstance();
	Config.LogLevel = "warn";
	EXPECT_FALSE(Config.Load((stdfs::temp_directory_path() / "roamwatchd-does-not-exist.ini").string()));
	EXPECT_EQ(Config.LogLevel, "warn");
}

TEST_F(DaemonConfigTest, SyntaxErrorFails)
{
	WriteIni("[tracker\nmax_history_days = 3\n");
	EXPECT_FALSE(RDaemonConfig::GetInstance().Load(Path.string()));
}
