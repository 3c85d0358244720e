/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <fstream>
#include <thread>
#include <gtest/gtest.h>
#include <spdlog/fmt/fmt.h>

#include "Json.hpp"
#include "TrackerTestUtil.hpp"
#include "Tracking/JsonStateStore.hpp"

class JsonStateStoreTest : public ::testing::Test
{
protected:
	stdfs::path Dir;

	void SetUp() override
	{
		auto const* Info = ::testing::UnitTest::GetInstance()->current_test_info();
		Dir = stdfs::temp_directory_path() / (std::string("roamwatch-store-") + Info->name());
		stdfs::remove_all(Dir);
		stdfs::create_directories(Dir);
	}

	void TearDown() override
	{
		std::error_code ec;
		stdfs::remove_all(Dir, ec);
	}

	static RTrackerState MakeState()
	{
		RTrackerState State{};

		RRoamingEvent Connect{};
		Connect.Timestamp = kBaseTime;
		Connect.MacAddress = "AA:BB:CC:DD:EE:01";
		Connect.Hostname = "phone";
		Connect.IpAddress = "192.168.178.20";
		Connect.ToRouter = "office";
		Connect.EventType = ET_Connect;
		Connect.SignalAfter = 64;
		State.Events.push_back(Connect);

		RRoamingEvent Roam = Connect;
		Roam.Timestamp = kBaseTime + Minutes(12.5);
		Roam.FromRouter = "office";
		Roam.ToRouter = "kitchen";
		Roam.EventType = ET_Roam;
		Roam.SignalBefore = 22;
		Roam.SignalAfter = 71;
		Roam.SessionDuration = 750.0;
		Roam.TriggerReason = RT_WeakSignal;
		State.Events.push_back(Roam);

		RRoamingEvent Disconnect{};
		Disconnect.Timestamp = kBaseTime + Minutes(20);
		Disconnect.MacAddress = "AA:BB:CC:DD:EE:02";
		Disconnect.FromRouter = "garage";
		Disconnect.EventType = ET_Disconnect;
		Disconnect.Medium = CM_Ethernet;
		Disconnect.SessionDuration = 0.5;
		State.Events.push_back(Disconnect);

		RDeviceProfile Profile{};
		Profile.MacAddress = "AA:BB:CC:DD:EE:01";
		Profile.Hostname = "phone";
		Profile.DeviceType = MP_Mobile;
		Profile.RoutersSeen = { "kitchen", "office" };
		Profile.RoamingFrequency = 0.625;
		Profile.AvgSessionDuration = 750.0;
		Profile.FirstSeen = kBaseTime;
		Profile.LastSeen = Roam.Timestamp;
		Profile.LastRouter = "kitchen";
		Profile.TotalRoams = 1;
		Profile.TotalSessions = 2;
		State.Profiles.push_back(Profile);

		State.Statistics.TotalRoams = 17;
		State.Statistics.TotalDevices = 2;
		State.Statistics.ActiveDevices = 1;
		State.Statistics.RoamingDevices = 1;
		State.Statistics.TotalEvents = 3;
		State.Statistics.LastUpdate = kBaseTime + Minutes(20);
		State.LastUpdated = kBaseTime + Minutes(21);
		return State;
	}
};

TEST_F(JsonStateStoreTest, RoundTripsEveryField)
{
	RJsonStateStore Store(Dir / "state.json");
	auto const      Original = MakeState();
	ASSERT_TRUE(Store.Save(Original));

	RTrackerState Loaded{};
	ASSERT_TRUE(Store.Load(Loaded));
	EXPECT_EQ(Loaded.Events, Original.Events);
	EXPECT_EQ(Loaded.Profiles, Original.Profiles);
	EXPECT_EQ(Loaded.Statistics, Original.Statistics);
	EXPECT_EQ(Loaded.LastUpdated, Original.LastUpdated);
}

TEST_F(JsonStateStoreTest, WritesDocumentedTopLevelKeys)
{
	RJsonStateStore Store(Dir / "state.json");
	ASSERT_TRUE(Store.Save(MakeState()));

	auto const Content = RFilesystem::ReadFile(Store.GetPath());
	ASSERT_TRUE(Content.has_value());

	std::string Err;
	auto const  Json = RJson::parse(*Content, Err);
	ASSERT_TRUE(Err.empty()) << Err;
	EXPECT_TRUE(Json["events"].is_array());
	EXPECT_TRUE(Json["device_profiles"].is_array());
	EXPECT_TRUE(Json["statistics"].is_object());
	EXPECT_EQ(Json["last_updated"].string_value(), "2026-10-17T00:21:00.000Z");

	auto const& Roam = Json["events"].array_items().at(1);
	EXPECT_EQ(Roam["event_type"].string_value(), "roam");
	EXPECT_EQ(Roam["trigger_reason"].string_value(), "weak_signal");
	EXPECT_EQ(Roam["timestamp"].string_value(), "2026-10-17T00:12:30.000Z");

	auto TempPath = Store.GetPath();
	TempPath += ".tmp";
	EXPECT_FALSE(RFilesystem::Exists(TempPath));
}

TEST_F(JsonStateStoreTest, CreatesMissingDirectories)
{
	RJsonStateStore Store(Dir / "nested" / "deeper" / "state.json");
	EXPECT_TRUE(Store.Save(MakeState()));
	EXPECT_TRUE(RFilesystem::Exists(Store.GetPath()));
}

TEST_F(JsonStateStoreTest, MissingFileStartsEmpty)
{
	RJsonStateStore Store(Dir / "nope.json");
	RTrackerState   Loaded = MakeState();
	EXPECT_FALSE(Store.Load(Loaded));
	EXPECT_TRUE(Loaded.Events.empty());
	EXPECT_TRUE(Loaded.Profiles.empty());
	EXPECT_EQ(Loaded.Statistics.TotalRoams, 0u);
}

TEST_F(JsonStateStoreTest, CorruptFileStartsEmpty)
{
	auto const Path = Dir / "state.json";
	{
		std::ofstream ofs(Path);
		ofs << "{ \"events\": [ { \"timestamp\": ";
	}

	RJsonStateStore Store(Path);
	RTrackerState   Loaded = MakeState();
	EXPECT_FALSE(Store.Load(Loaded));
	EXPECT_TRUE(Loaded.Events.empty());
	EXPECT_TRUE(Loaded.Profiles.empty());
}

TEST_F(JsonStateStoreTest, BadTimestampIsCorrupt)
{
	RJsonStateStore Store(Dir / "state.json");
	ASSERT_TRUE(Store.Save(MakeState()));

	auto Content = *RFilesystem::ReadFile(Store.GetPath());
	auto const Pos = Content.find("2026-10-17T00:00:00.000Z");
	ASSERT_NE(Pos, std::string::npos);
	Content.replace(Pos, 24, "last tuesday, roughly   ");
	ASSERT_TRUE(RFilesystem::WriteFileAtomic(Store.GetPath(), Content));

	RTrackerState Loaded{};
	EXPECT_FALSE(Store.Load(Loaded));
	EXPECT_TRUE(Loaded.Events.empty());
}

TEST_F(JsonStateStoreTest, ConcurrentSavesAllSucceed)
{
	RRoamingTracker Tracker(RTrackerConfig{}, std::make_shared<RJsonStateStore>(Dir / "state.json"),
		[] { return kBaseTime; });

	// enough devices that one write takes a while
	RSnapshot Snapshot;
	for (int i = 0; i < 2000; ++i)
	{
		Snapshot["office"].push_back(MakeDevice(fmt::format("AA:BB:CC:{:02X}:{:02X}:01", i / 256, i % 256)));
	}
	Tracker.UpdateDeviceLocations(Snapshot, kBaseTime);

	for (int Round = 0; Round < 20; ++Round)
	{
		bool       bFirst{ false };
		bool       bSecond{ false };
		std::thread First([&] { bFirst = Tracker.Save(); });
		std::thread Second([&] { bSecond = Tracker.Save(); });
		First.join();
		Second.join();
		ASSERT_TRUE(bFirst) << "round " << Round;
		ASSERT_TRUE(bSecond) << "round " << Round;
	}

	RTrackerState Loaded{};
	ASSERT_TRUE(RJsonStateStore(Dir / "state.json").Load(Loaded));
	EXPECT_EQ(Loaded.Events.size(), 2000u);
}

TEST(RoamingEventTest, OnlyKnowsCurrentTypeNames)
{
	EXPECT_EQ(RoamingEventTypeFromString("roam"), ET_Roam);
	EXPECT_EQ(RoamingEventTypeFromString("connect"), ET_Connect);
	EXPECT_FALSE(RoamingEventTypeFromString("roaming").has_value());
}

TEST_F(JsonStateStoreTest, TrackerSurvivesRestart)
{
	auto const Path = Dir / "state.json";
	RMsec      Now = kBaseTime;
	auto       Clock = [&Now] { return Now; };

	{
		RRoamingTracker Tracker(RTrackerConfig{}, std::make_shared<RJsonStateStore>(Path), Clock);
		Tracker.UpdateDeviceLocations({ { "office", { MakeDevice("AA:BB:CC:DD:EE:01") } } }, Now);
		Now += Minutes(3);
		Tracker.UpdateDeviceLocations({ { "kitchen", { MakeDevice("AA:BB:CC:DD:EE:01") } } }, Now);
		ASSERT_TRUE(Tracker.Save());
	}

	RRoamingTracker Restarted(RTrackerConfig{}, std::make_shared<RJsonStateStore>(Path), Clock);
	ASSERT_TRUE(Restarted.Load());
	EXPECT_EQ(Restarted.GetRoamingEvents(1).size(), 2u);
	EXPECT_EQ(Restarted.GetStatistics().TotalRoams, 1u);
	EXPECT_TRUE(Restarted.GetActiveSessions().empty());

	auto const Profile = Restarted.GetDeviceProfile("AA:BB:CC:DD:EE:01");
	ASSERT_TRUE(Profile.has_value());
	EXPECT_EQ(Profile->LastRouter, "kitchen");
	EXPECT_DOUBLE_EQ(Profile->AvgSessionDuration, 180.0);
}
