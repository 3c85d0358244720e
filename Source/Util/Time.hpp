/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "Singleton.hpp"
#include "Types.hpp"

namespace RTime
{
	RMsec GetEpochMs();

	double GetMonotonicSeconds();

	// 2026-10-17T08:15:02.125Z, always UTC with millisecond precision
	std::string ToIso8601(RMsec Time);

	// Accepts 'T' or ' ' as separator, optional fraction and an optional
	// 'Z' or +HH:MM / -HH:MM suffix. Naive timestamps are taken as UTC.
	std::optional<RMsec> FromIso8601(std::string const& Str);

	// format as HH:MM:SS
	std::string FormatDuration(RSeconds Duration);
} // namespace RTime

using RClock = std::function<RMsec()>;

class RTimer
{
	double const          Interval{};
	double                ElapsedTime{ 0.0 };
	std::function<void()> Callback{};
	friend class RTimerManager;
	bool Update(double DeltaTime)
	{
		ElapsedTime += DeltaTime;
		if (ElapsedTime >= Interval)
		{
			ElapsedTime -= Interval;
			return true;
		}
		return false;
	}
	RTimer(double IntervalSeconds, std::function<void()> Callback_);
};

class RTimerManager : public TSingleton<RTimerManager>
{
	std::vector<RTimer> Timers{};
	double              LastUpdateTime{};

public:
	void AddTimer(double IntervalSeconds, std::function<void()> Callback);

	void Start(double CurrentTime) { LastUpdateTime = CurrentTime; }
	void UpdateTimers(double CurrentTime);
	void Clear() { Timers.clear(); }
};
