/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "Time.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <utility>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace RTime
{
	RMsec GetEpochMs()
	{
		return std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::system_clock::now().time_since_epoch())
			.count();
	}

	double GetMonotonicSeconds()
	{
		return std::chrono::duration<double>(std::chrono::steady_clock::now().time_since_epoch()).count();
	}

	std::string ToIso8601(RMsec Time)
	{
		// floor division so pre-epoch values keep a positive millisecond part
		RMsec Seconds = Time / kMsecPerSecond;
		RMsec Millis = Time % kMsecPerSecond;
		if (Millis < 0)
		{
			Millis += kMsecPerSecond;
			--Seconds;
		}

		auto const Raw = static_cast<time_t>(Seconds);
		tm         Utc{};
		if (!gmtime_r(&Raw, &Utc))
		{
			spdlog::warn("can't convert timestamp {} to UTC", Time);
			return {};
		}

		return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z", Utc.tm_year + 1900, Utc.tm_mon + 1,
			Utc.tm_mday, Utc.tm_hour, Utc.tm_min, Utc.tm_sec, Millis);
	}

	std::optional<RMsec> FromIso8601(std::string const& Str)
	{
		int Year{}, Month{}, Day{}, Hour{}, Minute{}, Second{};
		int Consumed{ 0 };
		if (std::sscanf(Str.c_str(), "%4d-%2d-%2d%*1[T ]%2d:%2d:%2d%n", &Year, &Month, &Day, &Hour, &Minute,
				&Second, &Consumed)
				!= 6
			|| Consumed == 0)
		{
			return std::nullopt;
		}

		if (Month < 1 || Month > 12 || Day < 1 || Day > 31 || Hour < 0 || Hour > 23 || Minute < 0 || Minute > 59
			|| Second < 0 || Second > 60)
		{
			return std::nullopt;
		}

		auto Pos = static_cast<size_t>(Consumed);

		RMsec Millis{ 0 };
		if (Pos < Str.size() && Str[Pos] == '.')
		{
			++Pos;
			RMsec Scale{ 100 };
			size_t Digits{ 0 };
			while (Pos < Str.size() && std::isdigit(static_cast<unsigned char>(Str[Pos])))
			{
				// anything below a millisecond is dropped
				if (Scale > 0)
				{
					Millis += (Str[Pos] - '0') * Scale;
					Scale /= 10;
				}
				++Pos;
				++Digits;
			}
			if (Digits == 0)
			{
				return std::nullopt;
			}
		}

		RMsec Offset{ 0 };
		if (Pos < Str.size())
		{
			char const Sign = Str[Pos];
			if (Sign == 'Z' || Sign == 'z')
			{
				++Pos;
			}
			else if (Sign == '+' || Sign == '-')
			{
				int OffsetHours{}, OffsetMinutes{};
				if (std::sscanf(Str.c_str() + Pos + 1, "%2d:%2d", &OffsetHours, &OffsetMinutes) != 2)
				{
					return std::nullopt;
				}
				Offset = (OffsetHours * 3600 + OffsetMinutes * 60) * kMsecPerSecond;
				if (Sign == '-')
				{
					Offset = -Offset;
				}
				Pos += 6;
			}
			else
			{
				return std::nullopt;
			}
		}

		if (Pos != Str.size())
		{
			return std::nullopt;
		}

		tm Utc{};
		Utc.tm_year = Year - 1900;
		Utc.tm_mon = Month - 1;
		Utc.tm_mday = Day;
		Utc.tm_hour = Hour;
		Utc.tm_min = Minute;
		Utc.tm_sec = Second;

		auto const Seconds = timegm(&Utc);
		return static_cast<RMsec>(Seconds) * kMsecPerSecond + Millis - Offset;
	}

	std::string FormatDuration(RSeconds Duration)
	{
		auto const Total = static_cast<long>(std::lround(std::max(Duration, 0.0)));
		long const Hours = Total / 3600;
		long const Minutes = (Total % 3600) / 60;
		long const Seconds = Total % 60;
		return fmt::format("{:02}:{:02}:{:02}", Hours, Minutes, Seconds);
	}
} // namespace RTime

RTimer::RTimer(double IntervalSeconds, std::function<void()> Callback_)
	: Interval(IntervalSeconds), Callback(std::move(Callback_))
{
}

void RTimerManager::AddTimer(double IntervalSeconds, std::function<void()> Callback)
{
	if (IntervalSeconds <= 0)
	{
		spdlog::warn("ignoring timer with non-positive interval {}", IntervalSeconds);
		return;
	}
	RTimer Timer(IntervalSeconds, std::move(Callback));
	Timers.push_back(Timer);
}

void RTimerManager::UpdateTimers(double CurrentTime)
{
	auto const Delta = CurrentTime - LastUpdateTime;
	LastUpdateTime = CurrentTime;
	for (auto& Timer : Timers)
	{
		if (Timer.Update(Delta))
		{
			Timer.Callback();
		}
	}
}
