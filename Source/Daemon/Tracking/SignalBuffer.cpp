/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "SignalBuffer.hpp"

#include <algorithm>

char const* SignalTrendToString(ESignalTrend Trend)
{
	switch (Trend)
	{
		case ST_Stable:
			return "stable";
		case ST_Improving:
			return "improving";
		case ST_Degrading:
			return "degrading";
	}
	return "stable";
}

void RSignalBuffer::Record(RSignalStrength Strength, RMsec Timestamp)
{
	Samples.push_back(RSignalSample{ .Timestamp = Timestamp, .Strength = Strength });
	if (Samples.size() > kMaxSamples)
	{
		Samples.pop_front();
	}
}

double RSignalBuffer::Average() const
{
	if (Samples.empty())
	{
		return 0.0;
	}

	double Sum{ 0.0 };
	for (auto const& Sample : Samples)
	{
		Sum += Sample.Strength;
	}
	return Sum / static_cast<double>(Samples.size());
}

ESignalTrend RSignalBuffer::Trend() const
{
	if (Samples.size() < 2)
	{
		return ST_Stable;
	}

	auto const Count = std::min(Samples.size(), kTrendWindow);
	auto const Begin = Samples.end() - static_cast<std::ptrdiff_t>(Count);
	// with an odd count the older half is the smaller one
	auto const Mid = Begin + static_cast<std::ptrdiff_t>(Count / 2);

	double Older{ 0.0 };
	for (auto It = Begin; It != Mid; ++It)
	{
		Older += It->Strength;
	}
	Older /= static_cast<double>(Count / 2);

	double Newer{ 0.0 };
	for (auto It = Mid; It != Samples.end(); ++It)
	{
		Newer += It->Strength;
	}
	Newer /= static_cast<double>(Count - Count / 2);

	double const Delta = Newer - Older;
	if (Delta >= kTrendThreshold)
	{
		return ST_Improving;
	}
	if (Delta <= -kTrendThreshold)
	{
		return ST_Degrading;
	}
	return ST_Stable;
}
