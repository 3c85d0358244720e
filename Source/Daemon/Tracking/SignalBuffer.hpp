/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <deque>

#include "Types.hpp"

enum ESignalTrend
{
	ST_Stable,
	ST_Improving,
	ST_Degrading,
};

char const* SignalTrendToString(ESignalTrend Trend);

struct RSignalSample
{
	RMsec           Timestamp{ 0 };
	RSignalStrength Strength{ 0 };
};

class RSignalBuffer
{
	std::deque<RSignalSample> Samples;

public:
	static constexpr std::size_t kMaxSamples = 100;
	static constexpr std::size_t kTrendWindow = 10;
	static constexpr double      kTrendThreshold = 5.0;

	void Record(RSignalStrength Strength, RMsec Timestamp);

	[[nodiscard]] double       Average() const;
	[[nodiscard]] ESignalTrend Trend() const;

	// Strength of the newest sample, 0 before the first one
	[[nodiscard]] RSignalStrength Latest() const { return Samples.empty() ? 0 : Samples.back().Strength; }

	[[nodiscard]] std::size_t Size() const { return Samples.size(); }

	[[nodiscard]] std::deque<RSignalSample> const& GetSamples() const { return Samples; }
};
