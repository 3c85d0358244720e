/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "DeviceProfile.hpp"

char const* MobilityPatternToString(EMobilityPattern Pattern)
{
	switch (Pattern)
	{
		case MP_Static:
			return "static";
		case MP_Mobile:
			return "mobile";
		case MP_HighlyMobile:
			return "highly_mobile";
	}
	return "static";
}

EMobilityPattern MobilityPatternFromString(std::string const& Str)
{
	if (Str == "highly_mobile")
	{
		return MP_HighlyMobile;
	}
	if (Str == "mobile")
	{
		return MP_Mobile;
	}
	return MP_Static;
}

EMobilityPattern ClassifyMobility(double RoamsPerHour)
{
	if (RoamsPerHour > kHighlyMobileRoamsPerHour)
	{
		return MP_HighlyMobile;
	}
	if (RoamsPerHour > kMobileRoamsPerHour)
	{
		return MP_Mobile;
	}
	return MP_Static;
}
