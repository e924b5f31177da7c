#include "timeutil.h"

#include <stdio.h>
#include <string.h>

namespace {
	// stolen from stackoverflow
	int days_from_civil(int y, int m, int d)
	{
		y -= m <= 2;
		int era = (y >= 0 ? y : y - 399) / 400;
		int yoe = y - era * 400;                                   // [0, 399]
		int doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;  // [0, 365]
		int doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;           // [0, 146096]
		return era * 146097 + doe - 719468;
	}
}

time_t timeutil::timegm(tm const* t)
{
	int year = t->tm_year + 1900;
	int month = t->tm_mon;
	if (month > 11)
	{
		year += month / 12;
		month %= 12;
	}
	else if (month < 0)
	{
		int years_diff = (11 - month) / 12;
		year -= years_diff;
		month += 12 * years_diff;
	}
	int days_since_1970 = days_from_civil(year, month + 1, t->tm_mday);

	return 60 * (60 * (24L * days_since_1970 + t->tm_hour) + t->tm_min) + t->tm_sec;
}

bool timeutil::from_iso8601(const char * ts, int64_t& out) {
	struct tm parsed{};
	int consumed = 0;
	if (sscanf(ts, "%4d-%2d-%2dT%2d:%2d:%2d%n", &parsed.tm_year, &parsed.tm_mon, &parsed.tm_mday,
				&parsed.tm_hour, &parsed.tm_min, &parsed.tm_sec, &consumed) != 6 || consumed == 0)
		return false;

	if (parsed.tm_mon < 1 || parsed.tm_mon > 12 || parsed.tm_mday < 1 || parsed.tm_mday > 31 ||
		parsed.tm_hour < 0 || parsed.tm_hour > 23 || parsed.tm_min < 0 || parsed.tm_min > 59 ||
		parsed.tm_sec < 0 || parsed.tm_sec > 60)
		return false;

	const char * rest = ts + consumed;

	// Fractional seconds are dropped
	if (*rest == '.') {
		++rest;
		while (*rest >= '0' && *rest <= '9') ++rest;
	}

	int64_t offset = 0;
	if (*rest == 'Z') {
		++rest;
	}
	else if (*rest == '+' || *rest == '-') {
		int oh = 0, om = 0, n = 0;
		if (sscanf(rest + 1, "%2d:%2d%n", &oh, &om, &n) != 2 || n != 5) return false;
		offset = (oh * 60 + om) * 60;
		if (*rest == '-') offset = -offset;
		rest += 1 + n;
	}
	if (*rest != 0) return false;

	parsed.tm_mon -= 1;
	parsed.tm_year -= 1900;
	out = (int64_t)timeutil::timegm(&parsed) - offset;
	return true;
}
