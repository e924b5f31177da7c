#ifndef HC_TIMEUTIL_H
#define HC_TIMEUTIL_H

#include <stdint.h>
#include <time.h>

namespace timeutil {
	constexpr int64_t seconds_per_hour = 3600;

	time_t timegm(tm const* t);

	// Parses "YYYY-MM-DDTHH:MM:SS[.frac]" followed by "Z", "+HH:MM" / "-HH:MM" or nothing (taken as UTC)
	// into unix seconds. Returns false if ts is not in that shape.
	bool from_iso8601(const char * ts, int64_t& out);

	// Start of the hour containing t
	inline int64_t floor_hour(int64_t t) {
		int64_t r = t % seconds_per_hour;
		if (r < 0) r += seconds_per_hour;
		return t - r;
	}
}

#endif
