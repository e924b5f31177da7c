#ifndef HC_GRIDSERIES_H
#define HC_GRIDSERIES_H

#include <stdint.h>
#include <optional>
#include <vector>
#include "common/payload.h"

namespace gridseries {
	// One "validTime"/"value" entry from a grid quantity
	struct Record {
		int64_t start{};  // unix seconds
		int hours = 1;
		std::optional<double> value;
	};

	using Series = std::vector<Record>;

	struct Sample {
		int64_t instant{};
		std::optional<double> value;
	};

	using Expanded = std::vector<Sample>;

	// Decodes an interval duration. Only whole hours ("PT<n>H", n >= 1) are understood; everything else
	// (days, minutes, mixed forms) is taken to be a single hour.
	int decode_duration(const char * duration);

	// Decodes "<ISO start>/<duration>". Fails only if the start instant can't be parsed.
	bool decode_valid_time(const char * valid_time, int64_t& start, int& hours);

	// Repeats every record's value once per covered hour. Input order is kept; overlapping records are
	// not merged.
	//
	// Only the hours sampling over [from, to) can see are produced: hours starting at or after to are
	// left out, and of a record's hours before from only the last one is kept. A record's size is then
	// bounded by the window rather than by its duration.
	Expanded expand(const Series& series, int64_t from, int64_t to);

	// Value in effect at target: the first sample whose hour contains target, otherwise the last sample
	// at or before target. Empty if nothing starts at or before target.
	std::optional<double> sample_at(const Expanded& samples, int64_t target);

	// Window length clamped to [1, 48]
	int clamp_window(int hours);

	struct HourlyInputs {
		const Series * temperature{};
		const Series * apparent_temperature{};
		const Series * wind_speed{};
		const Series * wind_gust{};
		const Series * probability_of_precipitation{};
	};

	// Builds `hours` samples starting at the top of the hour containing now.
	std::vector<payload::HourlySample> build_hourly(const HourlyInputs& in, int64_t now, int hours, payload::UnitSystem units);
}

#endif
