#include "gridseries.h"
#include "units.h"
#include "../timeutil.h"

#include <string.h>
#include <stdlib.h>
#include <limits.h>

#include <algorithm>

namespace gridseries {
	int decode_duration(const char * duration) {
		if (strncmp(duration, "PT", 2) != 0) return 1;

		const char * digits = duration + 2;
		if (*digits < '0' || *digits > '9') return 1;

		char * end = nullptr;
		long hours = strtol(digits, &end, 10);
		if (end[0] != 'H' || end[1] != 0) return 1;
		if (hours < 1 || hours > INT_MAX) return 1;

		return (int)hours;
	}

	bool decode_valid_time(const char * valid_time, int64_t& start, int& hours) {
		const char * slash = strchr(valid_time, '/');
		size_t start_len = slash ? (size_t)(slash - valid_time) : strlen(valid_time);

		char buf[48];
		if (start_len >= sizeof buf) return false;
		memcpy(buf, valid_time, start_len);
		buf[start_len] = 0;

		if (!timeutil::from_iso8601(buf, start)) return false;
		hours = slash ? decode_duration(slash + 1) : 1;
		return true;
	}

	Expanded expand(const Series& series, int64_t from, int64_t to) {
		Expanded out;
		for (const auto& record : series) {
			if (record.hours < 1 || to <= record.start) continue;

			int64_t first = 0, last = record.hours;
			if (from > record.start) first = std::min<int64_t>((from - record.start) / timeutil::seconds_per_hour, last - 1);
			last = std::min<int64_t>(last, (to - record.start + timeutil::seconds_per_hour - 1) / timeutil::seconds_per_hour);

			for (int64_t h = first; h < last; ++h) {
				out.push_back({record.start + h * timeutil::seconds_per_hour, record.value});
			}
		}
		return out;
	}

	std::optional<double> sample_at(const Expanded& samples, int64_t target) {
		for (const auto& s : samples) {
			if (s.instant <= target && target < s.instant + timeutil::seconds_per_hour) return s.value;
		}

		std::optional<double> closest;
		for (const auto& s : samples) {
			if (s.instant <= target) closest = s.value;
		}
		return closest;
	}

	int clamp_window(int hours) {
		if (hours < 1) return 1;
		if (hours > 48) return 48;
		return hours;
	}

	std::vector<payload::HourlySample> build_hourly(const HourlyInputs& in, int64_t now, int hours, payload::UnitSystem u) {
		const int64_t start = timeutil::floor_hour(now);
		hours = clamp_window(hours);
		const int64_t end = start + hours * timeutil::seconds_per_hour;

		auto expand_or_empty = [&](const Series * s) {
			return s ? expand(*s, start, end) : Expanded{};
		};

		const Expanded temp = expand_or_empty(in.temperature);
		const Expanded feels_like = expand_or_empty(in.apparent_temperature);
		const Expanded wind_speed = expand_or_empty(in.wind_speed);
		const Expanded wind_gust = expand_or_empty(in.wind_gust);
		const Expanded pop = expand_or_empty(in.probability_of_precipitation);

		std::vector<payload::HourlySample> out;
		out.reserve(hours);
		for (int i = 0; i < hours; ++i) {
			const int64_t target = start + i * timeutil::seconds_per_hour;

			payload::HourlySample sample;
			sample.timestamp = target;
			sample.temp = units::temperature(sample_at(temp, target), u);
			sample.feels_like = units::temperature(sample_at(feels_like, target), u);
			sample.wind_speed = units::speed(sample_at(wind_speed, target), u);
			sample.wind_gust = units::speed(sample_at(wind_gust, target), u);

			// percent in the source
			if (auto p = sample_at(pop, target)) {
				sample.pop = *p / 100;
				if (sample.pop < 0) sample.pop = 0;
				else if (sample.pop > 1) sample.pop = 1;
			}

			out.push_back(sample);
		}
		return out;
	}
}
