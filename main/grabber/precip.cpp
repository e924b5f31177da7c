#include "precip.h"
#include "units.h"
#include "../timeutil.h"

#include <algorithm>
#include <set>

namespace precip {
	double display_threshold(PrecipitationPeriod::Kind kind, UnitSystem units) {
		if (kind == PrecipitationPeriod::FROZEN)
			return units == UnitSystem::IMPERIAL ? 0.1 : 2.5;
		else
			return units == UnitSystem::IMPERIAL ? 0.01 : 0.25;
	}

	std::vector<PrecipitationPeriod> extract(const gridseries::Series& series, int64_t now, int window_hours,
			UnitSystem units, PrecipitationPeriod::Kind kind) {
		std::vector<PrecipitationPeriod> out;

		window_hours = gridseries::clamp_window(window_hours);
		const int64_t window_start = timeutil::floor_hour(now);
		const int64_t window_end = window_start + window_hours * timeutil::seconds_per_hour;

		for (const auto& record : series) {
			if (!record.value || *record.value <= 0) continue;

			const int64_t period_start = record.start;
			const int64_t period_end = record.start + record.hours * timeutil::seconds_per_hour;

			// Entirely outside the window
			if (period_end <= window_start || period_start >= window_end) continue;

			const int64_t display_start = std::max(period_start, window_start);
			const int64_t display_end = std::min(period_end, window_end);

			PrecipitationPeriod p;
			p.kind = kind;
			p.start_index = (int)((display_start - window_start) / timeutil::seconds_per_hour);
			p.end_index = (int)((display_end - window_start) / timeutil::seconds_per_hour);
			p.amount_native = *record.value;
			p.amount_display = *units::depth(record.value, units);
			p.display_threshold = display_threshold(kind, units);
			p.units = units;

			out.push_back(p);
		}

		return out;
	}

	std::vector<PrecipitationPeriod> merge(const std::vector<PrecipitationPeriod>& liquid,
			const std::vector<PrecipitationPeriod>& frozen,
			const std::vector<payload::HourlySample>& hourly, UnitSystem units) {
		std::vector<PrecipitationPeriod> out;
		std::set<int> seen_liquid, consumed, emitted;

		auto frozen_at = [&](int start_index) -> const PrecipitationPeriod * {
			for (const auto& f : frozen) {
				if (f.start_index == start_index && f.amount_native > 0) return &f;
			}
			return nullptr;
		};

		for (const auto& l : liquid) {
			// only the first liquid period for a start index takes part
			if (!seen_liquid.insert(l.start_index).second) continue;

			if (const auto * f = frozen_at(l.start_index)) {
				out.push_back(*f);
				consumed.insert(l.start_index);
				emitted.insert(l.start_index);
				continue;
			}

			if (l.amount_native <= 0) continue;

			if (l.start_index >= 0 && (size_t)l.start_index < hourly.size()) {
				const auto& temp = hourly[l.start_index].temp;
				if (temp && *temp <= units::freezing_point(units)) continue;
			}

			out.push_back(l);
			emitted.insert(l.start_index);
		}

		for (const auto& f : frozen) {
			if (consumed.count(f.start_index) || f.amount_native <= 0) continue;
			if (!emitted.insert(f.start_index).second) continue;
			out.push_back(f);
		}

		return out;
	}
}
