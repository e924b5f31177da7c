#ifndef HC_UNITS_H
#define HC_UNITS_H

#include <cmath>
#include <optional>
#include "common/payload.h"

// Source data is always C / km/h / mm; display units follow the instance's unit system.
namespace units {
	using payload::UnitSystem;

	constexpr double kph_to_mph = 0.621371;
	constexpr double mm_to_inches = 0.0393701;

	// Half-way cases round up (towards +inf), so -0.5 rounds to 0.
	inline double round_half_up(double v) {
		return std::floor(v + 0.5);
	}

	inline std::optional<int> temperature(std::optional<double> celsius, UnitSystem u) {
		if (!celsius) return std::nullopt;
		if (u == UnitSystem::IMPERIAL) return (int)round_half_up(*celsius * 9 / 5 + 32);
		return (int)round_half_up(*celsius);
	}

	inline std::optional<int> speed(std::optional<double> kph, UnitSystem u) {
		if (!kph) return std::nullopt;
		if (u == UnitSystem::IMPERIAL) return (int)round_half_up(*kph * kph_to_mph);
		return (int)round_half_up(*kph);
	}

	// Imperial depths are rounded to hundredths of an inch
	inline std::optional<double> depth(std::optional<double> mm, UnitSystem u) {
		if (!mm) return std::nullopt;
		if (u == UnitSystem::IMPERIAL) return round_half_up(*mm * mm_to_inches * 100) / 100;
		return *mm;
	}

	// Inverses (display units back to source units), unrounded
	inline double temperature_to_native(double display, UnitSystem u) {
		return u == UnitSystem::IMPERIAL ? (display - 32) * 5 / 9 : display;
	}

	inline double speed_to_native(double display, UnitSystem u) {
		return u == UnitSystem::IMPERIAL ? display / kph_to_mph : display;
	}

	inline double depth_to_native(double display, UnitSystem u) {
		return u == UnitSystem::IMPERIAL ? display / mm_to_inches : display;
	}

	// In display units
	constexpr int freezing_point(UnitSystem u) {
		return u == UnitSystem::IMPERIAL ? 32 : 0;
	}
}

#endif
