#ifndef HC_PAYLOAD_H
#define HC_PAYLOAD_H

#include <stdint.h>
#include <optional>
#include <vector>

// Normalized forecast data as handed to the rendering layer.
namespace payload {
	enum struct UnitSystem : uint8_t {
		IMPERIAL,
		METRIC
	};

	// One sample per display hour, starting at the top of the current hour.
	struct HourlySample {
		int64_t timestamp{}; // unix seconds

		// Display units (F / mph or C / kph); empty when the source has no value for the hour.
		std::optional<int> temp, feels_like;
		std::optional<int> wind_speed, wind_gust;

		double pop = 0; // 0.0-1.0
	};

	struct PrecipitationPeriod {
		enum Kind : uint8_t {
			LIQUID,
			FROZEN
		} kind = LIQUID;

		// Offsets into the hourly samples, clipped to [0, window length]
		int start_index = 0, end_index = 0;

		double amount_native = 0;      // mm
		double amount_display = 0;     // inches or mm, see units
		double display_threshold = 0;  // in display units
		UnitSystem units = UnitSystem::IMPERIAL;
	};

	struct Payload {
		std::vector<HourlySample> hourly;
		std::vector<PrecipitationPeriod> precipitation_periods;
	};

	inline const char * unit_system_name(UnitSystem u) {
		return u == UnitSystem::METRIC ? "metric" : "imperial";
	}

	inline const char * kind_name(PrecipitationPeriod::Kind k) {
		return k == PrecipitationPeriod::FROZEN ? "snow" : "rain";
	}
}

#endif
