#ifndef HC_GRIDDATA_H
#define HC_GRIDDATA_H

#include <string>
#include "gridseries.h"
#include "../json.h"
#include "common/payload.h"

namespace griddata {
	// The quantities we read out of a forecast grid response (properties.<quantity>.values[])
	struct GridProperties {
		gridseries::Series temperature;                  // C
		gridseries::Series apparent_temperature;         // C
		gridseries::Series wind_speed;                   // km/h
		gridseries::Series wind_gust;                    // km/h
		gridseries::Series probability_of_precipitation; // percent
		gridseries::Series quantitative_precipitation;   // mm
		gridseries::Series snowfall_amount;              // mm
	};

	// Reads properties.forecastGridData out of a points response. False if the body is malformed or
	// the url is missing.
	bool parse_points(json::TextCallback&& body, std::string& grid_url);

	// Reads a grid response. Entries with an unparseable validTime are skipped; any other quantity in the
	// body is ignored. False if the body is malformed or has no properties object.
	bool parse_grid(json::TextCallback&& body, GridProperties& out);

	// Hourly samples plus merged precipitation periods for the window starting at the top of the hour
	// containing now.
	payload::Payload normalize(const GridProperties& props, int64_t now, int hours, payload::UnitSystem units);
}

#endif
