#include <stdio.h>
#include <string.h>
#include <stdlib.h>
#include <time.h>
#include <grabber/griddata.h>
#include <message.h>
#include <timeutil.h>

// Normalizes a saved grid response from stdin and prints the payload line the service would send.
//
// ncheck [--debug] [--metric] [--hours N] [--now <iso8601>]
int main(int argc, char ** argv) {
	bool debug = false;
	int hours = 48;
	payload::UnitSystem units = payload::UnitSystem::IMPERIAL;
	int64_t now = (int64_t)time(nullptr);

	for (int i = 1; i < argc; ++i) {
		if (!strcmp(argv[i], "--debug")) debug = true;
		else if (!strcmp(argv[i], "--metric")) units = payload::UnitSystem::METRIC;
		else if (!strcmp(argv[i], "--hours") && i + 1 < argc) hours = atoi(argv[++i]);
		else if (!strcmp(argv[i], "--now") && i + 1 < argc) {
			if (!timeutil::from_iso8601(argv[++i], now)) {
				fprintf(stderr, "ncheck: bad time %s\n", argv[i]);
				return 1;
			}
		}
		else {
			fprintf(stderr, "usage: %s [--debug] [--metric] [--hours N] [--now <iso8601>] < grid.json\n", argv[0]);
			return 1;
		}
	}

	griddata::GridProperties props;
	if (!griddata::parse_grid([]() -> int16_t {
		int x = getchar();
		return x == EOF ? -1 : x;
	}, props)) {
		fprintf(stderr, "ncheck: not a grid response\n");
		return 2;
	}

	if (debug) {
		fprintf(stderr, "temperature: %d records\n", (int)props.temperature.size());
		fprintf(stderr, "apparentTemperature: %d records\n", (int)props.apparent_temperature.size());
		fprintf(stderr, "windSpeed: %d records\n", (int)props.wind_speed.size());
		fprintf(stderr, "windGust: %d records\n", (int)props.wind_gust.size());
		fprintf(stderr, "probabilityOfPrecipitation: %d records\n", (int)props.probability_of_precipitation.size());
		fprintf(stderr, "quantitativePrecipitation: %d records\n", (int)props.quantitative_precipitation.size());
		fprintf(stderr, "snowfallAmount: %d records\n", (int)props.snowfall_amount.size());
	}

	auto data = griddata::normalize(props, now, hours, units);
	puts(message::encode_data("ncheck", data).c_str());

	return 0;
}
