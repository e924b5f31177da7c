#include "griddata.h"
#include "precip.h"

#include <string.h>

namespace griddata {
	namespace {
		gridseries::Series * series_for(GridProperties& props, const char * quantity) {
			if (!strcmp(quantity, "temperature")) return &props.temperature;
			if (!strcmp(quantity, "apparentTemperature")) return &props.apparent_temperature;
			if (!strcmp(quantity, "windSpeed")) return &props.wind_speed;
			if (!strcmp(quantity, "windGust")) return &props.wind_gust;
			if (!strcmp(quantity, "probabilityOfPrecipitation")) return &props.probability_of_precipitation;
			if (!strcmp(quantity, "quantitativePrecipitation")) return &props.quantitative_precipitation;
			if (!strcmp(quantity, "snowfallAmount")) return &props.snowfall_amount;
			return nullptr;
		}
	}

	bool parse_points(json::TextCallback&& body, std::string& grid_url) {
		grid_url.clear();

		json::JSONParser parser([&](json::PathNode ** stack, uint8_t stack_ptr, const json::Value& v) {
			if (stack_ptr != 3) return;
			if (!stack[1]->is("properties") || !stack[2]->is("forecastGridData")) return;

			if (v.type == json::Value::STR) grid_url = v.str_val;
		});

		if (!parser.parse(std::move(body))) return false;
		return !grid_url.empty();
	}

	bool parse_grid(json::TextCallback&& body, GridProperties& out) {
		out = {};

		bool saw_properties = false;

		// current values[] entry
		bool have_time = false;
		gridseries::Record current;

		json::JSONParser parser([&](json::PathNode ** stack, uint8_t stack_ptr, const json::Value& v) {
			if (stack_ptr < 2 || !stack[1]->is("properties")) return;

			if (stack_ptr == 2) {
				if (v.type == json::Value::OBJ) saw_properties = true;
				return;
			}

			if (stack_ptr < 4 || !stack[3]->is("values") || !stack[3]->is_array()) return;

			auto * series = series_for(out, stack[2]->name);
			if (!series) return;

			if (stack_ptr == 4) {
				// end of one entry
				if (v.type != json::Value::OBJ) return;
				if (have_time) series->push_back(current);

				current = {};
				have_time = false;
			}
			else if (stack_ptr == 5) {
				if (stack[4]->is("validTime") && v.type == json::Value::STR) {
					have_time = gridseries::decode_valid_time(v.str_val, current.start, current.hours);
				}
				else if (stack[4]->is("value")) {
					if (v.is_number()) current.value = v.as_number();
					else current.value.reset();
				}
			}
		});

		if (!parser.parse(std::move(body))) return false;
		return saw_properties;
	}

	payload::Payload normalize(const GridProperties& props, int64_t now, int hours, payload::UnitSystem units) {
		payload::Payload out;

		hours = gridseries::clamp_window(hours);

		gridseries::HourlyInputs in;
		in.temperature = &props.temperature;
		in.apparent_temperature = &props.apparent_temperature;
		in.wind_speed = &props.wind_speed;
		in.wind_gust = &props.wind_gust;
		in.probability_of_precipitation = &props.probability_of_precipitation;

		out.hourly = gridseries::build_hourly(in, now, hours, units);

		auto liquid = precip::extract(props.quantitative_precipitation, now, hours, units, payload::PrecipitationPeriod::LIQUID);
		auto frozen = precip::extract(props.snowfall_amount, now, hours, units, payload::PrecipitationPeriod::FROZEN);
		out.precipitation_periods = precip::merge(liquid, frozen, out.hourly, units);

		return out;
	}
}
