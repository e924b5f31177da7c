#include "message.h"
#include "json.h"
#include "grabber/gridseries.h"

#include <cmath>
#include <optional>
#include <stdio.h>
#include <string.h>
#include <inttypes.h>

namespace message {
	namespace {
		void append_string(std::string& out, const char * str) {
			out.push_back('"');
			for (const char * c = str; *c; ++c) {
				switch (*c) {
					case '"':
						out += "\\\"";
						break;
					case '\\':
						out += "\\\\";
						break;
					case '\n':
						out += "\\n";
						break;
					case '\r':
						out += "\\r";
						break;
					case '\t':
						out += "\\t";
						break;
					default:
						if ((uint8_t)*c < 0x20) {
							char buf[8];
							snprintf(buf, sizeof buf, "\\u%04x", (unsigned)(uint8_t)*c);
							out += buf;
						}
						else out.push_back(*c);
						break;
				}
			}
			out.push_back('"');
		}

		void append_number(std::string& out, double v) {
			if (!std::isfinite(v)) {
				out += "null";
				return;
			}
			char buf[32];
			snprintf(buf, sizeof buf, "%.10g", v);
			out += buf;
		}

		void append_int(std::string& out, int64_t v) {
			char buf[24];
			snprintf(buf, sizeof buf, "%" PRId64, v);
			out += buf;
		}

		void append_optional(std::string& out, const std::optional<int>& v) {
			if (v) append_int(out, *v);
			else out += "null";
		}

		void append_header(std::string& out, const char * type, const std::string& instance_id) {
			out += "{\"type\":";
			append_string(out, type);
			out += ",\"instanceId\":";
			append_string(out, instance_id.c_str());
		}
	}

	bool parse_inbound(const char * line, const Defaults& defaults, Inbound& out, std::string& error) {
		out = {};
		out.config.units = defaults.units;
		out.config.update_interval_ms = defaults.update_interval_ms;
		out.config.hours_to_show = defaults.hours_to_show;

		std::string type;
		bool is_object = false;
		bool have_id = false, have_lat = false, have_lon = false;
		std::optional<double> interval, hours;

		json::JSONParser parser([&](json::PathNode ** stack, uint8_t stack_ptr, const json::Value& v) {
			if (stack_ptr == 1) {
				if (v.type == json::Value::OBJ) is_object = true;
				return;
			}
			if (stack_ptr != 2) return;

			const auto& key = *stack[1];
			if (key.is("type") && v.type == json::Value::STR) {
				type = v.str_val;
			}
			else if (key.is("instanceId")) {
				if (v.type == json::Value::STR && *v.str_val) {
					out.config.instance_id = v.str_val;
					have_id = true;
				}
				else if (v.type == json::Value::INT) {
					char buf[24];
					snprintf(buf, sizeof buf, "%" PRId64, v.int_val);
					out.config.instance_id = buf;
					have_id = true;
				}
			}
			else if (key.is("latitude") && v.is_number()) {
				out.config.latitude = v.as_number();
				have_lat = true;
			}
			else if (key.is("longitude") && v.is_number()) {
				out.config.longitude = v.as_number();
				have_lon = true;
			}
			else if (key.is("units") && v.type == json::Value::STR) {
				if (!strcmp(v.str_val, "metric")) out.config.units = payload::UnitSystem::METRIC;
				else if (!strcmp(v.str_val, "imperial")) out.config.units = payload::UnitSystem::IMPERIAL;
			}
			else if (key.is("updateInterval") && v.is_number()) {
				interval = v.as_number();
			}
			else if (key.is("hoursToShow") && v.is_number()) {
				hours = v.as_number();
			}
		});

		if (!parser.parse(line) || !is_object) {
			error = "malformed message";
			return false;
		}

		if (type == "CONFIG") out.type = Inbound::CONFIG;
		else if (type == "REMOVE") out.type = Inbound::REMOVE;
		else {
			error = type.empty() ? "missing type" : "unknown type " + type;
			return false;
		}

		if (!have_id) {
			error = "missing instanceId";
			return false;
		}

		if (out.type == Inbound::REMOVE) return true;

		if (!have_lat || !have_lon || !std::isfinite(out.config.latitude) || !std::isfinite(out.config.longitude)) {
			error = "missing latitude/longitude";
			return false;
		}

		if (interval && std::isfinite(*interval) && *interval >= 1) {
			out.config.update_interval_ms = *interval > 1e15 ? (int64_t)1e15 : (int64_t)*interval;
		}
		if (out.config.update_interval_ms <= 0) out.config.update_interval_ms = Defaults{}.update_interval_ms;

		if (hours && std::isfinite(*hours)) {
			double h = std::floor(*hours);
			out.config.hours_to_show = h < 1 ? 1 : (h > 48 ? 48 : (int)h);
		}
		out.config.hours_to_show = gridseries::clamp_window(out.config.hours_to_show);

		return true;
	}

	std::string encode_data(const std::string& instance_id, const payload::Payload& data) {
		std::string out;
		out.reserve(160 + data.hourly.size() * 96 + data.precipitation_periods.size() * 160);

		append_header(out, "WEATHER_GRAPH_DATA", instance_id);
		out += ",\"data\":{\"hourly\":[";

		bool first = true;
		for (const auto& h : data.hourly) {
			if (!first) out.push_back(',');
			first = false;

			out += "{\"dt\":";
			append_int(out, h.timestamp);
			out += ",\"temp\":";
			append_optional(out, h.temp);
			out += ",\"feels_like\":";
			append_optional(out, h.feels_like);
			out += ",\"wind_speed\":";
			append_optional(out, h.wind_speed);
			out += ",\"wind_gust\":";
			append_optional(out, h.wind_gust);
			out += ",\"pop\":";
			append_number(out, h.pop);
			out.push_back('}');
		}

		out += "],\"precipitationPeriods\":[";

		first = true;
		for (const auto& p : data.precipitation_periods) {
			if (!first) out.push_back(',');
			first = false;

			out += "{\"startIndex\":";
			append_int(out, p.start_index);
			out += ",\"endIndex\":";
			append_int(out, p.end_index);
			out += ",\"amount_native\":";
			append_number(out, p.amount_native);
			out += ",\"amount\":";
			append_number(out, p.amount_display);
			out += ",\"displayThreshold\":";
			append_number(out, p.display_threshold);
			out += ",\"units\":";
			append_string(out, payload::unit_system_name(p.units));
			out += ",\"type\":";
			append_string(out, payload::kind_name(p.kind));
			out.push_back('}');
		}

		out += "]}}";
		return out;
	}

	std::string encode_error(const std::string& instance_id, const char * error) {
		std::string out;
		append_header(out, "WEATHER_GRAPH_ERROR", instance_id);
		out += ",\"error\":";
		append_string(out, error);
		out.push_back('}');
		return out;
	}

	std::string coordinate_key(double latitude, double longitude) {
		char buf[64];
		snprintf(buf, sizeof buf, "%.4f,%.4f", latitude, longitude);
		return buf;
	}
}
