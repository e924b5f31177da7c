#ifndef HC_MESSAGE_H
#define HC_MESSAGE_H

#include <stdint.h>
#include <string>
#include "common/payload.h"

// Line-oriented JSON messages exchanged with the rendering layer.
namespace message {
	struct Defaults {
		int64_t update_interval_ms = 900000;
		int hours_to_show = 48;
		payload::UnitSystem units = payload::UnitSystem::IMPERIAL;
	};

	struct InstanceConfig {
		std::string instance_id;
		double latitude = 0, longitude = 0;
		payload::UnitSystem units = payload::UnitSystem::IMPERIAL;
		int64_t update_interval_ms = 0;
		int hours_to_show = 48; // always within [1, 48]
	};

	struct Inbound {
		enum Type {
			CONFIG,
			REMOVE
		} type = CONFIG;

		// only instance_id is filled for REMOVE
		InstanceConfig config;
	};

	// Parses one inbound line. Missing fields take their value from defaults; display options we don't use
	// are ignored. Returns false (with a reason in error) for malformed JSON, an unknown type, a missing
	// instanceId or, for CONFIG, missing coordinates.
	bool parse_inbound(const char * line, const Defaults& defaults, Inbound& out, std::string& error);

	// {"type":"WEATHER_GRAPH_DATA",...} without a trailing newline
	std::string encode_data(const std::string& instance_id, const payload::Payload& data);
	// {"type":"WEATHER_GRAPH_ERROR",...} without a trailing newline
	std::string encode_error(const std::string& instance_id, const char * error);

	// Cache key for a coordinate pair, e.g. "40.7128,-74.0060"
	std::string coordinate_key(double latitude, double longitude);
}

#endif
