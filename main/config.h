#ifndef HC_CONFIG_H
#define HC_CONFIG_H

#include <string>
#include "json.h"

namespace config {
	//!cfg: holds .log.level
	extern std::string log_level;

	// Fills every //!cfg: variable from a json document. Keys that aren't present keep their defaults,
	// unknown keys are ignored. Returns false on malformed json or a value of the wrong type.
	bool parse_config(json::TextCallback&& tcb);

	// Missing files are fine (everything stays at its default); unreadable or malformed ones are not.
	bool parse_config_from_file(const char * path);
}

#endif
