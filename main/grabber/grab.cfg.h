#pragma once

#include <string>
#include <stdint.h>

namespace grabber {
	//!cfg: holds .upstream.host
	extern std::string host;

	//!cfg: holds .upstream.https
	extern bool https;

	//!cfg: holds .retry.max_attempts
	extern int max_attempts;

	//!cfg: holds .retry.base_delay_ms
	extern int64_t base_delay_ms;

	//!cfg: holds .defaults.update_interval_ms
	extern int64_t default_update_interval_ms;

	//!cfg: holds .defaults.hours_to_show
	extern int default_hours_to_show;

	//!cfg: holds .defaults.units
	extern std::string default_units;
}
