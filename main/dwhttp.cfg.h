#pragma once

#include <string>

namespace dwhttp {
	//!cfg: holds .upstream.user_agent
	extern std::string user_agent;

	//!cfg: holds .upstream.timeout_ms
	extern int timeout_ms;

	//!cfg: holds .upstream.ca_dir
	extern std::string ca_dir;
}
