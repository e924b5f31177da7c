#include "config.h"
#include "dwhttp.cfg.h"
#include "grabber/grab.cfg.h"
#include <esp_log.h>
#include <errno.h>
#include <stdio.h>
#include <string.h>

const static char * const TAG = "cfgload";

namespace config {
	std::string log_level = "info";

	namespace {
		struct Entry {
			const char * section;
			const char * key;
			enum Type {
				STRING,
				BOOL,
				INT,
				INT64
			} type;
			void * target;
		};

		const Entry entries[] = {
			{"upstream", "host", Entry::STRING, &grabber::host},
			{"upstream", "https", Entry::BOOL, &grabber::https},
			{"upstream", "user_agent", Entry::STRING, &dwhttp::user_agent},
			{"upstream", "timeout_ms", Entry::INT, &dwhttp::timeout_ms},
			{"upstream", "ca_dir", Entry::STRING, &dwhttp::ca_dir},
			{"retry", "max_attempts", Entry::INT, &grabber::max_attempts},
			{"retry", "base_delay_ms", Entry::INT64, &grabber::base_delay_ms},
			{"defaults", "update_interval_ms", Entry::INT64, &grabber::default_update_interval_ms},
			{"defaults", "hours_to_show", Entry::INT, &grabber::default_hours_to_show},
			{"defaults", "units", Entry::STRING, &grabber::default_units},
			{"log", "level", Entry::STRING, &log_level},
		};

		bool store(const Entry& e, const json::Value& v) {
			switch (e.type) {
				case Entry::STRING:
					if (v.type != json::Value::STR) return false;
					*(std::string *)e.target = v.str_val;
					return true;
				case Entry::BOOL:
					if (v.type != json::Value::BOOL) return false;
					*(bool *)e.target = v.bool_val;
					return true;
				case Entry::INT:
					if (v.type != json::Value::INT || v.int_val < 0 || v.int_val > INT32_MAX) return false;
					*(int *)e.target = (int)v.int_val;
					return true;
				case Entry::INT64:
					if (v.type != json::Value::INT || v.int_val < 0) return false;
					*(int64_t *)e.target = v.int_val;
					return true;
			}
			return false;
		}
	}

	bool parse_config(json::TextCallback&& tcb) {
		bool types_ok = true;

		json::JSONParser parser([&](json::PathNode ** stack, uint8_t stack_ptr, const json::Value& v) {
			if (stack_ptr != 3 || v.type == json::Value::OBJ) return;

			for (const auto& e : entries) {
				if (!stack[1]->is(e.section) || !stack[2]->is(e.key)) continue;

				if (!store(e, v)) {
					ESP_LOGE(TAG, "bad value for .%s.%s", e.section, e.key);
					types_ok = false;
				}
				return;
			}
		});

		if (!parser.parse(std::move(tcb))) {
			ESP_LOGE(TAG, "config is not valid json");
			return false;
		}

		return types_ok;
	}

	bool parse_config_from_file(const char * path) {
		FILE * config = fopen(path, "rb");
		if (!config) {
			if (errno == ENOENT) {
				ESP_LOGW(TAG, "no config at %s, using defaults", path);
				return true;
			}
			ESP_LOGE(TAG, "Could not load the configuration at %s (errno %d)", path, errno);
			return false;
		}

		bool cfg_ok = parse_config([&]() -> int16_t {
			int c = fgetc(config);
			return c == EOF ? -1 : c;
		});

		if (ferror(config)) {
			ESP_LOGE(TAG, "read error in %s", path);
			cfg_ok = false;
		}

		fclose(config);

		if (cfg_ok) ESP_LOGI(TAG, "loaded config from %s", path);
		return cfg_ok;
	}
}
