#include <FreeRTOS.h>
#include <task.h>
#include <esp_log.h>

#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include "config.h"
#include "display.h"
#include "grabber/grab.h"

const static char * const TAG = "app_main";

namespace {
	// stdout belongs to the rendering layer
	int log_to_stderr(const char * fmt, va_list args) {
		return vfprintf(stderr, fmt, args);
	}

	bool level_from_name(const char * name, esp_log_level_t& out) {
		static const struct {
			const char * name;
			esp_log_level_t level;
		} levels[] = {
			{"none", ESP_LOG_NONE},
			{"error", ESP_LOG_ERROR},
			{"warn", ESP_LOG_WARN},
			{"info", ESP_LOG_INFO},
			{"debug", ESP_LOG_DEBUG},
			{"verbose", ESP_LOG_VERBOSE},
		};

		for (const auto& l : levels) {
			if (!strcmp(l.name, name)) {
				out = l.level;
				return true;
			}
		}
		return false;
	}

	void app_main(void *) {
		if (!grabber::start()) {
			ESP_LOGE(TAG, "unable to start the grabber");
			exit(1);
		}

		display::link.run(STDIN_FILENO);

		ESP_LOGI(TAG, "rendering layer went away, exiting");
		exit(0);
	}
}

extern "C" void vAssertCalled(const char* m, int l) {
	ESP_LOGE("assert", "file %s line %d", m, l);
	abort();
}

int main(int argc, char ** argv) {
	esp_log_set_vprintf(log_to_stderr);

	const char * cfg_path = argc > 1 ? argv[1] : "hourcast.json";
	if (!config::parse_config_from_file(cfg_path)) {
		ESP_LOGE(TAG, "bad config in %s", cfg_path);
		return 1;
	}

	esp_log_level_t level;
	if (level_from_name(config::log_level.c_str(), level)) {
		esp_log_level_set("*", level);
	}
	else {
		ESP_LOGW(TAG, "unknown log level %s", config::log_level.c_str());
	}

	if (xTaskCreate(app_main, "app_main", 16384, nullptr, 5, nullptr) != pdPASS) {
		ESP_LOGE(TAG, "unable to create main task");
		return 1;
	}
	vTaskStartScheduler();

	return 1;
}
