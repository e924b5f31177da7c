#ifndef HC_FORECAST_H
#define HC_FORECAST_H

#include <stdint.h>
#include <functional>
#include <map>
#include <string>

#include "../json.h"
#include "../message.h"
#include "common/payload.h"

// Per-instance fetch scheduling, retry and caching on top of the grid-forecast API.
//
// Everything in here runs on one task; nothing is locked.
namespace forecast {
	struct Reply {
		int status = -1; // -1 if no response was received at all
		json::TextCallback body;
	};

	struct Upstream {
		virtual ~Upstream() = default;
		// GET url. The body callback must stay usable until the reply is dropped.
		virtual Reply get(const std::string& url) = 0;
	};

	struct Outbox {
		virtual ~Outbox() = default;
		virtual void deliver(const std::string& instance_id, const payload::Payload& data) = 0;
		virtual void deliver_error(const std::string& instance_id, const char * error) = 0;
	};

	// Timers feeding back into Service::refresh / Service::fetch.
	struct Scheduler {
		virtual ~Scheduler() = default;
		// Periodic, first tick one interval from now
		virtual bool start_refresh(const std::string& instance_id, int64_t interval_ms) = 0;
		// One shot, calls fetch(instance_id, attempt) once delay_ms has passed
		virtual bool retry_after(const std::string& instance_id, int attempt, int64_t delay_ms) = 0;
		// Stops the periodic refresh and any pending retries
		virtual void cancel(const std::string& instance_id) = 0;
	};

	// Keeps the backoff delay (base_delay_ms << (attempt - 1)) well inside int64_t
	constexpr int max_attempts_limit = 16;

	struct Settings {
		std::string base_url = "https://api.weather.gov";
		int max_attempts = 3;
		int64_t base_delay_ms = 5000;
	};

	struct Service {
		using Clock = std::function<int64_t ()>; // unix seconds

		Service(Upstream& upstream, Outbox& outbox, Scheduler& scheduler, Settings settings, Clock clock);

		Service(const Service&) = delete;
		Service& operator=(const Service&) = delete;

		// Handles a CONFIG message: serves cached data, and registers the instance if it's new.
		void configure(const message::InstanceConfig& config);
		// Handles a REMOVE message; unknown ids are ignored.
		void remove(const std::string& instance_id);

		// Refresh tick
		void refresh(const std::string& instance_id);
		// One fetch attempt (1-based). Failures schedule the next attempt until max_attempts is reached.
		void fetch(const std::string& instance_id, int attempt);

		bool is_registered(const std::string& instance_id) const {
			return instances.count(instance_id) != 0;
		}

		size_t instance_count() const {return instances.size();}

	private:
		struct CachedData {
			payload::UnitSystem units;
			int hours;
			payload::Payload data;
		};

		bool resolve_grid(const message::InstanceConfig& config, std::string& grid_url, std::string& error);
		bool load_payload(const message::InstanceConfig& config, payload::Payload& out, std::string& error);

		Upstream& upstream;
		Outbox& outbox;
		Scheduler& scheduler;
		Settings settings;
		Clock clock;

		std::map<std::string, message::InstanceConfig> instances;

		// keyed by message::coordinate_key
		std::map<std::string, std::string> grid_cache;
		std::map<std::string, CachedData> data_cache;
	};
}

#endif
