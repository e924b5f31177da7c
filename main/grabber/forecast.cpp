#include "forecast.h"
#include "griddata.h"

#include <esp_log.h>
#include <utility>

const static char * const TAG = "forecast";

namespace forecast {
	Service::Service(Upstream& upstream, Outbox& outbox, Scheduler& scheduler, Settings settings, Clock clock) :
		upstream(upstream),
		outbox(outbox),
		scheduler(scheduler),
		settings(std::move(settings)),
		clock(std::move(clock)) {
		if (this->settings.max_attempts < 1) this->settings.max_attempts = 1;
		if (this->settings.max_attempts > max_attempts_limit) {
			ESP_LOGW(TAG, "limiting max_attempts %d to %d", this->settings.max_attempts, max_attempts_limit);
			this->settings.max_attempts = max_attempts_limit;
		}
		if (this->settings.base_delay_ms < 0) this->settings.base_delay_ms = 0;
	}

	void Service::configure(const message::InstanceConfig& config) {
		const std::string key = message::coordinate_key(config.latitude, config.longitude);

		// Anything we already have for these coordinates goes out straight away
		auto cached = data_cache.find(key);
		if (cached != data_cache.end() && cached->second.units == config.units && cached->second.hours == config.hours_to_show) {
			ESP_LOGD(TAG, "serving cached data for %s to %s", key.c_str(), config.instance_id.c_str());
			outbox.deliver(config.instance_id, cached->second.data);
		}

		if (instances.count(config.instance_id)) {
			ESP_LOGD(TAG, "%s already registered", config.instance_id.c_str());
			return;
		}

		instances.emplace(config.instance_id, config);
		ESP_LOGI(TAG, "registered %s at %s (every %lld ms, %d h)", config.instance_id.c_str(), key.c_str(),
				(long long)config.update_interval_ms, config.hours_to_show);

		if (!scheduler.start_refresh(config.instance_id, config.update_interval_ms)) {
			ESP_LOGE(TAG, "unable to schedule refresh for %s", config.instance_id.c_str());
		}

		fetch(config.instance_id, 1);
	}

	void Service::remove(const std::string& instance_id) {
		if (!instances.erase(instance_id)) {
			ESP_LOGW(TAG, "remove for unknown instance %s", instance_id.c_str());
			return;
		}

		scheduler.cancel(instance_id);
		ESP_LOGI(TAG, "removed %s", instance_id.c_str());
	}

	void Service::refresh(const std::string& instance_id) {
		fetch(instance_id, 1);
	}

	void Service::fetch(const std::string& instance_id, int attempt) {
		auto it = instances.find(instance_id);
		if (it == instances.end()) {
			// removed while a retry or tick was in flight
			ESP_LOGD(TAG, "dropping fetch for %s", instance_id.c_str());
			return;
		}

		// copied, the instance may go away while we're delivering
		const message::InstanceConfig config = it->second;

		payload::Payload data;
		std::string error;
		if (load_payload(config, data, error)) {
			CachedData& entry = data_cache[message::coordinate_key(config.latitude, config.longitude)];
			entry.units = config.units;
			entry.hours = config.hours_to_show;
			entry.data = data;

			outbox.deliver(config.instance_id, data);
			return;
		}

		if (attempt < settings.max_attempts) {
			const int64_t delay = settings.base_delay_ms << (attempt - 1);
			ESP_LOGW(TAG, "fetch %d/%d for %s failed (%s), retrying in %lld ms", attempt, settings.max_attempts,
					config.instance_id.c_str(), error.c_str(), (long long)delay);

			if (scheduler.retry_after(config.instance_id, attempt + 1, delay)) return;
			ESP_LOGE(TAG, "unable to schedule retry for %s", config.instance_id.c_str());
		}
		else {
			ESP_LOGE(TAG, "giving up on %s after %d attempts: %s", config.instance_id.c_str(), attempt, error.c_str());
		}

		outbox.deliver_error(config.instance_id, error.c_str());
	}

	bool Service::resolve_grid(const message::InstanceConfig& config, std::string& grid_url, std::string& error) {
		const std::string key = message::coordinate_key(config.latitude, config.longitude);

		auto cached = grid_cache.find(key);
		if (cached != grid_cache.end()) {
			grid_url = cached->second;
			return true;
		}

		auto reply = upstream.get(settings.base_url + "/points/" + key);
		if (reply.status < 0) {
			error = "Points API request failed";
			return false;
		}
		if (reply.status < 200 || reply.status >= 300) {
			error = "Points API error: " + std::to_string(reply.status);
			return false;
		}

		if (!griddata::parse_points(std::move(reply.body), grid_url)) {
			error = "Points API malformed response";
			return false;
		}

		ESP_LOGI(TAG, "%s resolved to %s", key.c_str(), grid_url.c_str());
		grid_cache.emplace(key, grid_url);
		return true;
	}

	bool Service::load_payload(const message::InstanceConfig& config, payload::Payload& out, std::string& error) {
		std::string grid_url;
		if (!resolve_grid(config, grid_url, error)) return false;

		griddata::GridProperties props;
		{
			auto reply = upstream.get(grid_url);
			if (reply.status < 0) {
				error = "Grid API request failed";
				return false;
			}
			if (reply.status < 200 || reply.status >= 300) {
				error = "Grid API error: " + std::to_string(reply.status);
				return false;
			}

			if (!griddata::parse_grid(std::move(reply.body), props)) {
				error = "Grid API malformed response";
				return false;
			}
		}

		out = griddata::normalize(props, clock(), config.hours_to_show, config.units);
		ESP_LOGD(TAG, "normalized %d hours / %d precip periods for %s", (int)out.hourly.size(),
				(int)out.precipitation_periods.size(), config.instance_id.c_str());
		return true;
	}
}
