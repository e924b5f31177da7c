#include "grab.h"
#include "grab.cfg.h"
#include "forecast.h"
#include "slots.h"
#include "../dwhttp.h"
#include "../display.h"

#include <task.h>
#include <queue.h>
#include <timers.h>
#include <esp_log.h>

#include <memory>
#include <vector>
#include <time.h>

const static char * const TAG = "grab";

namespace grabber {
	std::string host = "api.weather.gov";
	bool https = true;
	int max_attempts = 3;
	int64_t base_delay_ms = 5000;
	int64_t default_update_interval_ms = 900000;
	int default_hours_to_show = 48;
	std::string default_units = "imperial";

	namespace {
		struct Event {
			enum Type {
				CONFIGURE,
				REMOVE,
				TIMER
			} type;

			message::InstanceConfig config; // only instance_id for REMOVE
			uintptr_t slot = 0;             // for TIMER
		};

		QueueHandle_t events = nullptr;
		TaskHandle_t grabber_task = nullptr;

		bool send_event(Event * ev) {
			if (!events || xQueueSend(events, &ev, pdMS_TO_TICKS(1000)) != pdPASS) {
				delete ev;
				return false;
			}
			return true;
		}

		TickType_t to_ticks(int64_t ms) {
			int64_t ticks = ms * configTICK_RATE_HZ / 1000;
			if (ticks < 1) ticks = 1;
			if (ticks >= (int64_t)portMAX_DELAY) ticks = portMAX_DELAY - 1;
			return (TickType_t)ticks;
		}

		struct HttpUpstream : forecast::Upstream {
			forecast::Reply get(const std::string& url) override {
				std::string site, path;
				if (!dwhttp::split_url(url.c_str(), site, path)) {
					ESP_LOGE(TAG, "can't fetch %s", url.c_str());
					return {};
				}

				static const char * const headers[][2] = {
					{"Accept", "application/geo+json"},
					{nullptr, nullptr}
				};

				ESP_LOGD(TAG, "GET %s", url.c_str());

				// shared since the body callback has to be copyable
				auto dw = std::make_shared<dwhttp::Download>(dwhttp::download_with_callback(site.c_str(), path.c_str(), headers));

				forecast::Reply reply;
				reply.status = dw->result_code();
				reply.body = [dw]() {return (*dw)();};
				return reply;
			}
		};

		// Refresh and retry timers. Slots are only touched from the worker task; the timer callback just
		// forwards the slot number.
		struct TimerScheduler : forecast::Scheduler {
			bool start_refresh(const std::string& instance_id, int64_t interval_ms) override {
				return add(instance_id, 0, true, interval_ms);
			}

			bool retry_after(const std::string& instance_id, int attempt, int64_t delay_ms) override {
				return add(instance_id, attempt, false, delay_ms);
			}

			void cancel(const std::string& instance_id) override {
				for (TimerHandle_t timer : slots.cancel(instance_id)) drop_timer(timer);
			}

			// Turns a fired slot back into what it was for. False if it was cancelled in the meantime.
			bool take(uintptr_t slot, std::string& instance_id, int& attempt, bool& periodic) {
				SlotTable<TimerHandle_t>::Slot s;
				if (!slots.take(slot, s)) return false;

				instance_id = s.instance_id;
				attempt = s.attempt;
				periodic = s.periodic;

				if (!periodic) drop_timer(s.timer);
				return true;
			}

			// Retries whose event got lost on a full queue
			std::vector<uintptr_t> missed() const {
				return slots.overdue(xTaskGetTickCount(), missed_grace);
			}

		private:
			constexpr static TickType_t missed_grace = pdMS_TO_TICKS(2000);

			static void fired(TimerHandle_t timer) {
				auto ev = new Event{Event::TIMER, {}, (uintptr_t)pvTimerGetTimerID(timer)};
				if (!events || xQueueSend(events, &ev, 0) != pdPASS) {
					// retries are swept up by the worker once overdue, refresh ticks just wait for the next one
					ESP_LOGW(TAG, "event queue full, timer %u delayed", (unsigned)ev->slot);
					delete ev;
				}
			}

			static void drop_timer(TimerHandle_t timer) {
				if (xTimerDelete(timer, pdMS_TO_TICKS(100)) != pdPASS) {
					ESP_LOGE(TAG, "unable to delete timer");
				}
			}

			bool add(const std::string& instance_id, int attempt, bool periodic, int64_t ms) {
				const uintptr_t slot = slots.reserve();
				const TickType_t period = to_ticks(ms);

				TimerHandle_t timer = xTimerCreate(periodic ? "refresh" : "retry", period, periodic ? pdTRUE : pdFALSE, (void *)slot, fired);
				if (timer == nullptr) {
					ESP_LOGE(TAG, "unable to create timer");
					return false;
				}

				const TickType_t due = xTaskGetTickCount() + period;
				if (xTimerStart(timer, pdMS_TO_TICKS(100)) != pdPASS) {
					ESP_LOGE(TAG, "unable to start timer");
					xTimerDelete(timer, 0);
					return false;
				}

				// the fired event is only handled on this task, so it can't see the slot missing
				SlotTable<TimerHandle_t>::Slot s;
				s.instance_id = instance_id;
				s.attempt = attempt;
				s.periodic = periodic;
				s.timer = timer;
				s.due = due;
				slots.insert(slot, s);
				return true;
			}

			SlotTable<TimerHandle_t> slots;
		};

		void run(void*) {
			HttpUpstream upstream;
			TimerScheduler scheduler;

			forecast::Settings settings;
			settings.base_url = (https ? "https://" : "http://") + host;
			settings.max_attempts = max_attempts;
			settings.base_delay_ms = base_delay_ms;

			forecast::Service service{upstream, display::link, scheduler, settings, []() -> int64_t {
				return (int64_t)time(nullptr);
			}};

			ESP_LOGI(TAG, "forecast worker up, upstream %s", settings.base_url.c_str());

			auto on_timer = [&](uintptr_t slot) {
				std::string instance_id;
				int attempt;
				bool periodic;
				if (!scheduler.take(slot, instance_id, attempt, periodic)) return;

				if (periodic) service.refresh(instance_id);
				else service.fetch(instance_id, attempt);
			};

			while (true) {
				Event * raw = nullptr;
				if (xQueueReceive(events, &raw, pdMS_TO_TICKS(1000)) == pdTRUE) {
					std::unique_ptr<Event> ev(raw);

					switch (ev->type) {
						case Event::CONFIGURE:
							service.configure(ev->config);
							break;
						case Event::REMOVE:
							service.remove(ev->config.instance_id);
							break;
						case Event::TIMER:
							on_timer(ev->slot);
							break;
					}
				}

				for (uintptr_t slot : scheduler.missed()) {
					ESP_LOGW(TAG, "timer %u never arrived, running it now", (unsigned)slot);
					on_timer(slot);
				}
			}
		}
	}

	message::Defaults defaults() {
		message::Defaults d;
		if (default_update_interval_ms > 0) d.update_interval_ms = default_update_interval_ms;
		d.hours_to_show = default_hours_to_show;
		if (default_units == "metric") d.units = payload::UnitSystem::METRIC;
		else if (default_units != "imperial") ESP_LOGW(TAG, "unknown units %s, using imperial", default_units.c_str());
		return d;
	}

	bool post(const message::Inbound& msg) {
		auto ev = new Event{msg.type == message::Inbound::REMOVE ? Event::REMOVE : Event::CONFIGURE, msg.config};
		if (!send_event(ev)) {
			ESP_LOGE(TAG, "unable to queue message for %s", msg.config.instance_id.c_str());
			return false;
		}
		return true;
	}

	bool start() {
		events = xQueueCreate(32, sizeof(Event *));
		if (events == nullptr) {
			ESP_LOGE(TAG, "unable to create event queue");
			return false;
		}

		if (xTaskCreate(run, "grab", 32768, nullptr, 6, &grabber_task) != pdPASS) {
			ESP_LOGE(TAG, "unable to start grabber task");
			grabber_task = nullptr;
			return false;
		}

		ESP_LOGI(TAG, "started grabber task");
		return true;
	}
}
