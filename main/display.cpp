#include "display.h"
#include "message.h"
#include "grabber/grab.h"

#include <FreeRTOS.h>
#include <task.h>
#include <esp_log.h>

#include <errno.h>
#include <poll.h>
#include <unistd.h>

const static char * const TAG = "display";

namespace display {
	Link link{stdout};

	void Link::write_line(const std::string& line) {
		if (fwrite(line.data(), 1, line.size(), out) != line.size() || fputc('\n', out) == EOF || fflush(out) != 0) {
			ESP_LOGE(TAG, "failed writing to the rendering layer (errno %d)", errno);
		}
	}

	void Link::deliver(const std::string& instance_id, const payload::Payload& data) {
		ESP_LOGD(TAG, "data -> %s", instance_id.c_str());
		write_line(message::encode_data(instance_id, data));
	}

	void Link::deliver_error(const std::string& instance_id, const char * error) {
		ESP_LOGD(TAG, "error -> %s: %s", instance_id.c_str(), error);
		write_line(message::encode_error(instance_id, error));
	}

	void Link::handle_line(const char * line) {
		// blank lines are fine
		const char * c = line;
		while (*c == ' ' || *c == '\t' || *c == '\r') ++c;
		if (!*c) return;

		message::Inbound msg;
		std::string error;
		if (!message::parse_inbound(line, grabber::defaults(), msg, error)) {
			ESP_LOGW(TAG, "dropping message: %s", error.c_str());
			return;
		}

		grabber::post(msg);
	}

	void Link::run(int in_fd) {
		std::string pending;
		char buf[1024];

		while (true) {
			// Don't block the scheduler in read()
			pollfd pfd{in_fd, POLLIN, 0};
			int ready = poll(&pfd, 1, 0);
			if (ready < 0 && errno != EINTR) {
				ESP_LOGE(TAG, "poll failed with errno %d", errno);
				return;
			}
			if (ready <= 0) {
				vTaskDelay(pdMS_TO_TICKS(50));
				continue;
			}

			ssize_t got = read(in_fd, buf, sizeof buf);
			if (got < 0) {
				if (errno == EINTR || errno == EAGAIN) continue;
				ESP_LOGE(TAG, "read failed with errno %d", errno);
				return;
			}
			if (got == 0) {
				if (!pending.empty()) handle_line(pending.c_str());
				ESP_LOGI(TAG, "input closed");
				return;
			}

			pending.append(buf, (size_t)got);

			size_t start = 0, nl;
			while ((nl = pending.find('\n', start)) != std::string::npos) {
				handle_line(pending.substr(start, nl - start).c_str());
				start = nl + 1;
			}
			pending.erase(0, start);

			if (pending.size() > 1024 * 1024) {
				ESP_LOGW(TAG, "dropping oversized message");
				pending.clear();
			}
		}
	}
}
