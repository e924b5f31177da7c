#ifndef HC_DWHTTP_IMPL_H
#define HC_DWHTTP_IMPL_H

// Response side of dwhttp: status line, headers and body framing, on top of any adapter providing
// connect / write / flush / read_some / close and a deadline.

#include "dwhttp.h"
#include "dwhttp.cfg.h"
#include <esp_log.h>
#include <FreeRTOS.h>
#include <task.h>

#include <sys/types.h>
#include <stdlib.h>
#include <string.h>
#include <strings.h>
#include <string>

namespace dwhttp {
	namespace detail {
		const static char * const TAG = "d_impl";

		struct DownloaderBase {
			virtual ~DownloaderBase() = default;

			virtual int16_t next() = 0;
			virtual void    stop() = 0;

			inline int result_code() const {
				return status;
			}

			inline int content_length() const {
				return length;
			}

			inline bool is_unknown_length() const {
				return length < 0;
			}

			inline bool is_chunked() const {
				return chunked;
			}
		protected:
			int status = -1;
			int length = -1;
			bool chunked = false;
		};

		template<typename Adapter>
		struct Downloader final : DownloaderBase {
			~Downloader() {
				stop();
			}

			bool request(const char *host, const char *port, const char *path, const char * const headers[][2]) {
				socket.deadline = xTaskGetTickCount() + pdMS_TO_TICKS(timeout_ms);

				if (!socket.connect(host, port)) {
					ESP_LOGE(TAG, "Failed to connect to host");
					return false;
				}

				// Send request
				if (!(socket.write("GET ") &&
					socket.write(path) &&
					socket.write(" HTTP/1.1\r\n"))) {
					ESP_LOGE(TAG, "Failed to send request path");

					stop();
					return false;
				}

				// Send headers
				if (!(write_header("Host", host) &&
					  write_header("User-Agent", user_agent.c_str()) &&
					  write_header("Connection", "close"))) {

					ESP_LOGE(TAG, "Failed to send request headers");

					stop();
					return false;
				}

				// Write all provided headers
				for (int i = 0;;++i) {
					if (headers[i][0] == nullptr || headers[i][1] == nullptr) break;
					if (!write_header(headers[i][0], headers[i][1])) {
						ESP_LOGE(TAG, "Failed to send user headers");

						stop();
						return false;
					}
					ESP_LOGD(TAG, "hdr: %s --> %s", headers[i][0], headers[i][1]);
				}

				if (!socket.write("\r\n")) {
					ESP_LOGE(TAG, "Failed to end request");

					stop();
					return false;
				}
				socket.flush();

				return parse_response_headers();
			}

			int16_t next() override {
				if (done) return -1;

				if (chunked) return next_chunked();

				if (length >= 0) {
					if (remain_bytes == 0) {
						done = true;
						return -1;
					}
					int16_t c = raw_byte();
					if (c < 0) {
						ESP_LOGW(TAG, "body ended %ld bytes early", remain_bytes);
						done = true;
						return -1;
					}
					--remain_bytes;
					return c;
				}

				// read until close
				int16_t c = raw_byte();
				if (c < 0) done = true;
				return c;
			}

			// Close sockets
			void stop() override {
				socket.close();
				done = true;
			}

		private:
			int16_t raw_byte() {
				if (recvread == recvpending) {
					if (eof) return -1;
					ssize_t r = socket.read_some(recvbuf, sizeof recvbuf);
					if (r <= 0) {
						if (r < 0) ESP_LOGW(TAG, "Read failed");
						eof = true;
						return -1;
					}
					recvpending = (size_t)r;
					recvread = 0;
				}
				return recvbuf[recvread++];
			}

			// Reads up to (and drops) the next CRLF / LF
			bool read_line(std::string& out) {
				out.clear();
				while (true) {
					int16_t c = raw_byte();
					if (c < 0) return false;
					if (c == '\n') break;
					if (out.size() > 8192) return false;
					out.push_back((char)c);
				}
				if (!out.empty() && out.back() == '\r') out.pop_back();
				return true;
			}

			bool parse_response_headers() {
				std::string line;

				if (!read_line(line) || strncmp(line.c_str(), "HTTP/1.", 7) != 0 || line.size() < 12) {
					ESP_LOGE(TAG, "Bad status line");
					stop();
					return false;
				}

				char * end = nullptr;
				long code = strtol(line.c_str() + 9, &end, 10);
				if (end != line.c_str() + 12 || code < 100 || code > 999) {
					ESP_LOGE(TAG, "Bad status code");
					stop();
					return false;
				}

				while (true) {
					if (!read_line(line)) {
						ESP_LOGE(TAG, "Got error while recving headers");
						stop();
						return false;
					}
					if (line.empty()) break;

					auto colon = line.find(':');
					if (colon == std::string::npos) continue;

					std::string name = line.substr(0, colon);
					const char * value = line.c_str() + colon + 1;
					while (*value == ' ' || *value == '\t') ++value;

					if (!strcasecmp(name.c_str(), "Content-Length")) {
						length = atoi(value);
					}
					else if (!strcasecmp(name.c_str(), "Transfer-Encoding")) {
						chunked = strcasestr(value, "chunked") != nullptr;
					}
				}

				status = (int)code;
				if (chunked) length = -1;
				if (status == 204 || status == 304) length = 0;
				remain_bytes = length;

				ESP_LOGD(TAG, "Ready with code = %d; length = %d; chunked = %d", result_code(), content_length(), is_chunked());
				return true;
			}

			int16_t next_chunked() {
				if (chunk_remaining == 0) {
					std::string line;

					// the CRLF after the previous chunk's data
					if (after_chunk && (!read_line(line) || !line.empty())) {
						ESP_LOGW(TAG, "chunked framing broken");
						done = true;
						return -1;
					}

					if (!read_line(line)) {
						done = true;
						return -1;
					}

					char * end = nullptr;
					long size = strtol(line.c_str(), &end, 16);
					if (end == line.c_str() || size < 0 || (*end && *end != ';' && *end != ' ')) {
						ESP_LOGW(TAG, "chunked parser threw error");
						done = true;
						return -1;
					}

					if (size == 0) {
						// trailers
						while (read_line(line) && !line.empty()) {}
						done = true;
						return -1;
					}

					chunk_remaining = size;
					after_chunk = true;
				}

				int16_t c = raw_byte();
				if (c < 0) {
					ESP_LOGW(TAG, "body ended mid chunk");
					done = true;
					return -1;
				}
				--chunk_remaining;
				return c;
			}

			bool write_header(const char * name, const char * value) {
				if (!socket.write(name)) return false;
				if (!socket.write(": ")) return false;
				if (!socket.write(value)) return false;
				if (!socket.write("\r\n")) return false;
				return true;
			}

			Adapter socket;

			uint8_t recvbuf[512];
			size_t recvpending = 0, recvread = 0;
			bool eof = false;

			long remain_bytes = -1;
			long chunk_remaining = 0;
			bool after_chunk = false;
			bool done = false;
		};
	}
}

#endif
