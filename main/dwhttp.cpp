#include "dwhttp.h"
#include "dwhttp.cfg.h"
#include "dwhttp_impl.h"
#include <esp_log.h>
#include <FreeRTOS.h>
#include <task.h>
#include <bearssl.h>

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <unistd.h>
#include <dirent.h>
#include <errno.h>
#include <stdio.h>
#include <strings.h>
#include <stdlib.h>

#include <algorithm>
#include <new>
#include <vector>

namespace dwhttp {
	std::string user_agent = "hourcast/1.0";
	int timeout_ms = 15000;
	std::string ca_dir = "/etc/hourcast/ca";

	namespace detail {
		namespace adapter {
			const static char * const TAG = "d_adapter";

			struct HttpAdapter {
				bool connect(const char *host, const char* port="80") {
					if (is_connected()) {
						ESP_LOGW(TAG, "httpadapter still connected, closing");
						close();
					}

					addrinfo hints{};
					addrinfo *result{}, *rp{};
					hints.ai_family = AF_UNSPEC;
					hints.ai_socktype = SOCK_STREAM;

					int stat;
					if ((stat = getaddrinfo(host, port, &hints, &result))) {
						ESP_LOGE(TAG, "gai fail: %s/%d", gai_strerror(stat), stat);
						return false;
					}

					// Every blocking call gets the whole request timeout; the deadline check covers the total.
					const struct timeval timeout = { timeout_ms / 1000, (timeout_ms % 1000) * 1000 };

					for (rp = result; rp != nullptr; rp = rp->ai_next) {
						sockno = ::socket(rp->ai_family, rp->ai_socktype,
								rp->ai_protocol);
						if (sockno == -1)
							continue;

						setsockopt(sockno, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
						setsockopt(sockno, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));

						if (::connect(sockno, rp->ai_addr, rp->ai_addrlen) != -1)
							break;                  /* Success */

						::close(sockno);
						sockno = -1;
					}

					freeaddrinfo(result);

					if (rp == nullptr) {
						ESP_LOGE(TAG, "failed to connect to %s:%s", host, port);
						return false;
					}

					// We are now connected.
					return true;
				}

				ssize_t read_some(uint8_t *buf, size_t max) {
					if (!is_connected()) return -1;
					int code = _read(buf, max);
					if (code < 0) close();
					return code;
				}

				bool write(const uint8_t *buf, size_t length) {
					if (!is_connected()) return false;
					size_t pos = 0;
					while (pos < length) {
						int code = _write(buf + pos, length - pos);
						if (code < 0) {
							close();
							return false;
						}
						pos += code;
					}
					return true;
				}

				bool write(const char *buf) {
					return write((const uint8_t *)buf, strlen(buf));
				}

				void close() {
					if (sockno != -1) ::close(sockno);
					sockno = -1;
				}

				void flush() {}

				bool is_connected() {
					return sockno != -1;
				}

				// Absolute tick count by which the request has to be finished
				TickType_t deadline = 0;
			protected:
				bool timed_out() const {
					return (int32_t)(xTaskGetTickCount() - deadline) > 0;
				}

				// 0 on orderly close, -1 on failure
				int _read(unsigned char *buf, size_t len) {
					while (true) {
						if (!len) return 0;
						if (timed_out()) {
							ESP_LOGW(TAG, "read timeout");
							return -1;
						}

						ssize_t rlen = ::recv(sockno, buf, len, 0);
						if (rlen < 0) {
							if (errno == EINTR) continue;
							if (errno == EAGAIN || errno == EWOULDBLOCK) {
								ESP_LOGW(TAG, "read timeout");
								return -1;
							}
							// don't pollute log for remote closing early
							if (errno != ENOTCONN) ESP_LOGE(TAG, "read failed with errno %d", errno);
							return -1;
						}
						return (int)rlen;
					}
				}

				int _write(const unsigned char *buf, size_t len) {
					while (true) {
						if (!len) return 0;
						if (timed_out()) {
							ESP_LOGW(TAG, "write timeout");
							return -1;
						}

						ssize_t wlen = ::send(sockno, buf, len, MSG_NOSIGNAL);
						if (wlen <= 0) {
							if (wlen < 0 && errno == EINTR) continue;
							ESP_LOGE(TAG, "write failed with errno %d", errno);
							return -1;
						}
						return (int)wlen;
					}
				}

				int sockno = -1;
			};

			// One DER certificate from ca_dir, turned into a trust anchor
			struct HeldTA {
				HeldTA(const char *filename) {
					std::unique_ptr<br_x509_decoder_context> ctx(new br_x509_decoder_context{});

					br_x509_decoder_init(ctx.get(), [](void * dest, const void * data, size_t len){
						auto& dn = *(std::vector<unsigned char> *)dest;
						dn.insert(dn.end(), (const unsigned char *)data, (const unsigned char *)data + len);
					}, &dn);

					FILE * certf = fopen(filename, "rb");
					if (!certf) {
						ESP_LOGE(TAG, "unable to open %s", filename);
						return;
					}

					// Continue reading in 256 byte chunks
					unsigned char buf[256];
					size_t btr;
					while ((btr = fread(buf, 1, sizeof buf, certf)) > 0) {
						br_x509_decoder_push(ctx.get(), buf, btr);
					}

					bool read_failed = ferror(certf);
					fclose(certf);
					if (read_failed) {
						ESP_LOGE(TAG, "File access in HeldTA failed");
						return;
					}

					br_x509_pkey *pk = br_x509_decoder_get_pkey(ctx.get());
					if (pk == nullptr) {
						ESP_LOGE(TAG, "No pkey in cert %s (err %d)", filename, br_x509_decoder_last_error(ctx.get()));
						return;
					}

					anchor.dn.data = dn.data();
					anchor.dn.len = dn.size();
					anchor.flags = br_x509_decoder_isCA(ctx.get()) ? BR_X509_TA_CA : 0;

					// Extract the public key
					switch (pk->key_type) {
						case BR_KEYTYPE_RSA:
							key_a.assign(pk->key.rsa.n, pk->key.rsa.n + pk->key.rsa.nlen);
							key_b.assign(pk->key.rsa.e, pk->key.rsa.e + pk->key.rsa.elen);

							anchor.pkey.key_type = BR_KEYTYPE_RSA;
							anchor.pkey.key.rsa.n = key_a.data();
							anchor.pkey.key.rsa.nlen = key_a.size();
							anchor.pkey.key.rsa.e = key_b.data();
							anchor.pkey.key.rsa.elen = key_b.size();
							is_ok = true;
							return;
						case BR_KEYTYPE_EC:
							key_a.assign(pk->key.ec.q, pk->key.ec.q + pk->key.ec.qlen);

							anchor.pkey.key_type = BR_KEYTYPE_EC;
							anchor.pkey.key.ec.curve = pk->key.ec.curve;
							anchor.pkey.key.ec.q = key_a.data();
							anchor.pkey.key.ec.qlen = key_a.size();
							is_ok = true;
							return;
						default:
							ESP_LOGE(TAG, "Unknown key type");
							return;
					}
				}

				HeldTA(const HeldTA& other) = delete;
				HeldTA& operator=(const HeldTA& other) = delete;

				// valid for duration of this class and when is_ok is true
				const br_x509_trust_anchor * get_anchor() const {
					if (is_ok) return &anchor;
					else return nullptr;
				}

			private:
				br_x509_trust_anchor anchor{};
				std::vector<unsigned char> dn, key_a, key_b;
				bool is_ok = false;
			};

			// Every anchor in ca_dir, loaded on first use and kept for the life of the process.
			struct TrustStore {
				const br_x509_trust_anchor * data() const {return anchors.data();}
				size_t size() const {return anchors.size();}

				static const TrustStore& get() {
					static TrustStore store{ca_dir.c_str()};
					return store;
				}

			private:
				explicit TrustStore(const char * dir) {
					DIR * d = opendir(dir);
					if (!d) {
						ESP_LOGE(TAG, "unable to open ca dir %s (errno %d)", dir, errno);
						return;
					}

					std::vector<std::string> files;
					while (dirent * ent = readdir(d)) {
						if (ent->d_name[0] == '.') continue;
						files.push_back(std::string(dir) + "/" + ent->d_name);
					}
					closedir(d);

					// directory order isn't stable
					std::sort(files.begin(), files.end());

					for (const auto& file : files) {
						auto held = std::make_unique<HeldTA>(file.c_str());
						if (!held->get_anchor()) continue;
						anchors.push_back(*held->get_anchor());
						held_tas.push_back(std::move(held));
					}

					ESP_LOGI(TAG, "loaded %d trust anchors from %s", (int)anchors.size(), dir);
				}

				std::vector<std::unique_ptr<HeldTA>> held_tas;
				std::vector<br_x509_trust_anchor> anchors;
			};

			struct HttpsAdapter : HttpAdapter {
				bool connect(const char* host, const char* port="443") {
					const auto& store = TrustStore::get();

					// Create all the objects
					ssl_cc.reset(new (std::nothrow) br_ssl_client_context{});
					ssl_xc.reset(new (std::nothrow) br_x509_minimal_context{});
					ssl_ic.reset(new (std::nothrow) br_sslio_context{});
					iobuf.reset(new (std::nothrow) unsigned char[BR_SSL_BUFSIZE_BIDI]);
					if (!ssl_cc || !ssl_xc || !ssl_ic || !iobuf) {
						ESP_LOGE(TAG, "Out of memory allocating ssl state");
						close();
						return false;
					}

					// Begin initializing bearssl
					br_ssl_client_init_full(ssl_cc.get(), ssl_xc.get(), store.data(), store.size());

					// Set the buffers
					br_ssl_engine_set_buffer(&ssl_cc->eng, iobuf.get(), BR_SSL_BUFSIZE_BIDI, 1);

					// Feed some entropy into bearssl (it also seeds itself from the OS)
					unsigned char block[32];
					if (FILE * rnd = fopen("/dev/urandom", "rb")) {
						if (fread(block, 1, sizeof block, rnd) == sizeof block)
							br_ssl_engine_inject_entropy(&ssl_cc->eng, block, sizeof block);
						fclose(rnd);
					}

					// Copy the host
					active_host = host;
					// Reset the SSL context; this is where bad server names are rejected, so do it before touching the network
					if (!br_ssl_client_reset(ssl_cc.get(), active_host.c_str(), 0)) {
						ESP_LOGE(TAG, "ssl reset failed with %d", br_ssl_engine_last_error(&ssl_cc->eng));
						close();
						return false;
					}

					if (!store.size()) {
						ESP_LOGE(TAG, "no trust anchors, refusing https");
						close();
						return false;
					}

					// Try and establish a connection with a socket.
					if (!HttpAdapter::connect(host, port)) {
						close();
						return false;
					}

					// Initialize IO
					br_sslio_init(ssl_ic.get(), &ssl_cc->eng,
						[](void *arg, unsigned char *data, size_t len){
							// bearssl wants at least one byte or an error
							int r = ((HttpsAdapter *)arg)->_read(data, len);
							return r == 0 ? -1 : r;
						}, this,
						[](void *arg, const unsigned char *data, size_t len){
							return ((HttpsAdapter *)arg)->_write(data, len);
						}, this
					);
					io_ready = true;
					return true;
				}

				ssize_t read_some(uint8_t *buf, size_t max) {
					if (!is_connected()) return -1;
					int rlen = br_sslio_read(ssl_ic.get(), buf, max);
					if (rlen < 0) {
						// a clean close_notify reads as end of stream
						bool clean = br_ssl_engine_current_state(&ssl_cc->eng) == BR_SSL_CLOSED && br_ssl_engine_last_error(&ssl_cc->eng) == BR_ERR_OK;
						close();
						return clean ? 0 : -1;
					}
					return rlen;
				}

				bool write(const uint8_t *buf, size_t length) {
					if (!is_connected()) return false;
					if (br_sslio_write_all(ssl_ic.get(), buf, length) < 0) {
						close();
						return false;
					}
					return true;
				}

				bool write(const char *buf) {
					return write((const uint8_t *)buf, strlen(buf));
				}

				void close() {
					if (io_ready && is_connected()) {
						// Check error for logging
						int err = br_ssl_engine_last_error(&ssl_cc->eng);
						if (err) ESP_LOGW(TAG, "ssl closing with error %d", err);
						if (err == BR_ERR_IO) ESP_LOGW(TAG, "possible errno %d", errno);
						// Send a close, but ignore it
						br_sslio_close(ssl_ic.get());
					}
					io_ready = false;
					// Close the underlying socket
					HttpAdapter::close();
					// Delete all the bearssl objects
					ssl_ic.reset();
					ssl_xc.reset();
					ssl_cc.reset();
					iobuf.reset();
					active_host.clear();
				}

				void flush() {
					if (!is_connected()) return;
					br_sslio_flush(ssl_ic.get());
				}

				bool is_connected() {
					return io_ready && ssl_cc && ssl_xc && ssl_ic && HttpAdapter::is_connected();
				}
			private:
				// These are allocated when a connection is made
				std::unique_ptr<br_ssl_client_context> ssl_cc;
				std::unique_ptr<br_x509_minimal_context> ssl_xc;
				std::unique_ptr<br_sslio_context> ssl_ic;
				std::unique_ptr<unsigned char[]> iobuf;
				std::string active_host;
				// set once br_sslio_init has run
				bool io_ready = false;
			};
		}

		template<typename T>
		dwhttp::Download download_with_callback_impl(const char * host, const char * path, const char * const headers[][2], const char * default_port) {
			std::string name = host, port = default_port;
			auto colon = name.rfind(':');
			if (colon != std::string::npos && name.find(':') == colon) {
				port = name.substr(colon + 1);
				name.erase(colon);
			}

			auto dwnld = std::make_unique<Downloader<T>>();
			if (!dwnld->request(name.c_str(), port.c_str(), path, headers)) {
				ESP_LOGW(TAG, "request to %s%s failed", host, path);
			}

			return dwhttp::Download(std::move(dwnld));
		}
	}
}

dwhttp::Download dwhttp::download_with_callback(const char * host, const char * path, const char * const headers[][2]) {
	if (host[0] != '_') {
		return detail::download_with_callback_impl<detail::adapter::HttpAdapter>(host, path, headers, "80");
	}
	else {
		return detail::download_with_callback_impl<detail::adapter::HttpsAdapter>(++host, path, headers, "443");
	}
}

dwhttp::Download dwhttp::download_with_callback(const char * host, const char * path) {
	static const char * const headers[][2] = {{nullptr, nullptr}};
	return download_with_callback(host, path, headers);
}

bool dwhttp::split_url(const char * url, std::string& host, std::string& path) {
	bool https;
	if (!strncasecmp(url, "https://", 8)) {
		https = true;
		url += 8;
	}
	else if (!strncasecmp(url, "http://", 7)) {
		https = false;
		url += 7;
	}
	else return false;

	const char * slash = strchr(url, '/');
	size_t host_len = slash ? (size_t)(slash - url) : strlen(url);
	if (!host_len) return false;

	host.assign(https ? "_" : "");
	host.append(url, host_len);
	path = slash ? slash : "/";
	return true;
}

dwhttp::Download::Download(std::unique_ptr<detail::DownloaderBase> adapter) : adapter(std::move(adapter)) {}
dwhttp::Download::Download(Download&& other) = default;
dwhttp::Download& dwhttp::Download::operator=(Download&& other) = default;
dwhttp::Download::~Download() = default;

int16_t dwhttp::Download::operator()() {
	if (!adapter) return -1;
	return adapter->next();
}

int dwhttp::Download::result_code() const {
	return adapter ? adapter->result_code() : -1;
}
int dwhttp::Download::content_length() const {
	return adapter ? adapter->content_length() : -1;
}
bool dwhttp::Download::is_unknown_length() const {
	return adapter ? adapter->is_unknown_length() : true;
}
void dwhttp::Download::stop() {
	if (adapter) adapter->stop();
}
