#ifndef HC_DWHTTP_H
#define HC_DWHTTP_H

#include <string.h>
#include <stdint.h>
#include <memory>
#include <string>

namespace dwhttp {
	namespace detail {
		// Internal type which hides HTTP/HTTPS connections
		struct DownloaderBase;
	}

	// A GET in progress: the status line and headers have been read, the body is pulled a byte at a time
	// (so it can be handed straight to the json parser). The connection is closed when this goes away.
	struct Download {
		Download(const Download&) = delete;
		Download(Download&& other);
		Download& operator=(const Download&) = delete;
		Download& operator=(Download&& other);
		~Download();

		// Internal use only.
		explicit Download(std::unique_ptr<detail::DownloaderBase> adapter);

		// Read single char, -1 at the end of the body (or on error)
		int16_t operator()();

		// -1 if the request never got a response
		int result_code() const;
		int content_length() const;
		bool is_unknown_length() const;

		bool ok() const {return result_code() >= 200 && result_code() < 300;}

		void stop();
	private:
		std::unique_ptr<detail::DownloaderBase> adapter;
	};

	// host may carry a :port suffix; a leading _ selects https.
	// headers is terminated by a {nullptr, nullptr} entry.
	Download download_with_callback(const char * host, const char * path);
	Download download_with_callback(const char * host, const char * path, const char * const headers[][2]);

	// Splits an absolute http/https url into the host (with the _ prefix for https) and path forms taken
	// by download_with_callback. Returns false for anything else.
	bool split_url(const char * url, std::string& host, std::string& path);
}

#endif
