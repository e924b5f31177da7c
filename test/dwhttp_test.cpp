#include <gtest/gtest.h>
#include <algorithm>
#include <memory>
#include <string>
#include <string.h>
#include "dwhttp.h"
#include "dwhttp_impl.h"

TEST(SplitUrl, Https) {
	std::string host, path;
	ASSERT_TRUE(dwhttp::split_url("https://api.weather.gov/gridpoints/TOP/31,80", host, path));
	EXPECT_EQ(host, "_api.weather.gov");
	EXPECT_EQ(path, "/gridpoints/TOP/31,80");
}

TEST(SplitUrl, HttpWithPort) {
	std::string host, path;
	ASSERT_TRUE(dwhttp::split_url("http://localhost:8080/points/1.0000,2.0000", host, path));
	EXPECT_EQ(host, "localhost:8080");
	EXPECT_EQ(path, "/points/1.0000,2.0000");
}

TEST(SplitUrl, BareHostGetsRootPath) {
	std::string host, path;
	ASSERT_TRUE(dwhttp::split_url("HTTPS://example.org", host, path));
	EXPECT_EQ(host, "_example.org");
	EXPECT_EQ(path, "/");
}

TEST(SplitUrl, RejectsOtherSchemes) {
	std::string host, path;
	EXPECT_FALSE(dwhttp::split_url("ftp://example.org/x", host, path));
	EXPECT_FALSE(dwhttp::split_url("/relative/path", host, path));
	EXPECT_FALSE(dwhttp::split_url("https:///nohost", host, path));
}

namespace {
	// Stands in for the socket: replays a canned response a few bytes at a time and records what was sent
	struct ScriptedAdapter {
		static std::string response;
		static std::string sent;
		static bool refuse;

		TickType_t deadline = 0;

		bool connect(const char *, const char *) {
			if (refuse) return false;
			connected = true;
			pos = 0;
			return true;
		}

		bool write(const char * buf) {
			if (!connected) return false;
			sent += buf;
			return true;
		}

		void flush() {}

		ssize_t read_some(uint8_t * buf, size_t max) {
			if (!connected) return -1;
			size_t n = std::min<size_t>({max, (size_t)7, response.size() - pos});
			memcpy(buf, response.data() + pos, n);
			pos += n;
			return (ssize_t)n;
		}

		void close() {connected = false;}

		bool connected = false;
		size_t pos = 0;
	};

	std::string ScriptedAdapter::response;
	std::string ScriptedAdapter::sent;
	bool ScriptedAdapter::refuse = false;

	dwhttp::Download fetch(const std::string& response, bool& ok) {
		ScriptedAdapter::response = response;
		ScriptedAdapter::sent.clear();

		static const char * const headers[][2] = {
			{"Accept", "application/geo+json"},
			{nullptr, nullptr}
		};

		auto d = std::make_unique<dwhttp::detail::Downloader<ScriptedAdapter>>();
		ok = d->request("api.test", "80", "/points/1,2", headers);
		return dwhttp::Download(std::move(d));
	}

	std::string body_of(dwhttp::Download& dw) {
		std::string body;
		int16_t c;
		while ((c = dw()) >= 0) body.push_back((char)c);
		return body;
	}

	struct DownloaderTest : ::testing::Test {
		void TearDown() override {
			ScriptedAdapter::refuse = false;
		}
	};
}

TEST_F(DownloaderTest, SendsTheRequest) {
	bool ok;
	auto dw = fetch("HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n", ok);
	ASSERT_TRUE(ok);

	EXPECT_EQ(ScriptedAdapter::sent,
		"GET /points/1,2 HTTP/1.1\r\n"
		"Host: api.test\r\n"
		"User-Agent: " + dwhttp::user_agent + "\r\n"
		"Connection: close\r\n"
		"Accept: application/geo+json\r\n"
		"\r\n");
}

TEST_F(DownloaderTest, ContentLength) {
	bool ok;
	auto dw = fetch("HTTP/1.1 200 OK\r\nServer: x\r\ncontent-length: 11\r\n\r\nhello worldTRAILING", ok);
	ASSERT_TRUE(ok);
	EXPECT_EQ(dw.result_code(), 200);
	EXPECT_TRUE(dw.ok());
	EXPECT_EQ(dw.content_length(), 11);
	EXPECT_FALSE(dw.is_unknown_length());
	EXPECT_EQ(body_of(dw), "hello world");
}

TEST_F(DownloaderTest, BodyEndingEarlyStops) {
	bool ok;
	auto dw = fetch("HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\n{\"a\":", ok);
	ASSERT_TRUE(ok);
	EXPECT_EQ(body_of(dw), "{\"a\":");
	EXPECT_EQ(dw(), -1);
}

TEST_F(DownloaderTest, ChunkedWithExtensionsAndTrailers) {
	bool ok;
	auto dw = fetch(
		"HTTP/1.1 200 OK\r\n"
		"Transfer-Encoding: chunked\r\n"
		"Content-Length: 3\r\n"
		"\r\n"
		"5;name=value\r\n"
		"hello\r\n"
		"6\r\n"
		" world\r\n"
		"0\r\n"
		"X-Checksum: abc\r\n"
		"\r\n", ok);
	ASSERT_TRUE(ok);
	EXPECT_TRUE(dw.is_unknown_length());
	EXPECT_EQ(body_of(dw), "hello world");
	EXPECT_EQ(dw(), -1);
}

TEST_F(DownloaderTest, ChunkedFramingErrorsEndTheBody) {
	bool ok;
	auto dw = fetch("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n3\r\nabcX\r\n", ok);
	ASSERT_TRUE(ok);
	EXPECT_EQ(body_of(dw), "abc");

	dw = fetch("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\nabc\r\n", ok);
	ASSERT_TRUE(ok);
	EXPECT_EQ(body_of(dw), "");

	// cut off mid chunk
	dw = fetch("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\na\r\nabc", ok);
	ASSERT_TRUE(ok);
	EXPECT_EQ(body_of(dw), "abc");
}

TEST_F(DownloaderTest, ErrorStatusStillParses) {
	bool ok;
	auto dw = fetch("HTTP/1.0 503 Service Unavailable\r\n\r\n", ok);
	ASSERT_TRUE(ok);
	EXPECT_EQ(dw.result_code(), 503);
	EXPECT_FALSE(dw.ok());
}

TEST_F(DownloaderTest, BadStatusLine) {
	const char * const bad[] = {
		"HTCPCP/1.0 418 I'm a teapot\r\n\r\n",
		"HTTP/1.1 2x0 OK\r\n\r\n",
		"HTTP/1.1 20\r\n\r\n",
		"HTTP/1.1 099 Low\r\n\r\n",
		"HTTP/1.1 200 OK\r\nContent-Length: 5\r\n", // headers never end
		"",
	};

	for (const char * response : bad) {
		bool ok;
		auto dw = fetch(response, ok);
		EXPECT_FALSE(ok) << response;
		EXPECT_EQ(dw.result_code(), -1) << response;
		EXPECT_EQ(dw(), -1) << response;
	}
}

TEST_F(DownloaderTest, NoContent) {
	bool ok;
	auto dw = fetch("HTTP/1.1 204 No Content\r\n\r\n", ok);
	ASSERT_TRUE(ok);
	EXPECT_EQ(dw.result_code(), 204);
	EXPECT_EQ(dw.content_length(), 0);
	EXPECT_EQ(dw(), -1);
}

TEST_F(DownloaderTest, ConnectFailure) {
	ScriptedAdapter::refuse = true;
	bool ok;
	auto dw = fetch("HTTP/1.1 200 OK\r\n\r\n", ok);
	EXPECT_FALSE(ok);
	EXPECT_EQ(dw.result_code(), -1);
	EXPECT_EQ(dw(), -1);
}

TEST(HttpsDownload, OverlongHostNameFailsCleanly) {
	// rejected by the tls layer before any socket is opened
	std::string host = "_" + std::string(300, 'a');
	auto dw = dwhttp::download_with_callback(host.c_str(), "/");
	EXPECT_EQ(dw.result_code(), -1);
	EXPECT_FALSE(dw.ok());
	EXPECT_EQ(dw(), -1);
}
