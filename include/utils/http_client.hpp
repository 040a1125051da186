/**
 * BrlsWebImage - HTTP Client
 * Using libcurl for image downloads
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <utility>

#ifndef BRLS_WEBIMAGE_CLIENT_NAME
#define BRLS_WEBIMAGE_CLIENT_NAME "BrlsWebImage"
#endif
#ifndef BRLS_WEBIMAGE_CLIENT_VERSION
#define BRLS_WEBIMAGE_CLIENT_VERSION "1.0.0"
#endif
#ifndef BRLS_WEBIMAGE_PLATFORM
#define BRLS_WEBIMAGE_PLATFORM "borealis"
#endif

namespace webimage {

// Result of a transfer. The body goes to the write callback, not here.
struct HttpResponse {
    int statusCode = 0;
    std::string error;
    bool success = false;
    bool cancelled = false;  // The write callback asked to stop
};

/**
 * HTTP Client using libcurl. One instance per thread.
 */
class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Initialize/cleanup (call once globally)
    static bool globalInit();
    static void globalCleanup();

    // writeCallback: receives data chunks, return false to cancel
    // sizeCallback: called once with the Content-Length when the server sends one
    using WriteCallback = std::function<bool(const char* data, size_t size)>;
    using SizeCallback = std::function<void(int64_t totalSize)>;
    HttpResponse download(const std::string& url, WriteCallback writeCallback, SizeCallback sizeCallback = nullptr);

    void setTimeout(int seconds) { m_timeout = seconds; }

    // Reads a "Content-Length: N" header line. False for any other line or a
    // malformed value.
    static bool parseContentLength(const std::string& headerLine, int64_t& size);

    // True for the "HTTP/1.1 200 OK" line that opens each response's headers
    static bool isStatusLine(const std::string& headerLine);

private:
    void* m_curl = nullptr;
    int m_timeout = 30;
    std::string m_userAgent;
};

/**
 * Feeds header lines to a SizeCallback. With redirects followed, curl hands
 * over the headers of every response in the chain; each response may report
 * its own Content-Length once, so the body that is finally written is sized by
 * the last one.
 */
class ContentLengthWatcher {
public:
    explicit ContentLengthWatcher(HttpClient::SizeCallback callback) : m_callback(std::move(callback)) {}

    void onHeaderLine(const std::string& headerLine);

private:
    HttpClient::SizeCallback m_callback;
    bool m_reported = false;
};

} // namespace webimage
