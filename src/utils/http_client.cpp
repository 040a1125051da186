/**
 * BrlsWebImage - HTTP Client implementation using libcurl
 */

#include "utils/http_client.hpp"

#include <borealis.hpp>
#include <curl/curl.h>
#include <cctype>
#include <stdexcept>

namespace webimage {

// Download callback data structure
struct DownloadCallbackData {
    HttpClient::WriteCallback writeCallback;
    ContentLengthWatcher* sizeWatcher;
    bool cancelled;
};

bool HttpClient::globalInit() {
    CURLcode res = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (res != CURLE_OK) {
        brls::Logger::error("curl_global_init failed: {}", curl_easy_strerror(res));
        return false;
    }
    return true;
}

void HttpClient::globalCleanup() {
    curl_global_cleanup();
}

HttpClient::HttpClient() {
    m_curl = curl_easy_init();
    m_userAgent = BRLS_WEBIMAGE_CLIENT_NAME "/" BRLS_WEBIMAGE_CLIENT_VERSION " (" BRLS_WEBIMAGE_PLATFORM ")";
}

HttpClient::~HttpClient() {
    if (m_curl) {
        curl_easy_cleanup((CURL*)m_curl);
        m_curl = nullptr;
    }
}

bool HttpClient::parseContentLength(const std::string& headerLine, int64_t& size) {
    static const std::string name = "content-length";

    size_t colonPos = headerLine.find(':');
    if (colonPos != name.size()) return false;
    for (size_t i = 0; i < name.size(); i++) {
        if (std::tolower((unsigned char)headerLine[i]) != name[i]) return false;
    }

    std::string value = headerLine.substr(colonPos + 1);
    // Trim whitespace
    while (!value.empty() && (value[0] == ' ' || value[0] == '\t')) {
        value = value.substr(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' ||
           value.back() == ' ' || value.back() == '\t')) {
        value.pop_back();
    }
    if (value.empty() || !std::isdigit((unsigned char)value[0])) return false;

    try {
        size = std::stoll(value);
    } catch (const std::out_of_range&) {
        return false;
    } catch (const std::invalid_argument&) {
        return false;
    }
    return true;
}

bool HttpClient::isStatusLine(const std::string& headerLine) {
    return headerLine.compare(0, 5, "HTTP/") == 0;
}

void ContentLengthWatcher::onHeaderLine(const std::string& headerLine) {
    if (!m_callback) return;

    // A new response in the redirect chain
    if (HttpClient::isStatusLine(headerLine)) {
        m_reported = false;
        return;
    }
    if (m_reported) return;

    int64_t contentLength = 0;
    if (HttpClient::parseContentLength(headerLine, contentLength)) {
        m_callback(contentLength);
        m_reported = true;
    }
}

static size_t downloadWriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    DownloadCallbackData* data = static_cast<DownloadCallbackData*>(userp);
    size_t totalSize = size * nmemb;

    if (data && data->writeCallback) {
        if (!data->writeCallback(static_cast<const char*>(contents), totalSize)) {
            data->cancelled = true;
            return 0; // Return 0 to signal curl to abort
        }
    }

    return totalSize;
}

static size_t downloadHeaderCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    DownloadCallbackData* data = static_cast<DownloadCallbackData*>(userp);
    size_t totalSize = size * nmemb;

    if (data && data->sizeWatcher) {
        data->sizeWatcher->onHeaderLine(std::string(static_cast<char*>(contents), totalSize));
    }

    return totalSize;
}

HttpResponse HttpClient::download(const std::string& url, WriteCallback writeCallback, SizeCallback sizeCallback) {
    HttpResponse response;

    if (!m_curl) {
        response.error = "CURL not initialized";
        brls::Logger::error("HttpClient: {}", response.error);
        return response;
    }

    CURL* curl = (CURL*)m_curl;
    curl_easy_reset(curl);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());

    int connectTimeout = m_timeout > 30 ? 30 : 15;
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, (long)m_timeout);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, (long)connectTimeout);

    // Enable DNS caching for faster reconnects
    curl_easy_setopt(curl, CURLOPT_DNS_CACHE_TIMEOUT, 300L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

#ifdef __vita__
    // No CA bundle on the Vita
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
#endif
    curl_easy_setopt(curl, CURLOPT_SSLVERSION, CURL_SSLVERSION_TLSv1_2);

    curl_easy_setopt(curl, CURLOPT_USERAGENT, m_userAgent.c_str());

    ContentLengthWatcher sizeWatcher(sizeCallback);
    DownloadCallbackData callbackData;
    callbackData.writeCallback = writeCallback;
    callbackData.sizeWatcher = &sizeWatcher;
    callbackData.cancelled = false;

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, downloadWriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &callbackData);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, downloadHeaderCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &callbackData);

    // Abort if < 1KB/s for 30 seconds
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1024L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, 30L);

    brls::Logger::debug("HttpClient: GET {}", url);
    CURLcode res = curl_easy_perform(curl);

    if (callbackData.cancelled) {
        response.cancelled = true;
        response.error = "Cancelled";
        brls::Logger::debug("HttpClient: Download of {} cancelled", url);
        return response;
    }

    if (res != CURLE_OK) {
        response.error = curl_easy_strerror(res);
        brls::Logger::error("HttpClient: Download of {} failed: {}", url, response.error);
        return response;
    }

    long httpCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
    response.statusCode = (int)httpCode;
    response.success = (httpCode >= 200 && httpCode < 300);
    if (!response.success) {
        response.error = "HTTP " + std::to_string(httpCode);
        brls::Logger::error("HttpClient: Download of {} failed with HTTP {}", url, httpCode);
    } else {
        brls::Logger::debug("HttpClient: Download of {} completed", url);
    }

    return response;
}

} // namespace webimage
