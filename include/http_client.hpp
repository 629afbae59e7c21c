#pragma once

#include "http_transport.hpp"

#include <curl/curl.h>
#include <memory>
#include <string>

/**
 * libcurl implementation of HttpTransport.
 * Uses RAII to manage CURL handle lifecycle; one instance per thread.
 */
class HttpClient : public HttpTransport
{
public:
    struct Options
    {
        int connectTimeoutSeconds = 30;
        int lowSpeedTimeoutSeconds = 60; // Abort when below 1 B/s for this long (0 disables)
        int requestTimeoutSeconds = 60;  // Whole-request limit for HEAD and POST only
        std::string userAgent = "dlorch/1.0";
    };

    HttpClient();
    explicit HttpClient(Options options);
    ~HttpClient() override;

    // Delete copy operations (CURL handles aren't copyable)
    HttpClient(const HttpClient &) = delete;
    HttpClient &operator=(const HttpClient &) = delete;

    HeadInfo head(const std::string &url) override;

    HttpResponse post(const std::string &url,
                      const std::string &body,
                      const std::vector<std::string> &headers) override;

    StreamOutcome get(const std::string &url, std::uint64_t offset, StreamHandler &handler) override;

private:
    // CURL handle with custom deleter (RAII pattern)
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_;
    Options options_;

    /**
     * Reset the handle to a clean state and apply the options shared by every request.
     */
    void prepare(const std::string &url);

    /**
     * Throw a TransferError describing a failed curl_easy_perform.
     */
    [[noreturn]] void fail(const std::string &url, CURLcode code) const;

    static size_t stringWriteCallback(char *ptr, size_t size, size_t nmemb, void *userdata);
    static size_t headerCallback(char *buffer, size_t size, size_t nitems, void *userdata);
    static size_t streamHeaderCallback(char *buffer, size_t size, size_t nitems, void *userdata);
    static size_t streamWriteCallback(char *ptr, size_t size, size_t nmemb, void *userdata);

    /**
     * Static progress callback for libcurl; used only to poll StreamHandler::shouldAbort.
     * libcurl calls it at least once per second even when no data arrives.
     */
    static int progressCallback(void *clientp,
                                curl_off_t dltotal,
                                curl_off_t dlnow,
                                curl_off_t ultotal,
                                curl_off_t ulnow);
};
