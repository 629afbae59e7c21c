#include "http_client.hpp"
#include "errors.hpp"

#include <cctype>
#include <cstdlib>
#include <cstring>
#include <new>
#include <stdexcept>
#include <strings.h>
#include <utility>

#include <fmt/core.h>

namespace
{

// Owns a curl_slist built from request headers
struct HeaderList
{
    curl_slist *list = nullptr;

    ~HeaderList()
    {
        if (list)
        {
            curl_slist_free_all(list);
        }
    }

    void append(const std::string &header)
    {
        curl_slist *next = curl_slist_append(list, header.c_str());
        if (!next)
        {
            throw std::bad_alloc();
        }
        list = next;
    }
};

// State shared with the streaming callbacks of a single GET
struct StreamContext
{
    CURL *curl;
    StreamHandler &handler;
    bool notified = false;
    bool aborted = false;
    std::optional<std::uint64_t> rangeStart; // From the Content-Range of the final response

    // Deliver onResponse once, using whatever curl knows about the final response
    bool notify()
    {
        if (notified)
        {
            return !aborted;
        }
        notified = true;

        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        curl_off_t length = -1;
        curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);

        std::optional<std::uint64_t> contentLength;
        if (length >= 0)
        {
            contentLength = static_cast<std::uint64_t>(length);
        }

        if (!handler.onResponse(status, contentLength, rangeStart))
        {
            aborted = true;
        }
        return !aborted;
    }
};

std::string trim(std::string value)
{
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())))
    {
        value.pop_back();
    }
    size_t start = 0;
    while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start])))
    {
        ++start;
    }
    return value.substr(start);
}

bool headerNameIs(const std::string &line, size_t colon, const char *name)
{
    return colon == std::strlen(name) && strncasecmp(line.c_str(), name, colon) == 0;
}

// "bytes 500-1499/1500" -> 500
std::optional<std::uint64_t> parseRangeStart(const std::string &value)
{
    if (strncasecmp(value.c_str(), "bytes ", 6) != 0)
    {
        return std::nullopt;
    }
    size_t digits = value.find_first_not_of("0123456789", 6);
    if (digits == 6 || digits == std::string::npos || value[digits] != '-')
    {
        return std::nullopt;
    }
    return std::strtoull(value.c_str() + 6, nullptr, 10);
}

} // namespace

HttpClient::HttpClient() : HttpClient(Options{})
{
}

HttpClient::HttpClient(Options options)
    : curl_(curl_easy_init(), curl_easy_cleanup), options_(std::move(options))
{
    if (!curl_)
    {
        throw std::runtime_error("Failed to initialize CURL (out of memory or library error)");
    }
}

// Destructor: unique_ptr handles cleanup automatically
HttpClient::~HttpClient() = default;

void HttpClient::prepare(const std::string &url)
{
    CURL *curl = curl_.get();
    curl_easy_reset(curl);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());

    // Set a user-agent (some servers block requests without one)
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.userAgent.c_str());

    // HTTPS settings
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    // Follow redirects; provider links usually bounce through a CDN
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connectTimeoutSeconds));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
}

void HttpClient::fail(const std::string &url, CURLcode code) const
{
    throw TransferError(ErrorKind::TransientNetwork,
                        fmt::format("Request to {} failed: {}", url, curl_easy_strerror(code)));
}

size_t HttpClient::stringWriteCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    size_t totalSize = size * nmemb;
    static_cast<std::string *>(userdata)->append(ptr, totalSize);
    return totalSize;
}

size_t HttpClient::headerCallback(char *buffer, size_t size, size_t nitems, void *userdata)
{
    size_t totalSize = size * nitems;
    auto *info = static_cast<HeadInfo *>(userdata);

    std::string line(buffer, totalSize);
    // A new status line starts a new header block (redirect hop)
    if (line.rfind("HTTP/", 0) == 0)
    {
        info->contentDisposition.clear();
        return totalSize;
    }

    auto colon = line.find(':');
    if (colon != std::string::npos && headerNameIs(line, colon, "content-disposition"))
    {
        info->contentDisposition = trim(line.substr(colon + 1));
    }
    return totalSize;
}

HeadInfo HttpClient::head(const std::string &url)
{
    prepare(url);
    CURL *curl = curl_.get();

    HeadInfo info;
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &info);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(options_.requestTimeoutSeconds));

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK)
    {
        fail(url, res);
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &info.status);

    curl_off_t length = -1;
    curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
    if (length >= 0)
    {
        info.contentLength = static_cast<std::uint64_t>(length);
    }

    char *effective = nullptr;
    curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective);
    info.effectiveUrl = effective ? effective : url;
    return info;
}

HttpResponse HttpClient::post(const std::string &url,
                              const std::string &body,
                              const std::vector<std::string> &headers)
{
    prepare(url);
    CURL *curl = curl_.get();

    HeaderList headerList;
    for (const auto &header : headers)
    {
        headerList.append(header);
    }

    HttpResponse response;
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList.list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, stringWriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(options_.requestTimeoutSeconds));

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK)
    {
        fail(url, res);
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

size_t HttpClient::streamHeaderCallback(char *buffer, size_t size, size_t nitems, void *userdata)
{
    size_t totalSize = size * nitems;
    auto *context = static_cast<StreamContext *>(userdata);

    std::string line(buffer, totalSize);
    // Only the last header block (after redirects) describes the body
    if (line.rfind("HTTP/", 0) == 0)
    {
        context->rangeStart.reset();
        return totalSize;
    }

    auto colon = line.find(':');
    if (colon != std::string::npos && headerNameIs(line, colon, "content-range"))
    {
        context->rangeStart = parseRangeStart(trim(line.substr(colon + 1)));
    }
    return totalSize;
}

// Static callback: libcurl calls this with chunks of downloaded data
size_t HttpClient::streamWriteCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    size_t totalSize = size * nmemb;
    auto *context = static_cast<StreamContext *>(userdata);

    if (!context->notify())
    {
        return 0;
    }
    if (context->handler.shouldAbort() || !context->handler.onData(ptr, totalSize))
    {
        context->aborted = true;
        return 0; // Returning a different value makes libcurl abort the transfer
    }
    return totalSize;
}

int HttpClient::progressCallback(void *clientp,
                                 curl_off_t dltotal,
                                 curl_off_t dlnow,
                                 curl_off_t ultotal,
                                 curl_off_t ulnow)
{
    // Suppress unused parameter warnings
    (void)dltotal;
    (void)dlnow;
    (void)ultotal;
    (void)ulnow;

    auto *context = static_cast<StreamContext *>(clientp);
    if (context->handler.shouldAbort())
    {
        context->aborted = true;
        return 1; // Non-zero aborts the transfer
    }
    return 0;
}

StreamOutcome HttpClient::get(const std::string &url, std::uint64_t offset, StreamHandler &handler)
{
    prepare(url);
    CURL *curl = curl_.get();

    StreamContext context{curl, handler};

    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, streamWriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &context);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, streamHeaderCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &context);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &context);

    // Stalled transfers are detected by speed rather than a whole-request timeout
    if (options_.lowSpeedTimeoutSeconds > 0)
    {
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(options_.lowSpeedTimeoutSeconds));
    }

    // Range is set by hand rather than with CURLOPT_RESUME_FROM_LARGE: libcurl
    // rejects a 200 answer to a resume request, we restart from zero instead
    HeaderList headerList;
    if (offset > 0)
    {
        headerList.append(fmt::format("Range: bytes={}-", offset));
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList.list);
    }

    CURLcode res = curl_easy_perform(curl);

    if (context.aborted)
    {
        return StreamOutcome::Aborted;
    }

    if (res != CURLE_OK)
    {
        fail(url, res);
    }

    // Empty bodies never reach the write callback
    if (!context.notify())
    {
        return StreamOutcome::Aborted;
    }
    return StreamOutcome::Completed;
}
