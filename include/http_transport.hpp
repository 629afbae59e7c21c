#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * Result of a HEAD probe.
 */
struct HeadInfo
{
    long status = 0;
    std::optional<std::uint64_t> contentLength;
    std::string contentDisposition; // Raw Content-Disposition header value, if any
    std::string effectiveUrl;       // URL after redirects
};

/**
 * Buffered response of a small request (RPC, provider API).
 */
struct HttpResponse
{
    long status = 0;
    std::string body;
};

/**
 * Receiver of a streamed GET body. Returning false from any callback aborts the transfer.
 */
class StreamHandler
{
public:
    virtual ~StreamHandler() = default;

    /**
     * Called once per request with the final (post-redirect) status, before the first body byte.
     *
     * @param status HTTP status code
     * @param contentLength Length of the body that follows, if announced
     * @param rangeStart First byte position of a Content-Range reply, if the server sent one
     */
    virtual bool onResponse(long status,
                            std::optional<std::uint64_t> contentLength,
                            std::optional<std::uint64_t> rangeStart) = 0;

    virtual bool onData(const char *data, std::size_t size) = 0;

    /**
     * Polled periodically while the transfer is idle or running.
     */
    virtual bool shouldAbort() = 0;
};

enum class StreamOutcome
{
    Completed, // Body fully received
    Aborted    // A handler callback asked to stop
};

/**
 * Minimal HTTP surface needed by the download subsystem.
 * Implementations throw TransferError(ErrorKind::TransientNetwork) on transport failures.
 */
class HttpTransport
{
public:
    virtual ~HttpTransport() = default;

    virtual HeadInfo head(const std::string &url) = 0;

    virtual HttpResponse post(const std::string &url,
                              const std::string &body,
                              const std::vector<std::string> &headers) = 0;

    /**
     * GET `url`, asking for bytes from `offset` onward when offset > 0.
     */
    virtual StreamOutcome get(const std::string &url, std::uint64_t offset, StreamHandler &handler) = 0;
};
