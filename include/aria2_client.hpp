#pragma once

#include "http_transport.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

/**
 * Opaque identifier of a daemon transfer (aria2 GID).
 */
using DaemonTaskId = std::string;

/**
 * Typed snapshot of aria2.tellStatus.
 */
struct DaemonStatus
{
    std::uint64_t completedBytes = 0;
    std::uint64_t totalBytes = 0;        // 0 until the daemon knows the size
    std::uint64_t speedBytesPerSec = 0;
    std::optional<long> errorCode;       // Set only for non-zero codes
    std::string errorMessage;
    std::string state;                   // active, waiting, paused, error, complete, removed

    bool isNotFound() const;
    bool isComplete() const;

    /**
     * Daemon gave up on the transfer (error or removed state, or a non-zero error code).
     */
    bool isFailed() const;

    /**
     * completed / total, 0 while the total is unknown.
     */
    double fraction() const;
};

/**
 * Per-submission options, mapped onto aria2 option names.
 */
struct DaemonOptions
{
    std::string dir;
    std::string out;
    std::optional<std::uint64_t> maxDownloadLimit; // bytes per second, unset = uncapped
    bool continuePartial = true;                   // resume from bytes already on disk
};

struct GlobalStat
{
    std::uint64_t downloadSpeed = 0;
    std::uint64_t numActive = 0;
    std::uint64_t numWaiting = 0;
    std::uint64_t numStopped = 0;
};

/**
 * Operations the renewal driver needs from the external download daemon.
 */
class DownloadDaemon
{
public:
    virtual ~DownloadDaemon() = default;

    virtual DaemonTaskId submitByUri(const std::vector<std::string> &urls, const DaemonOptions &options) = 0;
    virtual DaemonStatus status(const DaemonTaskId &id) = 0;
    virtual void remove(const DaemonTaskId &id) = 0;
    virtual void pause(const DaemonTaskId &id) = 0;
    virtual void unpause(const DaemonTaskId &id) = 0;
    virtual GlobalStat globalStats() = 0;

    /**
     * Drop a finished task from the daemon's result list.
     */
    virtual void purgeResult(const DaemonTaskId &id) = 0;
};

/**
 * Correlation ids for JSON-RPC calls: "<prefix>-<hex ns timestamp>-<hex counter>".
 * The atomic counter keeps ids unique even when the clock does not move.
 */
class RequestIdGenerator
{
public:
    explicit RequestIdGenerator(std::string prefix = "dlorch");

    std::string next();

private:
    std::string prefix_;
    std::atomic<std::uint64_t> counter_{0};
};

/**
 * Client for an aria2 daemon speaking JSON-RPC 2.0 over HTTP POST.
 */
class Aria2Client : public DownloadDaemon
{
public:
    static constexpr const char *DEFAULT_ENDPOINT = "http://localhost:6800/jsonrpc";

    /**
     * @param transport HTTP transport used for every call
     * @param ids Correlation id source
     * @param endpoint JSON-RPC endpoint URL
     * @param secret Optional rpc-secret, sent as "token:<secret>" first parameter
     */
    Aria2Client(HttpTransport &transport,
                RequestIdGenerator &ids,
                std::string endpoint = DEFAULT_ENDPOINT,
                std::optional<std::string> secret = std::nullopt);

    /**
     * Send one JSON-RPC call and return its `result`.
     *
     * @param method Method name without the "aria2." prefix (e.g. "addUri")
     * @param params Positional parameters (the secret is prepended automatically)
     * @throws DaemonTransportError on transport failure or malformed response
     * @throws DaemonProtocolError when the daemon answers with an error object
     */
    nlohmann::json call(const std::string &method, nlohmann::json params = nlohmann::json::array());

    DaemonTaskId submitByUri(const std::vector<std::string> &urls, const DaemonOptions &options) override;
    DaemonStatus status(const DaemonTaskId &id) override;
    void remove(const DaemonTaskId &id) override;
    void pause(const DaemonTaskId &id) override;
    void unpause(const DaemonTaskId &id) override;
    GlobalStat globalStats() override;
    void purgeResult(const DaemonTaskId &id) override;

    /**
     * Raw tellStatus result (all keys), for display.
     */
    nlohmann::json rawStatus(const DaemonTaskId &id);

    const std::string &endpoint() const { return endpoint_; }

    /**
     * Convert a tellStatus result. Unknown keys are ignored.
     * @throws DaemonTransportError if a required length/speed field is missing or not numeric
     */
    static DaemonStatus parseStatus(const nlohmann::json &result);

    static GlobalStat parseGlobalStat(const nlohmann::json &result);

    static nlohmann::json optionsToJson(const DaemonOptions &options);

private:
    HttpTransport &transport_;
    RequestIdGenerator &ids_;
    std::string endpoint_;
    std::optional<std::string> secret_;
};
