#include "aria2_client.hpp"
#include "errors.hpp"

#include <chrono>
#include <cstdlib>
#include <utility>

#include <fmt/core.h>

using json = nlohmann::json;

namespace
{

// aria2 encodes every number as a decimal string
std::uint64_t requireNumber(const json &object, const char *key, const char *what)
{
    auto it = object.find(key);
    if (it == object.end())
    {
        throw DaemonTransportError(fmt::format("Malformed {}: missing '{}'", what, key));
    }

    if (it->is_number_unsigned())
    {
        return it->get<std::uint64_t>();
    }
    if (!it->is_string())
    {
        throw DaemonTransportError(fmt::format("Malformed {}: '{}' is not a number", what, key));
    }

    const std::string &text = it->get_ref<const std::string &>();
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos)
    {
        throw DaemonTransportError(fmt::format("Malformed {}: '{}' is not a number ({})", what, key, text));
    }
    return std::strtoull(text.c_str(), nullptr, 10);
}

const char *STATUS_KEYS[] = {"gid", "status", "totalLength", "completedLength",
                             "downloadSpeed", "errorCode", "errorMessage"};

} // namespace

bool DaemonStatus::isNotFound() const
{
    return errorCode && *errorCode == DAEMON_NOT_FOUND_CODE;
}

bool DaemonStatus::isComplete() const
{
    return state == "complete";
}

bool DaemonStatus::isFailed() const
{
    return state == "error" || state == "removed" || errorCode.has_value();
}

double DaemonStatus::fraction() const
{
    if (totalBytes == 0)
    {
        return 0.0;
    }
    return static_cast<double>(completedBytes) / static_cast<double>(totalBytes);
}

RequestIdGenerator::RequestIdGenerator(std::string prefix) : prefix_(std::move(prefix))
{
}

std::string RequestIdGenerator::next()
{
    auto now = std::chrono::system_clock::now().time_since_epoch();
    auto nanos = static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
    std::uint64_t count = counter_.fetch_add(1, std::memory_order_relaxed);
    return fmt::format("{}-{:x}-{:x}", prefix_, nanos, count);
}

Aria2Client::Aria2Client(HttpTransport &transport,
                         RequestIdGenerator &ids,
                         std::string endpoint,
                         std::optional<std::string> secret)
    : transport_(transport), ids_(ids), endpoint_(std::move(endpoint)), secret_(std::move(secret))
{
}

json Aria2Client::call(const std::string &method, json params)
{
    json rpcParams = json::array();
    if (secret_)
    {
        rpcParams.push_back("token:" + *secret_);
    }
    for (auto &param : params)
    {
        rpcParams.push_back(std::move(param));
    }

    json request = {
        {"jsonrpc", "2.0"},
        {"id", ids_.next()},
        {"method", "aria2." + method},
        {"params", std::move(rpcParams)},
    };

    HttpResponse response;
    try
    {
        response = transport_.post(endpoint_, request.dump(), {"Content-Type: application/json"});
    }
    catch (const TransferError &e)
    {
        throw DaemonTransportError(fmt::format("Aria2 RPC {} failed: {}", method, e.what()));
    }

    // aria2 answers RPC errors with HTTP 400 and a regular error envelope,
    // so try to decode the body before looking at the status
    json reply = json::parse(response.body, nullptr, false);
    if (reply.is_discarded() || !reply.is_object())
    {
        if (response.status < 200 || response.status >= 300)
        {
            throw DaemonTransportError(fmt::format("Aria2 RPC HTTP error: {}", response.status));
        }
        throw DaemonTransportError(fmt::format("Aria2 RPC {} returned a non-JSON body", method));
    }

    bool hasResult = reply.contains("result");
    bool hasError = reply.contains("error") && !reply["error"].is_null();
    if (hasResult && hasError)
    {
        throw DaemonTransportError(fmt::format("Aria2 RPC {} returned both result and error", method));
    }

    if (hasError)
    {
        const json &error = reply["error"];
        if (!error.is_object())
        {
            throw DaemonTransportError(fmt::format("Aria2 RPC {} returned a malformed error", method));
        }
        auto code = error.find("code");
        if (code == error.end() || !code->is_number_integer())
        {
            throw DaemonTransportError(fmt::format("Aria2 RPC {} returned an error without an integer code", method));
        }
        std::string message = "unknown error";
        auto text = error.find("message");
        if (text != error.end() && text->is_string())
        {
            message = text->get<std::string>();
        }
        throw DaemonProtocolError(code->get<long>(), message);
    }

    if (!hasResult)
    {
        if (response.status < 200 || response.status >= 300)
        {
            throw DaemonTransportError(fmt::format("Aria2 RPC HTTP error: {}", response.status));
        }
        throw DaemonTransportError(fmt::format("Aria2 RPC {} returned no result", method));
    }
    return reply["result"];
}

json Aria2Client::optionsToJson(const DaemonOptions &options)
{
    json object = json::object();
    if (!options.dir.empty())
    {
        object["dir"] = options.dir;
    }
    if (!options.out.empty())
    {
        object["out"] = options.out;
    }
    if (options.maxDownloadLimit)
    {
        object["max-download-limit"] = std::to_string(*options.maxDownloadLimit);
    }
    object["continue"] = options.continuePartial ? "true" : "false";
    return object;
}

DaemonTaskId Aria2Client::submitByUri(const std::vector<std::string> &urls, const DaemonOptions &options)
{
    json result = call("addUri", json::array({json(urls), optionsToJson(options)}));
    if (!result.is_string())
    {
        throw DaemonTransportError("Aria2 addUri did not return a GID");
    }
    return result.get<std::string>();
}

json Aria2Client::rawStatus(const DaemonTaskId &id)
{
    return call("tellStatus", json::array({id}));
}

DaemonStatus Aria2Client::status(const DaemonTaskId &id)
{
    json keys = json::array();
    for (const char *key : STATUS_KEYS)
    {
        keys.push_back(key);
    }
    return parseStatus(call("tellStatus", json::array({id, keys})));
}

void Aria2Client::remove(const DaemonTaskId &id)
{
    call("remove", json::array({id}));
}

void Aria2Client::pause(const DaemonTaskId &id)
{
    call("pause", json::array({id}));
}

void Aria2Client::unpause(const DaemonTaskId &id)
{
    call("unpause", json::array({id}));
}

void Aria2Client::purgeResult(const DaemonTaskId &id)
{
    call("removeDownloadResult", json::array({id}));
}

GlobalStat Aria2Client::globalStats()
{
    return parseGlobalStat(call("getGlobalStat"));
}

DaemonStatus Aria2Client::parseStatus(const json &result)
{
    if (!result.is_object())
    {
        throw DaemonTransportError("Malformed status: result is not an object");
    }

    DaemonStatus status;
    status.completedBytes = requireNumber(result, "completedLength", "status");
    status.totalBytes = requireNumber(result, "totalLength", "status");
    status.speedBytesPerSec = requireNumber(result, "downloadSpeed", "status");

    auto state = result.find("status");
    if (state != result.end() && state->is_string())
    {
        status.state = state->get<std::string>();
    }

    if (result.contains("errorCode"))
    {
        long code = static_cast<long>(requireNumber(result, "errorCode", "status"));
        if (code != 0)
        {
            status.errorCode = code;
        }
    }

    auto message = result.find("errorMessage");
    if (message != result.end() && message->is_string())
    {
        status.errorMessage = message->get<std::string>();
    }
    return status;
}

GlobalStat Aria2Client::parseGlobalStat(const json &result)
{
    if (!result.is_object())
    {
        throw DaemonTransportError("Malformed global stat: result is not an object");
    }

    GlobalStat stat;
    stat.downloadSpeed = requireNumber(result, "downloadSpeed", "global stat");
    stat.numActive = requireNumber(result, "numActive", "global stat");
    stat.numWaiting = requireNumber(result, "numWaiting", "global stat");
    stat.numStopped = requireNumber(result, "numStopped", "global stat");
    return stat;
}
