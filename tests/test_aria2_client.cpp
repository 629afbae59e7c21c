#include "aria2_client.hpp"
#include "errors.hpp"
#include "test_support.hpp"

#include <set>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace
{

HttpResponse reply(long status, const json &body)
{
    return HttpResponse{status, body.dump()};
}

json statusResult(const std::string &state, const std::string &completed, const std::string &total)
{
    return {
        {"gid", "2089b05ecca3d829"},
        {"status", state},
        {"completedLength", completed},
        {"totalLength", total},
        {"downloadSpeed", "2048"},
    };
}

} // namespace

int main()
{
    try
    {
        FakeTransport transport;
        RequestIdGenerator ids("test");
        Aria2Client client(transport, ids, "http://127.0.0.1:6800/jsonrpc", std::string("s3cret"));

        // Test 1: addUri envelope, secret first, options mapped
        transport.postReplies.push_back(reply(200, {{"jsonrpc", "2.0"}, {"id", "x"}, {"result", "2089b05ecca3d829"}}));
        DaemonOptions options;
        options.dir = "/downloads";
        options.out = "movie.mkv";
        options.maxDownloadLimit = 10000000;
        DaemonTaskId gid = client.submitByUri({"https://dl.example/movie.mkv"}, options);
        check(gid == "2089b05ecca3d829", "addUri returns the GID");

        json sent = json::parse(transport.posts.back().body);
        check(transport.posts.back().url == "http://127.0.0.1:6800/jsonrpc", "posted to the endpoint");
        check(sent["jsonrpc"] == "2.0" && sent["method"] == "aria2.addUri", "JSON-RPC 2.0 envelope");
        check(sent["id"].get<std::string>().rfind("test-", 0) == 0, "correlation id carries the prefix");
        check(sent["params"][0] == "token:s3cret", "secret sent as first parameter");
        check(sent["params"][1][0] == "https://dl.example/movie.mkv", "uris in second parameter");
        check(sent["params"][2]["dir"] == "/downloads" && sent["params"][2]["out"] == "movie.mkv", "dir and out mapped");
        check(sent["params"][2]["max-download-limit"] == "10000000", "bandwidth cap as string");
        check(sent["params"][2]["continue"] == "true", "continue mapped");

        // Test 2: uncapped submission has no limit key
        check(!Aria2Client::optionsToJson(DaemonOptions{}).contains("max-download-limit"), "no cap when unset");

        // Test 3: status parsing of decimal strings
        transport.postReplies.push_back(reply(200, {{"id", "x"}, {"result", statusResult("active", "2500", "10000")}}));
        DaemonStatus status = client.status(gid);
        check(status.completedBytes == 2500 && status.totalBytes == 10000, "lengths parsed");
        check(status.speedBytesPerSec == 2048, "speed parsed");
        check(status.fraction() == 0.25, "fraction computed");
        check(!status.errorCode && !status.isFailed() && !status.isComplete(), "active task is healthy");

        // Test 4: errorCode "0" means no error, "3" is not-found
        json finished = statusResult("complete", "10000", "10000");
        finished["errorCode"] = "0";
        check(!Aria2Client::parseStatus(finished).errorCode, "errorCode 0 is absent");
        check(Aria2Client::parseStatus(finished).isComplete(), "complete state");

        json missing = statusResult("error", "0", "0");
        missing["errorCode"] = "3";
        missing["errorMessage"] = "Resource not found";
        DaemonStatus notFound = Aria2Client::parseStatus(missing);
        check(notFound.isNotFound() && notFound.isFailed(), "code 3 is not-found");

        json generic = statusResult("error", "0", "0");
        generic["errorCode"] = "1";
        check(!Aria2Client::parseStatus(generic).isNotFound(), "other codes are generic failures");

        // Test 5: malformed status
        json broken = statusResult("active", "12", "100");
        broken.erase("completedLength");
        check(throwsKind([&] { Aria2Client::parseStatus(broken); }, ErrorKind::DaemonTransport),
              "missing field is a transport error");
        broken = statusResult("active", "twelve", "100");
        check(throwsKind([&] { Aria2Client::parseStatus(broken); }, ErrorKind::DaemonTransport),
              "non-numeric field is a transport error");

        // Test 6: error envelope on HTTP 400
        transport.postReplies.push_back(
            reply(400, {{"id", "x"}, {"error", {{"code", 1}, {"message", "GID 2089b05ecca3d829 is not found"}}}}));
        bool protocolError = false;
        try
        {
            client.remove(gid);
        }
        catch (const DaemonProtocolError &e)
        {
            protocolError = e.code() == 1 && e.daemonMessage().find("not found") != std::string::npos &&
                            !e.isNotFound();
        }
        check(protocolError, "error object becomes DaemonProtocolError with code and message");

        // Test 6b: error object with a non-integer code
        transport.postReplies.push_back(reply(400, {{"id", "x"}, {"error", {{"code", "1"}, {"message", "bad"}}}}));
        check(throwsKind([&] { client.remove(gid); }, ErrorKind::DaemonTransport),
              "string error code is a transport error");
        transport.postReplies.push_back(reply(400, {{"id", "x"}, {"error", {{"code", 1}, {"message", nullptr}}}}));
        check(throwsKind([&] { client.remove(gid); }, ErrorKind::DaemonProtocol),
              "null message still yields a protocol error");

        // Test 7: envelope with both result and error
        transport.postReplies.push_back(reply(200, {{"id", "x"}, {"result", "OK"}, {"error", {{"code", 1}}}}));
        check(throwsKind([&] { client.pause(gid); }, ErrorKind::DaemonTransport), "both result and error rejected");

        // Test 8: non-JSON body and transport failures
        transport.postReplies.push_back(HttpResponse{502, "<html>Bad Gateway</html>"});
        check(throwsKind([&] { client.unpause(gid); }, ErrorKind::DaemonTransport), "non-JSON body rejected");

        transport.postThrows = true;
        check(throwsKind([&] { client.globalStats(); }, ErrorKind::DaemonTransport),
              "connection failure becomes DaemonTransport");
        check(isRetryable(ErrorKind::DaemonTransport) && !isRetryable(ErrorKind::DaemonProtocol),
              "only transport errors are retryable");
        transport.postThrows = false;

        // Test 9: global stat and purge
        transport.postReplies.push_back(reply(200, {{"id", "x"},
                                                    {"result",
                                                     {{"downloadSpeed", "4096"},
                                                      {"numActive", "2"},
                                                      {"numWaiting", "1"},
                                                      {"numStopped", "5"},
                                                      {"numStoppedTotal", "7"}}}}));
        GlobalStat stat = client.globalStats();
        check(stat.downloadSpeed == 4096 && stat.numActive == 2 && stat.numWaiting == 1 && stat.numStopped == 5,
              "global stat parsed");

        transport.postReplies.push_back(reply(200, {{"id", "x"}, {"result", "OK"}}));
        client.purgeResult(gid);
        check(json::parse(transport.posts.back().body)["method"] == "aria2.removeDownloadResult",
              "purge uses removeDownloadResult");

        // Test 10: ids are unique even within the same clock tick
        RequestIdGenerator burst;
        std::set<std::string> seen;
        for (int i = 0; i < 1000; ++i)
        {
            seen.insert(burst.next());
        }
        check(seen.size() == 1000, "request ids unique");

        // Test 11: no secret, no token parameter
        Aria2Client open(transport, ids);
        transport.postReplies.push_back(reply(200, {{"id", "x"}, {"result", "OK"}}));
        open.remove(gid);
        check(json::parse(transport.posts.back().body)["params"][0] == gid, "no token without secret");

        return finish();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }
}
