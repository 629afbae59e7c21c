#include "errors.hpp"
#include "http_client.hpp"
#include "loopback_server.hpp"
#include "test_support.hpp"

#include <chrono>
#include <optional>
#include <string>

#include <fmt/core.h>

namespace
{

// Records everything HttpClient hands to a stream handler
class RecordingHandler : public StreamHandler
{
public:
    int responses = 0;
    long status = 0;
    std::optional<std::uint64_t> contentLength;
    std::optional<std::uint64_t> rangeStart;
    std::string body;

    // Abort as soon as the first bytes have arrived
    bool abortAfterData = false;

    bool onResponse(long s, std::optional<std::uint64_t> length, std::optional<std::uint64_t> start) override
    {
        ++responses;
        status = s;
        contentLength = length;
        rangeStart = start;
        return true;
    }

    bool onData(const char *data, std::size_t size) override
    {
        body.append(data, size);
        return true;
    }

    bool shouldAbort() override { return abortAfterData && !body.empty(); }
};

std::string response(const std::string &statusLine, const std::string &headers, const std::string &body)
{
    return fmt::format("HTTP/1.1 {}\r\nContent-Length: {}\r\n{}Connection: close\r\n\r\n{}",
                       statusLine, body.size(), headers, body);
}

const std::string CONTENT = "0123456789abcdefghij";

} // namespace

int main()
{
    try
    {
        curl_global_init(CURL_GLOBAL_DEFAULT);

        // Test 1: Plain GET from offset zero sends no Range header
        {
            LoopbackServer server([](const LoopbackServer::Request &) {
                return LoopbackServer::Reply{response("200 OK", "", CONTENT)};
            });
            HttpClient client;
            RecordingHandler handler;

            StreamOutcome outcome = client.get(server.url("/file.bin"), 0, handler);
            check(outcome == StreamOutcome::Completed, "full GET completes");
            check(handler.responses == 1 && handler.status == 200, "one response callback with 200");
            check(handler.contentLength && *handler.contentLength == CONTENT.size(), "Content-Length reported");
            check(!handler.rangeStart, "no range on a full reply");
            check(handler.body == CONTENT, "body delivered intact");

            auto requests = server.requests();
            check(requests.size() == 1 && requests[0].method == "GET" && requests[0].path == "/file.bin",
                  "server saw the GET");
            check(requests.size() == 1 && requests[0].header("Range").empty(), "no Range header from zero");
        }

        // Test 2: Resume sends Range and surfaces the Content-Range start
        {
            LoopbackServer server([](const LoopbackServer::Request &request) {
                std::string range = request.header("Range");
                if (range != "bytes=12-")
                {
                    return LoopbackServer::Reply{response("200 OK", "", CONTENT)};
                }
                return LoopbackServer::Reply{
                    response("206 Partial Content", "Content-Range: bytes 12-19/20\r\n", CONTENT.substr(12))};
            });
            HttpClient client;
            RecordingHandler handler;

            StreamOutcome outcome = client.get(server.url("/file.bin"), 12, handler);
            check(outcome == StreamOutcome::Completed, "ranged GET completes");
            check(handler.status == 206, "206 passed through");
            check(handler.rangeStart && *handler.rangeStart == 12, "range start parsed from Content-Range");
            check(handler.body == "cdefghij", "only the tail is delivered");
            check(server.requests().at(0).header("Range") == "bytes=12-", "Range header sent for the offset");
        }

        // Test 3: A server that ignores Range answers 200 and no range start is reported
        {
            LoopbackServer server([](const LoopbackServer::Request &) {
                return LoopbackServer::Reply{response("200 OK", "", CONTENT)};
            });
            HttpClient client;
            RecordingHandler handler;

            client.get(server.url("/file.bin"), 12, handler);
            check(handler.status == 200 && !handler.rangeStart && handler.body == CONTENT,
                  "ignored Range yields the whole body");
        }

        // Test 4: Error status with an empty body still reaches the handler
        {
            LoopbackServer server([](const LoopbackServer::Request &) {
                return LoopbackServer::Reply{response("404 Not Found", "", "")};
            });
            HttpClient client;
            RecordingHandler handler;

            StreamOutcome outcome = client.get(server.url("/missing"), 0, handler);
            check(outcome == StreamOutcome::Completed && handler.responses == 1 && handler.status == 404,
                  "empty 404 reported once");
        }

        // Test 5: A stalled transfer is aborted from the progress callback
        {
            LoopbackServer server([](const LoopbackServer::Request &) {
                // Announce the whole file, send the first bytes, then go silent
                std::string head = fmt::format(
                    "HTTP/1.1 200 OK\r\nContent-Length: {}\r\nConnection: close\r\n\r\n", CONTENT.size());
                return LoopbackServer::Reply{head + CONTENT.substr(0, 5), true};
            });
            HttpClient::Options options;
            options.lowSpeedTimeoutSeconds = 30;
            HttpClient client(options);
            RecordingHandler handler;
            handler.abortAfterData = true;

            auto started = std::chrono::steady_clock::now();
            StreamOutcome outcome = client.get(server.url("/slow.bin"), 0, handler);
            auto elapsed = std::chrono::steady_clock::now() - started;
            server.release();

            check(outcome == StreamOutcome::Aborted, "stalled GET aborted on request");
            check(handler.body == CONTENT.substr(0, 5), "bytes before the stall were kept");
            check(elapsed < std::chrono::seconds(10), "abort did not wait for the low-speed timeout");
        }

        // Test 6: HEAD reports length and Content-Disposition
        {
            LoopbackServer server([](const LoopbackServer::Request &) {
                return LoopbackServer::Reply{"HTTP/1.1 200 OK\r\nContent-Length: 52428800\r\n"
                                             "Content-Disposition: attachment; filename=\"report.pdf\"\r\n"
                                             "Connection: close\r\n\r\n"};
            });
            HttpClient client;

            HeadInfo info = client.head(server.url("/dl/abc"));
            check(info.status == 200, "HEAD status");
            check(info.contentLength && *info.contentLength == 52428800, "HEAD Content-Length");
            check(info.contentDisposition == "attachment; filename=\"report.pdf\"", "HEAD Content-Disposition");
            check(info.effectiveUrl == server.url("/dl/abc"), "effective URL without redirects");
            check(server.requests().at(0).method == "HEAD", "server saw a HEAD");
        }

        // Test 7: POST sends body and headers and buffers the reply
        {
            LoopbackServer server([](const LoopbackServer::Request &) {
                return LoopbackServer::Reply{response("201 Created", "Content-Type: application/json\r\n",
                                                      R"({"location":"https://cdn.example/x"})")};
            });
            HttpClient client;

            HttpResponse reply = client.post(server.url("/api/session/download"),
                                             R"({"url":"u","token":"t"})",
                                             {"Content-Type: application/json", "Cookie: session_id=abc"});
            check(reply.status == 201, "POST status");
            check(reply.body == R"({"location":"https://cdn.example/x"})", "POST body buffered");

            auto request = server.requests().at(0);
            check(request.method == "POST" && request.body == R"({"url":"u","token":"t"})", "request body sent");
            check(request.header("Cookie") == "session_id=abc", "extra headers sent");
            check(request.header("Content-Type") == "application/json", "content type sent");
        }

        // Test 8: Connection refused is a retryable network error
        {
            HttpClient::Options options;
            options.connectTimeoutSeconds = 5;
            HttpClient client(options);
            std::string url = fmt::format("http://127.0.0.1:{}/file.bin", LoopbackServer::unusedPort());

            RecordingHandler handler;
            check(throwsKind([&] { client.get(url, 0, handler); }, ErrorKind::TransientNetwork),
                  "refused GET is TransientNetwork");
            check(throwsKind([&] { client.head(url); }, ErrorKind::TransientNetwork),
                  "refused HEAD is TransientNetwork");
        }

        curl_global_cleanup();
        return finish();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }
}
