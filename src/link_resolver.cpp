#include "link_resolver.hpp"
#include "errors.hpp"
#include "target.hpp"

#include <cctype>
#include <strings.h>
#include <utility>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace
{

int hexValue(char c)
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f')
    {
        return c - 'a' + 10;
    }
    return -1;
}

std::string percentDecode(std::string_view value)
{
    std::string out;
    for (size_t i = 0; i < value.size(); ++i)
    {
        if (value[i] == '%' && i + 2 < value.size())
        {
            int hi = hexValue(value[i + 1]);
            int lo = hexValue(value[i + 2]);
            if (hi >= 0 && lo >= 0)
            {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += value[i];
    }
    return out;
}

// Value of `key=` inside a header parameter list, unquoted ("" if absent)
std::string parameterValue(std::string_view header, std::string_view key)
{
    size_t pos = 0;
    while (pos < header.size())
    {
        size_t end = header.find(';', pos);
        std::string_view part = header.substr(pos, end == std::string_view::npos ? std::string_view::npos : end - pos);
        pos = end == std::string_view::npos ? header.size() : end + 1;

        while (!part.empty() && std::isspace(static_cast<unsigned char>(part.front())))
        {
            part.remove_prefix(1);
        }
        auto eq = part.find('=');
        if (eq == std::string_view::npos || eq != key.size() ||
            strncasecmp(part.data(), key.data(), key.size()) != 0)
        {
            continue;
        }

        std::string_view value = part.substr(eq + 1);
        while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())))
        {
            value.remove_suffix(1);
        }
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
        {
            value = value.substr(1, value.size() - 2);
        }
        return std::string(value);
    }
    return {};
}

} // namespace

std::string filenameFromContentDisposition(std::string_view header)
{
    std::string extended = parameterValue(header, "filename*");
    if (!extended.empty())
    {
        // charset'language'value
        auto quote = extended.find('\'');
        auto second = quote == std::string::npos ? std::string::npos : extended.find('\'', quote + 1);
        if (second != std::string::npos)
        {
            return percentDecode(std::string_view(extended).substr(second + 1));
        }
    }
    return parameterValue(header, "filename");
}

VipLinkResolver::VipLinkResolver(HttpTransport &transport, ProviderSettings settings)
    : transport_(transport), settings_(std::move(settings))
{
}

std::string VipLinkResolver::resolve(const std::string &target)
{
    if (settings_.token.empty())
    {
        throw DownloadError(ErrorKind::Resolve, "Provider token not configured (not logged in)");
    }

    json request = {
        {"url", target},
        {"token", settings_.token},
        {"password", settings_.password ? json(*settings_.password) : json(nullptr)},
    };

    std::vector<std::string> headers{"Content-Type: application/json"};
    if (!settings_.sessionId.empty())
    {
        headers.push_back("Cookie: session_id=" + settings_.sessionId);
    }

    HttpResponse response = transport_.post(settings_.apiUrl, request.dump(), headers);
    if (response.status == 404)
    {
        throw DownloadError(ErrorKind::NotFound, fmt::format("Provider file not found: {}", target));
    }
    if (response.status < 200 || response.status >= 300)
    {
        throw DownloadError(ErrorKind::Resolve,
                            fmt::format("VIP link resolution failed ({}): {}", response.status, response.body));
    }

    json reply = json::parse(response.body, nullptr, false);
    if (reply.is_discarded() || !reply.is_object())
    {
        throw DownloadError(ErrorKind::Resolve, "VIP link resolution returned a non-JSON body");
    }

    auto location = reply.find("location");
    if (location == reply.end() || !location->is_string() || location->get<std::string>().empty())
    {
        std::string message = "no download location returned";
        auto msg = reply.find("msg");
        if (msg != reply.end() && msg->is_string() && !msg->get<std::string>().empty())
        {
            message = msg->get<std::string>();
        }
        throw DownloadError(ErrorKind::Resolve, fmt::format("VIP link resolution failed: {}", message));
    }
    return location->get<std::string>();
}

ProbeResult VipLinkResolver::probe(const std::string &directUrl)
{
    HeadInfo info = transport_.head(directUrl);
    if (info.status == 404 || info.status == 410)
    {
        throw DownloadError(ErrorKind::NotFound, fmt::format("Direct link not found (HTTP {})", info.status));
    }
    if (info.status < 200 || info.status >= 300)
    {
        throw TransferError(ErrorKind::TransientNetwork, fmt::format("Probe failed: HTTP {}", info.status));
    }

    ProbeResult result;
    result.size = info.contentLength;

    std::string name = sanitizeFilename(filenameFromContentDisposition(info.contentDisposition));
    result.name = name.empty() ? filenameFromUrl(info.effectiveUrl.empty() ? directUrl : info.effectiveUrl) : name;
    return result;
}
