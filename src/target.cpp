#include "target.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include <fmt/core.h>

namespace
{

std::string_view trimView(std::string_view value)
{
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())))
    {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())))
    {
        value.remove_suffix(1);
    }
    return value;
}

// Path component of a URL without query and fragment
std::string_view pathOf(std::string_view url)
{
    auto scheme = url.find("://");
    std::string_view rest = scheme == std::string_view::npos ? url : url.substr(scheme + 3);
    auto slash = rest.find('/');
    if (slash == std::string_view::npos)
    {
        return {};
    }
    std::string_view path = rest.substr(slash);
    auto end = path.find_first_of("?#");
    if (end != std::string_view::npos)
    {
        path = path.substr(0, end);
    }
    return path;
}

} // namespace

std::string hostOf(std::string_view url)
{
    auto scheme = url.find("://");
    if (scheme == std::string_view::npos)
    {
        return {};
    }
    std::string_view rest = url.substr(scheme + 3);
    auto end = rest.find_first_of("/?#");
    std::string_view authority = rest.substr(0, end);

    auto at = authority.rfind('@');
    if (at != std::string_view::npos)
    {
        authority.remove_prefix(at + 1);
    }
    auto colon = authority.rfind(':');
    if (colon != std::string_view::npos && authority.find(']') == std::string_view::npos)
    {
        authority = authority.substr(0, colon);
    }

    std::string host(authority);
    std::transform(host.begin(), host.end(), host.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return host;
}

TargetKind classifyTarget(std::string_view url, const std::vector<std::string> &providerDomains)
{
    std::string host = hostOf(url);
    bool isProvider = std::any_of(providerDomains.begin(), providerDomains.end(),
                                  [&host](const std::string &domain) { return !domain.empty() && host == domain; });
    if (!isProvider)
    {
        return TargetKind::Direct;
    }

    std::string_view path = pathOf(url);
    if (path.rfind("/folder/", 0) == 0)
    {
        return TargetKind::ProviderFolder;
    }
    return TargetKind::ProviderFile;
}

std::vector<std::string> parseTargetList(std::string_view text)
{
    std::vector<std::string> targets;
    while (!text.empty())
    {
        auto newline = text.find('\n');
        std::string_view line = text.substr(0, newline);
        text = newline == std::string_view::npos ? std::string_view{} : text.substr(newline + 1);

        line = trimView(line);
        if (line.empty() || line.front() == '#')
        {
            continue;
        }

        while (!line.empty())
        {
            auto comma = line.find(',');
            std::string_view item = trimView(line.substr(0, comma));
            line = comma == std::string_view::npos ? std::string_view{} : line.substr(comma + 1);
            if (!item.empty())
            {
                targets.emplace_back(item);
            }
        }
    }
    return targets;
}

std::vector<std::string> readTargetFile(const std::filesystem::path &path)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        throw ConfigError(fmt::format("Links file not found: {}", path.string()));
    }

    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        throw ConfigError(fmt::format("Cannot read links file: {}", path.string()));
    }
    std::ostringstream content;
    content << in.rdbuf();
    return parseTargetList(content.str());
}

ExpandedTargets expandTargetArguments(const std::vector<std::string> &arguments)
{
    ExpandedTargets expanded;
    for (const auto &argument : arguments)
    {
        bool isListFile = argument.find("://") == std::string::npos && argument.size() > 4 &&
                          argument.compare(argument.size() - 4, 4, ".txt") == 0;
        if (!isListFile)
        {
            expanded.targets.push_back(argument);
            continue;
        }

        try
        {
            std::vector<std::string> listed = readTargetFile(argument);
            expanded.targets.insert(expanded.targets.end(), listed.begin(), listed.end());
        }
        catch (const ConfigError &e)
        {
            expanded.errors.emplace_back(e.what());
        }
    }
    return expanded;
}

std::string sanitizeFilename(std::string_view name)
{
    std::string result;
    result.reserve(name.size());
    for (char c : name)
    {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '.' || c == '-' || c == '_')
        {
            result += c;
        }
        else
        {
            result += '_';
        }
    }
    // No hidden files, no "." or ".."
    auto firstVisible = result.find_first_not_of('.');
    return firstVisible == std::string::npos ? std::string() : result.substr(firstVisible);
}

std::string filenameFromUrl(std::string_view url)
{
    std::string_view path = pathOf(url);
    auto slash = path.rfind('/');
    std::string_view segment = slash == std::string_view::npos ? path : path.substr(slash + 1);

    std::string name = sanitizeFilename(segment);
    return name.empty() ? "download" : name;
}
