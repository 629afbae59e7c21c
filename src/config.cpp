#include "config.hpp"
#include "errors.hpp"

#include <cstdlib>
#include <fstream>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace
{

std::filesystem::path homeDirectory()
{
    const char *home = std::getenv("HOME");
    return home != nullptr && *home != '\0' ? std::filesystem::path(home) : std::filesystem::path("/tmp");
}

template <typename T>
void readKey(const json &object, const char *key, T &target)
{
    auto it = object.find(key);
    if (it == object.end() || it->is_null())
    {
        return;
    }
    try
    {
        target = it->get<T>();
    }
    catch (const json::exception &e)
    {
        throw ConfigError(fmt::format("Invalid value for '{}': {}", key, e.what()));
    }
}

void readSeconds(const json &object, const char *key, std::chrono::milliseconds &target)
{
    double seconds = -1.0;
    readKey(object, key, seconds);
    if (object.contains(key) && !object[key].is_null())
    {
        if (seconds < 0.0)
        {
            throw ConfigError(fmt::format("'{}' must not be negative", key));
        }
        target = std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
    }
}

void readPath(const json &object, const char *key, std::filesystem::path &target)
{
    std::string value;
    readKey(object, key, value);
    if (!value.empty())
    {
        target = value;
    }
}

} // namespace

AppConfig defaultConfig()
{
    AppConfig config;
    std::filesystem::path home = homeDirectory();
    config.downloadDir = home / "Downloads";
    config.linksFile = home / "Downloads" / "links.txt";

    std::error_code ec;
    std::filesystem::path tmp = std::filesystem::temp_directory_path(ec);
    if (ec)
    {
        tmp = "/tmp";
    }
    config.lockFile = tmp / "download.lock";
    return config;
}

void loadConfigFile(AppConfig &config, const std::filesystem::path &path)
{
    std::ifstream in(path);
    if (!in)
    {
        throw ConfigError(fmt::format("Cannot open config file: {}", path.string()));
    }

    json root;
    try
    {
        root = json::parse(in);
    }
    catch (const json::parse_error &e)
    {
        throw ConfigError(fmt::format("Invalid JSON in {}: {}", path.string(), e.what()));
    }

    if (!root.is_object())
    {
        throw ConfigError(fmt::format("Config file {} must contain a JSON object", path.string()));
    }

    readKey(root, "maxRetries", config.retry.maxRetries);
    if (config.retry.maxRetries < 0)
    {
        throw ConfigError("'maxRetries' must not be negative");
    }
    readSeconds(root, "retryDelay", config.retry.retryDelay);
    readKey(root, "skipSize", config.skipSize);

    readPath(root, "downloadDir", config.downloadDir);
    readPath(root, "linksFile", config.linksFile);
    readPath(root, "lockFile", config.lockFile);

    readKey(root, "aria2Endpoint", config.aria2Endpoint);
    std::string secret;
    readKey(root, "aria2Secret", secret);
    if (!secret.empty())
    {
        config.aria2Secret = secret;
    }

    readKey(root, "connectTimeout", config.connectTimeoutSeconds);
    readKey(root, "lowSpeedTimeout", config.lowSpeedTimeoutSeconds);

    readSeconds(root, "pollInterval", config.renewal.pollInterval);
    readKey(root, "smallFileThreshold", config.renewal.smallFileThreshold);
    readSeconds(root, "smallFileTimeout", config.renewal.smallFileTimeout);
    readSeconds(root, "renewalTimeout", config.renewal.overallTimeout);

    auto provider = root.find("provider");
    if (provider != root.end() && provider->is_object())
    {
        readKey(*provider, "apiUrl", config.provider.apiUrl);
        readKey(*provider, "token", config.provider.token);
        readKey(*provider, "sessionId", config.provider.sessionId);
        readKey(*provider, "domains", config.provider.domains);
        std::string password;
        readKey(*provider, "password", password);
        if (!password.empty())
        {
            config.provider.password = password;
        }
    }
    else if (provider != root.end() && !provider->is_null())
    {
        throw ConfigError("'provider' must be a JSON object");
    }
}
