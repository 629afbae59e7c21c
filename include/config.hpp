#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

/**
 * Retry settings applied to every target of a batch.
 */
struct RetryPolicy
{
    int maxRetries = 5;                            // Attempts per target = maxRetries + 1
    std::chrono::milliseconds retryDelay{2000};    // Fixed delay between attempts
};

/**
 * Settings of the throttled-provider segmented download.
 */
struct RenewalSettings
{
    std::chrono::milliseconds pollInterval{1000};
    double renewalThreshold = 0.25;                // Fraction at which the link is renewed
    std::uint64_t bandwidthDivisor = 5;            // First segment cap = size / divisor (bytes/s)
    std::uint64_t smallFileThreshold = 100ULL * 1024 * 1024;
    std::chrono::milliseconds smallFileTimeout = std::chrono::minutes(20);
    std::chrono::milliseconds overallTimeout = std::chrono::minutes(30);
};

/**
 * Provider API used to turn a file page URL into a direct download URL.
 */
struct ProviderSettings
{
    std::string apiUrl = "https://api.fshare.vn/api/session/download";
    std::string token;
    std::string sessionId;
    std::optional<std::string> password;
    std::vector<std::string> domains{"fshare.vn", "www.fshare.vn"};
};

/**
 * Configuration for the download orchestrator.
 * Defaults below, optionally overridden by a JSON file, then by CLI11 flags.
 */
struct AppConfig
{
    std::filesystem::path downloadDir;
    std::filesystem::path linksFile;
    std::filesystem::path lockFile;

    RetryPolicy retry;
    std::uint64_t skipSize = 0; // 0 disables the minimum size check

    // Daemon (aria2 JSON-RPC)
    std::string aria2Endpoint = "http://localhost:6800/jsonrpc";
    std::optional<std::string> aria2Secret;

    RenewalSettings renewal;
    ProviderSettings provider;

    int connectTimeoutSeconds = 30;
    int lowSpeedTimeoutSeconds = 60; // Abort a stalled transfer after this long below 1 B/s

    bool unattended = false;
    bool verbose = false;
};

/**
 * Build the default configuration rooted at $HOME/Downloads.
 */
AppConfig defaultConfig();

/**
 * Overlay a JSON config file onto an existing configuration.
 * Keys are camelCase (maxRetries, retryDelay, downloadDir, ...); unknown keys are ignored.
 *
 * @param config Configuration to update in place
 * @param path JSON file to read
 * @throws ConfigError if the file cannot be read, is not valid JSON, or a key has the wrong type
 */
void loadConfigFile(AppConfig &config, const std::filesystem::path &path);
