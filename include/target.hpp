#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

/**
 * How a target URL is dispatched by the batch runner.
 */
enum class TargetKind
{
    Direct,         // Plain HTTP(S) file, streamed locally
    ProviderFile,   // Throttled-provider file page, downloaded through the daemon
    ProviderFolder  // Provider folder, expanded into file targets
};

/**
 * Classify a target by host and path against the provider domains.
 */
TargetKind classifyTarget(std::string_view url, const std::vector<std::string> &providerDomains);

/**
 * Lower-cased host part of a URL ("" if there is none).
 */
std::string hostOf(std::string_view url);

/**
 * Parse a target list: one target per line, blank and '#' lines ignored,
 * comma-separated sub-targets allowed on a line.
 */
std::vector<std::string> parseTargetList(std::string_view text);

/**
 * Read and parse a target list file.
 * @throws ConfigError if the file does not exist or cannot be read
 */
std::vector<std::string> readTargetFile(const std::filesystem::path &path);

/**
 * Command-line targets after list-file expansion.
 */
struct ExpandedTargets
{
    std::vector<std::string> targets;
    std::vector<std::string> errors; // One message per list file that could not be read
};

/**
 * Replace every argument naming a local ".txt" file with the targets listed in it.
 * URLs are kept as they are, even when their path ends in ".txt".
 */
ExpandedTargets expandTargetArguments(const std::vector<std::string> &arguments);

/**
 * Local filename for a URL: last path segment without query, sanitized,
 * "download" when the URL has no usable segment.
 */
std::string filenameFromUrl(std::string_view url);

/**
 * Replace every character outside [A-Za-z0-9._-] with '_' and strip leading dots.
 */
std::string sanitizeFilename(std::string_view name);
