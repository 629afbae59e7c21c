#include <fmt/core.h>
#include <CLI/CLI.hpp> // CLI11 main header
#include <nlohmann/json.hpp>

#include "aria2_client.hpp"
#include "batch_runner.hpp"
#include "cancellation.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "link_resolver.hpp"
#include "logger.hpp"
#include "progress.hpp"
#include "renewal.hpp"
#include "target.hpp"
#include "transfer_engine.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace
{

constexpr int EXIT_ALL_OK = 0;
constexpr int EXIT_FAILURES = 1;
constexpr int EXIT_LOCK_CONFLICT = 2;
constexpr int EXIT_CANCELLED = 130;

HttpClient::Options httpOptions(const AppConfig &config)
{
    HttpClient::Options options;
    options.connectTimeoutSeconds = config.connectTimeoutSeconds;
    options.lowSpeedTimeoutSeconds = config.lowSpeedTimeoutSeconds;
    return options;
}

int runDownload(const AppConfig &config, const std::vector<std::string> &arguments, const Logger &logger)
{
    // .txt arguments are list files; an unreadable one is reported and skipped
    ExpandedTargets expanded = expandTargetArguments(arguments);
    for (const auto &error : expanded.errors)
    {
        logger.error("{}", error);
    }
    if (!arguments.empty() && expanded.targets.empty())
    {
        logger.error("Input required: no targets to download");
        return EXIT_FAILURES;
    }
    const std::vector<std::string> &targets = expanded.targets;

    CancellationSignal cancel;
    SignalWatcher watcher(cancel);

    HttpClient transferClient(httpOptions(config));
    HttpClient rpcClient(httpOptions(config));
    RequestIdGenerator ids;
    Aria2Client daemon(rpcClient, ids, config.aria2Endpoint, config.aria2Secret);
    VipLinkResolver resolver(rpcClient, config.provider);

    std::unique_ptr<ProgressSink> progress;
    if (config.unattended)
    {
        progress = std::make_unique<NullProgress>();
    }
    else
    {
        progress = std::make_unique<ConsoleProgress>();
    }

    TransferEngine engine(transferClient, config.downloadDir, config.retry, logger, *progress);
    RenewalDriver driver(daemon, resolver, config.downloadDir, config.renewal, logger, *progress);
    BatchRunner runner(engine, driver, AdvisoryLock(config.lockFile), config.retry, config.provider.domains, logger);

    BatchReport report;
    try
    {
        report = targets.empty()
                     ? runner.runFromFile(config.linksFile, cancel, config.unattended, config.skipSize)
                     : runner.run(targets, cancel, config.unattended, config.skipSize);
    }
    catch (const LockConflictError &e)
    {
        logger.error("Another download is already running ({})", e.path().string());
        return EXIT_LOCK_CONFLICT;
    }

    if (report.cancelled || cancel.isCancelled())
    {
        if (watcher.receivedSignal() != 0)
        {
            logger.warning("Interrupted by signal {}", watcher.receivedSignal());
        }
        return EXIT_CANCELLED;
    }
    return report.failedCount() == 0 && expanded.errors.empty() ? EXIT_ALL_OK : EXIT_FAILURES;
}

void printStatus(const DaemonTaskId &gid, const DaemonStatus &status)
{
    fmt::print("GID:       {}\n", gid);
    fmt::print("State:     {}\n", status.state);
    fmt::print("Progress:  {} / {} ({:.1f}%)\n",
               formatBytes(status.completedBytes),
               formatBytes(status.totalBytes),
               status.fraction() * 100.0);
    fmt::print("Speed:     {}/s\n", formatBytes(status.speedBytesPerSec));
    if (status.errorCode)
    {
        fmt::print("Error:     {} {}\n", *status.errorCode, status.errorMessage);
    }
}

} // namespace

int main(int argc, char *argv[])
{
    CLI::App app{"dlorch - download orchestrator (direct HTTP and aria2-driven provider downloads)"};
    app.require_subcommand(1);
    app.set_version_flag("--version", "dlorch 1.0");

    AppConfig config = defaultConfig();

    // ====================================================================
    // GLOBAL OPTIONS
    // ====================================================================

    std::string configFile;
    app.add_option("-c,--config", configFile, "JSON configuration file")->check(CLI::ExistingFile);

    bool verbose = false;
    app.add_flag("-V,--verbose", verbose, "Print debug output");

    std::optional<std::string> endpoint;
    std::optional<std::string> secret;
    app.add_option("--rpc-url", endpoint, "aria2 JSON-RPC endpoint");
    app.add_option("--rpc-secret", secret, "aria2 rpc-secret");

    // ====================================================================
    // download
    // ====================================================================

    CLI::App *download = app.add_subcommand("download", "Download targets (or the links file when none given)");
    download->alias("dl");

    std::vector<std::string> targets;
    download->add_option("TARGETS", targets, "Direct or provider URLs, or .txt files listing them");

    bool unattended = false;
    download->add_flag("-u,--unattended", unattended, "No progress output, small-file shortcut enabled");

    std::optional<std::uint64_t> skipSize;
    download->add_option("-s,--skip-size", skipSize, "Skip files smaller than this many bytes");

    std::optional<int> retries;
    download->add_option("-r,--retries", retries, "Maximum retry attempts per target")
        ->check(CLI::Range(0, 100));

    std::optional<double> retryDelay;
    download->add_option("--retry-delay", retryDelay, "Seconds between attempts")
        ->check(CLI::NonNegativeNumber);

    std::optional<std::string> downloadDir;
    download->add_option("-d,--dir", downloadDir, "Download directory");

    std::optional<std::string> linksFile;
    download->add_option("-l,--links-file", linksFile, "Target list file");

    std::optional<std::string> token;
    download->add_option("--token", token, "Provider session token");

    // ====================================================================
    // aria2 maintenance
    // ====================================================================

    CLI::App *aria2 = app.add_subcommand("aria2", "Talk to the aria2 daemon directly");
    aria2->require_subcommand(1);

    std::string uri;
    DaemonOptions addOptions;
    std::optional<std::uint64_t> maxLimit;
    CLI::App *add = aria2->add_subcommand("add", "Submit a URI");
    add->add_option("URI", uri, "URI to download")->required();
    add->add_option("--dir", addOptions.dir, "Directory on the daemon host");
    add->add_option("--out", addOptions.out, "Output filename");
    add->add_option("--max-limit", maxLimit, "Bandwidth cap in bytes per second");

    std::string gid;
    CLI::App *status = aria2->add_subcommand("status", "Show a transfer");
    CLI::App *pause = aria2->add_subcommand("pause", "Pause a transfer");
    CLI::App *unpause = aria2->add_subcommand("unpause", "Resume a paused transfer");
    CLI::App *remove = aria2->add_subcommand("remove", "Remove a transfer");
    for (CLI::App *command : {status, pause, unpause, remove})
    {
        command->add_option("GID", gid, "aria2 transfer id")->required();
    }
    CLI::App *stats = aria2->add_subcommand("stats", "Show global statistics");

    // ====================================================================
    // PARSE ARGUMENTS
    // ====================================================================

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e)
    {
        return app.exit(e);
    }

    try
    {
        if (!configFile.empty())
        {
            loadConfigFile(config, configFile);
        }
    }
    catch (const ConfigError &e)
    {
        fmt::print(stderr, "✗ {}\n", e.what());
        return EXIT_FAILURES;
    }

    // Flags override the file
    config.verbose = config.verbose || verbose;
    if (endpoint)
    {
        config.aria2Endpoint = *endpoint;
    }
    if (secret)
    {
        config.aria2Secret = *secret;
    }
    config.unattended = config.unattended || unattended;
    if (skipSize)
    {
        config.skipSize = *skipSize;
    }
    if (retries)
    {
        config.retry.maxRetries = *retries;
    }
    if (retryDelay)
    {
        config.retry.retryDelay = std::chrono::milliseconds(static_cast<long long>(*retryDelay * 1000.0));
    }
    if (downloadDir)
    {
        config.downloadDir = *downloadDir;
    }
    if (linksFile)
    {
        config.linksFile = *linksFile;
    }
    if (token)
    {
        config.provider.token = *token;
    }

    Logger logger(config.unattended, config.verbose);

    try
    {
        if (*download)
        {
            return runDownload(config, targets, logger);
        }

        HttpClient client(httpOptions(config));
        RequestIdGenerator ids;
        Aria2Client daemon(client, ids, config.aria2Endpoint, config.aria2Secret);

        if (*add)
        {
            addOptions.maxDownloadLimit = maxLimit;
            fmt::print("{}\n", daemon.submitByUri({uri}, addOptions));
        }
        else if (*status)
        {
            printStatus(gid, daemon.status(gid));
            logger.debug("{}", daemon.rawStatus(gid).dump(2));
        }
        else if (*pause)
        {
            daemon.pause(gid);
            logger.success("Paused {}", gid);
        }
        else if (*unpause)
        {
            daemon.unpause(gid);
            logger.success("Resumed {}", gid);
        }
        else if (*remove)
        {
            daemon.remove(gid);
            logger.success("Removed {}", gid);
        }
        else if (*stats)
        {
            GlobalStat stat = daemon.globalStats();
            fmt::print("Speed:   {}/s\n", formatBytes(stat.downloadSpeed));
            fmt::print("Active:  {}\n", stat.numActive);
            fmt::print("Waiting: {}\n", stat.numWaiting);
            fmt::print("Stopped: {}\n", stat.numStopped);
        }
        return EXIT_ALL_OK;
    }
    catch (const DownloadError &e)
    {
        logger.error("{}", e.what());
        return EXIT_FAILURES;
    }
    catch (const std::exception &e)
    {
        logger.error("Fatal error: {}", e.what());
        return EXIT_FAILURES;
    }
}
