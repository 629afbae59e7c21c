#pragma once

#include "advisory_lock.hpp"
#include "cancellation.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "renewal.hpp"
#include "transfer_engine.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

/**
 * What happened to one dispatched target.
 */
struct TargetOutcome
{
    std::string target;
    std::optional<TransferResult> result; // Set on success
    std::string error;
    ErrorKind kind = ErrorKind::TransientNetwork; // Meaningful only when result is empty
    int attempts = 0;

    bool succeeded() const { return result.has_value(); }
};

struct BatchReport
{
    std::vector<TransferResult> results;
    std::vector<TargetOutcome> outcomes;
    bool cancelled = false;

    std::size_t failedCount() const;
};

/**
 * Expands a provider folder URL into file targets.
 */
using FolderExpander = std::function<std::vector<std::string>(const std::string &folderUrl)>;

/**
 * Runs a list of targets sequentially under the advisory lock.
 */
class BatchRunner
{
public:
    BatchRunner(TransferEngine &engine,
                RenewalDriver &driver,
                AdvisoryLock lock,
                RetryPolicy policy,
                std::vector<std::string> providerDomains,
                const Logger &logger,
                FolderExpander expander = nullptr);

    /**
     * @throws LockConflictError if another run holds the lock; nothing is dispatched then
     */
    BatchReport run(const std::vector<std::string> &targets,
                    CancellationSignal &cancel,
                    bool unattended,
                    std::uint64_t skipSize);

    /**
     * @throws ConfigError if the list file is missing
     * @throws LockConflictError
     */
    BatchReport runFromFile(const std::filesystem::path &path,
                            CancellationSignal &cancel,
                            bool unattended,
                            std::uint64_t skipSize);

private:
    TargetOutcome dispatch(const std::string &target,
                           CancellationSignal &cancel,
                           bool unattended,
                           std::uint64_t skipSize);

    TargetOutcome downloadProviderFile(const std::string &target,
                                       CancellationSignal &cancel,
                                       bool unattended,
                                       std::uint64_t skipSize);

    /**
     * @throws DownloadError (Resolve) when no expander is set, or whatever the expander throws
     */
    std::vector<std::string> expandFolder(const std::string &folder);

    TransferEngine &engine_;
    RenewalDriver &driver_;
    AdvisoryLock lock_;
    RetryPolicy policy_;
    std::vector<std::string> providerDomains_;
    const Logger &logger_;
    FolderExpander expander_;
};
