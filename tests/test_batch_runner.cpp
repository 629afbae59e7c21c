#include "batch_runner.hpp"
#include "cancellation.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "progress.hpp"
#include "test_support.hpp"

#include <fmt/core.h>

namespace
{

const std::vector<std::string> DOMAINS{"fshare.vn", "www.fshare.vn"};

RenewalSettings fastSettings()
{
    RenewalSettings settings;
    settings.pollInterval = std::chrono::milliseconds(1);
    return settings;
}

/**
 * Everything a runner needs, wired to fakes in one scratch directory.
 */
struct Harness
{
    TempDir dir;
    FakeTransport transport;
    FakeDaemon daemon;
    FakeResolver resolver;
    Logger logger{true, false};
    NullProgress progress;
    RetryPolicy policy{2, std::chrono::milliseconds(1)};
    TransferEngine engine{transport, dir.path() / "downloads", policy, logger, progress};
    RenewalDriver driver{daemon, resolver, dir.path() / "downloads", fastSettings(), logger, progress};

    BatchRunner runner(FolderExpander expander = nullptr)
    {
        return BatchRunner(engine, driver, AdvisoryLock(lockPath()), policy, DOMAINS, logger, std::move(expander));
    }

    std::filesystem::path lockPath() const { return dir.path() / "run" / "download.lock"; }
    std::filesystem::path downloads() const { return dir.path() / "downloads"; }
};

const TargetOutcome *findOutcome(const BatchReport &report, const std::string &target)
{
    for (const auto &outcome : report.outcomes)
    {
        if (outcome.target == target)
        {
            return &outcome;
        }
    }
    return nullptr;
}

} // namespace

int main()
{
    try
    {
        // Scenario: one failing target, one fresh download, one resume
        {
            Harness h;
            std::string resumable(1500, 'r');
            ServedFile failing{std::string(100, 'f')};
            failing.failuresBeforeSuccess = 100;
            h.transport.files["https://a.example/fail.bin"] = failing;
            h.transport.files["https://b.example/fresh.bin"] = ServedFile{std::string(700, 'n')};
            h.transport.files["https://c.example/partial.bin"] = ServedFile{resumable};
            writeFile(h.downloads() / "partial.bin", resumable.substr(0, 500));

            CancellationSignal cancel;
            BatchReport report = h.runner().run(
                {"https://a.example/fail.bin", "https://b.example/fresh.bin", "https://c.example/partial.bin"},
                cancel, true, 0);

            check(report.outcomes.size() == 3 && report.results.size() == 2, "failure does not stop siblings");
            check(!report.cancelled && report.failedCount() == 1, "one failed outcome");

            const TargetOutcome *failed = findOutcome(report, "https://a.example/fail.bin");
            check(failed && !failed->succeeded() && failed->attempts == 3, "failing target used max_retries + 1 attempts");
            check(failed && failed->kind == ErrorKind::TransientNetwork && !failed->error.empty(),
                  "last error attached to the outcome");

            const TargetOutcome *fresh = findOutcome(report, "https://b.example/fresh.bin");
            check(fresh && fresh->succeeded() && !fresh->result->resumed && fresh->attempts == 1, "fresh download");

            const TargetOutcome *partial = findOutcome(report, "https://c.example/partial.bin");
            check(partial && partial->succeeded() && partial->result->resumed, "partial file resumed");
            check(!h.transport.gets.empty() && h.transport.gets.back().offset == 500, "resumed from byte 500");
            check(readFile(h.downloads() / "partial.bin") == resumable, "resumed file complete");

            check(!std::filesystem::exists(h.lockPath()), "lock released after the run");
        }

        // Lock held by another run
        {
            Harness h;
            AdvisoryLock other(h.lockPath());
            LockGuard held = other.acquire();

            CancellationSignal cancel;
            bool conflict = false;
            try
            {
                h.runner().run({"https://b.example/x.bin"}, cancel, true, 0);
            }
            catch (const LockConflictError &)
            {
                conflict = true;
            }
            check(conflict, "second run refused while the lock is held");
            check(h.transport.gets.empty(), "nothing dispatched under conflict");
        }

        // Cancellation halts dispatch
        {
            Harness h;
            h.transport.files["https://a.example/one.bin"] = ServedFile{std::string(1000, '1')};
            h.transport.files["https://a.example/two.bin"] = ServedFile{std::string(1000, '2')};

            CancellationSignal cancel;
            h.transport.onChunk = [&cancel](std::uint64_t delivered) {
                if (delivered >= 200)
                {
                    cancel.cancel();
                }
            };

            BatchReport report = h.runner().run({"https://a.example/one.bin", "https://a.example/two.bin"},
                                                cancel, true, 0);
            check(report.cancelled, "report marked cancelled");
            check(report.outcomes.size() == 1 && report.outcomes[0].kind == ErrorKind::Cancelled,
                  "in-flight target recorded as cancelled");
            check(h.transport.gets.size() == 1, "no further target started");
            check(!std::filesystem::exists(h.lockPath()), "lock released after cancellation");
        }

        // Provider targets go through the renewal driver, retried on transient errors
        {
            Harness h;
            h.resolver.probeResult.size = 2000;
            h.resolver.probeResult.name = "provider.bin";
            h.resolver.failResolveFrom = 0;
            h.resolver.failKind = ErrorKind::TransientNetwork;

            CancellationSignal cancel;
            BatchReport report = h.runner().run({"https://www.fshare.vn/file/ABC"}, cancel, true, 0);
            check(report.outcomes.size() == 1 && report.outcomes[0].attempts == 3,
                  "transient provider failures retried");
            check(h.transport.gets.empty(), "provider target never streamed locally");

            Harness ok;
            ok.resolver.probeResult.size = 2000;
            ok.resolver.probeResult.name = "provider.bin";
            ok.daemon.script = [](const FakeDaemon::Submission &, int) {
                return makeStatus("complete", 2000, 2000);
            };
            report = ok.runner().run({"https://www.fshare.vn/file/ABC"}, cancel, true, 0);
            check(report.results.size() == 1 && ok.daemon.submissions.size() == 1, "provider target downloaded");

            Harness denied;
            denied.resolver.failResolveFrom = 0;
            report = denied.runner().run({"https://www.fshare.vn/file/ABC"}, cancel, true, 0);
            check(report.outcomes.size() == 1 && report.outcomes[0].attempts == 1 &&
                      report.outcomes[0].kind == ErrorKind::Resolve,
                  "resolve denial is not retried");
        }

        // Folder targets
        {
            Harness h;
            h.transport.files["https://a.example/plain.bin"] = ServedFile{std::string(10, 'p')};

            CancellationSignal cancel;
            BatchReport report = h.runner().run({"https://www.fshare.vn/folder/F1", "https://a.example/plain.bin"},
                                                cancel, true, 0);
            check(report.outcomes.size() == 2 && report.results.size() == 1, "unexpandable folder fails alone");
            check(report.outcomes.size() == 2 && report.outcomes[0].target == "https://www.fshare.vn/folder/F1" &&
                      report.outcomes[1].target == "https://a.example/plain.bin",
                  "outcomes keep input order");

            Harness e;
            e.resolver.probeResult.size = 10;
            e.resolver.probeResult.name = "inner.bin";
            e.daemon.script = [](const FakeDaemon::Submission &, int) {
                return makeStatus("complete", 10, 10);
            };
            auto expander = [](const std::string &) {
                return std::vector<std::string>{"https://www.fshare.vn/file/A", "https://www.fshare.vn/file/B"};
            };
            report = e.runner(expander).run({"https://fshare.vn/folder/F1"}, cancel, true, 0);
            check(report.results.size() == 2 && e.daemon.submissions.size() == 2, "folder expanded into files");

            Harness ordered;
            ordered.transport.files["https://a.example/first.bin"] = ServedFile{std::string(10, '1')};
            ordered.transport.files["https://a.example/inner.bin"] = ServedFile{std::string(10, 'i')};
            ordered.transport.files["https://a.example/last.bin"] = ServedFile{std::string(10, '3')};
            auto direct = [](const std::string &) {
                return std::vector<std::string>{"https://a.example/inner.bin"};
            };
            report = ordered.runner(direct).run(
                {"https://a.example/first.bin", "https://fshare.vn/folder/F2", "https://a.example/last.bin"},
                cancel, true, 0);
            check(report.outcomes.size() == 3 && report.outcomes[1].target == "https://a.example/inner.bin",
                  "folder files dispatched in place");

            Harness halted;
            int expansions = 0;
            auto counting = [&expansions](const std::string &) {
                ++expansions;
                return std::vector<std::string>{};
            };
            CancellationSignal raised;
            raised.cancel();
            report = halted.runner(counting).run({"https://fshare.vn/folder/F3"}, raised, true, 0);
            check(report.cancelled && expansions == 0, "no folder expanded after cancellation");
        }

        // Links file
        {
            Harness h;
            h.transport.files["https://a.example/listed.bin"] = ServedFile{std::string(42, 'l')};
            writeFile(h.dir.path() / "links.txt", "# list\nhttps://a.example/listed.bin\n\n");

            CancellationSignal cancel;
            BatchReport report = h.runner().runFromFile(h.dir.path() / "links.txt", cancel, true, 0);
            check(report.results.size() == 1, "targets read from the links file");
            check(throwsKind([&] { h.runner().runFromFile(h.dir.path() / "nope.txt", cancel, true, 0); },
                             ErrorKind::Config),
                  "missing links file is a config error");
        }

        return finish();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }
}
