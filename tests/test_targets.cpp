#include "errors.hpp"
#include "link_resolver.hpp"
#include "target.hpp"
#include "test_support.hpp"

#include <fmt/core.h>

int main()
{
    try
    {
        std::vector<std::string> domains{"fshare.vn", "www.fshare.vn"};

        // Classification
        check(classifyTarget("https://www.fshare.vn/file/ABC123", domains) == TargetKind::ProviderFile,
              "provider file page");
        check(classifyTarget("https://fshare.vn/folder/XYZ", domains) == TargetKind::ProviderFolder,
              "provider folder page");
        check(classifyTarget("https://example.com/fshare.vn/file/x.bin", domains) == TargetKind::Direct,
              "provider name in path is still direct");
        check(classifyTarget("https://WWW.FSHARE.VN:443/file/A", domains) == TargetKind::ProviderFile,
              "host match ignores case and port");
        check(hostOf("http://user:pw@Example.com:8080/a?b") == "example.com", "hostOf strips userinfo and port");

        // Target list parsing
        auto targets = parseTargetList("# comment\n"
                                       "\n"
                                       "  https://a.example/1.bin  \n"
                                       "https://b.example/2.bin, https://c.example/3.bin,\r\n"
                                       "   # indented comment\n");
        check(targets.size() == 3, "blank, comment and trailing-comma entries skipped");
        check(targets.size() == 3 && targets[0] == "https://a.example/1.bin", "whitespace trimmed");
        check(targets.size() == 3 && targets[2] == "https://c.example/3.bin", "comma-separated sub-targets split");

        TempDir dir;
        check(throwsKind([&] { readTargetFile(dir.path() / "missing.txt"); }, ErrorKind::Config),
              "missing links file is a config error");
        writeFile(dir.path() / "links.txt", "https://a.example/x\n");
        check(readTargetFile(dir.path() / "links.txt").size() == 1, "links file read");

        // Command-line arguments naming list files
        writeFile(dir.path() / "batch.txt", "https://a.example/1.bin\n# skip\nhttps://b.example/2.bin\n");
        ExpandedTargets expanded = expandTargetArguments({"https://z.example/first.bin",
                                                          (dir.path() / "batch.txt").string(),
                                                          "https://z.example/notes.txt",
                                                          (dir.path() / "absent.txt").string()});
        check(expanded.targets.size() == 4, "list file replaced by its targets");
        check(expanded.targets.size() == 4 && expanded.targets[1] == "https://a.example/1.bin" &&
                  expanded.targets[2] == "https://b.example/2.bin",
              "listed targets keep their place");
        check(expanded.targets.size() == 4 && expanded.targets[3] == "https://z.example/notes.txt",
              "URL ending in .txt is a download target");
        check(expanded.errors.size() == 1, "unreadable list file reported");

        // Filenames
        check(filenameFromUrl("https://a.example/dir/file.tar.gz?sig=1#frag") == "file.tar.gz",
              "filename drops query and fragment");
        check(filenameFromUrl("https://a.example/") == "download", "empty segment falls back");
        check(sanitizeFilename("../etc/passwd") == "_etc_passwd", "path separators sanitized");
        check(sanitizeFilename("my movie (2020).mkv") == "my_movie__2020_.mkv", "spaces and brackets replaced");

        // Content-Disposition
        check(filenameFromContentDisposition("attachment; filename=\"Report 2024.pdf\"") == "Report 2024.pdf",
              "quoted filename");
        check(filenameFromContentDisposition("attachment; filename*=UTF-8''na%C3%AFve.txt; filename=\"naive.txt\"") ==
                  "na\xC3\xAFve.txt",
              "extended filename preferred and decoded");
        check(filenameFromContentDisposition("inline").empty(), "no filename parameter");

        return finish();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }
}
