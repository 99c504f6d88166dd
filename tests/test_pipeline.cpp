#include <catch2/catch.hpp>
#include <tku/blob_store.hpp>
#include <tku/dedup.hpp>
#include <tku/pipeline.hpp>
#include <tku/provider.hpp>
#include <tku/worker_pool.hpp>
#include <atomic>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace tku;
namespace fs = std::filesystem;

static fs::path make_fixture_dir(size_t files) {
    static int counter = 0;
    fs::path dir = "/tmp/tku_test_pipeline_" + std::to_string(getpid()) + "_" +
                   std::to_string(counter++);
    fs::remove_all(dir);
    fs::create_directories(dir);
    for (size_t i = 0; i < files; ++i) {
        char name[32];
        snprintf(name, sizeof(name), "f%03zu.jsonl", i);
        std::ofstream(dir / name) << std::string(i + 1, 'x');
    }
    return dir;
}

// One record per file, carrying the file size as its input token count
struct CountingParser {
    std::atomic<size_t> calls{0};

    ParseFn fn(const std::string& provider) {
        return [this, provider](const fs::path& path) {
            ++calls;
            UsageRecord r;
            r.provider = provider;
            r.session_id = path.stem().string();
            r.timestamp = timestamp_from_millis(1736937000000LL);
            r.model = "claude-sonnet-4-5";
            r.message_id = path.filename().string();
            r.input_tokens = fs::file_size(path);
            return std::vector<UsageRecord>{r};
        };
    }
};

static ScanStats scan(const fs::path& dir, Storage& storage, CountingParser& parser,
                      unsigned workers = 4, const ProgressFn* progress = nullptr) {
    auto files = discover_files({dir}, "jsonl");
    return discover_and_parse_with("claude", files, storage, progress,
                                   parser.fn("claude"), workers);
}

// ===== WorkerPool =====

TEST_CASE("WorkerPool keeps input order", "[pipeline]") {
    WorkerPool pool(8);
    REQUIRE(pool.size() == 8);
    auto out = pool.parallel_map<size_t>(1000, [](size_t i) { return i * i; });
    REQUIRE(out.size() == 1000);
    for (size_t i = 0; i < out.size(); ++i) REQUIRE(out[i] == i * i);
}

TEST_CASE("WorkerPool treats zero workers as one", "[pipeline]") {
    WorkerPool pool(0);
    REQUIRE(pool.size() == 1);
    auto out = pool.parallel_map<int>(3, [](size_t i) { return static_cast<int>(i) + 1; });
    REQUIRE(out == std::vector<int>{1, 2, 3});
}

TEST_CASE("WorkerPool handles an empty range", "[pipeline]") {
    WorkerPool pool(4);
    auto out = pool.parallel_map<int>(0, [](size_t) -> int {
        throw std::runtime_error("never called");
    });
    REQUIRE(out.empty());
}

TEST_CASE("WorkerPool rethrows a worker exception after joining", "[pipeline]") {
    WorkerPool pool(4);
    REQUIRE_THROWS_WITH(
        pool.parallel_map<int>(100, [](size_t i) -> int {
            if (i == 42) throw std::runtime_error("boom");
            return 0;
        }),
        "boom");
}

TEST_CASE("WorkerPool finishes when thread creation fails", "[pipeline]") {
    // In a child process, cap the address space just above what is mapped
    // now so that most thread stacks cannot be allocated.
    pid_t pid = fork();
    REQUIRE(pid >= 0);
    if (pid == 0) {
        long pages = 0;
        std::ifstream("/proc/self/statm") >> pages;
        rlim_t cap = static_cast<rlim_t>(pages) * sysconf(_SC_PAGESIZE) + (256u << 20);
        struct rlimit lim{cap, cap};
        if (setrlimit(RLIMIT_AS, &lim) != 0) _exit(2);

        WorkerPool pool(4000);
        auto out = pool.parallel_map<size_t>(4000, [](size_t i) {
            usleep(1000);
            return i;
        });
        for (size_t i = 0; i < out.size(); ++i) {
            if (out[i] != i) _exit(1);
        }
        _exit(out.size() == 4000 ? 0 : 1);
    }
    int status = 0;
    REQUIRE(waitpid(pid, &status, 0) == pid);
    REQUIRE(WIFEXITED(status));
    REQUIRE(WEXITSTATUS(status) == 0);
}

// ===== discover_and_parse_with =====

TEST_CASE("Pipeline parses every file on a cold cache", "[pipeline]") {
    auto dir = make_fixture_dir(10);
    BlobStorage storage("");
    CountingParser parser;

    auto stats = scan(dir, storage, parser);
    REQUIRE(stats.total == 10);
    REQUIRE(stats.cached == 0);
    REQUIRE(stats.parsed == 10);
    REQUIRE(stats.records == 10);
    REQUIRE(parser.calls.load() == 10);
    fs::remove_all(dir);
}

TEST_CASE("Pipeline does not re-parse unchanged files", "[pipeline]") {
    auto dir = make_fixture_dir(10);
    BlobStorage storage("");
    CountingParser parser;

    scan(dir, storage, parser);
    parser.calls = 0;
    auto stats = scan(dir, storage, parser);
    REQUIRE(parser.calls.load() == 0);
    REQUIRE(stats.cached == 10);
    REQUIRE(stats.parsed == 0);
    REQUIRE(storage.drain_all().value().size() == 10);
    fs::remove_all(dir);
}

TEST_CASE("Pipeline cache survives a flush and reopen", "[pipeline]") {
    auto dir = make_fixture_dir(5);
    auto cache_dir = dir.string() + "_cache";
    CountingParser parser;
    {
        BlobStorage storage(cache_dir);
        scan(dir, storage, parser);
        REQUIRE(storage.flush().is_ok());
    }
    parser.calls = 0;
    BlobStorage storage(cache_dir);
    scan(dir, storage, parser);
    REQUIRE(parser.calls.load() == 0);
    REQUIRE(storage.drain_all().value().size() == 5);
    fs::remove_all(dir);
    fs::remove_all(cache_dir);
}

TEST_CASE("Pipeline re-parses only files whose fingerprint changed", "[pipeline]") {
    auto dir = make_fixture_dir(5);
    BlobStorage storage("");
    CountingParser parser;
    scan(dir, storage, parser);

    std::ofstream(dir / "f002.jsonl", std::ios::app) << "more";
    parser.calls = 0;
    auto stats = scan(dir, storage, parser);
    REQUIRE(parser.calls.load() == 1);
    REQUIRE(stats.cached == 4);

    auto records = storage.drain_all().value();
    sort_records(records, {"claude"});
    REQUIRE(records.size() == 5);
    REQUIRE(records[2].message_id == "f002.jsonl");
    REQUIRE(records[2].input_tokens == 3 + 4);
    fs::remove_all(dir);
}

TEST_CASE("Pipeline prunes files that disappeared", "[pipeline]") {
    auto dir = make_fixture_dir(4);
    BlobStorage storage("");
    CountingParser parser;
    scan(dir, storage, parser);

    fs::remove(dir / "f001.jsonl");
    scan(dir, storage, parser);

    auto records = storage.drain_all().value();
    REQUIRE(records.size() == 3);
    for (const auto& r : records) REQUIRE(r.message_id != "f001.jsonl");
    fs::remove_all(dir);
}

TEST_CASE("Pipeline progress is strictly increasing and ends at total", "[pipeline]") {
    auto dir = make_fixture_dir(12);
    BlobStorage storage("");
    CountingParser parser;

    // Warm half of the cache so both phases report
    auto files = discover_files({dir}, "jsonl");
    std::vector<DiscoveredFile> half(files.begin(), files.begin() + 6);
    discover_and_parse_with("claude", half, storage, nullptr, parser.fn("claude"), 2);

    std::vector<std::pair<size_t, size_t>> seen;
    ProgressFn progress = [&](size_t done, size_t total) { seen.emplace_back(done, total); };
    discover_and_parse_with("claude", files, storage, &progress, parser.fn("claude"), 4);

    REQUIRE(seen.size() == 12);
    for (size_t i = 0; i < seen.size(); ++i) {
        REQUIRE(seen[i].first == i + 1);
        REQUIRE(seen[i].second == 12);
    }
    fs::remove_all(dir);
}

TEST_CASE("Pipeline result does not depend on the worker count", "[pipeline]") {
    auto dir = make_fixture_dir(40);
    CountingParser parser;

    BlobStorage serial("");
    scan(dir, serial, parser, 1);
    BlobStorage parallel("");
    scan(dir, parallel, parser, 16);

    auto a = serial.drain_all().value();
    auto b = parallel.drain_all().value();
    sort_records(a, {"claude"});
    sort_records(b, {"claude"});
    REQUIRE(a.size() == 40);
    REQUIRE(a == b);
    fs::remove_all(dir);
}

TEST_CASE("Pipeline keeps going when a parser throws", "[pipeline]") {
    auto dir = make_fixture_dir(3);
    BlobStorage storage("");
    CountingParser parser;
    auto good = parser.fn("claude");
    ParseFn flaky = [&](const fs::path& path) {
        if (path.filename() == "f001.jsonl") throw std::runtime_error("bad file");
        return good(path);
    };

    auto files = discover_files({dir}, "jsonl");
    auto stats = discover_and_parse_with("claude", files, storage, nullptr, flaky, 2);
    REQUIRE(stats.parsed == 3);
    REQUIRE(stats.records == 2);

    // The failed file is cached as empty and not retried until it changes
    REQUIRE(storage.is_cached("claude", (dir / "f001.jsonl").string(),
                              files[1].mtime, files[1].size));
    REQUIRE(storage.drain_all().value().size() == 2);
    fs::remove_all(dir);
}

TEST_CASE("Pipeline survives a parser throwing a non-standard exception", "[pipeline]") {
    auto dir = make_fixture_dir(4);
    BlobStorage storage("");
    CountingParser parser;
    auto good = parser.fn("claude");
    ParseFn flaky = [&](const fs::path& path) {
        if (path.filename() == "f002.jsonl") throw 42;
        return good(path);
    };

    auto files = discover_files({dir}, "jsonl");
    ScanStats stats;
    REQUIRE_NOTHROW(stats = discover_and_parse_with("claude", files, storage,
                                                    nullptr, flaky, 3));
    REQUIRE(stats.parsed == 4);
    REQUIRE(stats.records == 3);
    REQUIRE(storage.is_cached("claude", (dir / "f002.jsonl").string(),
                              files[2].mtime, files[2].size));
    fs::remove_all(dir);
}

TEST_CASE("Pipeline handles an empty file list", "[pipeline]") {
    BlobStorage storage("");
    CountingParser parser;
    REQUIRE(storage.insert("claude", "/old.jsonl", 1, 1, {}).is_ok());

    auto stats = discover_and_parse_with("claude", {}, storage, nullptr,
                                         parser.fn("claude"), 4);
    REQUIRE(stats.total == 0);
    REQUIRE(parser.calls.load() == 0);
    REQUIRE_FALSE(storage.is_cached("claude", "/old.jsonl", 1, 1));
}

// ===== collect_records =====

namespace {

class FakeProvider : public Provider {
public:
    FakeProvider(const char* name, fs::path root, CountingParser& parser)
        : name_(name), root_(std::move(root)), parser_(parser) {}

    const char* name() const override { return name_; }
    std::vector<fs::path> root_dirs() const override { return {root_}; }
    ScanStats discover_and_parse(Storage& storage, const ProgressFn* progress,
                                 unsigned workers) const override {
        auto files = discover_files(root_dirs(), "jsonl");
        return discover_and_parse_with(name_, files, storage, progress,
                                       parser_.fn(name_), workers);
    }

private:
    const char* name_;
    fs::path root_;
    CountingParser& parser_;
};

} // namespace

TEST_CASE("collect_records scans providers in order and drains storage", "[pipeline]") {
    auto dir_a = make_fixture_dir(2);
    auto dir_b = make_fixture_dir(3);
    CountingParser parser;

    std::vector<std::unique_ptr<Provider>> providers;
    providers.push_back(std::make_unique<FakeProvider>("alpha", dir_a, parser));
    providers.push_back(std::make_unique<FakeProvider>("beta", dir_b, parser));

    std::vector<std::string> order;
    ScanProgressFn progress = [&](const std::string& name, size_t done, size_t total) {
        if (done == total) order.push_back(name);
    };

    BlobStorage storage("");
    auto records = collect_records(providers, storage, &progress, 2);
    REQUIRE(records.is_ok());
    REQUIRE(records.value().size() == 5);
    REQUIRE(order == std::vector<std::string>{"alpha", "beta"});

    size_t alpha = 0;
    for (const auto& r : records.value()) {
        if (r.provider == "alpha") ++alpha;
    }
    REQUIRE(alpha == 2);
    fs::remove_all(dir_a);
    fs::remove_all(dir_b);
}

TEST_CASE("collect_records works without a progress callback", "[pipeline]") {
    auto dir = make_fixture_dir(2);
    CountingParser parser;
    std::vector<std::unique_ptr<Provider>> providers;
    providers.push_back(std::make_unique<FakeProvider>("alpha", dir, parser));

    BlobStorage storage("");
    auto records = collect_records(providers, storage, nullptr, 1);
    REQUIRE(records.is_ok());
    REQUIRE(records.value().size() == 2);
    fs::remove_all(dir);
}
