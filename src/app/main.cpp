#include <tku/aggregate.hpp>
#include <tku/config.hpp>
#include <tku/dedup.hpp>
#include <tku/filter.hpp>
#include <tku/log.hpp>
#include <tku/pricing.hpp>
#include <tku/provider.hpp>
#include <tku/report.hpp>
#include <tku/storage.hpp>

#include <cstdlib>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <unistd.h>

using namespace tku;

static const char* USAGE =
    "Usage: tku [daily|monthly|session|model] [options]\n"
    "\n"
    "Options:\n"
    "  --from YYYY-MM-DD     only records on or after this UTC date\n"
    "  --to YYYY-MM-DD       only records on or before this UTC date\n"
    "  --project TEXT        project name contains TEXT (case-insensitive)\n"
    "  --tool NAME           only this provider (claude, codex, pi, amp, opencode)\n"
    "  --backend blob|sqlite cache backend for this run\n"
    "  --workers N           parser threads (default: CPU count)\n"
    "  --config PATH         config file (default: ~/.config/tku/config.toml)\n"
    "  --breakdown           per-model rows under each bucket\n"
    "  --quiet               no progress output\n"
    "  --help                show this message\n";

struct CliOptions {
    Grouping grouping = Grouping::Daily;
    RecordFilter filter;
    Config overrides;
    std::string config_file;
    bool breakdown = false;
    bool quiet = false;
    bool help = false;
};

static Result<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    bool have_grouping = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto next_value = [&](const char* flag) -> Result<std::string> {
            if (i + 1 >= argc) {
                return TkuError(TkuError::InvalidArg,
                    std::string("missing value for ") + flag);
            }
            return Result<std::string>::ok(argv[++i]);
        };

        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--breakdown") {
            opts.breakdown = true;
        } else if (arg == "--quiet" || arg == "-q") {
            opts.quiet = true;
        } else if (arg == "--from" || arg == "--to" || arg == "--project" ||
                   arg == "--tool" || arg == "--config") {
            auto v = next_value(arg.c_str());
            if (v.is_err()) return std::move(v).error();
            if (arg == "--from") opts.filter.from = v.value();
            else if (arg == "--to") opts.filter.to = v.value();
            else if (arg == "--project") opts.filter.project = v.value();
            else if (arg == "--tool") opts.filter.tool = v.value();
            else opts.config_file = v.value();
        } else if (arg == "--backend") {
            auto v = next_value("--backend");
            if (v.is_err()) return std::move(v).error();
            if (!parse_cache_backend(v.value(), opts.overrides.backend)) {
                return TkuError(TkuError::InvalidArg,
                    "unknown cache backend '" + v.value() + "'",
                    "expected 'blob' or 'sqlite'");
            }
            opts.overrides.backend_set = true;
        } else if (arg == "--workers") {
            auto v = next_value("--workers");
            if (v.is_err()) return std::move(v).error();
            char* end = nullptr;
            unsigned long n = std::strtoul(v.value().c_str(), &end, 10);
            if (v.value().empty() || *end != '\0' || n == 0 || n > max_workers) {
                return TkuError(TkuError::InvalidArg,
                    "invalid worker count '" + v.value() + "'",
                    "expected a number between 1 and " + std::to_string(max_workers));
            }
            opts.overrides.workers = static_cast<unsigned>(n);
            opts.overrides.workers_set = true;
        } else if (!arg.empty() && arg[0] != '-' && !have_grouping) {
            if (!parse_grouping(arg, opts.grouping)) {
                return TkuError(TkuError::InvalidArg,
                    "unknown report '" + arg + "'",
                    "expected daily, monthly, session or model");
            }
            have_grouping = true;
        } else {
            return TkuError(TkuError::InvalidArg, "unexpected argument '" + arg + "'",
                "run 'tku --help' for usage");
        }
    }
    return Result<CliOptions>::ok(std::move(opts));
}

static Result<Config> resolve_config(const CliOptions& opts) {
    auto base = opts.config_file.empty() ? load_user_config()
                                         : Config::load(opts.config_file);
    if (base.is_err()) return base;
    Config config = std::move(base).value();
    config.merge(opts.overrides);
    return Result<Config>::ok(std::move(config));
}

static int fail(const TkuError& err) {
    std::cerr << err.format() << "\n";
    return err.exit_code();
}

int main(int argc, char* argv[]) {
    log::set_color_enabled(::isatty(STDERR_FILENO) != 0);

    auto parsed = parse_args(argc, argv);
    if (parsed.is_err()) return fail(parsed.error());
    const CliOptions& opts = parsed.value();
    if (opts.help) {
        std::cout << USAGE;
        return 0;
    }

    auto filter_ok = opts.filter.validate();
    if (filter_ok.is_err()) return fail(filter_ok.error());

    auto cfg = resolve_config(opts);
    if (cfg.is_err()) return fail(cfg.error());
    const Config& config = cfg.value();
    log::init_level(config.log_level);

    auto storage = open_storage(config);
    if (storage.is_err()) return fail(storage.error());

    bool show_progress = !opts.quiet && ::isatty(STDERR_FILENO);
    ScanProgressFn progress = [](const std::string& provider, size_t done, size_t total) {
        std::fprintf(stderr, "\rScanning %s: %zu/%zu", provider.c_str(), done, total);
        if (done == total) std::fprintf(stderr, "\n");
        std::fflush(stderr);
    };

    auto providers = all_providers();
    auto collected = collect_records(providers, *storage.value(),
                                     show_progress ? &progress : nullptr,
                                     config.effective_workers());
    if (collected.is_err()) return fail(collected.error());

    std::vector<UsageRecord> records = std::move(collected).value();
    sort_records(records, provider_names());
    size_t before = records.size();
    records = dedup(std::move(records));
    log::debug("%zu records, %zu after dedup", before, records.size());

    records = apply_filter(std::move(records), opts.filter);
    if (records.empty()) {
        std::cerr << "No usage records found.\n";
        return 0;
    }
    if (!opts.quiet) std::cerr << "Found " << records.size() << " usage records.\n";

    auto pricing = load_pricing(config);
    if (pricing.is_err()) return fail(pricing.error());

    auto unpriced = unpriced_models(pricing.value(), records);
    if (!unpriced.empty()) {
        std::string list;
        for (size_t i = 0; i < unpriced.size(); ++i) {
            if (i) list += ", ";
            list += unpriced[i];
        }
        std::cerr << "No pricing data for: " << list << "\n";
    }

    auto buckets = aggregate(records, bucket_key_fn(opts.grouping), pricing.value());
    print_table(std::cout, buckets, opts.grouping, opts.breakdown);
    return 0;
}
