#include <tku/provider.hpp>
#include <tku/log.hpp>
#include <tku/providers/amp.hpp>
#include <tku/providers/claude.hpp>
#include <tku/providers/codex.hpp>
#include <tku/providers/opencode.hpp>
#include <tku/providers/pi.hpp>

namespace tku {

std::vector<std::unique_ptr<Provider>> all_providers() {
    std::vector<std::unique_ptr<Provider>> providers;
    providers.push_back(std::make_unique<ClaudeProvider>());
    providers.push_back(std::make_unique<CodexProvider>());
    providers.push_back(std::make_unique<PiProvider>());
    providers.push_back(std::make_unique<AmpProvider>());
    providers.push_back(std::make_unique<OpenCodeProvider>());
    return providers;
}

std::vector<std::string> provider_names() {
    std::vector<std::string> names;
    for (const auto& p : all_providers()) names.emplace_back(p->name());
    return names;
}

Result<std::vector<UsageRecord>> collect_records(
    const std::vector<std::unique_ptr<Provider>>& providers,
    Storage& storage,
    const ScanProgressFn* progress,
    unsigned workers) {
    for (const auto& provider : providers) {
        std::string name = provider->name();
        ProgressFn per_provider;
        if (progress) {
            per_provider = [progress, &name](size_t done, size_t total) {
                (*progress)(name, done, total);
            };
        }
        provider->discover_and_parse(storage, progress ? &per_provider : nullptr, workers);
    }

    auto st = storage.flush();
    if (st.is_err()) {
        // The records are still in memory; only the next run pays for this
        log::warn("failed to save cache: %s", st.error().message.c_str());
    }
    return storage.drain_all();
}

} // namespace tku
