#include <tku/pricing.hpp>
#include <tku/json_util.hpp>
#include <tku/log.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace tku {

// ---------------------------------------------------------------------------
// Key normalization
// ---------------------------------------------------------------------------

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static std::string strip_provider_prefix(const std::string& key) {
    // Longest prefixes first
    static const char* prefixes[] = {
        "us.anthropic.",
        "eu.anthropic.",
        "au.anthropic.",
        "apac.anthropic.",
        "global.anthropic.",
        "anthropic.",
        "openai/",
    };
    for (const char* prefix : prefixes) {
        if (starts_with(key, prefix)) return key.substr(std::char_traits<char>::length(prefix));
    }

    // "bedrock/<model>" or "bedrock/<region>/<model>"
    if (starts_with(key, "bedrock/")) {
        std::string rest = key.substr(8);
        auto slash = rest.find('/');
        if (slash != std::string::npos) return rest.substr(slash + 1);
        return rest;
    }
    return key;
}

static std::string strip_version_suffix(const std::string& key) {
    if (ends_with(key, ":0")) {
        std::string stripped = key.substr(0, key.size() - 2);
        if (ends_with(stripped, "-v1")) return stripped.substr(0, stripped.size() - 3);
        return stripped;
    }
    if (ends_with(key, "-v1")) return key.substr(0, key.size() - 3);
    return key;
}

std::vector<std::string> normalized_model_keys(const std::string& key) {
    std::vector<std::string> variants;

    std::string stripped = strip_provider_prefix(key);
    if (stripped != key) variants.push_back(stripped);

    std::string without_suffix = strip_version_suffix(stripped);
    if (without_suffix != stripped) variants.push_back(without_suffix);

    return variants;
}

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

Result<PricingTable> parse_litellm_pricing(const std::string& json_text) {
    auto doc = json::parse(json_text);
    if (doc.is_err()) return std::move(doc).error();

    const Json::Value& root = doc.value();
    if (!root.isObject()) {
        return TkuError(TkuError::Parse, "price table must be a JSON object");
    }

    PricingTable table;
    std::vector<std::pair<std::string, ModelPricing>> aliases;

    for (const auto& key : root.getMemberNames()) {
        const Json::Value& entry = root[key];
        auto input = json::get_double(entry, "input_cost_per_token");
        auto output = json::get_double(entry, "output_cost_per_token");
        if (!input || !output) continue;

        ModelPricing p;
        p.input_cost_per_token = *input;
        p.output_cost_per_token = *output;
        p.cache_read_input_token_cost = json::get_double(entry, "cache_read_input_token_cost");
        p.cache_creation_input_token_cost = json::get_double(entry, "cache_creation_input_token_cost");

        table.set(key, p);
        for (auto& alias : normalized_model_keys(key)) {
            aliases.emplace_back(std::move(alias), p);
        }
    }

    // Aliases never shadow a real key; getMemberNames() is sorted, so the
    // first alias claimant wins deterministically.
    for (const auto& [alias, p] : aliases) {
        table.set_if_absent(alias, p);
    }

    return Result<PricingTable>::ok(std::move(table));
}

Result<PricingTable> load_pricing(const Config& config) {
    PricingTable table;

    std::string path = config.effective_pricing_file();
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) {
        log::warn("no price table at '%s'; costs will be reported as unknown",
                  path.c_str());
    } else {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            return TkuError(TkuError::IO, "cannot open price table: " + path);
        }
        std::ostringstream ss;
        ss << file.rdbuf();

        auto parsed = parse_litellm_pricing(ss.str());
        if (parsed.is_err()) {
            TkuError err = std::move(parsed).error();
            err.at(path);
            err.hint = "delete or replace the file with a LiteLLM model price table";
            return err;
        }
        table = std::move(parsed).value();
        log::debug("loaded %zu price entries from %s", table.size(), path.c_str());
    }

    for (const auto& [model, p] : config.pricing_overrides) {
        table.set(model, p);
    }
    return Result<PricingTable>::ok(std::move(table));
}

} // namespace tku
