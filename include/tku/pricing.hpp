#pragma once

#include <tku/config.hpp>
#include <tku/cost.hpp>
#include <tku/result.hpp>
#include <string>
#include <vector>

namespace tku {

// Parse a LiteLLM-style price table: an object keyed by model id whose
// entries carry input_cost_per_token / output_cost_per_token and, optionally,
// cache_read_input_token_cost / cache_creation_input_token_cost. Entries
// without both base rates are skipped. Vendor-prefixed keys are also
// registered under their normalized names unless a real entry exists.
Result<PricingTable> parse_litellm_pricing(const std::string& json_text);

// Alternative lookup names for a price-table key, e.g.
// "us.anthropic.claude-3-5-haiku-20241022-v1:0" ->
// {"claude-3-5-haiku-20241022-v1:0", "claude-3-5-haiku-20241022"}
std::vector<std::string> normalized_model_keys(const std::string& key);

// Local price file (no network) plus [pricing.models] overrides from the
// config. A missing price file only logs a warning.
Result<PricingTable> load_pricing(const Config& config);

} // namespace tku
