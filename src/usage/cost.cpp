#include <tku/cost.hpp>

#include <algorithm>
#include <unordered_set>

namespace tku {

const ModelPricing* PricingTable::get(const std::string& model) const {
    auto it = entries_.find(model);
    if (it == entries_.end()) return nullptr;
    return &it->second;
}

void PricingTable::set(const std::string& model, ModelPricing pricing) {
    entries_[model] = std::move(pricing);
}

bool PricingTable::set_if_absent(const std::string& model, const ModelPricing& pricing) {
    return entries_.emplace(model, pricing).second;
}

Cost cost_for_record(const PricingMap& pricing, const UsageRecord& record) {
    const ModelPricing* p = pricing.get(record.model);
    if (!p) return Cost();

    double cost = 0.0;
    cost += static_cast<double>(record.input_tokens) * p->input_cost_per_token;
    cost += static_cast<double>(record.output_tokens) * p->output_cost_per_token;
    if (p->cache_read_input_token_cost) {
        cost += static_cast<double>(record.cache_read_input_tokens) *
                *p->cache_read_input_token_cost;
    }
    if (p->cache_creation_input_token_cost) {
        cost += static_cast<double>(record.cache_creation_input_tokens) *
                *p->cache_creation_input_token_cost;
    }
    return Cost::of(cost);
}

std::vector<std::string> unpriced_models(const PricingMap& pricing,
                                         const std::vector<UsageRecord>& records) {
    std::unordered_set<std::string> seen;
    std::vector<std::string> out;
    for (const auto& r : records) {
        if (!seen.insert(r.model).second) continue;
        if (!pricing.get(r.model)) out.push_back(r.model);
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace tku
