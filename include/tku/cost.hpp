#pragma once

#include <tku/record.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tku {

// Accumulated cost that distinguishes "unknown" from "zero".
//
//   undefined + undefined  = undefined
//   undefined + defined(v) = defined(v)
//   defined(a) + defined(b) = defined(a + b)
class Cost {
public:
    Cost() = default;
    static Cost of(double v) { Cost c; c.value_ = v; return c; }

    bool is_defined() const { return value_.has_value(); }
    double value() const { return *value_; }
    double value_or(double fallback) const { return value_.value_or(fallback); }

    Cost& operator+=(const Cost& other) {
        if (!other.value_) return *this;
        if (value_) {
            *value_ += *other.value_;
        } else {
            value_ = other.value_;
        }
        return *this;
    }

    friend Cost operator+(Cost a, const Cost& b) { a += b; return a; }

private:
    std::optional<double> value_;
};

// Per-token rates in USD. Cache rates are optional; when absent the
// corresponding tokens contribute nothing.
struct ModelPricing {
    double input_cost_per_token = 0.0;
    double output_cost_per_token = 0.0;
    std::optional<double> cache_read_input_token_cost;
    std::optional<double> cache_creation_input_token_cost;
};

// Model id -> rates
class PricingMap {
public:
    virtual ~PricingMap() = default;
    virtual const ModelPricing* get(const std::string& model) const = 0;
};

// Map-backed pricing lookup
class PricingTable : public PricingMap {
public:
    const ModelPricing* get(const std::string& model) const override;

    // Replaces any existing entry
    void set(const std::string& model, ModelPricing pricing);
    // Only inserts when `model` has no entry yet
    bool set_if_absent(const std::string& model, const ModelPricing& pricing);

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::unordered_map<std::string, ModelPricing> entries_;
};

// Undefined when the record's model has no pricing entry
Cost cost_for_record(const PricingMap& pricing, const UsageRecord& record);

// Sorted distinct model ids that appear in `records` but have no pricing
std::vector<std::string> unpriced_models(const PricingMap& pricing,
                                         const std::vector<UsageRecord>& records);

} // namespace tku
