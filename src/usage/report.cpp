#include <tku/report.hpp>

#include <algorithm>
#include <cstdio>
#include <vector>

namespace tku {

std::string format_tokens(uint64_t n) {
    char buf[32];
    if (n >= 1000000) {
        std::snprintf(buf, sizeof(buf), "%.1fM", static_cast<double>(n) / 1000000.0);
    } else if (n >= 1000) {
        std::snprintf(buf, sizeof(buf), "%.1fK", static_cast<double>(n) / 1000.0);
    } else {
        std::snprintf(buf, sizeof(buf), "%llu", static_cast<unsigned long long>(n));
    }
    return buf;
}

std::string format_cost(const Cost& cost) {
    if (!cost.is_defined()) return "N/A";
    char buf[48];
    std::snprintf(buf, sizeof(buf), "$%.2f", cost.value());
    return buf;
}

static const char* key_header(Grouping g) {
    switch (g) {
    case Grouping::Daily:   return "Date";
    case Grouping::Monthly: return "Month";
    case Grouping::Session: return "Session";
    case Grouping::Model:   return "Model";
    }
    return "Key";
}

static std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += ", ";
        out += items[i];
    }
    return out;
}

namespace {

using Row = std::vector<std::string>;

constexpr size_t NUM_COLS = 8;

Row bucket_row(const std::string& key, const AggregatedBucket& b) {
    return {key,
            format_tokens(b.input_tokens),
            format_tokens(b.output_tokens),
            format_tokens(b.cache_creation_input_tokens),
            format_tokens(b.cache_read_input_tokens),
            format_cost(b.cost),
            join(b.models),
            join(b.tools)};
}

Row detail_row(const ModelBucketDetail& d) {
    return {"  " + short_model_name(d.model),
            format_tokens(d.input_tokens),
            format_tokens(d.output_tokens),
            format_tokens(d.cache_creation_input_tokens),
            format_tokens(d.cache_read_input_tokens),
            format_cost(d.cost),
            "",
            ""};
}

} // namespace

void print_table(std::ostream& out,
                 const std::map<std::string, AggregatedBucket>& buckets,
                 Grouping grouping,
                 bool breakdown) {
    std::vector<Row> rows;
    rows.push_back({key_header(grouping), "Input", "Output", "Cache Write",
                    "Cache Read", "Cost", "Models", "Tools"});

    for (const auto& [key, bucket] : buckets) {
        rows.push_back(bucket_row(key, bucket));
        if (breakdown) {
            for (const auto& d : bucket.details) rows.push_back(detail_row(d));
        }
    }
    size_t total_index = rows.size();
    rows.push_back(bucket_row("TOTAL", total_of(buckets)));

    size_t widths[NUM_COLS] = {};
    for (const auto& row : rows) {
        for (size_t c = 0; c < NUM_COLS; ++c) widths[c] = std::max(widths[c], row[c].size());
    }

    auto rule = [&]() {
        for (size_t c = 0; c < NUM_COLS; ++c) {
            if (c) out << "-+-";
            out << std::string(widths[c], '-');
        }
        out << "\n";
    };

    for (size_t r = 0; r < rows.size(); ++r) {
        if (r == total_index) rule();
        const Row& row = rows[r];
        std::string line;
        for (size_t c = 0; c < NUM_COLS; ++c) {
            if (c) line += " | ";
            // Key and text columns left-aligned, numbers right-aligned
            bool left = c == 0 || c >= 6;
            std::string pad(widths[c] - row[c].size(), ' ');
            line += left ? row[c] + pad : pad + row[c];
        }
        while (!line.empty() && line.back() == ' ') line.pop_back();
        out << line << "\n";
        if (r == 0) rule();
    }
}

} // namespace tku
