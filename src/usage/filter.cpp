#include <tku/filter.hpp>

#include <algorithm>
#include <cctype>

namespace tku {

static std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

Status RecordFilter::validate() const {
    if (from && !is_valid_date(*from)) {
        return TkuError(TkuError::InvalidArg, "invalid --from date: " + *from,
                        "expected YYYY-MM-DD");
    }
    if (to && !is_valid_date(*to)) {
        return TkuError(TkuError::InvalidArg, "invalid --to date: " + *to,
                        "expected YYYY-MM-DD");
    }
    // ISO dates order lexicographically
    if (from && to && *from > *to) {
        return TkuError(TkuError::InvalidArg,
                        "date range is empty: " + *from + " > " + *to);
    }
    return ok_status();
}

bool RecordFilter::matches(const UsageRecord& r) const {
    if (from || to) {
        std::string date = format_date(r.timestamp);
        if (from && date < *from) return false;
        if (to && date > *to) return false;
    }
    if (project && to_lower(r.project).find(to_lower(*project)) == std::string::npos) {
        return false;
    }
    if (tool && to_lower(r.provider) != to_lower(*tool)) {
        return false;
    }
    return true;
}

std::vector<UsageRecord> apply_filter(std::vector<UsageRecord> records,
                                      const RecordFilter& filter) {
    records.erase(std::remove_if(records.begin(), records.end(),
                                 [&](const UsageRecord& r) { return !filter.matches(r); }),
                  records.end());
    return records;
}

} // namespace tku
