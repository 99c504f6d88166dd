#pragma once

#include <tku/result.hpp>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace tku {

// UTC instant with millisecond precision
using Timestamp = std::chrono::time_point<std::chrono::system_clock,
                                          std::chrono::milliseconds>;

// One normalized usage event. (provider, message_id, request_id) is the
// identity key; some providers leave the ids empty.
struct UsageRecord {
    std::string provider;
    std::string session_id;
    Timestamp timestamp{};
    std::string project;
    std::string model;
    std::string message_id;
    std::string request_id;
    uint64_t input_tokens = 0;
    uint64_t output_tokens = 0;
    uint64_t cache_creation_input_tokens = 0;
    uint64_t cache_read_input_tokens = 0;
};

bool operator==(const UsageRecord& a, const UsageRecord& b);
bool operator!=(const UsageRecord& a, const UsageRecord& b);

// ---------------------------------------------------------------------------
// Time helpers
// ---------------------------------------------------------------------------

// RFC 3339: "2025-01-15T10:30:00Z", fractional seconds and "+HH:MM" offsets
// accepted. Sub-millisecond digits are truncated.
Result<Timestamp> parse_timestamp(const std::string& text);

Timestamp timestamp_from_millis(int64_t millis);
int64_t timestamp_to_millis(Timestamp ts);

// "2025-01-15T10:30:00.000Z"
std::string format_timestamp(Timestamp ts);
// "2025-01-15" (UTC)
std::string format_date(Timestamp ts);
// "2025-01" (UTC)
std::string format_month(Timestamp ts);

// Accepts exactly "YYYY-MM-DD" with a real calendar day
bool is_valid_date(const std::string& date);

} // namespace tku
