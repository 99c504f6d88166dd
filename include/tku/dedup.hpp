#pragma once

#include <tku/record.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace tku {

// 64-bit FNV-1a over (provider, message_id, request_id)
uint64_t record_identity_hash(const UsageRecord& r);

// Keep the first record per identity hash; order preserved.
// Records with empty ids from one provider collapse onto one identity.
std::vector<UsageRecord> dedup(std::vector<UsageRecord> records);

// Put drained records into the logical order dedup relies on: providers in
// `provider_order` (unknown providers last, by name), then timestamp,
// session, message id, request id. The remaining fields break ties, so
// the result does not depend on the order records were drained in.
void sort_records(std::vector<UsageRecord>& records,
                  const std::vector<std::string>& provider_order);

} // namespace tku
