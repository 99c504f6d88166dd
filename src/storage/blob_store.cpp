#include <tku/blob_store.hpp>
#include <tku/log.hpp>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <unordered_set>

namespace fs = std::filesystem;

namespace tku {

// ---------------------------------------------------------------------------
// Binary serialization helpers (varint + length-prefixed strings)
// ---------------------------------------------------------------------------

static const char MAGIC[] = "TKUB";
static constexpr size_t MAGIC_LEN = 4;

namespace ser {

static void write_varint(std::vector<uint8_t>& buf, uint64_t val) {
    while (val >= 0x80) {
        buf.push_back(static_cast<uint8_t>(val & 0x7F) | 0x80);
        val >>= 7;
    }
    buf.push_back(static_cast<uint8_t>(val));
}

static bool read_varint(const uint8_t*& p, const uint8_t* end, uint64_t& val) {
    val = 0;
    unsigned shift = 0;
    while (p < end) {
        uint8_t b = *p++;
        val |= static_cast<uint64_t>(b & 0x7F) << shift;
        if (!(b & 0x80)) return true;
        shift += 7;
        if (shift >= 64) return false;
    }
    return false;
}

// Zigzag keeps small negative values short
static void write_svarint(std::vector<uint8_t>& buf, int64_t v) {
    write_varint(buf, (static_cast<uint64_t>(v) << 1) ^ static_cast<uint64_t>(v >> 63));
}

static bool read_svarint(const uint8_t*& p, const uint8_t* end, int64_t& v) {
    uint64_t raw;
    if (!read_varint(p, end, raw)) return false;
    v = static_cast<int64_t>(raw >> 1) ^ -static_cast<int64_t>(raw & 1);
    return true;
}

static void write_string(std::vector<uint8_t>& buf, const std::string& s) {
    write_varint(buf, s.size());
    buf.insert(buf.end(), s.begin(), s.end());
}

static bool read_string(const uint8_t*& p, const uint8_t* end, std::string& s) {
    uint64_t len;
    if (!read_varint(p, end, len)) return false;
    if (len > static_cast<uint64_t>(end - p)) return false;
    s.assign(reinterpret_cast<const char*>(p), static_cast<size_t>(len));
    p += len;
    return true;
}

} // namespace ser

// ---------------------------------------------------------------------------
// Serialization of one provider partition
// ---------------------------------------------------------------------------

std::vector<uint8_t> BlobStorage::serialize(const ProviderCache& pc) {
    std::vector<uint8_t> buf;
    buf.reserve(4096);

    buf.insert(buf.end(), MAGIC, MAGIC + MAGIC_LEN);
    ser::write_varint(buf, FORMAT_VERSION);

    ser::write_varint(buf, pc.files.size());
    for (const auto& [path, cf] : pc.files) {
        ser::write_string(buf, path);
        ser::write_svarint(buf, cf.mtime_secs);
        ser::write_varint(buf, cf.size);

        ser::write_varint(buf, cf.records.size());
        for (const auto& r : cf.records) {
            // provider is implied by the blob
            ser::write_string(buf, r.session_id);
            ser::write_svarint(buf, timestamp_to_millis(r.timestamp));
            ser::write_string(buf, r.project);
            ser::write_string(buf, r.model);
            ser::write_string(buf, r.message_id);
            ser::write_string(buf, r.request_id);
            ser::write_varint(buf, r.input_tokens);
            ser::write_varint(buf, r.output_tokens);
            ser::write_varint(buf, r.cache_creation_input_tokens);
            ser::write_varint(buf, r.cache_read_input_tokens);
        }
    }
    return buf;
}

Result<BlobStorage::ProviderCache> BlobStorage::deserialize(const std::string& provider,
                                                            const uint8_t* data, size_t len) {
    if (len < MAGIC_LEN || std::memcmp(data, MAGIC, MAGIC_LEN) != 0) {
        return TkuError(TkuError::Storage, "invalid cache magic bytes");
    }

    const uint8_t* p = data + MAGIC_LEN;
    const uint8_t* end = data + len;

    uint64_t version;
    if (!ser::read_varint(p, end, version)) {
        return TkuError(TkuError::Storage, "corrupted cache: truncated version");
    }
    if (version != FORMAT_VERSION) {
        return TkuError(TkuError::Storage,
            "cache format version " + std::to_string(version) +
            " (expected " + std::to_string(FORMAT_VERSION) + ")");
    }

    ProviderCache pc;
    uint64_t num_files;
    if (!ser::read_varint(p, end, num_files)) {
        return TkuError(TkuError::Storage, "corrupted cache: truncated file count");
    }

    for (uint64_t fi = 0; fi < num_files; ++fi) {
        std::string path;
        CachedFile cf;
        uint64_t num_records;
        if (!ser::read_string(p, end, path) ||
            !ser::read_svarint(p, end, cf.mtime_secs) ||
            !ser::read_varint(p, end, cf.size) ||
            !ser::read_varint(p, end, num_records)) {
            return TkuError(TkuError::Storage, "corrupted cache: truncated file entry");
        }
        // Every record takes at least 11 bytes; reject absurd counts early
        if (num_records > static_cast<uint64_t>(end - p)) {
            return TkuError(TkuError::Storage, "corrupted cache: bad record count");
        }

        cf.records.resize(static_cast<size_t>(num_records));
        for (auto& r : cf.records) {
            int64_t millis;
            r.provider = provider;
            if (!ser::read_string(p, end, r.session_id) ||
                !ser::read_svarint(p, end, millis) ||
                !ser::read_string(p, end, r.project) ||
                !ser::read_string(p, end, r.model) ||
                !ser::read_string(p, end, r.message_id) ||
                !ser::read_string(p, end, r.request_id) ||
                !ser::read_varint(p, end, r.input_tokens) ||
                !ser::read_varint(p, end, r.output_tokens) ||
                !ser::read_varint(p, end, r.cache_creation_input_tokens) ||
                !ser::read_varint(p, end, r.cache_read_input_tokens)) {
                return TkuError(TkuError::Storage, "corrupted cache: truncated record");
            }
            r.timestamp = timestamp_from_millis(millis);
        }
        pc.files[path] = std::move(cf);
    }

    if (p != end) {
        return TkuError(TkuError::Storage, "corrupted cache: trailing bytes");
    }
    return Result<ProviderCache>::ok(std::move(pc));
}

// ---------------------------------------------------------------------------
// BlobStorage
// ---------------------------------------------------------------------------

BlobStorage::BlobStorage(std::string dir) : dir_(std::move(dir)) {}

std::string BlobStorage::blob_path(const std::string& provider) const {
    if (dir_.empty()) return "";
    return (fs::path(dir_) / (provider + ".bin")).string();
}

BlobStorage::ProviderCache BlobStorage::load(const std::string& provider) const {
    std::string path = blob_path(provider);
    if (path.empty()) return ProviderCache{};

    std::error_code ec;
    if (!fs::exists(path, ec)) return ProviderCache{};

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        log::warn("cannot read %s; rebuilding %s cache", path.c_str(), provider.c_str());
        ProviderCache pc;
        pc.dirty = true;
        return pc;
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)),
                              std::istreambuf_iterator<char>());

    auto r = deserialize(provider, data.data(), data.size());
    if (r.is_err()) {
        log::warn("discarding %s cache (%s); it will be rebuilt",
                  provider.c_str(), r.error().message.c_str());
        ProviderCache pc;
        pc.dirty = true;
        return pc;
    }
    log::debug("loaded %zu cached files for %s", r.value().files.size(), provider.c_str());
    return std::move(r).value();
}

BlobStorage::ProviderCache& BlobStorage::provider_cache(const std::string& provider) {
    auto it = providers_.find(provider);
    if (it == providers_.end()) {
        it = providers_.emplace(provider, load(provider)).first;
    }
    return it->second;
}

bool BlobStorage::is_cached(const std::string& provider, const std::string& path,
                            int64_t mtime, uint64_t size) {
    const ProviderCache& pc = provider_cache(provider);
    auto it = pc.files.find(path);
    return it != pc.files.end() &&
           it->second.mtime_secs == mtime &&
           it->second.size == size;
}

Status BlobStorage::insert(const std::string& provider, const std::string& path,
                           int64_t mtime, uint64_t size,
                           std::vector<UsageRecord> records) {
    ProviderCache& pc = provider_cache(provider);
    CachedFile& cf = pc.files[path];
    cf.mtime_secs = mtime;
    cf.size = size;
    cf.records = std::move(records);
    pc.dirty = true;
    return ok_status();
}

Status BlobStorage::prune(const std::string& provider,
                          const std::vector<std::string>& existing) {
    ProviderCache& pc = provider_cache(provider);
    std::unordered_set<std::string> known(existing.begin(), existing.end());

    size_t before = pc.files.size();
    for (auto it = pc.files.begin(); it != pc.files.end();) {
        if (known.count(it->first) == 0) {
            it = pc.files.erase(it);
        } else {
            ++it;
        }
    }
    if (pc.files.size() != before) pc.dirty = true;
    return ok_status();
}

Status BlobStorage::flush() {
    if (dir_.empty()) return ok_status();

    bool any_dirty = false;
    for (const auto& [name, pc] : providers_) any_dirty = any_dirty || pc.dirty;
    if (!any_dirty) return ok_status();

    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        return TkuError(TkuError::IO,
            "failed to create cache directory: " + dir_, ec.message());
    }

    for (auto& [name, pc] : providers_) {
        if (!pc.dirty) continue;

        std::string target = blob_path(name);
        std::string tmp = target + ".tmp";
        auto data = serialize(pc);
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            out.write(reinterpret_cast<const char*>(data.data()),
                      static_cast<std::streamsize>(data.size()));
            out.close();
            if (!out) {
                fs::remove(tmp, ec);
                return TkuError(TkuError::IO, "failed to write " + tmp);
            }
        }
        fs::rename(tmp, target, ec);
        if (ec) {
            fs::remove(tmp, ec);
            return TkuError(TkuError::IO,
                "failed to replace " + target, ec.message());
        }
        pc.dirty = false;
    }
    return ok_status();
}

Result<std::vector<UsageRecord>> BlobStorage::drain_all() {
    std::vector<UsageRecord> all;
    for (auto& [name, pc] : providers_) {
        for (auto& [path, cf] : pc.files) {
            std::move(cf.records.begin(), cf.records.end(), std::back_inserter(all));
        }
    }
    providers_.clear();
    return Result<std::vector<UsageRecord>>::ok(std::move(all));
}

} // namespace tku
