#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tku {

// A candidate log file with its cheap identity fingerprint.
// mtime has second granularity: two writes within one second that keep the
// size unchanged are indistinguishable.
struct DiscoveredFile {
    std::filesystem::path path;
    int64_t mtime = 0;     // seconds since epoch
    uint64_t size = 0;     // bytes
};

// lstat() a regular file; nullopt for missing files, symlinks, directories
std::optional<DiscoveredFile> stat_file(const std::filesystem::path& path);

// Recursively list regular files ending in ".<extension>" under each root.
// Symlinks are neither followed nor returned; missing roots are skipped.
// Paths are sorted within each root, roots keep their given order.
std::vector<DiscoveredFile> discover_files(const std::vector<std::filesystem::path>& roots,
                                           const std::string& extension);

enum class XdgBase {
    Config,   // $XDG_CONFIG_HOME, else ~/.config
    Data,     // $XDG_DATA_HOME, else ~/.local/share
    Home      // ~ (legacy dot-directories)
};

struct HomeFallback {
    XdgBase base;
    std::vector<std::string> subpaths;
};

// Root directories for one provider. When `env_var` is set in the
// environment it replaces every default (joined with each of
// `env_subpaths`, or used as-is when that list is empty). Otherwise each
// fallback is resolved against HOME / XDG. Returns nothing when neither the
// override nor HOME is available.
std::vector<std::filesystem::path> compute_provider_roots(
    const char* env_var,
    const std::vector<std::string>& env_subpaths,
    const std::vector<HomeFallback>& fallbacks);

} // namespace tku
