#include <tku/discovery.hpp>
#include <tku/log.hpp>

#include <algorithm>
#include <cstdlib>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace tku {

std::optional<DiscoveredFile> stat_file(const fs::path& path) {
    struct stat st;
    if (::lstat(path.c_str(), &st) != 0) return std::nullopt;
    if (!S_ISREG(st.st_mode)) return std::nullopt;

    DiscoveredFile df;
    df.path = path;
    df.mtime = static_cast<int64_t>(st.st_mtim.tv_sec);
    df.size = static_cast<uint64_t>(st.st_size);
    return df;
}

std::vector<DiscoveredFile> discover_files(const std::vector<fs::path>& roots,
                                           const std::string& extension) {
    const std::string dot_ext = "." + extension;
    std::vector<DiscoveredFile> files;

    for (const auto& root : roots) {
        std::error_code ec;
        if (!fs::is_directory(root, ec)) continue;

        std::vector<fs::path> found;
        fs::recursive_directory_iterator it(
            root, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            log::warn("cannot read %s: %s", root.c_str(), ec.message().c_str());
            continue;
        }
        for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
            if (it->path().extension() != dot_ext) continue;
            found.push_back(it->path());
        }
        if (ec) {
            log::warn("stopped listing %s early: %s", root.c_str(), ec.message().c_str());
        }

        std::sort(found.begin(), found.end());
        for (const auto& p : found) {
            if (auto df = stat_file(p)) files.push_back(std::move(*df));
        }
    }

    return files;
}

static std::optional<fs::path> env_path(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v) return std::nullopt;
    return fs::path(v);
}

std::vector<fs::path> compute_provider_roots(
    const char* env_var,
    const std::vector<std::string>& env_subpaths,
    const std::vector<HomeFallback>& fallbacks)
{
    if (env_var) {
        if (auto base = env_path(env_var)) {
            if (env_subpaths.empty()) return {*base};
            std::vector<fs::path> roots;
            for (const auto& sub : env_subpaths) roots.push_back(*base / sub);
            return roots;
        }
    }

    auto home = env_path("HOME");
    if (!home) return {};

    std::vector<fs::path> roots;
    for (const auto& fb : fallbacks) {
        fs::path base;
        switch (fb.base) {
            case XdgBase::Config:
                base = env_path("XDG_CONFIG_HOME").value_or(*home / ".config");
                break;
            case XdgBase::Data:
                base = env_path("XDG_DATA_HOME").value_or(*home / ".local" / "share");
                break;
            case XdgBase::Home:
                base = *home;
                break;
        }
        for (const auto& seg : fb.subpaths) base /= seg;
        roots.push_back(std::move(base));
    }
    return roots;
}

} // namespace tku
