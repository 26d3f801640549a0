#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <cstdlib>
#include <filesystem>

namespace {

std::string expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~' || (path.size() > 1 && path[1] != '/')) {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return path;
    }
    return std::string(home) + path.substr(1);
}

}  // namespace

ServiceConfig make_config(const char* local_data_path) {
    std::string raw = local_data_path ? trim(local_data_path) : "";
    if (raw.empty()) {
        throw ConfigError(
            "Missing LOCAL_DATA_PATH. Set LOCAL_DATA_PATH to the folder containing "
            "index/faiss.index + index/meta.json");
    }

    // Symlinks are resolved for the existing part of the path.
    std::filesystem::path root = std::filesystem::absolute(expand_home(raw));
    std::error_code ec;
    std::filesystem::path resolved = std::filesystem::weakly_canonical(root, ec);
    root = ec ? root.lexically_normal() : resolved;

    ServiceConfig cfg;
    cfg.data_root = root.string();
    cfg.index_dir = (root / "index").string();
    return cfg;
}

ServiceConfig load_config_from_env() {
    return make_config(std::getenv("LOCAL_DATA_PATH"));
}
